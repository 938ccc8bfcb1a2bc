#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace ragquery {

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::string> headers;
    std::string body;
    long timeout_seconds = 30;
    // Takes precedence over timeout_seconds when positive.
    long timeout_ms = 0;
    long connect_timeout_seconds = 10;
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

// Transport-level failure: nothing usable came back from the peer.
class HttpTransferError : public std::runtime_error {
public:
    enum class Reason { Network, Timeout, Aborted };

    HttpTransferError(Reason reason, const std::string& message) : std::runtime_error(message), reason_(reason) {}

    Reason reason() const noexcept { return reason_; }
    bool timed_out() const noexcept { return reason_ == Reason::Timeout; }
    bool aborted() const noexcept { return reason_ == Reason::Aborted; }

private:
    Reason reason_;
};

HttpResponse perform_http_request(const HttpRequest& request);

// Receives body bytes as they arrive. Returning false stops the transfer
// without an error.
using BodyChunkHandler = std::function<bool(std::string_view)>;
// Polled while the transfer runs; returning true aborts it with
// HttpTransferError::Reason::Aborted.
using AbortCheck = std::function<bool()>;

// Streams a 2xx body to on_chunk. For any other status the body is buffered
// and returned instead, and on_chunk is never called. Exceptions thrown by
// on_chunk are rethrown after the transfer is torn down.
HttpResponse perform_streaming_request(const HttpRequest& request,
                                       const BodyChunkHandler& on_chunk,
                                       const AbortCheck& should_abort);

}  // namespace ragquery
