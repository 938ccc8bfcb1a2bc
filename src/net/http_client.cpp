#include "net/http_client.hpp"

#include <curl/curl.h>

#include <exception>
#include <memory>

namespace ragquery {
namespace {

constexpr std::size_t kMaxErrorBodyBytes = 64 * 1024;

class CurlGlobal {
public:
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
};

CurlGlobal& global_curl() {
    static CurlGlobal global;
    return global;
}

struct CurlHandleDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlHandle = std::unique_ptr<CURL, CurlHandleDeleter>;
using CurlHeaders = std::unique_ptr<curl_slist, SlistDeleter>;

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* buffer = static_cast<std::string*>(userdata);
    buffer->append(ptr, total);
    return total;
}

struct StreamState {
    CURL* curl = nullptr;
    const BodyChunkHandler* on_chunk = nullptr;
    const AbortCheck* should_abort = nullptr;
    std::string error_body;
    std::exception_ptr failure;
    bool stopped = false;
    bool aborted = false;
};

size_t stream_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* state = static_cast<StreamState*>(userdata);

    long status = 0;
    curl_easy_getinfo(state->curl, CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        if (state->error_body.size() < kMaxErrorBodyBytes) {
            state->error_body.append(ptr, total);
        }
        return total;
    }

    try {
        if (!(*state->on_chunk)(std::string_view{ptr, total})) {
            state->stopped = true;
            return 0;
        }
    } catch (...) {
        // Rethrown once curl has unwound.
        state->failure = std::current_exception();
        return 0;
    }
    return total;
}

int stream_progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* state = static_cast<StreamState*>(userdata);
    if (state->should_abort == nullptr || !*state->should_abort) {
        return 0;
    }
    try {
        if ((*state->should_abort)()) {
            state->aborted = true;
            return 1;
        }
    } catch (...) {
        state->failure = std::current_exception();
        return 1;
    }
    return 0;
}

CurlHeaders configure(CURL* curl, const HttpRequest& request) {
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (request.timeout_ms > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, request.timeout_ms);
    } else if (request.timeout_seconds > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, request.timeout_seconds);
    }
    if (request.connect_timeout_seconds > 0) {
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, request.connect_timeout_seconds);
    }

    curl_slist* headers = nullptr;
    for (const auto& header : request.headers) {
        headers = curl_slist_append(headers, header.c_str());
    }
    if (headers != nullptr) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    }

    if (!request.body.empty()) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else if (request.method == "POST" || request.method == "PUT" || request.method == "PATCH") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, 0L);
    }
    return CurlHeaders{headers};
}

[[noreturn]] void throw_transfer_error(CURLcode code, const HttpRequest& request) {
    const std::string message =
        std::string{"curl request failed: "} + curl_easy_strerror(code) + " (" + request.method + " " + request.url + ")";
    if (code == CURLE_OPERATION_TIMEDOUT) {
        throw HttpTransferError(HttpTransferError::Reason::Timeout, message);
    }
    if (code == CURLE_ABORTED_BY_CALLBACK) {
        throw HttpTransferError(HttpTransferError::Reason::Aborted, message);
    }
    throw HttpTransferError(HttpTransferError::Reason::Network, message);
}

CurlHandle new_handle() {
    global_curl();
    CurlHandle curl{curl_easy_init()};
    if (!curl) {
        throw HttpTransferError(HttpTransferError::Reason::Network, "failed to initialize curl");
    }
    return curl;
}

}  // namespace

HttpResponse perform_http_request(const HttpRequest& request) {
    CurlHandle curl = new_handle();

    std::string response_body;
    const CurlHeaders headers = configure(curl.get(), request);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_body);

    const CURLcode code = curl_easy_perform(curl.get());
    if (code != CURLE_OK) {
        throw_transfer_error(code, request);
    }

    long status_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status_code);
    return HttpResponse{status_code, std::move(response_body)};
}

HttpResponse perform_streaming_request(const HttpRequest& request,
                                       const BodyChunkHandler& on_chunk,
                                       const AbortCheck& should_abort) {
    CurlHandle curl = new_handle();

    StreamState state;
    state.curl = curl.get();
    state.on_chunk = &on_chunk;
    state.should_abort = &should_abort;

    const CurlHeaders headers = configure(curl.get(), request);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, stream_write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, stream_progress_callback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &state);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);

    const CURLcode code = curl_easy_perform(curl.get());
    if (state.failure) {
        std::rethrow_exception(state.failure);
    }

    long status_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status_code);

    if (code != CURLE_OK) {
        if (code == CURLE_WRITE_ERROR && state.stopped) {
            return HttpResponse{status_code, {}};
        }
        if (state.aborted) {
            throw HttpTransferError(HttpTransferError::Reason::Aborted, "transfer aborted: " + request.url);
        }
        throw_transfer_error(code, request);
    }
    return HttpResponse{status_code, std::move(state.error_body)};
}

}  // namespace ragquery
