#include "generation/http_stream.hpp"

#include <algorithm>

#include "core/errors.hpp"
#include "util/text.hpp"

namespace ragquery {
namespace {

constexpr std::size_t kErrorBodyPreviewBytes = 512;

}  // namespace

void run_provider_transfer(const std::string& provider, HttpRequest request, ProviderCall& call,
                           const BodyChunkHandler& on_chunk) {
    call.check_deadline();
    request.timeout_ms = std::max<long>(1, static_cast<long>(call.remaining().count()));

    HttpResponse response;
    try {
        response = perform_streaming_request(request, on_chunk, [&call] { return call.should_stop(); });
    } catch (const HttpTransferError& ex) {
        if (call.cancelled()) {
            return;
        }
        if (ex.aborted() || ex.timed_out()) {
            call.check_deadline();
            throw ProviderError(provider + " timed out", true);
        }
        throw ProviderError(provider + " transport failed: " + ex.what());
    }

    if (call.cancelled()) {
        return;
    }
    if (response.status < 200 || response.status >= 300) {
        throw ProviderError(provider + " failed with status " + std::to_string(response.status) +
                            " body: " + text::preview(response.body, kErrorBodyPreviewBytes));
    }
}

}  // namespace ragquery
