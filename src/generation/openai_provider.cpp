#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

#include "core/errors.hpp"
#include "generation/http_stream.hpp"
#include "generation/provider.hpp"
#include "generation/stream_parsers.hpp"

namespace ragquery {
namespace {

constexpr std::string_view kDoneMarker = "[DONE]";

nlohmann::json build_chat_completions_body(const ProviderRequest& request, const std::string& default_model) {
    nlohmann::json body;
    body["model"] = request.model.value_or(default_model);
    body["temperature"] = request.temperature;
    body["max_tokens"] = request.max_output_tokens;
    body["stream"] = true;
    body["messages"] = nlohmann::json::array({
        {{"role", "system"}, {"content", request.system_prompt}},
        {{"role", "user"}, {"content", request.user_prompt}},
    });
    return body;
}

nlohmann::json parse_event(const std::string& data, const std::string& provider) {
    try {
        return nlohmann::json::parse(data);
    } catch (const nlohmann::json::exception& ex) {
        throw ProviderError(provider + " sent a malformed stream event: " + ex.what());
    }
}

// Content delta of one chat.completion.chunk; empty for role-only and
// finish chunks.
std::string extract_delta(const nlohmann::json& event, const std::string& provider) {
    if (event.contains("error")) {
        const auto& error = event["error"];
        const std::string message =
            error.is_object() ? error.value("message", error.dump()) : error.dump();
        throw ProviderError(provider + " stream error: " + message);
    }
    if (!event.contains("choices") || !event["choices"].is_array() || event["choices"].empty()) {
        return {};
    }
    const auto& choice = event["choices"][0];
    if (!choice.contains("delta") || !choice["delta"].is_object()) {
        return {};
    }
    const auto& delta = choice["delta"];
    if (!delta.contains("content") || !delta["content"].is_string()) {
        return {};
    }
    return delta["content"].get<std::string>();
}

}  // namespace

OpenAiStreamDecoder::OpenAiStreamDecoder(std::string provider) : provider_(std::move(provider)) {}

bool OpenAiStreamDecoder::feed(std::string_view bytes, ProviderCall& call) {
    for (const auto& data : parser_.feed(bytes)) {
        if (data == kDoneMarker) {
            done_ = true;
            return false;
        }
        if (!call.emit(extract_delta(parse_event(data, provider_), provider_))) {
            return false;
        }
    }
    return true;
}

void OpenAiStreamDecoder::finish(ProviderCall& call) {
    if (done_ || call.cancelled()) {
        return;
    }
    if (const auto trailing = parser_.finish()) {
        if (*trailing == kDoneMarker) {
            done_ = true;
            return;
        }
        call.emit(extract_delta(parse_event(*trailing, provider_), provider_));
    }
    if (!call.cancelled()) {
        throw ProviderError(provider_ + " stream ended before completion");
    }
}

OpenAiChatProvider::OpenAiChatProvider(OpenAiProviderSettings settings) : settings_(std::move(settings)) {
    if (settings_.url.empty()) {
        throw std::invalid_argument("missing chat completions endpoint for provider " + settings_.name);
    }
    if (settings_.api_key.empty()) {
        throw std::invalid_argument("missing api key for provider " + settings_.name);
    }
}

void OpenAiChatProvider::stream(const ProviderRequest& request, ProviderCall& call) const {
    auto headers = auth_headers(settings_.auth, settings_.api_key);
    headers.push_back("Accept: text/event-stream");
    HttpRequest http_request{
        .method = "POST",
        .url = settings_.url,
        .headers = std::move(headers),
        .body = build_chat_completions_body(request, settings_.model).dump(),
        .timeout_seconds = 0,
        .timeout_ms = 0,
        .connect_timeout_seconds = settings_.connect_timeout_seconds,
    };

    OpenAiStreamDecoder decoder(settings_.name);
    run_provider_transfer(settings_.name, std::move(http_request), call,
                          [&](std::string_view bytes) { return decoder.feed(bytes, call); });
    decoder.finish(call);
}

}  // namespace ragquery
