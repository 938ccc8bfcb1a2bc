#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

#include "core/errors.hpp"
#include "generation/http_stream.hpp"
#include "generation/provider.hpp"
#include "generation/stream_parsers.hpp"

namespace ragquery {
namespace {

std::string ensure_no_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

nlohmann::json build_chat_body(const ProviderRequest& request, const std::string& default_model) {
    nlohmann::json body;
    body["model"] = request.model.value_or(default_model);
    body["stream"] = true;
    body["options"] = {{"temperature", request.temperature}, {"num_predict", request.max_output_tokens}};
    body["messages"] = nlohmann::json::array({
        {{"role", "system"}, {"content", request.system_prompt}},
        {{"role", "user"}, {"content", request.user_prompt}},
    });
    return body;
}

struct OllamaLine {
    std::string content;
    bool done = false;
};

OllamaLine parse_line(const std::string& line, const std::string& provider) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(line);
    } catch (const nlohmann::json::exception& ex) {
        throw ProviderError(provider + " sent a malformed stream line: " + ex.what());
    }
    if (json.contains("error")) {
        throw ProviderError(provider + " stream error: " +
                            (json["error"].is_string() ? json["error"].get<std::string>() : json["error"].dump()));
    }
    OllamaLine parsed;
    if (json.contains("message") && json["message"].is_object()) {
        parsed.content = json["message"].value("content", std::string{});
    }
    parsed.done = json.value("done", false);
    return parsed;
}

}  // namespace

OllamaStreamDecoder::OllamaStreamDecoder(std::string provider) : provider_(std::move(provider)) {}

bool OllamaStreamDecoder::consume(const std::string& line, ProviderCall& call) {
    const auto parsed = parse_line(line, provider_);
    if (!call.emit(parsed.content)) {
        return false;
    }
    done_ = parsed.done;
    return !done_;
}

bool OllamaStreamDecoder::feed(std::string_view bytes, ProviderCall& call) {
    for (const auto& line : parser_.feed(bytes)) {
        if (!consume(line, call)) {
            return false;
        }
    }
    return true;
}

void OllamaStreamDecoder::finish(ProviderCall& call) {
    if (done_ || call.cancelled()) {
        return;
    }
    if (const auto trailing = parser_.finish()) {
        consume(*trailing, call);
    }
    if (!done_ && !call.cancelled()) {
        throw ProviderError(provider_ + " stream ended before completion");
    }
}

OllamaChatProvider::OllamaChatProvider(OllamaProviderSettings settings) : settings_(std::move(settings)) {
    settings_.base_url = ensure_no_trailing_slash(std::move(settings_.base_url));
    if (settings_.base_url.empty()) {
        throw std::invalid_argument("missing base url for provider " + settings_.name);
    }
}

void OllamaChatProvider::stream(const ProviderRequest& request, ProviderCall& call) const {
    HttpRequest http_request{
        .method = "POST",
        .url = settings_.base_url + "/api/chat",
        .headers = {"Content-Type: application/json"},
        .body = build_chat_body(request, settings_.model).dump(),
        .timeout_seconds = 0,
        .timeout_ms = 0,
        .connect_timeout_seconds = settings_.connect_timeout_seconds,
    };

    OllamaStreamDecoder decoder(settings_.name);
    run_provider_transfer(settings_.name, std::move(http_request), call,
                          [&](std::string_view bytes) { return decoder.feed(bytes, call); });
    decoder.finish(call);
}

}  // namespace ragquery
