#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "core/cancel_token.hpp"
#include "embedding/http_embedder.hpp"
#include "generation/stream_parsers.hpp"

namespace ragquery {

struct ProviderRequest {
    std::string system_prompt;
    std::string user_prompt;
    std::optional<std::string> model;
    double temperature = 0.1;
    int max_output_tokens = 1500;
};

// State of one streaming attempt against one provider. Providers push text
// through emit() and poll should_stop() while waiting on the network.
class ProviderCall {
public:
    using SteadyClock = std::chrono::steady_clock;
    using DeltaSink = std::function<void(std::string_view)>;

    ProviderCall(CancelToken cancel,
                 SteadyClock::time_point first_token_deadline,
                 SteadyClock::time_point total_deadline,
                 DeltaSink sink);

    // Forwards a delta. Returns false once cancelled, in which case the delta
    // is dropped. Throws ProviderError(timed_out) past the active deadline.
    bool emit(std::string_view delta);

    bool cancelled() const noexcept { return cancel_.cancelled(); }
    // First-token deadline until something was emitted, total deadline after.
    bool deadline_passed() const noexcept;
    bool should_stop() const noexcept { return cancelled() || deadline_passed(); }
    void check_deadline() const;

    bool emitted() const noexcept { return !text_.empty(); }
    const std::string& text() const noexcept { return text_; }
    std::chrono::milliseconds remaining() const noexcept;

private:
    CancelToken cancel_;
    SteadyClock::time_point first_token_deadline_;
    SteadyClock::time_point total_deadline_;
    DeltaSink sink_;
    std::string text_;
};

// Decodes an OpenAI-compatible event stream into deltas on a call.
class OpenAiStreamDecoder {
public:
    explicit OpenAiStreamDecoder(std::string provider);

    // False once [DONE] arrived or the call stopped taking deltas.
    bool feed(std::string_view bytes, ProviderCall& call);
    // Flushes an unterminated trailing event. Throws ProviderError when the
    // body ended without [DONE] and the call was not cancelled.
    void finish(ProviderCall& call);

    bool done() const noexcept { return done_; }

private:
    std::string provider_;
    SseParser parser_;
    bool done_ = false;
};

// Same contract for Ollama's newline-delimited chat stream, which ends with a
// line carrying "done": true.
class OllamaStreamDecoder {
public:
    explicit OllamaStreamDecoder(std::string provider);

    bool feed(std::string_view bytes, ProviderCall& call);
    void finish(ProviderCall& call);

    bool done() const noexcept { return done_; }

private:
    bool consume(const std::string& line, ProviderCall& call);

    std::string provider_;
    NdjsonParser parser_;
    bool done_ = false;
};

struct OpenAiProviderSettings {
    std::string name = "openai";
    // Full chat-completions URL.
    std::string url;
    std::string api_key;
    ApiAuthStyle auth = ApiAuthStyle::Bearer;
    std::string model;
    long connect_timeout_seconds = 10;
};

// OpenAI-compatible /chat/completions with stream=true (Server-Sent Events).
// Azure OpenAI deployments use the same wire format.
class OpenAiChatProvider {
public:
    explicit OpenAiChatProvider(OpenAiProviderSettings settings);

    const std::string& name() const noexcept { return settings_.name; }
    void stream(const ProviderRequest& request, ProviderCall& call) const;

private:
    OpenAiProviderSettings settings_;
};

struct OllamaProviderSettings {
    std::string name = "ollama";
    std::string base_url = "http://localhost:11434";
    std::string model = "llama3";
    long connect_timeout_seconds = 10;
};

// Ollama /api/chat, streamed as newline-delimited JSON.
class OllamaChatProvider {
public:
    explicit OllamaChatProvider(OllamaProviderSettings settings);

    const std::string& name() const noexcept { return settings_.name; }
    void stream(const ProviderRequest& request, ProviderCall& call) const;

private:
    OllamaProviderSettings settings_;
};

// In-process provider backed by a function, for embedding callers and tests.
class CallbackProvider {
public:
    using Fn = std::function<void(const ProviderRequest&, ProviderCall&)>;

    CallbackProvider(std::string name, Fn fn);

    const std::string& name() const noexcept { return name_; }
    void stream(const ProviderRequest& request, ProviderCall& call) const;

private:
    std::string name_;
    Fn fn_;
};

// Closed set of backends. stream() returns normally on completion or when the
// call was cancelled, and throws ProviderError on every failure.
using Provider = std::variant<OpenAiChatProvider, OllamaChatProvider, CallbackProvider>;

const std::string& provider_name(const Provider& provider);
void stream_provider(const Provider& provider, const ProviderRequest& request, ProviderCall& call);

}  // namespace ragquery
