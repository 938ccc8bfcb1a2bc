#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/cancel_token.hpp"
#include "core/types.hpp"
#include "generation/provider.hpp"

namespace ragquery {

enum class GenerationState { Pending, Streaming, Completed, Failed, Cancelled };

const char* generation_state_name(GenerationState state);

struct GenerationResult {
    GenerationState state = GenerationState::Pending;
    // Full answer when Completed, whatever was streamed otherwise.
    std::string text;
    std::string provider;
    bool used_failover = false;
    bool timed_out = false;
    std::string error_message;
};

struct GenerationTimeouts {
    std::chrono::milliseconds first_token{std::chrono::seconds(60)};
    std::chrono::milliseconds total{std::chrono::seconds(300)};
};

struct ProviderStatus {
    std::string name;
    std::string role;
};

// Streams an answer from the primary provider and fails over once to the
// secondary when the primary fails before producing any text. After partial
// output a failure is final and carries the partial text.
class GenerationAdapter {
public:
    using DeltaSink = std::function<void(std::string_view)>;

    GenerationAdapter(Provider primary,
                      std::optional<Provider> secondary,
                      GenerationTimeouts timeouts,
                      std::string default_system_prompt = {});

    GenerationResult generate(const std::string& prompt,
                              const std::string& context,
                              const GenerationParams& params,
                              const CancelToken& cancel,
                              const DeltaSink& sink) const;

    bool has_provider(const std::string& name) const;
    std::vector<ProviderStatus> provider_status() const;
    const GenerationTimeouts& timeouts() const noexcept { return timeouts_; }

private:
    std::vector<const Provider*> attempt_order(const GenerationParams& params) const;

    Provider primary_;
    std::optional<Provider> secondary_;
    GenerationTimeouts timeouts_;
    std::string default_system_prompt_;
};

}  // namespace ragquery
