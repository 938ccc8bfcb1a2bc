#include "generation/generation_adapter.hpp"

#include <sstream>
#include <utility>

#include "core/errors.hpp"
#include "generation/prompts.hpp"
#include "util/log.hpp"

namespace ragquery {

const char* generation_state_name(GenerationState state) {
    switch (state) {
        case GenerationState::Pending:
            return "PENDING";
        case GenerationState::Streaming:
            return "STREAMING";
        case GenerationState::Completed:
            return "COMPLETED";
        case GenerationState::Failed:
            return "FAILED";
        case GenerationState::Cancelled:
            return "CANCELLED";
    }
    return "UNKNOWN";
}

GenerationAdapter::GenerationAdapter(Provider primary,
                                     std::optional<Provider> secondary,
                                     GenerationTimeouts timeouts,
                                     std::string default_system_prompt)
    : primary_(std::move(primary)),
      secondary_(std::move(secondary)),
      timeouts_(timeouts),
      default_system_prompt_(default_system_prompt.empty() ? std::string{prompts::kDefaultSystemPrompt}
                                                           : std::move(default_system_prompt)) {}

bool GenerationAdapter::has_provider(const std::string& name) const {
    return provider_name(primary_) == name || (secondary_ && provider_name(*secondary_) == name);
}

std::vector<ProviderStatus> GenerationAdapter::provider_status() const {
    std::vector<ProviderStatus> status{{provider_name(primary_), "primary"}};
    if (secondary_) {
        status.push_back({provider_name(*secondary_), "secondary"});
    }
    return status;
}

std::vector<const Provider*> GenerationAdapter::attempt_order(const GenerationParams& params) const {
    if (!secondary_) {
        return {&primary_};
    }
    if (params.provider && *params.provider == provider_name(*secondary_)) {
        return {&*secondary_, &primary_};
    }
    return {&primary_, &*secondary_};
}

GenerationResult GenerationAdapter::generate(const std::string& prompt,
                                             const std::string& context,
                                             const GenerationParams& params,
                                             const CancelToken& cancel,
                                             const DeltaSink& sink) const {
    ProviderRequest request;
    request.system_prompt = params.system_prompt.value_or(default_system_prompt_);
    request.user_prompt = prompts::rag_user_prompt(prompt, context);
    request.model = params.model;
    request.temperature = params.temperature;
    request.max_output_tokens = params.max_output_tokens;

    GenerationResult result;
    const auto order = attempt_order(params);
    std::string failures;

    for (std::size_t attempt = 0; attempt < order.size(); ++attempt) {
        if (cancel.cancelled()) {
            result.state = GenerationState::Cancelled;
            return result;
        }
        const Provider& provider = *order[attempt];
        result.provider = provider_name(provider);
        result.used_failover = attempt > 0;
        result.state = GenerationState::Streaming;

        const auto started = ProviderCall::SteadyClock::now();
        ProviderCall call(cancel, started + timeouts_.first_token, started + timeouts_.total, sink);
        try {
            stream_provider(provider, request, call);
        } catch (const ProviderError& ex) {
            result.text = call.text();
            result.timed_out = ex.timed_out();
            if (call.cancelled()) {
                result.state = GenerationState::Cancelled;
                return result;
            }

            std::ostringstream oss;
            oss << "generation provider failed provider=" << result.provider << " attempt=" << attempt + 1
                << " emitted_bytes=" << call.text().size() << " timed_out=" << ex.timed_out()
                << " error=" << ex.what();
            log::warn(oss.str());

            if (!failures.empty()) {
                failures += "; ";
            }
            failures += ex.what();

            if (call.emitted() || attempt + 1 == order.size()) {
                result.state = GenerationState::Failed;
                result.error_message = failures;
                return result;
            }
            continue;
        }

        result.text = call.text();
        result.state = call.cancelled() ? GenerationState::Cancelled : GenerationState::Completed;
        return result;
    }

    // Only reachable with an empty attempt order.
    result.state = GenerationState::Failed;
    result.error_message = "no generation provider configured";
    return result;
}

}  // namespace ragquery
