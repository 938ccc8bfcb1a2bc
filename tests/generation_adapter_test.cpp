#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "generation/generation_adapter.hpp"
#include "generation/prompts.hpp"
#include "test_doubles.hpp"

namespace ragquery {
namespace {

using namespace std::chrono_literals;
using test::failing_provider;
using test::scripted_provider;
using test::stalling_provider;

GenerationTimeouts short_timeouts() {
    GenerationTimeouts timeouts;
    timeouts.first_token = 60ms;
    timeouts.total = 400ms;
    return timeouts;
}

struct Collected {
    std::vector<std::string> deltas;

    GenerationAdapter::DeltaSink sink() {
        return [this](std::string_view delta) { deltas.emplace_back(delta); };
    }
};

TEST(GenerationAdapterTest, StreamsPrimaryAnswer) {
    GenerationAdapter adapter(scripted_provider("primary", {"Refunds ", "take ", "14 days."}), std::nullopt,
                              short_timeouts());
    Collected collected;

    const auto result = adapter.generate("How long?", "ctx", GenerationParams{}, CancelToken{}, collected.sink());

    EXPECT_EQ(result.state, GenerationState::Completed);
    EXPECT_EQ(result.text, "Refunds take 14 days.");
    EXPECT_EQ(result.provider, "primary");
    EXPECT_FALSE(result.used_failover);
    EXPECT_EQ(collected.deltas, (std::vector<std::string>{"Refunds ", "take ", "14 days."}));
}

TEST(GenerationAdapterTest, FailsOverWhenPrimaryFailsBeforeFirstToken) {
    auto primary_calls = std::make_shared<int>(0);
    auto secondary_calls = std::make_shared<int>(0);
    GenerationAdapter adapter(failing_provider("primary", primary_calls),
                              scripted_provider("secondary", {"fallback answer"}, secondary_calls), short_timeouts());
    Collected collected;

    const auto result = adapter.generate("q", "", GenerationParams{}, CancelToken{}, collected.sink());

    EXPECT_EQ(result.state, GenerationState::Completed);
    EXPECT_EQ(result.text, "fallback answer");
    EXPECT_EQ(result.provider, "secondary");
    EXPECT_TRUE(result.used_failover);
    EXPECT_EQ(*primary_calls, 1);
    EXPECT_EQ(*secondary_calls, 1);
}

TEST(GenerationAdapterTest, FailsOverWhenPrimaryMissesFirstTokenDeadline) {
    auto secondary_calls = std::make_shared<int>(0);
    GenerationAdapter adapter(stalling_provider("primary"),
                              scripted_provider("secondary", {"late but fine"}, secondary_calls), short_timeouts());
    Collected collected;

    const auto started = std::chrono::steady_clock::now();
    const auto result = adapter.generate("q", "", GenerationParams{}, CancelToken{}, collected.sink());

    EXPECT_EQ(result.state, GenerationState::Completed);
    EXPECT_TRUE(result.used_failover);
    EXPECT_EQ(result.text, "late but fine");
    EXPECT_EQ(*secondary_calls, 1);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

TEST(GenerationAdapterTest, FailsWhenBothProvidersTimeOut) {
    GenerationAdapter adapter(stalling_provider("primary"), stalling_provider("secondary"), short_timeouts());
    Collected collected;

    const auto result = adapter.generate("q", "", GenerationParams{}, CancelToken{}, collected.sink());

    EXPECT_EQ(result.state, GenerationState::Failed);
    EXPECT_TRUE(result.timed_out);
    EXPECT_TRUE(result.used_failover);
    EXPECT_TRUE(result.text.empty());
    EXPECT_FALSE(result.error_message.empty());
    EXPECT_TRUE(collected.deltas.empty());
}

TEST(GenerationAdapterTest, NoFailoverAfterPartialOutput) {
    auto secondary_calls = std::make_shared<int>(0);
    GenerationAdapter adapter(
        CallbackProvider("primary",
                         [](const ProviderRequest&, ProviderCall& call) {
                             call.emit("Refunds take");
                             throw ProviderError("connection reset");
                         }),
        scripted_provider("secondary", {"should not run"}, secondary_calls), short_timeouts());
    Collected collected;

    const auto result = adapter.generate("q", "", GenerationParams{}, CancelToken{}, collected.sink());

    EXPECT_EQ(result.state, GenerationState::Failed);
    EXPECT_EQ(result.text, "Refunds take");
    EXPECT_FALSE(result.used_failover);
    EXPECT_EQ(*secondary_calls, 0);
    EXPECT_EQ(collected.deltas, (std::vector<std::string>{"Refunds take"}));
}

TEST(GenerationAdapterTest, TotalTimeoutAfterFirstTokenFailsWithPartialText) {
    auto secondary_calls = std::make_shared<int>(0);
    GenerationAdapter adapter(stalling_provider("primary", {"partial"}),
                              scripted_provider("secondary", {"unused"}, secondary_calls), short_timeouts());
    Collected collected;

    const auto result = adapter.generate("q", "", GenerationParams{}, CancelToken{}, collected.sink());

    EXPECT_EQ(result.state, GenerationState::Failed);
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.text, "partial");
    EXPECT_EQ(*secondary_calls, 0);
}

TEST(GenerationAdapterTest, CancellationStopsStreaming) {
    const CancelToken cancel;
    GenerationAdapter adapter(
        CallbackProvider("primary",
                         [cancel](const ProviderRequest&, ProviderCall& call) {
                             call.emit("first ");
                             cancel.cancel();
                             call.emit("second");
                         }),
        scripted_provider("secondary", {"unused"}), short_timeouts());
    Collected collected;

    const auto result = adapter.generate("q", "", GenerationParams{}, cancel, collected.sink());

    EXPECT_EQ(result.state, GenerationState::Cancelled);
    EXPECT_EQ(result.text, "first ");
    EXPECT_EQ(collected.deltas, (std::vector<std::string>{"first "}));
}

TEST(GenerationAdapterTest, CancelledBeforeStartNeverCallsProvider) {
    auto calls = std::make_shared<int>(0);
    GenerationAdapter adapter(scripted_provider("primary", {"x"}, calls), std::nullopt, short_timeouts());
    const CancelToken cancel;
    cancel.cancel();

    const auto result = adapter.generate("q", "", GenerationParams{}, cancel, [](std::string_view) {});

    EXPECT_EQ(result.state, GenerationState::Cancelled);
    EXPECT_EQ(*calls, 0);
}

TEST(GenerationAdapterTest, PreferredProviderGoesFirst) {
    GenerationAdapter adapter(scripted_provider("openai", {"from openai"}), scripted_provider("ollama", {"from ollama"}),
                              short_timeouts());
    GenerationParams params;
    params.provider = "ollama";

    const auto result = adapter.generate("q", "", params, CancelToken{}, [](std::string_view) {});

    EXPECT_EQ(result.provider, "ollama");
    EXPECT_EQ(result.text, "from ollama");
    EXPECT_TRUE(adapter.has_provider("openai"));
    EXPECT_FALSE(adapter.has_provider("azure"));
}

TEST(GenerationAdapterTest, BuildsPromptFromContextAndParams) {
    ProviderRequest seen;
    GenerationAdapter adapter(CallbackProvider("primary",
                                               [&seen](const ProviderRequest& request, ProviderCall& call) {
                                                   seen = request;
                                                   call.emit("ok");
                                               }),
                              std::nullopt, short_timeouts());
    GenerationParams params;
    params.temperature = 0.5;
    params.max_output_tokens = 64;
    params.model = "small";

    adapter.generate("What is the refund window?", "Refunds take 14 days.", params, CancelToken{},
                     [](std::string_view) {});

    EXPECT_EQ(seen.system_prompt, std::string{prompts::kDefaultSystemPrompt});
    EXPECT_NE(seen.user_prompt.find("Refunds take 14 days."), std::string::npos);
    EXPECT_NE(seen.user_prompt.find("What is the refund window?"), std::string::npos);
    EXPECT_DOUBLE_EQ(seen.temperature, 0.5);
    EXPECT_EQ(seen.max_output_tokens, 64);
    EXPECT_EQ(seen.model, std::optional<std::string>{"small"});
}

TEST(GenerationAdapterTest, EmptyContextUsesPlaceholder) {
    ProviderRequest seen;
    GenerationAdapter adapter(CallbackProvider("primary",
                                               [&seen](const ProviderRequest& request, ProviderCall& call) {
                                                   seen = request;
                                                   call.emit("ok");
                                               }),
                              std::nullopt, short_timeouts());

    adapter.generate("q", "", GenerationParams{}, CancelToken{}, [](std::string_view) {});

    EXPECT_NE(seen.user_prompt.find(std::string{prompts::kNoContextPlaceholder}), std::string::npos);
}

TEST(PromptsTest, HistoryIsFoldedIntoQuestion) {
    ConversationTurn earlier;
    earlier.question = "What is the refund window?";
    earlier.answer = "14 days.";

    const auto prompt = prompts::with_history({earlier}, "And for sale items?");
    EXPECT_EQ(prompt,
              "Given our recent conversation:\nUser: What is the refund window?\nAI: 14 days.\n\n"
              "New question: And for sale items?");
    EXPECT_EQ(prompts::with_history({}, "plain"), "plain");
}

}  // namespace
}  // namespace ragquery
