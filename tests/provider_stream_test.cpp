#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include "core/errors.hpp"
#include "generation/provider.hpp"

namespace ragquery {
namespace {

using namespace std::chrono_literals;

class ProviderStreamTest : public ::testing::Test {
protected:
    ProviderCall make_call() {
        const auto far = std::chrono::steady_clock::now() + 1h;
        return ProviderCall(cancel_, far, far, [this](std::string_view delta) { deltas_.emplace_back(delta); });
    }

    static std::string sse(const std::string& content) {
        return R"(data: {"choices":[{"delta":{"content":")" + content + "\"}}]}\n\n";
    }

    static std::string ndjson(const std::string& content, bool done) {
        return R"({"message":{"role":"assistant","content":")" + content + R"("},"done":)" +
               (done ? "true" : "false") + "}\n";
    }

    CancelToken cancel_;
    std::vector<std::string> deltas_;
};

TEST_F(ProviderStreamTest, OpenAiStreamCompletesOnDoneMarker) {
    auto call = make_call();
    OpenAiStreamDecoder decoder("openai");

    EXPECT_TRUE(decoder.feed(R"(data: {"choices":[{"delta":{"role":"assistant"}}]})" "\n\n", call));
    EXPECT_TRUE(decoder.feed(sse("Refunds ") + sse("take 14 days."), call));
    EXPECT_FALSE(decoder.feed("data: [DONE]\n\n", call));
    EXPECT_NO_THROW(decoder.finish(call));

    EXPECT_TRUE(decoder.done());
    EXPECT_EQ(call.text(), "Refunds take 14 days.");
    EXPECT_EQ(deltas_, (std::vector<std::string>{"Refunds ", "take 14 days."}));
}

TEST_F(ProviderStreamTest, OpenAiDoneMarkerWithoutTrailingBlankLine) {
    auto call = make_call();
    OpenAiStreamDecoder decoder("openai");

    decoder.feed(sse("ok") + "data: [DONE]", call);
    EXPECT_NO_THROW(decoder.finish(call));
    EXPECT_TRUE(decoder.done());
}

TEST_F(ProviderStreamTest, OpenAiStreamEndingEarlyFailsWithPartialText) {
    auto call = make_call();
    OpenAiStreamDecoder decoder("openai");

    decoder.feed(sse("Refunds ") + sse("take"), call);
    try {
        decoder.finish(call);
        FAIL() << "expected ProviderError";
    } catch (const ProviderError& ex) {
        EXPECT_EQ(std::string{ex.what()}, "openai stream ended before completion");
        EXPECT_FALSE(ex.timed_out());
    }
    EXPECT_EQ(call.text(), "Refunds take");
}

TEST_F(ProviderStreamTest, OpenAiErrorEventThrows) {
    auto call = make_call();
    OpenAiStreamDecoder decoder("azure");
    EXPECT_THROW(decoder.feed(R"(data: {"error":{"message":"content filtered"}})" "\n\n", call), ProviderError);
}

TEST_F(ProviderStreamTest, CancelledStreamEndingEarlyIsNotAnError) {
    auto call = make_call();
    OpenAiStreamDecoder decoder("openai");

    decoder.feed(sse("Refunds"), call);
    cancel_.cancel();
    EXPECT_FALSE(decoder.feed(sse(" ignored"), call));
    EXPECT_NO_THROW(decoder.finish(call));
    EXPECT_EQ(call.text(), "Refunds");
}

TEST_F(ProviderStreamTest, OllamaStreamCompletesOnDoneLine) {
    auto call = make_call();
    OllamaStreamDecoder decoder("ollama");

    EXPECT_TRUE(decoder.feed(ndjson("Refunds ", false) + ndjson("take 14 days.", false), call));
    EXPECT_FALSE(decoder.feed(ndjson("", true), call));
    EXPECT_NO_THROW(decoder.finish(call));
    EXPECT_EQ(call.text(), "Refunds take 14 days.");
}

TEST_F(ProviderStreamTest, OllamaUnterminatedDoneLineCompletes) {
    auto call = make_call();
    OllamaStreamDecoder decoder("ollama");

    std::string last = ndjson("!", true);
    last.pop_back();
    decoder.feed(ndjson("Hi", false) + last, call);
    EXPECT_NO_THROW(decoder.finish(call));
    EXPECT_TRUE(decoder.done());
    EXPECT_EQ(call.text(), "Hi!");
}

TEST_F(ProviderStreamTest, OllamaStreamEndingEarlyFailsWithPartialText) {
    auto call = make_call();
    OllamaStreamDecoder decoder("ollama");

    decoder.feed(ndjson("Refunds ", false) + ndjson("take", false), call);
    EXPECT_THROW(decoder.finish(call), ProviderError);
    EXPECT_FALSE(decoder.done());
    EXPECT_EQ(call.text(), "Refunds take");
}

}  // namespace
}  // namespace ragquery
