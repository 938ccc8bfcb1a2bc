#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "generation/stream_parsers.hpp"

namespace ragquery {
namespace {

std::vector<std::string> feed_bytewise(SseParser& parser, const std::string& input) {
    std::vector<std::string> events;
    for (const char ch : input) {
        for (auto& event : parser.feed(std::string_view{&ch, 1})) {
            events.push_back(std::move(event));
        }
    }
    return events;
}

TEST(SseParserTest, SplitsEventsOnBlankLines) {
    SseParser parser;
    const auto events = parser.feed("data: {\"a\":1}\n\ndata: {\"a\":2}\n\n");
    EXPECT_EQ(events, (std::vector<std::string>{"{\"a\":1}", "{\"a\":2}"}));
}

TEST(SseParserTest, HandlesArbitraryChunkBoundaries) {
    SseParser parser;
    const auto events = feed_bytewise(parser, "data: hello\r\n\r\n: keep-alive\n\ndata: [DONE]\n\n");
    EXPECT_EQ(events, (std::vector<std::string>{"hello", "[DONE]"}));
}

TEST(SseParserTest, JoinsMultiLineData) {
    SseParser parser;
    const auto events = parser.feed("event: message\ndata: line one\ndata: line two\nid: 7\n\n");
    EXPECT_EQ(events, (std::vector<std::string>{"line one\nline two"}));
}

TEST(SseParserTest, KeepsPartialEventUntilTerminated) {
    SseParser parser;
    EXPECT_TRUE(parser.feed("data: par").empty());
    EXPECT_TRUE(parser.feed("tial\n").empty());
    EXPECT_EQ(parser.feed("\n"), (std::vector<std::string>{"partial"}));
}

TEST(SseParserTest, FinishFlushesUnterminatedEvent) {
    SseParser parser;
    EXPECT_TRUE(parser.feed("data: tail").empty());
    EXPECT_EQ(parser.finish(), std::optional<std::string>{"tail"});
    EXPECT_FALSE(parser.finish().has_value());
}

TEST(SseParserTest, DataWithoutSpaceAfterColon) {
    SseParser parser;
    EXPECT_EQ(parser.feed("data:compact\n\n"), (std::vector<std::string>{"compact"}));
}

TEST(NdjsonParserTest, ReturnsCompleteLines) {
    NdjsonParser parser;
    EXPECT_EQ(parser.feed("{\"a\":1}\n{\"a\""), (std::vector<std::string>{"{\"a\":1}"}));
    EXPECT_EQ(parser.feed(":2}\n\n   \n"), (std::vector<std::string>{"{\"a\":2}"}));
    EXPECT_FALSE(parser.finish().has_value());
}

TEST(NdjsonParserTest, FinishReturnsTrailingLine) {
    NdjsonParser parser;
    EXPECT_TRUE(parser.feed("{\"done\":true}").empty());
    EXPECT_EQ(parser.finish(), std::optional<std::string>{"{\"done\":true}"});
}

TEST(NdjsonParserTest, StripsCarriageReturns) {
    NdjsonParser parser;
    EXPECT_EQ(parser.feed("{}\r\n"), (std::vector<std::string>{"{}"}));
}

}  // namespace
}  // namespace ragquery
