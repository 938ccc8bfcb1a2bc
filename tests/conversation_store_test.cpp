#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "conversation/in_memory_store.hpp"

namespace ragquery {
namespace {

using namespace std::chrono_literals;

class ConversationStoreTest : public ::testing::Test {
protected:
    InMemoryConversationStore make_store(std::size_t max_turns = 20, std::chrono::seconds max_age = 24h) {
        RetentionPolicy retention;
        retention.max_turns = max_turns;
        retention.max_age = max_age;
        return InMemoryConversationStore(retention, [this] { return now_; });
    }

    ConversationTurn turn(const std::string& question,
                          const std::string& conversation_id = "conv-1",
                          const std::string& tenant_id = "t1") {
        ConversationTurn t;
        t.tenant_id = tenant_id;
        t.conversation_id = conversation_id;
        t.user_id = "u1";
        t.question = question;
        t.answer = "answer to " + question;
        t.sources = {"c-" + question};
        return t;
    }

    static std::vector<std::string> questions(const std::vector<ConversationTurn>& turns) {
        std::vector<std::string> out;
        for (const auto& t : turns) {
            out.push_back(t.question);
        }
        return out;
    }

    Clock::time_point now_ = Clock::time_point{} + std::chrono::hours(24 * 365 * 50);
};

TEST_F(ConversationStoreTest, AppendAssignsSequenceAndTimestamp) {
    auto store = make_store();
    const auto first = store.append(turn("q1"));
    const auto second = store.append(turn("q2"));

    EXPECT_EQ(first.sequence, 1);
    EXPECT_EQ(second.sequence, 2);
    EXPECT_EQ(first.created_at, now_);
}

TEST_F(ConversationStoreTest, RecentReturnsOldestFirst) {
    auto store = make_store();
    for (const char* q : {"q1", "q2", "q3", "q4"}) {
        store.append(turn(q));
    }

    EXPECT_EQ(questions(store.recent("t1", "conv-1", 2)), (std::vector<std::string>{"q3", "q4"}));
    EXPECT_EQ(questions(store.recent("t1", "conv-1", 10)), (std::vector<std::string>{"q1", "q2", "q3", "q4"}));
    EXPECT_TRUE(store.recent("t1", "conv-1", 0).empty());
}

TEST_F(ConversationStoreTest, UnknownConversationIsEmpty) {
    auto store = make_store();
    EXPECT_TRUE(store.recent("t1", "missing", 5).empty());
    EXPECT_EQ(store.stats("t1", "missing").total_turns, 0U);
}

TEST_F(ConversationStoreTest, ConversationsAreKeyedByTenant) {
    auto store = make_store();
    store.append(turn("mine", "conv-1", "t1"));
    store.append(turn("theirs", "conv-1", "t2"));

    EXPECT_EQ(questions(store.recent("t1", "conv-1", 5)), (std::vector<std::string>{"mine"}));
    EXPECT_EQ(questions(store.recent("t2", "conv-1", 5)), (std::vector<std::string>{"theirs"}));
    EXPECT_EQ(store.conversation_count(), 2U);
}

TEST_F(ConversationStoreTest, EvictsBeyondMaxTurns) {
    auto store = make_store(3);
    for (int i = 1; i <= 5; ++i) {
        store.append(turn("q" + std::to_string(i)));
    }

    const auto kept = store.recent("t1", "conv-1", 10);
    EXPECT_EQ(questions(kept), (std::vector<std::string>{"q3", "q4", "q5"}));
    EXPECT_EQ(kept.back().sequence, 5);
}

TEST_F(ConversationStoreTest, EvictsTurnsOlderThanMaxAge) {
    auto store = make_store(20, 1h);
    store.append(turn("old"));
    now_ += 30min;
    store.append(turn("middle"));
    now_ += 45min;
    store.append(turn("new"));

    EXPECT_EQ(questions(store.recent("t1", "conv-1", 10)), (std::vector<std::string>{"middle", "new"}));

    now_ += 2h;
    EXPECT_TRUE(store.recent("t1", "conv-1", 10).empty());
}

TEST_F(ConversationStoreTest, ExpiredConversationsAreDropped) {
    auto store = make_store(20, 60s);
    for (int i = 0; i < 1000; ++i) {
        store.append(turn("q", "conv-" + std::to_string(i)));
    }
    ASSERT_EQ(store.conversation_count(), 1000U);

    now_ += 2h;
    for (int i = 0; i < 500; ++i) {
        EXPECT_TRUE(store.recent("t1", "conv-" + std::to_string(i), 5).empty());
    }
    for (int i = 500; i < 1000; ++i) {
        EXPECT_EQ(store.stats("t1", "conv-" + std::to_string(i)).total_turns, 0U);
    }
    EXPECT_EQ(store.conversation_count(), 0U);
}

TEST_F(ConversationStoreTest, AppendOfAlreadyExpiredTurnKeepsNothing) {
    auto store = make_store(20, 60s);
    auto stale = turn("stale");
    stale.created_at = now_ - 2h;

    EXPECT_EQ(store.append(stale).sequence, 1);
    EXPECT_EQ(store.conversation_count(), 0U);
    EXPECT_TRUE(store.recent("t1", "conv-1", 5).empty());
}

TEST_F(ConversationStoreTest, EraseRemovesConversation) {
    auto store = make_store();
    store.append(turn("q1"));
    store.append(turn("q1", "conv-2"));

    EXPECT_TRUE(store.erase("t1", "conv-1"));
    EXPECT_FALSE(store.erase("t1", "conv-1"));
    EXPECT_TRUE(store.recent("t1", "conv-1", 5).empty());
    EXPECT_EQ(store.recent("t1", "conv-2", 5).size(), 1U);

    // A new turn after erase starts a fresh sequence.
    EXPECT_EQ(store.append(turn("again")).sequence, 1);
}

TEST_F(ConversationStoreTest, StatsSummarizeRetainedTurns) {
    auto store = make_store();
    auto first = turn("q1");
    first.answer = "abcd";
    first.sources = {"c1", "c2"};
    store.append(first);
    now_ += 1min;
    auto second = turn("q2");
    second.answer = "ab";
    second.sources = {"c2", "c3"};
    store.append(second);

    const auto stats = store.stats("t1", "conv-1");
    EXPECT_EQ(stats.total_turns, 2U);
    EXPECT_EQ(stats.unique_sources, 3U);
    EXPECT_DOUBLE_EQ(stats.avg_answer_length, 3.0);
    ASSERT_TRUE(stats.oldest.has_value());
    ASSERT_TRUE(stats.newest.has_value());
    EXPECT_EQ(*stats.newest - *stats.oldest, Clock::duration(1min));
}

TEST(SummarizeTurnsTest, EmptyInputIsZero) {
    const auto stats = summarize_turns({});
    EXPECT_EQ(stats.total_turns, 0U);
    EXPECT_FALSE(stats.oldest.has_value());
    EXPECT_DOUBLE_EQ(stats.avg_answer_length, 0.0);
}

}  // namespace
}  // namespace ragquery
