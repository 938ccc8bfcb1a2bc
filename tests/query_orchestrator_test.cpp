#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "context/context_assembler.hpp"
#include "retrieval/in_memory_index.hpp"
#include "service/query_orchestrator.hpp"
#include "tenant/tenant_directory.hpp"
#include "test_doubles.hpp"

namespace ragquery {
namespace {

using namespace std::chrono_literals;
using test::axis;
using test::failing_provider;
using test::FakeEmbedder;
using test::FlakyConversationStore;
using test::make_chunk;
using test::RecordingReporter;
using test::scripted_provider;
using test::stalling_provider;
using test::UnavailableIndex;

GenerationTimeouts short_timeouts() {
    GenerationTimeouts timeouts;
    timeouts.first_token = 60ms;
    timeouts.total = 400ms;
    return timeouts;
}

class QueryOrchestratorTest : public ::testing::Test {
protected:
    QueryOrchestratorTest() {
        index_->index(make_chunk("acme", "refund-1", axis(0), "Refunds are issued within 14 days."));
        index_->index(make_chunk("acme", "shipping-1", axis(1), "Shipping takes 3 days."));
        index_->index(make_chunk("globex", "secret-1", axis(0), "Globex internal notes."));
    }

    QueryOrchestrator make(GenerationAdapter adapter, std::shared_ptr<RetrievalIndex> index = nullptr) {
        QueryOrchestrator::Dependencies deps;
        deps.embedder = embedder_;
        if (index) {
            deps.index = std::move(index);
        } else {
            deps.index = index_;
        }
        deps.generation = std::make_shared<GenerationAdapter>(std::move(adapter));
        deps.conversations = store_;
        deps.tenants = std::make_shared<StaticTenantDirectory>(std::vector<std::string>{"acme", "globex"});
        deps.failures = reporter_;
        return QueryOrchestrator(std::move(deps), ContextAssembler{}, OrchestratorSettings{});
    }

    QueryOrchestrator make_answering(const std::vector<std::string>& deltas) {
        return make(GenerationAdapter(scripted_provider("openai", deltas), scripted_provider("ollama", {"backup"}),
                                      short_timeouts()));
    }

    static RagQueryRequest request(const std::string& query, std::optional<std::string> conversation_id = "conv-1") {
        RagQueryRequest r;
        r.tenant_id = "acme";
        r.user_id = "u1";
        r.query = query;
        r.conversation_id = std::move(conversation_id);
        return r;
    }

    std::vector<GenerationEvent> run(const QueryOrchestrator& orchestrator,
                                     const RagQueryRequest& r,
                                     const CancelToken& cancel = CancelToken{}) {
        std::vector<GenerationEvent> events;
        orchestrator.handle(
            r, [&events](const GenerationEvent& event) { events.push_back(event); }, cancel);
        return events;
    }

    std::size_t stored_turns(const std::string& conversation_id = "conv-1") {
        return store_->inner.recent("acme", conversation_id, 100).size();
    }

    std::shared_ptr<FakeEmbedder> embedder_ = std::make_shared<FakeEmbedder>();
    std::shared_ptr<InMemoryRetrievalIndex> index_ = std::make_shared<InMemoryRetrievalIndex>(test::kTestDimension);
    std::shared_ptr<FlakyConversationStore> store_ = std::make_shared<FlakyConversationStore>();
    std::shared_ptr<RecordingReporter> reporter_ = std::make_shared<RecordingReporter>();
};

TEST_F(QueryOrchestratorTest, AnswersFromRetrievedContextAndStoresTurn) {
    const auto orchestrator = make_answering({"Refunds take ", "14 days."});

    const auto answer = orchestrator.answer(request("What is the refund window?"));

    EXPECT_EQ(answer.state, QueryState::Completed);
    EXPECT_TRUE(answer.complete);
    EXPECT_EQ(answer.answer, "Refunds take 14 days.");
    EXPECT_EQ(answer.sources, (std::vector<std::string>{"refund-1"}));
    ASSERT_TRUE(answer.metadata.has_value());
    EXPECT_EQ(answer.metadata->provider, "openai");
    EXPECT_FALSE(answer.metadata->used_failover);
    EXPECT_FALSE(answer.metadata->retrieval_degraded);
    EXPECT_FALSE(answer.metadata->no_retrieved_context);
    EXPECT_TRUE(answer.metadata->persisted);

    const auto turns = store_->inner.recent("acme", "conv-1", 10);
    ASSERT_EQ(turns.size(), 1U);
    EXPECT_EQ(turns[0].question, "What is the refund window?");
    EXPECT_EQ(turns[0].answer, "Refunds take 14 days.");
    EXPECT_EQ(turns[0].sources, (std::vector<std::string>{"refund-1"}));
    EXPECT_EQ(turns[0].user_id, "u1");
}

TEST_F(QueryOrchestratorTest, EmitsSourcesThenDeltasThenOneTerminalEvent) {
    const auto orchestrator = make_answering({"a", "b", "c"});

    const auto events = run(orchestrator, request("q"));

    ASSERT_EQ(events.size(), 5U);
    EXPECT_TRUE(std::holds_alternative<SourcesAnnounced>(events[0]));
    for (std::size_t i = 1; i < 4; ++i) {
        EXPECT_TRUE(std::holds_alternative<TextDelta>(events[i])) << "event " << i;
    }
    EXPECT_TRUE(std::holds_alternative<Completed>(events[4]));
    std::size_t terminal = 0;
    for (const auto& event : events) {
        terminal += is_terminal(event) ? 1 : 0;
    }
    EXPECT_EQ(terminal, 1U);
}

TEST_F(QueryOrchestratorTest, NeverRetrievesAnotherTenantsChunks) {
    const auto orchestrator = make_answering({"ok"});
    auto r = request("notes");
    r.tenant_id = "globex";

    const auto answer = orchestrator.answer(r);

    EXPECT_EQ(answer.sources, (std::vector<std::string>{"secret-1"}));
    EXPECT_EQ(orchestrator.answer(request("notes")).sources, (std::vector<std::string>{"refund-1"}));
}

TEST_F(QueryOrchestratorTest, GeneratesConversationIdWhenAbsent) {
    const auto orchestrator = make_answering({"ok"});

    const auto answer = orchestrator.answer(request("q", std::nullopt));

    ASSERT_TRUE(answer.metadata.has_value());
    const std::string& id = answer.metadata->conversation_id;
    EXPECT_FALSE(id.empty());
    EXPECT_EQ(stored_turns(id), 1U);
    EXPECT_NE(orchestrator.answer(request("q", std::nullopt)).metadata->conversation_id, id);
}

TEST_F(QueryOrchestratorTest, InvalidRequestHasNoSideEffects) {
    const auto orchestrator = make_answering({"unused"});
    auto r = request("   ");

    const auto events = run(orchestrator, r);

    ASSERT_EQ(events.size(), 1U);
    const auto* failed = std::get_if<Failed>(&events[0]);
    ASSERT_NE(failed, nullptr);
    EXPECT_EQ(failed->error_kind, ErrorKind::InvalidRequest);
    EXPECT_EQ(embedder_->calls, 0);
    EXPECT_EQ(store_->appends, 0);
}

TEST_F(QueryOrchestratorTest, RejectsOutOfRangeOptions) {
    const auto orchestrator = make_answering({"unused"});

    auto too_many = request("q");
    too_many.options.top_k = 101;
    EXPECT_EQ(orchestrator.answer(too_many).error_kind, std::optional<ErrorKind>{ErrorKind::InvalidRequest});

    auto long_query = request(std::string(2001, 'x'));
    EXPECT_EQ(orchestrator.answer(long_query).error_kind, std::optional<ErrorKind>{ErrorKind::InvalidRequest});

    auto bad_conversation = request("q", std::string{"has space"});
    EXPECT_EQ(orchestrator.answer(bad_conversation).error_kind, std::optional<ErrorKind>{ErrorKind::InvalidRequest});

    auto unknown_provider = request("q");
    unknown_provider.options.generation.provider = "azure";
    EXPECT_EQ(orchestrator.answer(unknown_provider).error_kind, std::optional<ErrorKind>{ErrorKind::InvalidRequest});

    EXPECT_EQ(embedder_->calls, 0);
}

TEST_F(QueryOrchestratorTest, UnknownTenantIsInvalid) {
    const auto orchestrator = make_answering({"unused"});
    auto r = request("q");
    r.tenant_id = "initech";

    const auto answer = orchestrator.answer(r);

    EXPECT_EQ(answer.state, QueryState::Failed);
    EXPECT_EQ(answer.error_kind, std::optional<ErrorKind>{ErrorKind::InvalidRequest});
    EXPECT_NE(answer.error_message.find("unknown tenant"), std::string::npos);
    EXPECT_EQ(embedder_->calls, 0);
}

TEST_F(QueryOrchestratorTest, UnavailableIndexDegradesToUngroundedAnswer) {
    auto unavailable = std::make_shared<UnavailableIndex>();
    const auto orchestrator = make(
        GenerationAdapter(scripted_provider("openai", {"I could not find that."}), std::nullopt, short_timeouts()),
        unavailable);

    const auto answer = orchestrator.answer(request("q"));

    EXPECT_EQ(answer.state, QueryState::Completed);
    EXPECT_EQ(answer.answer, "I could not find that.");
    EXPECT_TRUE(answer.sources.empty());
    ASSERT_TRUE(answer.metadata.has_value());
    EXPECT_TRUE(answer.metadata->retrieval_degraded);
    EXPECT_TRUE(answer.metadata->no_retrieved_context);
    EXPECT_EQ(unavailable->searches, 1);
    EXPECT_EQ(stored_turns(), 1U);
}

TEST_F(QueryOrchestratorTest, EmbeddingFailureDegradesRetrieval) {
    embedder_->fail = true;
    const auto orchestrator = make_answering({"ok"});

    const auto answer = orchestrator.answer(request("q"));

    EXPECT_EQ(answer.state, QueryState::Completed);
    EXPECT_TRUE(answer.metadata->retrieval_degraded);
    EXPECT_TRUE(answer.metadata->no_retrieved_context);
}

TEST_F(QueryOrchestratorTest, NoRelevantChunksStillAnswers) {
    const auto orchestrator = make_answering({"nothing relevant"});
    auto r = request("q");
    r.tenant_id = "globex";
    r.options.min_score = 1.0;
    index_->tombstone("globex", "secret-1");

    const auto answer = orchestrator.answer(r);

    EXPECT_EQ(answer.state, QueryState::Completed);
    EXPECT_TRUE(answer.sources.empty());
    EXPECT_TRUE(answer.metadata->no_retrieved_context);
    EXPECT_FALSE(answer.metadata->retrieval_degraded);
}

TEST_F(QueryOrchestratorTest, FailsOverToSecondaryProvider) {
    auto secondary_calls = std::make_shared<int>(0);
    const auto orchestrator = make(GenerationAdapter(failing_provider("openai"),
                                                     scripted_provider("ollama", {"from ollama"}, secondary_calls),
                                                     short_timeouts()));

    const auto answer = orchestrator.answer(request("q"));

    EXPECT_EQ(answer.state, QueryState::Completed);
    EXPECT_EQ(answer.answer, "from ollama");
    EXPECT_EQ(answer.metadata->provider, "ollama");
    EXPECT_TRUE(answer.metadata->used_failover);
    EXPECT_EQ(*secondary_calls, 1);
    EXPECT_EQ(stored_turns(), 1U);
}

TEST_F(QueryOrchestratorTest, BothProvidersTimingOutFailsWithoutStoringTurn) {
    const auto orchestrator = make(
        GenerationAdapter(stalling_provider("openai"), stalling_provider("ollama"), short_timeouts()));

    const auto events = run(orchestrator, request("q"));

    ASSERT_FALSE(events.empty());
    const auto* failed = std::get_if<Failed>(&events.back());
    ASSERT_NE(failed, nullptr);
    EXPECT_EQ(failed->error_kind, ErrorKind::GenerationProviderFailure);
    EXPECT_TRUE(failed->partial_text.empty());
    EXPECT_EQ(store_->appends, 0);
    EXPECT_EQ(stored_turns(), 0U);
}

TEST_F(QueryOrchestratorTest, PartialAnswerIsNotStored) {
    const auto orchestrator = make(
        GenerationAdapter(stalling_provider("openai", {"Refunds"}), std::nullopt, short_timeouts()));

    const auto answer = orchestrator.answer(request("q"));

    EXPECT_EQ(answer.state, QueryState::Failed);
    EXPECT_FALSE(answer.complete);
    EXPECT_EQ(answer.answer, "Refunds");
    EXPECT_EQ(stored_turns(), 0U);
}

TEST_F(QueryOrchestratorTest, TruncatedProviderStreamFailsWithoutStoringTurn) {
    Provider truncated = CallbackProvider("openai", [](const ProviderRequest&, ProviderCall& call) {
        OpenAiStreamDecoder decoder("openai");
        decoder.feed("data: {\"choices\":[{\"delta\":{\"content\":\"Refunds take\"}}]}\n\n", call);
        decoder.finish(call);
    });
    const auto orchestrator = make(GenerationAdapter(std::move(truncated), std::nullopt, short_timeouts()));

    const auto answer = orchestrator.answer(request("q"));

    EXPECT_EQ(answer.state, QueryState::Failed);
    EXPECT_FALSE(answer.complete);
    EXPECT_EQ(answer.answer, "Refunds take");
    ASSERT_TRUE(answer.error_kind.has_value());
    EXPECT_EQ(*answer.error_kind, ErrorKind::GenerationProviderFailure);
    EXPECT_NE(answer.error_message.find("stream ended before completion"), std::string::npos);
    EXPECT_EQ(stored_turns(), 0U);
}

TEST_F(QueryOrchestratorTest, CancellationEndsWithCancelledAndNoTurn) {
    const CancelToken cancel;
    const auto orchestrator = make(GenerationAdapter(
        CallbackProvider("openai",
                         [cancel](const ProviderRequest&, ProviderCall& call) {
                             call.emit("Refunds ");
                             cancel.cancel();
                             call.emit("take 14 days.");
                         }),
        std::nullopt, short_timeouts()));

    const auto events = run(orchestrator, request("q"), cancel);

    ASSERT_FALSE(events.empty());
    const auto* cancelled = std::get_if<Cancelled>(&events.back());
    ASSERT_NE(cancelled, nullptr);
    EXPECT_EQ(cancelled->partial_text, "Refunds ");
    EXPECT_EQ(store_->appends, 0);
}

TEST_F(QueryOrchestratorTest, CancelledBeforeRetrievalFinishes) {
    const CancelToken cancel;
    cancel.cancel();
    const auto orchestrator = make_answering({"unused"});

    const auto answer = orchestrator.answer(request("q"), cancel);

    EXPECT_EQ(answer.state, QueryState::Cancelled);
    EXPECT_TRUE(answer.answer.empty());
    EXPECT_EQ(store_->appends, 0);
}

TEST_F(QueryOrchestratorTest, StoreFailureStillDeliversAnswerAndReports) {
    store_->fail_append = true;
    const auto orchestrator = make_answering({"Refunds take 14 days."});

    const auto answer = orchestrator.answer(request("What is the refund window?"));

    EXPECT_EQ(answer.state, QueryState::Completed);
    EXPECT_EQ(answer.answer, "Refunds take 14 days.");
    EXPECT_FALSE(answer.metadata->persisted);
    ASSERT_EQ(reporter_->failures.size(), 1U);
    const auto& failure = reporter_->failures[0];
    EXPECT_EQ(failure.tenant_id, "acme");
    EXPECT_EQ(failure.conversation_id, "conv-1");
    EXPECT_EQ(failure.question, "What is the refund window?");
    EXPECT_EQ(failure.answer, "Refunds take 14 days.");
    EXPECT_EQ(failure.error, "store offline");
}

TEST_F(QueryOrchestratorTest, HistoryFailureAnswersWithoutHistory) {
    store_->fail_recent = true;
    const auto orchestrator = make_answering({"ok"});

    const auto answer = orchestrator.answer(request("follow-up"));

    EXPECT_EQ(answer.state, QueryState::Completed);
    EXPECT_EQ(embedder_->last_text, "follow-up");
}

TEST_F(QueryOrchestratorTest, FollowUpFoldsHistoryIntoRetrievalAndPrompt) {
    std::string seen_prompt;
    const auto orchestrator = make(GenerationAdapter(
        CallbackProvider("openai",
                         [&seen_prompt](const ProviderRequest& r, ProviderCall& call) {
                             seen_prompt = r.user_prompt;
                             call.emit("answer");
                         }),
        std::nullopt, short_timeouts()));

    orchestrator.answer(request("first question"));
    orchestrator.answer(request("second question"));
    orchestrator.answer(request("third question"));

    EXPECT_EQ(embedder_->last_text, "first question\nsecond question\nthird question");
    EXPECT_NE(seen_prompt.find("User: second question"), std::string::npos);
    EXPECT_NE(seen_prompt.find("New question: third question"), std::string::npos);
    EXPECT_EQ(stored_turns(), 3U);
}

TEST_F(QueryOrchestratorTest, HistoryTurnsZeroSkipsHistory) {
    const auto orchestrator = make_answering({"ok"});
    orchestrator.answer(request("first question"));

    auto r = request("second question");
    r.options.history_turns = 0;
    orchestrator.answer(r);

    EXPECT_EQ(embedder_->last_text, "second question");
}

}  // namespace
}  // namespace ragquery
