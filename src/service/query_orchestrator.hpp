#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "context/context_assembler.hpp"
#include "conversation/conversation_store.hpp"
#include "core/cancel_token.hpp"
#include "core/types.hpp"
#include "embedding/embedder.hpp"
#include "generation/generation_adapter.hpp"
#include "retrieval/retrieval_index.hpp"
#include "service/failure_reporter.hpp"
#include "tenant/tenant_directory.hpp"

namespace ragquery {

enum class QueryState {
    Received,
    Validating,
    Retrieving,
    Assembling,
    Generating,
    Persisting,
    Completed,
    Failed,
    Cancelled,
};

const char* query_state_name(QueryState state);

struct OrchestratorSettings {
    std::size_t max_query_chars = 2000;
    int max_top_k = 100;
    // Turns replayed into the prompt when the request does not say.
    std::size_t history_turns = 5;
    // Earlier user questions folded into the retrieval text.
    std::size_t retrieval_history_questions = 2;
    double default_min_score = 0.0;
};

struct QueryOutcome {
    QueryState state = QueryState::Received;
    std::optional<ErrorKind> error_kind;
    std::string conversation_id;
    bool persisted = false;
};

// Collected form of one event stream.
struct QueryAnswer {
    std::string answer;
    std::vector<std::string> sources;
    bool complete = false;
    QueryState state = QueryState::Received;
    std::optional<ErrorKind> error_kind;
    std::string error_message;
    std::optional<AnswerMetadata> metadata;
};

using EventSink = std::function<void(const GenerationEvent&)>;

class QueryOrchestrator {
public:
    struct Dependencies {
        std::shared_ptr<Embedder> embedder;
        std::shared_ptr<RetrievalIndex> index;
        std::shared_ptr<GenerationAdapter> generation;
        std::shared_ptr<ConversationStore> conversations;
        std::shared_ptr<TenantDirectory> tenants;
        std::shared_ptr<FailureReporter> failures;
    };

    QueryOrchestrator(Dependencies deps, ContextAssembler assembler, OrchestratorSettings settings);

    // Runs one query and delivers its events to sink, ending with exactly one
    // of Completed, Failed or Cancelled. Never throws for pipeline failures.
    QueryOutcome handle(const RagQueryRequest& request, const EventSink& sink, const CancelToken& cancel) const;

    QueryAnswer answer(const RagQueryRequest& request) const;
    QueryAnswer answer(const RagQueryRequest& request, const CancelToken& cancel) const;

    // Throws InvalidRequestError; StoreError when the tenant lookup fails.
    void validate(const RagQueryRequest& request) const;

    const ContextAssembler& assembler() const noexcept { return assembler_; }
    const OrchestratorSettings& settings() const noexcept { return settings_; }

private:
    QueryOutcome run(const RagQueryRequest& request, const EventSink& sink, const CancelToken& cancel) const;
    std::vector<ConversationTurn> load_history(const RagQueryRequest& request, std::size_t turns) const;
    void report_persist_failure(const ConversationTurn& turn, const std::string& error) const;

    Dependencies deps_;
    ContextAssembler assembler_;
    OrchestratorSettings settings_;
};

}  // namespace ragquery
