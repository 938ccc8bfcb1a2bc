#include "service/query_orchestrator.hpp"

#include <chrono>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

#include "core/errors.hpp"
#include "generation/prompts.hpp"
#include "util/log.hpp"
#include "util/text.hpp"
#include "util/time.hpp"
#include "util/uuid.hpp"

namespace ragquery {
namespace {

constexpr std::size_t kMaxIdentifierLength = 64;
constexpr double kMaxTemperature = 2.0;

using SteadyClock = std::chrono::steady_clock;

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw InvalidRequestError(message);
    }
}

std::string retrieval_text(const std::vector<ConversationTurn>& history, const std::string& query, std::size_t window) {
    if (history.empty() || window == 0) {
        return query;
    }
    std::string out;
    const std::size_t first = history.size() > window ? history.size() - window : 0;
    for (std::size_t i = first; i < history.size(); ++i) {
        out += history[i].question;
        out.push_back('\n');
    }
    out += query;
    return out;
}

std::string describe(const RagQueryRequest& request, const std::string& conversation_id) {
    std::ostringstream oss;
    oss << "tenant_id=" << request.tenant_id << " user_id=" << request.user_id
        << " conversation_id=" << conversation_id;
    return oss.str();
}

}  // namespace

const char* query_state_name(QueryState state) {
    switch (state) {
        case QueryState::Received:
            return "RECEIVED";
        case QueryState::Validating:
            return "VALIDATING";
        case QueryState::Retrieving:
            return "RETRIEVING";
        case QueryState::Assembling:
            return "ASSEMBLING";
        case QueryState::Generating:
            return "GENERATING";
        case QueryState::Persisting:
            return "PERSISTING";
        case QueryState::Completed:
            return "COMPLETED";
        case QueryState::Failed:
            return "FAILED";
        case QueryState::Cancelled:
            return "CANCELLED";
    }
    return "UNKNOWN";
}

QueryOrchestrator::QueryOrchestrator(Dependencies deps, ContextAssembler assembler, OrchestratorSettings settings)
    : deps_(std::move(deps)), assembler_(std::move(assembler)), settings_(settings) {
    if (!deps_.embedder || !deps_.index || !deps_.generation || !deps_.conversations || !deps_.tenants) {
        throw std::invalid_argument("query orchestrator is missing a dependency");
    }
    if (!deps_.failures) {
        deps_.failures = std::make_shared<LogFailureReporter>();
    }
}

void QueryOrchestrator::validate(const RagQueryRequest& request) const {
    require(text::is_identifier(request.tenant_id, kMaxIdentifierLength),
            "tenant_id must be 1-64 characters of [A-Za-z0-9_-]");
    require(!text::is_blank(request.user_id), "user_id must not be blank");
    require(!text::is_blank(request.query), "query must not be blank");
    require(text::utf8_length(request.query) <= settings_.max_query_chars,
            "query exceeds " + std::to_string(settings_.max_query_chars) + " characters");
    if (request.conversation_id) {
        require(text::is_identifier(*request.conversation_id, kMaxIdentifierLength),
                "conversation_id must be 1-64 characters of [A-Za-z0-9_-]");
    }

    const QueryOptions& options = request.options;
    require(options.top_k >= 1 && options.top_k <= settings_.max_top_k,
            "top_k must be between 1 and " + std::to_string(settings_.max_top_k));
    if (options.min_score) {
        require(*options.min_score >= 0.0 && *options.min_score <= 1.0, "min_score must be within [0, 1]");
    }
    if (options.history_turns) {
        require(*options.history_turns >= 0 &&
                    static_cast<std::size_t>(*options.history_turns) <= deps_.conversations->retention().max_turns,
                "history_turns must be between 0 and " +
                    std::to_string(deps_.conversations->retention().max_turns));
    }
    if (options.context) {
        require(options.context->max_tokens > 0, "context.max_tokens must be positive");
        require(options.context->relevance_threshold >= 0.0 && options.context->relevance_threshold <= 1.0,
                "context.relevance_threshold must be within [0, 1]");
    }
    const GenerationParams& generation = options.generation;
    require(generation.max_output_tokens > 0, "generation.max_output_tokens must be positive");
    require(generation.temperature >= 0.0 && generation.temperature <= kMaxTemperature,
            "generation.temperature must be within [0, 2]");
    if (generation.provider) {
        require(deps_.generation->has_provider(*generation.provider),
                "generation.provider is not configured: " + *generation.provider);
    }

    if (!deps_.tenants->is_known(request.tenant_id)) {
        throw InvalidRequestError("unknown tenant: " + request.tenant_id);
    }
}

std::vector<ConversationTurn> QueryOrchestrator::load_history(const RagQueryRequest& request, std::size_t turns) const {
    if (!request.conversation_id || turns == 0) {
        return {};
    }
    try {
        return deps_.conversations->recent(request.tenant_id, *request.conversation_id, turns);
    } catch (const StoreError& ex) {
        log::warn(std::string{"conversation history unavailable, answering without it: "} + ex.what());
        return {};
    }
}

void QueryOrchestrator::report_persist_failure(const ConversationTurn& turn, const std::string& error) const {
    PersistFailure failure;
    failure.tenant_id = turn.tenant_id;
    failure.user_id = turn.user_id;
    failure.conversation_id = turn.conversation_id;
    failure.question = turn.question;
    failure.answer = turn.answer;
    failure.sources = turn.sources;
    failure.error = error;
    failure.occurred_at = Clock::now();
    try {
        deps_.failures->report_persist_failure(failure);
    } catch (const std::exception& ex) {
        log::error(std::string{"failure reporter rejected persist failure: "} + ex.what());
    }
}

QueryOutcome QueryOrchestrator::handle(const RagQueryRequest& request,
                                       const EventSink& sink,
                                       const CancelToken& cancel) const {
    bool terminal_sent = false;
    const EventSink guarded = [&](const GenerationEvent& event) {
        if (terminal_sent) {
            return;
        }
        terminal_sent = is_terminal(event);
        sink(event);
    };

    try {
        return run(request, guarded, cancel);
    } catch (const RagError& ex) {
        log::error(std::string{"query failed: "} + ex.what());
        if (!terminal_sent) {
            guarded(Failed{ex.kind(), ex.what(), {}});
        }
        return QueryOutcome{QueryState::Failed, ex.kind(), request.conversation_id.value_or(""), false};
    } catch (const std::exception& ex) {
        log::error(std::string{"query failed with internal error: "} + ex.what());
        if (!terminal_sent) {
            guarded(Failed{ErrorKind::Internal, ex.what(), {}});
        }
        return QueryOutcome{QueryState::Failed, ErrorKind::Internal, request.conversation_id.value_or(""), false};
    }
}

QueryOutcome QueryOrchestrator::run(const RagQueryRequest& request,
                                    const EventSink& sink,
                                    const CancelToken& cancel) const {
    const auto total_start = SteadyClock::now();
    QueryOutcome outcome;

    outcome.state = QueryState::Validating;
    try {
        validate(request);
    } catch (const RagError& ex) {
        std::ostringstream oss;
        oss << "query rejected tenant_id=" << request.tenant_id << " kind=" << error_kind_name(ex.kind())
            << " reason=" << ex.what();
        log::warn(oss.str());
        sink(Failed{ex.kind(), ex.what(), {}});
        outcome.state = QueryState::Failed;
        outcome.error_kind = ex.kind();
        return outcome;
    }

    outcome.conversation_id = request.conversation_id.value_or(uuid::generate());
    const std::string context_line = describe(request, outcome.conversation_id);
    const ContextConfig config = request.options.context.value_or(assembler_.defaults());
    const std::size_t history_turns = request.options.history_turns
                                          ? static_cast<std::size_t>(*request.options.history_turns)
                                          : settings_.history_turns;
    AnswerMetadata metadata;
    metadata.conversation_id = outcome.conversation_id;

    const auto cancelled = [&](const std::string& partial) {
        log::info("query cancelled " + context_line);
        sink(Cancelled{partial});
        outcome.state = QueryState::Cancelled;
        return outcome;
    };

    // Retrieving
    outcome.state = QueryState::Retrieving;
    const auto retrieval_start = SteadyClock::now();
    const std::vector<ConversationTurn> history = load_history(request, history_turns);
    std::vector<RetrievedChunk> retrieved;
    try {
        const auto embedding = deps_.embedder->embed(
            retrieval_text(history, request.query, settings_.retrieval_history_questions), request.tenant_id);
        retrieved = deps_.index->search(request.tenant_id, embedding, request.options.top_k,
                                        request.options.min_score.value_or(settings_.default_min_score));
    } catch (const EmbeddingError& ex) {
        metadata.retrieval_degraded = true;
        log::warn("retrieval degraded, embedding unavailable " + context_line + " error=" + ex.what());
    } catch (const IndexError& ex) {
        metadata.retrieval_degraded = true;
        log::warn("retrieval degraded, index unavailable " + context_line + " error=" + ex.what());
    }
    metadata.timings.retrieval_ms = time::elapsed_ms(retrieval_start);
    if (cancel.cancelled()) {
        return cancelled({});
    }

    // Assembling
    outcome.state = QueryState::Assembling;
    const auto assembly_start = SteadyClock::now();
    const AssembledContext assembled = assembler_.assemble(retrieved, config);
    metadata.context_stats = assembled.stats;
    metadata.no_retrieved_context = assembled.used_chunk_ids.empty();
    metadata.timings.assembly_ms = time::elapsed_ms(assembly_start);
    sink(SourcesAnnounced{assembled.used_chunk_ids});

    // Generating
    outcome.state = QueryState::Generating;
    const auto generation_start = SteadyClock::now();
    const GenerationResult generated = deps_.generation->generate(
        prompts::with_history(history, request.query), assembled.text, request.options.generation, cancel,
        [&](std::string_view delta) {
            if (!cancel.cancelled()) {
                sink(TextDelta{std::string{delta}});
            }
        });
    metadata.timings.generation_ms = time::elapsed_ms(generation_start);
    metadata.provider = generated.provider;
    metadata.used_failover = generated.used_failover;

    if (generated.state == GenerationState::Cancelled) {
        return cancelled(generated.text);
    }
    if (generated.state != GenerationState::Completed) {
        std::ostringstream oss;
        oss << "generation failed " << context_line << " provider=" << generated.provider
            << " failover=" << generated.used_failover << " partial_bytes=" << generated.text.size()
            << " error=" << generated.error_message;
        log::error(oss.str());
        sink(Failed{ErrorKind::GenerationProviderFailure, generated.error_message, generated.text});
        outcome.state = QueryState::Failed;
        outcome.error_kind = ErrorKind::GenerationProviderFailure;
        return outcome;
    }

    // Persisting
    outcome.state = QueryState::Persisting;
    ConversationTurn turn;
    turn.conversation_id = outcome.conversation_id;
    turn.tenant_id = request.tenant_id;
    turn.user_id = request.user_id;
    turn.question = request.query;
    turn.answer = generated.text;
    turn.sources = assembled.used_chunk_ids;
    turn.created_at = Clock::now();
    try {
        deps_.conversations->append(turn);
        metadata.persisted = true;
    } catch (const StoreError& ex) {
        log::error("conversation turn not persisted " + context_line + " error=" + ex.what());
        report_persist_failure(turn, ex.what());
    }
    outcome.persisted = metadata.persisted;

    metadata.timings.total_ms = time::elapsed_ms(total_start);
    std::ostringstream oss;
    oss << "query completed " << context_line << " provider=" << metadata.provider
        << " failover=" << metadata.used_failover << " sources=" << assembled.used_chunk_ids.size()
        << " degraded=" << metadata.retrieval_degraded << " persisted=" << metadata.persisted
        << " retrieval_ms=" << metadata.timings.retrieval_ms << " generation_ms=" << metadata.timings.generation_ms
        << " total_ms=" << metadata.timings.total_ms;
    log::info(oss.str());

    sink(Completed{generated.text, metadata});
    outcome.state = QueryState::Completed;
    return outcome;
}

QueryAnswer QueryOrchestrator::answer(const RagQueryRequest& request) const { return answer(request, CancelToken{}); }

QueryAnswer QueryOrchestrator::answer(const RagQueryRequest& request, const CancelToken& cancel) const {
    QueryAnswer collected;
    const QueryOutcome outcome = handle(
        request,
        [&collected](const GenerationEvent& event) {
            std::visit(
                [&collected](const auto& e) {
                    using T = std::decay_t<decltype(e)>;
                    if constexpr (std::is_same_v<T, TextDelta>) {
                        collected.answer += e.text;
                    } else if constexpr (std::is_same_v<T, SourcesAnnounced>) {
                        collected.sources = e.chunk_ids;
                    } else if constexpr (std::is_same_v<T, Completed>) {
                        collected.answer = e.full_text;
                        collected.metadata = e.metadata;
                        collected.complete = true;
                    } else if constexpr (std::is_same_v<T, Failed>) {
                        collected.error_kind = e.error_kind;
                        collected.error_message = e.message;
                        collected.answer = e.partial_text;
                    } else if constexpr (std::is_same_v<T, Cancelled>) {
                        collected.answer = e.partial_text;
                    }
                },
                event);
        },
        cancel);
    collected.state = outcome.state;
    return collected;
}

}  // namespace ragquery
