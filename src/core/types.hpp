#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ragquery {

using Clock = std::chrono::system_clock;
using MetadataValue = std::variant<std::string, std::int64_t, double, bool>;
using Metadata = std::map<std::string, MetadataValue>;

struct Chunk {
    std::string chunk_id;
    std::string tenant_id;
    std::string content;
    std::vector<float> embedding;
    Metadata metadata;
};

struct RetrievedChunk {
    Chunk chunk;
    double relevance_score = 0.0;
};

struct ContextConfig {
    int max_tokens = 4000;
    double relevance_threshold = 0.7;
    bool include_metadata = true;
    std::string chunk_separator = "\n\n---\n\n";

    static ContextConfig minimal() { return ContextConfig{2000, 0.8, false, "\n\n"}; }
};

struct ContextStats {
    int total_candidates = 0;
    int used_candidates = 0;
    int estimated_tokens = 0;
    double avg_relevance = 0.0;
    int max_tokens = 0;
};

struct AssembledContext {
    std::string text;
    std::vector<std::string> used_chunk_ids;
    ContextStats stats;
};

struct ConversationTurn {
    std::string conversation_id;
    std::string tenant_id;
    std::string user_id;
    std::string question;
    std::string answer;
    std::vector<std::string> sources;
    Clock::time_point created_at{};
    // Assigned by the store on append.
    std::int64_t sequence = 0;
};

struct GenerationParams {
    std::optional<std::string> provider;
    std::optional<std::string> model;
    double temperature = 0.1;
    int max_output_tokens = 1500;
    std::optional<std::string> system_prompt;
};

struct QueryOptions {
    std::optional<ContextConfig> context;
    int top_k = 10;
    std::optional<double> min_score;
    std::optional<int> history_turns;
    GenerationParams generation;
};

struct RagQueryRequest {
    std::string tenant_id;
    std::string user_id;
    std::string query;
    std::optional<std::string> conversation_id;
    QueryOptions options;
};

enum class ErrorKind {
    InvalidRequest,
    EmbeddingUnavailable,
    IndexUnavailable,
    GenerationProviderFailure,
    StoreUnavailable,
    Internal,
};

struct StageTimings {
    long retrieval_ms = 0;
    long assembly_ms = 0;
    long generation_ms = 0;
    long total_ms = 0;
};

struct AnswerMetadata {
    std::string conversation_id;
    std::string provider;
    bool used_failover = false;
    bool no_retrieved_context = false;
    bool retrieval_degraded = false;
    bool persisted = false;
    ContextStats context_stats;
    StageTimings timings;
};

struct TextDelta {
    std::string text;
};

struct SourcesAnnounced {
    std::vector<std::string> chunk_ids;
};

struct Completed {
    std::string full_text;
    AnswerMetadata metadata;
};

struct Failed {
    ErrorKind error_kind = ErrorKind::Internal;
    std::string message;
    // Text already streamed before the failure; the answer is incomplete.
    std::string partial_text;
};

struct Cancelled {
    std::string partial_text;
};

using GenerationEvent = std::variant<TextDelta, SourcesAnnounced, Completed, Failed, Cancelled>;

inline bool is_terminal(const GenerationEvent& event) {
    return std::holds_alternative<Completed>(event) || std::holds_alternative<Failed>(event) ||
           std::holds_alternative<Cancelled>(event);
}

}  // namespace ragquery
