#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "conversation/conversation_store.hpp"
#include "core/types.hpp"
#include "generation/generation_adapter.hpp"
#include "retrieval/retrieval_index.hpp"
#include "service/query_orchestrator.hpp"

namespace ragquery {

// A chunk as delivered by ingestion. `supersedes` names the chunk it
// replaces, which is tombstoned once the new one is indexed.
struct ChunkRecord {
    Chunk chunk;
    std::optional<std::string> supersedes;
};

// Parsing throws InvalidRequestError naming the offending field.
nlohmann::json parse_json_body(const std::string& body);
RagQueryRequest request_from_json(const nlohmann::json& json);
ChunkRecord chunk_record_from_json(const nlohmann::json& json);

nlohmann::json metadata_to_json(const Metadata& metadata);
// Nested objects and arrays are kept as their JSON text; nulls are dropped.
Metadata metadata_from_json(const nlohmann::json& json);

// SSE event name: delta, sources, completed, failed, cancelled.
const char* event_name(const GenerationEvent& event);
nlohmann::json event_to_json(const GenerationEvent& event);

nlohmann::json context_stats_to_json(const ContextStats& stats);
nlohmann::json answer_metadata_to_json(const AnswerMetadata& metadata);
nlohmann::json answer_to_json(const QueryAnswer& answer);
// "OK" for a completed answer, "CANCELLED" or "ERROR" otherwise.
const char* answer_status(const QueryAnswer& answer);
nlohmann::json turn_to_json(const ConversationTurn& turn);
nlohmann::json conversation_stats_to_json(const ConversationStats& stats);
nlohmann::json health_to_json(const HealthDetail& index, const std::vector<ProviderStatus>& providers);
nlohmann::json error_to_json(const std::string& code, const std::string& message);

}  // namespace ragquery
