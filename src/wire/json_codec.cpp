#include "wire/json_codec.hpp"

#include <type_traits>
#include <variant>

#include "core/errors.hpp"
#include "util/time.hpp"

namespace ragquery {
namespace {

[[noreturn]] void invalid_type(const char* field) {
    throw InvalidRequestError(std::string{"invalid field type: "} + field);
}

const nlohmann::json* find_field(const nlohmann::json& json, const char* field) {
    const auto it = json.find(field);
    if (it == json.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

std::string require_string(const nlohmann::json& json, const char* field) {
    const auto* value = find_field(json, field);
    if (value == nullptr) {
        throw InvalidRequestError(std::string{"missing field: "} + field);
    }
    if (!value->is_string()) {
        invalid_type(field);
    }
    return value->get<std::string>();
}

std::optional<std::string> optional_string(const nlohmann::json& json, const char* field) {
    const auto* value = find_field(json, field);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (!value->is_string()) {
        invalid_type(field);
    }
    return value->get<std::string>();
}

std::optional<int> optional_int(const nlohmann::json& json, const char* field) {
    const auto* value = find_field(json, field);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (!value->is_number_integer()) {
        invalid_type(field);
    }
    return value->get<int>();
}

std::optional<double> optional_double(const nlohmann::json& json, const char* field) {
    const auto* value = find_field(json, field);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (!value->is_number()) {
        invalid_type(field);
    }
    return value->get<double>();
}

std::optional<bool> optional_bool(const nlohmann::json& json, const char* field) {
    const auto* value = find_field(json, field);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (!value->is_boolean()) {
        invalid_type(field);
    }
    return value->get<bool>();
}

const nlohmann::json* optional_object(const nlohmann::json& json, const char* field) {
    const auto* value = find_field(json, field);
    if (value != nullptr && !value->is_object()) {
        invalid_type(field);
    }
    return value;
}

ContextConfig context_from_json(const nlohmann::json& json) {
    ContextConfig config;
    if (const auto preset = optional_string(json, "preset")) {
        if (*preset == "minimal") {
            config = ContextConfig::minimal();
        } else if (*preset != "default") {
            throw InvalidRequestError("unknown context preset: " + *preset);
        }
    }
    if (const auto value = optional_int(json, "max_tokens")) {
        config.max_tokens = *value;
    }
    if (const auto value = optional_double(json, "relevance_threshold")) {
        config.relevance_threshold = *value;
    }
    if (const auto value = optional_bool(json, "include_metadata")) {
        config.include_metadata = *value;
    }
    if (const auto value = optional_string(json, "chunk_separator")) {
        config.chunk_separator = *value;
    }
    return config;
}

GenerationParams generation_from_json(const nlohmann::json& json) {
    GenerationParams params;
    params.provider = optional_string(json, "provider");
    params.model = optional_string(json, "model");
    params.system_prompt = optional_string(json, "system_prompt");
    if (const auto value = optional_double(json, "temperature")) {
        params.temperature = *value;
    }
    if (const auto value = optional_int(json, "max_output_tokens")) {
        params.max_output_tokens = *value;
    }
    return params;
}

std::vector<float> embedding_from_json(const nlohmann::json& json) {
    const auto* value = find_field(json, "embedding");
    if (value == nullptr) {
        throw InvalidRequestError("missing field: embedding");
    }
    if (!value->is_array()) {
        invalid_type("embedding");
    }
    std::vector<float> embedding;
    embedding.reserve(value->size());
    for (const auto& item : *value) {
        if (!item.is_number()) {
            invalid_type("embedding");
        }
        embedding.push_back(item.get<float>());
    }
    return embedding;
}

}  // namespace

nlohmann::json parse_json_body(const std::string& body) {
    try {
        auto json = nlohmann::json::parse(body);
        if (!json.is_object()) {
            throw InvalidRequestError("request body must be a JSON object");
        }
        return json;
    } catch (const nlohmann::json::exception& ex) {
        throw InvalidRequestError(std::string{"invalid JSON: "} + ex.what());
    }
}

RagQueryRequest request_from_json(const nlohmann::json& json) {
    RagQueryRequest request;
    request.tenant_id = require_string(json, "tenant_id");
    request.user_id = require_string(json, "user_id");
    request.query = require_string(json, "query");
    request.conversation_id = optional_string(json, "conversation_id");

    if (const auto* options = optional_object(json, "options")) {
        if (const auto value = optional_int(*options, "top_k")) {
            request.options.top_k = *value;
        }
        request.options.min_score = optional_double(*options, "min_score");
        request.options.history_turns = optional_int(*options, "history_turns");
        if (const auto* context = optional_object(*options, "context")) {
            request.options.context = context_from_json(*context);
        }
        if (const auto* generation = optional_object(*options, "generation")) {
            request.options.generation = generation_from_json(*generation);
        }
    }
    return request;
}

ChunkRecord chunk_record_from_json(const nlohmann::json& json) {
    ChunkRecord record;
    record.chunk.chunk_id = require_string(json, "chunk_id");
    record.chunk.tenant_id = require_string(json, "tenant_id");
    record.chunk.content = require_string(json, "content");
    record.chunk.embedding = embedding_from_json(json);
    if (const auto* metadata = optional_object(json, "metadata")) {
        record.chunk.metadata = metadata_from_json(*metadata);
    }
    record.supersedes = optional_string(json, "supersedes");
    return record;
}

nlohmann::json metadata_to_json(const Metadata& metadata) {
    nlohmann::json json = nlohmann::json::object();
    for (const auto& [key, value] : metadata) {
        std::visit([&json, &key = key](const auto& v) { json[key] = v; }, value);
    }
    return json;
}

Metadata metadata_from_json(const nlohmann::json& json) {
    Metadata metadata;
    if (!json.is_object()) {
        return metadata;
    }
    for (const auto& [key, value] : json.items()) {
        if (value.is_string()) {
            metadata[key] = value.get<std::string>();
        } else if (value.is_boolean()) {
            metadata[key] = value.get<bool>();
        } else if (value.is_number_integer()) {
            metadata[key] = value.get<std::int64_t>();
        } else if (value.is_number_float()) {
            metadata[key] = value.get<double>();
        } else if (!value.is_null()) {
            metadata[key] = value.dump();
        }
    }
    return metadata;
}

const char* event_name(const GenerationEvent& event) {
    return std::visit(
        [](const auto& e) -> const char* {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, TextDelta>) {
                return "delta";
            } else if constexpr (std::is_same_v<T, SourcesAnnounced>) {
                return "sources";
            } else if constexpr (std::is_same_v<T, Completed>) {
                return "completed";
            } else if constexpr (std::is_same_v<T, Failed>) {
                return "failed";
            } else {
                return "cancelled";
            }
        },
        event);
}

nlohmann::json event_to_json(const GenerationEvent& event) {
    return std::visit(
        [](const auto& e) -> nlohmann::json {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, TextDelta>) {
                return {{"text", e.text}};
            } else if constexpr (std::is_same_v<T, SourcesAnnounced>) {
                return {{"chunk_ids", e.chunk_ids}};
            } else if constexpr (std::is_same_v<T, Completed>) {
                return {{"answer", e.full_text}, {"metadata", answer_metadata_to_json(e.metadata)}};
            } else if constexpr (std::is_same_v<T, Failed>) {
                nlohmann::json body = error_to_json(error_kind_name(e.error_kind), e.message);
                body["partial_text"] = e.partial_text;
                return body;
            } else {
                return {{"partial_text", e.partial_text}};
            }
        },
        event);
}

nlohmann::json context_stats_to_json(const ContextStats& stats) {
    return {
        {"total_candidates", stats.total_candidates},
        {"used_candidates", stats.used_candidates},
        {"estimated_tokens", stats.estimated_tokens},
        {"avg_relevance", stats.avg_relevance},
        {"max_tokens", stats.max_tokens},
    };
}

nlohmann::json answer_metadata_to_json(const AnswerMetadata& metadata) {
    return {
        {"conversation_id", metadata.conversation_id},
        {"provider", metadata.provider},
        {"used_failover", metadata.used_failover},
        {"no_retrieved_context", metadata.no_retrieved_context},
        {"retrieval_degraded", metadata.retrieval_degraded},
        {"persisted", metadata.persisted},
        {"context", context_stats_to_json(metadata.context_stats)},
        {"timings_ms",
         {
             {"retrieval", metadata.timings.retrieval_ms},
             {"assembly", metadata.timings.assembly_ms},
             {"generation", metadata.timings.generation_ms},
             {"total", metadata.timings.total_ms},
         }},
    };
}

nlohmann::json answer_to_json(const QueryAnswer& answer) {
    nlohmann::json body;
    body["answer"] = answer.answer;
    body["sources"] = answer.sources;
    body["complete"] = answer.complete;
    body["state"] = query_state_name(answer.state);
    if (answer.error_kind) {
        body["error"] = error_to_json(error_kind_name(*answer.error_kind), answer.error_message)["error"];
    }
    if (answer.metadata) {
        body["metadata"] = answer_metadata_to_json(*answer.metadata);
    }
    return body;
}

const char* answer_status(const QueryAnswer& answer) {
    switch (answer.state) {
        case QueryState::Completed:
            return "OK";
        case QueryState::Cancelled:
            return "CANCELLED";
        default:
            return "ERROR";
    }
}

nlohmann::json turn_to_json(const ConversationTurn& turn) {
    return {
        {"sequence", turn.sequence},
        {"user_id", turn.user_id},
        {"question", turn.question},
        {"answer", turn.answer},
        {"sources", turn.sources},
        {"created_at", time::to_iso8601(turn.created_at)},
    };
}

nlohmann::json conversation_stats_to_json(const ConversationStats& stats) {
    nlohmann::json body;
    body["total_turns"] = stats.total_turns;
    body["unique_sources"] = stats.unique_sources;
    body["avg_answer_length"] = stats.avg_answer_length;
    body["oldest"] = stats.oldest ? nlohmann::json(time::to_iso8601(*stats.oldest)) : nlohmann::json();
    body["newest"] = stats.newest ? nlohmann::json(time::to_iso8601(*stats.newest)) : nlohmann::json();
    return body;
}

nlohmann::json health_to_json(const HealthDetail& index, const std::vector<ProviderStatus>& providers) {
    nlohmann::json body;
    body["status"] = index.connected ? "UP" : "DEGRADED";
    body["index"] = {
        {"connected", index.connected},
        {"approx_indexed_count", index.approx_indexed_count},
        {"backend_version", index.backend_version},
    };
    body["providers"] = nlohmann::json::array();
    for (const auto& provider : providers) {
        body["providers"].push_back({{"name", provider.name}, {"role", provider.role}});
    }
    return body;
}

nlohmann::json error_to_json(const std::string& code, const std::string& message) {
    nlohmann::json body;
    body["error"] = {{"code", code}, {"message", message}};
    return body;
}

}  // namespace ragquery
