#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace ragquery {

enum class ProviderKind { OpenAi, Azure, Ollama, None };
enum class IndexBackend { Qdrant, Memory };
enum class ConversationBackend { Postgres, Memory };
enum class TenantSource { Static, Postgres };
enum class FailureSink { Log, Kafka };

const char* provider_kind_name(ProviderKind kind);

class Config {
public:
    // Returns the value of an environment variable, or null when unset.
    using EnvLookup = std::function<const char*(const char*)>;

    // Reads the process environment. Throws std::runtime_error on malformed
    // numbers or unknown enum values.
    static Config load();
    static Config load(const EnvLookup& lookup);

    const std::string& http_host() const noexcept { return http_host_; }
    int http_port() const noexcept { return http_port_; }

    IndexBackend index_backend() const noexcept { return index_backend_; }
    const std::string& qdrant_url() const noexcept { return qdrant_url_; }
    const std::string& qdrant_api_key() const noexcept { return qdrant_api_key_; }
    const std::string& qdrant_collection_prefix() const noexcept { return qdrant_collection_prefix_; }
    long index_timeout_seconds() const noexcept { return index_timeout_seconds_; }
    std::size_t embedding_dimension() const noexcept { return embedding_dimension_; }

    ProviderKind embedding_provider() const noexcept { return embedding_provider_; }
    long embedding_timeout_seconds() const noexcept { return embedding_timeout_seconds_; }

    const std::string& azure_endpoint() const noexcept { return azure_endpoint_; }
    const std::string& azure_api_key() const noexcept { return azure_api_key_; }
    const std::string& azure_api_version() const noexcept { return azure_api_version_; }
    const std::string& azure_embedding_deployment() const noexcept { return azure_embedding_deployment_; }
    const std::string& azure_chat_deployment() const noexcept { return azure_chat_deployment_; }

    const std::string& openai_base_url() const noexcept { return openai_base_url_; }
    const std::string& openai_api_key() const noexcept { return openai_api_key_; }
    const std::string& openai_chat_model() const noexcept { return openai_chat_model_; }
    const std::string& openai_embedding_model() const noexcept { return openai_embedding_model_; }

    const std::string& ollama_base_url() const noexcept { return ollama_base_url_; }
    const std::string& ollama_chat_model() const noexcept { return ollama_chat_model_; }

    ProviderKind primary_provider() const noexcept { return primary_provider_; }
    ProviderKind secondary_provider() const noexcept { return secondary_provider_; }
    std::chrono::seconds first_token_timeout() const noexcept { return first_token_timeout_; }
    std::chrono::seconds total_generation_timeout() const noexcept { return total_generation_timeout_; }

    ConversationBackend conversation_backend() const noexcept { return conversation_backend_; }
    std::size_t conversation_max_turns() const noexcept { return conversation_max_turns_; }
    std::chrono::hours conversation_ttl() const noexcept { return conversation_ttl_; }
    std::size_t history_turns() const noexcept { return history_turns_; }

    const std::string& pg_host() const noexcept { return pg_host_; }
    const std::string& pg_port() const noexcept { return pg_port_; }
    const std::string& pg_database() const noexcept { return pg_database_; }
    const std::string& pg_user() const noexcept { return pg_user_; }
    const std::string& pg_password() const noexcept { return pg_password_; }
    std::size_t pg_pool_size() const noexcept { return pg_pool_size_; }
    std::chrono::milliseconds pg_acquire_timeout() const noexcept { return pg_acquire_timeout_; }

    TenantSource tenant_source() const noexcept { return tenant_source_; }
    const std::vector<std::string>& tenants() const noexcept { return tenants_; }
    std::chrono::seconds tenant_cache_ttl() const noexcept { return tenant_cache_ttl_; }

    std::size_t max_query_chars() const noexcept { return max_query_chars_; }
    int max_top_k() const noexcept { return max_top_k_; }
    int context_max_tokens() const noexcept { return context_max_tokens_; }
    double context_relevance_threshold() const noexcept { return context_relevance_threshold_; }
    bool context_include_metadata() const noexcept { return context_include_metadata_; }

    const std::string& kafka_brokers() const noexcept { return kafka_brokers_; }
    const std::string& kafka_worker_group() const noexcept { return kafka_worker_group_; }
    FailureSink failure_sink() const noexcept { return failure_sink_; }

    // Returns libpq-compatible connection information string.
    std::string pg_conninfo() const;
    std::string azure_embedding_url() const;
    // Azure chat completions URL for the configured deployment.
    std::string azure_chat_url() const;
    std::string openai_chat_url() const;
    std::string openai_embedding_url() const;

private:
    Config() = default;

    std::string http_host_;
    int http_port_ = 8080;

    IndexBackend index_backend_ = IndexBackend::Qdrant;
    std::string qdrant_url_;
    std::string qdrant_api_key_;
    std::string qdrant_collection_prefix_;
    long index_timeout_seconds_ = 10;
    std::size_t embedding_dimension_ = 3072;

    ProviderKind embedding_provider_ = ProviderKind::Azure;
    long embedding_timeout_seconds_ = 30;

    std::string azure_endpoint_;
    std::string azure_api_key_;
    std::string azure_api_version_;
    std::string azure_embedding_deployment_;
    std::string azure_chat_deployment_;
    std::string azure_chat_api_version_;

    std::string openai_base_url_;
    std::string openai_api_key_;
    std::string openai_chat_model_;
    std::string openai_embedding_model_;

    std::string ollama_base_url_;
    std::string ollama_chat_model_;

    ProviderKind primary_provider_ = ProviderKind::OpenAi;
    ProviderKind secondary_provider_ = ProviderKind::Ollama;
    std::chrono::seconds first_token_timeout_{60};
    std::chrono::seconds total_generation_timeout_{300};

    ConversationBackend conversation_backend_ = ConversationBackend::Postgres;
    std::size_t conversation_max_turns_ = 20;
    std::chrono::hours conversation_ttl_{24};
    std::size_t history_turns_ = 5;

    std::string pg_host_;
    std::string pg_port_;
    std::string pg_database_;
    std::string pg_user_;
    std::string pg_password_;
    std::size_t pg_pool_size_ = 4;
    std::chrono::milliseconds pg_acquire_timeout_{2000};

    TenantSource tenant_source_ = TenantSource::Static;
    std::vector<std::string> tenants_;
    std::chrono::seconds tenant_cache_ttl_{60};

    std::size_t max_query_chars_ = 2000;
    int max_top_k_ = 100;
    int context_max_tokens_ = 4000;
    double context_relevance_threshold_ = 0.7;
    bool context_include_metadata_ = true;

    std::string kafka_brokers_;
    std::string kafka_worker_group_;
    FailureSink failure_sink_ = FailureSink::Log;
};

}  // namespace ragquery
