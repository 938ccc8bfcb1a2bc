#include "service/pipeline.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

#include "conversation/in_memory_store.hpp"
#include "conversation/pg_conversation_store.hpp"
#include "db/pg_pool.hpp"
#include "db/pg_tenant_directory.hpp"
#include "embedding/http_embedder.hpp"
#include "mq/kafka_failure_reporter.hpp"
#include "qdrant/qdrant_client.hpp"
#include "retrieval/in_memory_index.hpp"
#include "retrieval/qdrant_index.hpp"
#include "tenant/tenant_directory.hpp"
#include "util/log.hpp"

namespace ragquery {
namespace {

std::shared_ptr<PgConnectionPool> pool_for(const Config& config, std::shared_ptr<PgConnectionPool>& pool) {
    if (!pool) {
        pool = std::make_shared<PgConnectionPool>(config.pg_conninfo(), config.pg_pool_size(),
                                                  config.pg_acquire_timeout());
    }
    return pool;
}

std::shared_ptr<RetrievalIndex> make_index(const Config& config) {
    if (config.index_backend() == IndexBackend::Memory) {
        log::warn("using in-memory retrieval index; indexed chunks are lost on restart");
        return std::make_shared<InMemoryRetrievalIndex>(config.embedding_dimension());
    }
    auto client = std::make_shared<QdrantClient>(config.qdrant_url(), config.index_timeout_seconds(),
                                                 config.qdrant_api_key());
    return std::make_shared<QdrantRetrievalIndex>(std::move(client), config.qdrant_collection_prefix(),
                                                  config.embedding_dimension());
}

}  // namespace

std::unique_ptr<Embedder> make_embedder(const Config& config) {
    HttpEmbedderSettings settings;
    settings.dimension = config.embedding_dimension();
    settings.timeout_seconds = config.embedding_timeout_seconds();
    if (config.embedding_provider() == ProviderKind::OpenAi) {
        settings.url = config.openai_embedding_url();
        settings.api_key = config.openai_api_key();
        settings.auth = ApiAuthStyle::Bearer;
        settings.model = config.openai_embedding_model();
    } else {
        settings.url = config.azure_embedding_url();
        settings.api_key = config.azure_api_key();
        settings.auth = ApiAuthStyle::ApiKeyHeader;
    }
    if (settings.url.empty()) {
        throw std::runtime_error(std::string{"embedding endpoint is not configured for "} +
                                 provider_kind_name(config.embedding_provider()));
    }
    return std::make_unique<HttpEmbedder>(std::move(settings));
}

std::optional<Provider> make_provider(const Config& config, ProviderKind kind) {
    switch (kind) {
        case ProviderKind::OpenAi: {
            OpenAiProviderSettings settings;
            settings.url = config.openai_chat_url();
            settings.api_key = config.openai_api_key();
            settings.auth = ApiAuthStyle::Bearer;
            settings.model = config.openai_chat_model();
            return Provider{OpenAiChatProvider(std::move(settings))};
        }
        case ProviderKind::Azure: {
            OpenAiProviderSettings settings;
            settings.name = "azure";
            settings.url = config.azure_chat_url();
            settings.api_key = config.azure_api_key();
            settings.auth = ApiAuthStyle::ApiKeyHeader;
            settings.model = config.azure_chat_deployment();
            if (settings.url.empty()) {
                throw std::runtime_error("azure chat endpoint is not configured");
            }
            return Provider{OpenAiChatProvider(std::move(settings))};
        }
        case ProviderKind::Ollama: {
            OllamaProviderSettings settings;
            settings.base_url = config.ollama_base_url();
            settings.model = config.ollama_chat_model();
            return Provider{OllamaChatProvider(std::move(settings))};
        }
        case ProviderKind::None:
            return std::nullopt;
    }
    return std::nullopt;
}

ContextConfig default_context_config(const Config& config) {
    ContextConfig context;
    context.max_tokens = config.context_max_tokens();
    context.relevance_threshold = config.context_relevance_threshold();
    context.include_metadata = config.context_include_metadata();
    return context;
}

Pipeline build_pipeline(const Config& config) {
    Pipeline pipeline;
    std::shared_ptr<PgConnectionPool> pool;

    pipeline.embedder = make_embedder(config);
    pipeline.index = make_index(config);

    RetentionPolicy retention;
    retention.max_turns = config.conversation_max_turns();
    retention.max_age = config.conversation_ttl();
    if (config.conversation_backend() == ConversationBackend::Postgres) {
        auto store = std::make_shared<PgConversationStore>(pool_for(config, pool), retention);
        store->ensure_schema();
        pipeline.conversations = std::move(store);
    } else {
        log::warn("using in-memory conversation store; history is lost on restart");
        pipeline.conversations = std::make_shared<InMemoryConversationStore>(retention);
    }

    std::shared_ptr<TenantDirectory> tenants;
    if (config.tenant_source() == TenantSource::Postgres) {
        tenants = std::make_shared<PgTenantDirectory>(pool_for(config, pool), config.tenant_cache_ttl());
    } else {
        auto directory = std::make_shared<StaticTenantDirectory>(config.tenants());
        if (directory->accepts_any()) {
            log::warn("RAG_TENANTS is empty; every well-formed tenant id is accepted");
        }
        tenants = std::move(directory);
    }

    std::shared_ptr<FailureReporter> failures;
    if (config.failure_sink() == FailureSink::Kafka) {
        pipeline.producer = std::make_shared<KafkaProducer>(config.kafka_brokers());
        failures = std::make_shared<KafkaFailureReporter>(pipeline.producer, kPersistFailedTopic);
    } else {
        failures = std::make_shared<LogFailureReporter>();
    }

    auto primary = make_provider(config, config.primary_provider());
    if (!primary) {
        throw std::runtime_error("a primary generation provider is required");
    }
    GenerationTimeouts timeouts;
    timeouts.first_token = config.first_token_timeout();
    timeouts.total = config.total_generation_timeout();
    pipeline.generation = std::make_shared<GenerationAdapter>(
        std::move(*primary), make_provider(config, config.secondary_provider()), timeouts);

    OrchestratorSettings settings;
    settings.max_query_chars = config.max_query_chars();
    settings.max_top_k = config.max_top_k();
    settings.history_turns = config.history_turns();

    QueryOrchestrator::Dependencies deps;
    deps.embedder = pipeline.embedder;
    deps.index = pipeline.index;
    deps.generation = pipeline.generation;
    deps.conversations = pipeline.conversations;
    deps.tenants = std::move(tenants);
    deps.failures = std::move(failures);
    pipeline.orchestrator = std::make_shared<QueryOrchestrator>(
        std::move(deps), ContextAssembler(default_context_config(config)), settings);

    std::ostringstream oss;
    oss << "pipeline ready embedding_dimension=" << config.embedding_dimension()
        << " history_turns=" << settings.history_turns << " max_top_k=" << settings.max_top_k;
    for (const auto& provider : pipeline.generation->provider_status()) {
        oss << ' ' << provider.role << '=' << provider.name;
    }
    log::info(oss.str());
    return pipeline;
}

}  // namespace ragquery
