#pragma once

#include <memory>
#include <optional>

#include "config/config.hpp"
#include "conversation/conversation_store.hpp"
#include "embedding/embedder.hpp"
#include "generation/generation_adapter.hpp"
#include "mq/kafka_producer.hpp"
#include "retrieval/retrieval_index.hpp"
#include "service/query_orchestrator.hpp"

namespace ragquery {

inline constexpr const char* kPersistFailedTopic = "rag_persist_failed";

// Everything one process needs to answer queries, wired from Config. The
// HTTP server and the Kafka worker share one instance.
struct Pipeline {
    std::shared_ptr<Embedder> embedder;
    std::shared_ptr<RetrievalIndex> index;
    std::shared_ptr<ConversationStore> conversations;
    std::shared_ptr<GenerationAdapter> generation;
    std::shared_ptr<QueryOrchestrator> orchestrator;
    // Set only when failures are reported through Kafka.
    std::shared_ptr<KafkaProducer> producer;
};

// Throws std::runtime_error when a backend cannot be set up.
Pipeline build_pipeline(const Config& config);

std::unique_ptr<Embedder> make_embedder(const Config& config);
std::optional<Provider> make_provider(const Config& config, ProviderKind kind);
ContextConfig default_context_config(const Config& config);

}  // namespace ragquery
