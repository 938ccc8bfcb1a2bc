#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include "qdrant/qdrant_client.hpp"
#include "retrieval/retrieval_index.hpp"

namespace ragquery {

// One Qdrant collection per tenant, named "<prefix>__<tenant_id>". A tenant
// can only ever be searched through its own collection.
class QdrantRetrievalIndex final : public RetrievalIndex {
public:
    QdrantRetrievalIndex(std::shared_ptr<QdrantClient> client, std::string collection_prefix, std::size_t dimension);

    void index(const Chunk& chunk) override;
    bool tombstone(const std::string& tenant_id, const std::string& chunk_id) override;
    std::vector<RetrievedChunk> search(const std::string& tenant_id,
                                       const std::vector<float>& query_embedding,
                                       int k,
                                       double min_score) override;
    bool is_available() override;
    HealthDetail health() override;
    std::size_t dimension() const noexcept override { return dimension_; }

    std::string collection_for(const std::string& tenant_id) const;
    static std::string point_id_for(const std::string& tenant_id, const std::string& chunk_id);

private:
    void ensure_collection(const std::string& collection);

    std::shared_ptr<QdrantClient> client_;
    std::string collection_prefix_;
    std::size_t dimension_;
    std::mutex ensured_mutex_;
    std::unordered_set<std::string> ensured_;
};

}  // namespace ragquery
