#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "retrieval/retrieval_index.hpp"

namespace ragquery {

// Exact cosine search over one partition per tenant. Vectors are normalized
// when indexed so a search is a dot product per stored chunk.
class InMemoryRetrievalIndex final : public RetrievalIndex {
public:
    explicit InMemoryRetrievalIndex(std::size_t dimension);

    void index(const Chunk& chunk) override;
    bool tombstone(const std::string& tenant_id, const std::string& chunk_id) override;
    std::vector<RetrievedChunk> search(const std::string& tenant_id,
                                       const std::vector<float>& query_embedding,
                                       int k,
                                       double min_score) override;
    bool is_available() override { return true; }
    HealthDetail health() override;
    std::size_t dimension() const noexcept override { return dimension_; }

    std::size_t tenant_count() const;

private:
    struct Entry {
        Chunk chunk;
        std::vector<float> unit;
        std::uint64_t indexed_seq = 0;
    };

    struct Partition {
        mutable std::shared_mutex mutex;
        std::unordered_map<std::string, Entry> entries;
    };

    std::shared_ptr<Partition> find_partition(const std::string& tenant_id) const;
    std::shared_ptr<Partition> get_or_create_partition(const std::string& tenant_id);

    std::size_t dimension_;
    std::atomic<std::uint64_t> next_seq_{1};
    mutable std::shared_mutex partitions_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Partition>> partitions_;
};

}  // namespace ragquery
