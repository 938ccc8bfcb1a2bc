#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace ragquery {

struct HealthDetail {
    bool connected = false;
    std::size_t approx_indexed_count = 0;
    std::string backend_version;
};

// One isolated vector space per tenant. Implementations key every storage
// operation by tenant_id; results are never filtered out of a shared space.
class RetrievalIndex {
public:
    virtual ~RetrievalIndex() = default;

    // Inserts or replaces. Throws IndexError (DimensionMismatch, InvalidTenant,
    // InvalidChunk, Unavailable).
    virtual void index(const Chunk& chunk) = 0;

    // Removes a superseded chunk. Returns false when it was not present.
    virtual bool tombstone(const std::string& tenant_id, const std::string& chunk_id) = 0;

    // Up to k chunks of tenant_id with score >= min_score, best first, ties
    // broken by most recently indexed. An empty result is not an error.
    virtual std::vector<RetrievedChunk> search(const std::string& tenant_id,
                                               const std::vector<float>& query_embedding,
                                               int k,
                                               double min_score) = 0;

    virtual bool is_available() = 0;
    virtual HealthDetail health() = 0;
    virtual std::size_t dimension() const noexcept = 0;
};

// Shared argument checks; throw IndexError.
void validate_tenant_id(const std::string& tenant_id);
void validate_chunk(const Chunk& chunk, std::size_t dimension);
void validate_query_embedding(const std::vector<float>& embedding, std::size_t dimension);

}  // namespace ragquery
