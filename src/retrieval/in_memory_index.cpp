#include "retrieval/in_memory_index.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "core/errors.hpp"

namespace ragquery {
namespace {

std::vector<float> normalized(const std::vector<float>& vector) {
    double norm = 0.0;
    for (const float value : vector) {
        norm += static_cast<double>(value) * static_cast<double>(value);
    }
    std::vector<float> unit(vector.size(), 0.0F);
    if (norm <= 0.0) {
        return unit;
    }
    const double inv = 1.0 / std::sqrt(norm);
    for (std::size_t i = 0; i < vector.size(); ++i) {
        unit[i] = static_cast<float>(vector[i] * inv);
    }
    return unit;
}

double dot(const std::vector<float>& a, const std::vector<float>& b) {
    double sum = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        sum += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    }
    return sum;
}

}  // namespace

InMemoryRetrievalIndex::InMemoryRetrievalIndex(std::size_t dimension) : dimension_(dimension) {
    if (dimension_ == 0) {
        throw std::invalid_argument("index dimension must be positive");
    }
}

std::shared_ptr<InMemoryRetrievalIndex::Partition> InMemoryRetrievalIndex::find_partition(
    const std::string& tenant_id) const {
    std::shared_lock lock(partitions_mutex_);
    const auto it = partitions_.find(tenant_id);
    return it == partitions_.end() ? nullptr : it->second;
}

std::shared_ptr<InMemoryRetrievalIndex::Partition> InMemoryRetrievalIndex::get_or_create_partition(
    const std::string& tenant_id) {
    if (auto existing = find_partition(tenant_id)) {
        return existing;
    }
    std::unique_lock lock(partitions_mutex_);
    auto& slot = partitions_[tenant_id];
    if (!slot) {
        slot = std::make_shared<Partition>();
    }
    return slot;
}

void InMemoryRetrievalIndex::index(const Chunk& chunk) {
    validate_chunk(chunk, dimension_);

    Entry entry;
    entry.chunk = chunk;
    entry.unit = normalized(chunk.embedding);
    entry.indexed_seq = next_seq_.fetch_add(1);

    auto partition = get_or_create_partition(chunk.tenant_id);
    std::unique_lock lock(partition->mutex);
    partition->entries.insert_or_assign(chunk.chunk_id, std::move(entry));
}

bool InMemoryRetrievalIndex::tombstone(const std::string& tenant_id, const std::string& chunk_id) {
    validate_tenant_id(tenant_id);
    auto partition = find_partition(tenant_id);
    if (!partition) {
        return false;
    }
    std::unique_lock lock(partition->mutex);
    return partition->entries.erase(chunk_id) > 0;
}

std::vector<RetrievedChunk> InMemoryRetrievalIndex::search(const std::string& tenant_id,
                                                           const std::vector<float>& query_embedding,
                                                           int k,
                                                           double min_score) {
    validate_tenant_id(tenant_id);
    validate_query_embedding(query_embedding, dimension_);
    if (k <= 0) {
        return {};
    }

    auto partition = find_partition(tenant_id);
    if (!partition) {
        return {};
    }

    const std::vector<float> query = normalized(query_embedding);

    struct Candidate {
        double score;
        std::uint64_t seq;
        const Entry* entry;
    };

    std::shared_lock lock(partition->mutex);
    std::vector<Candidate> candidates;
    candidates.reserve(partition->entries.size());
    for (const auto& [chunk_id, entry] : partition->entries) {
        const double score = std::clamp(dot(query, entry.unit), 0.0, 1.0);
        if (score >= min_score) {
            candidates.push_back(Candidate{score, entry.indexed_seq, &entry});
        }
    }

    const auto better = [](const Candidate& a, const Candidate& b) {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        return a.seq > b.seq;
    };
    const std::size_t limit = std::min(candidates.size(), static_cast<std::size_t>(k));
    std::partial_sort(candidates.begin(), candidates.begin() + static_cast<std::ptrdiff_t>(limit), candidates.end(),
                      better);

    std::vector<RetrievedChunk> results;
    results.reserve(limit);
    for (std::size_t i = 0; i < limit; ++i) {
        results.push_back(RetrievedChunk{candidates[i].entry->chunk, candidates[i].score});
    }
    return results;
}

HealthDetail InMemoryRetrievalIndex::health() {
    HealthDetail detail;
    detail.connected = true;
    detail.backend_version = "in-memory";

    std::shared_lock lock(partitions_mutex_);
    for (const auto& [tenant_id, partition] : partitions_) {
        std::shared_lock partition_lock(partition->mutex);
        detail.approx_indexed_count += partition->entries.size();
    }
    return detail;
}

std::size_t InMemoryRetrievalIndex::tenant_count() const {
    std::shared_lock lock(partitions_mutex_);
    return partitions_.size();
}

}  // namespace ragquery
