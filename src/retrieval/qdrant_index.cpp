#include "retrieval/qdrant_index.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>
#include <stdexcept>

#include "core/errors.hpp"
#include "util/log.hpp"
#include "util/time.hpp"
#include "util/uuid.hpp"
#include "wire/json_codec.hpp"

namespace ragquery {
namespace {

constexpr const char* kCollectionSeparator = "__";

std::int64_t indexed_seq_now() {
    static std::mutex mutex;
    static std::int64_t last = 0;
    std::lock_guard<std::mutex> lock(mutex);
    // Strictly increasing within the process even when the clock stalls.
    last = std::max(last + 1, time::to_epoch_millis(std::chrono::system_clock::now()) * 1000);
    return last;
}

}  // namespace

QdrantRetrievalIndex::QdrantRetrievalIndex(std::shared_ptr<QdrantClient> client,
                                           std::string collection_prefix,
                                           std::size_t dimension)
    : client_(std::move(client)), collection_prefix_(std::move(collection_prefix)), dimension_(dimension) {
    if (!client_) {
        throw std::invalid_argument("qdrant index requires a client");
    }
    if (dimension_ == 0) {
        throw std::invalid_argument("index dimension must be positive");
    }
}

std::string QdrantRetrievalIndex::collection_for(const std::string& tenant_id) const {
    return collection_prefix_ + kCollectionSeparator + tenant_id;
}

std::string QdrantRetrievalIndex::point_id_for(const std::string& tenant_id, const std::string& chunk_id) {
    return uuid::from_name(tenant_id + ":" + chunk_id);
}

void QdrantRetrievalIndex::ensure_collection(const std::string& collection) {
    {
        std::lock_guard<std::mutex> lock(ensured_mutex_);
        if (ensured_.count(collection) > 0) {
            return;
        }
    }
    client_->ensure_collection(collection, dimension_);
    std::lock_guard<std::mutex> lock(ensured_mutex_);
    ensured_.insert(collection);
}

void QdrantRetrievalIndex::index(const Chunk& chunk) {
    validate_chunk(chunk, dimension_);

    const std::string collection = collection_for(chunk.tenant_id);
    nlohmann::json payload;
    payload["tenant_id"] = chunk.tenant_id;
    payload["chunk_id"] = chunk.chunk_id;
    payload["content"] = chunk.content;
    payload["metadata"] = metadata_to_json(chunk.metadata);
    payload["indexed_seq"] = indexed_seq_now();

    try {
        ensure_collection(collection);
        client_->upsert_point(collection, point_id_for(chunk.tenant_id, chunk.chunk_id), chunk.embedding, payload);
    } catch (const std::exception& ex) {
        throw IndexError(IndexErrorKind::Unavailable, std::string{"qdrant index failed: "} + ex.what());
    }
}

bool QdrantRetrievalIndex::tombstone(const std::string& tenant_id, const std::string& chunk_id) {
    validate_tenant_id(tenant_id);
    try {
        return client_->delete_point(collection_for(tenant_id), point_id_for(tenant_id, chunk_id));
    } catch (const std::exception& ex) {
        throw IndexError(IndexErrorKind::Unavailable, std::string{"qdrant tombstone failed: "} + ex.what());
    }
}

std::vector<RetrievedChunk> QdrantRetrievalIndex::search(const std::string& tenant_id,
                                                         const std::vector<float>& query_embedding,
                                                         int k,
                                                         double min_score) {
    validate_tenant_id(tenant_id);
    validate_query_embedding(query_embedding, dimension_);
    if (k <= 0) {
        return {};
    }

    const std::string collection = collection_for(tenant_id);
    std::optional<std::vector<QdrantPoint>> points;
    try {
        points = client_->search(collection, query_embedding, k, min_score);
    } catch (const std::exception& ex) {
        throw IndexError(IndexErrorKind::Unavailable, std::string{"qdrant search failed: "} + ex.what());
    }
    if (!points) {
        log::debug("qdrant collection not found, tenant has nothing indexed: " + collection);
        return {};
    }

    struct Hit {
        RetrievedChunk retrieved;
        std::int64_t indexed_seq;
    };
    std::vector<Hit> hits;
    hits.reserve(points->size());
    for (const auto& point : *points) {
        const auto& payload = point.payload;
        if (payload.value("tenant_id", std::string{}) != tenant_id) {
            std::ostringstream oss;
            oss << "qdrant point with foreign tenant dropped collection=" << collection << " point_id=" << point.id;
            log::error(oss.str());
            continue;
        }

        Hit hit;
        hit.retrieved.chunk.tenant_id = tenant_id;
        hit.retrieved.chunk.chunk_id = payload.value("chunk_id", std::string{});
        hit.retrieved.chunk.content = payload.value("content", std::string{});
        if (payload.contains("metadata")) {
            hit.retrieved.chunk.metadata = metadata_from_json(payload["metadata"]);
        }
        hit.retrieved.relevance_score = std::clamp(point.score, 0.0, 1.0);
        hit.indexed_seq = payload.value("indexed_seq", std::int64_t{0});
        if (hit.retrieved.relevance_score < min_score) {
            continue;
        }
        hits.push_back(std::move(hit));
    }

    std::stable_sort(hits.begin(), hits.end(), [](const Hit& a, const Hit& b) {
        if (a.retrieved.relevance_score != b.retrieved.relevance_score) {
            return a.retrieved.relevance_score > b.retrieved.relevance_score;
        }
        return a.indexed_seq > b.indexed_seq;
    });

    std::vector<RetrievedChunk> results;
    results.reserve(hits.size());
    for (auto& hit : hits) {
        results.push_back(std::move(hit.retrieved));
    }
    return results;
}

bool QdrantRetrievalIndex::is_available() {
    try {
        client_->version();
        return true;
    } catch (const std::exception& ex) {
        log::warn(std::string{"qdrant unavailable: "} + ex.what());
        return false;
    }
}

HealthDetail QdrantRetrievalIndex::health() {
    HealthDetail detail;
    try {
        detail.backend_version = client_->version();
        detail.connected = true;
        const std::string prefix = collection_prefix_ + kCollectionSeparator;
        for (const auto& name : client_->list_collections()) {
            if (name.rfind(prefix, 0) == 0) {
                detail.approx_indexed_count += client_->count_points(name);
            }
        }
    } catch (const std::exception& ex) {
        log::warn(std::string{"qdrant health check failed: "} + ex.what());
        detail.connected = false;
    }
    return detail;
}

}  // namespace ragquery
