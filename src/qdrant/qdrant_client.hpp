#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ragquery {

struct QdrantPoint {
    std::string id;
    double score = 0.0;
    nlohmann::json payload;
};

// Thin REST client for a Qdrant node. Every method throws std::runtime_error
// (HttpTransferError for transport problems) when the node misbehaves.
class QdrantClient {
public:
    QdrantClient(std::string base_url, long timeout_seconds, std::string api_key = {});

    bool collection_exists(const std::string& collection_name);
    void ensure_collection(const std::string& collection_name, std::size_t dimension);
    void upsert_point(const std::string& collection_name,
                      const std::string& point_id,
                      const std::vector<float>& vector,
                      const nlohmann::json& payload);
    // False when the point or its collection did not exist.
    bool delete_point(const std::string& collection_name, const std::string& point_id);

    // nullopt when the collection does not exist.
    std::optional<std::vector<QdrantPoint>> search(const std::string& collection_name,
                                                   const std::vector<float>& vector,
                                                   int limit,
                                                   double score_threshold);

    std::vector<std::string> list_collections();
    std::size_t count_points(const std::string& collection_name);
    std::string version();

private:
    std::string base_url_;
    long timeout_seconds_;
    std::string api_key_;

    std::string collection_url(const std::string& collection_name) const;
    std::vector<std::string> headers() const;
};

}  // namespace ragquery
