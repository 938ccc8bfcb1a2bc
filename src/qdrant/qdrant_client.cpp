#include "qdrant/qdrant_client.hpp"

#include <stdexcept>

#include "net/http_client.hpp"

namespace ragquery
{
    namespace
    {

        std::string ensure_no_trailing_slash(std::string url)
        {
            while (!url.empty() && url.back() == '/')
            {
                url.pop_back();
            }
            return url;
        }

        nlohmann::json parse_body(const HttpResponse &response, const char *what)
        {
            try
            {
                return nlohmann::json::parse(response.body);
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw std::runtime_error(std::string{"failed to parse qdrant "} + what + " response: " + ex.what());
            }
        }

        [[noreturn]] void throw_status(const char *what, const HttpResponse &response)
        {
            throw std::runtime_error(std::string{"qdrant "} + what + " failed with status " +
                                     std::to_string(response.status) + " body: " + response.body);
        }

    }

    QdrantClient::QdrantClient(std::string base_url, long timeout_seconds, std::string api_key)
        : base_url_(ensure_no_trailing_slash(std::move(base_url))),
          timeout_seconds_(timeout_seconds),
          api_key_(std::move(api_key))
    {
    }

    std::string QdrantClient::collection_url(const std::string &collection_name) const
    {
        return base_url_ + "/collections/" + collection_name;
    }

    std::vector<std::string> QdrantClient::headers() const
    {
        std::vector<std::string> result{"Content-Type: application/json"};
        if (!api_key_.empty())
        {
            result.push_back("api-key: " + api_key_);
        }
        return result;
    }

    bool QdrantClient::collection_exists(const std::string &collection_name)
    {
        const HttpRequest request{
            .method = "GET",
            .url = collection_url(collection_name),
            .headers = headers(),
            .body = {},
            .timeout_seconds = timeout_seconds_,
        };

        const auto response = perform_http_request(request);
        if (response.status == 200)
        {
            return true;
        }
        if (response.status == 404)
        {
            return false;
        }
        throw_status("collection check", response);
    }

    void QdrantClient::ensure_collection(const std::string &collection_name, std::size_t dimension)
    {
        if (collection_exists(collection_name))
        {
            return;
        }

        nlohmann::json body;
        body["vectors"] = {{"size", dimension}, {"distance", "Cosine"}};
        const HttpRequest put_request{
            .method = "PUT",
            .url = collection_url(collection_name),
            .headers = headers(),
            .body = body.dump(),
            .timeout_seconds = timeout_seconds_,
        };

        const auto response = perform_http_request(put_request);
        // 409: another replica created it between the check and the PUT.
        if (response.status != 200 && response.status != 409)
        {
            throw_status("create collection", response);
        }
    }

    void QdrantClient::upsert_point(const std::string &collection_name,
                                    const std::string &point_id,
                                    const std::vector<float> &vector,
                                    const nlohmann::json &payload)
    {
        nlohmann::json point;
        point["id"] = point_id;
        point["vector"] = vector;
        point["payload"] = payload;

        nlohmann::json body;
        body["points"] = nlohmann::json::array();
        body["points"].push_back(point);

        const HttpRequest request{
            .method = "PUT",
            .url = collection_url(collection_name) + "/points?wait=true",
            .headers = headers(),
            .body = body.dump(),
            .timeout_seconds = timeout_seconds_,
        };

        const auto response = perform_http_request(request);
        if (response.status != 200)
        {
            throw_status("upsert", response);
        }
    }

    bool QdrantClient::delete_point(const std::string &collection_name, const std::string &point_id)
    {
        nlohmann::json body;
        body["points"] = nlohmann::json::array({point_id});

        const HttpRequest request{
            .method = "POST",
            .url = collection_url(collection_name) + "/points/delete?wait=true",
            .headers = headers(),
            .body = body.dump(),
            .timeout_seconds = timeout_seconds_,
        };

        const auto response = perform_http_request(request);
        if (response.status == 404)
        {
            return false;
        }
        if (response.status != 200)
        {
            throw_status("delete", response);
        }
        return true;
    }

    std::optional<std::vector<QdrantPoint>> QdrantClient::search(const std::string &collection_name,
                                                                 const std::vector<float> &vector,
                                                                 int limit,
                                                                 double score_threshold)
    {
        if (limit <= 0)
        {
            throw std::runtime_error("qdrant search requires limit > 0");
        }

        nlohmann::json body;
        body["vector"] = vector;
        body["limit"] = limit;
        body["with_payload"] = true;
        body["score_threshold"] = score_threshold;

        const HttpRequest request{
            .method = "POST",
            .url = collection_url(collection_name) + "/points/search",
            .headers = headers(),
            .body = body.dump(),
            .timeout_seconds = timeout_seconds_,
        };

        const auto response = perform_http_request(request);
        if (response.status == 404)
        {
            return std::nullopt;
        }
        if (response.status != 200)
        {
            throw_status("search", response);
        }

        const nlohmann::json json = parse_body(response, "search");
        if (!json.contains("result") || !json["result"].is_array())
        {
            throw std::runtime_error("qdrant search response missing result array");
        }

        std::vector<QdrantPoint> points;
        points.reserve(json["result"].size());
        for (const auto &item : json["result"])
        {
            if (!item.contains("score") || !item["score"].is_number())
            {
                throw std::runtime_error("qdrant search result missing score");
            }
            if (!item.contains("payload") || !item["payload"].is_object())
            {
                throw std::runtime_error("qdrant search result missing payload");
            }

            QdrantPoint point;
            point.score = item["score"].get<double>();
            if (item.contains("id"))
            {
                point.id = item["id"].is_string() ? item["id"].get<std::string>() : item["id"].dump();
            }
            point.payload = item["payload"];
            points.push_back(std::move(point));
        }
        return points;
    }

    std::vector<std::string> QdrantClient::list_collections()
    {
        const HttpRequest request{
            .method = "GET",
            .url = base_url_ + "/collections",
            .headers = headers(),
            .body = {},
            .timeout_seconds = timeout_seconds_,
        };

        const auto response = perform_http_request(request);
        if (response.status != 200)
        {
            throw_status("list collections", response);
        }

        const nlohmann::json json = parse_body(response, "collections");
        std::vector<std::string> names;
        for (const auto &item : json.value(nlohmann::json::json_pointer("/result/collections"), nlohmann::json::array()))
        {
            if (item.contains("name") && item["name"].is_string())
            {
                names.push_back(item["name"].get<std::string>());
            }
        }
        return names;
    }

    std::size_t QdrantClient::count_points(const std::string &collection_name)
    {
        nlohmann::json body;
        body["exact"] = false;

        const HttpRequest request{
            .method = "POST",
            .url = collection_url(collection_name) + "/points/count",
            .headers = headers(),
            .body = body.dump(),
            .timeout_seconds = timeout_seconds_,
        };

        const auto response = perform_http_request(request);
        if (response.status == 404)
        {
            return 0;
        }
        if (response.status != 200)
        {
            throw_status("count", response);
        }

        const nlohmann::json json = parse_body(response, "count");
        return json.value(nlohmann::json::json_pointer("/result/count"), std::size_t{0});
    }

    std::string QdrantClient::version()
    {
        const HttpRequest request{
            .method = "GET",
            .url = base_url_ + "/",
            .headers = headers(),
            .body = {},
            .timeout_seconds = timeout_seconds_,
        };

        const auto response = perform_http_request(request);
        if (response.status != 200)
        {
            throw_status("version", response);
        }
        const nlohmann::json json = parse_body(response, "version");
        return "qdrant " + json.value("version", std::string{"unknown"});
    }

}
