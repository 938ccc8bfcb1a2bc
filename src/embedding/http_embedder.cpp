#include "embedding/http_embedder.hpp"

#include <chrono>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

#include <nlohmann/json.hpp>

#include "core/errors.hpp"
#include "net/http_client.hpp"
#include "util/log.hpp"

namespace ragquery
{

    namespace
    {

        nlohmann::json build_request_body(const std::string &text, const std::string &model, const std::string &tenant_id)
        {
            nlohmann::json body;
            body["input"] = text;
            if (!model.empty())
            {
                body["model"] = model;
            }
            // Lets the provider attribute usage per tenant.
            body["user"] = tenant_id;
            return body;
        }

    } // namespace

    std::vector<std::string> auth_headers(ApiAuthStyle auth, const std::string &api_key)
    {
        std::vector<std::string> headers{"Content-Type: application/json"};
        if (api_key.empty())
        {
            return headers;
        }
        if (auth == ApiAuthStyle::ApiKeyHeader)
        {
            headers.push_back("api-key: " + api_key);
        }
        else
        {
            headers.push_back("Authorization: Bearer " + api_key);
        }
        return headers;
    }

    HttpEmbedder::HttpEmbedder(HttpEmbedderSettings settings) : settings_(std::move(settings))
    {
        if (settings_.url.empty())
        {
            throw std::invalid_argument("embedding endpoint is not configured");
        }
        if (settings_.dimension == 0)
        {
            throw std::invalid_argument("embedding dimension must be positive");
        }
        if (settings_.max_attempts < 1)
        {
            settings_.max_attempts = 1;
        }
    }

    std::vector<float> HttpEmbedder::parse_embedding(const std::string &body) const
    {
        const auto json = nlohmann::json::parse(body);
        if (!json.contains("data") || !json["data"].is_array() || json["data"].empty())
        {
            throw EmbeddingError("embedding response missing data");
        }
        const auto &embedding_json = json["data"][0]["embedding"];
        if (!embedding_json.is_array())
        {
            throw EmbeddingError("embedding format invalid");
        }
        std::vector<float> embedding;
        embedding.reserve(embedding_json.size());
        for (const auto &value : embedding_json)
        {
            embedding.push_back(value.get<float>());
        }
        if (embedding.size() != settings_.dimension)
        {
            throw EmbeddingError("unexpected embedding dimension: " + std::to_string(embedding.size()));
        }
        return embedding;
    }

    std::vector<float> HttpEmbedder::embed(const std::string &text, const std::string &tenant_id)
    {
        if (text.empty())
        {
            throw EmbeddingError("cannot embed empty text");
        }

        const HttpRequest request{
            .method = "POST",
            .url = settings_.url,
            .headers = auth_headers(settings_.auth, settings_.api_key),
            .body = build_request_body(text, settings_.model, tenant_id).dump(),
            .timeout_seconds = settings_.timeout_seconds,
        };

        for (int attempt = 0; attempt < settings_.max_attempts; ++attempt)
        {
            HttpResponse response;
            try
            {
                response = perform_http_request(request);
            }
            catch (const HttpTransferError &ex)
            {
                throw EmbeddingError(std::string{"embedding request failed: "} + ex.what());
            }

            if (response.status == 200)
            {
                try
                {
                    return parse_embedding(response.body);
                }
                catch (const nlohmann::json::exception &ex)
                {
                    throw EmbeddingError(std::string{"failed to parse embedding response: "} + ex.what());
                }
            }

            if (response.status == 401 || response.status == 403)
            {
                throw EmbeddingError("embedding unauthorized (status " + std::to_string(response.status) + ')');
            }

            if ((response.status == 429 || response.status >= 500) && attempt + 1 < settings_.max_attempts)
            {
                std::ostringstream oss;
                oss << "embedding retry status=" << response.status << " attempt=" << attempt + 1;
                log::warn(oss.str());
                std::this_thread::sleep_for(std::chrono::milliseconds(250 << attempt));
                continue;
            }

            throw EmbeddingError("embedding request failed with status " + std::to_string(response.status));
        }

        throw EmbeddingError("embedding failed after retries");
    }

} // namespace ragquery
