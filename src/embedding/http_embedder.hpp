#pragma once

#include <string>
#include <vector>

#include "embedding/embedder.hpp"

namespace ragquery
{

    enum class ApiAuthStyle
    {
        // Azure OpenAI: "api-key: <key>"
        ApiKeyHeader,
        // OpenAI and compatible gateways: "Authorization: Bearer <key>"
        Bearer,
    };

    struct HttpEmbedderSettings
    {
        std::string url;
        std::string api_key;
        ApiAuthStyle auth = ApiAuthStyle::ApiKeyHeader;
        // Sent as "model" when set; Azure deployments encode it in the URL.
        std::string model;
        std::size_t dimension = 3072;
        long timeout_seconds = 30;
        int max_attempts = 3;
    };

    class HttpEmbedder final : public Embedder
    {
    public:
        explicit HttpEmbedder(HttpEmbedderSettings settings);

        std::vector<float> embed(const std::string &text, const std::string &tenant_id) override;
        std::size_t dimension() const noexcept override { return settings_.dimension; }

    private:
        std::vector<float> parse_embedding(const std::string &body) const;

        HttpEmbedderSettings settings_;
    };

    std::vector<std::string> auth_headers(ApiAuthStyle auth, const std::string &api_key);

} // namespace ragquery
