#include "config/config.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "util/log.hpp"
#include "util/text.hpp"

namespace ragquery
{
    namespace
    {

        class EnvReader
        {
        public:
            explicit EnvReader(const Config::EnvLookup &lookup) : lookup_(lookup) {}

            std::string string_or(const char *name, const char *default_value) const
            {
                if (const char *value = lookup_(name); value && *value)
                {
                    return value;
                }
                return default_value;
            }

            long long integer_or(const char *name, long long default_value, long long min_value) const
            {
                const std::string raw = string_or(name, "");
                if (raw.empty())
                {
                    return default_value;
                }
                std::size_t consumed = 0;
                long long value = 0;
                try
                {
                    value = std::stoll(raw, &consumed);
                }
                catch (const std::exception &)
                {
                    throw invalid(name, raw);
                }
                if (consumed != raw.size() || value < min_value)
                {
                    throw invalid(name, raw);
                }
                return value;
            }

            double number_or(const char *name, double default_value, double min_value, double max_value) const
            {
                const std::string raw = string_or(name, "");
                if (raw.empty())
                {
                    return default_value;
                }
                std::size_t consumed = 0;
                double value = 0.0;
                try
                {
                    value = std::stod(raw, &consumed);
                }
                catch (const std::exception &)
                {
                    throw invalid(name, raw);
                }
                if (consumed != raw.size() || value < min_value || value > max_value)
                {
                    throw invalid(name, raw);
                }
                return value;
            }

            bool flag_or(const char *name, bool default_value) const
            {
                const std::string raw = string_or(name, "");
                if (raw.empty())
                {
                    return default_value;
                }
                if (raw == "1" || raw == "true" || raw == "yes" || raw == "on")
                {
                    return true;
                }
                if (raw == "0" || raw == "false" || raw == "no" || raw == "off")
                {
                    return false;
                }
                throw invalid(name, raw);
            }

            std::vector<std::string> list(const char *name) const
            {
                std::vector<std::string> items;
                std::istringstream in(string_or(name, ""));
                std::string item;
                while (std::getline(in, item, ','))
                {
                    item = text::trim(item);
                    if (!item.empty())
                    {
                        items.push_back(item);
                    }
                }
                return items;
            }

            static std::runtime_error invalid(const char *name, const std::string &raw)
            {
                return std::runtime_error(std::string{"invalid value for "} + name + ": '" + raw + "'");
            }

        private:
            const Config::EnvLookup &lookup_;
        };

        ProviderKind parse_provider(const EnvReader &env, const char *name, const char *default_value)
        {
            const std::string raw = env.string_or(name, default_value);
            if (raw == "openai")
            {
                return ProviderKind::OpenAi;
            }
            if (raw == "azure")
            {
                return ProviderKind::Azure;
            }
            if (raw == "ollama")
            {
                return ProviderKind::Ollama;
            }
            if (raw == "none")
            {
                return ProviderKind::None;
            }
            throw EnvReader::invalid(name, raw);
        }

        template <typename Enum>
        Enum parse_choice(const EnvReader &env,
                          const char *name,
                          const char *default_value,
                          const char *first,
                          Enum first_value,
                          const char *second,
                          Enum second_value)
        {
            const std::string raw = env.string_or(name, default_value);
            if (raw == first)
            {
                return first_value;
            }
            if (raw == second)
            {
                return second_value;
            }
            throw EnvReader::invalid(name, raw);
        }

        std::string strip_trailing_slashes(std::string url)
        {
            while (!url.empty() && url.back() == '/')
            {
                url.pop_back();
            }
            return url;
        }

        std::string append_api_version(const std::string &url, const std::string &version)
        {
            if (url.find("api-version=") != std::string::npos || version.empty())
            {
                return url;
            }
            const char separator = (url.find('?') == std::string::npos) ? '?' : '&';
            return url + separator + "api-version=" + version;
        }

    } // namespace

    const char *provider_kind_name(ProviderKind kind)
    {
        switch (kind)
        {
        case ProviderKind::OpenAi:
            return "openai";
        case ProviderKind::Azure:
            return "azure";
        case ProviderKind::Ollama:
            return "ollama";
        case ProviderKind::None:
            return "none";
        }
        return "none";
    }

    Config Config::load()
    {
        return load([](const char *name) -> const char *
                    { return std::getenv(name); });
    }

    Config Config::load(const EnvLookup &lookup)
    {
        const EnvReader env(lookup);
        Config config;

        config.http_host_ = env.string_or("RAG_HTTP_HOST", "0.0.0.0");
        config.http_port_ = static_cast<int>(env.integer_or("RAG_HTTP_PORT", 8080, 1));

        config.index_backend_ = parse_choice(env, "RAG_INDEX_BACKEND", "qdrant", "qdrant", IndexBackend::Qdrant,
                                             "memory", IndexBackend::Memory);
        config.qdrant_url_ = env.string_or("QDRANT_URL", "http://qdrant:6333");
        config.qdrant_api_key_ = env.string_or("QDRANT_API_KEY", "");
        config.qdrant_collection_prefix_ = env.string_or("RAG_QDRANT_COLLECTION_PREFIX", "rag");
        config.index_timeout_seconds_ = static_cast<long>(env.integer_or("RAG_INDEX_TIMEOUT_SECONDS", 10, 1));
        config.embedding_dimension_ =
            static_cast<std::size_t>(env.integer_or("RAG_EMBEDDING_DIMENSION", 3072, 1));

        config.embedding_provider_ = parse_provider(env, "RAG_EMBEDDING_PROVIDER", "azure");
        if (config.embedding_provider_ != ProviderKind::Azure && config.embedding_provider_ != ProviderKind::OpenAi)
        {
            throw EnvReader::invalid("RAG_EMBEDDING_PROVIDER", provider_kind_name(config.embedding_provider_));
        }
        config.embedding_timeout_seconds_ =
            static_cast<long>(env.integer_or("RAG_EMBEDDING_TIMEOUT_SECONDS", 30, 1));

        config.azure_endpoint_ = env.string_or("AZURE_OPENAI_ENDPOINT", "");
        config.azure_api_key_ = env.string_or("AZURE_OPENAI_API_KEY", "");
        config.azure_api_version_ = env.string_or("AZURE_OPENAI_API_VERSION", "");
        config.azure_embedding_deployment_ = env.string_or("AZURE_OPENAI_EMBEDDING_DEPLOYMENT", "");
        config.azure_chat_deployment_ = env.string_or("AZURE_OPENAI_CHAT_DEPLOYMENT", "");
        config.azure_chat_api_version_ = env.string_or("AZURE_OPENAI_CHAT_API_VERSION", "");

        config.openai_base_url_ = env.string_or("OPENAI_BASE_URL", "https://api.openai.com/v1");
        config.openai_api_key_ = env.string_or("OPENAI_API_KEY", "");
        config.openai_chat_model_ = env.string_or("OPENAI_CHAT_MODEL", "gpt-4o-mini");
        config.openai_embedding_model_ = env.string_or("OPENAI_EMBEDDING_MODEL", "text-embedding-3-large");

        config.ollama_base_url_ = env.string_or("OLLAMA_BASE_URL", "http://ollama:11434");
        config.ollama_chat_model_ = env.string_or("OLLAMA_CHAT_MODEL", "llama3");

        config.primary_provider_ = parse_provider(env, "RAG_PRIMARY_PROVIDER", "openai");
        if (config.primary_provider_ == ProviderKind::None)
        {
            throw EnvReader::invalid("RAG_PRIMARY_PROVIDER", "none");
        }
        config.secondary_provider_ = parse_provider(env, "RAG_SECONDARY_PROVIDER", "ollama");
        if (config.secondary_provider_ == config.primary_provider_)
        {
            throw std::runtime_error("RAG_SECONDARY_PROVIDER must differ from RAG_PRIMARY_PROVIDER");
        }
        config.first_token_timeout_ =
            std::chrono::seconds{env.integer_or("RAG_GENERATION_FIRST_TOKEN_TIMEOUT_SECONDS", 60, 1)};
        config.total_generation_timeout_ =
            std::chrono::seconds{env.integer_or("RAG_GENERATION_TOTAL_TIMEOUT_SECONDS", 300, 1)};
        if (config.total_generation_timeout_ < config.first_token_timeout_)
        {
            throw std::runtime_error("RAG_GENERATION_TOTAL_TIMEOUT_SECONDS is shorter than the first-token timeout");
        }

        config.conversation_backend_ = parse_choice(env, "RAG_CONVERSATION_BACKEND", "postgres", "postgres",
                                                    ConversationBackend::Postgres, "memory",
                                                    ConversationBackend::Memory);
        config.conversation_max_turns_ =
            static_cast<std::size_t>(env.integer_or("RAG_CONVERSATION_MAX_TURNS", 20, 1));
        config.conversation_ttl_ = std::chrono::hours{env.integer_or("RAG_CONVERSATION_TTL_HOURS", 24, 1)};
        config.history_turns_ = static_cast<std::size_t>(env.integer_or("RAG_HISTORY_TURNS", 5, 0));
        if (config.history_turns_ > config.conversation_max_turns_)
        {
            throw std::runtime_error("RAG_HISTORY_TURNS exceeds RAG_CONVERSATION_MAX_TURNS");
        }

        config.pg_host_ = env.string_or("PGHOST", "postgres");
        config.pg_port_ = env.string_or("PGPORT", "5432");
        config.pg_database_ = env.string_or("PGDATABASE", "rag_db");
        config.pg_user_ = env.string_or("PGUSER", "rag_user");
        config.pg_password_ = env.string_or("PGPASSWORD", "rag_pass");
        config.pg_pool_size_ = static_cast<std::size_t>(env.integer_or("RAG_PG_POOL_SIZE", 4, 1));
        config.pg_acquire_timeout_ =
            std::chrono::milliseconds{env.integer_or("RAG_PG_ACQUIRE_TIMEOUT_MS", 2000, 1)};

        config.tenant_source_ = parse_choice(env, "RAG_TENANT_DIRECTORY", "static", "static", TenantSource::Static,
                                             "postgres", TenantSource::Postgres);
        config.tenants_ = env.list("RAG_TENANTS");
        config.tenant_cache_ttl_ = std::chrono::seconds{env.integer_or("RAG_TENANT_CACHE_SECONDS", 60, 0)};

        config.max_query_chars_ = static_cast<std::size_t>(env.integer_or("RAG_MAX_QUERY_CHARS", 2000, 1));
        config.max_top_k_ = static_cast<int>(env.integer_or("RAG_MAX_TOP_K", 100, 1));
        config.context_max_tokens_ = static_cast<int>(env.integer_or("RAG_CONTEXT_MAX_TOKENS", 4000, 1));
        config.context_relevance_threshold_ = env.number_or("RAG_CONTEXT_RELEVANCE_THRESHOLD", 0.7, 0.0, 1.0);
        config.context_include_metadata_ = env.flag_or("RAG_CONTEXT_INCLUDE_METADATA", true);

        config.kafka_brokers_ = env.string_or("KAFKA_BROKERS", "redpanda:9092");
        config.kafka_worker_group_ = env.string_or("KAFKA_WORKER_GROUP", "rag-query-worker");
        config.failure_sink_ = parse_choice(env, "RAG_FAILURE_REPORTER", "log", "log", FailureSink::Log, "kafka",
                                            FailureSink::Kafka);

        std::ostringstream oss;
        oss << "config loaded index=" << (config.index_backend_ == IndexBackend::Qdrant ? "qdrant" : "memory")
            << " conversations="
            << (config.conversation_backend_ == ConversationBackend::Postgres ? "postgres" : "memory")
            << " primary=" << provider_kind_name(config.primary_provider_)
            << " secondary=" << provider_kind_name(config.secondary_provider_);
        log::info(oss.str());
        return config;
    }

    std::string Config::pg_conninfo() const
    {
        std::ostringstream oss;
        oss << "host=" << pg_host_;
        oss << " port=" << pg_port_;
        oss << " dbname=" << pg_database_;
        oss << " user=" << pg_user_;
        oss << " password=" << pg_password_;
        return oss.str();
    }

    std::string Config::azure_embedding_url() const
    {
        if (azure_endpoint_.empty())
        {
            return "";
        }
        if (azure_endpoint_.find("embeddings") != std::string::npos)
        {
            return append_api_version(azure_endpoint_, azure_api_version_);
        }

        std::ostringstream oss;
        oss << strip_trailing_slashes(azure_endpoint_) << "/openai/deployments/" << azure_embedding_deployment_
            << "/embeddings";
        return append_api_version(oss.str(), azure_api_version_);
    }

    std::string Config::azure_chat_url() const
    {
        if (azure_endpoint_.empty())
        {
            return "";
        }
        const std::string &version = azure_chat_api_version_.empty() ? azure_api_version_ : azure_chat_api_version_;
        if (azure_endpoint_.find("chat/completions") != std::string::npos)
        {
            return append_api_version(azure_endpoint_, version);
        }

        const std::string base = strip_trailing_slashes(azure_endpoint_);
        if (base.find("/openai/v1") != std::string::npos)
        {
            return base + "/chat/completions";
        }
        std::ostringstream oss;
        oss << base << "/openai/deployments/" << azure_chat_deployment_ << "/chat/completions";
        return append_api_version(oss.str(), version);
    }

    std::string Config::openai_chat_url() const
    {
        return strip_trailing_slashes(openai_base_url_) + "/chat/completions";
    }

    std::string Config::openai_embedding_url() const
    {
        return strip_trailing_slashes(openai_base_url_) + "/embeddings";
    }

} // namespace ragquery
