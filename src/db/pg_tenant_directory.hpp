#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "db/pg_pool.hpp"
#include "tenant/tenant_directory.hpp"

namespace ragquery
{

    // Looks tenants up in the `tenant` table and caches positive and
    // negative answers for cache_ttl.
    class PgTenantDirectory final : public TenantDirectory
    {
    public:
        PgTenantDirectory(std::shared_ptr<PgConnectionPool> pool, std::chrono::seconds cache_ttl);

        // Throws StoreError when the lookup cannot be made.
        bool is_known(const std::string &tenant_id) override;

    private:
        struct CacheEntry
        {
            bool known = false;
            std::chrono::steady_clock::time_point expires_at;
        };

        std::shared_ptr<PgConnectionPool> pool_;
        std::chrono::seconds cache_ttl_;
        std::mutex mutex_;
        std::unordered_map<std::string, CacheEntry> cache_;
    };

} // namespace ragquery
