#include "db/pg_tenant_directory.hpp"

#include <utility>

#include "core/errors.hpp"

namespace ragquery {

PgTenantDirectory::PgTenantDirectory(std::shared_ptr<PgConnectionPool> pool, std::chrono::seconds cache_ttl)
    : pool_(std::move(pool)), cache_ttl_(cache_ttl) {}

bool PgTenantDirectory::is_known(const std::string& tenant_id) {
    const auto now = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = cache_.find(tenant_id);
        if (it != cache_.end() && it->second.expires_at > now) {
            return it->second.known;
        }
    }

    bool known = false;
    try {
        auto connection = pool_->acquire();
        pqxx::read_transaction txn{*connection};
        const auto result = txn.exec_params("SELECT 1 FROM tenant WHERE id = $1 LIMIT 1;", tenant_id);
        txn.commit();
        known = !result.empty();
    } catch (const std::exception& ex) {
        throw StoreError(std::string{"tenant lookup failed: "} + ex.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    cache_[tenant_id] = CacheEntry{known, now + cache_ttl_};
    return known;
}

}  // namespace ragquery
