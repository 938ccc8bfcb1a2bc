#pragma once

#include <string>
#include <unordered_set>
#include <vector>

namespace ragquery {

// Answers whether a tenant exists. Tenant records are owned elsewhere.
class TenantDirectory {
public:
    virtual ~TenantDirectory() = default;

    virtual bool is_known(const std::string& tenant_id) = 0;
};

// Fixed allow-list. An empty list accepts every well-formed tenant id.
class StaticTenantDirectory final : public TenantDirectory {
public:
    explicit StaticTenantDirectory(const std::vector<std::string>& tenants);

    bool is_known(const std::string& tenant_id) override;

    bool accepts_any() const noexcept { return tenants_.empty(); }

private:
    std::unordered_set<std::string> tenants_;
};

}  // namespace ragquery
