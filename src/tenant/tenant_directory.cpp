#include "tenant/tenant_directory.hpp"

namespace ragquery {

StaticTenantDirectory::StaticTenantDirectory(const std::vector<std::string>& tenants)
    : tenants_(tenants.begin(), tenants.end()) {}

bool StaticTenantDirectory::is_known(const std::string& tenant_id) {
    return tenants_.empty() || tenants_.count(tenant_id) > 0;
}

}  // namespace ragquery
