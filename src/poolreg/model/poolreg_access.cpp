#include "poolreg_access.hpp"
#include "poolreg_errors.hpp"
#include "../commons/poolreg_log.hpp"

namespace poolreg {
namespace model {

const role_t DEFAULT_ADMIN_ROLE              = "DEFAULT_ADMIN_ROLE";
const role_t SADDLE_MANAGER_ROLE             = "SADDLE_MANAGER_ROLE";
const role_t COMMUNITY_MANAGER_ROLE          = "COMMUNITY_MANAGER_ROLE";
const role_t SADDLE_APPROVED_POOL_OWNER_ROLE = "SADDLE_APPROVED_POOL_OWNER_ROLE";


bool AccessControl::m_has_role(const role_t &role, const address_t &account) const
{
    auto i = m_members.find(role);
    return i != m_members.end() && i->second.count(account) > 0;
}

bool AccessControl::has_role(const role_t &role, const address_t &account) const
{
    lock_guard_t lock(m_roles_mutex);
    return m_has_role(role, account);
}

void AccessControl::check_role(const role_t &role, const address_t &account) const
{
    require<AuthorizationError>(has_role(role, account)
                                , strfmt("%1% is missing role %2%", account, role));
}

role_t AccessControl::get_role_admin(const role_t &role) const
{
    lock_guard_t lock(m_roles_mutex);
    auto i = m_admins.find(role);
    return i == m_admins.end() ? DEFAULT_ADMIN_ROLE : i->second;
}

void AccessControl::grant_role(const address_t &caller, const role_t &role, const address_t &account)
{
    check_role(get_role_admin(role), caller);
    require<InvalidIdentifier>(!account.is_null(), "can't grant a role to the null address");
    lock_guard_t lock(m_roles_mutex);
    if (m_members[role].insert(account).second)
    {
        log_info("role %1% granted to %2% by %3%", role, account, caller);
    }
}

void AccessControl::revoke_role(const address_t &caller, const role_t &role, const address_t &account)
{
    check_role(get_role_admin(role), caller);
    lock_guard_t lock(m_roles_mutex);
    if (m_members[role].erase(account) > 0)
    {
        log_info("role %1% revoked from %2% by %3%", role, account, caller);
    }
}

void AccessControl::renounce_role(const address_t &caller, const role_t &role)
{
    lock_guard_t lock(m_roles_mutex);
    if (m_members[role].erase(caller) > 0)
    {
        log_info("role %1% renounced by %2%", role, caller);
    }
}

std::size_t AccessControl::role_member_count(const role_t &role) const
{
    lock_guard_t lock(m_roles_mutex);
    auto i = m_members.find(role);
    return i == m_members.end() ? 0 : i->second.size();
}

void AccessControl::m_setup_role(const role_t &role, const address_t &account)
{
    require<InvalidIdentifier>(!account.is_null()
                               , strfmt("can't setup role %1% for the null address", role));
    lock_guard_t lock(m_roles_mutex);
    m_members[role].insert(account);
}

void AccessControl::m_set_role_admin(const role_t &role, const role_t &admin_role)
{
    lock_guard_t lock(m_roles_mutex);
    m_admins[role] = admin_role;
}


} // namespace model
} // namespace poolreg
