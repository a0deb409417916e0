/**
 * @file poolreg_access.hpp
 * @brief Role based access control for registry operations.
 *
 * Each role is administered by one other role (DEFAULT_ADMIN_ROLE unless
 * told otherwise): holders of the admin role grant and revoke it.
 */

#pragma once

#include "poolreg_types.hpp"
#include <map>
#include <set>
#include <mutex>
#include <string>

namespace poolreg {
namespace model {

typedef std::string role_t;

extern const role_t DEFAULT_ADMIN_ROLE;
extern const role_t SADDLE_MANAGER_ROLE;              ///< registers, updates and removes anything
extern const role_t COMMUNITY_MANAGER_ROLE;           ///< registers unapproved pools only
extern const role_t SADDLE_APPROVED_POOL_OWNER_ROLE;  ///< pool owners whose pools can be approved


struct AccessControl
{
    virtual ~AccessControl() {}

    bool has_role(const role_t &role, const address_t &account) const;

    /**
     * @throws AuthorizationError unless @p account holds @p role
     */
    void check_role(const role_t &role, const address_t &account) const;

    role_t get_role_admin(const role_t &role) const;

    /**
     * @brief @p caller must hold the admin role of @p role
     */
    void grant_role(const address_t &caller, const role_t &role, const address_t &account);
    void revoke_role(const address_t &caller, const role_t &role, const address_t &account);

    /**
     * @brief drop a role held by @p caller itself
     */
    void renounce_role(const address_t &caller, const role_t &role);

    std::size_t role_member_count(const role_t &role) const;

protected:
    void m_setup_role(const role_t &role, const address_t &account);
    void m_set_role_admin(const role_t &role, const role_t &admin_role);

private:
    bool m_has_role(const role_t &role, const address_t &account) const;

    mutable std::mutex m_roles_mutex;
    typedef std::lock_guard<std::mutex> lock_guard_t;
    std::map<role_t, std::set<address_t>> m_members;
    std::map<role_t, role_t> m_admins;
};


} // namespace model
} // namespace poolreg
