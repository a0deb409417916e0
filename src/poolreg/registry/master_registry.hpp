/**
 * @file master_registry.hpp
 * @brief Versioned name -> address registry of infrastructure contracts.
 *
 * Every name owns an append-only list of addresses (its versions), the
 * last one being the latest. Every address belongs to at most one
 * (name, version) for the whole life of the registry: history is never
 * rewritten, so a resolved address can always be traced back.
 */

#pragma once

#include "../model/poolreg_model.hpp"
#include "../model/poolreg_config.hpp"
#include "../model/poolreg_access.hpp"
#include "registry_listener.hpp"
#include <boost/noncopyable.hpp>
#include <map>
#include <mutex>
#include <unordered_map>


namespace poolreg {
namespace registry {

using model::address_t;
using model::address_list_t;


struct MasterRegistry: model::AccessControl, boost::noncopyable
{
    /**
     * @param admin gets DEFAULT_ADMIN_ROLE and SADDLE_MANAGER_ROLE
     */
    explicit MasterRegistry(const address_t &admin
                            , const model::RegistryConfig &config = model::RegistryConfig());

    /**
     * @brief append @p address as the newest version of @p name
     * @return version number of the new entry (0 for the first)
     * @throws AuthorizationError, InvalidName, InvalidIdentifier, DuplicateIdentifier
     */
    std::size_t add_registry(const address_t &caller
                             , const std::string &name
                             , const address_t &address);

    /**
     * @throws NameNotFound
     */
    address_t resolve_name_to_latest_address(const std::string &name) const;

    /**
     * @throws VersionNotFound
     */
    address_t resolve_name_and_version_to_address(const std::string &name
                                                  , std::size_t version) const;

    /**
     * @throws NameNotFound
     */
    address_list_t resolve_name_to_all_addresses(const std::string &name) const;

    /**
     * @throws IdentifierNotFound
     */
    model::RegistryData resolve_address_to_registry_data(const address_t &address) const;

    std::size_t names_count() const;

    void set_listener(RegistryListener *listener);

private:
    struct ReverseEntry {
        std::string name;
        std::size_t version;
    };

    model::RegistryConfig m_config;
    std::map<std::string, address_list_t> m_versions;
    std::unordered_map<address_t, ReverseEntry> m_reverse;
    RegistryListener *m_listener = nullptr;

    mutable std::recursive_mutex m_update_mutex;
    typedef std::lock_guard<std::recursive_mutex> lock_guard_t;
    bool m_write_in_progress = false;
};


} // namespace registry
} // namespace poolreg
