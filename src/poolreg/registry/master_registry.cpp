#include "master_registry.hpp"
#include "non_reentrant.hpp"
#include "../model/poolreg_errors.hpp"
#include "../commons/poolreg_log.hpp"

namespace poolreg {
namespace registry {

using namespace model;


MasterRegistry::MasterRegistry(const address_t &admin, const RegistryConfig &config)
    : m_config(config)
{
    m_config.check_consistency();
    m_setup_role(DEFAULT_ADMIN_ROLE, admin);
    m_setup_role(SADDLE_MANAGER_ROLE, admin);
    log_trace("MasterRegistry created at %1%", static_cast<const void *>(this));
}


std::size_t MasterRegistry::add_registry(const address_t &caller
                                         , const std::string &name
                                         , const address_t &address)
{
    lock_guard_t lock_guard(m_update_mutex);
    NonReentrant guard(m_write_in_progress, "add_registry");

    check_role(SADDLE_MANAGER_ROLE, caller);
    require<InvalidName>(!name.empty(), "name cannot be empty");
    require<InvalidName>(name.size() <= m_config.max_name_length
                         , strfmt("name too long: %1% bytes, limit is %2%"
                                  , name.size(), m_config.max_name_length));
    require<InvalidIdentifier>(!address.is_null(), "address cannot be empty");
    require<DuplicateIdentifier>(m_reverse.find(address) == m_reverse.end()
                                 , strfmt("duplicate registry address %1%", address));

    auto &versions = m_versions[name];
    const std::size_t version = versions.size();
    versions.emplace_back(address);
    m_reverse.emplace(address, ReverseEntry{name, version});

    log_info("registry %1% v%2% -> %3%", name, version, address);
    if (m_listener != nullptr)
    {
        try {
            m_listener->registry_added(name, address, version);
        } catch (const std::exception &e) {
            log_error("registry listener failed on %1% v%2%: %3%", name, version, e.what());
        }
    }
    return version;
}


address_t MasterRegistry::resolve_name_to_latest_address(const std::string &name) const
{
    lock_guard_t lock_guard(m_update_mutex);
    auto i = m_versions.find(name);
    require<NameNotFound>(i != m_versions.end() && !i->second.empty()
                          , strfmt("no match found for name %1%", name));
    return i->second.back();
}

address_t MasterRegistry::resolve_name_and_version_to_address(const std::string &name
                                                              , std::size_t version) const
{
    lock_guard_t lock_guard(m_update_mutex);
    auto i = m_versions.find(name);
    const std::size_t length = i == m_versions.end() ? 0 : i->second.size();
    require<VersionNotFound>(version < length
                             , strfmt("no match found for name %1% and version %2%", name, version));
    return i->second[version];
}

address_list_t MasterRegistry::resolve_name_to_all_addresses(const std::string &name) const
{
    lock_guard_t lock_guard(m_update_mutex);
    auto i = m_versions.find(name);
    require<NameNotFound>(i != m_versions.end() && !i->second.empty()
                          , strfmt("no match found for name %1%", name));
    return i->second;
}

RegistryData MasterRegistry::resolve_address_to_registry_data(const address_t &address) const
{
    lock_guard_t lock_guard(m_update_mutex);
    auto i = m_reverse.find(address);
    require<IdentifierNotFound>(i != m_reverse.end()
                                , strfmt("no match found for address %1%", address));

    RegistryData res;
    res.name = i->second.name;
    res.version = i->second.version;
    res.isLatest = res.version == m_versions.at(res.name).size() - 1;
    return res;
}

std::size_t MasterRegistry::names_count() const
{
    lock_guard_t lock_guard(m_update_mutex);
    return m_versions.size();
}

void MasterRegistry::set_listener(RegistryListener *listener)
{
    lock_guard_t lock_guard(m_update_mutex);
    m_listener = listener;
}


} // namespace registry
} // namespace poolreg
