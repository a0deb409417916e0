#include "pool_registry.hpp"
#include "non_reentrant.hpp"
#include "../model/poolreg_errors.hpp"
#include "../commons/poolreg_log.hpp"

namespace poolreg {
namespace registry {

using namespace model;


PoolRegistry::PoolRegistry(const ContractDirectory &directory
                           , const address_t &admin
                           , const address_t &approvedPoolOwner
                           , const RegistryConfig &config)
    : m_directory(directory)
    , m_config(config)
    , m_pairs(config.pair_key_scheme)
{
    m_config.check_consistency();
    m_setup_role(DEFAULT_ADMIN_ROLE, admin);
    m_setup_role(SADDLE_MANAGER_ROLE, admin);
    m_setup_role(SADDLE_APPROVED_POOL_OWNER_ROLE, approvedPoolOwner);
    m_set_role_admin(COMMUNITY_MANAGER_ROLE, SADDLE_MANAGER_ROLE);
    log_trace("PoolRegistry created at %1%", static_cast<const void *>(this));
}


template<typename Fn>
void PoolRegistry::m_notify(const char *event, Fn &&fn) const
{
    if (m_listener == nullptr) return;
    try {
        fn(*m_listener);
    } catch (const std::exception &e) {
        // the write is committed already. Report, don't unwind
        log_error("registry listener failed on %1%: %2%", event, e.what());
    }
}


void PoolRegistry::m_check_can_add(const address_t &caller, const PoolInputData &input) const
{
    if (has_role(SADDLE_MANAGER_ROLE, caller))
    {
        return;
    }
    require<AuthorizationError>(has_role(COMMUNITY_MANAGER_ROLE, caller)
                                , strfmt("%1% can't add pools", caller));
    require<AuthorizationError>(!input.isApproved
                                , strfmt("%1% can only add unapproved pools", caller));
}

void PoolRegistry::m_check_name(const std::string &name) const
{
    require<InvalidName>(!name.empty(), "pool name cannot be empty");
    require<InvalidName>(name.size() <= m_config.max_name_length
                         , strfmt("pool name too long: %1% bytes, limit is %2%"
                                  , name.size(), m_config.max_name_length));
}

const PoolData &PoolRegistry::m_lookup(const address_t &poolAddress) const
{
    auto loc = m_locators.lookup(poolAddress);
    require<PoolNotFound>(loc != nullptr, strfmt("no matching pool found for %1%", poolAddress));
    return m_records[loc->position];
}

const SwapEngine &PoolRegistry::m_engine_of(const PoolData &record) const
{
    return m_directory.require_swap_engine(record.targetAddress);
}


std::size_t PoolRegistry::add_pool(const address_t &caller, const PoolInputData &input)
{
    lock_guard_t lock_guard(m_update_mutex);
    NonReentrant guard(m_write_in_progress, "add_pool");

    // 1. validation of the request itself
    m_check_can_add(caller, input);
    require<InvalidIdentifier>(!input.poolAddress.is_null(), "poolAddress == 0");
    require<AlreadyRegistered>(m_locators.lookup(input.poolAddress) == nullptr
                               , strfmt("pool %1% is already registered", input.poolAddress));
    m_check_name(input.name);
    require<NameAlreadyRegistered>(m_locators.lookup_name(input.name) == nullptr
                                   , strfmt("pool name %1% is already taken", input.name));

    const std::size_t position = m_records.size();
    PoolData record;
    record.poolAddress           = input.poolAddress;
    record.assetClass            = input.assetClass;
    record.name                  = input.name;
    record.targetAddress         = input.targetAddress.is_null()
                                        ? input.poolAddress
                                        : input.targetAddress;
    record.depositWrapperAddress = input.depositWrapperAddress;
    record.externalId            = input.externalId;
    record.isApproved            = input.isApproved;
    record.isRemoved             = input.isRemoved;

    // 2. token discovery
    auto &engine = m_engine_of(record);
    record.tokens = discover_tokens(engine, m_config.max_tokens, record.targetAddress);

    // 3. every pair of pool tokens is swappable through the pool itself
    pending_pairs_t pairs;
    for (std::size_t i = 1; i < record.tokens.size(); ++i)
    {
        for (std::size_t j = 0; j < i; ++j)
        {
            if (record.tokens[i] == record.tokens[j]) continue;
            pairs.emplace_back(PendingPair{record.tokens[i], record.tokens[j], record.poolAddress});
        }
    }

    // 4. derived fields
    record.lpToken = fetch_swap_storage(engine, record.targetAddress).lpToken;

    // 5. meta pools
    if (record.has_wrapper())
    {
        m_expand_wrapper(record, pairs);
    }

    // 6. commit. Nothing below is expected to fail
    m_records.emplace_back(record);
    m_locators.emplace(PoolLocator{record.poolAddress, record.name, position});
    std::size_t indexed = 0;
    for (auto &p: pairs)
    {
        if (m_pairs.add(p.a, p.b, p.venue, position)) ++indexed;
    }

    log_info("pool %1% added at index %2% (%3% tokens, %4% pair entries): %5%"
             , record.poolAddress, position, record.tokens.size(), indexed, record);
    m_notify("pool_added", [&](RegistryListener &l) { l.pool_added(record.poolAddress, position, record); });
    return position;
}


void PoolRegistry::m_expand_wrapper(PoolData &record, pending_pairs_t &pairs) const
{
    auto &wrapper = m_directory.require_deposit_wrapper(record.depositWrapperAddress);

    const address_t base = wrapper.base_pool();
    require<BasePoolNotFound>(m_locators.lookup(base) != nullptr
                              , strfmt("base pool not found: %1% (wrapper %2%)"
                                       , base, record.depositWrapperAddress));
    record.basePoolAddress = base;

    record.underlyingTokens = discover_tokens(wrapper
                                              , m_config.max_tokens
                                              , record.depositWrapperAddress);

    require<ValidationError>(!record.tokens.empty()
                             , strfmt("meta pool %1% exposes no tokens", record.poolAddress));

    // the last meta level token is the base LP token. Underlying tokens from
    // that position on come from the base pool: swapping any of them against
    // a meta level token takes the wrapper, not the meta pool.
    const std::size_t base_lp_index = record.tokens.size() - 1;
    for (std::size_t i = base_lp_index; i < record.underlyingTokens.size(); ++i)
    {
        for (std::size_t j = 0; j < base_lp_index; ++j)
        {
            if (record.underlyingTokens[i] == record.tokens[j]) continue;
            pairs.emplace_back(PendingPair{record.underlyingTokens[i]
                                           , record.tokens[j]
                                           , record.depositWrapperAddress});
        }
    }

    const address_t parent = wrapper.meta_swap();
    require<WrapperMismatch>(parent == record.poolAddress
                             , strfmt("wrapper %1% fronts %2%, not %3%"
                                      , record.depositWrapperAddress, parent, record.poolAddress));
}


void PoolRegistry::approve_pool(const address_t &caller, const address_t &poolAddress)
{
    lock_guard_t lock_guard(m_update_mutex);
    NonReentrant guard(m_write_in_progress, "approve_pool");

    check_role(SADDLE_MANAGER_ROLE, caller);
    auto loc = m_locators.lookup(poolAddress);
    require<PoolNotFound>(loc != nullptr, strfmt("no matching pool found for %1%", poolAddress));
    auto &record = m_records[loc->position];
    const address_t owner = m_engine_of(record).owner();
    require<NotSaddleOwned>(has_role(SADDLE_APPROVED_POOL_OWNER_ROLE, owner)
                            , strfmt("pool %1% is owned by %2%, not an approved owner"
                                     , poolAddress, owner));

    record.isApproved = true;
    log_info("pool %1% approved", poolAddress);
    m_notify("pool_approved", [&](RegistryListener &l) { l.pool_approved(poolAddress); });
}


void PoolRegistry::update_pool(const address_t &caller, const PoolData &record)
{
    lock_guard_t lock_guard(m_update_mutex);
    NonReentrant guard(m_write_in_progress, "update_pool");

    check_role(SADDLE_MANAGER_ROLE, caller);
    auto &idx = m_locators.get<by_address>();
    auto loc = idx.find(record.poolAddress);
    require<PoolNotFound>(loc != idx.end()
                          , strfmt("no matching pool found for %1%", record.poolAddress));
    require<ValidationError>(record.isRemoved == m_records[loc->position].isRemoved
                             , strfmt("pool %1%: isRemoved can only be changed by remove_pool"
                                      , record.poolAddress));
    m_check_name(record.name);
    auto owner_of_name = m_locators.lookup_name(record.name);
    require<NameAlreadyRegistered>(owner_of_name == nullptr || owner_of_name->position == loc->position
                                   , strfmt("pool name %1% is already taken", record.name));

    const std::size_t position = loc->position;
    m_records[position] = record;
    idx.modify(loc, [&record](PoolLocator &l) { l.name = record.name; });

    log_info("pool %1% updated at index %2%: %3%", record.poolAddress, position, record);
    m_notify("pool_updated", [&](RegistryListener &l) { l.pool_updated(record); });
}


void PoolRegistry::remove_pool(const address_t &caller, const address_t &poolAddress)
{
    lock_guard_t lock_guard(m_update_mutex);
    NonReentrant guard(m_write_in_progress, "remove_pool");

    check_role(SADDLE_MANAGER_ROLE, caller);
    auto &idx = m_locators.get<by_address>();
    auto loc = idx.find(poolAddress);
    require<PoolNotFound>(loc != idx.end()
                          , strfmt("no matching pool found for %1%", poolAddress));

    const std::size_t position = loc->position;
    m_records[position].isRemoved = true;

    if (m_config.purge_removed_pools)
    {
        idx.erase(loc);
        auto withdrawn = m_pairs.withdraw(position);
        log_info("pool %1% removed from index %2%, %3% pair entries withdrawn"
                 , poolAddress, position, withdrawn);
    }
    else
    {
        log_info("pool %1% at index %2% flagged as removed", poolAddress, position);
    }
    m_notify("pool_removed", [&](RegistryListener &l) { l.pool_removed(poolAddress); });
}


PoolData PoolRegistry::get_pool_data(const address_t &poolAddress) const
{
    lock_guard_t lock_guard(m_update_mutex);
    return m_lookup(poolAddress);
}

PoolData PoolRegistry::get_pool_data_at_index(std::size_t index) const
{
    lock_guard_t lock_guard(m_update_mutex);
    require<OutOfBounds>(index < m_records.size()
                         , strfmt("index out of bounds: %1% (%2% pools)", index, m_records.size()));
    return m_records[index];
}

PoolData PoolRegistry::get_pool_data_by_name(const std::string &name) const
{
    lock_guard_t lock_guard(m_update_mutex);
    auto loc = m_locators.lookup_name(name);
    require<PoolNotFound>(loc != nullptr, strfmt("no matching pool found for name %1%", name));
    return m_records[loc->position];
}

std::vector<PoolData> PoolRegistry::get_all_pool_data() const
{
    lock_guard_t lock_guard(m_update_mutex);
    return m_records;
}

std::size_t PoolRegistry::get_pools_length() const
{
    lock_guard_t lock_guard(m_update_mutex);
    return m_records.size();
}

address_list_t PoolRegistry::get_tokens(const address_t &poolAddress) const
{
    lock_guard_t lock_guard(m_update_mutex);
    return m_lookup(poolAddress).tokens;
}

address_list_t PoolRegistry::get_underlying_tokens(const address_t &poolAddress) const
{
    lock_guard_t lock_guard(m_update_mutex);
    return m_lookup(poolAddress).underlyingTokens;
}

address_list_t PoolRegistry::get_eligible_pools(const address_t &from, const address_t &to) const
{
    require<InvalidPair>(!from.is_null() && from != to
                         , strfmt("invalid pair (%1%, %2%)", from, to));
    lock_guard_t lock_guard(m_update_mutex);
    return m_pairs.venues(from, to);
}


TokenBalances PoolRegistry::m_token_balances(const PoolData &record) const
{
    auto &engine = m_engine_of(record);
    TokenBalances res;
    res.tokens = record.tokens;
    res.balances.reserve(record.tokens.size());
    for (unsigned i = 0; i < record.tokens.size(); ++i)
    {
        res.balances.emplace_back(engine.token_balance(i));
    }
    return res;
}

TokenBalances PoolRegistry::get_token_balances(const address_t &poolAddress) const
{
    lock_guard_t lock_guard(m_update_mutex);
    return m_token_balances(m_lookup(poolAddress));
}

TokenBalances PoolRegistry::get_underlying_token_balances(const address_t &poolAddress) const
{
    lock_guard_t lock_guard(m_update_mutex);
    auto &record = m_lookup(poolAddress);
    if (!record.has_wrapper() || record.tokens.empty())
    {
        return m_token_balances(record);
    }

    auto &base = m_lookup(record.basePoolAddress);
    auto meta_level = m_token_balances(record);
    auto base_level = m_token_balances(base);

    const std::size_t base_lp_index = record.tokens.size() - 1;
    const balance_t base_lp_held = meta_level.balances[base_lp_index];
    const balance_t base_lp_supply = m_directory.total_supply(base.lpToken);

    TokenBalances res;
    res.tokens = record.underlyingTokens;
    res.balances.resize(record.underlyingTokens.size(), balance_t(0));
    for (std::size_t i = 0; i < res.balances.size(); ++i)
    {
        if (i < base_lp_index)
        {
            res.balances[i] = meta_level.balances[i];
            continue;
        }
        const std::size_t j = i - base_lp_index;
        if (base_lp_supply == 0 || j >= base_level.balances.size())
        {
            continue;
        }
        // widened, the product of two uint256 can overflow
        typedef bignum::uint512_t wide_t;
        wide_t share = wide_t(base_level.balances[j]) * wide_t(base_lp_held);
        res.balances[i] = balance_t(share / wide_t(base_lp_supply));
    }
    return res;
}


balance_t PoolRegistry::get_virtual_price(const address_t &poolAddress) const
{
    lock_guard_t lock_guard(m_update_mutex);
    return m_engine_of(m_lookup(poolAddress)).virtual_price();
}

balance_t PoolRegistry::get_a(const address_t &poolAddress) const
{
    lock_guard_t lock_guard(m_update_mutex);
    return m_engine_of(m_lookup(poolAddress)).a();
}

bool PoolRegistry::get_paused(const address_t &poolAddress) const
{
    lock_guard_t lock_guard(m_update_mutex);
    return m_engine_of(m_lookup(poolAddress)).paused();
}

SwapStorage PoolRegistry::get_swap_storage(const address_t &poolAddress) const
{
    lock_guard_t lock_guard(m_update_mutex);
    auto &record = m_lookup(poolAddress);
    return fetch_swap_storage(m_engine_of(record), record.targetAddress);
}

balance_t PoolRegistry::get_swap_fee(const address_t &poolAddress) const
{
    return get_swap_storage(poolAddress).swapFee;
}

balance_t PoolRegistry::get_admin_fee(const address_t &poolAddress) const
{
    return get_swap_storage(poolAddress).adminFee;
}


void PoolRegistry::set_listener(RegistryListener *listener)
{
    lock_guard_t lock_guard(m_update_mutex);
    m_listener = listener;
}


} // namespace registry
} // namespace poolreg
