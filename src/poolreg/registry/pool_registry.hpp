/**
 * @file pool_registry.hpp
 * @brief Registry of liquidity pools, and index of the token pairs they swap.
 *
 * Registration (add_pool) is the only place where knowledge is built:
 * the registry probes the pool's swap engine (and deposit wrapper, for meta
 * pools) to discover its tokens and LP token, then records, for every token
 * pair the pool can swap, the venue a caller has to go through.
 * That way routing lookups (get_eligible_pools) are a single index hit.
 *
 * Dynamic figures (balances, fees, pause state) are never cached: the
 * related accessors check the pool is registered and ask its engine.
 */

#pragma once

#include "../model/poolreg_model.hpp"
#include "../model/poolreg_config.hpp"
#include "../model/poolreg_access.hpp"
#include "../model/poolreg_collaborators.hpp"
#include "pair_idx.hpp"
#include "pool_idx.hpp"
#include "registry_listener.hpp"
#include <boost/noncopyable.hpp>
#include <mutex>
#include <vector>


namespace poolreg {
namespace registry {

using model::address_t;
using model::address_list_t;
using model::balance_t;
using model::PoolData;
using model::PoolInputData;


struct PoolRegistry: model::AccessControl, boost::noncopyable
{
    /**
     * @param directory resolves pool, engine and wrapper addresses. Must outlive the registry
     * @param admin gets DEFAULT_ADMIN_ROLE and SADDLE_MANAGER_ROLE
     * @param approvedPoolOwner gets SADDLE_APPROVED_POOL_OWNER_ROLE
     */
    PoolRegistry(const model::ContractDirectory &directory
                 , const address_t &admin
                 , const address_t &approvedPoolOwner
                 , const model::RegistryConfig &config = model::RegistryConfig());

    /**
     * @brief Register a pool.
     *
     * Discovers tokens, LP token and (meta pools) underlying tokens,
     * indexes every swappable pair, then appends the record.
     * Nothing is committed unless every step succeeds.
     *
     * SADDLE_MANAGER_ROLE may add any pool, COMMUNITY_MANAGER_ROLE
     * only unapproved ones.
     *
     * @return index of the new record
     */
    std::size_t add_pool(const address_t &caller, const PoolInputData &input);

    /**
     * @brief flag a pool as approved. Its engine owner must hold
     *        SADDLE_APPROVED_POOL_OWNER_ROLE.
     */
    void approve_pool(const address_t &caller, const address_t &poolAddress);

    /**
     * @brief overwrite a record in place. The pair index is not touched.
     *
     * The isRemoved flag must match the stored one: removal goes through remove_pool().
     */
    void update_pool(const address_t &caller, const PoolData &record);

    /**
     * @brief soft delete. @see RegistryConfig::purge_removed_pools
     */
    void remove_pool(const address_t &caller, const address_t &poolAddress);


    PoolData get_pool_data(const address_t &poolAddress) const;
    PoolData get_pool_data_at_index(std::size_t index) const;
    PoolData get_pool_data_by_name(const std::string &name) const;
    std::vector<PoolData> get_all_pool_data() const;
    std::size_t get_pools_length() const;

    address_list_t get_tokens(const address_t &poolAddress) const;
    address_list_t get_underlying_tokens(const address_t &poolAddress) const;

    /**
     * @brief venues (pools or deposit wrappers) able to swap @p from against @p to
     *
     * Symmetric in its arguments.
     * @throws InvalidPair if @p from is null or equal to @p to
     */
    address_list_t get_eligible_pools(const address_t &from, const address_t &to) const;

    /**
     * @brief live balance of every token of the pool, in token order
     */
    model::TokenBalances get_token_balances(const address_t &poolAddress) const;

    /**
     * @brief live balances in terms of underlying tokens
     *
     * For meta pools, the share of base pool balances held through the
     * base LP token replaces the LP token itself. Other pools answer
     * like get_token_balances().
     */
    model::TokenBalances get_underlying_token_balances(const address_t &poolAddress) const;

    balance_t get_virtual_price(const address_t &poolAddress) const;
    balance_t get_a(const address_t &poolAddress) const;
    bool get_paused(const address_t &poolAddress) const;
    balance_t get_swap_fee(const address_t &poolAddress) const;
    balance_t get_admin_fee(const address_t &poolAddress) const;
    model::SwapStorage get_swap_storage(const address_t &poolAddress) const;

    const model::RegistryConfig &config() const { return m_config; }
    void set_listener(RegistryListener *listener);

private:
    struct PendingPair {
        address_t a;
        address_t b;
        address_t venue;
    };
    typedef std::vector<PendingPair> pending_pairs_t;

    void m_check_can_add(const address_t &caller, const PoolInputData &input) const;
    void m_check_name(const std::string &name) const;
    void m_expand_wrapper(PoolData &record, pending_pairs_t &pairs) const;
    const PoolData &m_lookup(const address_t &poolAddress) const;
    const model::SwapEngine &m_engine_of(const PoolData &record) const;
    model::TokenBalances m_token_balances(const PoolData &record) const;

    template<typename Fn> void m_notify(const char *event, Fn &&fn) const;

    const model::ContractDirectory &m_directory;
    model::RegistryConfig m_config;
    std::vector<PoolData> m_records;
    PoolLocatorIndex m_locators;
    PairIndex m_pairs;
    RegistryListener *m_listener = nullptr;

    mutable std::recursive_mutex m_update_mutex;
    typedef std::lock_guard<std::recursive_mutex> lock_guard_t;
    bool m_write_in_progress = false;
};


} // namespace registry
} // namespace poolreg
