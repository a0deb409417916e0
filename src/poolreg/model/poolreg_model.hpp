/**
 * @file poolreg_model.hpp
 * @brief Records handled by the registries.
 *
 * This includes:
 *
 *  - PoolInputData, what an administrator submits
 *  - PoolData, what the pool registry stores
 *  - SwapStorage / GuardedSwapStorage, aggregate swap engine parameters
 *  - TokenBalances
 *  - RegistryData, reverse lookup result of the master registry
 */

#pragma once

#include "poolreg_model_fwd.hpp"
#include "poolreg_types.hpp"
#include <ostream>
#include <string>
#include <cstdint>


namespace poolreg {
namespace model {

using std::string;

/**
 * @brief Peg category of a pool.
 */
typedef enum {
    ASSET_BTC,
    ASSET_ETH,
    ASSET_USD,
    ASSET_OTHER,
} AssetClass_e;

const char *asset_class_name(AssetClass_e c);


/**
 * @brief Registration request for a pool.
 *
 * Tokens, underlying tokens, LP token and base pool are not part of
 * the request: the registry discovers them.
 */
struct PoolInputData
{
    address_t    poolAddress;
    AssetClass_e assetClass = ASSET_OTHER;
    string       name;
    address_t    targetAddress;          ///< swap engine implementing the pool. null means poolAddress
    address_t    depositWrapperAddress;  ///< optional deposit wrapper (meta pools only)
    datatag_t    externalId = 0;
    bool         isApproved = false;
    bool         isRemoved = false;
};


/**
 * @brief Pool record, as stored by the pool registry.
 */
struct PoolData
{
    address_t      poolAddress;
    address_t      lpToken;
    AssetClass_e   assetClass = ASSET_OTHER;
    string         name;
    address_t      targetAddress;
    address_list_t tokens;
    address_list_t underlyingTokens;
    address_t      basePoolAddress;
    address_t      depositWrapperAddress;
    datatag_t      externalId = 0;
    bool           isApproved = false;
    bool           isRemoved = false;

    bool has_wrapper() const { return !depositWrapperAddress.is_null(); }
    bool operator==(const PoolData &o) const;
    bool operator!=(const PoolData &o) const { return !(*this == o); }
};

std::ostream& operator<< (std::ostream& stream, const PoolData& o);


/**
 * @brief Aggregate swap engine parameters, primary shape.
 */
struct SwapStorage
{
    balance_t     initialA = 0;
    balance_t     futureA = 0;
    std::uint64_t initialATime = 0;
    std::uint64_t futureATime = 0;
    balance_t     swapFee = 0;
    balance_t     adminFee = 0;
    address_t     lpToken;
};


/**
 * @brief Aggregate swap engine parameters as exposed by guarded engines.
 *
 * Same as SwapStorage, without the admin fee.
 */
struct GuardedSwapStorage
{
    balance_t     initialA = 0;
    balance_t     futureA = 0;
    std::uint64_t initialATime = 0;
    std::uint64_t futureATime = 0;
    balance_t     swapFee = 0;
    address_t     lpToken;

    /**
     * @brief normalizes to the primary shape. adminFee is reported as 0
     */
    SwapStorage as_swap_storage() const;
};


struct TokenBalances
{
    address_list_t         tokens;
    std::vector<balance_t> balances;
};


/**
 * @brief where an address sits in the master registry
 */
struct RegistryData
{
    string      name;
    std::size_t version = 0;
    bool        isLatest = false;

    bool operator==(const RegistryData &o) const
    {
        return name == o.name && version == o.version && isLatest == o.isLatest;
    }
};


} // namespace model
} // namespace poolreg
