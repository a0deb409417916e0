#pragma once

#include "poolreg_model_fwd.hpp"

namespace poolreg {
namespace model {

/**
 * @brief hard cap on the number of tokens a pool, or its wrapper, can expose
 */
constexpr unsigned MAX_POOL_TOKENS = 8;

/**
 * @brief names are stored on chain as bytes32
 */
constexpr unsigned MAX_NAME_LENGTH = 32;


/**
 * @brief how an unordered pair of tokens is turned into an index key
 */
typedef enum {
    PAIR_KEY_ORDERED,   ///< (min, max) of the two addresses. Injective.
    PAIR_KEY_XOR,       ///< a ^ b. Bit compatible with the on-chain index, may collide.
} PairKeyScheme_e;


/**
 * @brief Registry tunables
 *
 * @note using a struct because they can add up quickly,
 *       and I don't want to pass them as a bunch of individual parameters.
 */
struct RegistryConfig {
    /**
     * @brief max_tokens
     *
     * Token discovery stops at this position even if the
     * swap engine would answer further probes. Applies to
     * both pool tokens and wrapper (underlying) tokens.
     *
     * @default MAX_POOL_TOKENS (8), which is also the upper limit
     */
    unsigned int max_tokens = MAX_POOL_TOKENS;

    /**
     * @brief max_name_length
     *
     * Longest accepted pool or registry name, in bytes.
     *
     * @default MAX_NAME_LENGTH (32)
     */
    unsigned int max_name_length = MAX_NAME_LENGTH;

    /**
     * @brief pair_key_scheme
     *
     * @default PAIR_KEY_ORDERED
     */
    PairKeyScheme_e pair_key_scheme = PAIR_KEY_ORDERED;

    /**
     * @brief purge_removed_pools
     *
     * When set, remove_pool() drops the removed pool from the address
     * and name lookups (the address can be registered again) and withdraws
     * the eligible pairs it contributed. The record itself stays
     * reachable by index.
     *
     * When clear, remove_pool() only flags the record.
     *
     * @default true
     */
    bool purge_removed_pools = true;

    void check_consistency() const;
};


} // namespace model
} // namespace poolreg
