#pragma once

#include "../model/poolreg_model.hpp"

namespace poolreg {
namespace registry {

/**
 * @brief Observer of committed registry writes.
 *
 * Callbacks run after the write is committed, under the registry lock:
 * they must not write into the registry they are observing.
 * Default implementations do nothing.
 */
struct RegistryListener
{
    virtual ~RegistryListener() {}

    virtual void pool_added(const model::address_t &/*poolAddress*/
                            , std::size_t /*index*/
                            , const model::PoolData &/*record*/) {}
    virtual void pool_approved(const model::address_t &/*poolAddress*/) {}
    virtual void pool_updated(const model::PoolData &/*record*/) {}
    virtual void pool_removed(const model::address_t &/*poolAddress*/) {}
    virtual void registry_added(const std::string &/*name*/
                                , const model::address_t &/*address*/
                                , std::size_t /*version*/) {}
};

} // namespace registry
} // namespace poolreg
