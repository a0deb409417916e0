/**
 * @file pool_idx.hpp
 * @brief Address and name lookups over the pool record sequence
 *
 * Records themselves live in a plain vector and never move: the index
 * of a record is its identity. This container only maps active
 * addresses and names to that index, so that a record can leave the
 * lookups (soft delete) and stay in the sequence.
 */

#pragma once

#include "../model/poolreg_types.hpp"
#include <boost/multi_index_container.hpp>
#include <boost/multi_index/hashed_index.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index/member.hpp>
#include <string>


namespace poolreg {
namespace registry {

using namespace boost::multi_index;


struct PoolLocator
{
    model::address_t address;
    std::string      name;
    std::size_t      position;
};


/**
 * @defgroup pool_indexes Available indexing (and lookup) strategies
 * @{
 */
struct by_address {};
struct by_name {};
struct by_position {};
/** @} */


typedef multi_index_container<
  PoolLocator,
  indexed_by<
          hashed_unique<  tag<by_address> , member<PoolLocator, model::address_t, &PoolLocator::address > >
        , hashed_unique<  tag<by_name>    , member<PoolLocator, std::string     , &PoolLocator::name    > >
        , ordered_unique< tag<by_position>, member<PoolLocator, std::size_t     , &PoolLocator::position> >
  >
> PoolLocatorIndex_base;


/**
 * @brief Public PoolLocatorIndex type
 */
struct PoolLocatorIndex: PoolLocatorIndex_base
{
    using PoolLocatorIndex_base::PoolLocatorIndex_base;

    /**
     * @brief lookup record position by address
     * @return matching locator or null
     */
    const PoolLocator *lookup(const model::address_t &address) const noexcept
    {
        auto &idx = get<by_address>();
        auto i = idx.find(address);
        return i == idx.end() ? nullptr : &(*i);
    }

    /**
     * @brief lookup record position by name
     * @return matching locator or null
     */
    const PoolLocator *lookup_name(const std::string &name) const noexcept
    {
        auto &idx = get<by_name>();
        auto i = idx.find(name);
        return i == idx.end() ? nullptr : &(*i);
    }
};


} // namespace registry
} // namespace poolreg
