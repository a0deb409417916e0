/**
 * @file pair_idx.hpp
 * @brief Lookup index of eligible venues per unordered token pair
 *
 * The machinery implemented here is based around boost::multi_index.
 * Each entry ties a token pair to one venue (a pool or deposit wrapper
 * address) through which the pair can be swapped, and remembers which
 * pool record contributed it.
 *
 * Entries can be looked up:
 *
 *  - by_pair, in insertion order (lookup by the two key halves of the composite key)
 *  - by_pair_and_venue, to refuse duplicates in O(1)
 *  - by_origin, to withdraw everything a pool record contributed
 */

#pragma once

#include "../model/poolreg_types.hpp"
#include "../model/poolreg_config.hpp"
#include <boost/multi_index_container.hpp>
#include <boost/multi_index/hashed_index.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index/composite_key.hpp>
#include <boost/multi_index/member.hpp>


namespace poolreg {
namespace registry {

using namespace boost::multi_index;
using model::address_t;
using model::address_list_t;


/**
 * @brief Index key of an unordered token pair.
 *
 * make(a, b) == make(b, a) for every scheme.
 */
struct PairKey
{
    address_t lo;
    address_t hi;

    static PairKey make(const address_t &a
                        , const address_t &b
                        , model::PairKeyScheme_e scheme);
};


struct PairVenue
{
    address_t   lo;         ///< PairKey::lo
    address_t   hi;         ///< PairKey::hi
    address_t   venue;
    std::size_t origin;     ///< index of the contributing pool record
    std::size_t seq;        ///< insertion order
};


/**
 * @defgroup pair_indexes Available indexing (and lookup) strategies
 * @{
 */
struct by_pair {};
struct by_pair_and_venue {};
struct by_origin {};
/** @} */


typedef multi_index_container<
  PairVenue,
  indexed_by<
          // ordered, so that a partial (lo, hi) lookup returns venues by seq
          ordered_unique<    tag<by_pair>,  composite_key<PairVenue,
                 member<PairVenue, address_t  , &PairVenue::lo>
               , member<PairVenue, address_t  , &PairVenue::hi>
               , member<PairVenue, std::size_t, &PairVenue::seq>            >
          >
        , hashed_unique<     tag<by_pair_and_venue>,  composite_key<PairVenue,
                 member<PairVenue, address_t  , &PairVenue::lo>
               , member<PairVenue, address_t  , &PairVenue::hi>
               , member<PairVenue, address_t  , &PairVenue::venue>
               , member<PairVenue, std::size_t, &PairVenue::origin>         >
          >
        , hashed_non_unique< tag<by_origin>, member<PairVenue, std::size_t, &PairVenue::origin> >
  >
> PairIndex_base;


/**
 * @brief Public PairIndex type
 */
struct PairIndex: PairIndex_base
{
    explicit PairIndex(model::PairKeyScheme_e scheme = model::PAIR_KEY_ORDERED);

    PairKey key(const address_t &a, const address_t &b) const;

    /**
     * @brief record @p venue as eligible for swapping @p a against @p b
     * @return false if the very same entry was already there
     */
    bool add(const address_t &a
             , const address_t &b
             , const address_t &venue
             , std::size_t origin);

    /**
     * @brief eligible venues for the pair, in registration order, no duplicates
     */
    address_list_t venues(const address_t &a, const address_t &b) const;

    /**
     * @brief drop every entry contributed by pool record @p origin
     * @return number of dropped entries
     */
    std::size_t withdraw(std::size_t origin);

    model::PairKeyScheme_e scheme() const { return m_scheme; }

private:
    model::PairKeyScheme_e m_scheme;
    std::size_t m_seq = 0;
};


} // namespace registry
} // namespace poolreg
