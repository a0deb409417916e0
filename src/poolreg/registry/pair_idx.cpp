#include "pair_idx.hpp"
#include <boost/tuple/tuple.hpp>
#include <algorithm>

namespace poolreg {
namespace registry {


PairKey PairKey::make(const address_t &a
                      , const address_t &b
                      , model::PairKeyScheme_e scheme)
{
    PairKey res;
    switch (scheme) {
    case model::PAIR_KEY_XOR:
        res.lo = address_t(address_t::base_type(model::as_base(a) ^ model::as_base(b)));
        break;
    case model::PAIR_KEY_ORDERED:
    default:
        if (b < a)
        {
            res.lo = b;
            res.hi = a;
        }
        else
        {
            res.lo = a;
            res.hi = b;
        }
        break;
    }
    return res;
}


PairIndex::PairIndex(model::PairKeyScheme_e scheme)
    : m_scheme(scheme)
{ }

PairKey PairIndex::key(const address_t &a, const address_t &b) const
{
    return PairKey::make(a, b, m_scheme);
}

bool PairIndex::add(const address_t &a
                    , const address_t &b
                    , const address_t &venue
                    , std::size_t origin)
{
    auto k = key(a, b);
    auto &idx = get<by_pair_and_venue>();
    if (idx.find(boost::make_tuple(k.lo, k.hi, venue, origin)) != idx.end())
    {
        return false;
    }
    return emplace(PairVenue{k.lo, k.hi, venue, origin, m_seq++}).second;
}

address_list_t PairIndex::venues(const address_t &a, const address_t &b) const
{
    auto k = key(a, b);
    auto &idx = get<by_pair>();
    auto range = idx.equal_range(boost::make_tuple(k.lo, k.hi));

    address_list_t res;
    for (auto i = range.first; i != range.second; ++i)
    {
        // a venue shows up twice only if two pool records share it
        if (std::find(res.begin(), res.end(), i->venue) == res.end())
        {
            res.emplace_back(i->venue);
        }
    }
    return res;
}

std::size_t PairIndex::withdraw(std::size_t origin)
{
    return get<by_origin>().erase(origin);
}


} // namespace registry
} // namespace poolreg
