#pragma once

#include "poolreg_model_fwd.hpp"
#include <vector>
#include <boost/multiprecision/cpp_int.hpp>
#include <ostream>
#include <functional>


namespace poolreg {
namespace model {

namespace bignum {

using namespace boost::multiprecision;
using uint256_t = boost::multiprecision::uint256_t;
using uint160_t = number<cpp_int_backend<160, 160, unsigned_magnitude, unchecked, void> >;

}

/**
 * @brief Balance of any given token, or any other on-chain quantity
 *        (fees, amplification, virtual price).
 */
typedef bignum::uint256_t balance_t;


/**
 * @brief Blockchain addresses are stored in 160 bit wide uints
 *
 * This type is constructible by string. It parses the
 * widespread Ethereum address hexstring format 0xhhhhhhhhhhhhh.
 * The string constructors throw std::invalid_argument unless given a 0x
 * prefixed hexstring of 1 to 40 digits.
 *
 * The default constructed value is the null address, which is never a
 * valid pool, token or registry entry.
 *
 * This thing is indexable, does not make use of heap memory and
 * it's copy constructible.
 */
struct address_t: bignum::uint160_t
{
    typedef bignum::uint160_t base_type;
    static constexpr unsigned size_bits = 160;
    static constexpr unsigned nibs = size_bits / 4;
    address_t();
    address_t(const char *hexstring);        ///< constructible via 0x... hexstring
    address_t(const std::string &hexstring);
    explicit address_t(const base_type &value);

    bool is_null() const;
    std::string str() const;
};

inline const address_t::base_type &as_base(const address_t &a)
{
    return static_cast<const address_t::base_type &>(a);
}

inline bool operator==(const address_t &a, const address_t &b)
{
    return as_base(a) == as_base(b);
}

inline bool operator!=(const address_t &a, const address_t &b)
{
    return !(a == b);
}

inline bool operator<(const address_t &a, const address_t &b)
{
    return as_base(a) < as_base(b);
}

/**
 * @brief Boost.Hash support, found by ADL from boost::hash and multi_index
 */
inline std::size_t hash_value(const address_t &a)
{
    return boost::multiprecision::hash_value(as_base(a));
}

std::ostream& operator<< (std::ostream& stream, const address_t& o);

typedef std::vector<address_t> address_list_t;

/**
 * @brief opaque, administrator supplied key attached to pool records
 */
typedef unsigned long int datatag_t;

} // namespace model
} // namespace poolreg


namespace std {
template<> struct hash<poolreg::model::address_t>
{
    std::size_t operator()(const poolreg::model::address_t &a) const noexcept
    {
        return poolreg::model::hash_value(a);
    }
};
} // namespace std
