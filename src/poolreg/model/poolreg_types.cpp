#include "poolreg_types.hpp"
#include <sstream>
#include <iomanip>
#include <cctype>
#include <cstring>
#include <stdexcept>

namespace poolreg {
namespace model {

/**
 * @brief pass through a well formed 0x hexstring of at most 160 bits, throw otherwise
 */
static const char *checked_hexstring(const char *hexstring)
{
    if (hexstring == nullptr)
    {
        throw std::invalid_argument("address: null hexstring");
    }
    if (hexstring[0] != '0' || (hexstring[1] != 'x' && hexstring[1] != 'X'))
    {
        throw std::invalid_argument(std::string("address: missing 0x prefix: ") + hexstring);
    }
    const char *digits = hexstring + 2;
    const std::size_t len = std::strlen(digits);
    if (len == 0 || len > address_t::nibs)
    {
        throw std::invalid_argument(std::string("address: expected 1 to 40 hex digits: ") + hexstring);
    }
    for (const char *c = digits; *c != 0; ++c)
    {
        if (!std::isxdigit(static_cast<unsigned char>(*c)))
        {
            throw std::invalid_argument(std::string("address: not a hexstring: ") + hexstring);
        }
    }
    return hexstring;
}

address_t::address_t() : bignum::uint160_t(0) {}
address_t::address_t(const char *hexstring) : bignum::uint160_t(checked_hexstring(hexstring)) {}
address_t::address_t(const std::string &hexstring) : bignum::uint160_t(checked_hexstring(hexstring.c_str())) {}
address_t::address_t(const base_type &value) : bignum::uint160_t(value) {}


bool address_t::is_null() const
{
    return as_base(*this) == 0;
}

std::string address_t::str() const
{
    std::stringstream ss;
    ss << *this;
    return ss.str();
}


std::ostream& operator<< (std::ostream& stream, const address_t& o)
{
    std::stringstream ss;
    ss
            << std::hex
            << std::noshowbase
            << std::setfill('0')
            << std::setw(address_t::nibs)
            << as_base(o);

    // lowercase hex, no EIP-55 mixed-case checksum
    std::string digits = ss.str();
    for (auto &c: digits)
    {
        if (c >= 'A' && c <= 'F') c = static_cast<char>(c - 'A' + 'a');
    }
    stream << "0x" << digits;
    return stream;
}


} // namespace model
} // namespace poolreg
