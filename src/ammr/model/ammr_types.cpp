#include "ammr_types.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/functional/hash.hpp>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace ammr {
namespace model {


static std::string m_checked_hexstring(const std::string &s)
{
    if (!boost::algorithm::istarts_with(s, "0x"))
    {
        throw AddressFormatError(strfmt("address must start with 0x: \"%1%\"", s));
    }
    const auto digits = s.substr(2);
    if (digits.empty() || digits.size() > address_t::nibs)
    {
        throw AddressFormatError(strfmt("bad address length: \"%1%\"", s));
    }
    if (!boost::algorithm::all(digits, boost::algorithm::is_xdigit()))
    {
        throw AddressFormatError(strfmt("not a hexstring: \"%1%\"", s));
    }
    return s;
}


address_t::address_t() : bignum::uint160_t(0) {}
address_t::address_t(const base_type &v) : bignum::uint160_t(v) {}
address_t::address_t(const char *hexstring)
    : bignum::uint160_t(m_checked_hexstring(hexstring))
{}
address_t::address_t(const std::string &hexstring)
    : bignum::uint160_t(m_checked_hexstring(hexstring))
{}

bool address_t::is_zero() const noexcept
{
    return reinterpret_cast<const base_type &>(*this) == 0;
}

std::string address_t::str() const
{
    std::stringstream ss;
    ss << *this;
    return ss.str();
}


std::size_t hash_value(const address_t &a)
{
    std::size_t h = 0U;
    boost::hash_combine(h, reinterpret_cast<const address_t::base_type &>(a));
    return h;
}


std::ostream& operator<< (std::ostream& stream, const address_t& o)
{
    std::stringstream ss;
    ss
            << std::hex
            << std::noshowbase
            << std::setfill('0')
            << std::setw(address_t::nibs)
            << reinterpret_cast<const address_t::base_type &>(o);
    auto txt = ss.str();
    for (auto &c: txt) c = static_cast<char>(std::tolower(c));
    stream << "0x" << txt;
    return stream;
}


bool fits_balance(const wide_t &v)
{
    static const wide_t max_balance = wide_t(~balance_t(0));
    return v <= max_balance;
}


balance_t parse_balance(const std::string &literal)
{
    // cpp_int's own parser wraps negatives around, reads a leading 0 as
    // octal and drops overflowing digits: screen the literal first
    const bool hex = boost::algorithm::istarts_with(literal, "0x");
    auto digits = hex ? literal.substr(2) : literal;
    const bool valid = !digits.empty() && (hex
            ? digits.size() <= 64 && boost::algorithm::all(digits, boost::algorithm::is_xdigit())
            : digits.size() <= 78 && boost::algorithm::all(digits, boost::algorithm::is_digit()));
    if (!valid)
    {
        throw bad_argument(strfmt("not an unsigned 256 bit integer: \"%1%\"", literal));
    }
    if (hex)
    {
        return balance_t(literal);
    }
    const auto first = digits.find_first_not_of('0');
    if (first == std::string::npos)
    {
        return 0;
    }
    const wide_t v(digits.substr(first));
    if (!fits_balance(v))
    {
        throw bad_argument(strfmt("not an unsigned 256 bit integer: \"%1%\"", literal));
    }
    return balance_t(v);
}


} // namespace model
} // namespace ammr
