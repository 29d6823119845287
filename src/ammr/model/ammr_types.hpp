#pragma once

#include "../commons/ammr_common.hpp"
#include "ammr_model_fwd.hpp"
#include <vector>
#include <boost/multiprecision/cpp_int.hpp>
#include <ostream>


namespace ammr {
namespace model {

namespace bignum {

using namespace boost::multiprecision;
using uint256_t = boost::multiprecision::uint256_t;
using uint512_t = boost::multiprecision::uint512_t;
using uint1024_t = boost::multiprecision::uint1024_t;
using uint160_t = number<cpp_int_backend<160, 160, unsigned_magnitude, unchecked, void> >;

}

/**
 * @brief Balance of any given token, in its smallest unit
 */
typedef bignum::uint256_t balance_t;

/**
 * @brief Room for the intermediate products of the pricing formulas.
 *
 * Boosted curves multiply balances by fee denominators, boosts and
 * then square the result, which overflows 512 bits for extreme
 * balances. Results are narrowed back to balance_t only after
 * checking with fits_balance().
 */
typedef bignum::uint1024_t wide_t;

/**
 * @brief Seconds since epoch, as reported by the ledger clock
 */
typedef std::uint64_t timestamp_t;

struct AddressFormatError: std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/**
 * @brief Ledger addresses are stored in 160 bit wide uints
 *
 * This type is constructible by string. It parses the
 * widespread Ethereum address hexstring format 0xhhhhhhhhhhhhh.
 * Tokens, pools, accounts and the router itself are all addressed this way.
 *
 * This thing is indexable, does not make use of heap memory and
 * it's copy constructible.
 */
struct address_t: bignum::uint160_t
{
    typedef bignum::uint160_t base_type;
    static constexpr unsigned size_bits = 160;
    static constexpr unsigned nibs = size_bits / 4;
    using bignum::uint160_t::uint160_t;
    address_t();
    address_t(const base_type &v);
    address_t(const char *hexstring);        ///< constructible via 0x... hexstring
    address_t(const std::string &hexstring);

    bool is_zero() const noexcept;
    std::string str() const;
};

inline bool operator==(const address_t &a, const address_t &b)
{
    return reinterpret_cast<const address_t::base_type &>(a) ==
            reinterpret_cast<const address_t::base_type &>(b);
}

inline bool operator!=(const address_t &a, const address_t &b)
{
    return !(a == b);
}

inline bool operator<(const address_t &a, const address_t &b)
{
    return reinterpret_cast<const address_t::base_type &>(a) <
            reinterpret_cast<const address_t::base_type &>(b);
}

std::size_t hash_value(const address_t &a);

std::ostream& operator<< (std::ostream& stream, const address_t& o);


/**
 * @brief ordered sequence of tokens a swap walks through
 */
typedef std::vector<address_t> TokenPath;

/**
 * @brief one amount per path token.
 *
 * Element i flows into hop i, element i+1 is what hop i produces.
 */
typedef std::vector<balance_t> AmountVector;

/**
 * @brief a pair of amounts, in the order the caller named the tokens
 */
struct TokenAmounts
{
    balance_t amountA = 0;
    balance_t amountB = 0;
};

/**
 * @brief true if @p v can be narrowed to balance_t without loss
 */
bool fits_balance(const wide_t &v);

/**
 * @brief parse a decimal (or 0x-prefixed hex) literal into a balance_t
 */
balance_t parse_balance(const std::string &literal);

} // namespace model
} // namespace ammr


namespace std {

template<> struct hash<ammr::model::address_t>
{
    std::size_t operator()(const ammr::model::address_t &a) const
    {
        return ammr::model::hash_value(a);
    }
};

} // namespace std
