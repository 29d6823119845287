#include "ammr_pool.hpp"

namespace ammr {
namespace model {


bool PoolSettings::allows(bool sellToken0) const noexcept
{
    switch (tradeState) {
    case TRADE_SELL_ALL:            return true;
    case TRADE_SELL_TOKEN0_ONLY:    return sellToken0;
    case TRADE_SELL_TOKEN1_ONLY:    return !sellToken0;
    case TRADE_SELL_NONE:           return false;
    }
    return false;
}

void PoolSettings::check_consistency() const
{
    if (feeBP >= FEE_DENOMINATOR)
    {
        throw SettingsConsistencyError(strfmt("fee must be < %1% basis points", FEE_DENOMINATOR));
    }
    if (boost0 < 1 || boost1 < 1)
    {
        throw SettingsConsistencyError("boost coefficients must be >= 1");
    }
    switch (tradeState) {
    case TRADE_SELL_ALL:
    case TRADE_SELL_TOKEN0_ONLY:
    case TRADE_SELL_TOKEN1_ONLY:
    case TRADE_SELL_NONE:
        break;
    default:
        throw SettingsConsistencyError("unknown trade state");
    }
}


Outcome<std::pair<address_t, address_t>> canonicalize(const address_t &tokenA
                                                      , const address_t &tokenB)
{
    if (tokenA == tokenB)
    {
        return RC_IDENTICAL_ADDRESSES;
    }
    if (tokenA.is_zero() || tokenB.is_zero())
    {
        return RC_ZERO_ADDRESS;
    }
    return tokenA < tokenB
            ? std::make_pair(tokenA, tokenB)
            : std::make_pair(tokenB, tokenA);
}


} // namespace model
} // namespace ammr
