#include "ammr_invariant.hpp"
#include <algorithm>

namespace ammr {
namespace model {
namespace amm {


static const wide_t D = FEE_DENOMINATOR;


static Outcome<balance_t> narrowed(const wide_t &v)
{
    if (!fits_balance(v))
    {
        return RC_ARITHMETIC_OVERFLOW;
    }
    return balance_t(v);
}


/**
 * Take it away from https://github.com/Uniswap/v2-periphery/blob/87edfdcaf49ccc52591502993db4c8c08ea9eec0/contracts/libraries/UniswapV2Library.sol#L42
 */
Outcome<balance_t> ConstantProductInvariant::getAmountOut(const balance_t &amountIn
                                                          , const balance_t &reserveIn
                                                          , const balance_t &reserveOut
                                                          , const PoolSettings &settings
                                                          , bool) const
{
    if (amountIn == 0)
    {
        return RC_INSUFFICIENT_INPUT_AMOUNT;
    }
    if (reserveIn == 0 || reserveOut == 0)
    {
        return RC_INSUFFICIENT_LIQUIDITY;
    }

    const wide_t amountInWithFee = wide_t(amountIn) * (FEE_DENOMINATOR - settings.feeBP);
    const wide_t numerator = amountInWithFee * wide_t(reserveOut);
    const wide_t denominator = wide_t(reserveIn) * D + amountInWithFee;
    return narrowed(numerator / denominator);
}

Outcome<balance_t> ConstantProductInvariant::getAmountIn(const balance_t &amountOut
                                                         , const balance_t &reserveIn
                                                         , const balance_t &reserveOut
                                                         , const PoolSettings &settings
                                                         , bool) const
{
    if (amountOut == 0)
    {
        return RC_INSUFFICIENT_OUTPUT_AMOUNT;
    }
    if (reserveIn == 0 || reserveOut == 0 || amountOut >= reserveOut)
    {
        return RC_INSUFFICIENT_LIQUIDITY;
    }

    const wide_t numerator = wide_t(reserveIn) * wide_t(amountOut) * D;
    const wide_t denominator = (wide_t(reserveOut) - wide_t(amountOut)) * (FEE_DENOMINATOR - settings.feeBP);
    return narrowed(numerator / denominator + 1);
}

bool ConstantProductInvariant::accepts(const Reserves &before
                                       , const wide_t &balance0Adjusted
                                       , const wide_t &balance1Adjusted
                                       , const PoolSettings &) const
{
    return balance0Adjusted * balance1Adjusted >=
            wide_t(before.reserve0) * wide_t(before.reserve1) * D * D;
}


wide_t BoostedInvariant::sqrtK(unsigned boost0
                               , unsigned boost1
                               , const wide_t &balance0
                               , const wide_t &balance1)
{
    const wide_t boost = (balance0 > balance1 ? boost0 : boost1) - 1;
    const wide_t denom = boost * 2 + 1;
    const wide_t term = boost * (balance0 + balance1) / (denom * 2);
    const wide_t radicand = term * term + balance0 * balance1 / denom;
    return boost::multiprecision::sqrt(radicand) + term;
}

Outcome<balance_t> BoostedInvariant::getAmountOut(const balance_t &amountIn
                                                  , const balance_t &reserveIn
                                                  , const balance_t &reserveOut
                                                  , const PoolSettings &settings
                                                  , bool sellToken0) const
{
    if (amountIn == 0)
    {
        return RC_INSUFFICIENT_INPUT_AMOUNT;
    }
    if (reserveIn == 0 && reserveOut == 0)
    {
        return RC_INSUFFICIENT_LIQUIDITY;
    }

    wide_t rIn = reserveIn;
    wide_t rOut = reserveOut;
    wide_t amountInWithFee = wide_t(amountIn) * (FEE_DENOMINATOR - settings.feeBP);
    wide_t firstLeg = 0;

    const wide_t s = sqrtK(settings.boost0
                           , settings.boost1
                           , sellToken0 ? rIn : rOut
                           , sellToken0 ? rOut : rIn);
    const unsigned boostIn = sellToken0 ? settings.boost0 : settings.boost1;
    const unsigned boostOut = sellToken0 ? settings.boost1 : settings.boost0;

    wide_t artificial;
    if (amountInWithFee + rIn * D >= s * D)
    {
        // the input side ends above the balanced point
        artificial = wide_t(boostIn - 1) * s;
        if (rIn < s && rOut > s && settings.boost0 != settings.boost1)
        {
            // first leg walks the output side's curve down to (s, s)
            firstLeg = rOut - s;
            amountInWithFee -= (s - rIn) * D;
            rIn = s;
            rOut = s;
        }
    }
    else
    {
        artificial = wide_t(boostOut - 1) * s;
    }

    const wide_t numerator = amountInWithFee * (rOut + artificial);
    const wide_t denominator = (rIn + artificial) * D + amountInWithFee;
    const wide_t lastLeg = numerator / denominator;
    // artificial liquidity is not withdrawable
    return narrowed((lastLeg > rOut ? rOut : lastLeg) + firstLeg);
}

Outcome<balance_t> BoostedInvariant::getAmountIn(const balance_t &amountOut
                                                 , const balance_t &reserveIn
                                                 , const balance_t &reserveOut
                                                 , const PoolSettings &settings
                                                 , bool sellToken0) const
{
    if (amountOut == 0)
    {
        return RC_INSUFFICIENT_OUTPUT_AMOUNT;
    }
    if (amountOut > reserveOut)
    {
        return RC_INSUFFICIENT_LIQUIDITY;
    }

    wide_t rIn = reserveIn;
    wide_t rOut = reserveOut;
    wide_t out = amountOut;
    wide_t firstLeg = 0;

    const wide_t s = sqrtK(settings.boost0
                           , settings.boost1
                           , sellToken0 ? rIn : rOut
                           , sellToken0 ? rOut : rIn);
    const unsigned boostIn = sellToken0 ? settings.boost0 : settings.boost1;
    const unsigned boostOut = sellToken0 ? settings.boost1 : settings.boost0;

    wide_t artificial;
    if (rOut - out >= s)
    {
        // the output side stays above the balanced point
        artificial = wide_t(boostOut - 1) * s;
    }
    else
    {
        artificial = wide_t(boostIn - 1) * s;
        if (rOut > s && rIn < s && settings.boost0 != settings.boost1)
        {
            // input needed to bring the pool to (s, s) first
            firstLeg = (s - rIn) * D;
            out -= rOut - s;
            rIn = s;
            rOut = s;
        }
    }

    const wide_t denominator = rOut + artificial - out;
    if (denominator == 0)
    {
        return RC_INSUFFICIENT_LIQUIDITY;
    }
    const wide_t numerator = (rIn + artificial) * out * D;
    return narrowed((firstLeg + numerator / denominator) / (FEE_DENOMINATOR - settings.feeBP) + 1);
}

bool BoostedInvariant::accepts(const Reserves &before
                               , const wide_t &balance0Adjusted
                               , const wide_t &balance1Adjusted
                               , const PoolSettings &settings) const
{
    const wide_t s = sqrtK(settings.boost0
                           , settings.boost1
                           , before.reserve0
                           , before.reserve1) * D;

    // below s on both sides no boost can satisfy the curve, boost0 is as good as any
    const unsigned boost = balance1Adjusted > s && !(balance0Adjusted > s)
            ? settings.boost1
            : settings.boost0;
    const wide_t artificial = wide_t(boost - 1) * s;
    const wide_t k = wide_t(boost) * s;
    return (balance0Adjusted + artificial) * (balance1Adjusted + artificial) >= k * k;
}


const Invariant &invariant_for(const PoolSettings &settings)
{
    static const ConstantProductInvariant xyk;
    static const BoostedInvariant xybk;
    if (settings.isXybk())
    {
        return xybk;
    }
    return xyk;
}

Outcome<balance_t> getAmountOut(const balance_t &amountIn
                                , const balance_t &reserveIn
                                , const balance_t &reserveOut
                                , const PoolSettings &settings
                                , bool sellToken0)
{
    if (amountIn == 0)
    {
        return RC_INSUFFICIENT_INPUT_AMOUNT;
    }
    if (!settings.allows(sellToken0))
    {
        return RC_TRADE_NOT_ALLOWED;
    }
    return invariant_for(settings).getAmountOut(amountIn
                                                , reserveIn
                                                , reserveOut
                                                , settings
                                                , sellToken0);
}

Outcome<balance_t> getAmountIn(const balance_t &amountOut
                               , const balance_t &reserveIn
                               , const balance_t &reserveOut
                               , const PoolSettings &settings
                               , bool sellToken0)
{
    if (amountOut == 0)
    {
        return RC_INSUFFICIENT_OUTPUT_AMOUNT;
    }
    if (!settings.allows(sellToken0))
    {
        return RC_TRADE_NOT_ALLOWED;
    }
    return invariant_for(settings).getAmountIn(amountOut
                                               , reserveIn
                                               , reserveOut
                                               , settings
                                               , sellToken0);
}

/**
 * Take it away from https://github.com/Uniswap/v2-periphery/blob/87edfdcaf49ccc52591502993db4c8c08ea9eec0/contracts/libraries/UniswapV2Library.sol#L36
 */
Outcome<balance_t> quote(const balance_t &amountA
                         , const balance_t &reserveA
                         , const balance_t &reserveB)
{
    if (amountA == 0)
    {
        return RC_INSUFFICIENT_AMOUNT;
    }
    if (reserveA == 0 || reserveB == 0)
    {
        return RC_INSUFFICIENT_LIQUIDITY;
    }
    return narrowed(wide_t(amountA) * wide_t(reserveB) / wide_t(reserveA));
}


} // namespace amm
} // namespace model
} // namespace ammr
