/**
 * @file ammr_invariant.hpp
 * @brief AMM (Automated Market Maker) pricing curves
 *
 * Pure functions only: pool state in, amounts out. Nothing here has
 * side effects, so quoting twice against the same state yields the same result.
 */

#pragma once

#include "ammr_types.hpp"
#include "ammr_errors.hpp"
#include "ammr_pool.hpp"

namespace ammr {
namespace model {
namespace amm {


/**
 * @brief A pricing curve, solved in closed form both ways.
 *
 * Two forms of computations are provided, to match the Uniswap model.
 *
 * - "How much tokenOut would I get if I sent X amount of tokenIn?" is answered by getAmountOut()
 * - "How much tokenIn do I need to send in order to get X amount of tokenOut?" is answered by getAmountIn()
 *
 * Rounding always favors the pool: getAmountOut() rounds down,
 * getAmountIn() rounds up. The same object also implements the check
 * the pool runs on its post-swap balances (accepts()), so the quoted
 * amounts and the enforced invariant cannot drift apart.
 *
 * Trade state is not checked here. @see getAmountOut() free function
 */
struct Invariant
{
    virtual ~Invariant() {}

    /**
     * @brief output for selling @p amountIn into a pool holding
     *        @p reserveIn / @p reserveOut
     * @param sellToken0 true if the input token is the pool's token0
     */
    virtual Outcome<balance_t> getAmountOut(const balance_t &amountIn
                                            , const balance_t &reserveIn
                                            , const balance_t &reserveOut
                                            , const PoolSettings &settings
                                            , bool sellToken0) const = 0;

    /**
     * @brief minimum input that buys @p amountOut
     */
    virtual Outcome<balance_t> getAmountIn(const balance_t &amountOut
                                           , const balance_t &reserveIn
                                           , const balance_t &reserveOut
                                           , const PoolSettings &settings
                                           , bool sellToken0) const = 0;

    /**
     * @brief pool-side verdict on a reserve transition
     *
     * @param before reserves before the swap
     * @param balance0Adjusted balance0 * FEE_DENOMINATOR - amount0In * feeBP
     * @param balance1Adjusted balance1 * FEE_DENOMINATOR - amount1In * feeBP
     * @return true if the invariant value did not decrease
     */
    virtual bool accepts(const Reserves &before
                         , const wide_t &balance0Adjusted
                         , const wide_t &balance1Adjusted
                         , const PoolSettings &settings) const = 0;
};


/**
 * @brief x*y=k, fee taken from the input
 *
 * As specified by "Formal Specification of Constant Product
 * (x × y = k) Market Maker Model and Implementation"
 * (c) Yi Zhang, Xiaohong Chen, and Daejun Park
 */
struct ConstantProductInvariant: Invariant
{
    Outcome<balance_t> getAmountOut(const balance_t &amountIn
                                    , const balance_t &reserveIn
                                    , const balance_t &reserveOut
                                    , const PoolSettings &settings
                                    , bool sellToken0) const override;
    Outcome<balance_t> getAmountIn(const balance_t &amountOut
                                   , const balance_t &reserveIn
                                   , const balance_t &reserveOut
                                   , const PoolSettings &settings
                                   , bool sellToken0) const override;
    bool accepts(const Reserves &before
                 , const wide_t &balance0Adjusted
                 , const wide_t &balance1Adjusted
                 , const PoolSettings &settings) const override;
};


/**
 * @brief boosted constant product ("xybk")
 *
 * The curve is x*y=k shifted by an artificial liquidity term:
 *
 *     (x + (b-1)*s) * (y + (b-1)*s) = (b*s)^2
 *
 * where s is the balanced point (x == y == s lies on the curve) and b
 * is the boost of whichever token currently holds more than s.
 * With large b the curve is nearly flat (constant sum) around s, and
 * it bends back to plain constant product toward the edges. The real
 * reserves bound the output, so one side may be drained to zero.
 *
 * When a trade crosses s and the two boosts differ, it is priced in two
 * legs: start -> (s, s) on the starting side's curve, then (s, s) -> end
 * on the other side's one.
 */
struct BoostedInvariant: Invariant
{
    Outcome<balance_t> getAmountOut(const balance_t &amountIn
                                    , const balance_t &reserveIn
                                    , const balance_t &reserveOut
                                    , const PoolSettings &settings
                                    , bool sellToken0) const override;
    Outcome<balance_t> getAmountIn(const balance_t &amountOut
                                   , const balance_t &reserveIn
                                   , const balance_t &reserveOut
                                   , const PoolSettings &settings
                                   , bool sellToken0) const override;
    bool accepts(const Reserves &before
                 , const wide_t &balance0Adjusted
                 , const wide_t &balance1Adjusted
                 , const PoolSettings &settings) const override;

    /**
     * @brief balanced point s of the boosted curve through (balance0, balance1)
     *
     * boost = (balance0 > balance1 ? boost0 : boost1) - 1
     * s = boost*(x+y)/(2+4*boost) + sqrt((boost*(x+y)/(2+4*boost))^2 + x*y/(1+2*boost))
     *
     * Every division floors, so s never exceeds the exact value and the
     * current reserves always sit on or above the curve.
     */
    static wide_t sqrtK(unsigned boost0
                        , unsigned boost1
                        , const wide_t &balance0
                        , const wide_t &balance1);
};


/**
 * @brief the curve used by pools configured with @p settings
 */
const Invariant &invariant_for(const PoolSettings &settings);

/**
 * @brief trade-state gated getAmountOut() on the pool's curve.
 *
 * Fails with RC_TRADE_NOT_ALLOWED when @p settings forbid selling
 * the input token.
 */
Outcome<balance_t> getAmountOut(const balance_t &amountIn
                                , const balance_t &reserveIn
                                , const balance_t &reserveOut
                                , const PoolSettings &settings
                                , bool sellToken0);

/**
 * @brief trade-state gated getAmountIn() on the pool's curve.
 */
Outcome<balance_t> getAmountIn(const balance_t &amountOut
                               , const balance_t &reserveIn
                               , const balance_t &reserveOut
                               , const PoolSettings &settings
                               , bool sellToken0);

/**
 * @brief given some amount of an asset and pair reserves, returns an
 *        equivalent amount of the other asset (no fee, no slippage)
 */
Outcome<balance_t> quote(const balance_t &amountA
                         , const balance_t &reserveA
                         , const balance_t &reserveB);


} // namespace amm
} // namespace model
} // namespace ammr
