/**
 * @file ammr_router.hpp
 * @brief The router: entry points of the exchange
 *
 * Every state-mutating entry point runs as one all-or-nothing
 * invocation:
 *
 *  1. deadline check (fails with RC_EXPIRED, before anything else)
 *  2. reentrancy lock (fails with RC_LOCKED)
 *  3. ledger checkpoint, native value moves from the caller to the router
 *  4. pricing and execution
 *  5. native dust settled back to the caller
 *  6. checkpoint released on success, reverted on any failure
 *
 * Failures are reported by ReturnCode_e, exceptions are only thrown on
 * API misuse (and the ledger is reverted before they leave).
 */

#pragma once

#include "ammr_settings.hpp"
#include "ammr_guards.hpp"
#include "ammr_path_pricer.hpp"
#include "ammr_swap_executor.hpp"
#include "ammr_liquidity.hpp"
#include <ammr/model/ammr_collaborators.hpp>
#include <boost/noncopyable.hpp>

namespace ammr {
namespace router {

using PoolSettings = model::PoolSettings;
using ApprovalSignature = model::ApprovalSignature;


/**
 * @brief who calls, and how much native asset comes along
 */
struct CallContext
{
    address_t sender;
    balance_t value = 0;
};

/**
 * @brief outcome of a liquidity deposit
 */
struct LiquidityReceipt
{
    balance_t amountA = 0;  ///< tokenA (or token) deposited
    balance_t amountB = 0;  ///< tokenB (or native) deposited
    balance_t shares = 0;   ///< pool shares issued
};


class Router: boost::noncopyable
{
public:
    /**
     * @throws SettingsConsistencyError if @p settings are inconsistent,
     *         or do not match @p native
     */
    Router(const RouterSettings &settings
           , model::Registry &registry
           , model::TokenLedger &ledger
           , model::NativeAssetAdapter &native
           , model::PermitVerifier &permits);

    const RouterSettings &settings() const { return m_settings; }
    const address_t &address() const { return m_settings.router_address; }
    const address_t &nativeToken() const { return m_settings.wrapped_native; }
    model::Registry &registry() const { return m_registry; }

    /**
     * @defgroup liquidity liquidity provisioning
     * @{
     */
    Outcome<LiquidityReceipt> addLiquidity(const CallContext &ctx
                                           , const address_t &tokenA
                                           , const address_t &tokenB
                                           , const balance_t &amountADesired
                                           , const balance_t &amountBDesired
                                           , const balance_t &amountAMin
                                           , const balance_t &amountBMin
                                           , const address_t &to
                                           , timestamp_t deadline);

    /**
     * @brief the native side is desired up to ctx.value, the rest is refunded
     */
    Outcome<LiquidityReceipt> addLiquidityNative(const CallContext &ctx
                                                 , const address_t &token
                                                 , const balance_t &amountTokenDesired
                                                 , const balance_t &amountTokenMin
                                                 , const balance_t &amountNativeMin
                                                 , const address_t &to
                                                 , timestamp_t deadline);

    Outcome<TokenAmounts> removeLiquidity(const CallContext &ctx
                                          , const address_t &tokenA
                                          , const address_t &tokenB
                                          , const balance_t &shares
                                          , const balance_t &amountAMin
                                          , const balance_t &amountBMin
                                          , const address_t &to
                                          , timestamp_t deadline);

    /**
     * @return (amountToken, amountNative)
     */
    Outcome<TokenAmounts> removeLiquidityNative(const CallContext &ctx
                                                , const address_t &token
                                                , const balance_t &shares
                                                , const balance_t &amountTokenMin
                                                , const balance_t &amountNativeMin
                                                , const address_t &to
                                                , timestamp_t deadline);

    /**
     * @brief removeLiquidity() with the share allowance installed by a
     *        signed approval. @p approveMax approves the maximum amount
     *        instead of @p shares.
     */
    Outcome<TokenAmounts> removeLiquidityWithPermit(const CallContext &ctx
                                                    , const address_t &tokenA
                                                    , const address_t &tokenB
                                                    , const balance_t &shares
                                                    , const balance_t &amountAMin
                                                    , const balance_t &amountBMin
                                                    , const address_t &to
                                                    , timestamp_t deadline
                                                    , bool approveMax
                                                    , const ApprovalSignature &sig);

    Outcome<TokenAmounts> removeLiquidityNativeWithPermit(const CallContext &ctx
                                                          , const address_t &token
                                                          , const balance_t &shares
                                                          , const balance_t &amountTokenMin
                                                          , const balance_t &amountNativeMin
                                                          , const address_t &to
                                                          , timestamp_t deadline
                                                          , bool approveMax
                                                          , const ApprovalSignature &sig);
    /** @} */

    /**
     * @defgroup swaps swaps
     *
     * Swaps return the AmountVector they executed.
     * @{
     */
    Outcome<AmountVector> swapExactTokensForTokens(const CallContext &ctx
                                                   , const balance_t &amountIn
                                                   , const balance_t &amountOutMin
                                                   , const TokenPath &path
                                                   , const address_t &to
                                                   , timestamp_t deadline);

    Outcome<AmountVector> swapTokensForExactTokens(const CallContext &ctx
                                                   , const balance_t &amountOut
                                                   , const balance_t &amountInMax
                                                   , const TokenPath &path
                                                   , const address_t &to
                                                   , timestamp_t deadline);

    /**
     * @brief sells all of ctx.value. path[0] must be the wrapped native token.
     */
    Outcome<AmountVector> swapExactNativeForTokens(const CallContext &ctx
                                                   , const balance_t &amountOutMin
                                                   , const TokenPath &path
                                                   , const address_t &to
                                                   , timestamp_t deadline);

    /**
     * @brief ctx.value is the maximum input, the rest is refunded.
     *        path[0] must be the wrapped native token.
     */
    Outcome<AmountVector> swapNativeForExactTokens(const CallContext &ctx
                                                   , const balance_t &amountOut
                                                   , const TokenPath &path
                                                   , const address_t &to
                                                   , timestamp_t deadline);

    /**
     * @brief the last path token must be the wrapped native token
     */
    Outcome<AmountVector> swapExactTokensForNative(const CallContext &ctx
                                                   , const balance_t &amountIn
                                                   , const balance_t &amountOutMin
                                                   , const TokenPath &path
                                                   , const address_t &to
                                                   , timestamp_t deadline);

    Outcome<AmountVector> swapTokensForExactNative(const CallContext &ctx
                                                   , const balance_t &amountOut
                                                   , const balance_t &amountInMax
                                                   , const TokenPath &path
                                                   , const address_t &to
                                                   , timestamp_t deadline);

    /**
     * @brief exact-in swap through tokens that may charge a transfer fee
     * @return amount the recipient actually received
     */
    Outcome<balance_t> swapExactTokensForTokensSupportingFeeOnTransferTokens(const CallContext &ctx
                                                                             , const balance_t &amountIn
                                                                             , const balance_t &amountOutMin
                                                                             , const TokenPath &path
                                                                             , const address_t &to
                                                                             , timestamp_t deadline);
    /** @} */

    /**
     * @defgroup readonly quotes, no guards, no side effects
     * @{
     */
    Outcome<balance_t> quote(const balance_t &amountA
                             , const balance_t &reserveA
                             , const balance_t &reserveB) const;

    Outcome<balance_t> getAmountOut(const balance_t &amountIn
                                    , const balance_t &reserveIn
                                    , const balance_t &reserveOut
                                    , const PoolSettings &settings = PoolSettings()
                                    , bool sellToken0 = true) const;

    Outcome<balance_t> getAmountIn(const balance_t &amountOut
                                   , const balance_t &reserveIn
                                   , const balance_t &reserveOut
                                   , const PoolSettings &settings = PoolSettings()
                                   , bool sellToken0 = true) const;

    Outcome<AmountVector> getAmountsOut(const balance_t &amountIn, const TokenPath &path) const;
    Outcome<AmountVector> getAmountsIn(const balance_t &amountOut, const TokenPath &path) const;
    /** @} */

private:
    RouterSettings m_settings;
    model::Registry &m_registry;
    model::TokenLedger &m_ledger;
    model::NativeAssetAdapter &m_native;
    model::PermitVerifier &m_permits;

    ReentrancyGuard m_guard;
    DeadlineGuard m_deadline;
    PathPricer m_pricer;
    SwapExecutor m_executor;
    LiquidityManager m_liquidity;

    template<typename T, typename Body>
    Outcome<T> invoke(const char *op, const CallContext &ctx, timestamp_t deadline, Body body);

    model::Status pay_first_hop(const TokenPath &path, const address_t &payer, const balance_t &amount);
    model::Status wrap(const balance_t &amount);
    model::Status unwrap_to(const address_t &to, const balance_t &amount);
    model::Status permit_shares(const CallContext &ctx
                                , const address_t &tokenA
                                , const address_t &tokenB
                                , const balance_t &shares
                                , timestamp_t deadline
                                , bool approveMax
                                , const ApprovalSignature &sig);

    Outcome<TokenAmounts> do_removeLiquidity(const CallContext &ctx
                                             , const address_t &tokenA
                                             , const address_t &tokenB
                                             , const balance_t &shares
                                             , const balance_t &amountAMin
                                             , const balance_t &amountBMin
                                             , const address_t &to);
    Outcome<TokenAmounts> do_removeLiquidityNative(const CallContext &ctx
                                                   , const address_t &token
                                                   , const balance_t &shares
                                                   , const balance_t &amountTokenMin
                                                   , const balance_t &amountNativeMin
                                                   , const address_t &to);
};


} // namespace router
} // namespace ammr
