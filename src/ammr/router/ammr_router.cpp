#include "ammr_router.hpp"
#include "ammr_transfer.hpp"
#include <ammr/model/ammr_invariant.hpp>
#include <ammr/model/ammr_pool.hpp>
#include <ammr/commons/ammr_log.hpp>

namespace ammr {
namespace router {

using namespace model;


Router::Router(const RouterSettings &settings
               , Registry &registry
               , TokenLedger &ledger
               , NativeAssetAdapter &native
               , PermitVerifier &permits)
    : m_settings(settings)
    , m_registry(registry)
    , m_ledger(ledger)
    , m_native(native)
    , m_permits(permits)
    , m_deadline(ledger)
    , m_pricer(registry, settings.max_path_length)
    , m_executor(registry, ledger)
    , m_liquidity(registry, ledger, settings.router_address)
{
    m_settings.check_consistency();
    if (native.token() != m_settings.wrapped_native)
    {
        throw SettingsConsistencyError(strfmt("native adapter wraps %1%, router configured for %2%"
                                              , native.token()
                                              , m_settings.wrapped_native));
    }
}


template<typename T, typename Body>
Outcome<T> Router::invoke(const char *op, const CallContext &ctx, timestamp_t deadline, Body body)
{
    const auto expiry = m_deadline.check(deadline);
    if (expiry.failed())
    {
        log_debug("%1%: %2% (deadline %3%, now %4%)", op, expiry.describe(), deadline, m_ledger.now());
        return expiry;
    }
    ReentrancyGuard::Lock lock(m_guard);
    if (!lock.acquired())
    {
        log_debug("%1%: %2%", op, lock.status().describe());
        return lock.status();
    }

    const auto cp = m_ledger.checkpoint();
    Outcome<T> res = RC_OK;
    try
    {
        const auto nativeBefore = m_ledger.nativeBalanceOf(address());
        if (ctx.value > 0 && m_ledger.transferNative(ctx.sender, address(), ctx.value).failed())
        {
            res = RC_INSUFFICIENT_NATIVE_VALUE;
        }
        if (res.ok())
        {
            res = body();
        }
        if (res.ok())
        {
            // native dust the body did not consume
            const auto nativeAfter = m_ledger.nativeBalanceOf(address());
            if (nativeAfter > nativeBefore)
            {
                const balance_t dust = nativeAfter - nativeBefore;
                if (!m_settings.refund_dust)
                {
                    res = RC_EXCESSIVE_INPUT_AMOUNT;
                }
                else if (m_ledger.transferNative(address(), ctx.sender, dust).failed())
                {
                    res = RC_INSUFFICIENT_NATIVE_VALUE;
                }
            }
        }
    }
    catch (...)
    {
        m_ledger.revert(cp);
        throw;
    }

    if (res.failed())
    {
        m_ledger.revert(cp);
        log_debug("%1% from %2% reverted: %3%", op, ctx.sender, res.describe());
        return res;
    }
    m_ledger.release(cp);
    return res;
}


Status Router::pay_first_hop(const TokenPath &path, const address_t &payer, const balance_t &amount)
{
    const auto pool = m_registry.getPool(path[0], path[1]);
    if (pool == nullptr)
    {
        return RC_INSUFFICIENT_LIQUIDITY;
    }
    return pay(m_ledger, address(), path[0], payer, pool->address(), amount);
}

Status Router::wrap(const balance_t &amount)
{
    return m_native.deposit(address(), amount);
}

Status Router::unwrap_to(const address_t &to, const balance_t &amount)
{
    const auto st = m_native.withdraw(address(), amount);
    if (st.failed())
    {
        return st;
    }
    return m_ledger.transferNative(address(), to, amount);
}

static void log_swap(const char *op, const TokenPath &path, const AmountVector &amounts, const address_t &to)
{
    log_info("%1%: %2% %3% -> %4% %5% to %6%, %7% hops"
             , op
             , amounts.front()
             , path.front()
             , amounts.back()
             , path.back()
             , to
             , path.size() - 1);
}


Outcome<LiquidityReceipt> Router::addLiquidity(const CallContext &ctx
                                               , const address_t &tokenA
                                               , const address_t &tokenB
                                               , const balance_t &amountADesired
                                               , const balance_t &amountBDesired
                                               , const balance_t &amountAMin
                                               , const balance_t &amountBMin
                                               , const address_t &to
                                               , timestamp_t deadline)
{
    return invoke<LiquidityReceipt>("addLiquidity", ctx, deadline, [&]() -> Outcome<LiquidityReceipt> {
        const auto amounts = m_liquidity.computeDeposit(tokenA
                                                        , tokenB
                                                        , amountADesired
                                                        , amountBDesired
                                                        , amountAMin
                                                        , amountBMin);
        if (amounts.failed())
        {
            return Status(amounts);
        }
        const auto shares = m_liquidity.provide(tokenA, tokenB, amounts.value, ctx.sender, ctx.sender, to);
        if (shares.failed())
        {
            return Status(shares);
        }
        return LiquidityReceipt{amounts.value.amountA, amounts.value.amountB, shares.value};
    });
}

Outcome<LiquidityReceipt> Router::addLiquidityNative(const CallContext &ctx
                                                     , const address_t &token
                                                     , const balance_t &amountTokenDesired
                                                     , const balance_t &amountTokenMin
                                                     , const balance_t &amountNativeMin
                                                     , const address_t &to
                                                     , timestamp_t deadline)
{
    return invoke<LiquidityReceipt>("addLiquidityNative", ctx, deadline, [&]() -> Outcome<LiquidityReceipt> {
        const auto amounts = m_liquidity.computeDeposit(token
                                                        , nativeToken()
                                                        , amountTokenDesired
                                                        , ctx.value
                                                        , amountTokenMin
                                                        , amountNativeMin);
        if (amounts.failed())
        {
            return Status(amounts);
        }
        if (amounts.value.amountB > 0)
        {
            const auto st = wrap(amounts.value.amountB);
            if (st.failed())
            {
                return st;
            }
        }
        const auto shares = m_liquidity.provide(token, nativeToken(), amounts.value, ctx.sender, address(), to);
        if (shares.failed())
        {
            return Status(shares);
        }
        return LiquidityReceipt{amounts.value.amountA, amounts.value.amountB, shares.value};
    });
}


Outcome<TokenAmounts> Router::do_removeLiquidity(const CallContext &ctx
                                                 , const address_t &tokenA
                                                 , const address_t &tokenB
                                                 , const balance_t &shares
                                                 , const balance_t &amountAMin
                                                 , const balance_t &amountBMin
                                                 , const address_t &to)
{
    return m_liquidity.remove(tokenA, tokenB, shares, amountAMin, amountBMin, ctx.sender, to);
}

Outcome<TokenAmounts> Router::do_removeLiquidityNative(const CallContext &ctx
                                                       , const address_t &token
                                                       , const balance_t &shares
                                                       , const balance_t &amountTokenMin
                                                       , const balance_t &amountNativeMin
                                                       , const address_t &to)
{
    // both sides come to the router first, the wrapped one gets unwrapped
    const auto out = m_liquidity.remove(token
                                        , nativeToken()
                                        , shares
                                        , amountTokenMin
                                        , amountNativeMin
                                        , ctx.sender
                                        , address());
    if (out.failed())
    {
        return out;
    }
    if (out.value.amountA > 0)
    {
        const auto st = m_ledger.transfer(token, address(), to, out.value.amountA);
        if (st.failed())
        {
            return st;
        }
    }
    if (out.value.amountB > 0)
    {
        const auto st = unwrap_to(to, out.value.amountB);
        if (st.failed())
        {
            return st;
        }
    }
    return out;
}

Status Router::permit_shares(const CallContext &ctx
                             , const address_t &tokenA
                             , const address_t &tokenB
                             , const balance_t &shares
                             , timestamp_t deadline
                             , bool approveMax
                             , const ApprovalSignature &sig)
{
    const auto pool = m_registry.getPool(tokenA, tokenB);
    if (pool == nullptr)
    {
        return RC_INSUFFICIENT_LIQUIDITY;
    }
    const balance_t value = approveMax ? balance_t(~balance_t(0)) : shares;
    return m_permits.permit(pool->address(), ctx.sender, address(), value, deadline, sig);
}

Outcome<TokenAmounts> Router::removeLiquidity(const CallContext &ctx
                                              , const address_t &tokenA
                                              , const address_t &tokenB
                                              , const balance_t &shares
                                              , const balance_t &amountAMin
                                              , const balance_t &amountBMin
                                              , const address_t &to
                                              , timestamp_t deadline)
{
    return invoke<TokenAmounts>("removeLiquidity", ctx, deadline, [&]() {
        return do_removeLiquidity(ctx, tokenA, tokenB, shares, amountAMin, amountBMin, to);
    });
}

Outcome<TokenAmounts> Router::removeLiquidityNative(const CallContext &ctx
                                                    , const address_t &token
                                                    , const balance_t &shares
                                                    , const balance_t &amountTokenMin
                                                    , const balance_t &amountNativeMin
                                                    , const address_t &to
                                                    , timestamp_t deadline)
{
    return invoke<TokenAmounts>("removeLiquidityNative", ctx, deadline, [&]() {
        return do_removeLiquidityNative(ctx, token, shares, amountTokenMin, amountNativeMin, to);
    });
}

Outcome<TokenAmounts> Router::removeLiquidityWithPermit(const CallContext &ctx
                                                        , const address_t &tokenA
                                                        , const address_t &tokenB
                                                        , const balance_t &shares
                                                        , const balance_t &amountAMin
                                                        , const balance_t &amountBMin
                                                        , const address_t &to
                                                        , timestamp_t deadline
                                                        , bool approveMax
                                                        , const ApprovalSignature &sig)
{
    return invoke<TokenAmounts>("removeLiquidityWithPermit", ctx, deadline, [&]() -> Outcome<TokenAmounts> {
        const auto st = permit_shares(ctx, tokenA, tokenB, shares, deadline, approveMax, sig);
        if (st.failed())
        {
            return st;
        }
        return do_removeLiquidity(ctx, tokenA, tokenB, shares, amountAMin, amountBMin, to);
    });
}

Outcome<TokenAmounts> Router::removeLiquidityNativeWithPermit(const CallContext &ctx
                                                              , const address_t &token
                                                              , const balance_t &shares
                                                              , const balance_t &amountTokenMin
                                                              , const balance_t &amountNativeMin
                                                              , const address_t &to
                                                              , timestamp_t deadline
                                                              , bool approveMax
                                                              , const ApprovalSignature &sig)
{
    return invoke<TokenAmounts>("removeLiquidityNativeWithPermit", ctx, deadline, [&]() -> Outcome<TokenAmounts> {
        const auto st = permit_shares(ctx, token, nativeToken(), shares, deadline, approveMax, sig);
        if (st.failed())
        {
            return st;
        }
        return do_removeLiquidityNative(ctx, token, shares, amountTokenMin, amountNativeMin, to);
    });
}


Outcome<AmountVector> Router::swapExactTokensForTokens(const CallContext &ctx
                                                       , const balance_t &amountIn
                                                       , const balance_t &amountOutMin
                                                       , const TokenPath &path
                                                       , const address_t &to
                                                       , timestamp_t deadline)
{
    return invoke<AmountVector>("swapExactTokensForTokens", ctx, deadline, [&]() -> Outcome<AmountVector> {
        const auto amounts = m_pricer.getAmountsOut(path, amountIn);
        if (amounts.failed())
        {
            return amounts;
        }
        if (amounts.value.back() < amountOutMin)
        {
            return RC_INSUFFICIENT_OUTPUT_AMOUNT;
        }
        auto st = pay_first_hop(path, ctx.sender, amounts.value.front());
        if (st.ok())
        {
            st = m_executor.execute(amounts.value, path, to);
        }
        if (st.failed())
        {
            return st;
        }
        log_swap("swapExactTokensForTokens", path, amounts.value, to);
        return amounts;
    });
}

Outcome<AmountVector> Router::swapTokensForExactTokens(const CallContext &ctx
                                                       , const balance_t &amountOut
                                                       , const balance_t &amountInMax
                                                       , const TokenPath &path
                                                       , const address_t &to
                                                       , timestamp_t deadline)
{
    return invoke<AmountVector>("swapTokensForExactTokens", ctx, deadline, [&]() -> Outcome<AmountVector> {
        const auto amounts = m_pricer.getAmountsIn(path, amountOut);
        if (amounts.failed())
        {
            return amounts;
        }
        if (amounts.value.front() > amountInMax)
        {
            return RC_EXCESSIVE_INPUT_AMOUNT;
        }
        auto st = pay_first_hop(path, ctx.sender, amounts.value.front());
        if (st.ok())
        {
            st = m_executor.execute(amounts.value, path, to);
        }
        if (st.failed())
        {
            return st;
        }
        log_swap("swapTokensForExactTokens", path, amounts.value, to);
        return amounts;
    });
}

Outcome<AmountVector> Router::swapExactNativeForTokens(const CallContext &ctx
                                                       , const balance_t &amountOutMin
                                                       , const TokenPath &path
                                                       , const address_t &to
                                                       , timestamp_t deadline)
{
    return invoke<AmountVector>("swapExactNativeForTokens", ctx, deadline, [&]() -> Outcome<AmountVector> {
        if (path.empty() || path.front() != nativeToken())
        {
            return RC_INVALID_PATH;
        }
        const auto amounts = m_pricer.getAmountsOut(path, ctx.value);
        if (amounts.failed())
        {
            return amounts;
        }
        if (amounts.value.back() < amountOutMin)
        {
            return RC_INSUFFICIENT_OUTPUT_AMOUNT;
        }
        auto st = wrap(amounts.value.front());
        if (st.ok())
        {
            st = pay_first_hop(path, address(), amounts.value.front());
        }
        if (st.ok())
        {
            st = m_executor.execute(amounts.value, path, to);
        }
        if (st.failed())
        {
            return st;
        }
        log_swap("swapExactNativeForTokens", path, amounts.value, to);
        return amounts;
    });
}

Outcome<AmountVector> Router::swapNativeForExactTokens(const CallContext &ctx
                                                       , const balance_t &amountOut
                                                       , const TokenPath &path
                                                       , const address_t &to
                                                       , timestamp_t deadline)
{
    return invoke<AmountVector>("swapNativeForExactTokens", ctx, deadline, [&]() -> Outcome<AmountVector> {
        if (path.empty() || path.front() != nativeToken())
        {
            return RC_INVALID_PATH;
        }
        const auto amounts = m_pricer.getAmountsIn(path, amountOut);
        if (amounts.failed())
        {
            return amounts;
        }
        if (amounts.value.front() > ctx.value)
        {
            return RC_EXCESSIVE_INPUT_AMOUNT;
        }
        auto st = wrap(amounts.value.front());
        if (st.ok())
        {
            st = pay_first_hop(path, address(), amounts.value.front());
        }
        if (st.ok())
        {
            st = m_executor.execute(amounts.value, path, to);
        }
        if (st.failed())
        {
            return st;
        }
        log_swap("swapNativeForExactTokens", path, amounts.value, to);
        return amounts;
    });
}

Outcome<AmountVector> Router::swapExactTokensForNative(const CallContext &ctx
                                                       , const balance_t &amountIn
                                                       , const balance_t &amountOutMin
                                                       , const TokenPath &path
                                                       , const address_t &to
                                                       , timestamp_t deadline)
{
    return invoke<AmountVector>("swapExactTokensForNative", ctx, deadline, [&]() -> Outcome<AmountVector> {
        if (path.empty() || path.back() != nativeToken())
        {
            return RC_INVALID_PATH;
        }
        const auto amounts = m_pricer.getAmountsOut(path, amountIn);
        if (amounts.failed())
        {
            return amounts;
        }
        if (amounts.value.back() < amountOutMin)
        {
            return RC_INSUFFICIENT_OUTPUT_AMOUNT;
        }
        auto st = pay_first_hop(path, ctx.sender, amounts.value.front());
        if (st.ok())
        {
            st = m_executor.execute(amounts.value, path, address());
        }
        if (st.ok())
        {
            st = unwrap_to(to, amounts.value.back());
        }
        if (st.failed())
        {
            return st;
        }
        log_swap("swapExactTokensForNative", path, amounts.value, to);
        return amounts;
    });
}

Outcome<AmountVector> Router::swapTokensForExactNative(const CallContext &ctx
                                                       , const balance_t &amountOut
                                                       , const balance_t &amountInMax
                                                       , const TokenPath &path
                                                       , const address_t &to
                                                       , timestamp_t deadline)
{
    return invoke<AmountVector>("swapTokensForExactNative", ctx, deadline, [&]() -> Outcome<AmountVector> {
        if (path.empty() || path.back() != nativeToken())
        {
            return RC_INVALID_PATH;
        }
        const auto amounts = m_pricer.getAmountsIn(path, amountOut);
        if (amounts.failed())
        {
            return amounts;
        }
        if (amounts.value.front() > amountInMax)
        {
            return RC_EXCESSIVE_INPUT_AMOUNT;
        }
        auto st = pay_first_hop(path, ctx.sender, amounts.value.front());
        if (st.ok())
        {
            st = m_executor.execute(amounts.value, path, address());
        }
        if (st.ok())
        {
            st = unwrap_to(to, amounts.value.back());
        }
        if (st.failed())
        {
            return st;
        }
        log_swap("swapTokensForExactNative", path, amounts.value, to);
        return amounts;
    });
}

Outcome<balance_t> Router::swapExactTokensForTokensSupportingFeeOnTransferTokens(const CallContext &ctx
                                                                                 , const balance_t &amountIn
                                                                                 , const balance_t &amountOutMin
                                                                                 , const TokenPath &path
                                                                                 , const address_t &to
                                                                                 , timestamp_t deadline)
{
    return invoke<balance_t>("swapExactTokensForTokensSupportingFeeOnTransferTokens", ctx, deadline, [&]() -> Outcome<balance_t> {
        auto st = m_pricer.check_path(path);
        if (st.ok())
        {
            st = pay_first_hop(path, ctx.sender, amountIn);
        }
        if (st.failed())
        {
            return st;
        }
        const auto balanceBefore = m_ledger.balanceOf(path.back(), to);
        st = m_executor.executeSupportingFeeOnTransfer(path, to);
        if (st.failed())
        {
            return st;
        }
        const auto balanceAfter = m_ledger.balanceOf(path.back(), to);
        const balance_t received = balanceAfter > balanceBefore ? balance_t(balanceAfter - balanceBefore) : balance_t(0);
        if (received < amountOutMin)
        {
            return RC_INSUFFICIENT_OUTPUT_AMOUNT;
        }
        log_info("swapExactTokensForTokensSupportingFeeOnTransferTokens: %1% %2% -> %3% %4% to %5%"
                 , amountIn
                 , path.front()
                 , received
                 , path.back()
                 , to);
        return received;
    });
}


Outcome<balance_t> Router::quote(const balance_t &amountA
                                 , const balance_t &reserveA
                                 , const balance_t &reserveB) const
{
    return amm::quote(amountA, reserveA, reserveB);
}

Outcome<balance_t> Router::getAmountOut(const balance_t &amountIn
                                        , const balance_t &reserveIn
                                        , const balance_t &reserveOut
                                        , const PoolSettings &settings
                                        , bool sellToken0) const
{
    return amm::getAmountOut(amountIn, reserveIn, reserveOut, settings, sellToken0);
}

Outcome<balance_t> Router::getAmountIn(const balance_t &amountOut
                                       , const balance_t &reserveIn
                                       , const balance_t &reserveOut
                                       , const PoolSettings &settings
                                       , bool sellToken0) const
{
    return amm::getAmountIn(amountOut, reserveIn, reserveOut, settings, sellToken0);
}

Outcome<AmountVector> Router::getAmountsOut(const balance_t &amountIn, const TokenPath &path) const
{
    return m_pricer.getAmountsOut(path, amountIn);
}

Outcome<AmountVector> Router::getAmountsIn(const balance_t &amountOut, const TokenPath &path) const
{
    return m_pricer.getAmountsIn(path, amountOut);
}


} // namespace router
} // namespace ammr
