#include "ammr_liquidity.hpp"
#include "ammr_transfer.hpp"
#include <ammr/model/ammr_pool.hpp>
#include <ammr/model/ammr_invariant.hpp>
#include <ammr/model/ammr_collaborators.hpp>
#include <ammr/commons/ammr_log.hpp>

namespace ammr {
namespace router {

using namespace model;


LiquidityManager::LiquidityManager(Registry &registry
                                   , TokenLedger &ledger
                                   , const address_t &self)
    : m_registry(registry)
    , m_ledger(ledger)
    , m_self(self)
{}


/**
 * Take it away from https://github.com/Uniswap/v2-periphery/blob/87edfdcaf49ccc52591502993db4c8c08ea9eec0/contracts/UniswapV2Router02.sol#L33
 */
Outcome<TokenAmounts> LiquidityManager::computeDeposit(const address_t &tokenA
                                                       , const address_t &tokenB
                                                       , const balance_t &desiredA
                                                       , const balance_t &desiredB
                                                       , const balance_t &minA
                                                       , const balance_t &minB)
{
    auto pool = m_registry.getPool(tokenA, tokenB);
    if (pool == nullptr)
    {
        auto created = m_registry.createPool(tokenA, tokenB);
        if (created.failed())
        {
            return Status(created);
        }
        pool = created.value;
        log_info("created pool %1% for %2%/%3%", pool->address(), pool->token0(), pool->token1());
    }

    const auto reserves = pool->getReserves();
    const bool aIsToken0 = tokenA == pool->token0();
    const balance_t &reserveA = aIsToken0 ? reserves.reserve0 : reserves.reserve1;
    const balance_t &reserveB = aIsToken0 ? reserves.reserve1 : reserves.reserve0;

    TokenAmounts res;
    if (reserveA == 0 && reserveB == 0)
    {
        res.amountA = desiredA;
        res.amountB = desiredB;
        return res;
    }
    if (reserveA == 0)
    {
        // drained side, only the other one can be deposited
        if (minA > 0)
        {
            return RC_INSUFFICIENT_A_AMOUNT;
        }
        if (desiredB < minB)
        {
            return RC_INSUFFICIENT_B_AMOUNT;
        }
        res.amountB = desiredB;
        return res;
    }
    if (reserveB == 0)
    {
        if (minB > 0)
        {
            return RC_INSUFFICIENT_B_AMOUNT;
        }
        if (desiredA < minA)
        {
            return RC_INSUFFICIENT_A_AMOUNT;
        }
        res.amountA = desiredA;
        return res;
    }

    const auto optimalB = amm::quote(desiredA, reserveA, reserveB);
    if (optimalB.failed())
    {
        return Status(optimalB);
    }
    if (optimalB.value <= desiredB)
    {
        if (optimalB.value < minB)
        {
            return RC_INSUFFICIENT_B_AMOUNT;
        }
        res.amountA = desiredA;
        res.amountB = optimalB.value;
        return res;
    }

    const auto optimalA = amm::quote(desiredB, reserveB, reserveA);
    if (optimalA.failed())
    {
        return Status(optimalA);
    }
    if (optimalA.value > desiredA || optimalA.value < minA)
    {
        return RC_INSUFFICIENT_A_AMOUNT;
    }
    res.amountA = optimalA.value;
    res.amountB = desiredB;
    return res;
}

Outcome<balance_t> LiquidityManager::provide(const address_t &tokenA
                                             , const address_t &tokenB
                                             , const TokenAmounts &amounts
                                             , const address_t &payerA
                                             , const address_t &payerB
                                             , const address_t &to)
{
    const auto pool = m_registry.getPool(tokenA, tokenB);
    if (pool == nullptr)
    {
        return RC_INSUFFICIENT_LIQUIDITY;
    }

    if (amounts.amountA > 0)
    {
        const auto st = pay(m_ledger, m_self, tokenA, payerA, pool->address(), amounts.amountA);
        if (st.failed())
        {
            return st;
        }
    }
    if (amounts.amountB > 0)
    {
        const auto st = pay(m_ledger, m_self, tokenB, payerB, pool->address(), amounts.amountB);
        if (st.failed())
        {
            return st;
        }
    }
    return pool->mint(to);
}

/**
 * Take it away from https://github.com/Uniswap/v2-periphery/blob/87edfdcaf49ccc52591502993db4c8c08ea9eec0/contracts/UniswapV2Router02.sol#L103
 */
Outcome<TokenAmounts> LiquidityManager::remove(const address_t &tokenA
                                               , const address_t &tokenB
                                               , const balance_t &shares
                                               , const balance_t &minA
                                               , const balance_t &minB
                                               , const address_t &owner
                                               , const address_t &to)
{
    const auto pool = m_registry.getPool(tokenA, tokenB);
    if (pool == nullptr)
    {
        return RC_INSUFFICIENT_LIQUIDITY;
    }

    // pool shares are a token addressed by the pool itself
    const auto st = pay(m_ledger, m_self, pool->address(), owner, pool->address(), shares);
    if (st.failed())
    {
        return st;
    }
    const auto burnt = pool->burn(to);
    if (burnt.failed())
    {
        return burnt;
    }

    TokenAmounts res;
    const bool aIsToken0 = tokenA == pool->token0();
    res.amountA = aIsToken0 ? burnt.value.amountA : burnt.value.amountB;
    res.amountB = aIsToken0 ? burnt.value.amountB : burnt.value.amountA;
    if (res.amountA < minA)
    {
        return RC_INSUFFICIENT_A_AMOUNT;
    }
    if (res.amountB < minB)
    {
        return RC_INSUFFICIENT_B_AMOUNT;
    }
    return res;
}


} // namespace router
} // namespace ammr
