#include "ammr_ledger_pool.hpp"
#include <ammr/model/ammr_invariant.hpp>
#include <ammr/commons/ammr_log.hpp>
#include <algorithm>

namespace ammr {
namespace ledger {

using namespace model;

constexpr unsigned LedgerPool::MINIMUM_LIQUIDITY;


LedgerPool::LedgerPool(Ledger &ledger
                       , const address_t &address
                       , const address_t &token0
                       , const address_t &token1
                       , const PoolSettings &settings)
    : m_ledger(ledger)
    , m_address(address)
    , m_token0(token0)
    , m_token1(token1)
    , m_settings(settings)
{
    if (!(token0 < token1))
    {
        throw bad_argument(strfmt("pool tokens not in canonical order: %1%, %2%", token0, token1));
    }
    m_settings.check_consistency();
}

balance_t LedgerPool::totalSupply() const
{
    return m_ledger.totalSupply(m_address);
}

void LedgerPool::update(const balance_t &balance0, const balance_t &balance1)
{
    const auto prev = m_reserves;
    m_ledger.journal([this, prev]() { m_reserves = prev; });
    m_reserves.reserve0 = balance0;
    m_reserves.reserve1 = balance1;
    log_trace("pool %1% sync: %2%, %3%", m_address, balance0, balance1);
}

void LedgerPool::sync()
{
    update(m_ledger.balanceOf(m_token0, m_address)
           , m_ledger.balanceOf(m_token1, m_address));
}


Status LedgerPool::swap(const balance_t &amount0Out
                        , const balance_t &amount1Out
                        , const address_t &to)
{
    if (amount0Out == 0 && amount1Out == 0)
    {
        return RC_INSUFFICIENT_OUTPUT_AMOUNT;
    }
    // boosted pools can be drained on one side
    const bool outOfRange = m_settings.isXybk()
            ? amount0Out > m_reserves.reserve0 || amount1Out > m_reserves.reserve1
            : amount0Out >= m_reserves.reserve0 || amount1Out >= m_reserves.reserve1;
    if (outOfRange)
    {
        return RC_INSUFFICIENT_LIQUIDITY;
    }

    if (amount0Out > 0)
    {
        const auto st = m_ledger.transfer(m_token0, m_address, to, amount0Out);
        if (st.failed())
        {
            return st;
        }
    }
    if (amount1Out > 0)
    {
        const auto st = m_ledger.transfer(m_token1, m_address, to, amount1Out);
        if (st.failed())
        {
            return st;
        }
    }

    const auto balance0 = m_ledger.balanceOf(m_token0, m_address);
    const auto balance1 = m_ledger.balanceOf(m_token1, m_address);
    const balance_t left0 = m_reserves.reserve0 - amount0Out;
    const balance_t left1 = m_reserves.reserve1 - amount1Out;
    const balance_t amount0In = balance0 > left0 ? balance_t(balance0 - left0) : balance_t(0);
    const balance_t amount1In = balance1 > left1 ? balance_t(balance1 - left1) : balance_t(0);
    if (amount0In == 0 && amount1In == 0)
    {
        return RC_INSUFFICIENT_INPUT_AMOUNT;
    }
    if ((amount0In > 0 && !m_settings.allows(true)) ||
        (amount1In > 0 && !m_settings.allows(false)))
    {
        return RC_TRADE_NOT_ALLOWED;
    }

    const wide_t adjusted0 = wide_t(balance0) * FEE_DENOMINATOR - wide_t(amount0In) * m_settings.feeBP;
    const wide_t adjusted1 = wide_t(balance1) * FEE_DENOMINATOR - wide_t(amount1In) * m_settings.feeBP;
    if (!amm::invariant_for(m_settings).accepts(m_reserves, adjusted0, adjusted1, m_settings))
    {
        return RC_INVARIANT_VIOLATED;
    }

    update(balance0, balance1);
    log_debug("pool %1% swap: in %2%/%3%, out %4%/%5%"
              , m_address
              , amount0In
              , amount1In
              , amount0Out
              , amount1Out);
    return RC_OK;
}


Outcome<balance_t> LedgerPool::mint(const address_t &to)
{
    const auto balance0 = m_ledger.balanceOf(m_token0, m_address);
    const auto balance1 = m_ledger.balanceOf(m_token1, m_address);
    const balance_t amount0 = balance0 - m_reserves.reserve0;
    const balance_t amount1 = balance1 - m_reserves.reserve1;
    const auto supply = totalSupply();

    balance_t liquidity = 0;
    if (supply == 0)
    {
        const wide_t product = wide_t(amount0) * wide_t(amount1);
        const wide_t root = boost::multiprecision::sqrt(product);
        if (root <= MINIMUM_LIQUIDITY)
        {
            return RC_INSUFFICIENT_LIQUIDITY_MINTED;
        }
        liquidity = balance_t(root - MINIMUM_LIQUIDITY);
        const auto st = m_ledger.mint(m_address, address_t(), MINIMUM_LIQUIDITY);
        if (st.failed())
        {
            return st;
        }
    }
    else
    {
        if (m_reserves.empty())
        {
            return RC_INSUFFICIENT_LIQUIDITY_MINTED;
        }
        // an empty side does not constrain the share count
        wide_t share = wide_t(~balance_t(0));
        if (m_reserves.reserve0 > 0)
        {
            share = std::min(share, wide_t(amount0) * wide_t(supply) / wide_t(m_reserves.reserve0));
        }
        if (m_reserves.reserve1 > 0)
        {
            share = std::min(share, wide_t(amount1) * wide_t(supply) / wide_t(m_reserves.reserve1));
        }
        liquidity = balance_t(share);
    }
    if (liquidity == 0)
    {
        return RC_INSUFFICIENT_LIQUIDITY_MINTED;
    }

    const auto st = m_ledger.mint(m_address, to, liquidity);
    if (st.failed())
    {
        return st;
    }
    update(balance0, balance1);
    log_debug("pool %1% mint: %2% shares to %3% for %4%/%5%"
              , m_address
              , liquidity
              , to
              , amount0
              , amount1);
    return liquidity;
}


Outcome<TokenAmounts> LedgerPool::burn(const address_t &to)
{
    const auto balance0 = m_ledger.balanceOf(m_token0, m_address);
    const auto balance1 = m_ledger.balanceOf(m_token1, m_address);
    const auto liquidity = m_ledger.balanceOf(m_address, m_address);
    const auto supply = totalSupply();
    if (supply == 0)
    {
        return RC_INSUFFICIENT_LIQUIDITY_BURNED;
    }

    TokenAmounts out;
    out.amountA = balance_t(wide_t(liquidity) * wide_t(balance0) / wide_t(supply));
    out.amountB = balance_t(wide_t(liquidity) * wide_t(balance1) / wide_t(supply));
    const bool paysOut = m_settings.isXybk()
            ? out.amountA > 0 || out.amountB > 0
            : out.amountA > 0 && out.amountB > 0;
    if (!paysOut)
    {
        return RC_INSUFFICIENT_LIQUIDITY_BURNED;
    }

    auto st = m_ledger.burn(m_address, m_address, liquidity);
    if (st.ok() && out.amountA > 0)
    {
        st = m_ledger.transfer(m_token0, m_address, to, out.amountA);
    }
    if (st.ok() && out.amountB > 0)
    {
        st = m_ledger.transfer(m_token1, m_address, to, out.amountB);
    }
    if (st.failed())
    {
        return st;
    }
    sync();
    log_debug("pool %1% burn: %2% shares for %3%/%4% to %5%"
              , m_address
              , liquidity
              , out.amountA
              , out.amountB
              , to);
    return out;
}


void LedgerPool::setSettings(const PoolSettings &settings)
{
    settings.check_consistency();
    const auto prev = m_settings;
    m_ledger.journal([this, prev]() { m_settings = prev; });
    m_settings = settings;
    log_info("pool %1%: fee %2% bp, %3%, boost %4%/%5%, trade state %6%"
             , m_address
             , m_settings.feeBP
             , m_settings.isXybk() ? "xybk" : "xyk"
             , m_settings.boost0
             , m_settings.boost1
             , static_cast<int>(m_settings.tradeState));
}

void LedgerPool::makeXybk(unsigned boost0, unsigned boost1)
{
    auto s = m_settings;
    s.mode = MODE_XYBK;
    s.boost0 = boost0;
    s.boost1 = boost1;
    setSettings(s);
}

void LedgerPool::makeXyk()
{
    auto s = m_settings;
    s.mode = MODE_XYK;
    setSettings(s);
}

void LedgerPool::updateTradeState(TradeState_e state)
{
    auto s = m_settings;
    s.tradeState = state;
    setSettings(s);
}

void LedgerPool::setFee(unsigned feeBP)
{
    auto s = m_settings;
    s.feeBP = feeBP;
    setSettings(s);
}


} // namespace ledger
} // namespace ammr
