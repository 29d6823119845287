/**
 * @file ammr_ledger_pool.hpp
 * @brief Reference Pool, keeping its balances in a Ledger
 */

#pragma once

#include "ammr_ledger.hpp"
#include <ammr/model/ammr_pool.hpp>

namespace ammr {
namespace ledger {

using PoolSettings = model::PoolSettings;
using Reserves = model::Reserves;
using TokenAmounts = model::TokenAmounts;
using model::Outcome;


/**
 * @brief A liquidity pool whose token balances live in the Ledger.
 *
 * Reserves are the balances as of the last accounted operation: any
 * excess sitting in the ledger is unaccounted input for the next
 * swap() or mint(). The shares are the ledger token addressed by the
 * pool itself.
 *
 * Reserve changes are journaled in the ledger, so they follow its
 * checkpoints.
 */
class LedgerPool: public model::Pool, boost::noncopyable
{
public:
    /// shares locked forever to the zero address by the first deposit
    static constexpr unsigned MINIMUM_LIQUIDITY = 1000;

    LedgerPool(Ledger &ledger
               , const address_t &address
               , const address_t &token0
               , const address_t &token1
               , const PoolSettings &settings = PoolSettings());

    const address_t &address() const override { return m_address; }
    const address_t &token0() const override { return m_token0; }
    const address_t &token1() const override { return m_token1; }
    Reserves getReserves() const override { return m_reserves; }
    PoolSettings getSettings() const override { return m_settings; }
    balance_t totalSupply() const override;

    /**
     * @brief optimistic swap
     *
     * Both outputs are sent first, then the inputs are measured
     * and the invariant of the current pricing mode is checked on the
     * fee-adjusted balances.
     */
    Status swap(const balance_t &amount0Out
                , const balance_t &amount1Out
                , const address_t &to) override;

    /**
     * The first deposit issues sqrt(amount0 * amount1) shares, of which
     * MINIMUM_LIQUIDITY are locked. Later ones issue shares
     * proportionally to the smallest contribution among the non-empty
     * reserves.
     */
    Outcome<balance_t> mint(const address_t &to) override;

    /**
     * Pays out the share of both balances the burnt shares represent.
     * Plain pools must pay something on both sides, boosted ones may
     * pay on one side only.
     */
    Outcome<TokenAmounts> burn(const address_t &to) override;

    /**
     * @defgroup admin pool administration
     *
     * @throws SettingsConsistencyError on bad values
     * @{
     */
    void setSettings(const PoolSettings &settings);
    void makeXybk(unsigned boost0, unsigned boost1);
    void makeXyk();
    void updateTradeState(model::TradeState_e state);
    void setFee(unsigned feeBP);
    /** @} */

    /**
     * @brief force reserves to match the ledger balances
     */
    void sync();

private:
    Ledger &m_ledger;
    const address_t m_address;
    const address_t m_token0;
    const address_t m_token1;
    PoolSettings m_settings;
    Reserves m_reserves;

    void update(const balance_t &balance0, const balance_t &balance1);
};


} // namespace ledger
} // namespace ammr
