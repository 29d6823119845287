/**
 * @file ammr_liquidity.hpp
 * @brief proportional deposits and withdrawals
 */

#pragma once

#include <ammr/model/ammr_types.hpp>
#include <ammr/model/ammr_errors.hpp>
#include <ammr/model/ammr_model_fwd.hpp>

namespace ammr {
namespace router {

using address_t = model::address_t;
using balance_t = model::balance_t;
using TokenAmounts = model::TokenAmounts;
using model::Outcome;


/**
 * @brief Sizes liquidity deposits and drives Pool::mint()/Pool::burn().
 *
 * All amounts are in the caller's (tokenA, tokenB) order.
 */
class LiquidityManager
{
public:
    /**
     * @param self the router identity, spender of the payers' allowances
     */
    LiquidityManager(model::Registry &registry
                     , model::TokenLedger &ledger
                     , const address_t &self);

    /**
     * @brief the amounts to deposit so that the pool ratio is preserved
     *
     * Creates the pool if missing. Fresh pools take both desired amounts
     * as they are, and so do boosted pools that went one-sided on the
     * missing side. Otherwise the desired amount of one token is matched
     * with quote() of the other, the smaller pairing wins, and the
     * matched amount must reach its minimum (RC_INSUFFICIENT_A_AMOUNT,
     * RC_INSUFFICIENT_B_AMOUNT).
     */
    Outcome<TokenAmounts> computeDeposit(const address_t &tokenA
                                         , const address_t &tokenB
                                         , const balance_t &desiredA
                                         , const balance_t &desiredB
                                         , const balance_t &minA
                                         , const balance_t &minB);

    /**
     * @brief deliver @p amounts to the pool and mint the shares to @p to
     *
     * Each side is paid by its own payer, which may be the router itself.
     * @return shares issued
     */
    Outcome<balance_t> provide(const address_t &tokenA
                               , const address_t &tokenB
                               , const TokenAmounts &amounts
                               , const address_t &payerA
                               , const address_t &payerB
                               , const address_t &to);

    /**
     * @brief return @p shares of @p owner to the pool, paying out to @p to
     * @return (amountA, amountB) received
     */
    Outcome<TokenAmounts> remove(const address_t &tokenA
                                 , const address_t &tokenB
                                 , const balance_t &shares
                                 , const balance_t &minA
                                 , const balance_t &minB
                                 , const address_t &owner
                                 , const address_t &to);

private:
    model::Registry &m_registry;
    model::TokenLedger &m_ledger;
    address_t m_self;
};


} // namespace router
} // namespace ammr
