/**
 * @file ammr_swap_executor.hpp
 * @brief hop-by-hop execution of a priced path
 */

#pragma once

#include "ammr_path_pricer.hpp"
#include <ammr/model/ammr_model_fwd.hpp>

namespace ammr {
namespace router {


/**
 * @brief Drives the pools of a path, one swap per hop.
 *
 * Funds are forwarded optimistically: every hop sends its output
 * straight to the pool of the next hop, and the last hop to the
 * recipient. The router never takes custody of intermediate amounts.
 */
class SwapExecutor
{
public:
    SwapExecutor(const model::Registry &registry, const model::TokenLedger &ledger);

    /**
     * @brief run the swaps planned by @p amounts along @p path
     *
     * Precondition: amounts[0] of path[0] already sits in the first
     * pool's balance. This call does not deliver it: if it is missing,
     * the first pool refuses the swap (RC_INSUFFICIENT_INPUT_AMOUNT, or
     * RC_INVARIANT_VIOLATED when only part of it was delivered).
     *
     * @throws bad_argument if @p amounts and @p path sizes mismatch
     */
    model::Status execute(const AmountVector &amounts
                          , const TokenPath &path
                          , const address_t &to);

    /**
     * @brief same protocol as execute(), for tokens that charge a fee
     *        on transfer.
     *
     * The input of each hop is measured as the pool's balance in excess
     * of its reserve, and its output is priced on the spot.
     */
    model::Status executeSupportingFeeOnTransfer(const TokenPath &path
                                                 , const address_t &to);

private:
    const model::Registry &m_registry;
    const model::TokenLedger &m_ledger;

    Outcome<address_t> recipient_of_hop(const TokenPath &path
                                        , std::size_t i
                                        , const address_t &to) const;
};


} // namespace router
} // namespace ammr
