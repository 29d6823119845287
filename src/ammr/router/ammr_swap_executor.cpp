#include "ammr_swap_executor.hpp"
#include <ammr/model/ammr_invariant.hpp>
#include <ammr/model/ammr_collaborators.hpp>
#include <ammr/commons/ammr_log.hpp>

namespace ammr {
namespace router {

using namespace model;


SwapExecutor::SwapExecutor(const Registry &registry, const TokenLedger &ledger)
    : m_registry(registry)
    , m_ledger(ledger)
{}

Outcome<address_t> SwapExecutor::recipient_of_hop(const TokenPath &path
                                                  , std::size_t i
                                                  , const address_t &to) const
{
    if (i + 2 >= path.size())
    {
        return to;
    }
    const auto next = m_registry.getPool(path[i+1], path[i+2]);
    if (next == nullptr)
    {
        return RC_INSUFFICIENT_LIQUIDITY;
    }
    return next->address();
}

Status SwapExecutor::execute(const AmountVector &amounts
                             , const TokenPath &path
                             , const address_t &to)
{
    if (amounts.size() != path.size())
    {
        throw bad_argument(strfmt("amounts/path size mismatch: %1% vs %2%"
                                  , amounts.size()
                                  , path.size()));
    }

    for (std::size_t i = 0; i + 1 < path.size(); ++i)
    {
        const auto pool = m_registry.getPool(path[i], path[i+1]);
        if (pool == nullptr)
        {
            return RC_INSUFFICIENT_LIQUIDITY;
        }
        const auto recipient = recipient_of_hop(path, i, to);
        if (recipient.failed())
        {
            return recipient;
        }

        const balance_t &amountOut = amounts[i+1];
        const bool outIsToken0 = path[i+1] == pool->token0();
        const auto st = pool->swap(outIsToken0 ? amountOut : balance_t(0)
                                   , outIsToken0 ? balance_t(0) : amountOut
                                   , recipient.value);
        if (st.failed())
        {
            log_debug("hop %1% (%2% -> %3%) refused by pool %4%: %5%"
                      , i
                      , path[i]
                      , path[i+1]
                      , pool->address()
                      , st.describe());
            return st;
        }
    }
    return RC_OK;
}

Status SwapExecutor::executeSupportingFeeOnTransfer(const TokenPath &path
                                                    , const address_t &to)
{
    for (std::size_t i = 0; i + 1 < path.size(); ++i)
    {
        const auto hop = view_hop(m_registry, path[i], path[i+1]);
        if (hop.failed())
        {
            return hop;
        }
        const auto recipient = recipient_of_hop(path, i, to);
        if (recipient.failed())
        {
            return recipient;
        }

        const auto &h = hop.value;
        const auto balance = m_ledger.balanceOf(path[i], h.pool->address());
        if (balance < h.reserveIn)
        {
            return RC_INSUFFICIENT_INPUT_AMOUNT;
        }
        const auto amountOut = amm::getAmountOut(balance - h.reserveIn
                                                 , h.reserveIn
                                                 , h.reserveOut
                                                 , h.settings
                                                 , h.sellToken0);
        if (amountOut.failed())
        {
            return amountOut;
        }

        const auto st = h.pool->swap(h.sellToken0 ? balance_t(0) : amountOut.value
                                     , h.sellToken0 ? amountOut.value : balance_t(0)
                                     , recipient.value);
        if (st.failed())
        {
            return st;
        }
    }
    return RC_OK;
}


} // namespace router
} // namespace ammr
