#include "ammr_path_pricer.hpp"
#include <ammr/model/ammr_invariant.hpp>

namespace ammr {
namespace router {

using namespace model;


Outcome<HopView> view_hop(const Registry &registry
                          , const address_t &tokenIn
                          , const address_t &tokenOut)
{
    HopView hop;
    hop.pool = registry.getPool(tokenIn, tokenOut);
    if (hop.pool == nullptr)
    {
        return RC_INSUFFICIENT_LIQUIDITY;
    }
    const auto reserves = hop.pool->getReserves();
    hop.settings = hop.pool->getSettings();
    hop.sellToken0 = tokenIn == hop.pool->token0();
    hop.reserveIn = hop.sellToken0 ? reserves.reserve0 : reserves.reserve1;
    hop.reserveOut = hop.sellToken0 ? reserves.reserve1 : reserves.reserve0;
    return hop;
}


PathPricer::PathPricer(const Registry &registry, unsigned max_path_length)
    : m_registry(registry)
    , m_max_path_length(max_path_length)
{}

Status PathPricer::check_path(const TokenPath &path) const
{
    if (path.size() < 2)
    {
        return RC_INVALID_PATH;
    }
    if (m_max_path_length > 0 && path.size() > m_max_path_length)
    {
        return RC_INVALID_PATH;
    }
    for (std::size_t i = 1; i < path.size(); ++i)
    {
        if (path[i] == path[i-1])
        {
            return RC_INVALID_PATH;
        }
    }
    return RC_OK;
}

Outcome<AmountVector> PathPricer::getAmountsOut(const TokenPath &path, const balance_t &amountIn) const
{
    auto st = check_path(path);
    if (st.failed())
    {
        return st;
    }

    AmountVector amounts(path.size());
    amounts[0] = amountIn;
    for (std::size_t i = 0; i < path.size() - 1; ++i)
    {
        const auto hop = view_hop(m_registry, path[i], path[i+1]);
        if (hop.failed())
        {
            return Status(hop);
        }
        const auto out = amm::getAmountOut(amounts[i]
                                           , hop.value.reserveIn
                                           , hop.value.reserveOut
                                           , hop.value.settings
                                           , hop.value.sellToken0);
        if (out.failed())
        {
            return Status(out);
        }
        amounts[i+1] = out.value;
    }
    return amounts;
}

Outcome<AmountVector> PathPricer::getAmountsIn(const TokenPath &path, const balance_t &amountOut) const
{
    auto st = check_path(path);
    if (st.failed())
    {
        return st;
    }

    AmountVector amounts(path.size());
    amounts.back() = amountOut;
    for (std::size_t i = path.size() - 1; i > 0; --i)
    {
        const auto hop = view_hop(m_registry, path[i-1], path[i]);
        if (hop.failed())
        {
            return Status(hop);
        }
        const auto in = amm::getAmountIn(amounts[i]
                                         , hop.value.reserveIn
                                         , hop.value.reserveOut
                                         , hop.value.settings
                                         , hop.value.sellToken0);
        if (in.failed())
        {
            return Status(in);
        }
        amounts[i-1] = in.value;
    }
    return amounts;
}


} // namespace router
} // namespace ammr
