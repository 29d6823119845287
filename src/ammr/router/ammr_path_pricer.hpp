/**
 * @file ammr_path_pricer.hpp
 * @brief multi-hop quotes
 */

#pragma once

#include <ammr/model/ammr_types.hpp>
#include <ammr/model/ammr_errors.hpp>
#include <ammr/model/ammr_pool.hpp>

namespace ammr {
namespace router {

using address_t = model::address_t;
using balance_t = model::balance_t;
using TokenPath = model::TokenPath;
using AmountVector = model::AmountVector;
using model::Outcome;


/**
 * @brief a pool, seen from the direction of a hop
 */
struct HopView
{
    model::Pool *pool = nullptr;
    model::PoolSettings settings;
    balance_t reserveIn = 0;
    balance_t reserveOut = 0;
    bool sellToken0 = false;
};

/**
 * @brief resolve the pool trading @p tokenIn for @p tokenOut and read its state.
 *
 * Fails with RC_INSUFFICIENT_LIQUIDITY if the pool does not exist.
 */
Outcome<HopView> view_hop(const model::Registry &registry
                          , const address_t &tokenIn
                          , const address_t &tokenOut);


/**
 * @brief Prices a whole path in one pass.
 *
 * The returned AmountVector has one element per path token:
 * element i goes into hop i, element i+1 comes out of it.
 * Any failing hop fails the whole quote, no partial vector is ever returned.
 */
class PathPricer
{
public:
    /**
     * @param max_path_length 0 for no constraint
     */
    PathPricer(const model::Registry &registry, unsigned max_path_length = 0);

    /**
     * @brief RC_INVALID_PATH unless @p path has at least two tokens,
     *        no repeated consecutive token and respects the length limit
     */
    model::Status check_path(const TokenPath &path) const;

    /**
     * @brief exact-in quote, computed forward from path[0]
     */
    Outcome<AmountVector> getAmountsOut(const TokenPath &path, const balance_t &amountIn) const;

    /**
     * @brief exact-out quote, computed backward from the last hop.
     *
     * Element 0 is the minimum input that yields at least @p amountOut.
     */
    Outcome<AmountVector> getAmountsIn(const TokenPath &path, const balance_t &amountOut) const;

private:
    const model::Registry &m_registry;
    unsigned m_max_path_length;
};


} // namespace router
} // namespace ammr
