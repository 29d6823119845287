/**
 * @file ammr_pool.hpp
 * @brief Pool and Registry collaborators as seen by the router.
 *
 * The router never owns reserves. It reads a pool's state, prices trades
 * against it and asks it to move funds. The pool is the authority
 * that accepts or rejects every reserve transition.
 */

#pragma once

#include "ammr_types.hpp"
#include "ammr_errors.hpp"
#include <utility>

namespace ammr {
namespace model {

/**
 * @brief which direction(s) a pool currently trades
 *
 * "Sell" is from the trader's point of view:
 * TRADE_SELL_TOKEN0_ONLY accepts token0 in (token0 -> token1) only.
 */
typedef enum {
    TRADE_SELL_ALL = 0,
    TRADE_SELL_TOKEN0_ONLY = 1,
    TRADE_SELL_TOKEN1_ONLY = 2,
    TRADE_SELL_NONE = 3,
} TradeState_e;

/**
 * @brief pricing curve of a pool
 */
typedef enum {
    MODE_XYK,   ///< plain constant product
    MODE_XYBK,  ///< boosted constant product, flatter around the balanced point
} PricingMode_e;

/// fees are expressed in basis points of this
constexpr unsigned FEE_DENOMINATOR = 10000;
/// 0.3%, same as 997/1000
constexpr unsigned DEFAULT_FEE_BP = 30;

struct SettingsConsistencyError: std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/**
 * @brief Per-pool pricing parameters
 */
struct PoolSettings
{
    /**
     * @brief fee taken from the input, basis points
     *
     * @default 30 (0.3%)
     */
    unsigned feeBP = DEFAULT_FEE_BP;

    TradeState_e tradeState = TRADE_SELL_ALL;

    PricingMode_e mode = MODE_XYK;

    /**
     * @brief boost coefficients, only meaningful in MODE_XYBK.
     *
     * boost0 applies while token0's balance is above the balanced point,
     * boost1 while token1's is. A boost of 1 is plain constant product.
     *
     * @default 1
     */
    unsigned boost0 = 1;
    unsigned boost1 = 1;

    bool isXybk() const noexcept { return mode == MODE_XYBK; }

    /**
     * @brief true if the trade state allows selling token0 (@p sellToken0)
     *        or token1 (!@p sellToken0) into the pool
     */
    bool allows(bool sellToken0) const noexcept;

    void check_consistency() const;
};

struct Reserves
{
    balance_t reserve0 = 0;
    balance_t reserve1 = 0;

    bool empty() const noexcept { return reserve0 == 0 && reserve1 == 0; }
};


/**
 * @brief canonical (token0, token1) ordering of a pair
 *
 * Fails with RC_IDENTICAL_ADDRESSES or RC_ZERO_ADDRESS.
 */
Outcome<std::pair<address_t, address_t>> canonicalize(const address_t &tokenA
                                                      , const address_t &tokenB);


/**
 * @brief A liquidity pool for one token pair.
 *
 * Pool shares are themselves a fungible token, addressed by the pool address.
 */
struct Pool
{
    virtual ~Pool() {}

    virtual const address_t &address() const = 0;
    virtual const address_t &token0() const = 0;
    virtual const address_t &token1() const = 0;

    virtual Reserves getReserves() const = 0;
    virtual PoolSettings getSettings() const = 0;
    virtual balance_t totalSupply() const = 0;

    /**
     * @brief send amount0Out/amount1Out to @p to.
     *
     * The input side must already sit in the pool's balance, unaccounted
     * by its reserves. The pool measures it, then rejects the whole call
     * (RC_INVARIANT_VIOLATED, RC_TRADE_NOT_ALLOWED ...) unless its
     * invariant holds after the transfer.
     */
    virtual Status swap(const balance_t &amount0Out
                        , const balance_t &amount1Out
                        , const address_t &to) = 0;

    /**
     * @brief issue shares to @p to for the unaccounted balances previously
     *        delivered to the pool
     */
    virtual Outcome<balance_t> mint(const address_t &to) = 0;

    /**
     * @brief burn the shares previously delivered to the pool and pay
     *        out the proportional reserves to @p to
     * @return (amount0, amount1), in canonical token order
     */
    virtual Outcome<TokenAmounts> burn(const address_t &to) = 0;
};


/**
 * @brief Maps a token pair to its pool.
 */
struct Registry
{
    virtual ~Registry() {}

    /**
     * @return the pool for the unordered pair, or nullptr
     */
    virtual Pool *getPool(const address_t &tokenA, const address_t &tokenB) const = 0;

    /**
     * @brief create the pool for the unordered pair.
     *        Fails with RC_PAIR_EXISTS if it is already there.
     */
    virtual Outcome<Pool *> createPool(const address_t &tokenA, const address_t &tokenB) = 0;
};


} // namespace model
} // namespace ammr
