/**
 * @file ammr_errors.hpp
 * @brief Failure reasons and the result types that carry them.
 *
 * Every expected business failure (slippage, expiry, missing liquidity...)
 * is reported as a return code and propagated by early return.
 * Exceptions are reserved for API misuse.
 */

#pragma once

#include "ammr_types.hpp"
#include <string>

namespace ammr {
namespace model {

typedef enum {
    RC_OK = 0,
    RC_EXPIRED,                         ///< deadline passed
    RC_LOCKED,                          ///< reentrant invocation
    RC_INVALID_PATH,                    ///< path too short, broken, or wrong native end
    RC_TRADE_NOT_ALLOWED,               ///< pool trade state forbids the direction
    RC_INSUFFICIENT_OUTPUT_AMOUNT,
    RC_EXCESSIVE_INPUT_AMOUNT,
    RC_INSUFFICIENT_INPUT_AMOUNT,
    RC_INSUFFICIENT_LIQUIDITY,          ///< missing pool, or reserves can't serve the trade
    RC_INSUFFICIENT_AMOUNT,             ///< quote() of a zero amount
    RC_INSUFFICIENT_A_AMOUNT,
    RC_INSUFFICIENT_B_AMOUNT,
    RC_IDENTICAL_ADDRESSES,
    RC_ZERO_ADDRESS,
    RC_PAIR_EXISTS,
    RC_INVARIANT_VIOLATED,              ///< pool rejected the post-swap balances
    RC_INSUFFICIENT_LIQUIDITY_MINTED,
    RC_INSUFFICIENT_LIQUIDITY_BURNED,
    RC_INSUFFICIENT_BALANCE,
    RC_INSUFFICIENT_ALLOWANCE,
    RC_INVALID_SIGNATURE,
    RC_INSUFFICIENT_NATIVE_VALUE,       ///< native value sent doesn't cover the operation
    RC_ARITHMETIC_OVERFLOW,
} ReturnCode_e;

/**
 * @brief human readable reason
 */
const char *rc_describe(ReturnCode_e rc);


/**
 * @brief outcome of an operation which produces no value
 */
struct Status
{
    ReturnCode_e rc = RC_OK;

    Status() = default;
    Status(ReturnCode_e rc_) : rc(rc_) {}

    bool ok() const noexcept { return rc == RC_OK; }
    bool failed() const noexcept { return rc != RC_OK; }
    const char *describe() const { return rc_describe(rc); }
};


/**
 * @brief outcome of an operation which produces a T
 *
 * Either rc != RC_OK, or value holds the result. Construct from a
 * ReturnCode_e (or any failed Status) to report a failure:
 *
 *     Outcome<balance_t> f() {
 *         if (...) return RC_INSUFFICIENT_LIQUIDITY;
 *         return balance_t(42);
 *     }
 */
template<typename T>
struct Outcome: Status
{
    T value{};

    Outcome(ReturnCode_e rc_) : Status(rc_) {}
    Outcome(const Status &s) : Status(s) {}
    Outcome(const T &v) : value(v) {}
    Outcome(T &&v) : value(std::move(v)) {}
};


} // namespace model
} // namespace ammr
