#pragma once

#include <ammr/ledger/ammr_deployment.hpp>
#include <stdexcept>
#include <string>

namespace ammr {
namespace test {

using namespace ammr::model;
using ammr::ledger::Deployment;
using ammr::router::RouterSettings;
using ammr::router::CallContext;
using ammr::router::LiquidityReceipt;

/**
 * @brief throws std::runtime_error carrying @p what unless @p cond holds
 */
void check(bool cond, const std::string &what);

/**
 * @brief throws unless @p st carries exactly @p rc
 */
void check_rc(const Status &st, ReturnCode_e rc, const std::string &what);

/**
 * @brief throws unless @p v == @p expected, reporting both
 */
void check_eq(const balance_t &v, const balance_t &expected, const std::string &what);

/**
 * @brief n * 10^18
 */
balance_t ether(unsigned n);

extern const address_t ROUTER;
extern const address_t WETH;
extern const address_t TOKEN_A;
extern const address_t TOKEN_B;
extern const address_t TOKEN_C;
extern const address_t ALICE;
extern const address_t BOB;

constexpr timestamp_t NOW = 1000;
constexpr timestamp_t DEADLINE = 2000;

RouterSettings default_router_settings();


/**
 * @brief A fresh deployment with ALICE and BOB holding 1000 ether of
 *        TOKEN_A, TOKEN_B, TOKEN_C and native asset. Every token
 *        balance is approved to the router. Ledger time is NOW.
 */
struct Fixture
{
    Deployment d;

    explicit Fixture(const RouterSettings &settings = default_router_settings());

    /**
     * @brief mint @p amount of @p token to @p owner, approve the router for all of it
     */
    void fund(const address_t &token, const address_t &owner, const balance_t &amount);

    CallContext as(const address_t &sender, const balance_t &value = 0) const;

    /**
     * @brief ALICE deposits into the (@p tokenA, @p tokenB) pool, creating it
     *        if needed. Throws on failure.
     */
    LiquidityReceipt seed(const address_t &tokenA
                          , const address_t &tokenB
                          , const balance_t &amountA
                          , const balance_t &amountB);

    balance_t balance(const address_t &token, const address_t &owner) const;
    balance_t native(const address_t &owner) const;
};


}
}
