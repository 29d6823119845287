#include "test_utils.hpp"

// for test code only:
#include <iostream>
#include <sstream>

namespace ammr {
namespace test {


void check(bool cond, const std::string &what)
{
    if (!cond)
    {
        throw std::runtime_error(what);
    }
}

void check_rc(const Status &st, ReturnCode_e rc, const std::string &what)
{
    if (st.rc != rc)
    {
        std::ostringstream ss;
        ss << what << ": got \"" << st.describe() << "\", expected \"" << rc_describe(rc) << "\"";
        throw std::runtime_error(ss.str());
    }
}

void check_eq(const balance_t &v, const balance_t &expected, const std::string &what)
{
    if (v != expected)
    {
        std::ostringstream ss;
        ss << what << ": got " << v << ", expected " << expected;
        throw std::runtime_error(ss.str());
    }
}

balance_t ether(unsigned n)
{
    return balance_t(n) * balance_t("1000000000000000000");
}


const address_t ROUTER  ("0x1000000000000000000000000000000000000001");
const address_t WETH    ("0x2000000000000000000000000000000000000002");
const address_t TOKEN_A ("0x3000000000000000000000000000000000000003");
const address_t TOKEN_B ("0x4000000000000000000000000000000000000004");
const address_t TOKEN_C ("0x5000000000000000000000000000000000000005");
const address_t ALICE   ("0xa11ce00000000000000000000000000000000001");
const address_t BOB     ("0xb0b0000000000000000000000000000000000002");


RouterSettings default_router_settings()
{
    RouterSettings s;
    s.router_address = ROUTER;
    s.wrapped_native = WETH;
    return s;
}


Fixture::Fixture(const RouterSettings &settings)
    : d(settings)
{
    d.ledger.set_now(NOW);
    for (const auto &owner: {ALICE, BOB})
    {
        for (const auto &token: {TOKEN_A, TOKEN_B, TOKEN_C})
        {
            fund(token, owner, ether(1000));
        }
        d.ledger.creditNative(owner, ether(1000));
        // wrapped native is approved as well, for the token -> native paths
        d.ledger.approve(WETH, owner, settings.router_address, ~balance_t(0));
    }
}

void Fixture::fund(const address_t &token, const address_t &owner, const balance_t &amount)
{
    check(d.ledger.mint(token, owner, amount).ok(), "fund: mint");
    d.ledger.approve(token, owner, d.router.address(), ~balance_t(0));
}

CallContext Fixture::as(const address_t &sender, const balance_t &value) const
{
    CallContext ctx;
    ctx.sender = sender;
    ctx.value = value;
    return ctx;
}

LiquidityReceipt Fixture::seed(const address_t &tokenA
                               , const address_t &tokenB
                               , const balance_t &amountA
                               , const balance_t &amountB)
{
    const auto res = d.router.addLiquidity(as(ALICE)
                                           , tokenA
                                           , tokenB
                                           , amountA
                                           , amountB
                                           , 0
                                           , 0
                                           , ALICE
                                           , DEADLINE);
    if (res.failed())
    {
        std::cerr << "seed failed: " << res.describe() << std::endl;
        throw std::runtime_error("seed");
    }
    return res.value;
}

balance_t Fixture::balance(const address_t &token, const address_t &owner) const
{
    return d.ledger.balanceOf(token, owner);
}

balance_t Fixture::native(const address_t &owner) const
{
    return d.ledger.nativeBalanceOf(owner);
}


}
}
