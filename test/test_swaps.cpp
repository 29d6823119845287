#include <ammr/router/ammr_swap_executor.hpp>
#include "test_utils.hpp"

using namespace ammr::test;
using ammr::router::SwapExecutor;


void test_exact_in(void)
{
    Fixture f;
    f.seed(TOKEN_A, TOKEN_B, ether(5), ether(10));
    const auto aBefore = f.balance(TOKEN_A, BOB);
    const auto bBefore = f.balance(TOKEN_B, BOB);

    const auto res = f.d.router.swapExactTokensForTokens(f.as(BOB)
                                                         , ether(1)
                                                         , balance_t("1662497915624478906")
                                                         , {TOKEN_A, TOKEN_B}
                                                         , BOB
                                                         , DEADLINE);
    check(res.ok(), "swapExactTokensForTokens");
    check_eq(res.value.back(), balance_t("1662497915624478906"), "output");
    check_eq(aBefore - f.balance(TOKEN_A, BOB), ether(1), "input debited");
    check_eq(f.balance(TOKEN_B, BOB) - bBefore, res.value.back(), "output credited");

    const auto pool = f.d.registry.lookup(TOKEN_A, TOKEN_B);
    check_eq(pool->getReserves().reserve0, ether(6), "reserve0 synced");
    check_eq(pool->getReserves().reserve1, ether(10) - res.value.back(), "reserve1 synced");
    check(f.balance(TOKEN_A, ROUTER) == 0 && f.balance(TOKEN_B, ROUTER) == 0, "router holds nothing");
}

void test_exact_in_slippage(void)
{
    Fixture f;
    f.seed(TOKEN_A, TOKEN_B, ether(5), ether(10));
    const auto aBefore = f.balance(TOKEN_A, BOB);
    const auto res = f.d.router.swapExactTokensForTokens(f.as(BOB)
                                                         , ether(1)
                                                         , balance_t("1662497915624478907")
                                                         , {TOKEN_A, TOKEN_B}
                                                         , BOB
                                                         , DEADLINE);
    check_rc(res, RC_INSUFFICIENT_OUTPUT_AMOUNT, "min output not met");
    check_eq(f.balance(TOKEN_A, BOB), aBefore, "nothing moved");
}

void test_exact_out(void)
{
    Fixture f;
    f.seed(TOKEN_A, TOKEN_B, ether(5), ether(10));
    const auto aBefore = f.balance(TOKEN_A, BOB);

    check_rc(f.d.router.swapTokensForExactTokens(f.as(BOB)
                                                 , ether(1)
                                                 , balance_t("557227237267357628")
                                                 , {TOKEN_A, TOKEN_B}
                                                 , BOB
                                                 , DEADLINE)
             , RC_EXCESSIVE_INPUT_AMOUNT
             , "max input not met");

    const auto res = f.d.router.swapTokensForExactTokens(f.as(BOB)
                                                         , ether(1)
                                                         , balance_t("557227237267357629")
                                                         , {TOKEN_A, TOKEN_B}
                                                         , BOB
                                                         , DEADLINE);
    check(res.ok(), "swapTokensForExactTokens");
    check_eq(res.value.front(), balance_t("557227237267357629"), "input");
    check_eq(aBefore - f.balance(TOKEN_A, BOB), res.value.front(), "input debited");
}

void test_multi_hop(void)
{
    Fixture f;
    f.seed(TOKEN_A, TOKEN_B, ether(5), ether(10));
    f.seed(TOKEN_B, TOKEN_C, ether(10), ether(10));
    const auto bBefore = f.balance(TOKEN_B, BOB);
    const auto cBefore = f.balance(TOKEN_C, BOB);

    const auto res = f.d.router.swapExactTokensForTokens(f.as(BOB)
                                                         , ether(1)
                                                         , 0
                                                         , {TOKEN_A, TOKEN_B, TOKEN_C}
                                                         , BOB
                                                         , DEADLINE);
    check(res.ok(), "multi hop");
    check_eq(res.value[2], balance_t("1421839107917040301"), "multi hop output");
    check_eq(f.balance(TOKEN_C, BOB) - cBefore, res.value[2], "output credited");
    // intermediate tokens go from pool to pool
    check_eq(f.balance(TOKEN_B, BOB), bBefore, "intermediate never reaches the caller");

    const auto bc = f.d.registry.lookup(TOKEN_B, TOKEN_C);
    check_eq(bc->getReserves().reserve0, ether(10) + res.value[1], "second pool got the intermediate amount");
}

static balance_t reserve_of(const ammr::ledger::LedgerPool *pool, const address_t &token)
{
    const auto r = pool->getReserves();
    return token == pool->token0() ? r.reserve0 : r.reserve1;
}

void test_conservation(void)
{
    Fixture f;
    f.seed(TOKEN_A, TOKEN_B, ether(5), ether(10));
    f.seed(TOKEN_B, TOKEN_C, ether(10), ether(10));
    const auto ab = f.d.registry.lookup(TOKEN_A, TOKEN_B);
    const auto bc = f.d.registry.lookup(TOKEN_B, TOKEN_C);

    for (const bool exactIn: {true, false})
    {
        const auto a0 = reserve_of(ab, TOKEN_A);
        const auto b0 = reserve_of(ab, TOKEN_B);
        const auto b1 = reserve_of(bc, TOKEN_B);
        const auto c1 = reserve_of(bc, TOKEN_C);
        const wide_t kab = wide_t(a0) * wide_t(b0);
        const wide_t kbc = wide_t(b1) * wide_t(c1);
        const auto aBob = f.balance(TOKEN_A, BOB);
        const auto cBob = f.balance(TOKEN_C, BOB);

        const auto res = exactIn
                ? f.d.router.swapExactTokensForTokens(f.as(BOB), ether(1), 0, {TOKEN_A, TOKEN_B, TOKEN_C}, BOB, DEADLINE)
                : f.d.router.swapTokensForExactTokens(f.as(BOB), ether(1), ether(10), {TOKEN_A, TOKEN_B, TOKEN_C}, BOB, DEADLINE);
        check(res.ok(), exactIn ? "exact in" : "exact out");
        const auto &amounts = res.value;

        // every hop moves exactly the quoted amounts, pool to pool
        check_eq(reserve_of(ab, TOKEN_A), a0 + amounts[0], "first pool takes the input");
        check_eq(reserve_of(ab, TOKEN_B), b0 - amounts[1], "first pool pays the intermediate");
        check_eq(reserve_of(bc, TOKEN_B), b1 + amounts[1], "second pool takes the intermediate");
        check_eq(reserve_of(bc, TOKEN_C), c1 - amounts[2], "second pool pays the output");
        check_eq(aBob - f.balance(TOKEN_A, BOB), amounts[0], "caller pays the input");
        check_eq(f.balance(TOKEN_C, BOB) - cBob, amounts[2], "caller gets the output");

        // the fee stays in the pools
        check(wide_t(reserve_of(ab, TOKEN_A)) * wide_t(reserve_of(ab, TOKEN_B)) > kab, "first pool k grows");
        check(wide_t(reserve_of(bc, TOKEN_B)) * wide_t(reserve_of(bc, TOKEN_C)) > kbc, "second pool k grows");
    }
}

void test_recipient(void)
{
    Fixture f;
    f.seed(TOKEN_A, TOKEN_B, ether(5), ether(10));
    const auto aliceBefore = f.balance(TOKEN_B, ALICE);
    const auto res = f.d.router.swapExactTokensForTokens(f.as(BOB)
                                                         , ether(1)
                                                         , 0
                                                         , {TOKEN_A, TOKEN_B}
                                                         , ALICE
                                                         , DEADLINE);
    check(res.ok(), "swap to a third party");
    check_eq(f.balance(TOKEN_B, ALICE) - aliceBefore, res.value.back(), "recipient credited");
}

void test_invalid_paths(void)
{
    Fixture f;
    f.seed(TOKEN_A, TOKEN_B, ether(5), ether(10));
    check_rc(f.d.router.swapExactTokensForTokens(f.as(BOB), ether(1), 0, {TOKEN_A}, BOB, DEADLINE)
             , RC_INVALID_PATH
             , "single token path");
    check_rc(f.d.router.swapExactTokensForTokens(f.as(BOB), ether(1), 0, {TOKEN_A, TOKEN_C}, BOB, DEADLINE)
             , RC_INSUFFICIENT_LIQUIDITY
             , "no pool");
}

void test_trade_state(void)
{
    Fixture f;
    f.seed(TOKEN_A, TOKEN_B, ether(5), ether(10));
    auto pool = f.d.registry.lookup(TOKEN_A, TOKEN_B);
    pool->updateTradeState(TRADE_SELL_TOKEN1_ONLY);

    check_rc(f.d.router.swapExactTokensForTokens(f.as(BOB), ether(1), 0, {TOKEN_A, TOKEN_B}, BOB, DEADLINE)
             , RC_TRADE_NOT_ALLOWED
             , "token0 can't be sold");
    check(f.d.router.swapExactTokensForTokens(f.as(BOB), ether(1), 0, {TOKEN_B, TOKEN_A}, BOB, DEADLINE).ok()
          , "token1 can be sold");
}

void test_boosted_pool(void)
{
    Fixture f;
    f.seed(TOKEN_A, TOKEN_B, ether(96), ether(101));
    f.d.registry.lookup(TOKEN_A, TOKEN_B)->makeXybk(10, 10);

    const auto res = f.d.router.swapExactTokensForTokens(f.as(BOB)
                                                         , ether(10)
                                                         , 0
                                                         , {TOKEN_A, TOKEN_B}
                                                         , BOB
                                                         , DEADLINE);
    check(res.ok(), "boosted swap");
    check_eq(res.value.back(), balance_t("9920071714348123486"), "boosted output");
}

void test_pool_rejects_undelivered_input(void)
{
    Fixture f;
    f.seed(TOKEN_A, TOKEN_B, ether(5), ether(10));
    SwapExecutor executor(f.d.registry, f.d.ledger);
    const AmountVector amounts{ether(1), balance_t("1662497915624478906")};

    // nothing was sent to the pool beforehand
    auto cp = f.d.ledger.checkpoint();
    check_rc(executor.execute(amounts, {TOKEN_A, TOKEN_B}, BOB), RC_INSUFFICIENT_INPUT_AMOUNT, "no input");
    f.d.ledger.revert(cp);

    // half of it was
    const auto pool = f.d.registry.lookup(TOKEN_A, TOKEN_B);
    cp = f.d.ledger.checkpoint();
    check(f.d.ledger.transfer(TOKEN_A, BOB, pool->address(), ether(1) / 2).ok(), "partial delivery");
    check_rc(executor.execute(amounts, {TOKEN_A, TOKEN_B}, BOB), RC_INVARIANT_VIOLATED, "partial input");
    f.d.ledger.revert(cp);
    check_eq(f.balance(TOKEN_B, pool->address()), ether(10), "pool balance restored");

    bool thrown = false;
    try {
        executor.execute({ether(1)}, {TOKEN_A, TOKEN_B}, BOB);
    } catch (const ammr::bad_argument &) {
        thrown = true;
    }
    check(thrown, "amounts/path mismatch");
}

void test_quotes(void)
{
    Fixture f;
    f.seed(TOKEN_A, TOKEN_B, ether(5), ether(10));
    const auto out = f.d.router.getAmountsOut(ether(1), {TOKEN_A, TOKEN_B});
    check_eq(out.value.back(), balance_t("1662497915624478906"), "getAmountsOut");
    const auto in = f.d.router.getAmountsIn(ether(1), {TOKEN_A, TOKEN_B});
    check_eq(in.value.front(), balance_t("557227237267357629"), "getAmountsIn");
    check_eq(f.d.router.quote(ether(1), ether(5), ether(10)).value, ether(2), "quote");
    check_eq(f.d.router.getAmountOut(ether(1), ether(5), ether(10)).value, balance_t("1662497915624478906"), "getAmountOut");
    check_eq(f.d.router.getAmountIn(ether(1), ether(5), ether(10)).value, balance_t("557227237267357629"), "getAmountIn");
}

int main()
{
    test_exact_in();
    test_exact_in_slippage();
    test_exact_out();
    test_multi_hop();
    test_conservation();
    test_recipient();
    test_invalid_paths();
    test_trade_state();
    test_boosted_pool();
    test_pool_rejects_undelivered_input();
    test_quotes();
}
