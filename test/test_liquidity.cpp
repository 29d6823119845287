#include "test_utils.hpp"

using namespace ammr::test;


void test_first_deposit(void)
{
    Fixture f;
    check(f.d.registry.size() == 0, "no pools yet");
    const auto receipt = f.seed(TOKEN_A, TOKEN_B, ether(1), ether(4));
    check(f.d.registry.size() == 1, "pool created on first deposit");

    const auto pool = f.d.registry.lookup(TOKEN_A, TOKEN_B);
    check_eq(receipt.amountA, ether(1), "amountA");
    check_eq(receipt.amountB, ether(4), "amountB");
    check_eq(pool->totalSupply(), ether(2), "sqrt(a*b) shares in total");
    check_eq(receipt.shares, ether(2) - 1000, "minimum liquidity withheld");
    check_eq(f.balance(pool->address(), ALICE), receipt.shares, "shares credited");
    check_eq(f.balance(pool->address(), address_t()), 1000, "minimum liquidity locked");
}

void test_ratio_matching(void)
{
    Fixture f;
    const auto first = f.seed(TOKEN_A, TOKEN_B, ether(5), ether(10));
    const auto supply = first.shares + 1000;

    // B is in excess: deposit follows A
    const auto res = f.d.router.addLiquidity(f.as(BOB)
                                             , TOKEN_A
                                             , TOKEN_B
                                             , ether(1)
                                             , ether(10)
                                             , 0
                                             , 0
                                             , BOB
                                             , DEADLINE);
    check(res.ok(), "addLiquidity");
    check_eq(res.value.amountA, ether(1), "A as desired");
    check_eq(res.value.amountB, ether(2), "B matched to the pool ratio");
    check_eq(res.value.shares, supply / 5, "proportional shares");

    // A is in excess: deposit follows B, and token order doesn't matter
    const auto rev = f.d.router.addLiquidity(f.as(BOB)
                                             , TOKEN_B
                                             , TOKEN_A
                                             , ether(2)
                                             , ether(10)
                                             , 0
                                             , 0
                                             , BOB
                                             , DEADLINE);
    check(rev.ok(), "addLiquidity, reversed");
    check_eq(rev.value.amountA, ether(2), "B as desired");
    check_eq(rev.value.amountB, ether(1), "A matched to the pool ratio");
}

void test_minimums(void)
{
    Fixture f;
    f.seed(TOKEN_A, TOKEN_B, ether(5), ether(10));
    check_rc(f.d.router.addLiquidity(f.as(BOB), TOKEN_A, TOKEN_B, ether(1), ether(10), 0, ether(3), BOB, DEADLINE)
             , RC_INSUFFICIENT_B_AMOUNT
             , "optimal B below minimum");
    check_rc(f.d.router.addLiquidity(f.as(BOB), TOKEN_A, TOKEN_B, ether(10), ether(2), ether(2), 0, BOB, DEADLINE)
             , RC_INSUFFICIENT_A_AMOUNT
             , "optimal A below minimum");
}

void test_remove_all(void)
{
    Fixture f;
    const auto receipt = f.seed(TOKEN_A, TOKEN_B, ether(1), ether(4));
    const auto pool = f.d.registry.lookup(TOKEN_A, TOKEN_B);
    const auto aBefore = f.balance(TOKEN_A, ALICE);

    // shares must be approved like any other token
    check_rc(f.d.router.removeLiquidity(f.as(ALICE), TOKEN_A, TOKEN_B, receipt.shares, 0, 0, ALICE, DEADLINE)
             , RC_INSUFFICIENT_ALLOWANCE
             , "shares not approved");
    f.d.ledger.approve(pool->address(), ALICE, ROUTER, receipt.shares);

    check_rc(f.d.router.removeLiquidity(f.as(ALICE), TOKEN_A, TOKEN_B, receipt.shares, ether(1), 0, ALICE, DEADLINE)
             , RC_INSUFFICIENT_A_AMOUNT
             , "minimum A not met");

    const auto res = f.d.router.removeLiquidity(f.as(ALICE), TOKEN_A, TOKEN_B, receipt.shares, 0, 0, ALICE, DEADLINE);
    check(res.ok(), "removeLiquidity");
    check_eq(res.value.amountA, ether(1) - 500, "A returned");
    check_eq(res.value.amountB, ether(4) - 2000, "B returned");
    check_eq(f.balance(TOKEN_A, ALICE) - aBefore, res.value.amountA, "A credited");
    check_eq(pool->getReserves().reserve0, 500, "locked liquidity backs reserve0");
    check_eq(pool->getReserves().reserve1, 2000, "locked liquidity backs reserve1");
    check_eq(pool->totalSupply(), 1000, "only the locked shares remain");
}

void test_remove_reversed_order(void)
{
    Fixture f;
    const auto receipt = f.seed(TOKEN_A, TOKEN_B, ether(1), ether(4));
    const auto pool = f.d.registry.lookup(TOKEN_A, TOKEN_B);
    f.d.ledger.approve(pool->address(), ALICE, ROUTER, receipt.shares);

    const auto res = f.d.router.removeLiquidity(f.as(ALICE), TOKEN_B, TOKEN_A, receipt.shares / 2, 0, 0, ALICE, DEADLINE);
    check(res.ok(), "removeLiquidity, reversed");
    check(res.value.amountA > res.value.amountB, "amounts follow the caller's token order");
}

void test_one_sided_deposit(void)
{
    Fixture f;
    f.seed(TOKEN_A, TOKEN_B, ether(1), ether(4));
    auto pool = f.d.registry.lookup(TOKEN_A, TOKEN_B);
    pool->makeXybk(10, 10);

    // boosted pools let a trader buy the whole token0 reserve
    const auto drain = f.d.router.swapTokensForExactTokens(f.as(BOB)
                                                           , ether(1)
                                                           , ether(10)
                                                           , {TOKEN_B, TOKEN_A}
                                                           , BOB
                                                           , DEADLINE);
    check(drain.ok(), "drain");
    check_eq(pool->getReserves().reserve0, 0, "token0 drained");
    check_eq(pool->getReserves().reserve1, balance_t("5184649172409150534"), "token1 balance");

    // the drained side deposits nothing, any minimum on it fails
    check_rc(f.d.router.addLiquidity(f.as(BOB), TOKEN_A, TOKEN_B, ether(1), ether(1), ether(1), 0, BOB, DEADLINE)
             , RC_INSUFFICIENT_A_AMOUNT
             , "minimum on the drained side");
    check_rc(f.d.router.addLiquidity(f.as(BOB), TOKEN_B, TOKEN_A, ether(1), ether(1), 0, 1, BOB, DEADLINE)
             , RC_INSUFFICIENT_B_AMOUNT
             , "minimum on the drained side, reversed order");
    check_rc(f.d.router.addLiquidity(f.as(BOB), TOKEN_A, TOKEN_B, ether(1), ether(1), 0, ether(2), BOB, DEADLINE)
             , RC_INSUFFICIENT_B_AMOUNT
             , "minimum above the desired amount");
    check_eq(pool->getReserves().reserve0, 0, "refused deposits left token0 alone");

    const auto res = f.d.router.addLiquidity(f.as(BOB)
                                             , TOKEN_A
                                             , TOKEN_B
                                             , ether(1)
                                             , balance_t("5184649172409150534")
                                             , 0
                                             , 0
                                             , BOB
                                             , DEADLINE);
    check(res.ok(), "one sided deposit");
    check_eq(res.value.amountA, 0, "nothing deposited on the drained side");
    check_eq(res.value.amountB, balance_t("5184649172409150534"), "all of B deposited");
    check_eq(res.value.shares, ether(2), "supply doubled");
}

void test_empty_pool_needs_both_sides(void)
{
    Fixture f;
    check_rc(f.d.router.addLiquidity(f.as(ALICE), TOKEN_A, TOKEN_B, ether(1), 0, 0, 0, ALICE, DEADLINE)
             , RC_INSUFFICIENT_LIQUIDITY_MINTED
             , "sqrt(a*0)");
    check(f.d.registry.size() == 0, "pool creation reverted");
    check_rc(f.d.router.addLiquidity(f.as(ALICE), TOKEN_A, TOKEN_A, ether(1), ether(1), 0, 0, ALICE, DEADLINE)
             , RC_IDENTICAL_ADDRESSES
             , "identical tokens");
}

int main()
{
    test_first_deposit();
    test_ratio_matching();
    test_minimums();
    test_remove_all();
    test_remove_reversed_order();
    test_one_sided_deposit();
    test_empty_pool_needs_both_sides();
}
