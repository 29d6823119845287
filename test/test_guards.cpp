#include <ammr/router/ammr_guards.hpp>
#include "test_utils.hpp"

using namespace ammr::test;
using ammr::router::ReentrancyGuard;
using ammr::router::DeadlineGuard;


void test_deadline(void)
{
    Fixture f;
    f.seed(TOKEN_A, TOKEN_B, ether(5), ether(10));
    const DeadlineGuard guard(f.d.ledger);
    check(guard.check(NOW).ok(), "deadline == now is still valid");
    check_rc(guard.check(NOW - 1), RC_EXPIRED, "deadline in the past");

    const auto before = f.balance(TOKEN_A, BOB);
    check_rc(f.d.router.swapExactTokensForTokens(f.as(BOB), ether(1), 0, {TOKEN_A, TOKEN_B}, BOB, NOW - 1)
             , RC_EXPIRED
             , "expired swap");
    check_eq(f.balance(TOKEN_A, BOB), before, "expired swap moved nothing");

    // expiry is checked before anything else, even a malformed path
    check_rc(f.d.router.swapExactTokensForTokens(f.as(BOB), ether(1), 0, {}, BOB, NOW - 1)
             , RC_EXPIRED
             , "expiry first");
}

void test_lock(void)
{
    ReentrancyGuard guard;
    {
        ReentrancyGuard::Lock outer(guard);
        check(outer.acquired() && guard.locked(), "first lock");
        ReentrancyGuard::Lock inner(guard);
        check(!inner.acquired(), "second lock refused");
        check_rc(inner.status(), RC_LOCKED, "second lock status");
    }
    check(!guard.locked(), "released on scope exit");
}

void test_reentrant_call(void)
{
    Fixture f;
    f.seed(TOKEN_A, TOKEN_B, ether(5), ether(10));

    // TOKEN_A calls back into the router while being transferred
    Status inner;
    unsigned calls = 0;
    f.d.ledger.set_transfer_hook(TOKEN_A, [&](const address_t &, const address_t &, const address_t &, const balance_t &) {
        ++calls;
        inner = f.d.router.swapExactTokensForTokens(f.as(BOB), ether(1), 0, {TOKEN_A, TOKEN_B}, BOB, DEADLINE);
    });

    const auto outer = f.d.router.swapExactTokensForTokens(f.as(ALICE), ether(1), 0, {TOKEN_A, TOKEN_B}, ALICE, DEADLINE);
    check(outer.ok(), "outer swap completes");
    check(calls == 1, "hook ran once");
    check_rc(inner, RC_LOCKED, "reentrant swap refused");

    f.d.ledger.set_transfer_hook(TOKEN_A, ammr::ledger::transfer_hook_t());
    check(f.d.router.swapExactTokensForTokens(f.as(BOB), ether(1), 0, {TOKEN_A, TOKEN_B}, BOB, DEADLINE).ok()
          , "lock released afterwards");
}

void test_rollback(void)
{
    Fixture f;
    const auto aBefore = f.balance(TOKEN_A, BOB);

    // A gets paid in, then B's transfer fails: everything unwinds, pool creation included
    f.d.ledger.approve(TOKEN_B, BOB, ROUTER, 0);
    check_rc(f.d.router.addLiquidity(f.as(BOB), TOKEN_A, TOKEN_B, ether(1), ether(1), 0, 0, BOB, DEADLINE)
             , RC_INSUFFICIENT_ALLOWANCE
             , "B not approved");
    check_eq(f.balance(TOKEN_A, BOB), aBefore, "A payment reverted");
    check(f.d.registry.size() == 0, "pool creation reverted");
    check(f.d.ledger.depth() == 0, "no checkpoint left open");
}

void test_exception_reverts(void)
{
    Fixture f;
    f.seed(TOKEN_A, TOKEN_B, ether(5), ether(10));
    const auto before = f.balance(TOKEN_A, BOB);
    f.d.ledger.set_transfer_hook(TOKEN_A, [](const address_t &, const address_t &, const address_t &, const balance_t &) {
        throw std::logic_error("hook failure");
    });

    bool thrown = false;
    try {
        f.d.router.swapExactTokensForTokens(f.as(BOB), ether(1), 0, {TOKEN_A, TOKEN_B}, BOB, DEADLINE);
    } catch (const std::logic_error &) {
        thrown = true;
    }
    check(thrown, "exception propagated");
    check_eq(f.balance(TOKEN_A, BOB), before, "ledger reverted");
    check(f.d.ledger.depth() == 0, "no checkpoint left open");
    f.d.ledger.set_transfer_hook(TOKEN_A, ammr::ledger::transfer_hook_t());
    check(f.d.router.swapExactTokensForTokens(f.as(BOB), ether(1), 0, {TOKEN_A, TOKEN_B}, BOB, DEADLINE).ok()
          , "lock released by the unwinding");
}

void test_settings(void)
{
    auto s = default_router_settings();
    s.max_path_length = 1;
    bool thrown = false;
    try {
        Deployment d(s);
    } catch (const SettingsConsistencyError &) {
        thrown = true;
    }
    check(thrown, "max_path_length 1");

    s = default_router_settings();
    s.wrapped_native = s.router_address;
    thrown = false;
    try {
        Deployment d(s);
    } catch (const SettingsConsistencyError &) {
        thrown = true;
    }
    check(thrown, "router and wrapped native share an address");

    s = default_router_settings();
    s.max_path_length = 2;
    Fixture f(s);
    f.seed(TOKEN_A, TOKEN_B, ether(5), ether(10));
    f.seed(TOKEN_B, TOKEN_C, ether(5), ether(10));
    check_rc(f.d.router.swapExactTokensForTokens(f.as(BOB), ether(1), 0, {TOKEN_A, TOKEN_B, TOKEN_C}, BOB, DEADLINE)
             , RC_INVALID_PATH
             , "path longer than configured");
}

int main()
{
    test_deadline();
    test_lock();
    test_reentrant_call();
    test_rollback();
    test_exception_reverts();
    test_settings();
}
