#include <ammr/router/ammr_path_pricer.hpp>
#include "test_utils.hpp"

using namespace ammr::test;
using ammr::router::PathPricer;
using ammr::router::view_hop;


void test_check_path(void)
{
    Fixture f;
    const PathPricer pricer(f.d.registry);
    check_rc(pricer.check_path({}), RC_INVALID_PATH, "empty path");
    check_rc(pricer.check_path({TOKEN_A}), RC_INVALID_PATH, "single token");
    check_rc(pricer.check_path({TOKEN_A, TOKEN_A}), RC_INVALID_PATH, "repeated token");
    check_rc(pricer.check_path({TOKEN_A, TOKEN_B}), RC_OK, "two tokens");

    const PathPricer bounded(f.d.registry, 2);
    check_rc(bounded.check_path({TOKEN_A, TOKEN_B, TOKEN_C}), RC_INVALID_PATH, "too long");
}

void test_view_hop(void)
{
    Fixture f;
    f.seed(TOKEN_B, TOKEN_A, ether(10), ether(5));
    const auto hop = view_hop(f.d.registry, TOKEN_B, TOKEN_A);
    check(hop.ok(), "view_hop");
    check(!hop.value.sellToken0, "TOKEN_B is token1");
    check_eq(hop.value.reserveIn, ether(10), "reserveIn follows the direction");
    check_eq(hop.value.reserveOut, ether(5), "reserveOut follows the direction");
    check_rc(view_hop(f.d.registry, TOKEN_A, TOKEN_C), RC_INSUFFICIENT_LIQUIDITY, "no pool");
}

void test_amounts_out(void)
{
    Fixture f;
    f.seed(TOKEN_A, TOKEN_B, ether(5), ether(10));
    f.seed(TOKEN_B, TOKEN_C, ether(10), ether(10));
    const PathPricer pricer(f.d.registry);

    const auto amounts = pricer.getAmountsOut({TOKEN_A, TOKEN_B, TOKEN_C}, ether(1));
    check(amounts.ok(), "getAmountsOut");
    check(amounts.value.size() == 3, "one amount per token");
    check_eq(amounts.value[0], ether(1), "first element is the input");
    check_eq(amounts.value[1], balance_t("1662497915624478906"), "first hop");
    check_eq(amounts.value[2], balance_t("1421839107917040301"), "second hop");

    check_rc(pricer.getAmountsOut({TOKEN_A, TOKEN_C}, ether(1)), RC_INSUFFICIENT_LIQUIDITY, "missing pool");
    check_rc(pricer.getAmountsOut({TOKEN_A, TOKEN_B}, 0), RC_INSUFFICIENT_INPUT_AMOUNT, "nothing in");
}

void test_amounts_in(void)
{
    Fixture f;
    f.seed(TOKEN_A, TOKEN_B, ether(5), ether(10));
    f.seed(TOKEN_B, TOKEN_C, ether(10), ether(10));
    const PathPricer pricer(f.d.registry);

    const auto amounts = pricer.getAmountsIn({TOKEN_A, TOKEN_B, TOKEN_C}, ether(1));
    check(amounts.ok(), "getAmountsIn");
    check_eq(amounts.value[2], ether(1), "last element is the output");
    check_eq(amounts.value[1], balance_t("1114454474534715257"), "second hop");
    check_eq(amounts.value[0], balance_t("629003528835597474"), "first hop");

    // quoting is a pure read
    const auto again = pricer.getAmountsIn({TOKEN_A, TOKEN_B, TOKEN_C}, ether(1));
    check(again.value == amounts.value, "same state, same quote");
}

void test_forward_backward_consistency(void)
{
    Fixture f;
    f.seed(TOKEN_A, TOKEN_B, ether(5), ether(10));
    f.seed(TOKEN_B, TOKEN_C, ether(10), ether(10));
    const PathPricer pricer(f.d.registry);
    const TokenPath path{TOKEN_A, TOKEN_B, TOKEN_C};

    for (unsigned n: {1U, 2U, 3U, 7U})
    {
        const auto forward = pricer.getAmountsOut(path, ether(n));
        check(forward.ok(), "forward");
        const auto backward = pricer.getAmountsIn(path, forward.value.back());
        check(backward.ok(), "backward");
        // the forward input always buys the forward output, so the
        // minimal input can't be larger, and it must still buy that output
        check(backward.value.front() <= ether(n), "backward quote within the forward input");
        const auto again = pricer.getAmountsOut(path, backward.value.front());
        check(again.ok() && again.value.back() >= forward.value.back(), "backward quote buys the output");
    }

    // no rounding loss on this one
    const auto backward = pricer.getAmountsIn(path, balance_t("1421839107917040301"));
    check_eq(backward.value[1], balance_t("1662497915624478906"), "intermediate");
    check_eq(backward.value[0], ether(1), "same input both ways");

    // rounding loss: the output of 3 ether is bought with one unit less
    const auto lossy = pricer.getAmountsIn(path, balance_t("2717597432322001941"));
    check_eq(lossy.value[0], balance_t("2999999999999999999"), "floors accumulate");
}

int main()
{
    test_check_path();
    test_view_hop();
    test_amounts_out();
    test_amounts_in();
    test_forward_backward_consistency();
}
