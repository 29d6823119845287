#include <ammr/ledger/ammr_ledger_registry.hpp>
#include "test_utils.hpp"
#include <iostream>

using namespace ammr::test;
using namespace ammr::ledger;

// the index holds raw pointers to pools owned elsewhere: lookups by
// address and by pair must agree, and listing must keep creation order.

void test_lookups(void)
{
    Ledger ledger;
    LedgerRegistry registry(ledger);

    const auto ab = registry.createPool(TOKEN_B, TOKEN_A);
    const auto bc = registry.createPool(TOKEN_B, TOKEN_C);
    const auto ac = registry.createPool(TOKEN_C, TOKEN_A);
    check(ab.ok() && bc.ok() && ac.ok(), "createPool");
    check(registry.size() == 3, "size");

    // pairs are unordered
    check(registry.getPool(TOKEN_A, TOKEN_B) == ab.value, "getPool(A, B)");
    check(registry.getPool(TOKEN_B, TOKEN_A) == ab.value, "getPool(B, A)");
    check(ab.value->token0() == TOKEN_A && ab.value->token1() == TOKEN_B, "canonical order");

    // by address
    check(registry.lookup(ac.value->address()) == registry.lookup(TOKEN_A, TOKEN_C), "by address");
    check(registry.lookup(TOKEN_A) == nullptr, "a token is not a pool");
    check(registry.getPool(TOKEN_A, WETH) == nullptr, "unknown pair");

    // creation order
    const auto pools = registry.pools();
    check(pools.size() == 3, "listing");
    check(pools[0] == ab.value && pools[1] == bc.value && pools[2] == ac.value, "creation order");

    for (auto p: pools)
    {
        std::cout << p->address() << ": " << p->token0() << "/" << p->token1() << std::endl;
    }
}

void test_duplicates(void)
{
    Ledger ledger;
    LedgerRegistry registry(ledger);
    check(registry.createPool(TOKEN_A, TOKEN_B).ok(), "first");
    check_rc(registry.createPool(TOKEN_B, TOKEN_A), RC_PAIR_EXISTS, "same pair, other order");
    check_rc(registry.createPool(TOKEN_A, TOKEN_A), RC_IDENTICAL_ADDRESSES, "identical");
    check_rc(registry.createPool(TOKEN_A, address_t()), RC_ZERO_ADDRESS, "zero");
    check(registry.size() == 1, "nothing else added");
}

void test_pool_address(void)
{
    const auto a = LedgerRegistry::pool_address(TOKEN_A, TOKEN_B);
    check(a == LedgerRegistry::pool_address(TOKEN_A, TOKEN_B), "deterministic");
    check(a != LedgerRegistry::pool_address(TOKEN_A, TOKEN_C), "distinct pairs, distinct addresses");
    check(!a.is_zero(), "never zero");
}

void test_creation_reverts(void)
{
    Ledger ledger;
    LedgerRegistry registry(ledger);
    const auto cp = ledger.checkpoint();
    check(registry.createPool(TOKEN_A, TOKEN_B).ok(), "created");
    ledger.revert(cp);
    check(registry.size() == 0, "creation undone");
    check(registry.getPool(TOKEN_A, TOKEN_B) == nullptr, "lookup undone");
    check(registry.createPool(TOKEN_A, TOKEN_B).ok(), "created again");
}

int main()
{
    test_lookups();
    test_duplicates();
    test_pool_address();
    test_creation_reverts();
}
