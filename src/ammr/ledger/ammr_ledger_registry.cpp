#include "ammr_ledger_registry.hpp"
#include <ammr/commons/ammr_log.hpp>
#include <boost/functional/hash.hpp>

namespace ammr {
namespace ledger {

using namespace model;


LedgerRegistry::LedgerRegistry(Ledger &ledger, const PoolSettings &defaults)
    : m_ledger(ledger)
    , m_defaults(defaults)
    , m_index(std::make_unique<idx::PoolIndex>())
{
    m_defaults.check_consistency();
}

LedgerRegistry::~LedgerRegistry()
{
    m_index->clear();
}


address_t LedgerRegistry::pool_address(const address_t &token0, const address_t &token1)
{
    std::size_t seed = 0xff;
    address_t::base_type v = 0;
    for (unsigned i = 0; i < 3; ++i)
    {
        boost::hash_combine(seed, token0);
        boost::hash_combine(seed, token1);
        v = (v << 64) | seed;
    }
    return address_t(v);
}


LedgerPool *LedgerRegistry::lookup(const address_t &tokenA, const address_t &tokenB) const
{
    const auto pair = canonicalize(tokenA, tokenB);
    if (pair.failed())
    {
        return nullptr;
    }
    return m_index->lookup(pair.value.first, pair.value.second);
}

LedgerPool *LedgerRegistry::lookup(const address_t &pool) const
{
    return m_index->lookup(pool);
}

Pool *LedgerRegistry::getPool(const address_t &tokenA, const address_t &tokenB) const
{
    return lookup(tokenA, tokenB);
}

Outcome<Pool *> LedgerRegistry::createPool(const address_t &tokenA, const address_t &tokenB)
{
    const auto pair = canonicalize(tokenA, tokenB);
    if (pair.failed())
    {
        return Status(pair);
    }
    const auto &token0 = pair.value.first;
    const auto &token1 = pair.value.second;
    if (m_index->lookup(token0, token1) != nullptr)
    {
        return RC_PAIR_EXISTS;
    }

    const auto address = pool_address(token0, token1);
    if (m_index->lookup(address) != nullptr)
    {
        throw bad_argument(strfmt("pool address collision: %1%", address));
    }
    m_pools.push_back(std::make_unique<LedgerPool>(m_ledger, address, token0, token1, m_defaults));
    LedgerPool *pool = m_pools.back().get();
    m_index->insert(pool);
    m_ledger.journal([this, pool]() {
        m_index->get<idx::by_address>().erase(pool->address());
        m_pools.pop_back();
    });

    log_debug("registry: pool %1% for %2%/%3%", address, token0, token1);
    return static_cast<Pool *>(pool);
}

std::vector<LedgerPool *> LedgerRegistry::pools() const
{
    auto &idx = m_index->get<idx::by_creation>();
    return std::vector<LedgerPool *>(idx.begin(), idx.end());
}


} // namespace ledger
} // namespace ammr
