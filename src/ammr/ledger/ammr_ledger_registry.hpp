/**
 * @file ammr_ledger_registry.hpp
 * @brief Reference Registry of LedgerPool objects
 *
 * The lookup machinery is based around boost::multi_index,
 * partitioned here for the same reason as anywhere else: it is great
 * but tortuous to read.
 */

#pragma once

#include "ammr_ledger_pool.hpp"
#include <boost/multi_index_container.hpp>
#include <boost/multi_index/hashed_index.hpp>
#include <boost/multi_index/composite_key.hpp>
#include <boost/multi_index/mem_fun.hpp>
#include <boost/multi_index/sequenced_index.hpp>
#include <memory>
#include <vector>

namespace ammr {
namespace ledger {
namespace idx {

using namespace boost::multi_index;


/**
 * @defgroup indexes Available indexing (and lookup) strategies
 * @{
 */
struct by_address {};
struct by_pair {};
struct by_creation {};
/** @} */


/**
 * @brief Base multi_index implementation
 *
 * Pools can be looked up:
 *
 *  - by_address in O(1)
 *  - by_pair in O(1), the pair being canonical (token0, token1)
 *  - by_creation, in creation order
 */
typedef multi_index_container<
  LedgerPool*,
  indexed_by<
        // 1. index by pool address (which is also the share token address)
          hashed_unique<      tag<by_address>    ,  const_mem_fun<model::Pool, const address_t &, &model::Pool::address> >
        // 2. index by canonical pair
        , hashed_unique<      tag<by_pair>       ,  composite_key<LedgerPool*,
                 const_mem_fun<model::Pool, const address_t &, &model::Pool::token0>
               , const_mem_fun<model::Pool, const address_t &, &model::Pool::token1>       >
          >
        // 3. creation order, for listing
        , sequenced<          tag<by_creation>   >
  >
> PoolIndex_base;


/**
 * @brief Public PoolIndex type
 */
struct PoolIndex: PoolIndex_base
{
    using PoolIndex_base::PoolIndex_base;

    /**
     * @return matching pool or null
     */
    LedgerPool *lookup(const address_t &address) const noexcept
    {
        auto &idx = get<by_address>();
        auto i = idx.find(address);
        if (i == idx.end())
        {
            return nullptr;
        }
        return *i;
    }

    /**
     * @return matching pool or null. @p token0 and @p token1 must be canonical.
     */
    LedgerPool *lookup(const address_t &token0, const address_t &token1) const noexcept
    {
        auto &idx = get<by_pair>();
        auto i = idx.find(boost::make_tuple(token0, token1));
        if (i == idx.end())
        {
            return nullptr;
        }
        return *i;
    }
};


} // namespace idx


/**
 * @brief Registry creating LedgerPool objects on demand
 *
 * Pool addresses are a deterministic function of the canonical pair.
 * Creations are journaled in the ledger like any other state change,
 * so a reverted invocation also forgets the pools it created.
 */
class LedgerRegistry: public model::Registry, boost::noncopyable
{
public:
    /**
     * @param defaults settings of newly created pools
     */
    explicit LedgerRegistry(Ledger &ledger, const PoolSettings &defaults = PoolSettings());
    ~LedgerRegistry();

    model::Pool *getPool(const address_t &tokenA, const address_t &tokenB) const override;
    Outcome<model::Pool *> createPool(const address_t &tokenA, const address_t &tokenB) override;

    /**
     * @brief same as getPool(), with access to the pool administration
     */
    LedgerPool *lookup(const address_t &tokenA, const address_t &tokenB) const;
    LedgerPool *lookup(const address_t &pool) const;

    std::vector<LedgerPool *> pools() const;
    std::size_t size() const noexcept { return m_index->size(); }

    /**
     * @brief address the pool of (@p token0, @p token1) gets, or already has
     */
    static address_t pool_address(const address_t &token0, const address_t &token1);

private:
    Ledger &m_ledger;
    PoolSettings m_defaults;
    std::unique_ptr<idx::PoolIndex> m_index;
    std::vector<std::unique_ptr<LedgerPool>> m_pools;
};


} // namespace ledger
} // namespace ammr
