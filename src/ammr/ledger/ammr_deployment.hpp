/**
 * @file ammr_deployment.hpp
 * @brief A router wired to a fresh reference ledger
 */

#pragma once

#include "ammr_ledger.hpp"
#include "ammr_ledger_registry.hpp"
#include "ammr_native_adapter.hpp"
#include "ammr_permit.hpp"
#include <ammr/router/ammr_router.hpp>

namespace ammr {
namespace ledger {


/**
 * @brief Owns one of each collaborator, and the router using them.
 *
 * Member order is construction order: the router comes last.
 */
struct Deployment: boost::noncopyable
{
    Ledger ledger;
    LedgerRegistry registry;
    WrappedNative native;
    LedgerPermit permits;
    router::Router router;

    /**
     * @param poolDefaults settings of the pools created by the registry
     * @throws SettingsConsistencyError
     */
    explicit Deployment(const router::RouterSettings &settings
                        , const PoolSettings &poolDefaults = PoolSettings());
};


} // namespace ledger
} // namespace ammr
