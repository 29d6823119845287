#include "ammr_deployment.hpp"

namespace ammr {
namespace ledger {


Deployment::Deployment(const router::RouterSettings &settings
                       , const PoolSettings &poolDefaults)
    : registry(ledger, poolDefaults)
    , native(ledger, settings.wrapped_native)
    , permits(ledger)
    , router(settings, registry, ledger, native, permits)
{}


} // namespace ledger
} // namespace ammr
