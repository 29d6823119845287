#include "ammr_settings.hpp"

namespace ammr {
namespace router {


void RouterSettings::check_consistency() const
{
    if (router_address.is_zero())
    {
        throw SettingsConsistencyError("router_address must be set");
    }
    if (wrapped_native.is_zero())
    {
        throw SettingsConsistencyError("wrapped_native must be set");
    }
    if (wrapped_native == router_address)
    {
        throw SettingsConsistencyError("wrapped_native and router_address must differ");
    }
    if (max_path_length == 1)
    {
        throw SettingsConsistencyError("max_path_length must be 0 (no constraint) or >= 2");
    }
}


} // namespace router
} // namespace ammr
