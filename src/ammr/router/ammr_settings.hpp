#pragma once

#include <ammr/model/ammr_types.hpp>
#include <ammr/model/ammr_pool.hpp>

namespace ammr {
namespace router {

using address_t = model::address_t;
using SettingsConsistencyError = model::SettingsConsistencyError;

/**
 * @brief Router deployment parameters
 *
 * @note a struct because the router constructor would otherwise take
 *       them as a bunch of individual parameters.
 */
struct RouterSettings {
    /**
     * @brief router_address
     *
     * identity the router acts as on the ledger: it is the spender of
     * the callers' allowances and the temporary holder of native
     * value and wrapped tokens during an invocation.
     *
     * @default none, must be set
     */
    address_t router_address;

    /**
     * @brief wrapped_native
     *
     * fungible token the native asset converts to. Native-asset entry
     * points require it at the matching end of their path.
     *
     * @default none, must be set
     */
    address_t wrapped_native;

    /**
     * @brief max_path_length
     *
     * longest token path accepted by the swap entry points and
     * the path quotes.
     *
     * @default 0 (no constraint)
     */
    unsigned int max_path_length = 0;

    /**
     * @brief refund_dust
     *
     * Native value sent in excess of what an invocation consumes is
     * sent back to the caller. When disabled, the caller must send the
     * exact amount or the invocation fails with RC_EXCESSIVE_INPUT_AMOUNT.
     *
     * @default true
     */
    bool refund_dust = true;

    void check_consistency() const;
};


} // namespace router
} // namespace ammr
