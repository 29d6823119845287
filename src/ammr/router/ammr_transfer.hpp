#pragma once

#include <ammr/model/ammr_types.hpp>
#include <ammr/model/ammr_errors.hpp>
#include <ammr/model/ammr_model_fwd.hpp>

namespace ammr {
namespace router {

/**
 * @brief move @p amount of @p token from @p payer to @p to, on behalf of
 *        the router @p self.
 *
 * Tokens the router holds itself are sent directly, anything else is
 * pulled through @p payer's allowance to @p self.
 */
model::Status pay(model::TokenLedger &ledger
                  , const model::address_t &self
                  , const model::address_t &token
                  , const model::address_t &payer
                  , const model::address_t &to
                  , const model::balance_t &amount);

} // namespace router
} // namespace ammr
