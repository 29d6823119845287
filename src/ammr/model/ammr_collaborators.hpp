/**
 * @file ammr_collaborators.hpp
 * @brief The host ledger and the auxiliary contracts the router talks to.
 */

#pragma once

#include "ammr_types.hpp"
#include "ammr_errors.hpp"

namespace ammr {
namespace model {

/**
 * @brief balances, allowances, clock and atomicity of the host ledger
 *
 * The native asset is kept apart from fungible tokens: it has its own
 * balance and transfer calls.
 */
struct TokenLedger
{
    virtual ~TokenLedger() {}

    virtual balance_t balanceOf(const address_t &token, const address_t &owner) const = 0;
    virtual balance_t allowance(const address_t &token, const address_t &owner, const address_t &spender) const = 0;

    /**
     * @brief move @p amount of @p token that @p from owns.
     *        Only the owner itself may call this.
     */
    virtual Status transfer(const address_t &token
                            , const address_t &from
                            , const address_t &to
                            , const balance_t &amount) = 0;

    /**
     * @brief move @p amount of @p token on behalf of @p from,
     *        consuming @p spender's allowance
     */
    virtual Status transferFrom(const address_t &token
                                , const address_t &spender
                                , const address_t &from
                                , const address_t &to
                                , const balance_t &amount) = 0;

    virtual balance_t nativeBalanceOf(const address_t &owner) const = 0;
    virtual Status transferNative(const address_t &from
                                  , const address_t &to
                                  , const balance_t &amount) = 0;

    /**
     * @brief current block timestamp
     */
    virtual timestamp_t now() const = 0;

    /**
     * @defgroup checkpoints all-or-nothing commit support
     *
     * checkpoint() opens a nested scope of effects. revert() undoes all
     * effects recorded since the matching checkpoint, release() keeps them
     * (folding them in the enclosing scope, if any).
     * @{
     */
    virtual unsigned checkpoint() = 0;
    virtual void revert(unsigned id) = 0;
    virtual void release(unsigned id) = 0;
    /** @} */
};


/**
 * @brief 1:1 converter between the native asset and its fungible equivalent
 */
struct NativeAssetAdapter
{
    virtual ~NativeAssetAdapter() {}

    /**
     * @brief the wrapped (fungible) token address
     */
    virtual const address_t &token() const = 0;

    /**
     * @brief turn @p amount of @p owner's native asset into wrapped tokens,
     *        credited to @p owner
     */
    virtual Status deposit(const address_t &owner, const balance_t &amount) = 0;

    /**
     * @brief turn @p amount of @p owner's wrapped tokens back into
     *        native asset, credited to @p owner
     */
    virtual Status withdraw(const address_t &owner, const balance_t &amount) = 0;
};


/**
 * @brief off-band signed approval
 */
struct ApprovalSignature
{
    std::uint8_t v = 0;
    balance_t r = 0;
    balance_t s = 0;
};

/**
 * @brief installs an allowance from a signed approval instead of a prior
 *        approve() call by the owner
 */
struct PermitVerifier
{
    virtual ~PermitVerifier() {}

    /**
     * @brief verify @p sig and, if valid, set the allowance
     *        (@p token, @p owner, @p spender) to @p value.
     *        Fails with RC_INVALID_SIGNATURE or RC_EXPIRED.
     */
    virtual Status permit(const address_t &token
                          , const address_t &owner
                          , const address_t &spender
                          , const balance_t &value
                          , timestamp_t deadline
                          , const ApprovalSignature &sig) = 0;
};


} // namespace model
} // namespace ammr
