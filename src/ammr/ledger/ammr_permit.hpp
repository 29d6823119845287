/**
 * @file ammr_permit.hpp
 * @brief Reference signed-approval verifier
 *
 * @warning not cryptography. Owners register a secret with the
 *          verifier, signatures are keyed digests of the approval,
 *          good enough to exercise the approval flow in tests and
 *          scripts.
 */

#pragma once

#include "ammr_ledger.hpp"

namespace ammr {
namespace ledger {

using ApprovalSignature = model::ApprovalSignature;


class LedgerPermit: public model::PermitVerifier, boost::noncopyable
{
public:
    explicit LedgerPermit(Ledger &ledger);

    /**
     * @brief register (or replace) the signing secret of @p owner
     */
    void register_key(const address_t &owner, const balance_t &secret);

    /**
     * @brief next nonce expected for @p owner's approvals
     */
    balance_t nonces(const address_t &owner) const;

    /**
     * @brief produce the signature @p owner would make for this approval,
     *        with its current nonce
     *
     * @throws bad_argument if @p owner has no registered key
     */
    ApprovalSignature sign(const address_t &token
                           , const address_t &owner
                           , const address_t &spender
                           , const balance_t &value
                           , timestamp_t deadline) const;

    Status permit(const address_t &token
                  , const address_t &owner
                  , const address_t &spender
                  , const balance_t &value
                  , timestamp_t deadline
                  , const ApprovalSignature &sig) override;

private:
    Ledger &m_ledger;
    std::map<address_t, balance_t> m_keys;
    std::map<address_t, balance_t> m_nonces;

    static ApprovalSignature digest(const balance_t &secret
                                    , const address_t &token
                                    , const address_t &owner
                                    , const address_t &spender
                                    , const balance_t &value
                                    , const balance_t &nonce
                                    , timestamp_t deadline);
};


} // namespace ledger
} // namespace ammr
