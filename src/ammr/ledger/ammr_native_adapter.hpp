#pragma once

#include "ammr_ledger.hpp"

namespace ammr {
namespace ledger {


/**
 * @brief Wrapped native token on the Ledger
 *
 * The wrapped token is backed 1:1 by the native asset held at the
 * token's own address.
 */
class WrappedNative: public model::NativeAssetAdapter, boost::noncopyable
{
public:
    WrappedNative(Ledger &ledger, const address_t &token);

    const address_t &token() const override { return m_token; }
    Status deposit(const address_t &owner, const balance_t &amount) override;
    Status withdraw(const address_t &owner, const balance_t &amount) override;

private:
    Ledger &m_ledger;
    const address_t m_token;
};


} // namespace ledger
} // namespace ammr
