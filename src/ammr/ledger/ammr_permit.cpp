#include "ammr_permit.hpp"
#include <ammr/commons/ammr_log.hpp>
#include <boost/functional/hash.hpp>

namespace ammr {
namespace ledger {

using namespace model;


LedgerPermit::LedgerPermit(Ledger &ledger)
    : m_ledger(ledger)
{}

void LedgerPermit::register_key(const address_t &owner, const balance_t &secret)
{
    m_keys[owner] = secret;
}

balance_t LedgerPermit::nonces(const address_t &owner) const
{
    auto i = m_nonces.find(owner);
    return i == m_nonces.end() ? balance_t(0) : i->second;
}

ApprovalSignature LedgerPermit::digest(const balance_t &secret
                                       , const address_t &token
                                       , const address_t &owner
                                       , const address_t &spender
                                       , const balance_t &value
                                       , const balance_t &nonce
                                       , timestamp_t deadline)
{
    std::size_t seed = 0;
    boost::hash_combine(seed, secret);
    boost::hash_combine(seed, token);
    boost::hash_combine(seed, owner);
    boost::hash_combine(seed, spender);
    boost::hash_combine(seed, value);
    boost::hash_combine(seed, nonce);
    boost::hash_combine(seed, deadline);

    // stretch the seed over r and s
    ApprovalSignature sig;
    sig.v = 27;
    for (unsigned i = 0; i < 4; ++i)
    {
        boost::hash_combine(seed, i);
        sig.r = (sig.r << 64) | seed;
        boost::hash_combine(seed, secret);
        sig.s = (sig.s << 64) | seed;
    }
    return sig;
}

ApprovalSignature LedgerPermit::sign(const address_t &token
                                     , const address_t &owner
                                     , const address_t &spender
                                     , const balance_t &value
                                     , timestamp_t deadline) const
{
    auto key = m_keys.find(owner);
    if (key == m_keys.end())
    {
        throw bad_argument(strfmt("no signing key for %1%", owner));
    }
    return digest(key->second, token, owner, spender, value, nonces(owner), deadline);
}

Status LedgerPermit::permit(const address_t &token
                            , const address_t &owner
                            , const address_t &spender
                            , const balance_t &value
                            , timestamp_t deadline
                            , const ApprovalSignature &sig)
{
    if (m_ledger.now() > deadline)
    {
        return RC_EXPIRED;
    }
    auto key = m_keys.find(owner);
    if (key == m_keys.end())
    {
        return RC_INVALID_SIGNATURE;
    }
    const auto nonce = nonces(owner);
    const auto expected = digest(key->second, token, owner, spender, value, nonce, deadline);
    if (sig.v != expected.v || sig.r != expected.r || sig.s != expected.s)
    {
        log_debug("permit: bad signature by %1% for %2%", owner, token);
        return RC_INVALID_SIGNATURE;
    }

    m_nonces[owner] = nonce + 1;
    m_ledger.journal([this, owner, nonce]() { m_nonces[owner] = nonce; });
    m_ledger.approve(token, owner, spender, value);
    return RC_OK;
}


} // namespace ledger
} // namespace ammr
