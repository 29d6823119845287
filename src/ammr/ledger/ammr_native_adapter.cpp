#include "ammr_native_adapter.hpp"

namespace ammr {
namespace ledger {

using namespace model;


WrappedNative::WrappedNative(Ledger &ledger, const address_t &token)
    : m_ledger(ledger)
    , m_token(token)
{
    if (token.is_zero())
    {
        throw bad_argument("wrapped native token can't be the zero address");
    }
}

Status WrappedNative::deposit(const address_t &owner, const balance_t &amount)
{
    const auto st = m_ledger.transferNative(owner, m_token, amount);
    if (st.failed())
    {
        return RC_INSUFFICIENT_NATIVE_VALUE;
    }
    return m_ledger.mint(m_token, owner, amount);
}

Status WrappedNative::withdraw(const address_t &owner, const balance_t &amount)
{
    const auto st = m_ledger.burn(m_token, owner, amount);
    if (st.failed())
    {
        return st;
    }
    return m_ledger.transferNative(m_token, owner, amount);
}


} // namespace ledger
} // namespace ammr
