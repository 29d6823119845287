#include "ammr_guards.hpp"
#include <ammr/model/ammr_collaborators.hpp>

namespace ammr {
namespace router {

using namespace model;


ReentrancyGuard::Lock::Lock(ReentrancyGuard &guard)
    : m_guard(guard)
    , m_acquired(!guard.m_locked)
{
    if (m_acquired)
    {
        m_guard.m_locked = true;
    }
}

ReentrancyGuard::Lock::~Lock()
{
    if (m_acquired)
    {
        m_guard.m_locked = false;
    }
}

Status ReentrancyGuard::Lock::status() const
{
    return m_acquired ? RC_OK : RC_LOCKED;
}


DeadlineGuard::DeadlineGuard(const TokenLedger &ledger)
    : m_ledger(ledger)
{}

Status DeadlineGuard::check(timestamp_t deadline) const
{
    if (m_ledger.now() > deadline)
    {
        return RC_EXPIRED;
    }
    return RC_OK;
}


} // namespace router
} // namespace ammr
