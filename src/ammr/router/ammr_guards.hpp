/**
 * @file ammr_guards.hpp
 * @brief preconditions wrapped around every state-mutating entry point
 */

#pragma once

#include <ammr/model/ammr_types.hpp>
#include <ammr/model/ammr_errors.hpp>
#include <ammr/model/ammr_model_fwd.hpp>
#include <boost/noncopyable.hpp>

namespace ammr {
namespace router {

using Status = model::Status;
using timestamp_t = model::timestamp_t;


/**
 * @brief mutual exclusion of router invocations
 *
 * One flag per router. Any invocation that starts while another one
 * is still running (e.g. called back from a token transfer hook)
 * fails with RC_LOCKED.
 */
class ReentrancyGuard: boost::noncopyable
{
public:
    /**
     * @brief RAII holder of the flag
     *
     * Check acquired() right after construction. The flag is
     * released on destruction, whatever the exit path.
     */
    class Lock: boost::noncopyable
    {
    public:
        explicit Lock(ReentrancyGuard &guard);
        ~Lock();

        bool acquired() const noexcept { return m_acquired; }
        Status status() const;

    private:
        ReentrancyGuard &m_guard;
        bool m_acquired;
    };

    bool locked() const noexcept { return m_locked; }

private:
    bool m_locked = false;
};


/**
 * @brief rejects invocations submitted past their deadline
 *
 * The check passes while ledger time <= deadline.
 */
class DeadlineGuard
{
public:
    explicit DeadlineGuard(const model::TokenLedger &ledger);

    Status check(timestamp_t deadline) const;

private:
    const model::TokenLedger &m_ledger;
};


} // namespace router
} // namespace ammr
