#include "ammr_ledger.hpp"
#include <ammr/commons/ammr_log.hpp>

namespace ammr {
namespace ledger {

using namespace model;

static const balance_t MAX_AMOUNT = ~balance_t(0);
static const balance_t &MAX_ALLOWANCE = MAX_AMOUNT;


template<typename M, typename K>
static balance_t lookup(const M &m, const K &key)
{
    auto i = m.find(key);
    if (i == m.end())
    {
        return 0;
    }
    return i->second;
}


Ledger::Ledger()
    : m_now(0)
{}

balance_t Ledger::balanceOf(const address_t &token, const address_t &owner) const
{
    return lookup(m_balances, balance_key(token, owner));
}

balance_t Ledger::allowance(const address_t &token, const address_t &owner, const address_t &spender) const
{
    return lookup(m_allowances, allowance_key(token, owner, spender));
}

balance_t Ledger::totalSupply(const address_t &token) const
{
    return lookup(m_supply, token);
}

balance_t Ledger::nativeBalanceOf(const address_t &owner) const
{
    return lookup(m_native, owner);
}

timestamp_t Ledger::now() const
{
    return m_now;
}

void Ledger::set_now(timestamp_t t)
{
    m_now = t;
}


void Ledger::journal(std::function<void()> undo)
{
    if (m_checkpoints.empty())
    {
        return;
    }
    m_journal.push_back(std::move(undo));
}

void Ledger::set_balance(const address_t &token, const address_t &owner, const balance_t &val)
{
    const balance_key key(token, owner);
    const auto prev = lookup(m_balances, key);
    journal([this, key, prev]() { m_balances[key] = prev; });
    m_balances[key] = val;
}

void Ledger::set_allowance(const allowance_key &key, const balance_t &val)
{
    const auto prev = lookup(m_allowances, key);
    journal([this, key, prev]() { m_allowances[key] = prev; });
    m_allowances[key] = val;
}

void Ledger::set_supply(const address_t &token, const balance_t &val)
{
    const auto prev = lookup(m_supply, token);
    journal([this, token, prev]() { m_supply[token] = prev; });
    m_supply[token] = val;
}

void Ledger::set_native(const address_t &owner, const balance_t &val)
{
    const auto prev = lookup(m_native, owner);
    journal([this, owner, prev]() { m_native[owner] = prev; });
    m_native[owner] = val;
}


unsigned Ledger::checkpoint()
{
    m_checkpoints.push_back(m_journal.size());
    return static_cast<unsigned>(m_checkpoints.size() - 1);
}

void Ledger::revert(unsigned id)
{
    if (id >= m_checkpoints.size())
    {
        throw bad_argument(strfmt("no such checkpoint: %1%", id));
    }
    const auto mark = m_checkpoints[id];
    while (m_journal.size() > mark)
    {
        // undo actions must not journal themselves
        auto undo = std::move(m_journal.back());
        m_journal.pop_back();
        undo();
    }
    m_checkpoints.resize(id);
    log_trace("ledger reverted to checkpoint %1%", id);
}

void Ledger::release(unsigned id)
{
    if (id >= m_checkpoints.size())
    {
        throw bad_argument(strfmt("no such checkpoint: %1%", id));
    }
    m_checkpoints.resize(id);
    if (m_checkpoints.empty())
    {
        m_journal.clear();
    }
}


void Ledger::set_feesPPM(const address_t &token, int val)
{
    if (val < 0 || val >= 1000000)
    {
        throw bad_argument(strfmt("transfer fee out of range: %1% PPM", val));
    }
    m_feesPPM[token] = val;
}

int Ledger::feesPPM(const address_t &token) const
{
    auto i = m_feesPPM.find(token);
    return i == m_feesPPM.end() ? 0 : i->second;
}

balance_t Ledger::transferResult(const address_t &token, const balance_t &amount) const
{
    const auto fees = feesPPM(token);
    if (fees == 0)
    {
        return amount;
    }
    return balance_t(wide_t(amount) * (1000000 - fees) / 1000000);
}

void Ledger::set_transfer_hook(const address_t &token, transfer_hook_t hook)
{
    if (!hook)
    {
        m_hooks.erase(token);
        return;
    }
    m_hooks[token] = std::move(hook);
}


Status Ledger::move(const address_t &token
                    , const address_t &from
                    , const address_t &to
                    , const balance_t &amount)
{
    const auto fromBalance = balanceOf(token, from);
    if (fromBalance < amount)
    {
        return RC_INSUFFICIENT_BALANCE;
    }
    const auto received = transferResult(token, amount);
    set_balance(token, from, fromBalance - amount);
    set_balance(token, to, balanceOf(token, to) + received);
    if (received != amount)
    {
        set_supply(token, totalSupply(token) - (amount - received));
    }

    auto hook = m_hooks.find(token);
    if (hook != m_hooks.end())
    {
        const auto fn = hook->second;
        fn(token, from, to, amount);
    }
    return RC_OK;
}

Status Ledger::transfer(const address_t &token
                        , const address_t &from
                        , const address_t &to
                        , const balance_t &amount)
{
    return move(token, from, to, amount);
}

Status Ledger::transferFrom(const address_t &token
                            , const address_t &spender
                            , const address_t &from
                            , const address_t &to
                            , const balance_t &amount)
{
    if (spender != from)
    {
        const allowance_key key(token, from, spender);
        const auto allowed = lookup(m_allowances, key);
        if (allowed < amount)
        {
            return RC_INSUFFICIENT_ALLOWANCE;
        }
        if (allowed != MAX_ALLOWANCE)
        {
            set_allowance(key, allowed - amount);
        }
    }
    return move(token, from, to, amount);
}

void Ledger::approve(const address_t &token
                     , const address_t &owner
                     , const address_t &spender
                     , const balance_t &amount)
{
    set_allowance(allowance_key(token, owner, spender), amount);
}


Status Ledger::mint(const address_t &token, const address_t &to, const balance_t &amount)
{
    const auto supply = totalSupply(token);
    if (supply > MAX_AMOUNT - amount)
    {
        return RC_ARITHMETIC_OVERFLOW;
    }
    set_supply(token, supply + amount);
    set_balance(token, to, balanceOf(token, to) + amount);
    return RC_OK;
}

Status Ledger::burn(const address_t &token, const address_t &from, const balance_t &amount)
{
    const auto fromBalance = balanceOf(token, from);
    if (fromBalance < amount)
    {
        return RC_INSUFFICIENT_BALANCE;
    }
    set_balance(token, from, fromBalance - amount);
    set_supply(token, totalSupply(token) - amount);
    return RC_OK;
}


Status Ledger::creditNative(const address_t &owner, const balance_t &amount)
{
    const auto balance = nativeBalanceOf(owner);
    if (balance > MAX_AMOUNT - amount)
    {
        return RC_ARITHMETIC_OVERFLOW;
    }
    set_native(owner, balance + amount);
    return RC_OK;
}

Status Ledger::transferNative(const address_t &from
                              , const address_t &to
                              , const balance_t &amount)
{
    const auto fromBalance = nativeBalanceOf(from);
    if (fromBalance < amount)
    {
        return RC_INSUFFICIENT_BALANCE;
    }
    set_native(from, fromBalance - amount);
    set_native(to, nativeBalanceOf(to) + amount);
    return RC_OK;
}


} // namespace ledger
} // namespace ammr
