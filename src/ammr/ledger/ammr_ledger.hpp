/**
 * @file ammr_ledger.hpp
 * @brief In-memory host ledger
 *
 * Reference implementation of TokenLedger. It backs the test suite and
 * the Python extension module, standing in for a real chain:
 *
 * - fungible token balances, total supplies and allowances
 * - native asset balances
 * - a settable clock
 * - nested checkpoints, implemented as an undo journal
 * - per-token transfer fees (parts per million, burnt) and transfer hooks
 */

#pragma once

#include <ammr/model/ammr_collaborators.hpp>
#include <boost/noncopyable.hpp>
#include <functional>
#include <map>
#include <tuple>
#include <vector>

namespace ammr {
namespace ledger {

using address_t = model::address_t;
using balance_t = model::balance_t;
using timestamp_t = model::timestamp_t;
using Status = model::Status;

/**
 * @brief called after every successful transfer of the token it is
 *        registered for
 */
typedef std::function<void(const address_t &token
                           , const address_t &from
                           , const address_t &to
                           , const balance_t &amount)> transfer_hook_t;


class Ledger: public model::TokenLedger, boost::noncopyable
{
public:
    Ledger();

    balance_t balanceOf(const address_t &token, const address_t &owner) const override;
    balance_t allowance(const address_t &token, const address_t &owner, const address_t &spender) const override;
    Status transfer(const address_t &token
                    , const address_t &from
                    , const address_t &to
                    , const balance_t &amount) override;
    Status transferFrom(const address_t &token
                        , const address_t &spender
                        , const address_t &from
                        , const address_t &to
                        , const balance_t &amount) override;
    balance_t nativeBalanceOf(const address_t &owner) const override;
    Status transferNative(const address_t &from
                          , const address_t &to
                          , const balance_t &amount) override;
    timestamp_t now() const override;
    unsigned checkpoint() override;
    void revert(unsigned id) override;
    void release(unsigned id) override;

    /**
     * @brief set the allowance of @p spender over @p owner's @p token.
     *        The maximum value never decreases.
     */
    void approve(const address_t &token
                 , const address_t &owner
                 , const address_t &spender
                 , const balance_t &amount);

    /**
     * @brief create @p amount of @p token out of thin air
     */
    Status mint(const address_t &token, const address_t &to, const balance_t &amount);
    Status burn(const address_t &token, const address_t &from, const balance_t &amount);
    balance_t totalSupply(const address_t &token) const;

    /**
     * @brief create native asset for @p owner
     */
    Status creditNative(const address_t &owner, const balance_t &amount);

    void set_now(timestamp_t t);

    /**
     * @brief transfer fee of @p token, parts per million of the sent amount.
     *
     * The fee is burnt: the recipient gets transferResult().
     */
    void set_feesPPM(const address_t &token, int val);
    int feesPPM(const address_t &token) const;
    balance_t transferResult(const address_t &token, const balance_t &amount) const;

    /**
     * @brief install (or clear, with an empty one) the transfer hook of @p token
     */
    void set_transfer_hook(const address_t &token, transfer_hook_t hook);

    /**
     * @brief record how to undo a change made to state kept outside the
     *        ledger (pool reserves, for instance).
     *
     * Discarded when no checkpoint is open.
     */
    void journal(std::function<void()> undo);

    /**
     * @brief number of open checkpoints
     */
    std::size_t depth() const noexcept { return m_checkpoints.size(); }

private:
    typedef std::pair<address_t, address_t> balance_key;
    typedef std::tuple<address_t, address_t, address_t> allowance_key;

    std::map<balance_key, balance_t> m_balances;
    std::map<allowance_key, balance_t> m_allowances;
    std::map<address_t, balance_t> m_supply;
    std::map<address_t, balance_t> m_native;
    std::map<address_t, int> m_feesPPM;
    std::map<address_t, transfer_hook_t> m_hooks;
    timestamp_t m_now;

    std::vector<std::function<void()>> m_journal;
    std::vector<std::size_t> m_checkpoints;

    void set_balance(const address_t &token, const address_t &owner, const balance_t &val);
    void set_allowance(const allowance_key &key, const balance_t &val);
    void set_supply(const address_t &token, const balance_t &val);
    void set_native(const address_t &owner, const balance_t &val);
    Status move(const address_t &token
                , const address_t &from
                , const address_t &to
                , const balance_t &amount);
};


} // namespace ledger
} // namespace ammr
