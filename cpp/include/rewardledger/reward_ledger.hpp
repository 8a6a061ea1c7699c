// Reward ledger: balances, fee pool, participation scores and the batch
// redistribution of the pool. Authorization and the block clock are supplied
// by the caller on every operation.
#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "account_store.hpp"
#include "ledger_error.hpp"
#include "ledger_types.hpp"

namespace rewardledger {

class RewardLedger {
public:
    explicit RewardLedger(
        AccountId administrator,
        LedgerParams params = LedgerParams{},
        std::unique_ptr<AccountStore> store = nullptr
    );

    // Rebuilds a ledger from persisted state. Runs audit() before returning.
    RewardLedger(
        AccountId administrator,
        LedgerParams params,
        GlobalState globals,
        std::unique_ptr<AccountStore> store
    );

    RewardLedger(RewardLedger&&) = default;
    RewardLedger& operator=(RewardLedger&&) = default;

    // ------------------------------ mutations --------------------------------
    void register_account(const AccountId& account, BlockHeight clock);

    void mint(const AccountId& caller, const uint128& amount, const AccountId& recipient);

    void transfer(
        const AccountId& caller,
        const uint128& amount,
        const AccountId& sender,
        const AccountId& recipient,
        BlockHeight clock
    );

    bool set_redistribution_active(const AccountId& caller, bool active);

    // Returns one payout per beneficiary, in input order (0 when ineligible)
    std::vector<uint128> execute_algorithmic_redistribution(
        const AccountId& caller,
        const std::vector<AccountId>& beneficiaries,
        BlockHeight clock
    );

    // -------------------------------- views ----------------------------------
    std::optional<Account> get_account(const AccountId& account) const;
    uint128 get_balance(const AccountId& account) const;
    uint128 get_participation_score(const AccountId& account) const;
    uint128 get_cumulative_holdings(const AccountId& account) const;
    uint128 get_pending_rewards(const AccountId& account) const;
    RedistributionQuote quote_redistribution(const AccountId& account, BlockHeight clock) const;

    uint128 get_redistribution_pool() const { return globals_.redistribution_pool; }
    uint128 get_total_supply() const { return globals_.total_supply; }
    uint128 get_total_participation_score() const { return globals_.total_participation_score; }
    uint64_t get_registered_count() const { return globals_.registered_count; }
    bool is_redistribution_active() const { return globals_.redistribution_active; }

    const AccountId& administrator() const { return administrator_; }
    const LedgerParams& params() const { return params_; }
    const GlobalState& globals() const { return globals_; }
    const AccountStore& store() const { return *store_; }

    // Full recount of the aggregate invariants; throws InvalidState on mismatch
    void audit() const;

private:
    Account require_account(const AccountId& account) const;
    void require_administrator(const AccountId& caller, const char* operation) const;

    // Holdings accrual, score transition and activity stamp for one account
    void touch_activity(Account& account, GlobalState& g, BlockHeight clock) const;

    AccountId administrator_;
    LedgerParams params_;
    GlobalState globals_;
    std::unique_ptr<AccountStore> store_;
};

} // namespace rewardledger
