#include "rewardledger/reward_ledger.hpp"
#include "rewardledger/reward_math.hpp"

#include <cstdlib>
#include <iostream>
#include <map>
#include <string>

namespace rewardledger {

namespace {

bool trace_enabled() {
    const char* env = std::getenv("TRACE");
    return env && std::string(env) == "1";
}

// Runs a computation phase; checked-integer faults surface as ArithmeticFault
template <typename Fn>
void checked(const char* operation, Fn&& fn) {
    try {
        fn();
    } catch (const std::overflow_error& e) {
        throw LedgerError(ErrorCode::ArithmeticFault, std::string(operation) + ": " + e.what());
    } catch (const std::range_error& e) {
        throw LedgerError(ErrorCode::ArithmeticFault, std::string(operation) + ": " + e.what());
    }
}

} // namespace

RewardLedger::RewardLedger(
    AccountId administrator,
    LedgerParams params,
    std::unique_ptr<AccountStore> store
) : administrator_(std::move(administrator)),
    params_(std::move(params)),
    store_(std::move(store))
{
    if (!store_) {
        store_ = std::make_unique<InMemoryAccountStore>();
    }
    globals_.redistribution_active = params_.redistribution_active_at_genesis;
}

RewardLedger::RewardLedger(
    AccountId administrator,
    LedgerParams params,
    GlobalState globals,
    std::unique_ptr<AccountStore> store
) : administrator_(std::move(administrator)),
    params_(std::move(params)),
    globals_(std::move(globals)),
    store_(std::move(store))
{
    if (!store_) {
        throw LedgerError(ErrorCode::InvalidState, "restored ledger has no account store");
    }
    audit();
}

// ------------------------------- helpers -------------------------------------

Account RewardLedger::require_account(const AccountId& account) const {
    auto found = store_->find(account);
    if (!found) {
        throw LedgerError(ErrorCode::NotRegistered, "account not registered: " + account);
    }
    return *found;
}

void RewardLedger::require_administrator(const AccountId& caller, const char* operation) const {
    if (caller != administrator_) {
        throw LedgerError(
            ErrorCode::Unauthorized,
            std::string(operation) + " requires the administrator, got " + caller
        );
    }
}

void RewardLedger::touch_activity(Account& account, GlobalState& g, BlockHeight clock) const {
    // elapsed is measured from the activity stamp before it is advanced
    uint64_t elapsed = RewardMath::blocks_between(account.last_activity_block, clock);

    // Holdings accrue on the balance held during the interval just ended
    account.cumulative_holdings = RewardMath::accrue_holdings(
        account.cumulative_holdings, account.balance, elapsed
    );

    uint128 old_score = account.participation_score;
    uint128 new_score = RewardMath::next_score(old_score, elapsed, params_);
    g.total_participation_score = g.total_participation_score + new_score - old_score;
    account.participation_score = new_score;

    account.last_activity_block = clock;
}

// ------------------------------ mutations ------------------------------------

void RewardLedger::register_account(const AccountId& account, BlockHeight clock) {
    if (store_->contains(account)) {
        throw LedgerError(ErrorCode::AlreadyRegistered, "account already registered: " + account);
    }

    Account record;
    record.participation_score = params_.initial_score;
    record.last_activity_block = clock;
    record.last_claim_block = clock;
    record.registered = true;

    GlobalState g = globals_;
    checked("register_account", [&] {
        g.total_participation_score += record.participation_score;
        g.registered_count += 1;
    });

    store_->put(account, record);
    globals_ = g;

    if (trace_enabled()) {
        std::cout << "TRACE register account=" << account
                  << " block=" << clock
                  << " registered_count=" << globals_.registered_count
                  << "\n";
    }
}

void RewardLedger::mint(const AccountId& caller, const uint128& amount, const AccountId& recipient) {
    require_administrator(caller, "mint");
    if (amount == 0) {
        throw LedgerError(ErrorCode::InvalidAmount, "mint amount must be positive");
    }
    Account to = require_account(recipient);

    GlobalState g = globals_;
    checked("mint", [&] {
        to.balance += amount;
        g.total_supply += amount;
    });

    store_->put(recipient, to);
    globals_ = g;

    if (trace_enabled()) {
        std::cout << "TRACE mint recipient=" << recipient
                  << " amount=" << amount
                  << " total_supply=" << globals_.total_supply
                  << "\n";
    }
}

void RewardLedger::transfer(
    const AccountId& caller,
    const uint128& amount,
    const AccountId& sender,
    const AccountId& recipient,
    BlockHeight clock
) {
    if (caller != sender) {
        throw LedgerError(ErrorCode::Unauthorized, "only the sender may transfer, got " + caller);
    }
    if (amount == 0) {
        throw LedgerError(ErrorCode::InvalidAmount, "transfer amount must be positive");
    }
    // Funds are checked before registration; an absent sender holds nothing
    auto sender_record = store_->find(sender);
    const uint128 available = sender_record ? sender_record->balance : uint128(0);
    if (available < amount) {
        throw LedgerError(
            ErrorCode::InsufficientBalance,
            "balance " + uint128_to_str(available) + " below transfer amount " + uint128_to_str(amount)
        );
    }
    const bool self_transfer = (sender == recipient);
    Account from = require_account(sender);
    Account to = self_transfer ? from : require_account(recipient);

    // Compute every new record first, then commit
    GlobalState g = globals_;
    uint128 fee = 0;
    checked("transfer", [&] {
        fee = RewardMath::fee(amount, params_);
        uint128 net = amount - fee;

        touch_activity(from, g, clock);
        if (self_transfer) {
            from.balance -= fee;
        } else {
            touch_activity(to, g, clock);
            from.balance -= amount;
            to.balance += net;
        }
        g.redistribution_pool += fee;
    });

    store_->put(sender, from);
    if (!self_transfer) {
        store_->put(recipient, to);
    }
    globals_ = g;

    if (trace_enabled()) {
        std::cout << "TRACE transfer sender=" << sender
                  << " recipient=" << recipient
                  << " amount=" << amount
                  << " fee=" << fee
                  << " pool=" << globals_.redistribution_pool
                  << " block=" << clock
                  << "\n";
    }
}

bool RewardLedger::set_redistribution_active(const AccountId& caller, bool active) {
    require_administrator(caller, "set_redistribution_active");
    globals_.redistribution_active = active;
    if (trace_enabled()) {
        std::cout << "TRACE set_active active=" << (active ? "true" : "false") << "\n";
    }
    return globals_.redistribution_active;
}

std::vector<uint128> RewardLedger::execute_algorithmic_redistribution(
    const AccountId& caller,
    const std::vector<AccountId>& beneficiaries,
    BlockHeight clock
) {
    require_administrator(caller, "execute_algorithmic_redistribution");
    if (!globals_.redistribution_active) {
        throw LedgerError(ErrorCode::RedistributionLocked, "redistribution is not active");
    }
    if (globals_.redistribution_pool == 0) {
        throw LedgerError(ErrorCode::NoRewards, "redistribution pool is empty");
    }
    if (beneficiaries.size() > params_.max_batch_size) {
        throw LedgerError(
            ErrorCode::BatchTooLarge,
            "at most " + std::to_string(params_.max_batch_size) + " beneficiaries per batch, got "
                + std::to_string(beneficiaries.size())
        );
    }

    // Effects are staged per account and committed once the whole list is done.
    // Later beneficiaries see the pool already depleted by earlier ones, and a
    // repeated beneficiary sees its own earlier claim.
    GlobalState g = globals_;
    std::map<AccountId, Account> staged;
    std::vector<uint128> payouts;
    payouts.reserve(beneficiaries.size());

    checked("execute_algorithmic_redistribution", [&] {
        for (const auto& id : beneficiaries) {
            std::optional<Account> account;
            auto it = staged.find(id);
            if (it != staged.end()) {
                account = it->second;
            } else {
                account = store_->find(id);
            }
            if (!account) {
                payouts.push_back(0);
                continue;
            }

            RedistributionQuote q = RewardMath::quote(*account, g, clock, params_);
            if (!q.eligible) {
                payouts.push_back(0);
                continue;
            }

            // Not clamped to the remaining pool; an over-debit faults
            g.redistribution_pool -= q.adjusted;
            account->balance += q.adjusted;
            account->last_claim_block = clock;

            uint128 old_score = account->participation_score;
            uint128 new_score = RewardMath::claim_boosted_score(old_score, params_);
            g.total_participation_score = g.total_participation_score + new_score - old_score;
            account->participation_score = new_score;

            staged[id] = *account;
            payouts.push_back(q.adjusted);

            if (trace_enabled()) {
                std::cout << "TRACE payout account=" << id
                          << " base=" << q.base_share
                          << " mult=" << q.time_multiplier
                          << " bonus=" << q.velocity_bonus
                          << " adjusted=" << q.adjusted
                          << " pool=" << g.redistribution_pool
                          << "\n";
            }
        }
    });

    for (const auto& [id, account] : staged) {
        store_->put(id, account);
    }
    globals_ = g;
    return payouts;
}

// -------------------------------- views --------------------------------------

std::optional<Account> RewardLedger::get_account(const AccountId& account) const {
    return store_->find(account);
}

uint128 RewardLedger::get_balance(const AccountId& account) const {
    auto found = store_->find(account);
    return found ? found->balance : uint128(0);
}

uint128 RewardLedger::get_participation_score(const AccountId& account) const {
    auto found = store_->find(account);
    return found ? found->participation_score : uint128(0);
}

uint128 RewardLedger::get_cumulative_holdings(const AccountId& account) const {
    auto found = store_->find(account);
    return found ? found->cumulative_holdings : uint128(0);
}

uint128 RewardLedger::get_pending_rewards(const AccountId& account) const {
    auto found = store_->find(account);
    if (!found) {
        return 0;
    }
    uint128 share = 0;
    checked("get_pending_rewards", [&] {
        share = RewardMath::base_share(*found, globals_, params_);
    });
    return share;
}

RedistributionQuote RewardLedger::quote_redistribution(const AccountId& account, BlockHeight clock) const {
    Account record = require_account(account);
    RedistributionQuote q;
    checked("quote_redistribution", [&] {
        q = RewardMath::quote(record, globals_, clock, params_);
    });
    return q;
}

void RewardLedger::audit() const {
    uint128 balance_sum = 0;
    uint128 score_sum = 0;
    uint64_t count = 0;

    checked("audit", [&] {
        store_->for_each([&](const AccountId& id, const Account& account) {
            if (!account.registered) {
                throw LedgerError(ErrorCode::InvalidState, "stored account not marked registered: " + id);
            }
            if (account.participation_score > params_.max_score) {
                throw LedgerError(
                    ErrorCode::InvalidState,
                    "participation score out of range for " + id + ": "
                        + uint128_to_str(account.participation_score)
                );
            }
            balance_sum += account.balance;
            score_sum += account.participation_score;
            ++count;
        });

        if (score_sum != globals_.total_participation_score) {
            throw LedgerError(
                ErrorCode::InvalidState,
                "score sum " + uint128_to_str(score_sum) + " != total_participation_score "
                    + uint128_to_str(globals_.total_participation_score)
            );
        }
        if (balance_sum + globals_.redistribution_pool != globals_.total_supply) {
            throw LedgerError(
                ErrorCode::InvalidState,
                "balances " + uint128_to_str(balance_sum) + " + pool "
                    + uint128_to_str(globals_.redistribution_pool) + " != total_supply "
                    + uint128_to_str(globals_.total_supply)
            );
        }
        if (count != globals_.registered_count) {
            throw LedgerError(
                ErrorCode::InvalidState,
                "store holds " + std::to_string(count) + " accounts, registered_count is "
                    + std::to_string(globals_.registered_count)
            );
        }
    });
}

} // namespace rewardledger
