#pragma once

#include <functional>
#include <map>
#include <optional>

#include "ledger_types.hpp"

namespace rewardledger {

// Key-value storage of account records. Absent keys yield std::nullopt;
// implementations never fabricate a record on read.
class AccountStore {
public:
    virtual ~AccountStore() = default;

    virtual std::optional<Account> find(const AccountId& id) const = 0;
    virtual void put(const AccountId& id, const Account& account) = 0;
    virtual size_t size() const = 0;

    // Visits every record in ascending identifier order
    virtual void for_each(
        const std::function<void(const AccountId&, const Account&)>& fn
    ) const = 0;

    bool contains(const AccountId& id) const { return find(id).has_value(); }
};

class InMemoryAccountStore final : public AccountStore {
public:
    std::optional<Account> find(const AccountId& id) const override;
    void put(const AccountId& id, const Account& account) override;
    size_t size() const override { return accounts_.size(); }
    void for_each(
        const std::function<void(const AccountId&, const Account&)>& fn
    ) const override;

private:
    std::map<AccountId, Account> accounts_;
};

} // namespace rewardledger
