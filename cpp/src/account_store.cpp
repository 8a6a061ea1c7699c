#include "rewardledger/account_store.hpp"

namespace rewardledger {

std::optional<Account> InMemoryAccountStore::find(const AccountId& id) const {
    auto it = accounts_.find(id);
    if (it == accounts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryAccountStore::put(const AccountId& id, const Account& account) {
    accounts_[id] = account;
}

void InMemoryAccountStore::for_each(
    const std::function<void(const AccountId&, const Account&)>& fn
) const {
    for (const auto& [id, account] : accounts_) {
        fn(id, account);
    }
}

} // namespace rewardledger
