// JSON encoding of ledger parameters and ledger state.
// 128-bit integers travel as decimal strings, block heights as JSON integers.
#pragma once

#include <boost/json.hpp>

#include "reward_ledger.hpp"

namespace rewardledger {

namespace json = boost::json;

// Accepts a decimal string or a non-negative JSON integer
uint128 uint128_from_json(const json::value& v);
uint64_t block_from_json(const json::value& v);

json::object params_to_json(const LedgerParams& p);
// Keys absent from the object keep their default value
LedgerParams params_from_json(const json::object& obj);

json::object account_to_json(const AccountId& id, const Account& account);
json::object globals_to_json(const GlobalState& g);
json::object quote_to_json(const RedistributionQuote& q);

json::object ledger_to_json(const RewardLedger& ledger);
// Throws LedgerError(InvalidState) when the snapshot breaks an invariant
RewardLedger ledger_from_json(const json::value& snapshot);

} // namespace rewardledger
