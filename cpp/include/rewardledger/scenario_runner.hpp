// Replays JSON action sequences against fresh ledgers.
#pragma once

#include "ledger_json.hpp"

namespace rewardledger {

struct ScenarioOptions {
    bool save_last_only = false;  // emit only final_state
    long snapshot_every = 1;      // 1 = every action, n > 1 = every n-th, 0 = final only
};

// Reads SAVE_LAST_ONLY and SNAPSHOT_EVERY; malformed or negative values are ignored
ScenarioOptions scenario_options_from_env();

json::object state_report(const RewardLedger& ledger, BlockHeight clock);

// Runs one scenario: "name", "administrator", optional "params" and
// "start_block", and "actions". A failed action is recorded and the run goes on.
// The result carries states, payouts, quotes, audit_ok and success.
json::object process_scenario(const json::object& scenario, const ScenarioOptions& options = {});

} // namespace rewardledger
