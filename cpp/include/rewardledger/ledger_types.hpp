// Ledger value types shared by the reward engine, the store and the JSON layer
#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <string>

namespace rewardledger {

// Checked 128-bit arithmetic: overflow and underflow throw instead of wrapping.
using uint128 = boost::multiprecision::checked_uint128_t;

using AccountId = std::string;
using BlockHeight = uint64_t;

// Every constant of the engine. Defaults are the production values.
struct LedgerParams {
    // Fees (basis points)
    uint128 fee_bps = 200;
    uint128 bps_denominator = 10000;

    // Participation score
    uint128 initial_score = 5000;
    uint128 max_score = 10000;
    uint64_t decay_threshold = 1000;  // blocks of inactivity before decay
    uint128 decay_numerator = 9;
    uint128 decay_denominator = 10;
    uint128 boost_divisor = 100;
    uint128 claim_score_boost = 100;

    // Redistribution
    uint64_t min_holding_period = 144;
    uint64_t multiplier_ramp_periods = 10;  // cap reached at this many periods
    uint64_t velocity_window_periods = 2;
    uint128 multiplier_scale = 10000;     // 1.0x
    uint128 max_time_multiplier = 20000;  // 2.0x
    uint128 velocity_bonus = 1500;        // +15%
    uint128 balance_weight = 60;
    uint128 score_weight = 40;
    uint128 weight_denominator = 100;
    uint128 eligibility_divisor = 1000;   // min balance = supply / divisor
    size_t max_batch_size = 10;

    bool redistribution_active_at_genesis = true;
};

struct Account {
    uint128 balance = 0;
    uint128 participation_score = 0;
    BlockHeight last_activity_block = 0;
    BlockHeight last_claim_block = 0;
    uint128 cumulative_holdings = 0;
    bool registered = false;
};

struct GlobalState {
    uint128 redistribution_pool = 0;
    uint128 total_supply = 0;
    uint128 total_participation_score = 0;
    bool redistribution_active = true;
    uint64_t registered_count = 0;
};

// Per-account evaluation of one redistribution step
struct RedistributionQuote {
    uint64_t blocks_held = 0;
    uint64_t blocks_since_claim = 0;
    uint128 time_multiplier = 0;
    uint128 velocity_bonus = 0;
    uint128 base_share = 0;
    uint128 adjusted = 0;
    bool eligible = false;
};

inline std::string uint128_to_str(const uint128& value) {
    return value.str();
}

} // namespace rewardledger
