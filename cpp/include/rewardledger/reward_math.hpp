#ifndef REWARDLEDGER_REWARD_MATH_HPP
#define REWARDLEDGER_REWARD_MATH_HPP

#include "ledger_types.hpp"

namespace rewardledger {

// Pure integer formulas of the engine. All divisions truncate.
class RewardMath {
public:
    static uint128 fee(const uint128& amount, const LedgerParams& p);
    static uint128 net(const uint128& amount, const LedgerParams& p);

    // to - from; throws ClockRegression when the clock went backwards
    static uint64_t blocks_between(BlockHeight from, BlockHeight to);

    // Decay after a long idle period, proportional boost otherwise
    static uint128 next_score(
        const uint128& score,
        uint64_t elapsed,
        const LedgerParams& p
    );

    // Flat post-claim boost
    static uint128 claim_boosted_score(const uint128& score, const LedgerParams& p);

    static uint128 accrue_holdings(
        const uint128& cumulative,
        const uint128& balance,
        uint64_t blocks_held
    );

    static uint128 base_share(
        const Account& account,
        const GlobalState& g,
        const LedgerParams& p
    );

    static uint128 time_multiplier(uint64_t blocks_held, const LedgerParams& p);
    static uint128 velocity_bonus(uint64_t blocks_since_claim, const LedgerParams& p);

    static RedistributionQuote quote(
        const Account& account,
        const GlobalState& g,
        BlockHeight clock,
        const LedgerParams& p
    );
};

} // namespace rewardledger

#endif // REWARDLEDGER_REWARD_MATH_HPP
