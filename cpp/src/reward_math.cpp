#include "rewardledger/reward_math.hpp"
#include "rewardledger/ledger_error.hpp"

namespace rewardledger {

// ------------------------------- fees ----------------------------------------

uint128 RewardMath::fee(const uint128& amount, const LedgerParams& p) {
    return amount * p.fee_bps / p.bps_denominator;
}

uint128 RewardMath::net(const uint128& amount, const LedgerParams& p) {
    return amount - fee(amount, p);
}

uint64_t RewardMath::blocks_between(BlockHeight from, BlockHeight to) {
    if (to < from) {
        throw LedgerError(
            ErrorCode::ClockRegression,
            "clock " + std::to_string(to) + " is before recorded block " + std::to_string(from)
        );
    }
    return to - from;
}

// --------------------------- participation score -----------------------------

uint128 RewardMath::next_score(
    const uint128& score,
    uint64_t elapsed,
    const LedgerParams& p
) {
    if (elapsed > p.decay_threshold) {
        return score * p.decay_numerator / p.decay_denominator;
    }
    // Scores under boost_divisor gain nothing here (truncation)
    uint128 boosted = score + score / p.boost_divisor;
    return boosted > p.max_score ? p.max_score : boosted;
}

uint128 RewardMath::claim_boosted_score(const uint128& score, const LedgerParams& p) {
    uint128 boosted = score + p.claim_score_boost;
    return boosted > p.max_score ? p.max_score : boosted;
}

uint128 RewardMath::accrue_holdings(
    const uint128& cumulative,
    const uint128& balance,
    uint64_t blocks_held
) {
    return cumulative + balance * uint128(blocks_held);
}

// ------------------------------- rewards -------------------------------------

uint128 RewardMath::base_share(
    const Account& account,
    const GlobalState& g,
    const LedgerParams& p
) {
    if (account.balance == 0 || g.total_participation_score == 0 || g.total_supply == 0) {
        return 0;
    }
    // The two halves truncate independently
    uint128 balance_part = (
        g.redistribution_pool * p.balance_weight * account.balance
    ) / (p.weight_denominator * g.total_supply);
    uint128 score_part = (
        g.redistribution_pool * p.score_weight * account.participation_score
    ) / (p.weight_denominator * g.total_participation_score);
    return balance_part + score_part;
}

uint128 RewardMath::time_multiplier(uint64_t blocks_held, const LedgerParams& p) {
    if (blocks_held < p.min_holding_period) {
        return p.multiplier_scale;
    }
    uint128 ramp = uint128(blocks_held) * p.multiplier_scale
        / (uint128(p.min_holding_period) * p.multiplier_ramp_periods);
    uint128 mult = p.multiplier_scale + ramp;
    return mult > p.max_time_multiplier ? p.max_time_multiplier : mult;
}

uint128 RewardMath::velocity_bonus(uint64_t blocks_since_claim, const LedgerParams& p) {
    uint128 window = uint128(p.min_holding_period) * p.velocity_window_periods;
    return uint128(blocks_since_claim) < window ? p.velocity_bonus : uint128(0);
}

RedistributionQuote RewardMath::quote(
    const Account& account,
    const GlobalState& g,
    BlockHeight clock,
    const LedgerParams& p
) {
    RedistributionQuote q;
    q.blocks_held        = blocks_between(account.last_activity_block, clock);
    q.blocks_since_claim = blocks_between(account.last_claim_block, clock);
    q.time_multiplier    = time_multiplier(q.blocks_held, p);
    q.velocity_bonus     = velocity_bonus(q.blocks_since_claim, p);
    q.base_share         = base_share(account, g, p);
    q.adjusted = (
        q.base_share * q.time_multiplier * (p.multiplier_scale + q.velocity_bonus)
    ) / (p.multiplier_scale * p.multiplier_scale);

    // Anti-gaming threshold: dust balances and back-to-back claims earn nothing
    uint128 min_balance = g.total_supply / p.eligibility_divisor;
    q.eligible = account.balance >= min_balance
        && q.adjusted > 0
        && q.blocks_since_claim >= p.min_holding_period;
    return q;
}

} // namespace rewardledger
