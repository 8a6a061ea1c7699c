#include "rewardledger/ledger_json.hpp"

#include <boost/json/src.hpp>

#include <stdexcept>
#include <string>

namespace rewardledger {

// ------------------------------ scalars --------------------------------------

uint128 uint128_from_json(const json::value& v) {
    if (v.is_string()) {
        std::string s = v.as_string().c_str();
        if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
            throw std::invalid_argument("expected unsigned decimal string, got \"" + s + "\"");
        }
        return uint128(s);
    }
    if (v.is_uint64()) {
        return uint128(v.as_uint64());
    }
    if (v.is_int64()) {
        int64_t x = v.as_int64();
        if (x < 0) {
            throw std::invalid_argument("expected unsigned integer, got " + std::to_string(x));
        }
        return uint128(static_cast<uint64_t>(x));
    }
    throw std::invalid_argument("expected unsigned integer, got " + json::serialize(v));
}

uint64_t block_from_json(const json::value& v) {
    if (v.is_uint64()) {
        return v.as_uint64();
    }
    if (v.is_int64() && v.as_int64() >= 0) {
        return static_cast<uint64_t>(v.as_int64());
    }
    throw std::invalid_argument("expected block height, got " + json::serialize(v));
}

// ------------------------------ params ---------------------------------------

json::object params_to_json(const LedgerParams& p) {
    json::object obj;
    obj["fee_bps"] = uint128_to_str(p.fee_bps);
    obj["bps_denominator"] = uint128_to_str(p.bps_denominator);
    obj["initial_score"] = uint128_to_str(p.initial_score);
    obj["max_score"] = uint128_to_str(p.max_score);
    obj["decay_threshold"] = p.decay_threshold;
    obj["decay_numerator"] = uint128_to_str(p.decay_numerator);
    obj["decay_denominator"] = uint128_to_str(p.decay_denominator);
    obj["boost_divisor"] = uint128_to_str(p.boost_divisor);
    obj["claim_score_boost"] = uint128_to_str(p.claim_score_boost);
    obj["min_holding_period"] = p.min_holding_period;
    obj["multiplier_ramp_periods"] = p.multiplier_ramp_periods;
    obj["velocity_window_periods"] = p.velocity_window_periods;
    obj["multiplier_scale"] = uint128_to_str(p.multiplier_scale);
    obj["max_time_multiplier"] = uint128_to_str(p.max_time_multiplier);
    obj["velocity_bonus"] = uint128_to_str(p.velocity_bonus);
    obj["balance_weight"] = uint128_to_str(p.balance_weight);
    obj["score_weight"] = uint128_to_str(p.score_weight);
    obj["weight_denominator"] = uint128_to_str(p.weight_denominator);
    obj["eligibility_divisor"] = uint128_to_str(p.eligibility_divisor);
    obj["max_batch_size"] = static_cast<uint64_t>(p.max_batch_size);
    obj["redistribution_active_at_genesis"] = p.redistribution_active_at_genesis;
    return obj;
}

LedgerParams params_from_json(const json::object& obj) {
    LedgerParams p;
    auto u128 = [&](const char* key, uint128& field) {
        if (const json::value* v = obj.if_contains(key)) field = uint128_from_json(*v);
    };
    auto u64 = [&](const char* key, uint64_t& field) {
        if (const json::value* v = obj.if_contains(key)) field = block_from_json(*v);
    };

    u128("fee_bps", p.fee_bps);
    u128("bps_denominator", p.bps_denominator);
    u128("initial_score", p.initial_score);
    u128("max_score", p.max_score);
    u64("decay_threshold", p.decay_threshold);
    u128("decay_numerator", p.decay_numerator);
    u128("decay_denominator", p.decay_denominator);
    u128("boost_divisor", p.boost_divisor);
    u128("claim_score_boost", p.claim_score_boost);
    u64("min_holding_period", p.min_holding_period);
    u64("multiplier_ramp_periods", p.multiplier_ramp_periods);
    u64("velocity_window_periods", p.velocity_window_periods);
    u128("multiplier_scale", p.multiplier_scale);
    u128("max_time_multiplier", p.max_time_multiplier);
    u128("velocity_bonus", p.velocity_bonus);
    u128("balance_weight", p.balance_weight);
    u128("score_weight", p.score_weight);
    u128("weight_denominator", p.weight_denominator);
    u128("eligibility_divisor", p.eligibility_divisor);
    if (const json::value* v = obj.if_contains("max_batch_size")) {
        p.max_batch_size = static_cast<size_t>(block_from_json(*v));
    }
    if (const json::value* v = obj.if_contains("redistribution_active_at_genesis")) {
        p.redistribution_active_at_genesis = v->as_bool();
    }

    // Divisors of the formulas; zero would fault on first use
    if (p.bps_denominator == 0 || p.decay_denominator == 0 || p.boost_divisor == 0
        || p.multiplier_scale == 0 || p.weight_denominator == 0 || p.eligibility_divisor == 0
        || p.min_holding_period == 0 || p.multiplier_ramp_periods == 0) {
        throw std::invalid_argument("ledger params: divisors must be non-zero");
    }
    if (p.initial_score > p.max_score) {
        throw std::invalid_argument(
            "ledger params: initial_score " + uint128_to_str(p.initial_score)
                + " exceeds max_score " + uint128_to_str(p.max_score)
        );
    }
    return p;
}

// ------------------------------ records --------------------------------------

json::object account_to_json(const AccountId& id, const Account& account) {
    json::object obj;
    obj["id"] = id;
    obj["balance"] = uint128_to_str(account.balance);
    obj["participation_score"] = uint128_to_str(account.participation_score);
    obj["last_activity_block"] = account.last_activity_block;
    obj["last_claim_block"] = account.last_claim_block;
    obj["cumulative_holdings"] = uint128_to_str(account.cumulative_holdings);
    obj["registered"] = account.registered;
    return obj;
}

json::object globals_to_json(const GlobalState& g) {
    json::object obj;
    obj["redistribution_pool"] = uint128_to_str(g.redistribution_pool);
    obj["total_supply"] = uint128_to_str(g.total_supply);
    obj["total_participation_score"] = uint128_to_str(g.total_participation_score);
    obj["redistribution_active"] = g.redistribution_active;
    obj["registered_count"] = g.registered_count;
    return obj;
}

json::object quote_to_json(const RedistributionQuote& q) {
    json::object obj;
    obj["blocks_held"] = q.blocks_held;
    obj["blocks_since_claim"] = q.blocks_since_claim;
    obj["time_multiplier"] = uint128_to_str(q.time_multiplier);
    obj["velocity_bonus"] = uint128_to_str(q.velocity_bonus);
    obj["base_share"] = uint128_to_str(q.base_share);
    obj["adjusted"] = uint128_to_str(q.adjusted);
    obj["eligible"] = q.eligible;
    return obj;
}

// ------------------------------ snapshot -------------------------------------

json::object ledger_to_json(const RewardLedger& ledger) {
    json::array accounts;
    ledger.store().for_each([&](const AccountId& id, const Account& account) {
        accounts.push_back(account_to_json(id, account));
    });

    json::object obj;
    obj["administrator"] = ledger.administrator();
    obj["params"] = params_to_json(ledger.params());
    obj["globals"] = globals_to_json(ledger.globals());
    obj["accounts"] = std::move(accounts);
    return obj;
}

RewardLedger ledger_from_json(const json::value& snapshot) {
    const json::object& root = snapshot.as_object();

    AccountId administrator = root.at("administrator").as_string().c_str();
    LedgerParams params;
    if (const json::value* p = root.if_contains("params")) {
        params = params_from_json(p->as_object());
    }

    const json::object& gobj = root.at("globals").as_object();
    GlobalState g;
    g.redistribution_pool = uint128_from_json(gobj.at("redistribution_pool"));
    g.total_supply = uint128_from_json(gobj.at("total_supply"));
    g.total_participation_score = uint128_from_json(gobj.at("total_participation_score"));
    g.redistribution_active = gobj.at("redistribution_active").as_bool();
    g.registered_count = block_from_json(gobj.at("registered_count"));

    auto store = std::make_unique<InMemoryAccountStore>();
    for (const auto& entry : root.at("accounts").as_array()) {
        const json::object& aobj = entry.as_object();
        AccountId id = aobj.at("id").as_string().c_str();
        if (store->contains(id)) {
            throw LedgerError(ErrorCode::InvalidState, "duplicate account in snapshot: " + id);
        }
        Account account;
        account.balance = uint128_from_json(aobj.at("balance"));
        account.participation_score = uint128_from_json(aobj.at("participation_score"));
        account.last_activity_block = block_from_json(aobj.at("last_activity_block"));
        account.last_claim_block = block_from_json(aobj.at("last_claim_block"));
        account.cumulative_holdings = uint128_from_json(aobj.at("cumulative_holdings"));
        account.registered = aobj.at("registered").as_bool();
        store->put(id, account);
    }

    return RewardLedger(std::move(administrator), std::move(params), std::move(g), std::move(store));
}

} // namespace rewardledger
