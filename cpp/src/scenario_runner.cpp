#include "rewardledger/scenario_runner.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace rewardledger {

namespace {

std::string str_field(const json::object& act, const char* key) {
    return act.at(key).as_string().c_str();
}

// Optional caller override; mint/set_active/redistribute default to the
// administrator, transfer defaults to the sender
std::string caller_or(const json::object& act, const std::string& fallback) {
    if (const json::value* v = act.if_contains("caller")) {
        return v->as_string().c_str();
    }
    return fallback;
}

bool trace_enabled() {
    const char* env = std::getenv("TRACE");
    return env && std::string(env) == "1";
}

} // namespace

ScenarioOptions scenario_options_from_env() {
    ScenarioOptions options;
    if (const char* env = std::getenv("SAVE_LAST_ONLY")) {
        options.save_last_only = std::string(env) == "1";
    }
    if (const char* sev = std::getenv("SNAPSHOT_EVERY")) {
        try {
            long every = std::stol(sev);
            if (every < 0) {
                std::cerr << "Ignoring SNAPSHOT_EVERY=" << sev << ": must be >= 0" << std::endl;
            } else {
                options.snapshot_every = every;
            }
        } catch (const std::exception& e) {
            std::cerr << "Ignoring SNAPSHOT_EVERY=" << sev << ": " << e.what() << std::endl;
        }
    }
    return options;
}

json::object state_report(const RewardLedger& ledger, BlockHeight clock) {
    json::array accounts;
    ledger.store().for_each([&](const AccountId& id, const Account& account) {
        accounts.push_back(account_to_json(id, account));
    });
    json::object obj;
    obj["block"] = clock;
    obj["globals"] = globals_to_json(ledger.globals());
    obj["accounts"] = std::move(accounts);
    return obj;
}

// Actions run at the scenario clock; "blocks" on an action advances the clock
// before the action executes.
json::object process_scenario(const json::object& scenario, const ScenarioOptions& options) {
    json::object result;
    result["scenario"] = scenario.at("name");

    try {
        std::string administrator = str_field(scenario, "administrator");
        LedgerParams params;
        if (const json::value* p = scenario.if_contains("params")) {
            params = params_from_json(p->as_object());
        }
        RewardLedger ledger(administrator, params);

        BlockHeight clock = 0;
        if (const json::value* start = scenario.if_contains("start_block")) {
            clock = block_from_json(*start);
        }

        const bool save_last_only = options.save_last_only;
        const long snapshot_every = save_last_only ? 0 : options.snapshot_every;

        json::array states;
        json::array payouts;
        json::array quotes;
        bool all_success = true;

        const auto& actions = scenario.at("actions").as_array();
        size_t action_idx = 0;
        for (const auto& action : actions) {
            const auto& act = action.as_object();

            bool success = true;
            std::string error;
            std::string error_code;

            try {
                if (const json::value* blocks = act.if_contains("blocks")) {
                    clock += block_from_json(*blocks);
                }

                const auto& type = act.at("type").as_string();
                if (type == "register") {
                    ledger.register_account(str_field(act, "account"), clock);
                } else if (type == "mint") {
                    ledger.mint(
                        caller_or(act, administrator),
                        uint128_from_json(act.at("amount")),
                        str_field(act, "recipient")
                    );
                } else if (type == "transfer") {
                    std::string sender = str_field(act, "sender");
                    ledger.transfer(
                        caller_or(act, sender),
                        uint128_from_json(act.at("amount")),
                        sender,
                        str_field(act, "recipient"),
                        clock
                    );
                } else if (type == "set_active") {
                    ledger.set_redistribution_active(
                        caller_or(act, administrator),
                        act.at("active").as_bool()
                    );
                } else if (type == "redistribute") {
                    std::vector<AccountId> beneficiaries;
                    for (const auto& b : act.at("beneficiaries").as_array()) {
                        beneficiaries.emplace_back(b.as_string().c_str());
                    }
                    auto paid = ledger.execute_algorithmic_redistribution(
                        caller_or(act, administrator), beneficiaries, clock
                    );
                    json::array amounts;
                    for (const auto& amount : paid) {
                        amounts.push_back(json::value(uint128_to_str(amount)));
                    }
                    payouts.push_back(json::object{
                        {"action", action_idx},
                        {"block", clock},
                        {"payouts", amounts}
                    });
                } else if (type == "quote") {
                    std::string account = str_field(act, "account");
                    json::object quote = quote_to_json(ledger.quote_redistribution(account, clock));
                    quotes.push_back(json::object{
                        {"action", action_idx},
                        {"block", clock},
                        {"account", account},
                        {"quote", quote}
                    });
                } else if (type == "advance") {
                    // clock already moved by "blocks"
                } else {
                    throw std::invalid_argument("unknown action type: " + std::string(type.c_str()));
                }
            } catch (const LedgerError& e) {
                success = false;
                error = e.what();
                error_code = e.code_name();
            } catch (const std::exception& e) {
                success = false;
                error = e.what();
            }

            if (!success) all_success = false;

            bool do_snap = false;
            if (snapshot_every == 1) {
                do_snap = true;
            } else if (snapshot_every > 1 && ((action_idx + 1) % snapshot_every == 0)) {
                do_snap = true;
            }

            if (do_snap) {
                auto state_json = state_report(ledger, clock);
                state_json["action"] = action_idx;
                state_json["action_success"] = success;
                if (!success) {
                    state_json["error"] = error;
                    if (!error_code.empty()) state_json["error_code"] = error_code;
                }
                states.push_back(state_json);
            } else if (!success && trace_enabled()) {
                std::cout << "TRACE action_failed index=" << action_idx << " error=" << error << "\n";
            }
            action_idx++;
        }

        // Always capture the final state when intermediate snapshots were thinned
        if (snapshot_every == 0 || (snapshot_every > 1 && (action_idx % snapshot_every != 0))) {
            auto final_state = state_report(ledger, clock);
            final_state["action_success"] = all_success;
            states.push_back(final_state);
        }

        if (save_last_only) {
            result["final_state"] = states.back();
        } else {
            result["states"] = states;
        }
        result["payouts"] = payouts;
        result["quotes"] = quotes;

        // Full recount of the invariants after the run
        try {
            ledger.audit();
            result["audit_ok"] = true;
        } catch (const LedgerError& e) {
            result["audit_ok"] = false;
            result["audit_error"] = e.what();
            all_success = false;
        }
        result["success"] = all_success;

    } catch (const std::exception& e) {
        result["success"] = false;
        result["audit_ok"] = false;
        result["error"] = e.what();
    }

    return result;
}

} // namespace rewardledger
