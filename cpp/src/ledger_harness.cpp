#include "rewardledger/scenario_runner.hpp"
#include <iostream>
#include <fstream>
#include <thread>
#include <mutex>
#include <atomic>
#include <vector>
#include <cstdlib>
#include <algorithm>
#include <string>

using namespace rewardledger;

int main(int argc, char* argv[]) {
    if (argc != 3) {
        std::cerr << "Usage: " << argv[0] << " <scenarios.json> <output_results.json>" << std::endl;
        return 1;
    }

    std::string scenarios_file = argv[1];
    std::string output_file = argv[2];

    try {
        std::ifstream scenarios_stream(scenarios_file);
        if (!scenarios_stream) {
            throw std::runtime_error("Cannot open scenarios file: " + scenarios_file);
        }
        std::string scenarios_str((std::istreambuf_iterator<char>(scenarios_stream)),
                                  std::istreambuf_iterator<char>());
        json::value scenarios_data = json::parse(scenarios_str);
        json::array scenarios = scenarios_data.as_object().at("scenarios").as_array();
        if (scenarios.empty()) {
            throw std::runtime_error("No scenarios found in " + scenarios_file);
        }

        const char* only_scenario = std::getenv("FILTER_SCENARIO");

        std::vector<size_t> tasks;
        tasks.reserve(scenarios.size());
        for (size_t si = 0; si < scenarios.size(); ++si) {
            std::string name = scenarios[si].as_object().at("name").as_string().c_str();
            if (only_scenario && name != std::string(only_scenario)) continue;
            tasks.push_back(si);
        }

        size_t threads = std::thread::hardware_concurrency();
        if (threads == 0) threads = 4;
        if (const char* thr = std::getenv("CPP_THREADS")) {
            try {
                threads = std::max<size_t>(1, std::stoul(thr));
            } catch (const std::exception& e) {
                std::cerr << "Ignoring CPP_THREADS=" << thr << ": " << e.what() << std::endl;
            }
        }
        const ScenarioOptions options = scenario_options_from_env();
        std::cout << "Running with " << threads << " worker threads (" << tasks.size() << " tasks)" << std::endl;

        // One ledger per task; ledgers are never shared between workers
        std::vector<json::object> results_vec(tasks.size());
        std::atomic<size_t> next{0};
        std::mutex io_mu;

        auto worker = [&]() {
            for (;;) {
                size_t idx = next.fetch_add(1);
                if (idx >= tasks.size()) break;
                const auto& scenario_obj = scenarios[tasks[idx]].as_object();
                std::string name = scenario_obj.at("name").as_string().c_str();
                {
                    std::lock_guard<std::mutex> lk(io_mu);
                    std::cout << "Processing " << name << "..." << std::endl;
                }
                results_vec[idx] = process_scenario(scenario_obj, options);
            }
        };

        std::vector<std::thread> workers;
        workers.reserve(threads);
        for (size_t t = 0; t < threads; ++t) workers.emplace_back(worker);
        for (auto& th : workers) th.join();

        json::array results;
        results.reserve(results_vec.size());
        bool all_success = true;
        bool all_audits_ok = true;
        for (auto& obj : results_vec) {
            if (!obj.at("success").as_bool()) all_success = false;
            if (!obj.at("audit_ok").as_bool()) {
                all_audits_ok = false;
                std::cerr << "Audit failed for " << obj.at("scenario").as_string().c_str() << std::endl;
            }
            results.push_back(obj);
        }

        json::object output;
        output["results"] = results;
        output["metadata"] = {
            {"scenarios_file", scenarios_file},
            {"num_scenarios", tasks.size()},
            {"all_success", all_success},
            {"all_audits_ok", all_audits_ok}
        };

        std::ofstream out_file(output_file);
        if (!out_file) {
            throw std::runtime_error("Cannot open output file: " + output_file);
        }
        out_file << json::serialize(output) << std::endl;

        std::cout << "\nProcessed " << tasks.size() << " scenarios" << std::endl;
        std::cout << "Results written to " << output_file << std::endl;

        // Failed actions are expected in scenarios; a broken invariant is not
        if (!all_audits_ok) {
            return 2;
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
