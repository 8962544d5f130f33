#include "run_harness.hpp"
#include "lua_sandbox.hpp"
#include "../plugin_types.hpp"

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

static HarnessOutcome top_level_error(const std::string& message) {
    return {json{{"error", message}}, 1};
}

HarnessOutcome run_harness(const ordered_json& batch) {
    if (!batch.is_object() || !batch.contains("code") || !batch["code"].is_string()) {
        return top_level_error("Invalid batch payload: 'code' must be a string");
    }
    if (!batch.contains("pairs") || !batch["pairs"].is_array()) {
        return top_level_error("Invalid batch payload: 'pairs' must be an array");
    }

    try {
        LuaSandbox sandbox;
        sandbox.load(batch["code"].get<std::string>());

        std::vector<PairResult> results;
        for (const auto& item : batch["pairs"]) {
            std::string key;
            if (item.is_object() && item.contains("key") && item["key"].is_string()) {
                key = item["key"].get<std::string>();
            }
            try {
                const auto pair = item.get<PluginPair>();
                const double value = sandbox.calculate(TimeSeries(pair.series1), TimeSeries(pair.series2));
                results.push_back(PairResult::success(key, value));
            } catch (const std::exception& e) {
                results.push_back(PairResult::failure(key, e.what()));
            }
        }
        return {json(BatchResponse::success(std::move(results))), 0};
    } catch (const std::exception& e) {
        return top_level_error(e.what());
    }
}

HarnessOutcome run_harness(const std::string& payload) {
    ordered_json doc = ordered_json::parse(payload, nullptr, /*allow_exceptions*/false);
    if (doc.is_discarded()) {
        return top_level_error("Invalid batch payload: not valid JSON");
    }
    return run_harness(doc);
}
