#pragma once
#include <nlohmann/json.hpp>
#include <string>

struct HarnessOutcome {
    nlohmann::json response;   // {"results": [...]} or {"error": "..."}
    int exit_code{0};
};

// Evaluates a batch {"code", "pairs"} in a fresh sandbox. A failing pair
// records its own error; only a bad payload or a plugin that fails to load
// produces a top-level error (exit code 1). Never throws.
HarnessOutcome run_harness(const nlohmann::ordered_json& batch);
HarnessOutcome run_harness(const std::string& payload);
