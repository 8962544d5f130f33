#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

// Timestamp-string -> value points in the order the caller supplied them.
using Series = std::vector<std::pair<std::string, double>>;

// One (series1, series2, key) triple.
struct PluginPair {
    Series series1;
    Series series2;
    std::string key;
};

struct PluginBatch {
    std::string code;
    std::vector<PluginPair> pairs;
};

// Exactly one of value/error is meaningful, selected by ok.
struct PairResult {
    std::string key;
    bool ok{false};
    double value{0.0};
    std::string error;

    static PairResult success(std::string key, double value);
    static PairResult failure(std::string key, std::string error);
};

struct BatchResponse {
    enum class ErrorKind {
        None,
        Validation,
        BackendUnavailable,
        Timeout,
        Execution,
        Invocation
    };

    bool ok{false};
    std::vector<PairResult> results;
    std::string error;
    ErrorKind kind{ErrorKind::None};

    static BatchResponse success(std::vector<PairResult> results);
    static BatchResponse failure(ErrorKind kind, std::string error);
};

const char* to_string(BatchResponse::ErrorKind kind);

// Wire format. Batches travel as ordered_json so series keep their point
// order; series values that are JSON null round-trip as NaN.
void to_json(nlohmann::ordered_json& j, const PluginPair& p);
void from_json(const nlohmann::ordered_json& j, PluginPair& p);
void to_json(nlohmann::ordered_json& j, const PluginBatch& b);
void from_json(const nlohmann::ordered_json& j, PluginBatch& b);
void to_json(nlohmann::json& j, const PairResult& r);
void to_json(nlohmann::json& j, const BatchResponse& r);

// Strict parse of a backend response document. Returns false (and leaves
// out untouched) unless the document is {"results":[...]} with every entry
// carrying a string key plus exactly one of a numeric result or string error,
// or {"error": "<string>"}.
bool parse_batch_response(const nlohmann::json& doc, BatchResponse& out);

// True when a successful response lines up one-to-one with the batch pairs.
bool matches_pairs(const BatchResponse& response, const std::vector<PluginPair>& pairs);
