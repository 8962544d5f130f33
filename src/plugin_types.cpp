#include "plugin_types.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

PairResult PairResult::success(std::string key, double value) {
    PairResult r;
    r.key = std::move(key);
    r.ok = true;
    r.value = value;
    return r;
}

PairResult PairResult::failure(std::string key, std::string error) {
    PairResult r;
    r.key = std::move(key);
    r.error = std::move(error);
    return r;
}

BatchResponse BatchResponse::success(std::vector<PairResult> results) {
    BatchResponse r;
    r.ok = true;
    r.results = std::move(results);
    return r;
}

BatchResponse BatchResponse::failure(ErrorKind kind, std::string error) {
    BatchResponse r;
    r.kind = kind;
    r.error = std::move(error);
    return r;
}

const char* to_string(BatchResponse::ErrorKind kind) {
    switch (kind) {
        case BatchResponse::ErrorKind::None: return "none";
        case BatchResponse::ErrorKind::Validation: return "validation";
        case BatchResponse::ErrorKind::BackendUnavailable: return "backend_unavailable";
        case BatchResponse::ErrorKind::Timeout: return "timeout";
        case BatchResponse::ErrorKind::Execution: return "execution";
        case BatchResponse::ErrorKind::Invocation: return "invocation";
    }
    return "unknown";
}

// ------------------ series ------------------

static ordered_json series_to_json(const Series& s) {
    ordered_json obj = ordered_json::object();
    for (const auto& [ts, v] : s) {
        if (std::isnan(v)) obj[ts] = nullptr;
        else obj[ts] = v;
    }
    return obj;
}

static Series series_from_json(const ordered_json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("series must be an object of timestamp -> number");
    }
    Series out;
    out.reserve(j.size());
    for (auto it = j.begin(); it != j.end(); ++it) {
        const auto& v = it.value();
        if (v.is_null()) {
            out.emplace_back(it.key(), std::numeric_limits<double>::quiet_NaN());
        } else if (v.is_number()) {
            out.emplace_back(it.key(), v.get<double>());
        } else {
            throw std::invalid_argument("series value for '" + it.key() + "' must be a number");
        }
    }
    return out;
}

void to_json(ordered_json& j, const PluginPair& p) {
    j = ordered_json{{"series1", series_to_json(p.series1)},
                     {"series2", series_to_json(p.series2)},
                     {"key", p.key}};
}

void from_json(const ordered_json& j, PluginPair& p) {
    p.series1 = series_from_json(j.at("series1"));
    p.series2 = series_from_json(j.at("series2"));
    p.key = j.value("key", std::string());
}

void to_json(ordered_json& j, const PluginBatch& b) {
    j = ordered_json{{"code", b.code}, {"pairs", b.pairs}};
}

void from_json(const ordered_json& j, PluginBatch& b) {
    b.code = j.at("code").get<std::string>();
    b.pairs = j.at("pairs").get<std::vector<PluginPair>>();
}

// ------------------ responses ------------------

void to_json(json& j, const PairResult& r) {
    if (r.ok) j = json{{"key", r.key}, {"result", r.value}};
    else j = json{{"key", r.key}, {"error", r.error}};
}

void to_json(json& j, const BatchResponse& r) {
    if (r.ok) j = json{{"results", r.results}};
    else j = json{{"error", r.error}};
}

bool parse_batch_response(const json& doc, BatchResponse& out) {
    if (!doc.is_object()) return false;

    if (doc.contains("results")) {
        const auto& arr = doc["results"];
        if (!arr.is_array()) return false;
        std::vector<PairResult> results;
        results.reserve(arr.size());
        for (const auto& item : arr) {
            if (!item.is_object()) return false;
            if (!item.contains("key") || !item["key"].is_string()) return false;
            const bool has_result = item.contains("result");
            const bool has_error = item.contains("error");
            if (has_result == has_error) return false;
            auto key = item["key"].get<std::string>();
            if (has_result) {
                if (!item["result"].is_number()) return false;
                results.push_back(PairResult::success(std::move(key), item["result"].get<double>()));
            } else {
                if (!item["error"].is_string()) return false;
                results.push_back(PairResult::failure(std::move(key), item["error"].get<std::string>()));
            }
        }
        out = BatchResponse::success(std::move(results));
        return true;
    }

    if (doc.contains("error") && doc["error"].is_string()) {
        out = BatchResponse::failure(BatchResponse::ErrorKind::Execution, doc["error"].get<std::string>());
        return true;
    }
    return false;
}

bool matches_pairs(const BatchResponse& response, const std::vector<PluginPair>& pairs) {
    if (!response.ok) return true;
    if (response.results.size() != pairs.size()) return false;
    for (std::size_t i = 0; i < pairs.size(); ++i) {
        if (response.results[i].key != pairs[i].key) return false;
    }
    return true;
}
