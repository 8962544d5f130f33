#pragma once
#include "../plugin_types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Time-indexed sequence handed to plugins. Points keep the order the caller
// supplied; timestamps are only parsed when a caller needs real time.
class TimeSeries {
public:
    TimeSeries() = default;
    explicit TimeSeries(const Series& points);

    size_t size() const { return values_.size(); }
    const std::vector<std::string>& timestamps() const { return timestamps_; }
    const std::vector<double>& values() const { return values_; }
    // First point whose timestamp string equals timestamp.
    std::optional<double> at(const std::string& timestamp) const;

private:
    std::vector<std::string> timestamps_;
    std::vector<double> values_;
};

// ISO-8601 date or date-time ("2024-01-02", "2024-01-02T03:04:05.250Z",
// "2024-01-02 03:04", "...+02:00") to microseconds since the Unix epoch, UTC.
// Throws std::invalid_argument.
int64_t parse_timestamp(const std::string& text);

// "250ms", "30s", "5min", "2h", "1d" (or a bare number of seconds) to
// microseconds. Throws std::invalid_argument.
int64_t parse_tolerance(const std::string& text);

struct AlignedData {
    std::vector<std::string> time;
    std::vector<double> value1;
    std::vector<double> value2;
};

// As-of merge in the nearest direction: each point of a is paired with the
// closest point of b within the tolerance (ties go to the earlier point).
// Duplicate times keep their first point; unmatched or NaN rows are dropped.
// Without a tolerance the larger median sampling interval of the two series
// is used, and if neither has two points the result is empty.
AlignedData align_nearest(const TimeSeries& a, const TimeSeries& b,
                          std::optional<int64_t> tolerance_us = std::nullopt);
