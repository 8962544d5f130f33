#include "time_series.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

TimeSeries::TimeSeries(const Series& points) {
    timestamps_.reserve(points.size());
    values_.reserve(points.size());
    for (const auto& kv : points) {
        timestamps_.push_back(kv.first);
        values_.push_back(kv.second);
    }
}

std::optional<double> TimeSeries::at(const std::string& timestamp) const {
    auto it = std::find(timestamps_.begin(), timestamps_.end(), timestamp);
    if (it == timestamps_.end()) return std::nullopt;
    return values_[static_cast<size_t>(it - timestamps_.begin())];
}

// Howard Hinnant's days_from_civil
static int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

static bool is_leap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

static int days_in_month(int y, int m) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return m == 2 && is_leap(y) ? 29 : days[m - 1];
}

namespace {

class Cursor {
public:
    explicit Cursor(const std::string& s) : s_(s) {}

    bool done() const { return i_ >= s_.size(); }
    char peek() const { return done() ? '\0' : s_[i_]; }
    bool accept(char c) {
        if (peek() != c) return false;
        ++i_;
        return true;
    }
    int digits(size_t n) {
        int v = 0;
        for (size_t k = 0; k < n; ++k) {
            if (done() || !std::isdigit(static_cast<unsigned char>(s_[i_]))) fail();
            v = v * 10 + (s_[i_++] - '0');
        }
        return v;
    }
    [[noreturn]] void fail() const {
        throw std::invalid_argument("Unrecognized timestamp: '" + s_ + "'");
    }

private:
    const std::string& s_;
    size_t i_{0};
};

} // namespace

int64_t parse_timestamp(const std::string& text) {
    Cursor c(text);
    const int year = c.digits(4);
    if (!c.accept('-')) c.fail();
    const int month = c.digits(2);
    if (!c.accept('-')) c.fail();
    const int day = c.digits(2);
    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) c.fail();

    int64_t seconds = 0;
    int64_t micros = 0;
    int64_t offset = 0;
    if (c.accept('T') || c.accept(' ')) {
        const int hh = c.digits(2);
        if (!c.accept(':')) c.fail();
        const int mm = c.digits(2);
        int ss = 0;
        if (c.accept(':')) {
            ss = c.digits(2);
            if (c.accept('.')) {
                int64_t scale = 100000;
                size_t n = 0;
                while (std::isdigit(static_cast<unsigned char>(c.peek()))) {
                    const int d = c.digits(1);
                    if (n++ < 6) {
                        micros += d * scale;
                        scale /= 10;
                    }
                }
                if (n == 0) c.fail();
            }
        }
        if (hh > 23 || mm > 59 || ss > 60) c.fail();
        seconds = hh * 3600 + mm * 60 + ss;

        const char zone = c.peek();
        if (zone == 'Z') {
            c.accept('Z');
        } else if (zone == '+' || zone == '-') {
            c.accept(zone);
            const int sign = zone == '-' ? -1 : 1;
            const int oh = c.digits(2);
            c.accept(':');
            const int om = c.digits(2);
            offset = sign * (oh * 3600 + om * 60);
        }
    }
    if (!c.done()) c.fail();

    const int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    return (days * 86400 + seconds - offset) * 1000000 + micros;
}

int64_t parse_tolerance(const std::string& text) {
    size_t pos = 0;
    double amount = 0;
    try {
        amount = std::stod(text, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid tolerance: '" + text + "'");
    }
    std::string unit = text.substr(pos);
    unit.erase(0, unit.find_first_not_of(' '));

    double scale = 0;
    if (unit.empty() || unit == "s" || unit == "sec") scale = 1e6;
    else if (unit == "ms") scale = 1e3;
    else if (unit == "us") scale = 1;
    else if (unit == "min" || unit == "m") scale = 60e6;
    else if (unit == "h") scale = 3600e6;
    else if (unit == "d") scale = 86400e6;
    else throw std::invalid_argument("Invalid tolerance unit: '" + unit + "'");

    if (!std::isfinite(amount) || amount < 0) throw std::invalid_argument("Invalid tolerance: '" + text + "'");
    return static_cast<int64_t>(std::llround(amount * scale));
}

namespace {

struct Point {
    int64_t t;
    const std::string* label;
    double value;
};

// sorted by time, first point wins on duplicate times
std::vector<Point> index_points(const TimeSeries& s) {
    std::vector<Point> pts;
    pts.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        pts.push_back({parse_timestamp(s.timestamps()[i]), &s.timestamps()[i], s.values()[i]});
    }
    std::stable_sort(pts.begin(), pts.end(), [](const Point& a, const Point& b) { return a.t < b.t; });
    pts.erase(std::unique(pts.begin(), pts.end(), [](const Point& a, const Point& b) { return a.t == b.t; }),
              pts.end());
    return pts;
}

std::optional<int64_t> median_interval(const std::vector<Point>& pts) {
    if (pts.size() < 2) return std::nullopt;
    std::vector<int64_t> deltas;
    for (size_t i = 1; i < pts.size(); ++i) deltas.push_back(pts[i].t - pts[i - 1].t);
    std::sort(deltas.begin(), deltas.end());
    const size_t mid = deltas.size() / 2;
    if (deltas.size() % 2) return deltas[mid];
    return (deltas[mid - 1] + deltas[mid]) / 2;
}

} // namespace

AlignedData align_nearest(const TimeSeries& a, const TimeSeries& b, std::optional<int64_t> tolerance_us) {
    AlignedData out;
    const auto left = index_points(a);
    const auto right = index_points(b);

    if (!tolerance_us) {
        auto la = median_interval(left);
        auto lb = median_interval(right);
        if (!la && !lb) return out;
        tolerance_us = std::max(la.value_or(0), lb.value_or(0));
    }

    for (const auto& p : left) {
        // first right point strictly after p, so the one before it is <= p
        auto after = std::upper_bound(right.begin(), right.end(), p.t,
                                      [](int64_t t, const Point& q) { return t < q.t; });
        const Point* back = after == right.begin() ? nullptr : &*(after - 1);
        const Point* fwd = nullptr;
        if (back && back->t == p.t) fwd = back;
        else if (after != right.end()) fwd = &*after;

        const Point* match = back;
        if (!back || (fwd && fwd->t - p.t < p.t - back->t)) match = fwd;
        if (!match || std::llabs(match->t - p.t) > *tolerance_us) continue;
        if (std::isnan(p.value) || std::isnan(match->value)) continue;

        out.time.push_back(*p.label);
        out.value1.push_back(p.value);
        out.value2.push_back(match->value);
    }
    return out;
}
