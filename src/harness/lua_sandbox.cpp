#include "lua_sandbox.hpp"
#include <boost/math/statistics/bivariate_statistics.hpp>
#include <boost/math/statistics/univariate_statistics.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace bstats = boost::math::statistics;

static const char* const kBaseFunctions[] = {
    "assert", "error", "ipairs", "next", "pairs", "pcall", "select",
    "tonumber", "tostring", "type", "unpack", "xpcall", "_VERSION",
    "math", "string", "table",
};

LuaSandbox::LuaSandbox() {
    L_.open_libraries(sol::lib::base, sol::lib::math, sol::lib::string, sol::lib::table);
    // shared with every string through the string metatable
    L_["string"]["dump"] = sol::lua_nil;

    env_ = sol::environment(L_, sol::create);
    for (const char* name : kBaseFunctions) {
        sol::object fn = L_[name];
        if (fn.valid()) env_[name] = fn;
    }

    env_["print"] = [](sol::variadic_args args) {
        bool first = true;
        for (auto arg : args) {
            if (!first) std::cerr << '\t';
            first = false;
            switch (arg.get_type()) {
                case sol::type::string:
                case sol::type::number: std::cerr << arg.as<std::string>(); break;
                case sol::type::boolean: std::cerr << (arg.as<bool>() ? "true" : "false"); break;
                case sol::type::lua_nil: std::cerr << "nil"; break;
                default: std::cerr << sol::type_name(arg.lua_state(), arg.get_type()); break;
            }
        }
        std::cerr << std::endl;
    };

    L_.new_usertype<TimeSeries>("TimeSeries", sol::no_constructor,
        sol::meta_function::index, [](const TimeSeries& s, sol::object key, sol::this_state ts) -> sol::object {
            if (key.get_type() == sol::type::number) {
                const double pos = key.as<double>();
                if (pos >= 1 && pos <= static_cast<double>(s.size()) && std::floor(pos) == pos) {
                    return sol::make_object(ts, s.values()[static_cast<size_t>(pos) - 1]);
                }
            } else if (key.get_type() == sol::type::string) {
                if (auto v = s.at(key.as<std::string>())) return sol::make_object(ts, *v);
            }
            return sol::make_object(ts, sol::lua_nil);
        },
        sol::meta_function::length, &TimeSeries::size,
        "size", &TimeSeries::size,
        "values", [](const TimeSeries& s) { return sol::as_table(s.values()); },
        "timestamps", [](const TimeSeries& s) { return sol::as_table(s.timestamps()); });

    install_stats();
    install_helpers();
}

// Accepts a TimeSeries or an array of numbers. NaN (missing) entries are kept.
static std::vector<double> raw_values(const sol::object& o) {
    if (o.is<TimeSeries>()) return o.as<const TimeSeries&>().values();
    if (o.get_type() == sol::type::table) {
        sol::table t = o.as<sol::table>();
        std::vector<double> out;
        const size_t n = t.size();
        out.reserve(n);
        for (size_t i = 1; i <= n; ++i) {
            sol::object v = t[i];
            if (v.get_type() != sol::type::number) throw std::invalid_argument("stats: array elements must be numbers");
            out.push_back(v.as<double>());
        }
        return out;
    }
    throw std::invalid_argument("stats: expected a series or an array of numbers");
}

static std::vector<double> sample(const sol::object& o, size_t min_size) {
    std::vector<double> v;
    for (double d : raw_values(o)) {
        if (!std::isnan(d)) v.push_back(d);
    }
    if (v.size() < min_size) {
        throw std::invalid_argument("stats: at least " + std::to_string(min_size) + " value(s) required");
    }
    return v;
}

// Rows where either side is missing are dropped.
static std::pair<std::vector<double>, std::vector<double>> paired_sample(const sol::object& a, const sol::object& b) {
    const auto x = raw_values(a);
    const auto y = raw_values(b);
    if (x.size() != y.size()) throw std::invalid_argument("stats: inputs must have the same length");
    std::pair<std::vector<double>, std::vector<double>> out;
    for (size_t i = 0; i < x.size(); ++i) {
        if (std::isnan(x[i]) || std::isnan(y[i])) continue;
        out.first.push_back(x[i]);
        out.second.push_back(y[i]);
    }
    if (out.first.size() < 2) throw std::invalid_argument("stats: at least 2 paired values required");
    return out;
}

void LuaSandbox::install_stats() {
    sol::table stats = L_.create_table();
    stats["mean"] = [](sol::object x) { return bstats::mean(sample(x, 1)); };
    stats["variance"] = [](sol::object x) { return bstats::variance(sample(x, 1)); };
    stats["sample_variance"] = [](sol::object x) { return bstats::sample_variance(sample(x, 2)); };
    stats["stdev"] = [](sol::object x) { return std::sqrt(bstats::sample_variance(sample(x, 2))); };
    stats["median"] = [](sol::object x) {
        auto v = sample(x, 1);
        return bstats::median(v);
    };
    stats["skewness"] = [](sol::object x) { return bstats::skewness(sample(x, 1)); };
    stats["kurtosis"] = [](sol::object x) { return bstats::kurtosis(sample(x, 1)); };
    stats["covariance"] = [](sol::object a, sol::object b) {
        auto xy = paired_sample(a, b);
        return bstats::covariance(xy.first, xy.second);
    };
    stats["correlation"] = [](sol::object a, sol::object b) {
        auto xy = paired_sample(a, b);
        return bstats::correlation_coefficient(xy.first, xy.second);
    };
    env_["stats"] = stats;
}

static TimeSeries series_arg(const sol::object& o) {
    if (o.is<TimeSeries>()) return o.as<const TimeSeries&>();
    if (o.get_type() == sol::type::table) {
        Series points;
        for (auto& kv : o.as<sol::table>()) {
            if (kv.first.get_type() != sol::type::string || kv.second.get_type() != sol::type::number) {
                throw std::invalid_argument("get_aligned_data: series tables map timestamp strings to numbers");
            }
            points.emplace_back(kv.first.as<std::string>(), kv.second.as<double>());
        }
        // table traversal order is unspecified
        std::sort(points.begin(), points.end());
        return TimeSeries(points);
    }
    throw std::invalid_argument("get_aligned_data: expected a series");
}

void LuaSandbox::install_helpers() {
    env_["get_aligned_data"] = [](sol::object a, sol::object b, sol::variadic_args rest, sol::this_state ts) {
        std::optional<int64_t> tol;
        const sol::type tol_type = rest.size() > 0 ? rest[0].get_type() : sol::type::lua_nil;
        if (tol_type == sol::type::number) {
            const double secs = rest.get<double>(0);
            if (!std::isfinite(secs) || secs < 0) throw std::invalid_argument("get_aligned_data: invalid tolerance");
            tol = static_cast<int64_t>(std::llround(secs * 1e6));
        } else if (tol_type == sol::type::string) {
            tol = parse_tolerance(rest.get<std::string>(0));
        } else if (tol_type != sol::type::lua_nil) {
            throw std::invalid_argument("get_aligned_data: tolerance must be seconds or a duration string");
        }

        AlignedData aligned = align_nearest(series_arg(a), series_arg(b), tol);
        sol::state_view L(ts);
        sol::table out = L.create_table();
        out["n"] = aligned.time.size();
        out["time"] = sol::as_table(std::move(aligned.time));
        out["value1"] = sol::as_table(std::move(aligned.value1));
        out["value2"] = sol::as_table(std::move(aligned.value2));
        return out;
    };
}

void LuaSandbox::load(const std::string& source) {
    sol::load_result chunk = L_.load(source, "=plugin", sol::load_mode::text);
    if (!chunk.valid()) {
        sol::error err = chunk;
        throw std::runtime_error(std::string("Plugin load error: ") + err.what());
    }
    sol::protected_function main_chunk = chunk;
    env_.set_on(main_chunk);
    sol::protected_function_result r = main_chunk();
    if (!r.valid()) {
        sol::error err = r;
        throw std::runtime_error(std::string("Plugin load error: ") + err.what());
    }

    sol::object fn = env_["calculate"];
    if (fn.get_type() != sol::type::function) {
        throw std::runtime_error("Plugin must define 'calculate' function");
    }
    calculate_ = fn.as<sol::protected_function>();
}

double LuaSandbox::calculate(const TimeSeries& series1, const TimeSeries& series2) {
    if (!calculate_.valid()) throw std::runtime_error("Plugin must define 'calculate' function");

    sol::protected_function_result r = calculate_(series1, series2);
    if (!r.valid()) {
        sol::error err = r;
        throw std::runtime_error(err.what());
    }
    sol::object out = r;
    if (out.get_type() != sol::type::number) {
        throw std::runtime_error("Result must be a number, got " + sol::type_name(L_.lua_state(), out.get_type()));
    }
    const double value = out.as<double>();
    if (!std::isfinite(value)) throw std::runtime_error("Result is not a finite number");
    return value;
}
