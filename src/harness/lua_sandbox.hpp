#pragma once
#include "time_series.hpp"
#include <sol/sol.hpp>
#include <string>

// Evaluates one plugin inside a stripped-down Lua environment.
//
// The environment holds the safe base functions, math, string and table,
// a `stats` table backed by Boost.Math, get_aligned_data and a print that
// writes to stderr. Everything else (io, os, package, debug, load*, raw*,
// metatable access) is absent. The real confinement is the container or
// remote function the harness runs in.
class LuaSandbox {
public:
    LuaSandbox();

    // Runs the chunk once in the sandbox environment.
    // Throws std::runtime_error if it fails to load or does not define calculate.
    void load(const std::string& source);

    // Throws std::runtime_error carrying the Lua error, or when the result is
    // not a finite number.
    double calculate(const TimeSeries& series1, const TimeSeries& series2);

private:
    void install_stats();
    void install_helpers();

    sol::state L_;
    sol::environment env_;
    sol::protected_function calculate_;
};
