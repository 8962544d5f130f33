#include "plugin_template.hpp"

std::string plugin_template(const std::string& name, const std::string& description) {
    const std::string desc = description.empty() ? "A custom metric plugin" : description;
    return "-- Plugin: " + name + "\n"
           "-- Description: " + desc + "\n"
           "-- Author: Your Name\n"
           "--\n"
           "-- calculate(series1, series2) receives two time series and returns a number.\n"
           "--   series[\"2024-01-01T00:00:00Z\"]  value at a timestamp (nil when absent)\n"
           "--   series[i], #series              positional access and length\n"
           "--   series:values(), series:timestamps()\n"
           "-- Available: math, string, table, stats, get_aligned_data(series1, series2 [, tolerance])\n"
           "--\n"
           "-- Example:\n"
           "--   local aligned = get_aligned_data(series1, series2)\n"
           "--   local total = 0\n"
           "--   for i = 1, aligned.n do total = total + math.abs(aligned.value1[i] - aligned.value2[i]) end\n"
           "--   return total / aligned.n\n"
           "\n"
           "function calculate(series1, series2)\n"
           "    error(\"Implement the calculate function\")\n"
           "end\n";
}
