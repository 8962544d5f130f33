#pragma once
#include <string>

// Starter plugin source; passes validate_plugin unchanged.
std::string plugin_template(const std::string& name = "Custom Metric",
                            const std::string& description = "");
