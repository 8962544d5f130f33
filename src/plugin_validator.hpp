#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

/*
 * Static pre-screen for plugin source.
 *
 * This is defense in depth and NOT a sandbox: a case-insensitive substring
 * denylist is bypassed by anything that assembles names at runtime. Plugins
 * are only ever evaluated inside the isolation boundary (container or remote
 * function); the flags applied there are what actually confine them.
 */

struct ValidationResult {
    enum class Failure { None, ForbiddenPattern, MissingEntryPoint, SyntaxError };

    bool valid{false};
    Failure failure{Failure::None};
    std::string error;

    static ValidationResult ok();
    static ValidationResult reject(Failure failure, std::string error);
};

void to_json(nlohmann::json& j, const ValidationResult& r);

// Line endings to LF, trailing whitespace stripped, common indentation and
// surrounding blank lines removed.
std::string normalize_source(const std::string& code);

const std::vector<std::string>& forbidden_patterns();

ValidationResult validate_plugin(const std::string& code);
