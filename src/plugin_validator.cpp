#include "plugin_validator.hpp"
#include <sol/sol.hpp>
#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

ValidationResult ValidationResult::ok() {
    ValidationResult r;
    r.valid = true;
    return r;
}

ValidationResult ValidationResult::reject(Failure failure, std::string error) {
    ValidationResult r;
    r.failure = failure;
    r.error = std::move(error);
    return r;
}

void to_json(nlohmann::json& j, const ValidationResult& r) {
    if (r.valid) j = nlohmann::json{{"valid", true}};
    else j = nlohmann::json{{"valid", false}, {"error", r.error}};
}

const std::vector<std::string>& forbidden_patterns() {
    static const std::vector<std::string> patterns = {
        // filesystem
        "io.", "io[", "dofile", "loadfile",
        // OS / process modules
        "os.", "os[", "require", "package.",
        // shell
        "popen", "execute(",
        // dynamic evaluation
        "load(", "load (", "loadstring", "string.dump",
        // introspection escapes
        "debug.", "_G.", "_G[", "_ENV", "getmetatable", "setmetatable",
        "rawget", "rawset", "rawequal", "getfenv", "setfenv", "collectgarbage",
    };
    return patterns;
}

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string normalize_source(const std::string& code) {
    std::string unified;
    unified.reserve(code.size());
    for (size_t i = 0; i < code.size(); ++i) {
        if (code[i] == '\r') {
            unified.push_back('\n');
            if (i + 1 < code.size() && code[i + 1] == '\n') ++i;
        } else {
            unified.push_back(code[i]);
        }
    }

    std::vector<std::string> lines;
    std::istringstream in(unified);
    std::string line;
    while (std::getline(in, line)) {
        auto e = line.find_last_not_of(" \t");
        lines.push_back(e == std::string::npos ? std::string() : line.substr(0, e + 1));
    }

    while (!lines.empty() && lines.front().empty()) lines.erase(lines.begin());
    while (!lines.empty() && lines.back().empty()) lines.pop_back();

    // longest whitespace prefix shared by every non-blank line
    std::string prefix;
    bool first = true;
    for (const auto& l : lines) {
        if (l.empty()) continue;
        std::string indent = l.substr(0, l.find_first_not_of(" \t"));
        if (first) {
            prefix = indent;
            first = false;
            continue;
        }
        size_t n = 0;
        while (n < prefix.size() && n < indent.size() && prefix[n] == indent[n]) ++n;
        prefix.resize(n);
    }

    std::string out;
    for (const auto& l : lines) {
        if (!l.empty()) out += l.substr(prefix.size());
        out += '\n';
    }
    return out;
}

ValidationResult validate_plugin(const std::string& code) {
    const std::string normalized = normalize_source(code);
    const std::string lowered = to_lower(normalized);

    for (const auto& pattern : forbidden_patterns()) {
        if (lowered.find(to_lower(pattern)) != std::string::npos) {
            return ValidationResult::reject(ValidationResult::Failure::ForbiddenPattern,
                                            "Forbidden pattern detected: '" + pattern +
                                            "'. Plugins cannot access system resources.");
        }
    }

    static const std::regex entry_point(
        R"((^|[^.:\w])function\s+calculate\s*\(|(^|[^.:\w])calculate\s*=\s*function\s*\()");
    if (!std::regex_search(normalized, entry_point)) {
        return ValidationResult::reject(ValidationResult::Failure::MissingEntryPoint,
                                        "Plugin must define a 'calculate(series1, series2)' function");
    }

    // Compile only; nothing in the chunk runs in this process.
    sol::state lua;
    sol::load_result chunk = lua.load(normalized, "=plugin", sol::load_mode::text);
    if (!chunk.valid()) {
        sol::error err = chunk;
        return ValidationResult::reject(ValidationResult::Failure::SyntaxError,
                                        std::string("Syntax error in plugin code: ") + err.what());
    }
    return ValidationResult::ok();
}
