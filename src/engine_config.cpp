#include "engine_config.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

std::vector<std::string> IsolationPolicy::run_flags() const {
    std::vector<std::string> f;
    f.push_back("--network=" + network);
    if (read_only_root) f.push_back("--read-only");
    f.push_back("--memory=" + memory);
    f.push_back("--cpus=" + cpus);
    f.push_back("--pids-limit=" + std::to_string(pids_limit));
    for (const auto& cap : cap_drop) f.push_back("--cap-drop=" + cap);
    f.push_back("--user=" + user);
    if (no_new_privileges) f.push_back("--security-opt=no-new-privileges");
    f.push_back("--label=" + label);
    return f;
}

static bool is_root_user(const std::string& user) {
    const std::string name = user.substr(0, user.find(':'));
    return name.empty() || name == "root" || name.find_first_not_of('0') == std::string::npos;
}

void IsolationPolicy::check() const {
    if (network != "none") throw std::runtime_error("isolation.network must be \"none\", got \"" + network + "\"");
    if (!read_only_root) throw std::runtime_error("isolation.read_only_root cannot be disabled");
    if (!no_new_privileges) throw std::runtime_error("isolation.no_new_privileges cannot be disabled");
    if (std::find(cap_drop.begin(), cap_drop.end(), "ALL") == cap_drop.end()) {
        throw std::runtime_error("isolation.cap_drop must include ALL");
    }
    if (is_root_user(user)) throw std::runtime_error("isolation.user must not be root, got \"" + user + "\"");
    if (pids_limit <= 0) throw std::runtime_error("isolation.pids_limit must be positive");
    if (memory.empty() || cpus.empty()) throw std::runtime_error("isolation.memory and isolation.cpus must be set");
    if (label.empty()) throw std::runtime_error("isolation.label must not be empty");
}

static std::string env_or_empty(const char* name) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string();
}

void EngineConfig::merge_json(const json& j) {
    if (!j.is_object()) throw std::runtime_error("config root must be a JSON object");

    remote_function = j.value("remote_function", remote_function);
    remote_region = j.value("remote_region", remote_region);
    remote_endpoint = j.value("remote_endpoint", remote_endpoint);
    remote_timeout_seconds = j.value("remote_timeout_seconds", remote_timeout_seconds);
    remote_insecure_tls = j.value("remote_insecure_tls", remote_insecure_tls);

    container_runtime = j.value("container_runtime", container_runtime);
    image = j.value("image", image);
    harness_command = j.value("harness_command", harness_command);
    timeout_seconds = j.value("timeout_seconds", timeout_seconds);
    probe_timeout_seconds = j.value("probe_timeout_seconds", probe_timeout_seconds);
    stderr_excerpt_chars = j.value("stderr_excerpt_chars", stderr_excerpt_chars);

    if (j.contains("isolation")) {
        const auto& iso = j["isolation"];
        if (!iso.is_object()) throw std::runtime_error("config 'isolation' must be an object");
        isolation.network = iso.value("network", isolation.network);
        isolation.read_only_root = iso.value("read_only_root", isolation.read_only_root);
        isolation.memory = iso.value("memory", isolation.memory);
        isolation.cpus = iso.value("cpus", isolation.cpus);
        isolation.pids_limit = iso.value("pids_limit", isolation.pids_limit);
        isolation.cap_drop = iso.value("cap_drop", isolation.cap_drop);
        isolation.user = iso.value("user", isolation.user);
        isolation.no_new_privileges = iso.value("no_new_privileges", isolation.no_new_privileges);
        isolation.label = iso.value("label", isolation.label);
        isolation.check();
    }

    if (timeout_seconds <= 0) throw std::runtime_error("timeout_seconds must be positive");
    if (probe_timeout_seconds <= 0) throw std::runtime_error("probe_timeout_seconds must be positive");
    if (harness_command.empty()) throw std::runtime_error("harness_command must not be empty");
}

void EngineConfig::merge_env() {
    auto lambda = env_or_empty("PLUGIN_EXECUTOR_LAMBDA");
    if (!lambda.empty()) remote_function = lambda;

    auto endpoint = env_or_empty("PLUGIN_EXECUTOR_ENDPOINT");
    if (!endpoint.empty()) remote_endpoint = endpoint;

    auto region = env_or_empty("AWS_REGION");
    if (region.empty()) region = env_or_empty("AWS_DEFAULT_REGION");
    if (!region.empty()) remote_region = region;

    auto runtime = env_or_empty("PLUGIN_CONTAINER_RUNTIME");
    if (!runtime.empty()) container_runtime = runtime;

    auto img = env_or_empty("PLUGIN_EXECUTOR_IMAGE");
    if (!img.empty()) image = img;

    auto timeout = env_or_empty("PLUGIN_TIMEOUT_SECONDS");
    if (!timeout.empty()) {
        int t = std::atoi(timeout.c_str());
        if (t > 0) timeout_seconds = t;
        else std::cerr << "[config] Ignoring invalid PLUGIN_TIMEOUT_SECONDS=" << timeout << std::endl;
    }
}

EngineConfig EngineConfig::load(const std::string& config_path) {
    EngineConfig cfg;
    if (!config_path.empty()) {
        std::ifstream in(config_path);
        if (!in) throw std::runtime_error("cannot open config file " + config_path);
        json j = json::parse(in, nullptr, /*allow_exceptions*/false);
        if (j.is_discarded()) throw std::runtime_error("config file " + config_path + " is not valid JSON");
        try {
            cfg.merge_json(j);
        } catch (const json::exception& e) {
            throw std::runtime_error("config file " + config_path + ": " + e.what());
        }
        std::cout << "[config] Loaded " << config_path << std::endl;
    }
    cfg.merge_env();
    return cfg;
}
