#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Flags applied to every container spawn. Enumerated once so that no code
// path can start a boundary with a weaker set.
struct IsolationPolicy {
    std::string network = "none";
    bool read_only_root = true;
    std::string memory = "256m";
    std::string cpus = "0.5";
    int pids_limit = 50;
    std::vector<std::string> cap_drop = {"ALL"};
    std::string user = "65534:65534";
    bool no_new_privileges = true;
    std::string label = "plugin-engine.managed=true";

    std::vector<std::string> run_flags() const;

    // Throws std::runtime_error when a field would weaken the boundary: any
    // network but "none", a writable root, privilege escalation, a capability
    // set without ALL, or a root or unset user. Ceilings and label stay tunable.
    void check() const;
};

struct EngineConfig {
    using json = nlohmann::json;

    // remote mode
    std::string remote_function;           // PLUGIN_EXECUTOR_LAMBDA
    std::string remote_region = "us-east-1";
    std::string remote_endpoint;           // empty -> https://lambda.<region>.amazonaws.com
    int remote_timeout_seconds = 130;
    bool remote_insecure_tls = false;

    // container mode
    std::string container_runtime = "docker";
    std::string image = "sandboxed-plugin-executor:latest";
    std::vector<std::string> harness_command = {"/usr/local/bin/plugin_harness"};
    int timeout_seconds = 120;
    int probe_timeout_seconds = 5;
    std::size_t stderr_excerpt_chars = 200;
    IsolationPolicy isolation;

    // Applies keys present in j; unknown keys are ignored.
    void merge_json(const json& j);
    void merge_env();

    static EngineConfig load(const std::string& config_path = "");
};
