#include <gtest/gtest.h>
#include "engine_config.hpp"
#include "test_support.hpp"

#include <algorithm>

static bool has_flag(const std::vector<std::string>& flags, const std::string& f) {
    return std::find(flags.begin(), flags.end(), f) != flags.end();
}

TEST(IsolationPolicy, DefaultFlags) {
    auto flags = IsolationPolicy{}.run_flags();
    for (const char* f : {"--network=none", "--read-only", "--memory=256m", "--cpus=0.5", "--pids-limit=50",
                          "--cap-drop=ALL", "--user=65534:65534", "--security-opt=no-new-privileges",
                          "--label=plugin-engine.managed=true"}) {
        EXPECT_TRUE(has_flag(flags, f)) << f;
    }
}

TEST(EngineConfig_Defaults, Values) {
    EngineConfig cfg;
    EXPECT_EQ(cfg.container_runtime, "docker");
    EXPECT_EQ(cfg.image, "sandboxed-plugin-executor:latest");
    EXPECT_EQ(cfg.timeout_seconds, 120);
    EXPECT_EQ(cfg.probe_timeout_seconds, 5);
    EXPECT_EQ(cfg.stderr_excerpt_chars, 200u);
    EXPECT_EQ(cfg.remote_region, "us-east-1");
    EXPECT_TRUE(cfg.remote_function.empty());
}

TEST(EngineConfig_Json, MergesPresentKeys) {
    EngineConfig cfg;
    cfg.merge_json(nlohmann::json::parse(R"({
        "container_runtime": "podman",
        "timeout_seconds": 30,
        "harness_command": ["/opt/harness", "--quiet"],
        "isolation": {"memory": "128m", "pids_limit": 20}
    })"));
    EXPECT_EQ(cfg.container_runtime, "podman");
    EXPECT_EQ(cfg.timeout_seconds, 30);
    EXPECT_EQ(cfg.harness_command, (std::vector<std::string>{"/opt/harness", "--quiet"}));
    EXPECT_EQ(cfg.isolation.memory, "128m");
    EXPECT_EQ(cfg.isolation.pids_limit, 20);
    EXPECT_EQ(cfg.isolation.network, "none");
    EXPECT_EQ(cfg.image, "sandboxed-plugin-executor:latest");
}

TEST(EngineConfig_Json, RejectsBadValues) {
    EngineConfig cfg;
    EXPECT_THROW(cfg.merge_json(nlohmann::json::array()), std::runtime_error);
    EXPECT_THROW(cfg.merge_json(nlohmann::json{{"timeout_seconds", 0}}), std::runtime_error);
    EXPECT_THROW(cfg.merge_json(nlohmann::json{{"isolation", 5}}), std::runtime_error);
}

TEST(EngineConfig_Json, RejectsWeakenedIsolation) {
    for (const char* iso : {
             R"({"network": "host"})",
             R"({"network": "bridge"})",
             R"({"read_only_root": false})",
             R"({"no_new_privileges": false})",
             R"({"cap_drop": []})",
             R"({"cap_drop": ["NET_RAW"]})",
             R"({"user": "0:0"})",
             R"({"user": "root"})",
             R"({"user": "00"})",
             R"({"user": ""})",
             R"({"pids_limit": 0})",
         }) {
        EngineConfig cfg;
        EXPECT_THROW(cfg.merge_json(nlohmann::json{{"isolation", nlohmann::json::parse(iso)}}), std::runtime_error)
            << iso;
    }
}

TEST(EngineConfig_Json, CeilingsAndIdentityStayTunable) {
    EngineConfig cfg;
    cfg.merge_json(nlohmann::json::parse(R"({
        "isolation": {"cpus": "1", "user": "1000:1000", "cap_drop": ["ALL", "NET_RAW"], "label": "team.sandbox=1"}
    })"));
    auto flags = cfg.isolation.run_flags();
    for (const char* f : {"--network=none", "--read-only", "--cpus=1", "--user=1000:1000", "--cap-drop=ALL",
                          "--security-opt=no-new-privileges", "--label=team.sandbox=1"}) {
        EXPECT_TRUE(has_flag(flags, f)) << f;
    }
}

TEST(EngineConfig_Load, WeakenedIsolationFileFails) {
    TempDir dir;
    const auto path = dir.file("engine.json");
    write_text(path, R"({"isolation": {"read_only_root": false}})");
    EXPECT_THROW(EngineConfig::load(path), std::runtime_error);
}

TEST(EngineConfig_Env, Overrides) {
    ScopedEnv lambda("PLUGIN_EXECUTOR_LAMBDA", "metric-runner");
    ScopedEnv endpoint("PLUGIN_EXECUTOR_ENDPOINT", "http://127.0.0.1:9001");
    ScopedEnv region("AWS_REGION", nullptr);
    ScopedEnv default_region("AWS_DEFAULT_REGION", "eu-west-1");
    ScopedEnv runtime("PLUGIN_CONTAINER_RUNTIME", "podman");
    ScopedEnv image("PLUGIN_EXECUTOR_IMAGE", "registry.local/harness:2");
    ScopedEnv timeout("PLUGIN_TIMEOUT_SECONDS", "45");

    EngineConfig cfg;
    cfg.merge_env();
    EXPECT_EQ(cfg.remote_function, "metric-runner");
    EXPECT_EQ(cfg.remote_endpoint, "http://127.0.0.1:9001");
    EXPECT_EQ(cfg.remote_region, "eu-west-1");
    EXPECT_EQ(cfg.container_runtime, "podman");
    EXPECT_EQ(cfg.image, "registry.local/harness:2");
    EXPECT_EQ(cfg.timeout_seconds, 45);
}

TEST(EngineConfig_Env, InvalidTimeoutIgnored) {
    ScopedEnv timeout("PLUGIN_TIMEOUT_SECONDS", "soon");
    EngineConfig cfg;
    cfg.merge_env();
    EXPECT_EQ(cfg.timeout_seconds, 120);
}

TEST(EngineConfig_Load, FileThenEnvironment) {
    TempDir dir;
    const auto path = dir.file("engine.json");
    write_text(path, R"({"image": "from-file:1", "timeout_seconds": 10})");
    ScopedEnv image("PLUGIN_EXECUTOR_IMAGE", "from-env:2");
    ScopedEnv timeout("PLUGIN_TIMEOUT_SECONDS", nullptr);

    auto cfg = EngineConfig::load(path);
    EXPECT_EQ(cfg.image, "from-env:2");
    EXPECT_EQ(cfg.timeout_seconds, 10);
}

TEST(EngineConfig_Load, MalformedFile) {
    TempDir dir;
    const auto path = dir.file("broken.json");
    write_text(path, "{ not json");
    EXPECT_THROW(EngineConfig::load(path), std::runtime_error);
    EXPECT_THROW(EngineConfig::load(dir.file("missing.json")), std::runtime_error);

    write_text(path, R"({"timeout_seconds": "fast"})");
    EXPECT_THROW(EngineConfig::load(path), std::runtime_error);
}
