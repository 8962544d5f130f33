#include <algorithm>
#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <future>
#include <cstdlib>
#include <csignal>
#include <atomic>
#include "plugin_engine.hpp"
#include "plugin_template.hpp"
#include "plugin_validator.hpp"
#include "thread_pool.hpp"

using json = nlohmann::json;

// Global flag for signal handling
static std::atomic<bool> g_interrupted{false};

static void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_interrupted = true;
    }
}

struct Args {
    std::string command;
    std::string config;
    int concurrency = 1;
    std::string name = "Custom Metric";
    std::string description;
    std::vector<std::string> files;
};

static void print_help(const char* argv0) {
    std::cerr << "Usage:\n"
              << "  " << argv0 << " [--config FILE] validate FILE.lua\n"
              << "  " << argv0 << " [--config FILE] [--concurrency N] run BATCH.json [BATCH.json ...]\n"
              << "  " << argv0 << " template [--name NAME] [--description TEXT]\n"
              << "  " << argv0 << " [--config FILE] status\n"
              << "\nBackend selection honours PLUGIN_EXECUTOR_LAMBDA, PLUGIN_CONTAINER_RUNTIME,\n"
              << "PLUGIN_EXECUTOR_IMAGE, PLUGIN_TIMEOUT_SECONDS and AWS_REGION.\n"
              << "Ctrl+C (SIGINT) or SIGTERM stops scheduling new batches.\n";
}

[[noreturn]] static void usage_error(const char* argv0, const std::string& msg) {
    std::cerr << "[cli] " << msg << "\n";
    print_help(argv0);
    std::exit(2);
}

static Args parse_args(int argc, char** argv) {
    Args a;
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        if (s == "--help" || s == "-h") { print_help(argv[0]); std::exit(0); }
        else if (s == "--config" && i + 1 < argc) { a.config = argv[++i]; }
        else if (s == "--concurrency" && i + 1 < argc) { a.concurrency = std::max(1, std::atoi(argv[++i])); }
        else if (s == "--name" && i + 1 < argc) { a.name = argv[++i]; }
        else if (s == "--description" && i + 1 < argc) { a.description = argv[++i]; }
        else if (!s.empty() && s[0] == '-') { usage_error(argv[0], "Unknown arg: " + s); }
        else if (a.command.empty()) { a.command = s; }
        else { a.files.push_back(s); }
    }
    if (a.command.empty()) usage_error(argv[0], "Missing command");
    return a;
}

static bool read_file(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

static std::string dump_line(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

static int cmd_validate(const Args& args, std::ostream& out) {
    if (args.files.size() != 1) {
        std::cerr << "[cli] validate takes exactly one file" << std::endl;
        return 2;
    }
    std::string code;
    if (!read_file(args.files[0], code)) {
        std::cerr << "[cli] Cannot read " << args.files[0] << std::endl;
        return 2;
    }
    ValidationResult r = validate_plugin(code);
    out << dump_line(json(r)) << std::endl;
    return r.valid ? 0 : 1;
}

static BatchResponse load_and_execute(PluginEngine& engine, const std::string& path) {
    std::string text;
    if (!read_file(path, text)) {
        return BatchResponse::failure(BatchResponse::ErrorKind::Invocation, "Cannot read batch file " + path);
    }
    // ordered so series points keep the order they appear in the file
    auto doc = nlohmann::ordered_json::parse(text, nullptr, /*allow_exceptions*/false);
    if (doc.is_discarded()) {
        return BatchResponse::failure(BatchResponse::ErrorKind::Invocation, "Batch file " + path + " is not valid JSON");
    }
    PluginBatch batch;
    try {
        batch = doc.get<PluginBatch>();
    } catch (const std::exception& e) {
        return BatchResponse::failure(BatchResponse::ErrorKind::Invocation,
                                      "Batch file " + path + " is malformed: " + e.what());
    }
    return engine.execute(batch.code, batch.pairs);
}

static int cmd_run(const Args& args, const EngineConfig& cfg, std::ostream& out) {
    if (args.files.empty()) {
        std::cerr << "[cli] run needs at least one batch file" << std::endl;
        return 2;
    }

    PluginEngine engine(cfg);
    bool all_ok = true;
    {
        ThreadPool pool(static_cast<size_t>(args.concurrency));
        std::vector<std::future<BatchResponse>> pending;
        for (const auto& path : args.files) {
            if (g_interrupted) {
                std::cerr << "[cli] Interrupted, not scheduling " << path << " and later batches" << std::endl;
                all_ok = false;
                break;
            }
            pending.push_back(pool.enqueue([&engine, path] { return load_and_execute(engine, path); }));
        }
        for (auto& f : pending) {
            BatchResponse r = f.get();
            if (!r.ok) all_ok = false;
            out << dump_line(json(r)) << std::endl;
        }
    }
    return all_ok ? 0 : 1;
}

static int cmd_status(const EngineConfig& cfg, std::ostream& out) {
    PluginEngine engine(cfg);
    json status = {
        {"mode", to_string(engine.mode())},
        {"container_runtime", cfg.container_runtime},
        {"image", cfg.image},
        {"remote_function", cfg.remote_function},
        {"remote_region", cfg.remote_region},
        {"timeout_seconds", cfg.timeout_seconds},
    };
    out << dump_line(status) << std::endl;
    return engine.mode() == PluginEngine::Mode::Disabled ? 1 : 0;
}

int main(int argc, char** argv) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto args = parse_args(argc, argv);

    // stdout carries result documents only; component logs go to stderr
    std::ostream out(std::cout.rdbuf());
    std::cout.rdbuf(std::cerr.rdbuf());

    if (args.command == "template") {
        out << plugin_template(args.name, args.description) << std::flush;
        return 0;
    }
    if (args.command == "validate") {
        return cmd_validate(args, out);
    }

    EngineConfig cfg;
    try {
        cfg = EngineConfig::load(args.config);
    } catch (const std::exception& e) {
        std::cerr << "[cli] Configuration error: " << e.what() << std::endl;
        return 2;
    }
    if (args.command == "run") return cmd_run(args, cfg, out);
    if (args.command == "status") return cmd_status(cfg, out);

    usage_error(argv[0], "Unknown command: " + args.command);
}
