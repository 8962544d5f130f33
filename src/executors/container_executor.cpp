#include "container_executor.hpp"
#include <iostream>
#include <random>
#include <sstream>
#include <iomanip>

using json = nlohmann::json;

static std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

ContainerExecutor::ContainerExecutor(const EngineConfig& cfg, const ContainerRuntime& runtime)
    : runtime_(runtime),
      image_(cfg.image),
      harness_command_(cfg.harness_command),
      timeout_seconds_(cfg.timeout_seconds),
      stderr_excerpt_chars_(cfg.stderr_excerpt_chars) {}

std::string ContainerExecutor::make_container_name() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream ss;
    ss << "plugin-exec-" << std::hex << std::setw(16) << std::setfill('0') << rng();
    return ss.str();
}

BatchResponse ContainerExecutor::execute(const PluginBatch& batch) {
    if (batch.pairs.empty()) {
        return BatchResponse::success({});
    }
    try {
        return run_batch(batch);
    } catch (const std::exception& e) {
        std::cerr << "[container] Unexpected error: " << e.what() << std::endl;
        return BatchResponse::failure(BatchResponse::ErrorKind::Execution, "Internal execution error");
    }
}

BatchResponse ContainerExecutor::run_batch(const PluginBatch& batch) {
    const std::string input = nlohmann::ordered_json(batch).dump();
    const std::string container = make_container_name();
    const auto argv = runtime_.run_command(container, image_, harness_command_);

    std::cout << "[container] Starting " << container << " for " << batch.pairs.size()
              << " pair(s), " << input.size() << " bytes" << std::endl;

    return finish(container, batch, run_process(argv, input, std::chrono::seconds(timeout_seconds_)));
}

BatchResponse ContainerExecutor::finish(const std::string& container, const PluginBatch& batch,
                                        const ProcessResult& r) const {
    if (!r.started) {
        std::cerr << "[container] Could not start " << runtime_.binary() << ": " << r.error << std::endl;
        return BatchResponse::failure(BatchResponse::ErrorKind::Execution, "Internal execution error");
    }

    if (!r.error.empty()) {
        std::cerr << "[container] Lost track of " << container << " (" << r.error << "), removing" << std::endl;
        runtime_.remove({container}, std::chrono::seconds(10));
        return BatchResponse::failure(BatchResponse::ErrorKind::Execution, "Internal execution error");
    }

    if (r.timed_out) {
        std::cerr << "[container] " << container << " timed out after " << timeout_seconds_ << "s, removing" << std::endl;
        // Killing the CLI client does not stop the container itself.
        runtime_.remove({container}, std::chrono::seconds(10));
        return BatchResponse::failure(BatchResponse::ErrorKind::Timeout,
                                      "Plugin execution timed out after " + std::to_string(timeout_seconds_) + " seconds");
    }

    const std::string err = trim(r.err);
    if (!r.exited_ok()) {
        std::cerr << "[container] " << container << " failed (exit " << r.exit_code
                  << ", signal " << r.term_signal << "): " << err << std::endl;
        std::string excerpt = err.substr(0, stderr_excerpt_chars_);
        if (excerpt.empty()) {
            excerpt = r.term_signal ? "killed by signal " + std::to_string(r.term_signal)
                                    : "exit code " + std::to_string(r.exit_code);
        }
        return BatchResponse::failure(BatchResponse::ErrorKind::Execution, "Execution failed: " + excerpt);
    }
    if (!err.empty()) {
        std::cerr << "[container] Warning: " << container << " stderr: " << err << std::endl;
    }

    const std::string out = trim(r.out);
    json doc = json::parse(out, nullptr, /*allow_exceptions*/false);
    BatchResponse response;
    if (out.empty() || doc.is_discarded() || !parse_batch_response(doc, response) ||
        !matches_pairs(response, batch.pairs)) {
        std::cerr << "[container] Invalid output from " << container << " ("
                  << out.size() << " bytes): " << out.substr(0, 200) << std::endl;
        return BatchResponse::failure(BatchResponse::ErrorKind::Execution, "Invalid output format from plugin executor");
    }

    std::cout << "[container] " << container << " finished in " << r.ms << " ms" << std::endl;
    return response;
}
