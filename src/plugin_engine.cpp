#include "plugin_engine.hpp"
#include "executors/container_executor.hpp"
#include "executors/remote_executor.hpp"
#include <iostream>

const char* PluginEngine::unavailable_message() {
    return "Plugin execution unavailable: no isolation backend (container runtime or remote function) is configured";
}

const char* to_string(PluginEngine::Mode mode) {
    switch (mode) {
        case PluginEngine::Mode::Remote: return "remote";
        case PluginEngine::Mode::Container: return "container";
        case PluginEngine::Mode::Disabled: return "disabled";
    }
    return "unknown";
}

PluginEngine::PluginEngine(EngineConfig cfg)
    : cfg_(std::move(cfg)),
      runtime_(cfg_.container_runtime, cfg_.isolation) {
    if (!cfg_.remote_function.empty()) {
        try {
            executor_ = std::make_unique<RemoteFunctionExecutor>(cfg_);
            mode_ = Mode::Remote;
        } catch (const std::exception& e) {
            std::cerr << "[engine] Remote function configured but unusable: " << e.what() << std::endl;
        }
    } else if (runtime_.probe(std::chrono::seconds(cfg_.probe_timeout_seconds))) {
        executor_ = std::make_unique<ContainerExecutor>(cfg_, runtime_);
        mode_ = Mode::Container;
        sweep_stale_containers();
    } else {
        std::cerr << "[engine] Container runtime '" << cfg_.container_runtime
                  << "' not available and no remote function configured" << std::endl;
    }

    if (mode_ == Mode::Disabled) {
        std::cerr << "[engine] Plugin execution disabled" << std::endl;
    } else {
        std::cout << "[engine] Isolation backend: " << to_string(mode_) << std::endl;
    }
}

PluginEngine::~PluginEngine() {
    if (mode_ == Mode::Container) {
        sweep_stale_containers();
    }
}

ValidationResult PluginEngine::validate(const std::string& code) const {
    return validate_plugin(code);
}

BatchResponse PluginEngine::execute(const std::string& code, const std::vector<PluginPair>& pairs) {
    if (mode_ == Mode::Disabled || !executor_) {
        return BatchResponse::failure(BatchResponse::ErrorKind::BackendUnavailable, unavailable_message());
    }

    ValidationResult v = validate(code);
    if (!v.valid) {
        return BatchResponse::failure(BatchResponse::ErrorKind::Validation, v.error);
    }

    PluginBatch batch{code, pairs};
    return executor_->execute(batch);
}

size_t PluginEngine::sweep_stale_containers() {
    if (mode_ != Mode::Container) return 0;
    try {
        size_t removed = runtime_.sweep_managed(std::chrono::seconds(30));
        if (removed > 0) {
            std::cout << "[engine] Removed " << removed << " stale plugin container(s)" << std::endl;
        }
        return removed;
    } catch (const std::exception& e) {
        std::cerr << "[engine] Container sweep failed: " << e.what() << std::endl;
        return 0;
    }
}
