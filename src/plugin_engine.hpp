#pragma once
#include "engine_config.hpp"
#include "plugin_types.hpp"
#include "plugin_validator.hpp"
#include "executors/container_runtime.hpp"
#include "executors/iexecutor.hpp"
#include <memory>
#include <string>
#include <vector>

// Picks the isolation backend once, at construction, and routes every batch
// through it. Owned by the composition root; there is no global instance.
//
//   remote function configured -> Remote (never probes the container runtime)
//   `<runtime> version` ok     -> Container (stale labelled containers swept)
//   otherwise                  -> Disabled (every execute fails closed)
class PluginEngine {
public:
    enum class Mode { Remote, Container, Disabled };

    explicit PluginEngine(EngineConfig cfg);
    ~PluginEngine();

    PluginEngine(const PluginEngine&) = delete;
    PluginEngine& operator=(const PluginEngine&) = delete;

    Mode mode() const { return mode_; }
    const EngineConfig& config() const { return cfg_; }

    ValidationResult validate(const std::string& code) const;

    // Disabled check, then validation, then the selected executor. Never throws.
    // Safe to call from several threads; each call gets its own boundary.
    BatchResponse execute(const std::string& code, const std::vector<PluginPair>& pairs);

    // Force-removes labelled containers (container mode only). Returns the count.
    size_t sweep_stale_containers();

    static const char* unavailable_message();

private:
    EngineConfig cfg_;
    ContainerRuntime runtime_;
    std::unique_ptr<IPluginExecutor> executor_;
    Mode mode_{Mode::Disabled};
};

const char* to_string(PluginEngine::Mode mode);
