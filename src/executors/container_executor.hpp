#pragma once
#include "iexecutor.hpp"
#include "container_runtime.hpp"
#include "../engine_config.hpp"
#include "../process_runner.hpp"

// Runs a whole batch inside one locked-down container. The batch document is
// streamed over stdin; stdout must carry exactly one response document.
class ContainerExecutor : public IPluginExecutor {
public:
    ContainerExecutor(const EngineConfig& cfg, const ContainerRuntime& runtime);

    const char* name() const override { return "container"; }
    BatchResponse execute(const PluginBatch& batch) override;

    // Maps the finished `run` of container to a response, force-removing the
    // container whenever the client was killed or lost track of it.
    BatchResponse finish(const std::string& container, const PluginBatch& batch, const ProcessResult& r) const;

private:
    BatchResponse run_batch(const PluginBatch& batch);
    static std::string make_container_name();

    const ContainerRuntime& runtime_;
    std::string image_;
    std::vector<std::string> harness_command_;
    int timeout_seconds_;
    std::size_t stderr_excerpt_chars_;
};
