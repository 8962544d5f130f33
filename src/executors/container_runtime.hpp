#pragma once
#include "../engine_config.hpp"
#include <chrono>
#include <string>
#include <vector>

// Thin wrapper over a docker-compatible CLI. Every container this engine
// starts carries the policy label; list/remove only ever see labelled ones.
class ContainerRuntime {
public:
    ContainerRuntime(std::string binary, IsolationPolicy policy);

    // `<runtime> version`; false on non-zero exit, missing binary or timeout.
    bool probe(std::chrono::milliseconds timeout) const;

    std::vector<std::string> list_managed(std::chrono::milliseconds timeout) const;
    bool remove(const std::vector<std::string>& ids, std::chrono::milliseconds timeout) const;

    // list_managed + remove; returns how many containers were removed.
    size_t sweep_managed(std::chrono::milliseconds timeout) const;

    std::vector<std::string> run_command(const std::string& container_name,
                                         const std::string& image,
                                         const std::vector<std::string>& command) const;

    const std::string& binary() const { return binary_; }
    const IsolationPolicy& policy() const { return policy_; }

private:
    std::string binary_;
    IsolationPolicy policy_;
};
