#include "container_runtime.hpp"
#include "../process_runner.hpp"
#include <iostream>
#include <sstream>

ContainerRuntime::ContainerRuntime(std::string binary, IsolationPolicy policy)
    : binary_(std::move(binary)), policy_(std::move(policy)) {}

bool ContainerRuntime::probe(std::chrono::milliseconds timeout) const {
    auto r = run_process({binary_, "version"}, "", timeout);
    if (!r.started) {
        std::cerr << "[container] Probe of " << binary_ << " could not start: " << r.error << std::endl;
        return false;
    }
    if (r.timed_out) {
        std::cerr << "[container] Probe of " << binary_ << " timed out" << std::endl;
        return false;
    }
    if (!r.exited_ok()) {
        std::cerr << "[container] Probe of " << binary_ << " failed with code " << r.exit_code << std::endl;
        return false;
    }
    return true;
}

std::vector<std::string> ContainerRuntime::list_managed(std::chrono::milliseconds timeout) const {
    std::vector<std::string> ids;
    auto r = run_process({binary_, "ps", "-aq", "--filter", "label=" + policy_.label}, "", timeout);
    if (!r.exited_ok()) {
        std::cerr << "[container] Listing managed containers failed"
                  << (r.timed_out ? " (timeout)" : "") << ": " << r.err << r.error << std::endl;
        return ids;
    }
    std::istringstream in(r.out);
    std::string line;
    while (std::getline(in, line)) {
        auto b = line.find_first_not_of(" \t\r");
        if (b == std::string::npos) continue;
        auto e = line.find_last_not_of(" \t\r");
        ids.push_back(line.substr(b, e - b + 1));
    }
    return ids;
}

bool ContainerRuntime::remove(const std::vector<std::string>& ids, std::chrono::milliseconds timeout) const {
    if (ids.empty()) return true;
    std::vector<std::string> argv = {binary_, "rm", "-f"};
    argv.insert(argv.end(), ids.begin(), ids.end());
    auto r = run_process(argv, "", timeout);
    if (!r.exited_ok()) {
        std::cerr << "[container] Removing " << ids.size() << " container(s) failed"
                  << (r.timed_out ? " (timeout)" : "") << ": " << r.err << r.error << std::endl;
        return false;
    }
    return true;
}

size_t ContainerRuntime::sweep_managed(std::chrono::milliseconds timeout) const {
    auto ids = list_managed(timeout);
    if (ids.empty()) return 0;
    return remove(ids, timeout) ? ids.size() : 0;
}

std::vector<std::string> ContainerRuntime::run_command(const std::string& container_name,
                                                       const std::string& image,
                                                       const std::vector<std::string>& command) const {
    std::vector<std::string> argv = {binary_, "run", "--rm", "-i", "--name", container_name};
    auto flags = policy_.run_flags();
    argv.insert(argv.end(), flags.begin(), flags.end());
    argv.push_back(image);
    argv.insert(argv.end(), command.begin(), command.end());
    return argv;
}
