#pragma once
#include <chrono>
#include <string>
#include <vector>

struct ProcessResult {
    bool started{false};     // a child was forked
    bool timed_out{false};
    int exit_code{-1};       // valid when the child exited normally
    int term_signal{0};      // non-zero when the child was killed by a signal
    std::string out;
    std::string err;
    double ms{0.0};
    std::string error;       // plumbing failure, before or after the fork

    bool exited_ok() const {
        return started && error.empty() && !timed_out && term_signal == 0 && exit_code == 0;
    }
};

// Runs argv[0] (PATH lookup) with stdin_data on its standard input, collecting
// stdout and stderr until the child exits or the deadline passes. The child
// leads its own process group; on timeout, or when poll/waitpid fails after
// the fork, the whole group gets SIGKILL.
// Exec failure inside the child surfaces as exit code 127.
ProcessResult run_process(const std::vector<std::string>& argv,
                          const std::string& stdin_data,
                          std::chrono::milliseconds timeout);
