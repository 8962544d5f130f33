#include "run_harness.hpp"
#include <iostream>
#include <iterator>

// Container entry point: one batch on stdin, one response on stdout.
int main() {
    std::string payload((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());

    HarnessOutcome outcome = run_harness(payload);
    std::cout << outcome.response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    if (outcome.exit_code != 0) {
        // the engine reports a stderr excerpt on non-zero exit
        std::cerr << outcome.response.value("error", std::string("unknown error")) << std::endl;
    }
    return outcome.exit_code;
}
