#include "lambda_runtime.hpp"
#include <cstdlib>
#include <iostream>

// Custom Lambda runtime: pulls events from the Runtime API and answers each
// with the harness response for that batch.
int main() {
    const char* api = std::getenv("AWS_LAMBDA_RUNTIME_API");
    if (!api || !*api) {
        std::cerr << "[runtime] AWS_LAMBDA_RUNTIME_API is not set" << std::endl;
        return 1;
    }

    HttpEndpoint endpoint;
    try {
        endpoint = HttpEndpoint::parse(std::string("http://") + api);
    } catch (const std::exception& e) {
        std::cerr << "[runtime] Bad runtime API address '" << api << "': " << e.what() << std::endl;
        return 1;
    }
    return serve_runtime_api(endpoint, harness_handler, [] { return true; });
}
