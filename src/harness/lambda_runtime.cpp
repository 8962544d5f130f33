#include "lambda_runtime.hpp"
#include "run_harness.hpp"
#include <iostream>

using json = nlohmann::json;
namespace http = boost::beast::http;

json harness_handler(const std::string& event) {
    return run_harness(event).response;
}

int serve_runtime_api(const HttpEndpoint& endpoint,
                      const InvocationHandler& handler,
                      const std::function<bool()>& keep_running) {
    HttpClient client;
    const std::string base = "/2018-06-01/runtime/invocation/";
    const std::vector<std::pair<std::string, std::string>> json_headers = {{"Content-Type", "application/json"}};

    std::cout << "[runtime] Polling " << endpoint.host_header() << std::endl;
    while (keep_running()) {
        HttpResponse next;
        try {
            // blocks until the platform hands over an event
            next = client.request(endpoint, http::verb::get, base + "next", {}, "", std::chrono::hours(12));
        } catch (const std::exception& e) {
            std::cerr << "[runtime] Runtime API unreachable: " << e.what() << std::endl;
            return 1;
        }

        const std::string request_id = next.header("lambda-runtime-aws-request-id");
        if (next.status != 200 || request_id.empty()) {
            std::cerr << "[runtime] Unexpected next-invocation reply, HTTP " << next.status << std::endl;
            continue;
        }

        std::string reply;
        std::string route = "/response";
        std::vector<std::pair<std::string, std::string>> headers = json_headers;
        try {
            reply = handler(next.body).dump(-1, ' ', false, json::error_handler_t::replace);
        } catch (const std::exception& e) {
            std::cerr << "[runtime] Harness crashed on " << request_id << ": " << e.what() << std::endl;
            route = "/error";
            headers.emplace_back("Lambda-Runtime-Function-Error-Type", "Runtime.HarnessError");
            reply = json{{"errorMessage", e.what()}, {"errorType", "HarnessError"}}
                        .dump(-1, ' ', false, json::error_handler_t::replace);
        }

        try {
            auto res = client.request(endpoint, http::verb::post, base + request_id + route, headers, reply,
                                      std::chrono::seconds(30));
            if (res.status != 202) {
                std::cerr << "[runtime] Runtime API rejected " << route << " for " << request_id
                          << ": HTTP " << res.status << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "[runtime] Failed to post " << route << " for " << request_id << ": " << e.what() << std::endl;
            return 1;
        }
    }
    return 0;
}
