#include "remote_executor.hpp"
#include <iostream>

using json = nlohmann::json;
namespace http = boost::beast::http;

static HttpEndpoint default_endpoint(const EngineConfig& cfg) {
    if (!cfg.remote_endpoint.empty()) return HttpEndpoint::parse(cfg.remote_endpoint);
    return HttpEndpoint::parse("https://lambda." + cfg.remote_region + ".amazonaws.com");
}

RemoteFunctionExecutor::RemoteFunctionExecutor(const EngineConfig& cfg, AwsCredentials creds)
    : function_name_(cfg.remote_function),
      region_(cfg.remote_region),
      endpoint_(default_endpoint(cfg)),
      timeout_(cfg.remote_timeout_seconds),
      creds_(std::move(creds)),
      http_(cfg.remote_insecure_tls) {
    std::cout << "[remote] Function " << function_name_ << " via " << endpoint_.scheme << "://"
              << endpoint_.host_header() << endpoint_.base_path << std::endl;
    if (creds_.empty()) {
        std::cerr << "[remote] Warning: no AWS credentials in environment, requests will be unsigned" << std::endl;
    }
}

std::string RemoteFunctionExecutor::invocation_path() const {
    return endpoint_.base_path + "/2015-03-31/functions/" + uri_encode(function_name_, true) + "/invocations";
}

BatchResponse RemoteFunctionExecutor::execute(const PluginBatch& batch) {
    if (batch.pairs.empty()) {
        return BatchResponse::success({});
    }
    try {
        return invoke(batch);
    } catch (const std::exception& e) {
        std::cerr << "[remote] Invocation of " << function_name_ << " failed: " << e.what() << std::endl;
        return BatchResponse::failure(BatchResponse::ErrorKind::Invocation,
                                      std::string("Remote function invocation error: ") + e.what());
    }
}

BatchResponse RemoteFunctionExecutor::invoke(const PluginBatch& batch) {
    const std::string payload = nlohmann::ordered_json(batch).dump();
    const std::string path = invocation_path();

    std::vector<std::pair<std::string, std::string>> headers = {
        {"Content-Type", "application/json"},
        {"X-Amz-Invocation-Type", "RequestResponse"},
    };
    if (!creds_.empty()) {
        const std::string amz_date = amz_timestamp(std::chrono::system_clock::now());
        std::vector<std::pair<std::string, std::string>> signed_headers = {
            {"host", endpoint_.host_header()},
            {"x-amz-date", amz_date},
        };
        if (!creds_.session_token.empty()) {
            signed_headers.emplace_back("x-amz-security-token", creds_.session_token);
            headers.emplace_back("X-Amz-Security-Token", creds_.session_token);
        }
        headers.emplace_back("X-Amz-Date", amz_date);
        headers.emplace_back("Authorization",
                             sigv4_authorization(creds_, region_, "lambda", amz_date, "POST", path, "",
                                                 signed_headers, payload));
    }

    std::cout << "[remote] Invoking " << function_name_ << " with " << batch.pairs.size()
              << " pair(s), " << payload.size() << " bytes" << std::endl;
    auto res = http_.request(endpoint_, http::verb::post, path, headers, payload, timeout_);

    if (res.status < 200 || res.status >= 300) {
        std::cerr << "[remote] HTTP " << res.status << ": " << res.body.substr(0, 500) << std::endl;
        return BatchResponse::failure(BatchResponse::ErrorKind::Invocation,
                                      "Remote function invocation error: HTTP " + std::to_string(res.status));
    }

    const std::string function_error = res.header("x-amz-function-error");
    if (!function_error.empty()) {
        // Platform-level failure; its payload carries the remote stack trace.
        std::cerr << "[remote] Function error (" << function_error << "): " << res.body.substr(0, 2000) << std::endl;
        return BatchResponse::failure(BatchResponse::ErrorKind::Invocation, "Remote function execution failed");
    }

    json doc = json::parse(res.body, nullptr, /*allow_exceptions*/false);
    BatchResponse response;
    if (doc.is_discarded() || !parse_batch_response(doc, response) || !matches_pairs(response, batch.pairs)) {
        std::cerr << "[remote] Malformed response: " << res.body.substr(0, 200) << std::endl;
        return BatchResponse::failure(BatchResponse::ErrorKind::Invocation,
                                      "Remote function invocation error: malformed response");
    }
    return response;
}
