#pragma once
#include "iexecutor.hpp"
#include "../aws_sigv4.hpp"
#include "../engine_config.hpp"
#include "../http_client.hpp"

// Synchronous AWS Lambda Invoke (RequestResponse) carrying the same batch
// document the container harness reads from stdin.
class RemoteFunctionExecutor : public IPluginExecutor {
public:
    explicit RemoteFunctionExecutor(const EngineConfig& cfg,
                                    AwsCredentials creds = AwsCredentials::from_env());

    const char* name() const override { return "remote"; }
    BatchResponse execute(const PluginBatch& batch) override;

    const HttpEndpoint& endpoint() const { return endpoint_; }
    std::string invocation_path() const;

private:
    BatchResponse invoke(const PluginBatch& batch);

    std::string function_name_;
    std::string region_;
    HttpEndpoint endpoint_;
    std::chrono::seconds timeout_;
    AwsCredentials creds_;
    HttpClient http_;
};
