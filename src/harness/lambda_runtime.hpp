#pragma once
#include "../http_client.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <string>

// Answers one event payload with a response document. Throwing reports the
// invocation to the platform as a runtime failure.
using InvocationHandler = std::function<nlohmann::json(const std::string& event)>;

// Lambda Runtime API loop against endpoint: GET .../invocation/next, hand the
// event to handler, POST the document to .../<id>/response, or an error
// document to .../<id>/error when handler throws. Checks keep_running() before
// each poll. Returns 0 once stopped, 1 when the API can no longer be reached.
int serve_runtime_api(const HttpEndpoint& endpoint,
                      const InvocationHandler& handler,
                      const std::function<bool()>& keep_running);

// The run harness as a handler: a batch-level failure is still a normal
// {"error"} response document.
nlohmann::json harness_handler(const std::string& event);
