#pragma once
#include <boost/asio/ssl.hpp>
#include <boost/beast/http/verb.hpp>
#include <chrono>
#include <map>
#include <string>
#include <utility>
#include <vector>

struct HttpEndpoint {
    std::string scheme = "https";
    std::string host;
    std::string port = "443";
    std::string base_path;  // no trailing slash

    bool tls() const { return scheme == "https"; }
    // host, plus ":port" when the port is not the scheme default
    std::string host_header() const;

    // Accepts "https://host[:port][/path]", "http://..." or bare "host[:port]".
    static HttpEndpoint parse(const std::string& url);
};

struct HttpResponse {
    unsigned status{0};
    std::map<std::string, std::string> headers;  // lower-cased names
    std::string body;

    std::string header(const std::string& lower_name) const;
};

// Blocking HTTP/1.1 client. One connection per request; a single deadline,
// timeout from the call, covers resolve, connect, handshake, write and read.
// Throws boost::system::system_error or std::runtime_error on transport failure.
class HttpClient {
public:
    explicit HttpClient(bool insecure_tls = false);

    HttpResponse request(const HttpEndpoint& endpoint,
                         boost::beast::http::verb method,
                         const std::string& target,
                         const std::vector<std::pair<std::string, std::string>>& headers,
                         const std::string& body,
                         std::chrono::milliseconds timeout);

private:
    boost::asio::ssl::context ssl_ctx_{boost::asio::ssl::context::tls_client};
    bool insecure_;
};
