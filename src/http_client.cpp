#include "http_client.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/err.h>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

static constexpr std::size_t kMaxResponseBody = 64 * 1024 * 1024;

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// --------------------- endpoint ---------------------

std::string HttpEndpoint::host_header() const {
    const bool default_port = (tls() && port == "443") || (!tls() && port == "80");
    return default_port ? host : host + ":" + port;
}

HttpEndpoint HttpEndpoint::parse(const std::string& url) {
    HttpEndpoint ep;
    std::string rest = url;
    auto scheme_end = url.find("://");
    if (scheme_end != std::string::npos) {
        ep.scheme = to_lower(url.substr(0, scheme_end));
        rest = url.substr(scheme_end + 3);
    } else {
        ep.scheme = "http";
    }
    if (ep.scheme != "http" && ep.scheme != "https") {
        throw std::runtime_error("unsupported URL scheme: " + ep.scheme);
    }
    ep.port = ep.tls() ? "443" : "80";

    std::string hostport = rest;
    auto path_pos = rest.find('/');
    if (path_pos != std::string::npos) {
        hostport = rest.substr(0, path_pos);
        ep.base_path = rest.substr(path_pos);
        while (!ep.base_path.empty() && ep.base_path.back() == '/') ep.base_path.pop_back();
    }
    auto colon = hostport.find(':');
    if (colon != std::string::npos) {
        ep.host = hostport.substr(0, colon);
        ep.port = hostport.substr(colon + 1);
    } else {
        ep.host = hostport;
    }
    if (ep.host.empty()) throw std::runtime_error("URL has no host: " + url);
    return ep;
}

std::string HttpResponse::header(const std::string& lower_name) const {
    auto it = headers.find(lower_name);
    return it == headers.end() ? std::string() : it->second;
}

// --------------------- client ---------------------

HttpClient::HttpClient(bool insecure_tls) : insecure_(insecure_tls) {
    ssl_ctx_.set_options(ssl::context::default_workarounds |
                         ssl::context::no_sslv2 |
                         ssl::context::no_sslv3);
    if (insecure_) {
        ssl_ctx_.set_verify_mode(ssl::verify_none);
    } else {
        ssl_ctx_.set_default_verify_paths();
        ssl_ctx_.set_verify_mode(ssl::verify_peer);
    }
}

namespace {

// Runs one async operation to completion on ioc. tcp_stream deadlines only
// apply to async operations, so every phase goes through here.
template <class Start>
void run_step(net::io_context& ioc, Start start, const char* what) {
    beast::error_code ec;
    start([&ec](beast::error_code e, auto&&...) { ec = e; });
    ioc.restart();
    ioc.run();
    if (ec) throw beast::system_error(ec, what);
}

template <class Stream>
HttpResponse exchange(net::io_context& ioc, Stream& stream, http::request<http::string_body>& req) {
    run_step(ioc, [&](auto handler) { http::async_write(stream, req, handler); }, "write");

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(kMaxResponseBody);
    run_step(ioc, [&](auto handler) { http::async_read(stream, buffer, parser, handler); }, "read");

    auto res = parser.release();
    HttpResponse out;
    out.status = res.result_int();
    for (const auto& field : res) {
        out.headers[to_lower(std::string(field.name_string()))] = std::string(field.value());
    }
    out.body = std::move(res.body());
    return out;
}

} // namespace

HttpResponse HttpClient::request(const HttpEndpoint& endpoint,
                                 http::verb method,
                                 const std::string& target,
                                 const std::vector<std::pair<std::string, std::string>>& headers,
                                 const std::string& body,
                                 std::chrono::milliseconds timeout) {
    net::io_context ioc;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    // The resolver has no deadline of its own; a timer cancels it.
    tcp::resolver resolver(ioc);
    tcp::resolver::results_type results;
    {
        bool expired = false;
        net::steady_timer timer(ioc, deadline);
        timer.async_wait([&](beast::error_code ec) {
            if (ec) return;
            expired = true;
            resolver.cancel();
        });
        run_step(ioc, [&](auto handler) {
            resolver.async_resolve(endpoint.host, endpoint.port,
                [&, handler](beast::error_code ec, tcp::resolver::results_type r) mutable {
                    timer.cancel();
                    if (expired) ec = beast::error::timeout;
                    results = std::move(r);
                    handler(ec);
                });
        }, "resolve");
    }

    http::request<http::string_body> req{method, target, 11};
    req.set(http::field::host, endpoint.host_header());
    req.set(http::field::user_agent, "plugin-engine/1.0");
    for (const auto& [name, value] : headers) req.set(name, value);
    req.body() = body;
    req.prepare_payload();

    if (endpoint.tls()) {
        ssl::stream<beast::tcp_stream> stream(ioc, ssl_ctx_);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint.host.c_str())) {
            beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
            throw beast::system_error{ec};
        }
        if (!insecure_) stream.set_verify_callback(ssl::host_name_verification(endpoint.host));

        auto& lowest = beast::get_lowest_layer(stream);
        lowest.expires_at(deadline);
        run_step(ioc, [&](auto handler) { lowest.async_connect(results, handler); }, "connect");
        run_step(ioc, [&](auto handler) { stream.async_handshake(ssl::stream_base::client, handler); }, "handshake");

        auto out = exchange(ioc, stream, req);

        // Peers often drop TLS without close_notify; the response is complete.
        beast::error_code ec;
        lowest.socket().shutdown(tcp::socket::shutdown_both, ec);
        return out;
    }

    beast::tcp_stream stream(ioc);
    stream.expires_at(deadline);
    run_step(ioc, [&](auto handler) { stream.async_connect(results, handler); }, "connect");
    auto out = exchange(ioc, stream, req);
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    return out;
}
