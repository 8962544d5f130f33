#pragma once
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

/// Single-threaded HTTP/1.1 server on 127.0.0.1 for client tests. One request
/// per connection; the responder picks the reply and every request is recorded.
class StubHttpServer {
public:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;

    struct Reply {
        unsigned status = 200;
        std::vector<std::pair<std::string, std::string>> headers;
        std::string body;
        std::chrono::milliseconds delay{0};
    };
    using Responder = std::function<Reply(const Request&)>;

    static Responder canned(Reply reply) {
        return [reply](const Request&) { return reply; };
    }

    explicit StubHttpServer(Responder responder)
        : responder_(std::move(responder)),
          acceptor_(ioc_, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)) {
        port_ = acceptor_.local_endpoint().port();
        thread_ = std::thread([this] { serve(); });
    }

    ~StubHttpServer() {
        stop_ = true;
        boost::beast::error_code ec;
        tcp::socket wake(ioc_);
        wake.connect(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port_), ec);
        thread_.join();
    }

    unsigned short port() const { return port_; }
    std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }

    std::vector<Request> requests() {
        std::lock_guard<std::mutex> lock(mu_);
        return requests_;
    }

private:
    using tcp = boost::asio::ip::tcp;

    void serve() {
        namespace http = boost::beast::http;
        for (;;) {
            tcp::socket sock(ioc_);
            boost::beast::error_code ec;
            acceptor_.accept(sock, ec);
            if (stop_ || ec) return;

            boost::beast::flat_buffer buffer;
            Request req;
            http::read(sock, buffer, req, ec);
            if (ec) continue;
            {
                std::lock_guard<std::mutex> lock(mu_);
                requests_.push_back(req);
            }
            const Reply reply = responder_(req);
            if (reply.delay.count() > 0) std::this_thread::sleep_for(reply.delay);

            http::response<http::string_body> res{static_cast<http::status>(reply.status), 11};
            for (const auto& [name, value] : reply.headers) res.set(name, value);
            res.set(http::field::content_type, "application/json");
            res.body() = reply.body;
            res.prepare_payload();
            http::write(sock, res, ec);
            sock.shutdown(tcp::socket::shutdown_both, ec);
        }
    }

    Responder responder_;
    boost::asio::io_context ioc_;
    tcp::acceptor acceptor_;
    unsigned short port_{0};
    std::thread thread_;
    std::atomic<bool> stop_{false};
    std::mutex mu_;
    std::vector<Request> requests_;
};
