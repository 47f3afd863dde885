#pragma once

#include <boost/asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace fieldsync::testing {

/**
 * @brief Loopback HTTP server that answers each connection from a script
 *
 * The handler gets the raw request head (up to the blank line) plus body and
 * returns the raw bytes to send back; the connection is then closed. An empty
 * reply means "accept and stay silent" until the server is destroyed.
 */
class ScriptedHttpServer {
public:
    using Handler = std::function<std::string(const std::string& request)>;

    explicit ScriptedHttpServer(Handler handler)
        : handler_(std::move(handler))
        , acceptor_(io_, boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)) {
        port_ = acceptor_.local_endpoint().port();
        thread_ = std::thread([this]() { serve(); });
    }

    ~ScriptedHttpServer() {
        stopping_ = true;
        boost::system::error_code ec;
        {
            // Wake the blocking accept()
            boost::asio::ip::tcp::socket wake(io_);
            wake.connect(acceptor_.local_endpoint(), ec);
            if (thread_.joinable()) {
                thread_.join();
            }
        }
        acceptor_.close(ec);
        std::lock_guard lock(mutex_);
        for (auto& socket : silent_) {
            socket.close(ec);
        }
    }

    ScriptedHttpServer(const ScriptedHttpServer&) = delete;
    ScriptedHttpServer& operator=(const ScriptedHttpServer&) = delete;

    std::uint16_t port() const { return port_; }

    std::vector<std::string> requests() const {
        std::lock_guard lock(mutex_);
        return requests_;
    }

private:
    void serve() {
        while (!stopping_) {
            boost::asio::ip::tcp::socket socket(io_);
            boost::system::error_code ec;
            acceptor_.accept(socket, ec);
            if (ec || stopping_) {
                return;
            }

            std::string request = read_request(socket);
            {
                std::lock_guard lock(mutex_);
                requests_.push_back(request);
            }

            const std::string reply = handler_(request);
            if (reply.empty()) {
                std::lock_guard lock(mutex_);
                silent_.push_back(std::move(socket));
                continue;
            }
            boost::asio::write(socket, boost::asio::buffer(reply), ec);
            socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
            socket.close(ec);
        }
    }

    static std::string read_request(boost::asio::ip::tcp::socket& socket) {
        std::string data;
        boost::system::error_code ec;
        boost::asio::read_until(socket, boost::asio::dynamic_buffer(data), "\r\n\r\n", ec);
        if (ec) {
            return data;
        }

        const auto head_end = data.find("\r\n\r\n") + 4;
        std::size_t content_length = 0;
        const auto pos = data.find("Content-Length: ");
        if (pos != std::string::npos && pos < head_end) {
            content_length = std::stoul(data.substr(pos + 16));
        }
        if (data.size() < head_end + content_length) {
            boost::asio::read(socket, boost::asio::dynamic_buffer(data),
                              boost::asio::transfer_exactly(head_end + content_length - data.size()), ec);
        }
        return data;
    }

    Handler handler_;
    boost::asio::io_context io_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::uint16_t port_ = 0;
    std::thread thread_;
    std::atomic<bool> stopping_{false};

    mutable std::mutex mutex_;
    std::vector<std::string> requests_;
    std::vector<boost::asio::ip::tcp::socket> silent_;
};

inline std::string http_reply(int status, const std::string& reason, const std::string& body,
                              const std::string& content_type = "application/json") {
    return "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\n" +
           "Content-Type: " + content_type + "\r\n" +
           "Content-Length: " + std::to_string(body.size()) + "\r\n" +
           "Connection: close\r\n\r\n" + body;
}

} // namespace fieldsync::testing
