#include "fieldsync/network/http_client.hpp"

#include "fieldsync/network/http_response_parser.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <array>
#include <functional>
#include <optional>

namespace fieldsync {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

HttpClient::HttpClient(std::string host, std::uint16_t port, std::chrono::milliseconds timeout)
    : host_(std::move(host))
    , port_(port)
    , timeout_(timeout) {
}

Result<HttpResponse> HttpClient::send(const HttpRequest& request) const {
    asio::io_context io_context;
    tcp::resolver resolver(io_context);
    tcp::socket socket(io_context);

    HttpResponseParser parser;
    std::array<char, 8192> buffer{};
    const std::string wire = request.serialize(host_, port_);

    std::optional<Error> failure;
    bool complete = false;

    std::function<void()> do_read;
    do_read = [&]() {
        socket.async_read_some(
            asio::buffer(buffer),
            [&](boost::system::error_code ec, size_t bytes_transferred) {
                if (ec == asio::error::eof) {
                    auto finished = parser.finish();
                    if (finished.is_error()) {
                        failure = Error{ErrorKind::Transient, finished.error()};
                        return;
                    }
                    complete = true;
                    return;
                }
                if (ec) {
                    if (ec != asio::error::operation_aborted) {
                        failure = Error{ErrorKind::Transient, "Read failed: " + ec.message()};
                    }
                    return;
                }

                auto parse_result = parser.parse(buffer.data(), bytes_transferred);
                if (parse_result.is_error()) {
                    failure = Error{ErrorKind::Transient, "Malformed response: " + parse_result.error()};
                    return;
                }
                if (parse_result.value()) {
                    complete = true;
                    return;
                }
                do_read();
            });
    };

    resolver.async_resolve(
        host_, std::to_string(port_),
        [&](boost::system::error_code ec, tcp::resolver::results_type endpoints) {
            if (ec) {
                failure = Error{ErrorKind::Transient, "Cannot resolve " + host_ + ": " + ec.message()};
                return;
            }
            asio::async_connect(
                socket, endpoints,
                [&](boost::system::error_code connect_ec, const tcp::endpoint&) {
                    if (connect_ec) {
                        failure = Error{ErrorKind::Transient, "Cannot connect to " + host_ + ": " +
                                        connect_ec.message()};
                        return;
                    }
                    asio::async_write(
                        socket, asio::buffer(wire),
                        [&](boost::system::error_code write_ec, size_t) {
                            if (write_ec) {
                                failure = Error{ErrorKind::Transient, "Write failed: " + write_ec.message()};
                                return;
                            }
                            do_read();
                        });
                });
        });

    io_context.run_for(timeout_);

    if (!complete && !failure) {
        // Deadline passed; abort outstanding operations and let their handlers drain
        resolver.cancel();
        boost::system::error_code close_ec;
        socket.close(close_ec);
        io_context.restart();
        io_context.run();
        spdlog::debug("Request {} timed out after {}ms", request.target, timeout_.count());
        return Err<HttpResponse>(ErrorKind::Timeout,
                                 "No response from " + host_ + " within " +
                                 std::to_string(timeout_.count()) + "ms");
    }

    if (failure) {
        return Err<HttpResponse>(*failure);
    }

    boost::system::error_code shutdown_ec;
    socket.shutdown(tcp::socket::shutdown_both, shutdown_ec);
    return Ok(parser.get_response());
}

} // namespace network
} // namespace fieldsync
