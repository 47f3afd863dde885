#pragma once

#include "fieldsync/core/result.hpp"
#include "fieldsync/network/http_types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace fieldsync {
namespace network {

/**
 * @brief Blocking HTTP/1.1 client with a hard deadline per exchange
 *
 * Each send() opens a fresh connection on a private io_context and drives
 * resolve, connect, write and read asynchronously until the response is
 * complete or the timeout expires. The deadline covers the whole exchange.
 *
 * Thread safe: calls share no state, so the phase workers may send
 * concurrently.
 *
 * Errors: ErrorKind::Timeout when the deadline passes, ErrorKind::Transient
 * for resolve/connect/read failures and malformed responses. HTTP error
 * statuses are not errors at this level.
 */
class HttpClient {
public:
    HttpClient(std::string host, std::uint16_t port, std::chrono::milliseconds timeout);

    Result<HttpResponse> send(const HttpRequest& request) const;

    const std::string& host() const noexcept { return host_; }
    std::uint16_t port() const noexcept { return port_; }

private:
    std::string host_;
    std::uint16_t port_;
    std::chrono::milliseconds timeout_;
};

} // namespace network
} // namespace fieldsync
