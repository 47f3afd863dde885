#pragma once

#include <cstdint>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include <strings.h>

namespace fieldsync {
namespace network {

enum class HttpMethod {
    GET,
    POST
};

using HttpHeaders = std::unordered_map<std::string, std::string>;

// Header names are case-insensitive (RFC 7230)
inline std::string find_header(const HttpHeaders& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (strcasecmp(key.c_str(), name.c_str()) == 0) {
            return value;
        }
    }
    return "";
}

/**
 * @brief Outgoing HTTP/1.1 request
 *
 * serialize() produces the wire format:
 * POST /api/v1/submissions HTTP/1.1\r\n
 * Host: collect.example.org:443\r\n
 * Content-Length: 42\r\n
 * Connection: close\r\n
 * \r\n
 * {"id":"submission_..."}
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string target;             // Path plus query, e.g. "/api/v1/forms/new?since=0"
    HttpHeaders headers;
    std::vector<std::uint8_t> body;

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    void set_body(const std::string& content, const std::string& content_type) {
        body.assign(content.begin(), content.end());
        headers["Content-Type"] = content_type;
    }

    std::string serialize(const std::string& host, std::uint16_t port) const {
        std::ostringstream oss;
        oss << (method == HttpMethod::POST ? "POST" : "GET") << " " << target << " HTTP/1.1\r\n";
        oss << "Host: " << host << ":" << port << "\r\n";
        for (const auto& [name, value] : headers) {
            oss << name << ": " << value << "\r\n";
        }
        if (method == HttpMethod::POST || !body.empty()) {
            oss << "Content-Length: " << body.size() << "\r\n";
        }
        oss << "Connection: close\r\n";
        oss << "\r\n";

        std::string wire = oss.str();
        wire.append(body.begin(), body.end());
        return wire;
    }
};

/**
 * @brief Parsed HTTP response; body is raw bytes (media bodies are binary)
 */
struct HttpResponse {
    int status_code = 0;
    std::string reason_phrase;
    HttpHeaders headers;
    std::vector<std::uint8_t> body;

    std::string get_header(const std::string& name) const {
        return find_header(headers, name);
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }

    bool is_success() const { return status_code >= 200 && status_code < 300; }
};

} // namespace network
} // namespace fieldsync
