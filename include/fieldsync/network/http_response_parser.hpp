#pragma once

#include "fieldsync/core/result.hpp"
#include "fieldsync/network/http_types.hpp"

#include <cctype>
#include <cstdlib>
#include <string>

namespace fieldsync {
namespace network {

/**
 * @brief States of the response parser
 *
 * HTTP Response Format:
 * VERSION SP STATUS SP REASON CRLF    <- Status line
 * Header-Name: Header-Value CRLF      <- Headers (multiple)
 * CRLF                                <- Empty line
 * [Body]                              <- Content-Length, chunked, or until close
 */
enum class ResponseParseState {
    VERSION,
    STATUS_CODE,
    REASON,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,               // Content-Length delimited
    BODY_UNTIL_CLOSE,   // No length given; ends at EOF
    CHUNK_SIZE,
    CHUNK_DATA,
    CHUNK_DATA_END,
    CHUNK_TRAILER,
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP/1.x response parser
 *
 * Feed it whatever the socket returned; it keeps its place between calls.
 *
 * ```cpp
 * HttpResponseParser parser;
 * while (!done) {
 *     auto n = socket.read_some(buffer);
 *     auto result = parser.parse(buffer.data(), n);
 *     if (result.is_error()) { ... }
 *     done = result.value();
 * }
 * HttpResponse response = parser.get_response();
 * ```
 *
 * On EOF call finish(): a body without Content-Length ends there, anything
 * else is a truncated response.
 */
class HttpResponseParser {
public:
    HttpResponseParser() { reset(); }

    Result<bool, std::string> parse(const char* data, size_t len) {
        for (size_t i = 0; i < len; ++i) {
            const char c = data[i];
            bool ok = true;

            switch (state_) {
                case ResponseParseState::VERSION: ok = parse_version(c); break;
                case ResponseParseState::STATUS_CODE: ok = parse_status_code(c); break;
                case ResponseParseState::REASON: ok = parse_reason(c); break;
                case ResponseParseState::HEADER_NAME: ok = parse_header_name(c); break;
                case ResponseParseState::HEADER_VALUE: ok = parse_header_value(c); break;
                case ResponseParseState::BODY: parse_body(c); break;
                case ResponseParseState::BODY_UNTIL_CLOSE:
                    response_.body.push_back(static_cast<uint8_t>(c));
                    break;
                case ResponseParseState::CHUNK_SIZE: ok = parse_chunk_size(c); break;
                case ResponseParseState::CHUNK_DATA: parse_chunk_data(c); break;
                case ResponseParseState::CHUNK_DATA_END: ok = parse_chunk_data_end(c); break;
                case ResponseParseState::CHUNK_TRAILER: ok = parse_chunk_trailer(c); break;
                case ResponseParseState::COMPLETE:
                    return Ok(true);
                case ResponseParseState::PARSE_ERROR:
                    return Err<bool, std::string>(std::string("Parser in error state"));
            }

            if (!ok) {
                state_ = ResponseParseState::PARSE_ERROR;
                return Err<bool, std::string>(error_);
            }
            if (state_ == ResponseParseState::COMPLETE) {
                return Ok(true);
            }
        }
        return Ok(false);
    }

    /**
     * @brief The peer closed the connection
     */
    Result<bool, std::string> finish() {
        if (state_ == ResponseParseState::BODY_UNTIL_CLOSE) {
            state_ = ResponseParseState::COMPLETE;
        }
        if (state_ != ResponseParseState::COMPLETE) {
            return Err<bool, std::string>(std::string("Connection closed before the response was complete"));
        }
        return Ok(true);
    }

    const HttpResponse& get_response() const { return response_; }

    bool is_complete() const { return state_ == ResponseParseState::COMPLETE; }

    void reset() {
        state_ = ResponseParseState::VERSION;
        response_ = HttpResponse();
        buffer_.clear();
        current_header_name_.clear();
        error_.clear();
        body_expected_ = 0;
        chunk_remaining_ = 0;
        last_char_was_cr_ = false;
    }

private:
    bool fail(std::string message) {
        error_ = std::move(message);
        return false;
    }

    // Returns true once a CRLF has been consumed; `c` is neither appended nor rejected
    bool at_line_end(char c, bool& handled) {
        handled = true;
        if (c == '\r') {
            last_char_was_cr_ = true;
            return false;
        }
        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            return true;
        }
        last_char_was_cr_ = false;
        handled = false;
        return false;
    }

    bool parse_version(char c) {
        if (c == ' ') {
            if (buffer_ != "HTTP/1.1" && buffer_ != "HTTP/1.0") {
                return fail("Unsupported HTTP version: " + buffer_);
            }
            buffer_.clear();
            state_ = ResponseParseState::STATUS_CODE;
            return true;
        }
        if (buffer_.size() >= 8) {
            return fail("HTTP version too long");
        }
        buffer_ += c;
        return true;
    }

    bool parse_status_code(char c) {
        bool handled = false;
        const bool line_end = at_line_end(c, handled);
        if (c == ' ' || line_end) {
            if (buffer_.size() != 3) {
                return fail("Malformed status code: " + buffer_);
            }
            response_.status_code = std::stoi(buffer_);
            buffer_.clear();
            state_ = line_end ? ResponseParseState::HEADER_NAME : ResponseParseState::REASON;
            return true;
        }
        if (handled) {
            return true;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return fail("Non-digit in status code");
        }
        buffer_ += c;
        return true;
    }

    bool parse_reason(char c) {
        bool handled = false;
        if (at_line_end(c, handled)) {
            response_.reason_phrase = buffer_;
            buffer_.clear();
            state_ = ResponseParseState::HEADER_NAME;
            return true;
        }
        if (!handled) {
            buffer_ += c;
        }
        return true;
    }

    bool parse_header_name(char c) {
        bool handled = false;
        if (at_line_end(c, handled)) {
            if (!buffer_.empty()) {
                return fail("Header line without colon");
            }
            return start_body();
        }
        if (handled) {
            return true;
        }

        if (c == ':') {
            if (buffer_.empty()) {
                return fail("Empty header name");
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ResponseParseState::HEADER_VALUE;
            return true;
        }
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return fail("Invalid character in header name");
        }
        buffer_ += c;
        return true;
    }

    bool parse_header_value(char c) {
        if (buffer_.empty() && (c == ' ' || c == '\t')) {
            return true;
        }
        bool handled = false;
        if (at_line_end(c, handled)) {
            response_.headers[current_header_name_] = buffer_;
            buffer_.clear();
            current_header_name_.clear();
            state_ = ResponseParseState::HEADER_NAME;
            return true;
        }
        if (!handled) {
            buffer_ += c;
        }
        return true;
    }

    bool start_body() {
        // 1xx, 204 and 304 never carry a body
        const int status = response_.status_code;
        if ((status >= 100 && status < 200) || status == 204 || status == 304) {
            state_ = ResponseParseState::COMPLETE;
            return true;
        }

        const std::string encoding = response_.get_header("Transfer-Encoding");
        if (!encoding.empty()) {
            if (strcasecmp(encoding.c_str(), "chunked") != 0) {
                return fail("Unsupported transfer encoding: " + encoding);
            }
            state_ = ResponseParseState::CHUNK_SIZE;
            return true;
        }

        const std::string content_length = response_.get_header("Content-Length");
        if (content_length.empty()) {
            state_ = ResponseParseState::BODY_UNTIL_CLOSE;
            return true;
        }

        char* end = nullptr;
        const unsigned long long length = std::strtoull(content_length.c_str(), &end, 10);
        if (end == content_length.c_str() || *end != '\0') {
            return fail("Malformed Content-Length: " + content_length);
        }
        body_expected_ = static_cast<size_t>(length);
        if (body_expected_ == 0) {
            state_ = ResponseParseState::COMPLETE;
            return true;
        }
        response_.body.reserve(body_expected_);
        state_ = ResponseParseState::BODY;
        return true;
    }

    void parse_body(char c) {
        response_.body.push_back(static_cast<uint8_t>(c));
        if (response_.body.size() >= body_expected_) {
            state_ = ResponseParseState::COMPLETE;
        }
    }

    bool parse_chunk_size(char c) {
        bool handled = false;
        if (at_line_end(c, handled)) {
            // Chunk extensions after ';' are ignored
            const std::string size_text = buffer_.substr(0, buffer_.find(';'));
            buffer_.clear();
            if (size_text.empty()) {
                return fail("Missing chunk size");
            }
            char* end = nullptr;
            chunk_remaining_ = static_cast<size_t>(std::strtoull(size_text.c_str(), &end, 16));
            if (*end != '\0') {
                return fail("Malformed chunk size: " + size_text);
            }
            state_ = chunk_remaining_ == 0 ? ResponseParseState::CHUNK_TRAILER
                                           : ResponseParseState::CHUNK_DATA;
            return true;
        }
        if (!handled) {
            buffer_ += c;
        }
        return true;
    }

    void parse_chunk_data(char c) {
        response_.body.push_back(static_cast<uint8_t>(c));
        if (--chunk_remaining_ == 0) {
            state_ = ResponseParseState::CHUNK_DATA_END;
        }
    }

    bool parse_chunk_data_end(char c) {
        bool handled = false;
        if (at_line_end(c, handled)) {
            state_ = ResponseParseState::CHUNK_SIZE;
            return true;
        }
        if (!handled) {
            return fail("Missing CRLF after chunk data");
        }
        return true;
    }

    bool parse_chunk_trailer(char c) {
        bool handled = false;
        if (at_line_end(c, handled)) {
            if (buffer_.empty()) {
                state_ = ResponseParseState::COMPLETE;
            }
            buffer_.clear();
            return true;
        }
        if (!handled) {
            buffer_ += c;
        }
        return true;
    }

    ResponseParseState state_;
    HttpResponse response_;
    std::string buffer_;
    std::string current_header_name_;
    std::string error_;
    size_t body_expected_;
    size_t chunk_remaining_;
    bool last_char_was_cr_;
};

} // namespace network
} // namespace fieldsync
