#pragma once

#include "dsync/core/result.hpp"
#include "dsync/network/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>

namespace dsync {
namespace network {

/**
 * @brief State machine states for HTTP response parsing
 *
 * HTTP Response Format:
 * VERSION SP STATUS SP REASON CRLF   <- Status line
 * Header-Name: Header-Value CRLF     <- Headers (multiple)
 * CRLF                               <- Empty line
 * [Body]                             <- Content-Length, chunked, or until close
 */
enum class ResponseParseState {
    VERSION,
    STATUS_CODE,
    REASON,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,              // Fixed length body (Content-Length)
    CHUNK_SIZE,        // Hex size line of a chunked body
    CHUNK_DATA,
    CHUNK_DATA_END,    // CRLF after chunk data
    TRAILER,           // Optional trailer headers after the last chunk
    BODY_UNTIL_CLOSE,  // No framing: body ends when the peer closes
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP/1.1 response parser
 *
 * Data can be fed in arbitrary pieces as it arrives from the socket.
 *
 * Usage example:
 * ```cpp
 * HttpResponseParser parser;
 * while (!done) {
 *     auto n = stream.read_some(buffer);
 *     auto result = parser.parse(buffer.data(), n);
 *     if (result.is_error()) { ... }
 *     done = result.value();
 * }
 * // On EOF before completion:
 * auto result = parser.finish();
 * ```
 */
class HttpResponseParser {
public:
    /**
     * @param expect_body false for responses to HEAD requests
     */
    explicit HttpResponseParser(bool expect_body = true)
        : expect_body_(expect_body) {
        reset();
    }

    /**
     * @brief Parse incoming data
     *
     * @return true once the response is complete, false if more data is needed
     */
    Result<bool> parse(const char* data, std::size_t len) {
        std::size_t i = 0;
        while (i < len) {
            if (state_ == ResponseParseState::COMPLETE) {
                return Ok(true);
            }
            if (state_ == ResponseParseState::PARSE_ERROR) {
                return fail("Parser in error state");
            }

            // Body states consume runs of bytes at once
            if (state_ == ResponseParseState::BODY || state_ == ResponseParseState::CHUNK_DATA) {
                const std::size_t take = std::min(remaining_, len - i);
                response_.body.insert(response_.body.end(), data + i, data + i + take);
                remaining_ -= take;
                i += take;
                if (remaining_ == 0) {
                    state_ = (state_ == ResponseParseState::BODY)
                        ? ResponseParseState::COMPLETE
                        : ResponseParseState::CHUNK_DATA_END;
                }
                continue;
            }

            if (state_ == ResponseParseState::BODY_UNTIL_CLOSE) {
                response_.body.insert(response_.body.end(), data + i, data + len);
                i = len;
                continue;
            }

            const char c = data[i++];
            if (c == '\n') {
                line_++;
            }

            bool ok = true;
            switch (state_) {
                case ResponseParseState::VERSION: ok = parse_version(c); break;
                case ResponseParseState::STATUS_CODE: ok = parse_status_code(c); break;
                case ResponseParseState::REASON: ok = parse_reason(c); break;
                case ResponseParseState::HEADER_NAME: ok = parse_header_name(c); break;
                case ResponseParseState::HEADER_VALUE: ok = parse_header_value(c); break;
                case ResponseParseState::CHUNK_SIZE: ok = parse_chunk_size(c); break;
                case ResponseParseState::CHUNK_DATA_END: ok = parse_chunk_data_end(c); break;
                case ResponseParseState::TRAILER: ok = parse_trailer(c); break;
                default: break;
            }

            if (!ok) {
                state_ = ResponseParseState::PARSE_ERROR;
                return fail(error_ + " at line " + std::to_string(line_));
            }
        }

        return Ok(state_ == ResponseParseState::COMPLETE);
    }

    /**
     * @brief Signal that the peer closed the connection
     *
     * Completes a read-until-close body; anything else unfinished is an error.
     */
    Result<bool> finish() {
        if (state_ == ResponseParseState::BODY_UNTIL_CLOSE) {
            state_ = ResponseParseState::COMPLETE;
        }
        if (state_ == ResponseParseState::COMPLETE) {
            return Ok(true);
        }
        return fail("Connection closed before the response was complete");
    }

    const HttpResponse& get_response() const { return response_; }

    HttpResponse take_response() { return std::move(response_); }

    bool is_complete() const { return state_ == ResponseParseState::COMPLETE; }

    ResponseParseState state() const { return state_; }

    void reset() {
        state_ = ResponseParseState::VERSION;
        response_ = HttpResponse();
        buffer_.clear();
        current_header_name_.clear();
        error_.clear();
        remaining_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
    }

private:
    bool expect_body_;
    ResponseParseState state_ = ResponseParseState::VERSION;
    HttpResponse response_;
    std::string buffer_;                // Current token
    std::string current_header_name_;
    std::string error_;
    std::size_t remaining_ = 0;         // Bytes left in fixed body or current chunk
    std::size_t line_ = 1;
    bool last_char_was_cr_ = false;

    Result<bool> fail(const std::string& message) {
        return Err<bool>(ErrorKind::Protocol, message);
    }

    bool error(const std::string& message) {
        error_ = message;
        return false;
    }

    /**
     * @brief Consume CR of a CRLF; returns true when c completed the line
     */
    bool end_of_line(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return false;
        }
        const bool done = (c == '\n' && last_char_was_cr_);
        last_char_was_cr_ = false;
        return done;
    }

    /**
     * Example: "HTTP/1.1 200 OK\r\n"
     *           ^-- we're here
     */
    bool parse_version(char c) {
        if (c == ' ') {
            if (buffer_ != "HTTP/1.1" && buffer_ != "HTTP/1.0") {
                return error("Unsupported HTTP version '" + buffer_ + "'");
            }
            buffer_.clear();
            state_ = ResponseParseState::STATUS_CODE;
            return true;
        }
        if (!std::isprint(static_cast<unsigned char>(c)) || buffer_.size() > 8) {
            return error("Malformed status line");
        }
        buffer_ += c;
        return true;
    }

    bool parse_status_code(char c) {
        if (c == ' ' || c == '\r') {
            if (buffer_.size() != 3) {
                return error("Malformed status code '" + buffer_ + "'");
            }
            response_.status_code = std::stoi(buffer_);
            buffer_.clear();
            state_ = ResponseParseState::REASON;
            last_char_was_cr_ = (c == '\r');
            return true;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return error("Malformed status code");
        }
        buffer_ += c;
        return true;
    }

    bool parse_reason(char c) {
        if (end_of_line(c)) {
            response_.reason_phrase = buffer_;
            buffer_.clear();
            state_ = ResponseParseState::HEADER_NAME;
            return true;
        }
        if (c != '\r') {
            buffer_ += c;
        }
        return true;
    }

    bool parse_header_name(char c) {
        if (buffer_.empty() && (c == '\r' || c == '\n')) {
            if (end_of_line(c)) {
                return begin_body();
            }
            return c == '\r';
        }

        if (c == ':') {
            if (buffer_.empty()) {
                return error("Empty header name");
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ResponseParseState::HEADER_VALUE;
            return true;
        }

        if (std::isspace(static_cast<unsigned char>(c)) || !std::isprint(static_cast<unsigned char>(c))) {
            return error("Invalid character in header name");
        }

        buffer_ += c;
        return true;
    }

    bool parse_header_value(char c) {
        // Skip leading whitespace after colon
        if (buffer_.empty() && (c == ' ' || c == '\t')) {
            return true;
        }

        if (end_of_line(c)) {
            while (!buffer_.empty() && (buffer_.back() == ' ' || buffer_.back() == '\t')) {
                buffer_.pop_back();
            }
            response_.headers[current_header_name_] = buffer_;
            buffer_.clear();
            current_header_name_.clear();
            state_ = ResponseParseState::HEADER_NAME;
            return true;
        }

        if (c != '\r') {
            buffer_ += c;
        }
        return true;
    }

    /**
     * @brief Decide how the body is framed once headers are complete
     */
    bool begin_body() {
        const int status = response_.status_code;
        if (!expect_body_ || (status >= 100 && status < 200) || status == 204 || status == 304) {
            state_ = ResponseParseState::COMPLETE;
            return true;
        }

        std::string encoding = response_.get_header("Transfer-Encoding");
        std::transform(encoding.begin(), encoding.end(), encoding.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        if (encoding.find("chunked") != std::string::npos) {
            state_ = ResponseParseState::CHUNK_SIZE;
            return true;
        }

        const std::string content_length = response_.get_header("Content-Length");
        if (!content_length.empty()) {
            std::size_t length = 0;
            try {
                length = static_cast<std::size_t>(std::stoull(content_length));
            } catch (const std::exception&) {
                return error("Invalid Content-Length '" + content_length + "'");
            }
            if (length == 0) {
                state_ = ResponseParseState::COMPLETE;
                return true;
            }
            response_.body.reserve(length);
            remaining_ = length;
            state_ = ResponseParseState::BODY;
            return true;
        }

        state_ = ResponseParseState::BODY_UNTIL_CLOSE;
        return true;
    }

    /**
     * Example: "1a3;ext=1\r\n"
     */
    bool parse_chunk_size(char c) {
        if (end_of_line(c)) {
            const auto extension = buffer_.find(';');
            const std::string size_text = buffer_.substr(0, extension);
            buffer_.clear();
            if (size_text.empty()) {
                return error("Empty chunk size");
            }
            std::size_t size = 0;
            try {
                size = static_cast<std::size_t>(std::stoull(size_text, nullptr, 16));
            } catch (const std::exception&) {
                return error("Invalid chunk size '" + size_text + "'");
            }
            if (size == 0) {
                state_ = ResponseParseState::TRAILER;
                return true;
            }
            remaining_ = size;
            state_ = ResponseParseState::CHUNK_DATA;
            return true;
        }
        if (c != '\r') {
            buffer_ += c;
        }
        return true;
    }

    bool parse_chunk_data_end(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (end_of_line(c)) {
            state_ = ResponseParseState::CHUNK_SIZE;
            return true;
        }
        return error("Missing CRLF after chunk data");
    }

    bool parse_trailer(char c) {
        if (end_of_line(c)) {
            if (buffer_.empty()) {
                state_ = ResponseParseState::COMPLETE;
            }
            buffer_.clear();
            return true;
        }
        if (c != '\r') {
            buffer_ += c;
        }
        return true;
    }
};

} // namespace network
} // namespace dsync
