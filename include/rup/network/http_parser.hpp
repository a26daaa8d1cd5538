#pragma once

#include "rup/core/result.hpp"
#include "rup/network/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <exception>
#include <limits>
#include <string>

namespace rup {
namespace network {

/**
 * @brief State machine states for HTTP message parsing
 *
 * Request Format:
 * METHOD SP URL SP VERSION CRLF    <- Request line
 * Header-Name: Header-Value CRLF   <- Headers (multiple)
 * CRLF                             <- Empty line
 * [Body]                           <- Content-Length bytes
 *
 * Responses use STATUS_LINE in place of METHOD/URL/VERSION.
 */
enum class ParseState {
    METHOD,
    URL,
    VERSION,
    STATUS_LINE,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    COMPLETE,
    PARSE_ERROR      // Renamed to avoid Windows macro conflict
};

namespace detail {

/**
 * @brief Header and body states shared by the request and response parsers
 *
 * Header bytes are consumed one character at a time. Body bytes are copied in
 * bulk since chunk payloads are several megabytes.
 */
class MessageParserBase {
protected:
    ParseState state_ = ParseState::HEADER_NAME;
    std::string buffer_;
    std::string current_header_name_;
    std::size_t expected_body_length_ = 0;
    std::size_t max_body_size_ = std::numeric_limits<std::size_t>::max();
    std::size_t line_ = 1;
    bool last_char_was_cr_ = false;
    bool body_too_large_ = false;
    bool skip_body_ = false;

    void reset_base() {
        buffer_.clear();
        current_header_name_.clear();
        expected_body_length_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
        body_too_large_ = false;
    }

    /**
     * @brief Parse header field name; an empty line ends the header block
     */
    bool parse_header_name(char c, HeaderMap& headers, std::vector<uint8_t>& body) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            return finish_headers(headers, body);
        }

        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                return false;
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ParseState::HEADER_VALUE;
            return true;
        }

        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return false;
        }

        buffer_ += c;
        return true;
    }

    /**
     * @brief Parse header field value (leading whitespace skipped)
     */
    bool parse_header_value(char c, HeaderMap& headers) {
        if (buffer_.empty() && (c == ' ' || c == '\t')) {
            return true;
        }

        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            while (!buffer_.empty() && (buffer_.back() == ' ' || buffer_.back() == '\t')) {
                buffer_.pop_back();
            }
            headers[current_header_name_] = buffer_;
            buffer_.clear();
            current_header_name_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }

        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    /**
     * @brief Copy as many body bytes as are available
     * @return Number of input bytes consumed
     */
    std::size_t consume_body(const char* data, std::size_t len, std::vector<uint8_t>& body) {
        const std::size_t remaining = expected_body_length_ - body.size();
        const std::size_t take = std::min(remaining, len);
        body.insert(body.end(),
                    reinterpret_cast<const uint8_t*>(data),
                    reinterpret_cast<const uint8_t*>(data) + take);
        if (body.size() >= expected_body_length_) {
            state_ = ParseState::COMPLETE;
        }
        return take;
    }

private:
    bool finish_headers(const HeaderMap& headers, std::vector<uint8_t>& body) {
        const std::string content_length = find_header(headers, "Content-Length");
        if (content_length.empty() || skip_body_) {
            state_ = ParseState::COMPLETE;
            return true;
        }

        if (!std::all_of(content_length.begin(), content_length.end(),
                         [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
            return false;
        }

        std::size_t body_length = 0;
        try {
            body_length = static_cast<std::size_t>(std::stoull(content_length));
        } catch (const std::exception&) {
            return false;
        }

        if (body_length > max_body_size_) {
            body_too_large_ = true;
            return false;
        }

        if (body_length == 0) {
            state_ = ParseState::COMPLETE;
            return true;
        }

        expected_body_length_ = body_length;
        body.reserve(body_length);
        state_ = ParseState::BODY;
        return true;
    }
};

} // namespace detail

/**
 * @brief Incremental HTTP request parser
 *
 * Data can be fed as it arrives from the socket:
 * ```cpp
 * HttpParser parser(max_chunk_bytes);
 * auto result = parser.parse(buffer, n);
 * if (result.is_ok() && result.value()) {
 *     HttpRequest request = parser.get_request();
 * }
 * ```
 */
class HttpParser : private detail::MessageParserBase {
public:
    explicit HttpParser(std::size_t max_body_size = std::numeric_limits<std::size_t>::max()) {
        max_body_size_ = max_body_size;
        reset();
    }

    /**
     * @brief Parse incoming data
     *
     * @return true if a complete request is available, false if more data is
     *         needed, or an error for malformed input
     */
    Result<bool> parse(const char* data, size_t len) {
        size_t i = 0;
        while (i < len) {
            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
            if (state_ == ParseState::PARSE_ERROR) {
                return Err<bool, std::string>("Parser in error state");
            }

            if (state_ == ParseState::BODY) {
                i += consume_body(data + i, len - i, request_.body);
                continue;
            }

            const char c = data[i++];
            if (c == '\n') {
                line_++;
            }

            bool ok = true;
            const char* what = "";
            switch (state_) {
                case ParseState::METHOD:
                    ok = parse_method(c);
                    what = "HTTP method";
                    break;
                case ParseState::URL:
                    ok = parse_url(c);
                    what = "URL";
                    break;
                case ParseState::VERSION:
                    ok = parse_version(c);
                    what = "HTTP version";
                    break;
                case ParseState::HEADER_NAME:
                    ok = parse_header_name(c, request_.headers, request_.body);
                    what = "header name";
                    break;
                case ParseState::HEADER_VALUE:
                    ok = parse_header_value(c, request_.headers);
                    what = "header value";
                    break;
                default:
                    break;
            }

            if (!ok) {
                state_ = ParseState::PARSE_ERROR;
                if (body_too_large_) {
                    return Err<bool, std::string>("Request body exceeds " +
                                                  std::to_string(max_body_size_) + " bytes");
                }
                return Err<bool, std::string>(std::string("Failed to parse ") + what +
                                              " at line " + std::to_string(line_));
            }
        }

        return Ok(state_ == ParseState::COMPLETE);
    }

    HttpRequest get_request() const {
        return request_;
    }

    /// Moves the parsed request out; the parser must be reset before reuse.
    HttpRequest take_request() {
        return std::move(request_);
    }

    bool is_complete() const {
        return state_ == ParseState::COMPLETE;
    }

    /// True when the last error was caused by an oversized Content-Length.
    bool body_too_large() const {
        return body_too_large_;
    }

    void reset() {
        reset_base();
        state_ = ParseState::METHOD;
        request_ = HttpRequest();
    }

private:
    HttpRequest request_;

    bool parse_method(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.method = HttpMethodUtils::from_string(buffer_);
            if (request_.method == HttpMethod::UNKNOWN) {
                return false;
            }
            buffer_.clear();
            state_ = ParseState::URL;
            return true;
        }

        if (!std::isupper(static_cast<unsigned char>(c))) {
            return false;
        }

        buffer_ += c;
        return true;
    }

    bool parse_url(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.url = buffer_;
            buffer_.clear();
            state_ = ParseState::VERSION;
            return true;
        }

        if (!std::isprint(static_cast<unsigned char>(c))) {
            return false;
        }

        buffer_ += c;
        return true;
    }

    bool parse_version(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            if (buffer_ == "HTTP/1.1") {
                request_.version = HttpVersion::HTTP_1_1;
            } else if (buffer_ == "HTTP/1.0") {
                request_.version = HttpVersion::HTTP_1_0;
            } else {
                return false;
            }
            buffer_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }

        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }
};

/**
 * @brief Incremental HTTP response parser used by the upload client
 *
 * Responses to HEAD requests carry no body regardless of Content-Length;
 * call expect_no_body() before feeding such a response.
 */
class HttpResponseParser : private detail::MessageParserBase {
public:
    HttpResponseParser() { reset(); }

    Result<bool> parse(const char* data, size_t len) {
        size_t i = 0;
        while (i < len) {
            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
            if (state_ == ParseState::PARSE_ERROR) {
                return Err<bool, std::string>("Parser in error state");
            }

            if (state_ == ParseState::BODY) {
                i += consume_body(data + i, len - i, response_.body);
                continue;
            }

            const char c = data[i++];
            if (c == '\n') {
                line_++;
            }

            bool ok = true;
            switch (state_) {
                case ParseState::STATUS_LINE:
                    ok = parse_status_line(c);
                    break;
                case ParseState::HEADER_NAME:
                    ok = parse_header_name(c, response_.headers, response_.body);
                    break;
                case ParseState::HEADER_VALUE:
                    ok = parse_header_value(c, response_.headers);
                    break;
                default:
                    break;
            }

            if (!ok) {
                state_ = ParseState::PARSE_ERROR;
                return Err<bool, std::string>("Malformed HTTP response at line " + std::to_string(line_));
            }
        }

        return Ok(state_ == ParseState::COMPLETE);
    }

    void expect_no_body() { skip_body_ = true; }

    bool is_complete() const { return state_ == ParseState::COMPLETE; }

    /// Headers were read completely but the peer closed before the body ended.
    bool headers_complete() const {
        return state_ == ParseState::BODY || state_ == ParseState::COMPLETE;
    }

    HttpResponse get_response() const { return response_; }

    void reset() {
        reset_base();
        skip_body_ = false;
        state_ = ParseState::STATUS_LINE;
        response_ = HttpResponse();
    }

private:
    HttpResponse response_;

    // "HTTP/1.1 204 No Content\r\n"
    bool parse_status_line(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            const auto first_space = buffer_.find(' ');
            if (first_space == std::string::npos) {
                return false;
            }
            const std::string version = buffer_.substr(0, first_space);
            if (version == "HTTP/1.1") {
                response_.version = HttpVersion::HTTP_1_1;
            } else if (version == "HTTP/1.0") {
                response_.version = HttpVersion::HTTP_1_0;
            } else {
                return false;
            }

            const auto second_space = buffer_.find(' ', first_space + 1);
            const std::string code = buffer_.substr(first_space + 1, second_space == std::string::npos
                                                                        ? std::string::npos
                                                                        : second_space - first_space - 1);
            if (code.size() != 3 || !std::all_of(code.begin(), code.end(),
                                                 [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
                return false;
            }
            response_.status_code = std::stoi(code);
            if (second_space != std::string::npos) {
                response_.reason_phrase = buffer_.substr(second_space + 1);
            }
            buffer_.clear();
            state_ = ParseState::HEADER_NAME;
            return true;
        }

        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }
};

} // namespace network
} // namespace rup
