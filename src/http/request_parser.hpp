#pragma once

#include "core/types.hpp"
#include "http/http_request.hpp"

#include <string>
#include <string_view>

namespace gzs::http {

/// Incremental HTTP/1.x request parser for one connection. Bytes are
/// appended as they arrive; parse() advances as far as the buffer allows.
/// Bytes following a complete request stay buffered for the next one
/// (pipelining).
class RequestParser {
public:
    enum class Status { Incomplete, Complete, Error };

    RequestParser(u64 max_header_size, u64 max_body_size)
        : max_header_size_(max_header_size), max_body_size_(max_body_size) {}

    void append(const char* data, size_t len) { buffer_.append(data, len); }
    Status parse();

    /// Move out the completed request and reset for the next one.
    HttpRequest take_request();

    /// HTTP status describing the failure once parse() returned Error.
    int error_status() const { return error_status_; }
    const std::string& error_message() const { return error_message_; }

    /// True while a request is partially received.
    bool in_progress() const { return state_ != State::RequestLine || !buffer_.empty(); }

private:
    enum class State { RequestLine, Headers, Body, Complete, Error };

    Status fail(int status, std::string message);
    bool parse_request_line(std::string_view line);
    bool parse_header_line(std::string_view line);
    Status finish_headers();

    /// Pop one line (LF or CRLF terminated) from the buffer.
    bool next_line(std::string& line);

    u64 max_header_size_;
    u64 max_body_size_;

    std::string buffer_;
    State state_ = State::RequestLine;
    HttpRequest request_;
    u64 header_bytes_ = 0;
    u64 content_length_ = 0;
    int error_status_ = 0;
    std::string error_message_;
};

} // namespace gzs::http
