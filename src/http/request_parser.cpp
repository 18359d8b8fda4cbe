#include "http/request_parser.hpp"

#include <charconv>

namespace gzs::http {

RequestParser::Status RequestParser::fail(int status, std::string message) {
    state_ = State::Error;
    error_status_ = status;
    error_message_ = std::move(message);
    return Status::Error;
}

bool RequestParser::next_line(std::string& line) {
    auto pos = buffer_.find('\n');
    if (pos == std::string::npos) {
        return false;
    }
    header_bytes_ += pos + 1;
    size_t len = pos;
    if (len > 0 && buffer_[len - 1] == '\r') len--;
    line.assign(buffer_, 0, len);
    buffer_.erase(0, pos + 1);
    return true;
}

RequestParser::Status RequestParser::parse() {
    if (state_ == State::Error) return Status::Error;
    if (state_ == State::Complete) return Status::Complete;

    std::string line;
    while (state_ == State::RequestLine) {
        if (!next_line(line)) {
            if (header_bytes_ + buffer_.size() > max_header_size_) {
                return fail(431, "Request header section too large");
            }
            return Status::Incomplete;
        }
        // Stray CRLF between pipelined requests
        if (line.empty()) continue;
        if (!parse_request_line(line)) {
            return Status::Error;
        }
        state_ = State::Headers;
    }

    while (state_ == State::Headers) {
        if (!next_line(line)) {
            if (header_bytes_ + buffer_.size() > max_header_size_) {
                return fail(431, "Request header section too large");
            }
            return Status::Incomplete;
        }
        if (header_bytes_ > max_header_size_) {
            return fail(431, "Request header section too large");
        }
        if (line.empty()) {
            auto status = finish_headers();
            if (status == Status::Error) return status;
            break;
        }
        if (!parse_header_line(line)) {
            return Status::Error;
        }
    }

    if (state_ == State::Body) {
        if (buffer_.size() < content_length_) {
            return Status::Incomplete;
        }
        request_.body.assign(buffer_.begin(),
                             buffer_.begin() + static_cast<std::ptrdiff_t>(content_length_));
        buffer_.erase(0, content_length_);
        state_ = State::Complete;
    }

    return state_ == State::Complete ? Status::Complete : Status::Incomplete;
}

bool RequestParser::parse_request_line(std::string_view line) {
    auto sp1 = line.find(' ');
    auto sp2 = sp1 == std::string_view::npos ? sp1 : line.find(' ', sp1 + 1);
    if (sp1 == 0 || sp2 == std::string_view::npos || sp2 == sp1 + 1 ||
        line.find(' ', sp2 + 1) != std::string_view::npos) {
        fail(400, "Malformed request line");
        return false;
    }

    auto method = line.substr(0, sp1);
    for (char c : method) {
        if (c < 'A' || c > 'Z') {
            fail(400, "Malformed request method");
            return false;
        }
    }

    auto version = line.substr(sp2 + 1);
    if (version.substr(0, 5) != "HTTP/") {
        fail(400, "Malformed HTTP version");
        return false;
    }
    if (version != "HTTP/1.1" && version != "HTTP/1.0") {
        fail(505, "Unsupported HTTP version");
        return false;
    }

    request_.method.assign(method);
    request_.target.assign(line.substr(sp1 + 1, sp2 - sp1 - 1));
    request_.version.assign(version);
    return true;
}

bool RequestParser::parse_header_line(std::string_view line) {
    if (line.front() == ' ' || line.front() == '\t') {
        fail(400, "Obsolete header line folding");
        return false;
    }
    auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        fail(400, "Malformed header line");
        return false;
    }
    auto name = line.substr(0, colon);
    if (name.find_first_of(" \t") != std::string_view::npos) {
        fail(400, "Whitespace in header name");
        return false;
    }
    auto value = line.substr(colon + 1);
    auto first = value.find_first_not_of(" \t");
    auto last = value.find_last_not_of(" \t");
    value = first == std::string_view::npos ? std::string_view{}
                                            : value.substr(first, last - first + 1);
    request_.headers.add(std::string(name), std::string(value));
    return true;
}

RequestParser::Status RequestParser::finish_headers() {
    if (request_.headers.contains("Transfer-Encoding")) {
        return fail(501, "Transfer-Encoding is not supported");
    }

    content_length_ = 0;
    bool seen = false;
    for (const auto& [name, value] : request_.headers) {
        if (!iequals(name, "Content-Length")) continue;
        u64 length = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
        if (value.empty() || ec != std::errc() || ptr != value.data() + value.size()) {
            return fail(400, "Invalid Content-Length");
        }
        if (seen && length != content_length_) {
            return fail(400, "Conflicting Content-Length headers");
        }
        seen = true;
        content_length_ = length;
    }

    if (content_length_ > max_body_size_) {
        return fail(413, "Request body too large");
    }
    state_ = content_length_ > 0 ? State::Body : State::Complete;
    return Status::Incomplete;
}

HttpRequest RequestParser::take_request() {
    HttpRequest out = std::move(request_);
    request_ = HttpRequest{};
    state_ = State::RequestLine;
    header_bytes_ = 0;
    content_length_ = 0;
    return out;
}

} // namespace gzs::http
