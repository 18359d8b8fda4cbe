#include "cgi/cgi_output_parser.hpp"

#include <cctype>
#include <spdlog/spdlog.h>

namespace gzs::cgi {

namespace {

std::string_view trim(std::string_view s) {
    auto first = s.find_first_not_of(" \t");
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

} // namespace

ParsedOutput parse_cgi_output(std::string_view output) {
    ParsedOutput parsed;
    auto& resp = parsed.response;

    auto crlf = output.find("\r\n\r\n");
    auto lf = output.find("\n\n");
    size_t separator = std::string_view::npos;
    size_t separator_len = 0;
    if (crlf != std::string_view::npos && (lf == std::string_view::npos || crlf < lf)) {
        separator = crlf;
        separator_len = 4;
    } else if (lf != std::string_view::npos) {
        separator = lf;
        separator_len = 2;
    }

    if (separator == std::string_view::npos) {
        spdlog::warn("[CGI] No header separator found in output, treating as plain body");
        resp.headers.set("Content-Type", "text/html");
        resp.body.assign(output.begin(), output.end());
        return parsed;
    }

    parsed.has_header_block = true;
    auto header_block = output.substr(0, separator);
    auto body = output.substr(separator + separator_len);
    resp.body.assign(body.begin(), body.end());

    bool status_seen = false;
    size_t start = 0;
    while (start <= header_block.size()) {
        size_t end = header_block.find('\n', start);
        if (end == std::string_view::npos) end = header_block.size();
        auto line = header_block.substr(start, end - start);
        start = end + 1;

        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        auto colon = line.find(':');
        if (colon == std::string_view::npos) continue;

        auto name = trim(line.substr(0, colon));
        auto value = trim(line.substr(colon + 1));
        if (name.empty()) continue;

        if (http::iequals(name, "Status")) {
            if (value.size() >= 3 && std::isdigit(static_cast<unsigned char>(value[0])) &&
                std::isdigit(static_cast<unsigned char>(value[1])) &&
                std::isdigit(static_cast<unsigned char>(value[2]))) {
                int code = (value[0] - '0') * 100 + (value[1] - '0') * 10 + (value[2] - '0');
                if (code >= 100 && code <= 599) {
                    resp.status_code = code;
                    status_seen = true;
                }
            }
            continue;
        }
        resp.headers.set(std::string(name), std::string(value));
    }

    if (!status_seen && resp.headers.contains("Location")) {
        resp.status_code = 302;
    }
    if (!resp.headers.contains("Content-Type")) {
        resp.headers.set("Content-Type", "text/html");
    }
    return parsed;
}

} // namespace gzs::cgi
