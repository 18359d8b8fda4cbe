#include "http/http_response.hpp"

#include <spdlog/fmt/fmt.h>

namespace gzs::http {

HttpResponse HttpResponse::text(int status, std::string_view body,
                                std::string_view content_type) {
    HttpResponse resp;
    resp.status = status;
    resp.headers.set("Content-Type", std::string(content_type));
    resp.body.assign(body.begin(), body.end());
    return resp;
}

std::string HttpResponse::serialize(bool keep_alive) const {
    std::string out = fmt::format("HTTP/1.1 {} {}\r\n", status, reason_phrase(status));
    for (const auto& [name, value] : headers) {
        if (iequals(name, "Content-Length") || iequals(name, "Connection") ||
            iequals(name, "Transfer-Encoding")) {
            continue;
        }
        out += fmt::format("{}: {}\r\n", name, value);
    }
    // 1xx, 204 and 304 never carry a body
    bool bodiless = status < 200 || status == 204 || status == 304;
    if (!bodiless) {
        out += fmt::format("Content-Length: {}\r\n", body.size());
    }
    out += keep_alive ? "Connection: keep-alive\r\n" : "Connection: close\r\n";
    out += "\r\n";
    if (!head_only && !bodiless) {
        out.append(body.data(), body.size());
    }
    return out;
}

const char* reason_phrase(int status) {
    switch (status) {
    case 100: return "Continue";
    case 200: return "OK";
    case 201: return "Created";
    case 202: return "Accepted";
    case 204: return "No Content";
    case 206: return "Partial Content";
    case 301: return "Moved Permanently";
    case 302: return "Found";
    case 303: return "See Other";
    case 304: return "Not Modified";
    case 307: return "Temporary Redirect";
    case 308: return "Permanent Redirect";
    case 400: return "Bad Request";
    case 401: return "Unauthorized";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 408: return "Request Timeout";
    case 411: return "Length Required";
    case 413: return "Payload Too Large";
    case 414: return "URI Too Long";
    case 415: return "Unsupported Media Type";
    case 431: return "Request Header Fields Too Large";
    case 500: return "Internal Server Error";
    case 501: return "Not Implemented";
    case 502: return "Bad Gateway";
    case 503: return "Service Unavailable";
    case 504: return "Gateway Timeout";
    case 505: return "HTTP Version Not Supported";
    default: return "Unknown";
    }
}

} // namespace gzs::http
