#pragma once

#include "core/types.hpp"
#include "http/headers.hpp"
#include "http/url.hpp"

#include <optional>
#include <string>

namespace gzs::cgi {

/// Inbound request as seen by a CGI script.
struct CgiRequest {
    std::string method;
    http::Url url;
    http::HeaderMap headers;
    std::optional<Bytes> body;
    std::string remote_addr = "127.0.0.1";
};

/// Parsed script output.
struct CgiResponse {
    int status_code = 200;
    http::HeaderMap headers;
    Bytes body;
};

} // namespace gzs::cgi
