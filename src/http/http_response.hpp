#pragma once

#include "core/types.hpp"
#include "http/headers.hpp"

#include <string>
#include <string_view>

namespace gzs::http {

struct HttpResponse {
    int status = 200;
    HeaderMap headers;
    Bytes body;
    bool head_only = false; ///< Send headers (with Content-Length) but no body

    static HttpResponse text(int status, std::string_view body,
                             std::string_view content_type = "text/plain");

    /// Status line, headers, Content-Length and body, ready for the socket.
    std::string serialize(bool keep_alive) const;
};

const char* reason_phrase(int status);

} // namespace gzs::http
