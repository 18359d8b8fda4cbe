#pragma once

#include "core/types.hpp"
#include "http/headers.hpp"

#include <string>

namespace gzs::http {

/// One parsed inbound request. target is the raw request-target from the
/// request line (origin-form "/path?q" or absolute-form "http://host/p").
struct HttpRequest {
    std::string method;
    std::string target;
    std::string version = "HTTP/1.1";
    HeaderMap headers;
    Bytes body;
    std::string remote_addr; ///< Peer address, filled in by the server

    /// Persistent-connection semantics of RFC 7230 section 6.3.
    bool keep_alive() const;
};

} // namespace gzs::http
