#pragma once

#include "cgi/cgi_types.hpp"
#include "core/result.hpp"
#include "http/http_request.hpp"
#include "http/http_response.hpp"

#include <string_view>
#include <variant>

namespace gzs::server {

/// A request that must be answered by running a script. The connection
/// loop spawns it and hands the outcome back to complete_cgi().
struct CgiDispatch {
    fs::path script;
    cgi::CgiRequest request;
};

using Dispatch = std::variant<http::HttpResponse, CgiDispatch>;

/// Application side of the HTTP server. Implementations must not block:
/// slow work (scripts) is returned as a CgiDispatch instead.
class RequestHandler {
public:
    virtual ~RequestHandler() = default;

    virtual Dispatch handle(const http::HttpRequest& request) = 0;

    /// Build the client response for a finished (or failed) script run.
    virtual http::HttpResponse complete_cgi(const http::HttpRequest& request,
                                            const Result<cgi::CgiResponse>& result) = 0;

    /// Plain-text error, used for transport-level failures too (400, 413,
    /// 431, 408).
    virtual http::HttpResponse error_response(int status, std::string_view message) = 0;
};

} // namespace gzs::server
