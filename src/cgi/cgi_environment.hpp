#pragma once

#include "cgi/cgi_types.hpp"
#include "core/config.hpp"

#include <map>
#include <string>
#include <string_view>

namespace gzs::cgi {

/// Variable name -> value. Ordered so the child's envp is deterministic.
using CgiEnvironment = std::map<std::string, std::string>;

/// The complete CGI/1.1 (RFC 3875) environment for one invocation. Nothing
/// from the server's own environment is carried over.
CgiEnvironment build_cgi_environment(const fs::path& script_path,
                                     const CgiRequest& request,
                                     const CgiConfig& config);

/// Drop query parameters that php-cgi would read as command-line switches
/// (CVE-2012-1823): a parameter with no '=' that starts with '-' or "%2d".
std::string sanitize_query_string(std::string_view query);

/// "X-Custom-Header" -> "HTTP_X_CUSTOM_HEADER". Empty when the name holds
/// characters outside [A-Za-z0-9-_].
std::string header_variable_name(std::string_view header);

} // namespace gzs::cgi
