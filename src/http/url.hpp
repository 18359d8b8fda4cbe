#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace gzs::http {

/// Parsed request target. path keeps its percent escapes; query excludes
/// the '?'.
struct Url {
    std::string hostname;
    std::optional<u16> port;
    std::string path = "/";
    std::string query;
};

/// Parse "http://host[:port]/path?query" (http or https, any case).
/// Userinfo and fragment are dropped; the hostname is lowercased.
Result<Url> parse_absolute_url(std::string_view url);

/// Split an origin-form target ("/path?query") into path and query.
Url split_target(std::string_view target);

/// Host header value without its port: "example.com:8080" -> "example.com".
std::string strip_port(std::string_view host);

/// Collapse empty, "." and ".." segments. ".." never climbs above the
/// first segment. The result has no leading slash; a trailing slash is
/// dropped. "/a/./b/../c" -> "a/c", "/../../x" -> "x".
std::string normalize_path(std::string_view path);

} // namespace gzs::http
