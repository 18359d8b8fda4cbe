#pragma once

#include <string>
#include <string_view>

namespace gzs::http {

/// Content type for a file extension (without the dot, any case).
/// Legacy plugin formats (Shockwave, Authorware, VRML, ...) take priority
/// over the common web types; unknown extensions map to
/// application/octet-stream.
std::string mime_type_for_extension(std::string_view extension);

/// Lowercased extension of the last path segment, without the dot.
/// "/a/b/Game.SWF" -> "swf", "/a.b/c" -> "".
std::string file_extension(std::string_view path);

/// Extensions executed through CGI rather than served as bytes.
bool is_script_extension(std::string_view extension);

} // namespace gzs::http
