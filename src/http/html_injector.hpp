#pragma once

#include <string>
#include <string_view>

namespace gzs::http {

/// True when the page references the Unity WebGL loader or runtime.
bool needs_unity_polyfills(std::string_view html);

/// Insert compatibility scripts at the start of <head>. Without a <head>
/// the scripts go into a new head right after <html>. Input that contains
/// neither "<html" nor "<head" is returned unchanged.
std::string inject_polyfills(std::string_view html);

} // namespace gzs::http
