#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace gzs::security {

/// Decode %XX escapes. Returns nullopt for a truncated or non-hex escape.
/// '+' is left alone (paths, not form data).
std::optional<std::string> percent_decode(std::string_view input);

/// True when the path carries an escape for '%' followed by an encoded
/// dot, slash, backslash or NUL (%252e, %252f, %255c, %2500). Such input
/// survives one decoding pass and turns into traversal on the second.
bool has_double_encoding(std::string_view url_path);

/// Gate for the path part of a request URL (query already removed).
/// Rejects NUL bytes, backslashes, encoded traversal sequences, double
/// encoding and malformed escapes with InvalidInput. Plain ".." segments
/// pass; they are collapsed later without escaping the archived host.
Result<std::string> sanitize_url_path(std::string_view url_path);

/// Component-wise containment test on lexically normalized paths:
/// "/games/x.zip" is within "/games", "/games-old/x.zip" is not.
bool is_within_directory(const fs::path& base, const fs::path& candidate);

/// Redact absolute filesystem paths and file names from a message before
/// it is sent to a client.
std::string sanitize_error_message(std::string_view message);

} // namespace gzs::security
