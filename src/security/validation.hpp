#pragma once

#include "core/result.hpp"

#include <string>
#include <string_view>

namespace gzs::security {

constexpr size_t kMaxGameIdLength = 255;
constexpr size_t kMaxHostnameLength = 253;

/// Mount ids: 1..255 characters of [A-Za-z0-9_-]. Anything else
/// (separators, dots, NUL) fails with InvalidInput.
Result<std::string> validate_game_id(std::string_view id);

/// Archived hostnames: 2..253 characters of [A-Za-z0-9._-], starting and
/// ending with an alphanumeric. Single-character hosts are not supported.
Result<std::string> validate_hostname(std::string_view host);

} // namespace gzs::security
