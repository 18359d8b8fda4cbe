#include "security/validation.hpp"

#include <spdlog/spdlog.h>

namespace gzs::security {

namespace {

bool is_alnum(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9');
}

} // namespace

Result<std::string> validate_game_id(std::string_view id) {
    if (id.empty()) {
        return Error(ErrorKind::InvalidInput, "Invalid game ID: Game ID is required");
    }
    if (id.size() > kMaxGameIdLength) {
        return Error(ErrorKind::InvalidInput, "Invalid game ID: Game ID is too long");
    }
    for (char c : id) {
        if (!is_alnum(c) && c != '-' && c != '_') {
            spdlog::warn("[Security] Invalid mount ID rejected");
            return Error(ErrorKind::InvalidInput,
                         "Invalid game ID: Game ID contains invalid characters");
        }
    }
    return std::string(id);
}

Result<std::string> validate_hostname(std::string_view host) {
    if (host.size() < 2) {
        return Error(ErrorKind::InvalidInput, "Invalid hostname: Hostname is required");
    }
    if (host.size() > kMaxHostnameLength) {
        return Error(ErrorKind::InvalidInput, "Invalid hostname: Hostname is too long");
    }
    if (!is_alnum(host.front()) || !is_alnum(host.back())) {
        return Error(ErrorKind::InvalidInput, "Invalid hostname: Invalid hostname format");
    }
    for (char c : host) {
        if (!is_alnum(c) && c != '-' && c != '_' && c != '.') {
            return Error(ErrorKind::InvalidInput,
                         "Invalid hostname: Invalid hostname format");
        }
    }
    return std::string(host);
}

} // namespace gzs::security
