#include "security/path_security.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <spdlog/spdlog.h>

namespace gzs::security {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return out;
}

Error reject(const char* reason) {
    spdlog::warn("[Security] {} in URL path", reason);
    return Error(ErrorKind::InvalidInput,
                 std::string("Invalid path: ") + reason);
}

// Escapes that decode into traversal or a NUL byte
constexpr std::array<std::string_view, 6> kDangerousEscapes = {
    "%2e%2e%2f", "%2e%2e%5c", "..%2f", "..%5c", "%2e%2e/", "%00",
};

} // namespace

std::optional<std::string> percent_decode(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    for (size_t i = 0; i < input.size(); i++) {
        if (input[i] != '%') {
            out += input[i];
            continue;
        }
        if (i + 2 >= input.size()) {
            return std::nullopt;
        }
        int hi = hex_value(input[i + 1]);
        int lo = hex_value(input[i + 2]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out += static_cast<char>((hi << 4) | lo);
        i += 2;
    }
    return out;
}

bool has_double_encoding(std::string_view url_path) {
    auto lower = to_lower(url_path);
    size_t pos = 0;
    while ((pos = lower.find("%25", pos)) != std::string::npos) {
        auto rest = std::string_view(lower).substr(pos + 3, 2);
        if (rest == "2e" || rest == "2f" || rest == "5c" || rest == "00") {
            return true;
        }
        pos += 3;
    }
    return false;
}

Result<std::string> sanitize_url_path(std::string_view url_path) {
    if (url_path.find('\0') != std::string_view::npos) {
        return reject("Null byte detected");
    }
    if (url_path.find('\\') != std::string_view::npos) {
        return reject("Backslash detected");
    }
    if (has_double_encoding(url_path)) {
        return reject("Double encoding detected");
    }

    auto lower = to_lower(url_path);
    for (auto pattern : kDangerousEscapes) {
        if (lower.find(pattern) != std::string::npos) {
            return reject("Dangerous pattern detected");
        }
    }

    auto decoded = percent_decode(url_path);
    if (!decoded) {
        return reject("Malformed URL encoding");
    }
    if (decoded->find('\0') != std::string::npos) {
        return reject("Null byte detected");
    }
    if (decoded->find('\\') != std::string::npos) {
        return reject("Backslash detected");
    }

    // A ".." that only exists after decoding (e.g. "%2e%2e", ".%2e")
    size_t start = 0;
    while (start <= url_path.size()) {
        size_t end = url_path.find('/', start);
        if (end == std::string_view::npos) end = url_path.size();
        auto raw_segment = url_path.substr(start, end - start);
        if (raw_segment.find('%') != std::string_view::npos) {
            auto segment = percent_decode(raw_segment).value_or("");
            size_t piece_start = 0;
            while (piece_start <= segment.size()) {
                size_t piece_end = segment.find('/', piece_start);
                if (piece_end == std::string::npos) piece_end = segment.size();
                if (segment.compare(piece_start, piece_end - piece_start, "..") == 0) {
                    return reject("Encoded traversal detected");
                }
                piece_start = piece_end + 1;
            }
        }
        start = end + 1;
    }

    return std::string(url_path);
}

bool is_within_directory(const fs::path& base, const fs::path& candidate) {
    auto norm_base = base.lexically_normal();
    auto norm_candidate = candidate.lexically_normal();

    // "/games/" normalizes with an empty trailing element; drop it
    if (!norm_base.empty() && !norm_base.has_filename()) {
        norm_base = norm_base.parent_path();
    }

    auto bit = norm_base.begin();
    auto cit = norm_candidate.begin();
    for (; bit != norm_base.end(); ++bit, ++cit) {
        if (cit == norm_candidate.end() || *bit != *cit) {
            return false;
        }
    }
    // No ".." may climb back out after the shared prefix
    for (; cit != norm_candidate.end(); ++cit) {
        if (*cit == "..") {
            return false;
        }
    }
    return true;
}

std::string sanitize_error_message(std::string_view message) {
    static const std::regex windows_path(R"([A-Za-z]:\\[^:\s'"]+)");
    static const std::regex unix_path(
        R"(/(?:home|data|usr|var|tmp|opt|etc|root|srv|mnt)[^\s'"]*)",
        std::regex::icase);
    static const std::regex unc_path(R"(\\\\[^\s'"]+)");
    static const std::regex file_name(R"([^\s'"\[\]]+\.[a-zA-Z]{2,4}(?=\s|$|["']))");

    std::string out(message);
    out = std::regex_replace(out, windows_path, "[path]");
    out = std::regex_replace(out, unix_path, "[path]");
    out = std::regex_replace(out, unc_path, "[path]");
    out = std::regex_replace(out, file_name, "[file]");
    return out;
}

} // namespace gzs::security
