#include "core/config.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace gzs {

using json = nlohmann::json;

namespace {

/// Copy j[key] into out when present. Throws json::type_error on mismatch.
template <typename T>
void read_key(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

/// Unsigned sizes and counts. Read as signed so -1 is rejected instead of
/// wrapping to a huge limit.
template <typename T>
Result<void> read_unsigned(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return {};
    }
    if (it->is_number() && it->get<double>() < 0) {
        return Error(ErrorKind::InvalidInput,
                     std::string("Invalid settings value: ") + key + " must not be negative");
    }
    out = it->get<T>();
    return {};
}

void read_path(const json& j, const char* key, fs::path& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = fs::path(it->get<std::string>());
    }
}

void read_millis(const json& j, const char* key, std::chrono::milliseconds& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = std::chrono::milliseconds(it->get<i64>());
    }
}

void read_seconds(const json& j, const char* key, std::chrono::seconds& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = std::chrono::seconds(it->get<i64>());
    }
}

} // namespace

void apply_flashpoint_root(ServerConfig& config, const fs::path& root) {
    config.games_dir = root / "Data" / "Games";
    config.cgi.document_root = root / "Legacy" / "htdocs";
    config.cgi.cgi_bin_path = root / "Legacy" / "cgi-bin";
    config.cgi.interpreter = root / "Legacy" / "php-cgi";
}

Result<void> apply_config_json(std::string_view json_text, ServerConfig& config) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return Error(ErrorKind::InvalidInput,
                     std::string("Malformed settings JSON: ") + e.what());
    }
    if (!j.is_object()) {
        return Error(ErrorKind::InvalidInput, "Settings must be a JSON object");
    }

    // Work on a copy so a type error leaves config untouched
    ServerConfig next = config;
    try {
        if (auto it = j.find("flashpointPath"); it != j.end() && it->is_string()) {
            apply_flashpoint_root(next, it->get<std::string>());
        }

        read_key(j, "bindAddress", next.bind_address);
        if (auto it = j.find("port"); it != j.end() && !it->is_null()) {
            auto port = it->get<i64>();
            if (port < 0 || port > 65535) {
                return Error(ErrorKind::InvalidInput,
                             "Invalid settings value: port out of range");
            }
            next.port = static_cast<u16>(port);
        }
        read_path(j, "gamesPath", next.games_dir);
        read_key(j, "allowCrossDomain", next.allow_cross_domain);
        for (auto r : {read_unsigned(j, "corsMaxAge", next.cors_max_age),
                       read_unsigned(j, "maxRequestBodySize", next.max_request_body),
                       read_unsigned(j, "maxHeaderSize", next.max_header_size),
                       read_unsigned(j, "maxBufferedFileSize", next.max_buffered_file_size),
                       read_unsigned(j, "cgiMaxBodySize", next.cgi.max_body_size),
                       read_unsigned(j, "cgiMaxResponseSize", next.cgi.max_response_size)}) {
            if (!r) {
                return r;
            }
        }
        read_seconds(j, "keepAliveTimeout", next.keep_alive_timeout);
        read_seconds(j, "requestTimeout", next.request_timeout);
        read_seconds(j, "shutdownDrain", next.shutdown_drain);
        read_key(j, "serviceName", next.service_name);
        read_path(j, "logFile", next.log_file);
        read_key(j, "logLevel", next.log_level);

        read_key(j, "enableCGI", next.enable_cgi);
        read_path(j, "phpCgiPath", next.cgi.interpreter);
        read_path(j, "legacyHTDOCSPath", next.cgi.document_root);
        read_path(j, "legacyCGIBINPath", next.cgi.cgi_bin_path);
        read_millis(j, "cgiTimeout", next.cgi.timeout);
        read_millis(j, "cgiKillGrace", next.cgi.kill_grace);
    } catch (const json::exception& e) {
        return Error(ErrorKind::InvalidInput,
                     std::string("Invalid settings value: ") + e.what());
    }

    config = std::move(next);
    return {};
}

u64 request_body_limit(const ServerConfig& config) {
    if (config.enable_cgi) {
        return std::max(config.max_request_body, config.cgi.max_body_size);
    }
    return config.max_request_body;
}

Result<void> load_config_file(const fs::path& path, ServerConfig& config) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Error(ErrorKind::NotFound,
                     "Settings file not found: " + path.string());
    }

    std::ostringstream ss;
    ss << file.rdbuf();

    auto result = apply_config_json(ss.str(), config);
    if (!result) {
        spdlog::error("[Config] {}: {}", path.string(), result.error().message);
        return result;
    }

    spdlog::info("[Config] Loaded settings from {}", path.string());
    return {};
}

} // namespace gzs
