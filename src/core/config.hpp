#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace gzs {

/// Settings for the external CGI interpreter.
struct CgiConfig {
    fs::path interpreter;   ///< php-cgi (or compatible) binary
    fs::path document_root; ///< Legacy htdocs directory
    fs::path cgi_bin_path;  ///< Legacy cgi-bin directory
    std::chrono::milliseconds timeout{30000};
    std::chrono::milliseconds kill_grace{5000}; ///< SIGTERM -> SIGKILL delay
    u64 max_body_size = 10 * MiB; ///< Raises the transport body cap when CGI is on
    u64 max_response_size = 50 * MiB;
    u64 max_stderr_size = 1 * MiB;
    std::string server_software = "gamezipserver/1.0";
};

/// Everything the server needs, passed explicitly to constructors.
struct ServerConfig {
    std::string bind_address = "0.0.0.0";
    u16 port = 22501;
    fs::path games_dir; ///< Mount sources must resolve inside this directory

    bool allow_cross_domain = true;
    u32 cors_max_age = 86400;

    u64 max_request_body = 1 * MiB;
    u64 max_header_size = 16 * KiB;
    u64 max_buffered_file_size = 50 * MiB;
    std::chrono::seconds keep_alive_timeout{65};
    std::chrono::seconds request_timeout{120};
    std::chrono::seconds shutdown_drain{10};

    std::string service_name = "flashpoint-gamezip-server";
    fs::path log_file;
    std::string log_level = "info";

    bool enable_cgi = false;
    CgiConfig cgi;
};

/// Derive the conventional Flashpoint layout from its root directory:
/// Data/Games, Legacy/htdocs, Legacy/cgi-bin and Legacy/php-cgi.
void apply_flashpoint_root(ServerConfig& config, const fs::path& root);

/// Body cap applied while reading a request. With CGI enabled this is the
/// larger of max_request_body and cgi.max_body_size, so the CGI limit is the
/// one a script POST actually meets.
u64 request_body_limit(const ServerConfig& config);

/// Overlay settings from a JSON file onto config. Unknown keys are ignored;
/// keys with the wrong type, and negative sizes, fail with InvalidInput.
Result<void> load_config_file(const fs::path& path, ServerConfig& config);

/// Same as load_config_file, from an in-memory JSON document.
Result<void> apply_config_json(std::string_view json_text, ServerConfig& config);

} // namespace gzs
