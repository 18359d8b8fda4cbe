#include "server/game_zip_server.hpp"

#include "http/html_injector.hpp"
#include "http/mime_types.hpp"
#include "security/path_security.hpp"
#include "security/validation.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace gzs::server {

using json = nlohmann::json;

namespace {

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.substr(0, prefix.size()) == prefix;
}

/// "/mount/abc?x" -> "abc"
std::string_view mount_id_of(std::string_view target) {
    auto id = target.substr(std::string_view("/mount/").size());
    return id.substr(0, id.find('?'));
}

} // namespace

std::string iso8601(std::chrono::system_clock::time_point tp) {
    auto secs = std::chrono::system_clock::to_time_t(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      tp.time_since_epoch()).count() % 1000;
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(millis));
    return out;
}

GameZipServer::GameZipServer(ServerConfig config, vfs::ZipManager& zips)
    : config_(std::move(config)), zips_(zips) {}

void GameZipServer::apply_cors(http::HttpResponse& resp) const {
    if (!config_.allow_cross_domain) return;
    resp.headers.set("Access-Control-Allow-Origin", "*");
    resp.headers.set("Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS");
    resp.headers.set("Access-Control-Allow-Headers", "*");
}

http::HttpResponse GameZipServer::error_response(int status, std::string_view message) {
    // Client mistakes are routine; only server-side failures are warnings
    if (status >= 500) {
        spdlog::warn("[GameZipServer] Sending error {}: {}", status, message);
    } else {
        spdlog::debug("[GameZipServer] Sending error {}: {}", status, message);
    }
    auto resp = http::HttpResponse::text(status, message);
    apply_cors(resp);
    return resp;
}

http::HttpResponse GameZipServer::json_response(int status, const std::string& body) {
    auto resp = http::HttpResponse::text(status, body, "application/json");
    apply_cors(resp);
    return resp;
}

Dispatch GameZipServer::handle(const http::HttpRequest& request) {
    spdlog::info("[GameZipServer] {} {}", request.method, request.target);
    try {
        return route(request);
    } catch (const std::exception& e) {
        spdlog::error("[GameZipServer] Unhandled error: {}", e.what());
        return error_response(500, "Internal Server Error");
    }
}

Dispatch GameZipServer::route(const http::HttpRequest& request) {
    const auto& method = request.method;
    const auto& target = request.target;

    if (method == "GET" && target == "/health") {
        return handle_health();
    }
    if (method == "OPTIONS") {
        return handle_options();
    }
    if (method == "POST" && starts_with(target, "/mount/")) {
        return handle_mount(mount_id_of(target), request);
    }
    if (method == "DELETE" && starts_with(target, "/mount/")) {
        return handle_unmount(mount_id_of(target));
    }
    if (method == "GET" && target == "/mounts") {
        return handle_list_mounts();
    }
    if (method == "GET" || method == "HEAD" || method == "POST") {
        return handle_file(request);
    }
    return error_response(404, "Not Found");
}

http::HttpResponse GameZipServer::handle_options() {
    http::HttpResponse resp;
    resp.status = 204;
    apply_cors(resp);
    if (config_.allow_cross_domain) {
        resp.headers.set("Access-Control-Max-Age", std::to_string(config_.cors_max_age));
    }
    return resp;
}

http::HttpResponse GameZipServer::handle_health() {
    json body = {
        {"status", "healthy"},
        {"service", config_.service_name},
        {"timestamp", iso8601(std::chrono::system_clock::now())},
    };
    return json_response(200, body.dump());
}

http::HttpResponse GameZipServer::handle_mount(std::string_view raw_id,
                                               const http::HttpRequest& request) {
    if (raw_id.empty()) {
        return error_response(400, "Missing mount ID");
    }
    auto id = security::validate_game_id(raw_id);
    if (!id) {
        spdlog::warn("[Security] Invalid mount ID detected");
        return error_response(400, id.error().message);
    }

    auto body = json::parse(request.body.begin(), request.body.end(), nullptr, false);
    if (body.is_discarded()) {
        return error_response(400, "Invalid JSON");
    }
    auto zip_it = body.is_object() ? body.find("zipPath") : body.end();
    if (!body.is_object() || zip_it == body.end() || !zip_it->is_string() ||
        zip_it->get_ref<const std::string&>().empty()) {
        return error_response(400, "Missing zipPath in request body");
    }
    const auto& zip_path_text = zip_it->get_ref<const std::string&>();
    fs::path zip_path(zip_path_text);

    // Lexical check first, then again with symlinks resolved
    std::error_code ec;
    auto lexical_games = fs::absolute(config_.games_dir, ec).lexically_normal();
    auto lexical_zip = fs::absolute(zip_path, ec).lexically_normal();
    if (ec || config_.games_dir.empty() ||
        !security::is_within_directory(lexical_games, lexical_zip)) {
        spdlog::warn("[Security] ZIP path outside allowed directory: {}", zip_path_text);
        return error_response(403, "Forbidden: ZIP file must be within games directory");
    }

    auto real_games = fs::weakly_canonical(config_.games_dir, ec);
    auto real_zip = ec ? fs::path{} : fs::weakly_canonical(zip_path, ec);
    if (ec || !security::is_within_directory(real_games, real_zip)) {
        spdlog::warn("[Security] ZIP path resolves outside allowed directory: {}",
                     zip_path_text);
        return error_response(403, "Forbidden: ZIP file must be within games directory");
    }

    auto mounted = zips_.mount(id.value(), real_zip);
    if (!mounted) {
        spdlog::error("[GameZipServer] Mount failed: {}", mounted.error().message);
        return error_response(http_status_for(mounted.error()),
                              security::sanitize_error_message(mounted.error().message));
    }

    json out = {{"success", true}, {"id", id.value()}, {"zipPath", zip_path_text}};
    return json_response(200, out.dump());
}

http::HttpResponse GameZipServer::handle_unmount(std::string_view raw_id) {
    if (raw_id.empty()) {
        return error_response(400, "Missing mount ID");
    }
    auto id = security::validate_game_id(raw_id);
    if (!id) {
        spdlog::warn("[Security] Invalid mount ID detected");
        return error_response(400, id.error().message);
    }

    bool success = zips_.unmount(id.value());
    json out = {{"success", success}, {"id", id.value()}};
    return json_response(success ? 200 : 404, out.dump());
}

http::HttpResponse GameZipServer::handle_list_mounts() {
    json mounts = json::array();
    for (const auto& info : zips_.list_mounts()) {
        mounts.push_back({
            {"id", info.id},
            {"zipPath", info.zip_path.string()},
            {"mountTime", iso8601(info.mount_time)},
            {"fileCount", info.file_count},
        });
    }
    json out = {{"mounts", std::move(mounts)}};
    return json_response(200, out.dump());
}

Result<http::Url> GameZipServer::resolve_target(const http::HttpRequest& request) const {
    std::string_view target = request.target;

    if (starts_with(target, "http://") || starts_with(target, "https://")) {
        // Proxy style: GET http://domain.com/path HTTP/1.1
        return http::parse_absolute_url(target);
    }
    if (starts_with(target, "/http://") || starts_with(target, "/https://")) {
        return http::parse_absolute_url(target.substr(1));
    }
    // "/http:/host/path": a proxy or client collapsed the double slash
    if (starts_with(target, "/http:/") || starts_with(target, "/https:/")) {
        auto colon = target.find(':');
        std::string repaired(target.substr(1, colon));
        repaired += "//";
        repaired.append(target.substr(colon + 2));
        return http::parse_absolute_url(repaired);
    }

    auto url = http::split_target(target);
    auto host = request.headers.get("Host");
    url.hostname = host && !host->empty() ? http::strip_port(*host) : "localhost";
    for (auto& c : url.hostname) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return url;
}

std::optional<fs::path> GameZipServer::find_script(const std::string& host,
                                                   const std::string& rel_path) const {
    for (const auto* root : {&config_.cgi.document_root, &config_.cgi.cgi_bin_path}) {
        if (root->empty()) continue;
        auto candidate = *root / host / rel_path;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}

Dispatch GameZipServer::handle_file(const http::HttpRequest& request) {
    auto url = resolve_target(request);
    if (!url) {
        return error_response(400, "Bad Request: Invalid URL");
    }

    auto hostname = security::validate_hostname(url.value().hostname);
    if (!hostname) {
        spdlog::error("[GameZipServer] Invalid hostname: {}", url.value().hostname);
        return error_response(400, hostname.error().message);
    }

    auto sanitized = security::sanitize_url_path(url.value().path);
    if (!sanitized) {
        spdlog::error("[GameZipServer] Invalid URL path: {}", url.value().path);
        return error_response(400, "Invalid URL path");
    }
    // sanitize_url_path already rejected malformed escapes
    auto decoded = security::percent_decode(sanitized.value()).value_or("");
    auto path = http::normalize_path(decoded);
    auto rel_path = hostname.value() + "/" + path;
    auto ext = http::file_extension(path);

    if (config_.enable_cgi && http::is_script_extension(ext)) {
        if (auto script = find_script(hostname.value(), path)) {
            CgiDispatch dispatch;
            dispatch.script = std::move(*script);
            dispatch.request.method = request.method;
            dispatch.request.url = url.value();
            dispatch.request.url.hostname = hostname.value();
            dispatch.request.headers = request.headers;
            if (!request.body.empty()) {
                dispatch.request.body = request.body;
            }
            if (!request.remote_addr.empty()) {
                dispatch.request.remote_addr = request.remote_addr;
            }
            return dispatch;
        }
    }

    if (request.method == "POST") {
        return error_response(404, "Not Found");
    }

    spdlog::info("[GameZipServer] Looking for: {}", rel_path);
    auto found = zips_.find_file(rel_path);
    if (!found) {
        spdlog::debug("[GameZipServer] File not found in any mounted ZIP: {}", rel_path);
        return error_response(404, "File not found in mounted ZIPs");
    }

    http::HttpResponse resp;
    resp.status = 200;
    resp.head_only = request.method == "HEAD";
    apply_cors(resp);

    if (ext == "html" || ext == "htm") {
        auto html = http::inject_polyfills(
            std::string_view(found->data.data(), found->data.size()));
        resp.body.assign(html.begin(), html.end());
        spdlog::debug("[GameZipServer] Injected polyfills into HTML file: {}", rel_path);
    } else {
        resp.body = std::move(found->data);
    }

    resp.headers.set("Content-Type", http::mime_type_for_extension(ext));
    resp.headers.set("Cache-Control", "public, max-age=86400");
    resp.headers.set("X-Source", "gamezipserver:" + found->mount_id);

    spdlog::info("[GameZipServer] Serving from ZIP {}: {} ({} bytes)",
                 found->mount_id, rel_path, resp.body.size());
    return resp;
}

http::HttpResponse GameZipServer::complete_cgi(const http::HttpRequest& request,
                                               const Result<cgi::CgiResponse>& result) {
    if (!result) {
        const auto& err = result.error();
        spdlog::error("[CGI] {} ({})", err.message, to_string(err.kind));
        return error_response(http_status_for(err),
                              security::sanitize_error_message(err.message));
    }

    const auto& cgi_resp = result.value();
    http::HttpResponse resp;
    resp.status = cgi_resp.status_code;
    resp.body = cgi_resp.body;
    resp.head_only = request.method == "HEAD";
    for (const auto& [name, value] : cgi_resp.headers) {
        // Framing is decided by the server
        if (http::iequals(name, "Connection") || http::iequals(name, "Content-Length") ||
            http::iequals(name, "Transfer-Encoding")) {
            continue;
        }
        resp.headers.add(name, value);
    }
    apply_cors(resp);
    return resp;
}

} // namespace gzs::server
