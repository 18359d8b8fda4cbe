#pragma once

#include "core/config.hpp"
#include "server/request_handler.hpp"
#include "vfs/zip_manager.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace gzs::server {

/// HTTP face of the archive registry:
///
///   OPTIONS *          CORS preflight (204)
///   POST   /mount/:id  {"zipPath": "..."} mounts an archive under id
///   DELETE /mount/:id  unmounts it
///   GET    /mounts     lists active mounts
///   GET    /health     liveness probe
///   GET|HEAD /*        file from the mounted archives, addressed as
///                      "http://host/path", "/http://host/path", or a plain
///                      path plus the Host header
///
/// With CGI enabled, script extensions found under the legacy htdocs or
/// cgi-bin trees on disk are dispatched to the interpreter instead
/// (GET, HEAD and POST).
class GameZipServer : public RequestHandler {
public:
    GameZipServer(ServerConfig config, vfs::ZipManager& zips);

    Dispatch handle(const http::HttpRequest& request) override;
    http::HttpResponse complete_cgi(const http::HttpRequest& request,
                                    const Result<cgi::CgiResponse>& result) override;
    http::HttpResponse error_response(int status, std::string_view message) override;

    /// Where a request-target points: hostname plus parsed path and query.
    /// Exposed for tests.
    Result<http::Url> resolve_target(const http::HttpRequest& request) const;

private:
    Dispatch route(const http::HttpRequest& request);

    http::HttpResponse handle_options();
    http::HttpResponse handle_health();
    http::HttpResponse handle_mount(std::string_view id, const http::HttpRequest& request);
    http::HttpResponse handle_unmount(std::string_view id);
    http::HttpResponse handle_list_mounts();
    Dispatch handle_file(const http::HttpRequest& request);

    /// Script on disk under htdocs, then cgi-bin: <root>/<host>/<path>.
    std::optional<fs::path> find_script(const std::string& host,
                                        const std::string& rel_path) const;

    http::HttpResponse json_response(int status, const std::string& body);
    void apply_cors(http::HttpResponse& resp) const;

    ServerConfig config_;
    vfs::ZipManager& zips_;
};

/// "2024-05-01T12:00:00.000Z"
std::string iso8601(std::chrono::system_clock::time_point tp);

} // namespace gzs::server
