#include <catch2/catch_test_macros.hpp>

#include "server/game_zip_server.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>
#include <variant>

using namespace gzs;
using namespace gzs::server;
using namespace gzs::test;
using json = nlohmann::json;

namespace {

struct ServerFixture {
    TempDir dir;
    ServerConfig config;
    vfs::ZipManager zips;

    ServerFixture() {
        config.games_dir = dir / "Games";
        fs::create_directories(config.games_dir);
        make_zip(config.games_dir / "game1.zip",
                 {
                     {"content/www.example.com/path/file.swf", "SWF-BYTES"},
                     {"content/www.example.com/index.html",
                      "<html><head><title>t</title></head><body></body></html>"},
                     {"content/www.example.com/data.bin", "bin"},
                 });
    }

    GameZipServer server() { return GameZipServer(config, zips); }
};

http::HttpRequest make_request(const std::string& method, const std::string& target,
                               const std::string& body = {}) {
    http::HttpRequest req;
    req.method = method;
    req.target = target;
    req.body = to_bytes(body);
    return req;
}

http::HttpResponse response_of(Dispatch dispatch) {
    REQUIRE(std::holds_alternative<http::HttpResponse>(dispatch));
    return std::get<http::HttpResponse>(std::move(dispatch));
}

std::string header(const http::HttpResponse& resp, const char* name) {
    return resp.headers.get(name).value_or("");
}

json body_json(const http::HttpResponse& resp) {
    return json::parse(to_string(resp.body));
}

std::string mount_body(const fs::path& zip) {
    return json{{"zipPath", zip.string()}}.dump();
}

} // namespace

// ====================================================================
// Mount management
// ====================================================================

TEST_CASE("Mount an archive from the games directory", "[server]") {
    ServerFixture fx;
    auto server = fx.server();
    auto zip = fx.config.games_dir / "game1.zip";

    auto resp = response_of(server.handle(make_request("POST", "/mount/game1", mount_body(zip))));
    CHECK(resp.status == 200);
    CHECK(header(resp, "Content-Type") == "application/json");
    auto body = body_json(resp);
    CHECK(body["success"] == true);
    CHECK(body["id"] == "game1");
    CHECK(body["zipPath"] == zip.string());
    CHECK(fx.zips.is_mounted("game1"));

    auto mounts = body_json(response_of(server.handle(make_request("GET", "/mounts"))));
    REQUIRE(mounts["mounts"].size() == 1);
    CHECK(mounts["mounts"][0]["id"] == "game1");
    CHECK(mounts["mounts"][0]["fileCount"] == 3);
    CHECK(mounts["mounts"][0]["mountTime"].get<std::string>().back() == 'Z');
}

TEST_CASE("Mount requests are validated", "[server]") {
    ServerFixture fx;
    auto server = fx.server();
    auto zip = fx.config.games_dir / "game1.zip";

    SECTION("outside the games directory") {
        auto outside = fx.dir / "elsewhere.zip";
        make_zip(outside, {{"a.txt", "a"}});
        auto resp = response_of(server.handle(make_request("POST", "/mount/x", mount_body(outside))));
        CHECK(resp.status == 403);
        CHECK(to_string(resp.body) == "Forbidden: ZIP file must be within games directory");

        auto climbing = fx.config.games_dir / ".." / "elsewhere.zip";
        resp = response_of(server.handle(make_request("POST", "/mount/x", mount_body(climbing))));
        CHECK(resp.status == 403);
        CHECK(fx.zips.mount_count() == 0);
    }
    SECTION("sibling directory sharing a prefix") {
        auto sibling = fx.dir / "Games-old" / "g.zip";
        make_zip(sibling, {{"a.txt", "a"}});
        auto resp = response_of(server.handle(make_request("POST", "/mount/x", mount_body(sibling))));
        CHECK(resp.status == 403);
    }
    SECTION("symlink leading out of the games directory") {
        auto outside = fx.dir / "outside.zip";
        make_zip(outside, {{"content/evil.com/a.txt", "a"}});
        auto link = fx.config.games_dir / "link.zip";
        fs::create_symlink(outside, link);

        auto resp = response_of(server.handle(make_request("POST", "/mount/x", mount_body(link))));
        CHECK(resp.status == 403);
        CHECK(to_string(resp.body) == "Forbidden: ZIP file must be within games directory");

        // Linked directory inside the games directory
        fs::create_directories(fx.dir / "elsewhere");
        make_zip(fx.dir / "elsewhere" / "g.zip", {{"a.txt", "a"}});
        fs::create_directory_symlink(fx.dir / "elsewhere", fx.config.games_dir / "linked");
        resp = response_of(server.handle(
            make_request("POST", "/mount/y", mount_body(fx.config.games_dir / "linked" / "g.zip"))));
        CHECK(resp.status == 403);
        CHECK(fx.zips.mount_count() == 0);
    }
    SECTION("bad mount id") {
        auto resp = response_of(server.handle(make_request("POST", "/mount/bad.id", mount_body(zip))));
        CHECK(resp.status == 400);
        CHECK(to_string(resp.body) == "Invalid game ID: Game ID contains invalid characters");

        resp = response_of(server.handle(make_request("POST", "/mount/", mount_body(zip))));
        CHECK(resp.status == 400);
        CHECK(to_string(resp.body) == "Missing mount ID");
    }
    SECTION("malformed body") {
        auto resp = response_of(server.handle(make_request("POST", "/mount/g", "{not json")));
        CHECK(resp.status == 400);
        CHECK(to_string(resp.body) == "Invalid JSON");

        resp = response_of(server.handle(make_request("POST", "/mount/g", "{\"other\":1}")));
        CHECK(resp.status == 400);
        CHECK(to_string(resp.body) == "Missing zipPath in request body");

        resp = response_of(server.handle(make_request("POST", "/mount/g", "{\"zipPath\":\"\"}")));
        CHECK(resp.status == 400);
    }
    SECTION("missing archive") {
        auto resp = response_of(server.handle(
            make_request("POST", "/mount/g", mount_body(fx.config.games_dir / "nope.zip"))));
        CHECK(resp.status == 500);
        CHECK(to_string(resp.body).find(fx.config.games_dir.string()) == std::string::npos);
    }
    SECTION("missing archive with download hints is not fetched") {
        json body = {
            {"zipPath", (fx.config.games_dir / "remote.zip").string()},
            {"gameId", "0a1b2c3d-0000-4000-8000-000000000000"},
            {"dateAdded", "2020-01-01T00:00:00.000Z"},
            {"sha256", std::string(64, 'a')},
        };
        auto resp = response_of(server.handle(make_request("POST", "/mount/remote", body.dump())));
        CHECK(resp.status == 500);
        CHECK_FALSE(fx.zips.is_mounted("remote"));
        CHECK_FALSE(fs::exists(fx.config.games_dir / "remote.zip"));
    }
}

TEST_CASE("Unmount reports whether anything was removed", "[server]") {
    ServerFixture fx;
    auto server = fx.server();
    REQUIRE(fx.zips.mount("game1", fx.config.games_dir / "game1.zip"));

    auto resp = response_of(server.handle(make_request("DELETE", "/mount/game1")));
    CHECK(resp.status == 200);
    CHECK(body_json(resp)["success"] == true);

    resp = response_of(server.handle(make_request("DELETE", "/mount/game1")));
    CHECK(resp.status == 404);
    CHECK(body_json(resp)["success"] == false);
    CHECK(body_json(resp)["id"] == "game1");
}

// ====================================================================
// File serving
// ====================================================================

TEST_CASE("Files are addressed by Host header or embedded URL", "[server]") {
    ServerFixture fx;
    auto server = fx.server();
    REQUIRE(fx.zips.mount("game1", fx.config.games_dir / "game1.zip"));

    auto by_host = make_request("GET", "/path/file.swf");
    by_host.headers.set("Host", "WWW.Example.com:22501");
    auto resp = response_of(server.handle(by_host));
    CHECK(resp.status == 200);
    CHECK(to_string(resp.body) == "SWF-BYTES");
    CHECK(header(resp, "Content-Type") == "application/x-shockwave-flash");
    CHECK(header(resp, "X-Source") == "gamezipserver:game1");
    CHECK(header(resp, "Cache-Control") == "public, max-age=86400");
    CHECK(header(resp, "Access-Control-Allow-Origin") == "*");

    resp = response_of(server.handle(make_request("GET", "/http://www.example.com/path/file.swf")));
    CHECK(resp.status == 200);

    resp = response_of(server.handle(make_request("GET", "http://www.example.com/path/file.swf?v=2")));
    CHECK(resp.status == 200);

    resp = response_of(server.handle(make_request("GET", "/http:/www.example.com/path/file.swf")));
    CHECK(resp.status == 200);

    resp = response_of(server.handle(make_request("GET", "/http://www.example.com/missing.swf")));
    CHECK(resp.status == 404);
    CHECK(to_string(resp.body) == "File not found in mounted ZIPs");
}

TEST_CASE("HEAD keeps headers and drops the body on the wire", "[server]") {
    ServerFixture fx;
    auto server = fx.server();
    REQUIRE(fx.zips.mount("game1", fx.config.games_dir / "game1.zip"));

    auto resp = response_of(server.handle(make_request("HEAD", "/http://www.example.com/data.bin")));
    CHECK(resp.status == 200);
    CHECK(resp.head_only);
    CHECK(header(resp, "Content-Type") == "application/octet-stream");
    auto wire = resp.serialize(true);
    CHECK(wire.find("Content-Length: 3\r\n") != std::string::npos);
    CHECK(wire.substr(wire.size() - 4) == "\r\n\r\n");
}

TEST_CASE("HTML responses carry the polyfills", "[server]") {
    ServerFixture fx;
    auto server = fx.server();
    REQUIRE(fx.zips.mount("game1", fx.config.games_dir / "game1.zip"));

    auto resp = response_of(server.handle(make_request("GET", "/http://www.example.com/index.html")));
    CHECK(resp.status == 200);
    CHECK(header(resp, "Content-Type") == "text/html");
    auto html = to_string(resp.body);
    CHECK(html.find("<head>\n<script>") != std::string::npos);
    CHECK(html.find("<title>t</title>") != std::string::npos);
}

TEST_CASE("Hostile targets are rejected", "[server]") {
    ServerFixture fx;
    auto server = fx.server();
    REQUIRE(fx.zips.mount("game1", fx.config.games_dir / "game1.zip"));

    auto resp = response_of(server.handle(make_request("GET", "/http://www.example.com/%2e%2e/%2e%2e/etc/passwd")));
    CHECK(resp.status == 400);
    CHECK(to_string(resp.body) == "Invalid URL path");

    resp = response_of(server.handle(make_request("GET", "/http://bad_host!/x")));
    CHECK(resp.status == 400);

    resp = response_of(server.handle(make_request("GET", "/http://www.example.com:abc/x")));
    CHECK(resp.status == 400);
    CHECK(to_string(resp.body) == "Bad Request: Invalid URL");

    // Plain ".." collapses inside the host and cannot reach another one
    resp = response_of(server.handle(make_request("GET", "/http://www.example.com/a/../path/file.swf")));
    CHECK(resp.status == 200);
}

// ====================================================================
// Misc routes
// ====================================================================

TEST_CASE("Health, preflight and unknown methods", "[server]") {
    ServerFixture fx;
    fx.config.service_name = "test-service";
    auto server = fx.server();

    auto health = response_of(server.handle(make_request("GET", "/health")));
    CHECK(health.status == 200);
    auto body = body_json(health);
    CHECK(body["status"] == "healthy");
    CHECK(body["service"] == "test-service");
    CHECK(body["timestamp"].is_string());

    auto options = response_of(server.handle(make_request("OPTIONS", "/anything")));
    CHECK(options.status == 204);
    CHECK(header(options, "Access-Control-Max-Age") == "86400");
    CHECK(header(options, "Access-Control-Allow-Methods") == "GET, POST, DELETE, OPTIONS");

    auto put = response_of(server.handle(make_request("PUT", "/x")));
    CHECK(put.status == 404);
    CHECK(to_string(put.body) == "Not Found");

    auto post = response_of(server.handle(make_request("POST", "/http://www.example.com/path/file.swf")));
    CHECK(post.status == 404);
}

TEST_CASE("CORS headers can be turned off", "[server]") {
    ServerFixture fx;
    fx.config.allow_cross_domain = false;
    auto server = fx.server();

    auto health = response_of(server.handle(make_request("GET", "/health")));
    CHECK_FALSE(health.headers.contains("Access-Control-Allow-Origin"));
    auto options = response_of(server.handle(make_request("OPTIONS", "/")));
    CHECK_FALSE(options.headers.contains("Access-Control-Max-Age"));
}

TEST_CASE("Timestamps are ISO 8601 UTC", "[server]") {
    auto epoch = std::chrono::system_clock::time_point{} + std::chrono::milliseconds(1500);
    CHECK(iso8601(epoch) == "1970-01-01T00:00:01.500Z");
}

// ====================================================================
// CGI dispatch
// ====================================================================

TEST_CASE("Scripts on disk are dispatched to CGI", "[server]") {
    ServerFixture fx;
    fx.config.enable_cgi = true;
    fx.config.cgi.document_root = fx.dir / "htdocs";
    fx.config.cgi.cgi_bin_path = fx.dir / "cgi-bin";
    write_script(fx.config.cgi.document_root / "www.example.com" / "game.php", "echo ''\n");
    auto server = fx.server();

    auto req = make_request("POST", "/game.php?level=3", "score=1");
    req.headers.set("Host", "www.example.com");
    req.remote_addr = "10.0.0.5";
    auto dispatch = server.handle(req);
    REQUIRE(std::holds_alternative<CgiDispatch>(dispatch));
    const auto& cgi = std::get<CgiDispatch>(dispatch);
    CHECK(cgi.script == fx.config.cgi.document_root / "www.example.com" / "game.php");
    CHECK(cgi.request.method == "POST");
    CHECK(cgi.request.url.hostname == "www.example.com");
    CHECK(cgi.request.url.query == "level=3");
    REQUIRE(cgi.request.body.has_value());
    CHECK(to_string(*cgi.request.body) == "score=1");
    CHECK(cgi.request.remote_addr == "10.0.0.5");

    // Not on disk: falls through to the archives
    auto missing = make_request("GET", "/http://www.example.com/other.php");
    auto resp = response_of(server.handle(missing));
    CHECK(resp.status == 404);
}

TEST_CASE("Script results become responses", "[server]") {
    ServerFixture fx;
    auto server = fx.server();
    auto req = make_request("GET", "/game.php");

    cgi::CgiResponse ok;
    ok.status_code = 201;
    ok.headers.set("Content-Type", "text/plain");
    ok.headers.set("Content-Length", "999");
    ok.body = to_bytes("done");
    auto resp = server.complete_cgi(req, ok);
    CHECK(resp.status == 201);
    CHECK(header(resp, "Content-Type") == "text/plain");
    CHECK_FALSE(resp.headers.contains("Content-Length"));
    CHECK(to_string(resp.body) == "done");

    auto timeout = server.complete_cgi(
        req, Error::execution(ExecutionFailure::Timeout, "CGI script execution timed out"));
    CHECK(timeout.status == 504);

    auto outside = server.complete_cgi(
        req, Error(ErrorKind::PathError, "CGI script path is not within allowed directories"));
    CHECK(outside.status == 403);
}

TEST_CASE("Client errors log below warning level", "[server]") {
    ServerFixture fx;
    auto server = fx.server();

    auto previous = spdlog::default_logger();
    auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(64);
    sink->set_pattern("%l %v");
    auto capture = std::make_shared<spdlog::logger>("capture", sink);
    capture->set_level(spdlog::level::trace);
    spdlog::set_default_logger(capture);

    auto missing = make_request("GET", "/nothing.txt");
    missing.headers.set("Host", "www.example.com");
    CHECK(response_of(server.handle(std::move(missing))).status == 404);
    CHECK(response_of(server.handle(make_request("PUT", "/anything"))).status == 404);
    CHECK(response_of(server.handle(
              make_request("POST", "/mount/g", mount_body(fx.config.games_dir / "nope.zip"))))
              .status == 500);

    spdlog::set_default_logger(previous);

    auto lines = sink->last_formatted();
    auto has = [&](const std::string& text) {
        for (const auto& line : lines) {
            if (line.rfind(text, 0) == 0) return true;
        }
        return false;
    };
    CHECK(has("debug [GameZipServer] Sending error 404"));
    CHECK_FALSE(has("warning [GameZipServer] Sending error 404"));
    CHECK(has("warning [GameZipServer] Sending error 500"));
}
