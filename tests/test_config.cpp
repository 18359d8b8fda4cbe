#include <catch2/catch_test_macros.hpp>

#include "core/config.hpp"
#include "core/error.hpp"
#include "core/log.hpp"
#include "test_support.hpp"

using namespace gzs;
using namespace gzs::test;

TEST_CASE("Flashpoint root layout", "[config]") {
    ServerConfig config;
    apply_flashpoint_root(config, "/fp");
    CHECK(config.games_dir == fs::path("/fp/Data/Games"));
    CHECK(config.cgi.document_root == fs::path("/fp/Legacy/htdocs"));
    CHECK(config.cgi.cgi_bin_path == fs::path("/fp/Legacy/cgi-bin"));
    CHECK(config.cgi.interpreter == fs::path("/fp/Legacy/php-cgi"));
}

TEST_CASE("Settings JSON overlays the defaults", "[config]") {
    ServerConfig config;
    auto result = apply_config_json(R"({
        "flashpointPath": "/fp",
        "gamesPath": "/custom/games",
        "port": 8080,
        "bindAddress": "127.0.0.1",
        "allowCrossDomain": false,
        "enableCGI": true,
        "cgiTimeout": 1500,
        "keepAliveTimeout": 5,
        "unknownKey": [1, 2, 3]
    })", config);
    REQUIRE(result);

    CHECK(config.port == 8080);
    CHECK(config.bind_address == "127.0.0.1");
    CHECK(config.games_dir == fs::path("/custom/games"));
    CHECK(config.cgi.document_root == fs::path("/fp/Legacy/htdocs"));
    CHECK_FALSE(config.allow_cross_domain);
    CHECK(config.enable_cgi);
    CHECK(config.cgi.timeout == std::chrono::milliseconds(1500));
    CHECK(config.keep_alive_timeout == std::chrono::seconds(5));
    CHECK(config.max_request_body == 1 * MiB);
}

TEST_CASE("Bad settings leave the config untouched", "[config]") {
    ServerConfig config;
    config.port = 1234;

    auto wrong_type = apply_config_json(R"({"bindAddress": "10.0.0.1", "port": "80"})", config);
    REQUIRE_FALSE(wrong_type);
    CHECK(wrong_type.error().is(ErrorKind::InvalidInput));
    CHECK(config.port == 1234);
    CHECK(config.bind_address == "0.0.0.0");

    auto out_of_range = apply_config_json(R"({"port": 70000})", config);
    REQUIRE_FALSE(out_of_range);
    CHECK(config.port == 1234);

    CHECK_FALSE(apply_config_json("{broken", config));
    CHECK_FALSE(apply_config_json("[1, 2]", config));
}

TEST_CASE("Negative sizes are rejected rather than wrapped", "[config]") {
    ServerConfig config;

    auto body = apply_config_json(R"({"maxRequestBodySize": -1})", config);
    REQUIRE_FALSE(body);
    CHECK(body.failed_with(ErrorKind::InvalidInput));
    CHECK(body.error().message == "Invalid settings value: maxRequestBodySize must not be negative");
    CHECK(config.max_request_body == 1 * MiB);

    CHECK(apply_config_json(R"({"cgiMaxResponseSize": -5})", config)
              .failed_with(ErrorKind::InvalidInput));
    CHECK(apply_config_json(R"({"corsMaxAge": -1})", config).failed_with(ErrorKind::InvalidInput));
    CHECK(apply_config_json(R"({"maxHeaderSize": -0.5})", config)
              .failed_with(ErrorKind::InvalidInput));
    CHECK(config.cgi.max_response_size == 50 * MiB);
    CHECK(config.cors_max_age == 86400);

    REQUIRE(apply_config_json(R"({"maxHeaderSize": 0, "cgiMaxBodySize": 2048})", config));
    CHECK(config.max_header_size == 0);
    CHECK(config.cgi.max_body_size == 2048);
}

TEST_CASE("CGI body cap governs the transport limit when CGI is on", "[config]") {
    ServerConfig config;
    CHECK(request_body_limit(config) == 1 * MiB);

    config.enable_cgi = true;
    CHECK(request_body_limit(config) == 10 * MiB);

    config.cgi.max_body_size = 512 * KiB;
    CHECK(request_body_limit(config) == 1 * MiB);

    config.enable_cgi = false;
    config.cgi.max_body_size = 64 * MiB;
    CHECK(request_body_limit(config) == 1 * MiB);
}

TEST_CASE("Settings files", "[config]") {
    TempDir dir;
    ServerConfig config;

    auto missing = load_config_file(dir / "nope.json", config);
    CHECK(missing.failed_with(ErrorKind::NotFound));

    write_file(dir / "settings.json", R"({"port": 9000, "logLevel": "debug"})");
    REQUIRE(load_config_file(dir / "settings.json", config));
    CHECK(config.port == 9000);
    CHECK(config.log_level == "debug");
}

TEST_CASE("Error kinds map to HTTP statuses", "[config]") {
    CHECK(http_status_for(Error(ErrorKind::InvalidInput, "x")) == 400);
    CHECK(http_status_for(Error(ErrorKind::PathError, "x")) == 403);
    CHECK(http_status_for(Error(ErrorKind::NotFound, "x")) == 404);
    CHECK(http_status_for(Error(ErrorKind::ResourceLimitExceeded, "x")) == 413);
    CHECK(http_status_for(Error(ErrorKind::MountError, "x")) == 500);
    CHECK(http_status_for(Error::execution(ExecutionFailure::Timeout, "x")) == 504);
    CHECK(http_status_for(Error::execution(ExecutionFailure::NonZeroExit, "x")) == 500);
}

TEST_CASE("Log file sink", "[config]") {
    TempDir dir;
    auto path = dir / "logs" / "server.log";
    log::init(path, "debug");
    spdlog::info("[Test] written to file");
    log::shutdown();

    CHECK(read_text(path).find("[Test] written to file") != std::string::npos);
    log::init();
}
