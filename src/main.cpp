#include "cgi/cgi_executor.hpp"
#include "core/config.hpp"
#include "core/log.hpp"
#include "core/types.hpp"
#include "server/game_zip_server.hpp"
#include "server/http_server.hpp"
#include "vfs/zip_manager.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>

static std::atomic<gzs::server::HttpServer*> g_server{nullptr};

static void on_signal(int) {
    if (auto* server = g_server.load()) {
        server->request_stop();
    }
}

static void print_usage() {
    std::cout << "GameZipServer v1.0.0\n"
              << "Serves legacy web game content from mounted ZIP archives\n\n"
              << "Usage:\n"
              << "  gamezipserver [options]\n\n"
              << "Options:\n"
              << "  --flashpoint <path>  Flashpoint root (derives Data/Games, Legacy/*)\n"
              << "  --config <file>      JSON settings file\n"
              << "  --games-dir <path>   Directory archives must be mounted from\n"
              << "  --port <n>           Listen port (default: 22501)\n"
              << "  --bind <addr>        Listen address (default: 0.0.0.0)\n"
              << "  --no-cors            Do not send CORS headers\n"
              << "  --enable-cgi         Execute PHP scripts from htdocs / cgi-bin\n"
              << "  --php-cgi <path>     CGI interpreter binary\n"
              << "  --htdocs <path>      Legacy htdocs directory\n"
              << "  --cgi-bin <path>     Legacy cgi-bin directory\n"
              << "  --log-file <path>    Also log to this file\n"
              << "  --log-level <level>  trace, debug, info, warn, error (default: info)\n"
              << "  --help               Show this help message\n";
}

static gzs::Result<gzs::u16> parse_port(const char* text) {
    char* end = nullptr;
    long val = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || val < 0 || val > 65535) {
        return gzs::Error(gzs::ErrorKind::InvalidInput,
                          std::string("Invalid --port value: ") + text);
    }
    return static_cast<gzs::u16>(val);
}

/// Defaults, then FLASHPOINT_PATH / FLASHPOINT_GAMES_PATH, then
/// --flashpoint, then --config, then the remaining flags.
static gzs::Result<void> parse_args(int argc, char* argv[], gzs::ServerConfig& config) {
    if (const char* root = std::getenv("FLASHPOINT_PATH")) {
        gzs::apply_flashpoint_root(config, root);
    }
    if (const char* games = std::getenv("FLASHPOINT_GAMES_PATH")) {
        config.games_dir = games;
    }

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--flashpoint") == 0 && i + 1 < argc) {
            gzs::apply_flashpoint_root(config, argv[++i]);
        }
    }
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            auto loaded = gzs::load_config_file(argv[++i], config);
            if (!loaded) return loaded;
        }
    }

    for (int i = 1; i < argc; i++) {
        if ((std::strcmp(argv[i], "--flashpoint") == 0 ||
             std::strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            ++i;
        } else if (std::strcmp(argv[i], "--games-dir") == 0 && i + 1 < argc) {
            config.games_dir = argv[++i];
        } else if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            auto port = parse_port(argv[++i]);
            if (!port) return port.error();
            config.port = port.value();
        } else if (std::strcmp(argv[i], "--bind") == 0 && i + 1 < argc) {
            config.bind_address = argv[++i];
        } else if (std::strcmp(argv[i], "--no-cors") == 0) {
            config.allow_cross_domain = false;
        } else if (std::strcmp(argv[i], "--enable-cgi") == 0) {
            config.enable_cgi = true;
        } else if (std::strcmp(argv[i], "--php-cgi") == 0 && i + 1 < argc) {
            config.cgi.interpreter = argv[++i];
        } else if (std::strcmp(argv[i], "--htdocs") == 0 && i + 1 < argc) {
            config.cgi.document_root = argv[++i];
        } else if (std::strcmp(argv[i], "--cgi-bin") == 0 && i + 1 < argc) {
            config.cgi.cgi_bin_path = argv[++i];
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            config.log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
            config.log_level = argv[++i];
        } else if (std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            std::exit(0);
        } else {
            return gzs::Error(gzs::ErrorKind::InvalidInput,
                              std::string("Unknown option: ") + argv[i]);
        }
    }
    return {};
}

int main(int argc, char* argv[]) {
    gzs::log::init();

    gzs::ServerConfig config;
    auto parsed = parse_args(argc, argv, config);
    if (!parsed) {
        spdlog::error("{}", parsed.error().message);
        print_usage();
        return 1;
    }

    if (!config.log_file.empty() || config.log_level != "info") {
        try {
            gzs::log::init(config.log_file, config.log_level);
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::error("Cannot open log file {}: {}", config.log_file.string(), e.what());
            return 1;
        }
    }

    if (config.games_dir.empty()) {
        spdlog::warn("No games directory configured; every mount will be refused. "
                     "Use --flashpoint or --games-dir.");
    } else {
        spdlog::info("Games dir: {}", config.games_dir.string());
    }

    gzs::vfs::ZipManager zips(config.max_buffered_file_size);

    std::unique_ptr<gzs::cgi::CgiExecutor> cgi;
    if (config.enable_cgi) {
        cgi = std::make_unique<gzs::cgi::CgiExecutor>(config.cgi);
        if (!cgi->validate_binary()) {
            spdlog::warn("[CGI] CGI execution disabled");
            config.enable_cgi = false;
            cgi.reset();
        } else {
            spdlog::info("[CGI] htdocs:  {}", config.cgi.document_root.string());
            spdlog::info("[CGI] cgi-bin: {}", config.cgi.cgi_bin_path.string());
        }
    }

    gzs::server::GameZipServer app(config, zips);
    gzs::server::HttpServer server(config, app, cgi.get());

    auto port = server.listen();
    if (!port) {
        spdlog::error("[GameZipServer] Failed to start: {}", port.error().message);
        return 1;
    }

    g_server = &server;
    struct sigaction sa {};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    spdlog::info("[GameZipServer] GameZip Server started on port {}", port.value());
    server.run();
    g_server = nullptr;

    zips.unmount_all();
    gzs::log::shutdown();
    return 0;
}
