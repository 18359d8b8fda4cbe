#include <catch2/catch_test_macros.hpp>

#include "server/game_zip_server.hpp"
#include "server/http_server.hpp"
#include "test_support.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <stdexcept>
#include <thread>

using namespace gzs;
using namespace gzs::server;
using namespace gzs::test;

namespace {

/// Blocking loopback client with a receive timeout.
class Client {
public:
    explicit Client(u16 port) {
        fd_ = socket(AF_INET, SOCK_STREAM, 0);
        if (fd_ < 0) throw std::runtime_error("socket failed");
        timeval tv{5, 0};
        setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        if (connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
            close(fd_);
            throw std::runtime_error("connect failed");
        }
    }
    ~Client() { close(fd_); }

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    void send_all(const std::string& data) {
        size_t sent = 0;
        while (sent < data.size()) {
            ssize_t n = send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) throw std::runtime_error("send failed");
            sent += static_cast<size_t>(n);
        }
    }

    /// One full response (headers plus Content-Length body unless head_only),
    /// or what was received before EOF or timeout.
    std::string read_response(bool head_only = false) {
        while (true) {
            auto header_end = buffer_.find("\r\n\r\n");
            if (header_end != std::string::npos) {
                size_t length = 0;
                auto cl = buffer_.find("Content-Length: ");
                if (!head_only && cl != std::string::npos && cl < header_end) {
                    length = std::stoul(buffer_.substr(cl + 16));
                }
                size_t total = header_end + 4 + length;
                if (buffer_.size() >= total) {
                    auto out = buffer_.substr(0, total);
                    buffer_.erase(0, total);
                    return out;
                }
            }
            if (!fill()) {
                auto out = std::move(buffer_);
                buffer_.clear();
                return out;
            }
        }
    }

    /// True once the server has closed its side.
    bool at_eof() {
        return buffer_.empty() && !fill();
    }

private:
    bool fill() {
        char buf[4096];
        ssize_t n = recv(fd_, buf, sizeof(buf), 0);
        if (n <= 0) return false;
        buffer_.append(buf, static_cast<size_t>(n));
        return true;
    }

    int fd_ = -1;
    std::string buffer_;
};

struct RunningServer {
    TempDir dir;
    ServerConfig config;
    vfs::ZipManager zips;
    std::unique_ptr<cgi::CgiExecutor> executor;
    std::unique_ptr<GameZipServer> handler;
    std::unique_ptr<HttpServer> server;
    std::thread thread;
    u16 port = 0;

    explicit RunningServer(bool with_cgi = false) {
        config.bind_address = "127.0.0.1";
        config.port = 0;
        config.games_dir = dir / "Games";
        config.max_header_size = 512;
        config.max_request_body = 64;
        config.shutdown_drain = std::chrono::seconds(2);
        make_zip(config.games_dir / "g.zip", {{"content/h.com/a.txt", "hello"}});

        if (with_cgi) {
            config.enable_cgi = true;
            config.cgi.interpreter = "/bin/sh";
            config.cgi.document_root = dir / "htdocs";
            config.cgi.cgi_bin_path = dir / "cgi-bin";
            write_script(config.cgi.document_root / "h.com" / "run.php",
                         "echo 'Content-Type: text/plain'\n"
                         "echo ''\n"
                         "echo \"cgi $REQUEST_METHOD\"\n");
            executor = std::make_unique<cgi::CgiExecutor>(config.cgi);
        }
    }

    void start() {
        handler = std::make_unique<GameZipServer>(config, zips);
        server = std::make_unique<HttpServer>(config, *handler, executor.get());
        auto bound = server->listen();
        REQUIRE(bound);
        port = bound.value();
        thread = std::thread([this] { server->run(); });
    }

    ~RunningServer() {
        if (thread.joinable()) {
            server->request_stop();
            thread.join();
        }
    }
};

} // namespace

TEST_CASE("Health check over a socket", "[server]") {
    RunningServer rs;
    rs.start();

    Client client(rs.port);
    client.send_all("GET /health HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n\r\n");
    auto resp = client.read_response();
    CHECK(resp.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    CHECK(resp.find("Content-Type: application/json") != std::string::npos);
    CHECK(resp.find("\"status\":\"healthy\"") != std::string::npos);
    CHECK(resp.find("Connection: close") != std::string::npos);
    CHECK(client.at_eof());
}

TEST_CASE("Keep-alive and pipelined requests", "[server]") {
    RunningServer rs;
    REQUIRE(rs.zips.mount("g", rs.config.games_dir / "g.zip"));
    rs.start();

    Client client(rs.port);
    client.send_all("GET /a.txt HTTP/1.1\r\nHost: h.com\r\n\r\n"
                    "GET /missing.txt HTTP/1.1\r\nHost: h.com\r\n\r\n");
    auto first = client.read_response();
    auto second = client.read_response();
    CHECK(first.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    CHECK(first.find("Connection: keep-alive") != std::string::npos);
    CHECK(first.substr(first.size() - 5) == "hello");
    CHECK(second.rfind("HTTP/1.1 404 Not Found\r\n", 0) == 0);

    client.send_all("HEAD /a.txt HTTP/1.1\r\nHost: h.com\r\n\r\n");
    auto head = client.read_response(true);
    CHECK(head.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    CHECK(head.find("Content-Length: 5\r\n") != std::string::npos);
}

TEST_CASE("Transport errors close the connection", "[server]") {
    RunningServer rs;
    rs.start();

    SECTION("header section too large") {
        Client client(rs.port);
        client.send_all("GET / HTTP/1.1\r\nX-Filler: " + std::string(600, 'a'));
        auto resp = client.read_response();
        CHECK(resp.rfind("HTTP/1.1 431 ", 0) == 0);
        CHECK(client.at_eof());
    }
    SECTION("body too large") {
        Client client(rs.port);
        client.send_all("POST /mount/g HTTP/1.1\r\nContent-Length: 100\r\n\r\n");
        auto resp = client.read_response();
        CHECK(resp.rfind("HTTP/1.1 413 ", 0) == 0);
        CHECK(client.at_eof());
    }
    SECTION("garbage") {
        Client client(rs.port);
        client.send_all("NOT-HTTP\r\n\r\n");
        auto resp = client.read_response();
        CHECK(resp.rfind("HTTP/1.1 400 ", 0) == 0);
        CHECK(client.at_eof());
    }
}

TEST_CASE("Scripts run inside the event loop", "[server]") {
    RunningServer rs(true);
    rs.start();

    Client client(rs.port);
    client.send_all("GET /run.php HTTP/1.1\r\nHost: h.com\r\n\r\n"
                    "GET /health HTTP/1.1\r\nHost: h.com\r\n\r\n");
    auto script = client.read_response();
    auto health = client.read_response();
    CHECK(script.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    CHECK(script.find("Content-Type: text/plain") != std::string::npos);
    CHECK(script.substr(script.size() - 8) == "cgi GET\n");
    CHECK(health.find("\"status\":\"healthy\"") != std::string::npos);
}

TEST_CASE("Script POST bodies follow the CGI size cap", "[server]") {
    RunningServer rs(true);
    rs.start();

    // Larger than max_request_body, well under cgi.max_body_size
    Client client(rs.port);
    client.send_all("POST /run.php HTTP/1.1\r\nHost: h.com\r\nContent-Length: 100\r\n\r\n" +
                    std::string(100, 'p'));
    auto resp = client.read_response();
    CHECK(resp.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    CHECK(resp.substr(resp.size() - 9) == "cgi POST\n");
}

TEST_CASE("Stop request ends the loop", "[server]") {
    RunningServer rs;
    rs.start();

    Client idle(rs.port);
    idle.send_all("GET /health HTTP/1.1\r\n\r\n");
    CHECK(idle.read_response().rfind("HTTP/1.1 200", 0) == 0);

    rs.server->request_stop();
    rs.thread.join();
    CHECK(idle.at_eof());
}
