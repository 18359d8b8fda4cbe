#pragma once

#include "cgi/cgi_executor.hpp"
#include "core/config.hpp"
#include "core/result.hpp"
#include "http/request_parser.hpp"
#include "server/request_handler.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace gzs::server {

/// Single-threaded HTTP/1.1 server. One poll() loop multiplexes the
/// listening socket, every client connection and the pipes of every
/// running CGI child. Requests on one connection are answered strictly in
/// order; while a script runs, that connection reads nothing further.
class HttpServer {
public:
    using Clock = std::chrono::steady_clock;

    /// cgi may be null when script execution is disabled.
    HttpServer(const ServerConfig& config, RequestHandler& handler,
               cgi::CgiExecutor* cgi);
    ~HttpServer();

    // Non-copyable
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bind and listen. Returns the bound port (useful with port 0).
    Result<u16> listen();

    /// Serve until request_stop(), then drain and return.
    void run();

    /// Begin graceful shutdown. Async-signal-safe.
    void request_stop();

    size_t connection_count() const { return connections_.size(); }

private:
    struct Connection {
        int fd = -1;
        std::string remote_addr;
        http::RequestParser parser;
        std::string write_buf;
        size_t write_offset = 0;
        bool close_after_write = false;
        bool closed = false;
        Clock::time_point last_activity;
        std::optional<Clock::time_point> request_started;

        // In-flight script for the request at the head of the queue
        std::unique_ptr<cgi::CgiProcess> cgi;
        http::HttpRequest cgi_request;
        bool cgi_keep_alive = false;

        Connection(int fd_, u64 max_header, u64 max_body)
            : fd(fd_), parser(max_header, max_body) {}
    };

    enum class Role { Wake, Listen, Client, CgiStdin, CgiStdout, CgiStderr };
    struct PollTarget {
        Role role;
        int conn_fd;
    };

    void accept_connections();
    void on_readable(Connection& conn);
    void process_requests(Connection& conn);
    void start_cgi(Connection& conn, http::HttpRequest request, CgiDispatch dispatch,
                   bool keep_alive);
    void check_cgi(Connection& conn, Clock::time_point now);
    void queue_response(Connection& conn, const http::HttpResponse& resp, bool keep_alive);
    void flush(Connection& conn);
    void sweep(Clock::time_point now);
    bool idle(const Connection& conn) const;
    void remove_closed();
    void drain_wake_pipe();

    const ServerConfig& config_;
    RequestHandler& handler_;
    cgi::CgiExecutor* cgi_;

    int listen_fd_ = -1;
    int wake_fds_[2] = {-1, -1};
    std::atomic<bool> stop_requested_{false};
    bool stopping_ = false;
    Clock::time_point drain_deadline_;

    std::unordered_map<int, std::unique_ptr<Connection>> connections_;
};

} // namespace gzs::server
