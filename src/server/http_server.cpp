#include "server/http_server.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

namespace gzs::server {

namespace {

constexpr size_t kRecvChunk = 16 * KiB;
constexpr int kPollSliceMs = 1000; // Upper bound between timeout sweeps

Error socket_error(const char* what) {
    return Error(ErrorKind::Internal, std::string(what) + ": " + std::strerror(errno));
}

} // namespace

HttpServer::HttpServer(const ServerConfig& config, RequestHandler& handler,
                       cgi::CgiExecutor* cgi)
    : config_(config), handler_(handler), cgi_(cgi) {}

HttpServer::~HttpServer() {
    for (auto& [fd, conn] : connections_) {
        ::close(fd);
    }
    connections_.clear();
    if (listen_fd_ >= 0) ::close(listen_fd_);
    for (int fd : wake_fds_) {
        if (fd >= 0) ::close(fd);
    }
}

Result<u16> HttpServer::listen() {
    if (wake_fds_[0] < 0 && pipe2(wake_fds_, O_CLOEXEC | O_NONBLOCK) == -1) {
        return socket_error("pipe2");
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.port);
    if (inet_pton(AF_INET, config_.bind_address.c_str(), &addr.sin_addr) != 1) {
        return Error(ErrorKind::InvalidInput,
                     "Invalid bind address: " + config_.bind_address);
    }

    int fd = socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd == -1) {
        return socket_error("socket");
    }
    int yes = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) == -1) {
        auto err = socket_error("setsockopt");
        ::close(fd);
        return err;
    }
    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == -1) {
        auto err = errno == EADDRINUSE
                       ? Error(ErrorKind::Internal,
                               "Port " + std::to_string(config_.port) + " is already in use")
                       : socket_error("bind");
        ::close(fd);
        return err;
    }
    if (::listen(fd, SOMAXCONN) == -1) {
        auto err = socket_error("listen");
        ::close(fd);
        return err;
    }

    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == -1) {
        auto err = socket_error("getsockname");
        ::close(fd);
        return err;
    }

    listen_fd_ = fd;
    u16 port = ntohs(addr.sin_port);
    spdlog::info("[GameZipServer] Listening on {}:{}", config_.bind_address, port);
    return port;
}

void HttpServer::request_stop() {
    stop_requested_.store(true);
    if (wake_fds_[1] >= 0) {
        // A full pipe already guarantees a wakeup
        ssize_t ignored = ::write(wake_fds_[1], "x", 1);
        (void)ignored;
    }
}

void HttpServer::drain_wake_pipe() {
    char buf[64];
    while (::read(wake_fds_[0], buf, sizeof(buf)) > 0) {
    }
}

void HttpServer::run() {
    if (listen_fd_ < 0) {
        spdlog::error("[HttpServer] run() called before listen()");
        return;
    }

    std::vector<pollfd> fds;
    std::vector<PollTarget> targets;

    while (true) {
        auto now = Clock::now();

        if (stop_requested_.load() && !stopping_) {
            stopping_ = true;
            drain_deadline_ = now + config_.shutdown_drain;
            ::close(listen_fd_);
            listen_fd_ = -1;
            spdlog::info("[HttpServer] Stopping, draining {} connection(s)",
                         connections_.size());
        }
        if (stopping_) {
            for (auto& [fd, conn] : connections_) {
                if (idle(*conn)) conn->closed = true;
            }
            remove_closed();
            if (connections_.empty()) break;
            if (now >= drain_deadline_) {
                spdlog::warn("[HttpServer] Drain period over, closing {} connection(s)",
                             connections_.size());
                break;
            }
        }

        fds.clear();
        targets.clear();
        auto watch = [&](int fd, short events, Role role, int conn_fd) {
            fds.push_back({fd, events, 0});
            targets.push_back({role, conn_fd});
        };

        watch(wake_fds_[0], POLLIN, Role::Wake, -1);
        if (listen_fd_ >= 0) {
            watch(listen_fd_, POLLIN, Role::Listen, -1);
        }

        int timeout_ms = kPollSliceMs;
        for (auto& [fd, conn] : connections_) {
            short events = 0;
            if (conn->write_offset < conn->write_buf.size()) events |= POLLOUT;
            if (!conn->cgi && !conn->close_after_write) events |= POLLIN;
            if (events) watch(fd, events, Role::Client, fd);

            if (conn->cgi) {
                auto& proc = *conn->cgi;
                if (proc.stdin_fd() >= 0) watch(proc.stdin_fd(), POLLOUT, Role::CgiStdin, fd);
                if (proc.stdout_fd() >= 0) watch(proc.stdout_fd(), POLLIN, Role::CgiStdout, fd);
                if (proc.stderr_fd() >= 0) watch(proc.stderr_fd(), POLLIN, Role::CgiStderr, fd);

                auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                    proc.deadline() - now).count();
                // Output closed but exit status not yet collected
                if (proc.output_closed()) left = std::min<long long>(left, 10);
                timeout_ms = static_cast<int>(
                    std::clamp<long long>(left, 0, timeout_ms));
            }
        }
        if (cgi_ && cgi_->terminating_count() > 0) {
            timeout_ms = std::min(timeout_ms, 100);
        }
        if (stopping_) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                drain_deadline_ - now).count();
            timeout_ms = static_cast<int>(std::clamp<long long>(left, 0, timeout_ms));
        }

        int n = poll(fds.data(), fds.size(), timeout_ms);
        if (n == -1) {
            if (errno == EINTR) continue;
            spdlog::error("[HttpServer] poll failed: {}", std::strerror(errno));
            break;
        }

        for (size_t i = 0; i < fds.size() && n > 0; i++) {
            if (fds[i].revents == 0) continue;
            auto revents = fds[i].revents;
            const auto& target = targets[i];

            if (target.role == Role::Wake) {
                drain_wake_pipe();
                continue;
            }
            if (target.role == Role::Listen) {
                accept_connections();
                continue;
            }

            auto it = connections_.find(target.conn_fd);
            if (it == connections_.end() || it->second->closed) continue;
            auto& conn = *it->second;

            switch (target.role) {
            case Role::Client:
                if (revents & POLLOUT) flush(conn);
                if (!conn.closed && (revents & (POLLIN | POLLHUP | POLLERR))) {
                    on_readable(conn);
                }
                break;
            case Role::CgiStdin:
                if (conn.cgi) conn.cgi->pump_stdin();
                break;
            case Role::CgiStdout:
                if (conn.cgi) conn.cgi->pump_stdout();
                break;
            case Role::CgiStderr:
                if (conn.cgi) conn.cgi->pump_stderr();
                break;
            default:
                break;
            }
        }

        now = Clock::now();
        for (auto& [fd, conn] : connections_) {
            if (conn->cgi && !conn->closed) check_cgi(*conn, now);
        }
        if (cgi_) cgi_->reap_terminated();
        sweep(now);
        remove_closed();
    }

    // Anything left is dropped; running scripts are killed with their handles
    for (auto& [fd, conn] : connections_) {
        ::close(fd);
    }
    connections_.clear();
    if (cgi_) cgi_->reap_terminated();
    spdlog::info("[HttpServer] Server stopped");
}

void HttpServer::accept_connections() {
    while (true) {
        sockaddr_in addr{};
        socklen_t len = sizeof(addr);
        int fd = accept4(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len,
                         SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (fd == -1) {
            if (errno == EINTR) continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                spdlog::error("[HttpServer] accept failed: {}", std::strerror(errno));
            }
            return;
        }

        auto conn = std::make_unique<Connection>(fd, config_.max_header_size,
                                                 request_body_limit(config_));
        char ip[INET_ADDRSTRLEN] = {};
        if (inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip))) {
            conn->remote_addr = ip;
        }
        conn->last_activity = Clock::now();
        spdlog::debug("[HttpServer] Accepted {} (fd {})", conn->remote_addr, fd);
        connections_[fd] = std::move(conn);
    }
}

void HttpServer::on_readable(Connection& conn) {
    char buf[kRecvChunk];
    ssize_t n = recv(conn.fd, buf, sizeof(buf), 0);
    if (n > 0) {
        auto now = Clock::now();
        if (!conn.request_started) conn.request_started = now;
        conn.last_activity = now;
        conn.parser.append(buf, static_cast<size_t>(n));
        process_requests(conn);
        return;
    }
    if (n == 0) {
        // Peer finished sending; answer what is already buffered
        process_requests(conn);
        if (conn.cgi || conn.write_offset < conn.write_buf.size()) {
            conn.close_after_write = true;
        } else {
            conn.closed = true;
        }
        return;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
        return;
    }
    spdlog::debug("[HttpServer] recv failed on fd {}: {}", conn.fd, std::strerror(errno));
    conn.closed = true;
}

void HttpServer::process_requests(Connection& conn) {
    while (!conn.closed && !conn.cgi && !conn.close_after_write) {
        auto status = conn.parser.parse();
        if (status == http::RequestParser::Status::Incomplete) {
            break;
        }
        if (status == http::RequestParser::Status::Error) {
            spdlog::warn("[HttpServer] Bad request from {}: {}", conn.remote_addr,
                         conn.parser.error_message());
            queue_response(conn,
                           handler_.error_response(conn.parser.error_status(),
                                                   conn.parser.error_message()),
                           false);
            break;
        }

        auto request = conn.parser.take_request();
        conn.request_started.reset();
        if (conn.parser.in_progress()) conn.request_started = Clock::now();
        request.remote_addr = conn.remote_addr;
        bool keep_alive = request.keep_alive() && !stopping_;

        auto dispatch = handler_.handle(request);
        if (auto* resp = std::get_if<http::HttpResponse>(&dispatch)) {
            queue_response(conn, *resp, keep_alive);
        } else {
            start_cgi(conn, std::move(request), std::move(std::get<CgiDispatch>(dispatch)),
                      keep_alive);
        }
    }
}

void HttpServer::start_cgi(Connection& conn, http::HttpRequest request,
                           CgiDispatch dispatch, bool keep_alive) {
    if (!cgi_) {
        queue_response(conn, handler_.error_response(500, "CGI is not available"),
                       keep_alive);
        return;
    }

    auto started = cgi_->start(dispatch.script, dispatch.request);
    if (!started) {
        Result<cgi::CgiResponse> failed(started.error());
        queue_response(conn, handler_.complete_cgi(request, failed), keep_alive);
        return;
    }
    conn.cgi = started.take();
    conn.cgi_request = std::move(request);
    conn.cgi_keep_alive = keep_alive;
}

void HttpServer::check_cgi(Connection& conn, Clock::time_point now) {
    if (!cgi_->ready(*conn.cgi, now)) {
        return;
    }
    auto result = cgi_->finish(std::move(conn.cgi));
    conn.cgi.reset();

    auto request = std::move(conn.cgi_request);
    conn.cgi_request = http::HttpRequest{};
    queue_response(conn, handler_.complete_cgi(request, result),
                   conn.cgi_keep_alive && !stopping_);

    // Pipelined requests queued up behind the script
    process_requests(conn);
}

void HttpServer::queue_response(Connection& conn, const http::HttpResponse& resp,
                                bool keep_alive) {
    if (!keep_alive) {
        conn.close_after_write = true;
    }
    if (conn.write_offset > 0) {
        conn.write_buf.erase(0, conn.write_offset);
        conn.write_offset = 0;
    }
    conn.write_buf += resp.serialize(keep_alive);
    flush(conn);
}

void HttpServer::flush(Connection& conn) {
    while (conn.write_offset < conn.write_buf.size()) {
        ssize_t n = send(conn.fd, conn.write_buf.data() + conn.write_offset,
                         conn.write_buf.size() - conn.write_offset, MSG_NOSIGNAL);
        if (n > 0) {
            conn.write_offset += static_cast<size_t>(n);
            conn.last_activity = Clock::now();
        } else if (n == -1 && errno == EINTR) {
            continue;
        } else if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        } else {
            spdlog::debug("[HttpServer] send failed on fd {}: {}", conn.fd,
                          std::strerror(errno));
            conn.closed = true;
            return;
        }
    }
    conn.write_buf.clear();
    conn.write_offset = 0;
    if (conn.close_after_write && !conn.cgi) {
        conn.closed = true;
    }
}

bool HttpServer::idle(const Connection& conn) const {
    return !conn.cgi && conn.write_offset >= conn.write_buf.size() &&
           !conn.request_started && !conn.parser.in_progress();
}

void HttpServer::sweep(Clock::time_point now) {
    for (auto& [fd, conn] : connections_) {
        if (conn->closed || conn->cgi) continue;

        if (conn->write_offset < conn->write_buf.size()) {
            if (now - conn->last_activity > config_.request_timeout) {
                spdlog::debug("[HttpServer] Write stalled on fd {}", fd);
                conn->closed = true;
            }
            continue;
        }
        if (conn->request_started && !conn->close_after_write &&
            now - *conn->request_started > config_.request_timeout) {
            queue_response(*conn, handler_.error_response(408, "Request Timeout"), false);
            continue;
        }
        if (idle(*conn) && now - conn->last_activity > config_.keep_alive_timeout) {
            spdlog::debug("[HttpServer] Keep-alive timeout on fd {}", fd);
            conn->closed = true;
        }
    }
}

void HttpServer::remove_closed() {
    for (auto it = connections_.begin(); it != connections_.end();) {
        if (it->second->closed) {
            ::close(it->first);
            it = connections_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace gzs::server
