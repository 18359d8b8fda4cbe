#include "cgi/cgi_executor.hpp"

#include "cgi/cgi_output_parser.hpp"
#include "security/path_security.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <poll.h>
#include <spdlog/spdlog.h>
#include <sys/wait.h>
#include <unistd.h>

namespace gzs::cgi {

namespace {

void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { signal(SIGPIPE, SIG_IGN); });
}

bool is_under(const fs::path& root, const fs::path& real_path) {
    if (root.empty()) return false;
    std::error_code ec;
    auto real_root = fs::weakly_canonical(root, ec);
    if (ec) return false;
    return security::is_within_directory(real_root, real_path);
}

void log_stderr(const std::string& text) {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return;
    spdlog::warn("[CGI] Script stderr: {}", text.substr(0, 500));
}

} // namespace

CgiExecutor::CgiExecutor(CgiConfig config) : config_(std::move(config)) {
    ignore_sigpipe_once();
}

bool CgiExecutor::validate_binary() const {
    if (!config_.interpreter.empty() &&
        access(config_.interpreter.c_str(), X_OK) == 0 &&
        !fs::is_directory(config_.interpreter)) {
        spdlog::info("[CGI] PHP-CGI binary validated: {}", config_.interpreter.string());
        return true;
    }
    spdlog::error("[CGI] PHP-CGI binary not found or not executable: {}",
                  config_.interpreter.string());
    return false;
}

Result<fs::path> CgiExecutor::validate_script_path(const fs::path& script) const {
    std::error_code ec;
    auto real = fs::canonical(script, ec);
    if (ec) {
        return Error(ErrorKind::NotFound, "CGI script not found");
    }
    if (is_under(config_.document_root, real) || is_under(config_.cgi_bin_path, real)) {
        return real;
    }
    spdlog::error("[CGI] Script path validation failed: {}", script.string());
    return Error(ErrorKind::PathError,
                 "CGI script path is not within allowed directories");
}

Result<std::unique_ptr<CgiProcess>> CgiExecutor::start(const fs::path& script,
                                                       const CgiRequest& request) {
    auto real = validate_script_path(script);
    if (!real) {
        return real.error();
    }

    if (request.body && request.body->size() > config_.max_body_size) {
        return Error(ErrorKind::ResourceLimitExceeded,
                     "Request body exceeds CGI maximum size");
    }

    CgiProcess::Options options;
    options.interpreter = config_.interpreter;
    options.script = real.value();
    options.env = build_cgi_environment(real.value(), request, config_);
    if (request.body) {
        options.input = *request.body;
    }
    options.max_output = config_.max_response_size;
    options.max_stderr = config_.max_stderr_size;
    options.deadline = CgiProcess::Clock::now() + config_.timeout;

    spdlog::info("[CGI] Executing: {}", real.value().string());
    spdlog::debug("[CGI] Method: {}, Query: {}", request.method, request.url.query);
    return CgiProcess::spawn(std::move(options));
}

bool CgiExecutor::ready(CgiProcess& proc, CgiProcess::Clock::time_point now) const {
    if (proc.overflowed() || proc.expired(now)) {
        return true;
    }
    return proc.output_closed() && proc.try_reap();
}

void CgiExecutor::park(std::unique_ptr<CgiProcess> proc) {
    proc->terminate();
    if (!proc->try_reap()) {
        terminating_.push_back(std::move(proc));
    }
}

Result<CgiResponse> CgiExecutor::finish(std::unique_ptr<CgiProcess> proc) {
    if (proc->overflowed()) {
        park(std::move(proc));
        return Error(ErrorKind::ResourceLimitExceeded,
                     "CGI response exceeds maximum size");
    }
    if (!proc->complete()) {
        spdlog::warn("[CGI] Script execution timed out after {}ms",
                     config_.timeout.count());
        park(std::move(proc));
        return Error::execution(ExecutionFailure::Timeout,
                                "CGI script execution timed out");
    }

    log_stderr(proc->error_output());

    auto parsed = parse_cgi_output(proc->output());
    int status = proc->wait_status();

    if (WIFSIGNALED(status)) {
        int sig = WTERMSIG(status);
        if (!parsed.has_header_block) {
            return Error::execution(
                ExecutionFailure::SignalTermination,
                std::string("CGI process terminated by signal: ") + strsignal(sig));
        }
        spdlog::warn("[CGI] Script killed by signal {} after writing a response", sig);
    } else if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        int code = WEXITSTATUS(status);
        if (!parsed.has_header_block) {
            return Error::execution(ExecutionFailure::NonZeroExit,
                                    "CGI script exited with code " + std::to_string(code));
        }
        spdlog::warn("[CGI] Script exited with code: {}", code);
    }

    spdlog::info("[CGI] Execution complete: {} ({} bytes)",
                 parsed.response.status_code, parsed.response.body.size());
    return std::move(parsed.response);
}

Result<CgiResponse> CgiExecutor::execute(const fs::path& script,
                                         const CgiRequest& request) {
    reap_terminated();

    auto started = start(script, request);
    if (!started) {
        return started.error();
    }
    auto proc = started.take();

    while (!ready(*proc, CgiProcess::Clock::now())) {
        pollfd fds[3];
        nfds_t count = 0;
        if (proc->stdin_fd() >= 0) fds[count++] = {proc->stdin_fd(), POLLOUT, 0};
        if (proc->stdout_fd() >= 0) fds[count++] = {proc->stdout_fd(), POLLIN, 0};
        if (proc->stderr_fd() >= 0) fds[count++] = {proc->stderr_fd(), POLLIN, 0};

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            proc->deadline() - CgiProcess::Clock::now());
        long long wait_ms = std::max<long long>(remaining.count(), 0);
        // Pipes closed but child not yet reaped: re-check shortly
        if (count == 0) {
            wait_ms = std::min<long long>(wait_ms, 10);
        }

        int n = poll(fds, count, static_cast<int>(wait_ms));
        if (n == -1 && errno != EINTR) {
            spdlog::error("[CGI] poll failed: {}", std::strerror(errno));
            proc->kill();
            return Error(ErrorKind::Internal, "CGI I/O failure");
        }

        proc->pump_stdin();
        proc->pump_stdout();
        proc->pump_stderr();
    }

    auto result = finish(std::move(proc));
    reap_terminated();
    return result;
}

void CgiExecutor::reap_terminated() {
    auto now = CgiProcess::Clock::now();
    terminating_.erase(
        std::remove_if(terminating_.begin(), terminating_.end(),
                       [&](std::unique_ptr<CgiProcess>& proc) {
                           if (proc->try_reap()) return true;
                           if (!proc->killed() &&
                               now - proc->terminated_at() >= config_.kill_grace) {
                               spdlog::warn("[CGI] pid {} ignored SIGTERM, sending SIGKILL",
                                            proc->pid());
                               proc->kill();
                           }
                           return false;
                       }),
        terminating_.end());
}

} // namespace gzs::cgi
