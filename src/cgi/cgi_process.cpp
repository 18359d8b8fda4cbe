#include "cgi/cgi_process.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <spdlog/spdlog.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace gzs::cgi {

namespace {

constexpr size_t kReadChunk = 64 * KiB;

void close_pair(int fds[2]) {
    for (int i = 0; i < 2; i++) {
        if (fds[i] >= 0) {
            ::close(fds[i]);
            fds[i] = -1;
        }
    }
}

bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    return flags != -1 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
}

Error spawn_error(const std::string& what, int err) {
    return Error::execution(ExecutionFailure::ProcessSpawnFailure,
                            "Failed to execute CGI script: " + what + ": " +
                                std::strerror(err));
}

/// Write errno to the status pipe and leave without running atexit handlers.
[[noreturn]] void child_fail(int status_fd) {
    int err = errno;
    ssize_t ignored = ::write(status_fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

} // namespace

Result<std::unique_ptr<CgiProcess>> CgiProcess::spawn(Options options) {
    // argv and envp are built before fork(); the child only calls
    // async-signal-safe functions
    std::string interpreter = options.interpreter.string();
    std::string script = options.script.string();
    std::string workdir = options.script.parent_path().string();

    std::vector<std::string> env_entries;
    env_entries.reserve(options.env.size());
    for (const auto& [name, value] : options.env) {
        env_entries.push_back(name + "=" + value);
    }
    std::vector<char*> envp;
    for (auto& entry : env_entries) envp.push_back(entry.data());
    envp.push_back(nullptr);

    std::vector<char*> argv = {interpreter.data(), script.data(), nullptr};

    int in[2] = {-1, -1};
    int out[2] = {-1, -1};
    int err[2] = {-1, -1};
    int status[2] = {-1, -1};
    if (pipe2(in, O_CLOEXEC) == -1 || pipe2(out, O_CLOEXEC) == -1 ||
        pipe2(err, O_CLOEXEC) == -1 || pipe2(status, O_CLOEXEC) == -1) {
        int e = errno;
        close_pair(in);
        close_pair(out);
        close_pair(err);
        close_pair(status);
        return spawn_error("pipe", e);
    }

    pid_t pid = fork();
    if (pid == -1) {
        int e = errno;
        close_pair(in);
        close_pair(out);
        close_pair(err);
        close_pair(status);
        return spawn_error("fork", e);
    }

    if (pid == 0) {
        setpgid(0, 0);
        signal(SIGPIPE, SIG_DFL);
        // dup2 clears O_CLOEXEC on the new descriptor
        if (dup2(in[0], STDIN_FILENO) == -1 || dup2(out[1], STDOUT_FILENO) == -1 ||
            dup2(err[1], STDERR_FILENO) == -1) {
            child_fail(status[1]);
        }
        if (!workdir.empty() && chdir(workdir.c_str()) == -1) {
            child_fail(status[1]);
        }
        execve(interpreter.c_str(), argv.data(), envp.data());
        child_fail(status[1]);
    }

    // Parent. Also set the group here so it exists before any signal
    setpgid(pid, pid);
    ::close(in[0]);
    ::close(out[1]);
    ::close(err[1]);
    ::close(status[1]);

    std::unique_ptr<CgiProcess> proc(new CgiProcess());
    proc->pid_ = pid;
    proc->stdin_fd_ = in[1];
    proc->stdout_fd_ = out[0];
    proc->stderr_fd_ = err[0];
    proc->input_ = std::move(options.input);
    proc->max_output_ = options.max_output;
    proc->max_stderr_ = options.max_stderr;
    proc->deadline_ = options.deadline;

    // EOF here means execve succeeded and closed the status pipe
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status[0], &child_errno, sizeof(child_errno));
    } while (n == -1 && errno == EINTR);
    ::close(status[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        // Destructor reaps the exited child
        return spawn_error(interpreter, child_errno);
    }

    if (!set_nonblocking(proc->stdin_fd_) || !set_nonblocking(proc->stdout_fd_) ||
        !set_nonblocking(proc->stderr_fd_)) {
        return spawn_error("fcntl", errno);
    }

    if (proc->input_.empty()) {
        proc->close_fd(proc->stdin_fd_);
    }

    spdlog::debug("[CGI] Spawned pid {} for {}", pid, script);
    return proc;
}

CgiProcess::~CgiProcess() {
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
    if (pid_ > 0 && !reaped_) {
        ::kill(-pid_, SIGKILL);
        ::kill(pid_, SIGKILL);
        while (waitpid(pid_, &wait_status_, 0) == -1 && errno == EINTR) {
        }
    }
}

void CgiProcess::close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void CgiProcess::pump_stdin() {
    while (stdin_fd_ >= 0 && input_offset_ < input_.size()) {
        ssize_t n = ::write(stdin_fd_, input_.data() + input_offset_,
                            input_.size() - input_offset_);
        if (n > 0) {
            input_offset_ += static_cast<size_t>(n);
        } else if (n == -1 && errno == EINTR) {
            continue;
        } else if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        } else {
            // EPIPE: the script exited without reading its input
            spdlog::debug("[CGI] stdin closed early: {}", std::strerror(errno));
            break;
        }
    }
    close_fd(stdin_fd_);
}

void CgiProcess::pump_stdout() {
    char buf[kReadChunk];
    while (stdout_fd_ >= 0) {
        ssize_t n = ::read(stdout_fd_, buf, sizeof(buf));
        if (n > 0) {
            if (output_.size() + static_cast<size_t>(n) > max_output_) {
                spdlog::error("[CGI] Response size exceeded maximum allowed");
                overflowed_ = true;
                close_fd(stdout_fd_);
                terminate();
                return;
            }
            output_.append(buf, static_cast<size_t>(n));
        } else if (n == 0) {
            close_fd(stdout_fd_);
        } else if (errno == EINTR) {
            continue;
        } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        } else {
            spdlog::warn("[CGI] stdout read failed: {}", std::strerror(errno));
            close_fd(stdout_fd_);
        }
    }
}

void CgiProcess::pump_stderr() {
    char buf[kReadChunk];
    while (stderr_fd_ >= 0) {
        ssize_t n = ::read(stderr_fd_, buf, sizeof(buf));
        if (n > 0) {
            if (stderr_.size() < max_stderr_) {
                auto room = static_cast<size_t>(max_stderr_ - stderr_.size());
                stderr_.append(buf, std::min(room, static_cast<size_t>(n)));
            }
        } else if (n == 0) {
            close_fd(stderr_fd_);
        } else if (errno == EINTR) {
            continue;
        } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        } else {
            close_fd(stderr_fd_);
        }
    }
}

bool CgiProcess::try_reap() {
    if (reaped_ || pid_ <= 0) return true;
    pid_t r = waitpid(pid_, &wait_status_, WNOHANG);
    if (r == pid_) {
        reaped_ = true;
    } else if (r == -1 && errno == ECHILD) {
        // Someone else collected it
        reaped_ = true;
    }
    return reaped_;
}

void CgiProcess::terminate() {
    if (terminated_ || reaped_) return;
    terminated_ = true;
    terminated_at_ = Clock::now();
    if (::kill(-pid_, SIGTERM) == -1) {
        ::kill(pid_, SIGTERM);
    }
}

void CgiProcess::kill() {
    if (reaped_) return;
    killed_ = true;
    if (::kill(-pid_, SIGKILL) == -1) {
        ::kill(pid_, SIGKILL);
    }
}

} // namespace gzs::cgi
