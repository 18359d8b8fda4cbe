#pragma once

#include "cgi/cgi_environment.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <sys/types.h>

namespace gzs::cgi {

/// One running interpreter child with non-blocking pipes on stdin, stdout
/// and stderr. The child leads its own process group so signals reach
/// anything it forks. Never reused.
///
/// The owner pumps the pipes when poll() reports them ready, then calls
/// try_reap(). A process destroyed before it was reaped is SIGKILLed and
/// waited for.
class CgiProcess {
public:
    using Clock = std::chrono::steady_clock;

    struct Options {
        fs::path interpreter;
        fs::path script;
        CgiEnvironment env;
        Bytes input;             ///< Written to the child's stdin, then closed
        u64 max_output = 0;      ///< stdout cap; exceeding it terminates the child
        u64 max_stderr = 0;      ///< stderr beyond this is read and dropped
        Clock::time_point deadline;
    };

    /// fork + execve. Fails with ExecutionError{ProcessSpawnFailure} when
    /// the pipes cannot be created, fork fails, or exec fails in the child.
    static Result<std::unique_ptr<CgiProcess>> spawn(Options options);

    ~CgiProcess();

    // Non-copyable
    CgiProcess(const CgiProcess&) = delete;
    CgiProcess& operator=(const CgiProcess&) = delete;

    /// Pipe ends still open in the parent, -1 once closed.
    int stdin_fd() const { return stdin_fd_; }
    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }

    void pump_stdin();
    void pump_stdout();
    void pump_stderr();

    /// Collect the exit status without blocking. True once reaped.
    bool try_reap();

    /// SIGTERM the process group (first call only).
    void terminate();
    /// SIGKILL the process group.
    void kill();

    bool output_closed() const { return stdout_fd_ < 0 && stderr_fd_ < 0; }
    bool reaped() const { return reaped_; }
    bool complete() const { return output_closed() && reaped_; }
    bool overflowed() const { return overflowed_; }
    bool expired(Clock::time_point now) const { return now >= deadline_; }
    bool terminated() const { return terminated_; }
    bool killed() const { return killed_; }

    pid_t pid() const { return pid_; }
    Clock::time_point deadline() const { return deadline_; }
    Clock::time_point terminated_at() const { return terminated_at_; }

    /// Raw waitpid() status, valid once reaped().
    int wait_status() const { return wait_status_; }

    const std::string& output() const { return output_; }
    const std::string& error_output() const { return stderr_; }

private:
    CgiProcess() = default;

    void close_fd(int& fd);

    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;

    Bytes input_;
    size_t input_offset_ = 0;

    std::string output_;
    std::string stderr_;
    u64 max_output_ = 0;
    u64 max_stderr_ = 0;

    Clock::time_point deadline_;
    Clock::time_point terminated_at_;

    bool reaped_ = false;
    bool overflowed_ = false;
    bool terminated_ = false;
    bool killed_ = false;
    int wait_status_ = 0;
};

} // namespace gzs::cgi
