#pragma once

#include "cgi/cgi_process.hpp"
#include "cgi/cgi_types.hpp"
#include "core/config.hpp"
#include "core/result.hpp"

#include <memory>
#include <vector>

namespace gzs::cgi {

/// Runs scripts through the configured interpreter, one child per request.
///
/// Two ways to drive it: execute() blocks until the response is ready; the
/// start()/ready()/finish() trio lets an event loop own the child's pipes
/// and multiplex many invocations on one thread. Children that time out are
/// sent SIGTERM and parked until they exit; reap_terminated() collects them
/// and escalates to SIGKILL after the configured grace period.
class CgiExecutor {
public:
    explicit CgiExecutor(CgiConfig config);

    // Non-copyable
    CgiExecutor(const CgiExecutor&) = delete;
    CgiExecutor& operator=(const CgiExecutor&) = delete;

    /// True when the interpreter exists and is executable.
    bool validate_binary() const;

    /// Real path of script if it lies under the document root or cgi-bin.
    /// PathError otherwise, NotFound if it does not exist.
    Result<fs::path> validate_script_path(const fs::path& script) const;

    /// Validate, build the environment and spawn. The returned process has
    /// its deadline set from the configured timeout.
    Result<std::unique_ptr<CgiProcess>> start(const fs::path& script,
                                              const CgiRequest& request);

    /// True when finish() can be called without blocking.
    bool ready(CgiProcess& proc, CgiProcess::Clock::time_point now) const;

    /// Turn a ready process into a response or an error. A process that
    /// is still running (deadline passed) is terminated and parked.
    Result<CgiResponse> finish(std::unique_ptr<CgiProcess> proc);

    /// Blocking convenience: start(), pump until ready(), finish().
    Result<CgiResponse> execute(const fs::path& script, const CgiRequest& request);

    /// Collect parked children; SIGKILL those past the grace period.
    void reap_terminated();
    size_t terminating_count() const { return terminating_.size(); }

    const CgiConfig& config() const { return config_; }

private:
    void park(std::unique_ptr<CgiProcess> proc);

    CgiConfig config_;
    std::vector<std::unique_ptr<CgiProcess>> terminating_;
};

} // namespace gzs::cgi
