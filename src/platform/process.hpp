#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Why spawn failed (fork or exec error). Empty when valid().
    const std::string& launch_error() const { return launch_error_; }

    // True if the process is still running.
    bool running();

    // Wait for the process to exit. Returns the exit code, 128+signal when
    // killed by a signal, or -1 on timeout/invalid handle.
    // timeout_ms = -1 means indefinite wait.
    int wait(int timeout_ms = -1);

    // Terminate the process (SIGTERM, then SIGKILL after 2s).
    void terminate();


private:
    int pid_ = -1;
    bool reaped_ = false;
    int exit_code_ = -1;
    std::string launch_error_;

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               const std::string& stderr_log);
};

// Spawn a child process. Launch failures (including a missing executable)
// are reported through launch_error(), never as an exit code.
// stderr_log: if non-empty, redirect child's stderr to this file (append mode).
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& stderr_log = "");

// Launch and forget: the process is re-parented to init (double fork, new
// session) so no one has to reap it. Only the launch itself is reported.
Result<void> spawn_detached(const std::string& program,
                            const std::vector<std::string>& args,
                            const std::string& stderr_log = "");

} // namespace platform
