#include "process.hpp"
#include "platform.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() = default;

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(other.pid_), reaped_(other.reaped_), exit_code_(other.exit_code_),
      launch_error_(std::move(other.launch_error_)) {
    other.pid_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        pid_ = other.pid_;
        reaped_ = other.reaped_;
        exit_code_ = other.exit_code_;
        launch_error_ = std::move(other.launch_error_);
        other.pid_ = -1;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

static int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

bool ProcessHandle::running() {
    if (pid_ <= 0 || reaped_) return false;
    int status;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) {
        reaped_ = true;
        exit_code_ = decode_status(status);
        return false;
    }
    return ret == 0;  // 0 means still running
}

int ProcessHandle::wait(int timeout_ms) {
    if (pid_ <= 0) return -1;
    if (reaped_) return exit_code_;
    if (timeout_ms < 0) {
        int status;
        pid_t ret;
        do {
            ret = waitpid(pid_, &status, 0);
        } while (ret < 0 && errno == EINTR);
        if (ret != pid_) return -1;
        reaped_ = true;
        exit_code_ = decode_status(status);
        return exit_code_;
    }
    // Poll with timeout
    int elapsed = 0;
    while (elapsed < timeout_ms) {
        if (!running()) return reaped_ ? exit_code_ : -1;
        sleep_ms(100);
        elapsed += 100;
    }
    return -1;  // timed out
}

void ProcessHandle::terminate() {
    if (pid_ <= 0 || reaped_) return;
    kill(pid_, SIGTERM);
    // Wait up to 2s for graceful exit
    for (int i = 0; i < 20; i++) {
        if (!running()) return;
        sleep_ms(100);
    }
    kill(pid_, SIGKILL);
    wait();
}

// ── spawn ────────────────────────────────────────────────────

// Runs in the forked child: only async-signal-safe calls.
[[noreturn]] static void exec_child(const char* program, char* const* argv,
                                    const char* stderr_log, int err_fd) {
    sigset_t none;
    sigemptyset(&none);
    sigprocmask(SIG_SETMASK, &none, nullptr);

    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
        dup2(devnull, STDIN_FILENO);
        close(devnull);
    }

    if (stderr_log) {
        int fd = open(stderr_log, O_WRONLY | O_CREAT | O_APPEND, 0644);
        if (fd >= 0) {
            dup2(fd, STDERR_FILENO);
            close(fd);
        }
    }

    execvp(program, argv);
    int e = errno;
    ssize_t ignored = write(err_fd, &e, sizeof(e));
    (void)ignored;
    _exit(127);  // exec failed
}

static std::vector<char*> build_argv(const std::string& program,
                                     const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(program.c_str()));
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    return argv;
}

// Read the errno a failed exec reported. 0 means exec succeeded.
static int read_exec_errno(int fd) {
    int e = 0;
    ssize_t n;
    do {
        n = read(fd, &e, sizeof(e));
    } while (n < 0 && errno == EINTR);
    return n == static_cast<ssize_t>(sizeof(e)) ? e : 0;
}

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& stderr_log) {
    ProcessHandle handle;
    auto argv = build_argv(program, args);
    const char* log = stderr_log.empty() ? nullptr : stderr_log.c_str();

    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        handle.launch_error_ = std::string("pipe: ") + std::strerror(errno);
        return handle;
    }

    pid_t pid = fork();
    if (pid < 0) {
        handle.launch_error_ = std::string("fork: ") + std::strerror(errno);
        close(err_pipe[0]);
        close(err_pipe[1]);
        return handle;
    }

    if (pid == 0) {
        close(err_pipe[0]);
        exec_child(program.c_str(), argv.data(), log, err_pipe[1]);
    }

    // Parent
    close(err_pipe[1]);
    int exec_errno = read_exec_errno(err_pipe[0]);
    close(err_pipe[0]);

    if (exec_errno != 0) {
        waitpid(pid, nullptr, 0);
        handle.launch_error_ = "exec " + program + ": " + std::strerror(exec_errno);
        return handle;
    }

    handle.pid_ = pid;
    return handle;
}

Result<void> spawn_detached(const std::string& program,
                            const std::vector<std::string>& args,
                            const std::string& stderr_log) {
    auto argv = build_argv(program, args);
    const char* log = stderr_log.empty() ? nullptr : stderr_log.c_str();

    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        return Result<void>::Err(std::string("pipe: ") + std::strerror(errno),
                                 ErrorKind::Processing);
    }

    pid_t pid = fork();
    if (pid < 0) {
        int e = errno;
        close(err_pipe[0]);
        close(err_pipe[1]);
        return Result<void>::Err(std::string("fork: ") + std::strerror(e), ErrorKind::Processing);
    }

    if (pid == 0) {
        // Intermediate child: new session, fork the real process, exit.
        close(err_pipe[0]);
        setsid();
        pid_t grandchild = fork();
        if (grandchild < 0) {
            int e = errno;
            ssize_t ignored = write(err_pipe[1], &e, sizeof(e));
            (void)ignored;
            _exit(1);
        }
        if (grandchild == 0) {
            exec_child(program.c_str(), argv.data(), log, err_pipe[1]);
        }
        _exit(0);
    }

    close(err_pipe[1]);
    int status;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    int exec_errno = read_exec_errno(err_pipe[0]);
    close(err_pipe[0]);

    if (exec_errno != 0) {
        return Result<void>::Err("exec " + program + ": " + std::strerror(exec_errno),
                                 ErrorKind::Processing);
    }
    return Result<void>::Ok();
}

} // namespace platform
