#include "runtime/snippet_runner.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <exception>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include <vector>
#include "core/errors/exec_errors.hpp"
#include "core/logging/logger.hpp"
#include "core/text/text_utils.hpp"
#include "runtime/temp_source_file.hpp"

namespace snipexec::runtime {

using core::errors::ErrorCategory;
using core::errors::ExecError;
using protocol::ExecutionResult;

namespace {

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

class ScopedFd {
public:
    explicit ScopedFd(const int fd = -1) : fd_(fd) {}
    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;
    ~ScopedFd() { reset(); }

    int get() const { return fd_; }
    bool is_open() const { return fd_ >= 0; }

    void reset(const int fd = -1) {
        if (fd_ >= 0) {
            static_cast<void>(close(fd_));
        }
        fd_ = fd;
    }

private:
    int fd_;
};

struct Pipe {
    ScopedFd read_end;
    ScopedFd write_end;
};

// O_CLOEXEC keeps these descriptors out of children forked by other threads,
// which would otherwise hold a write end open and delay our EOF.
bool open_pipe(Pipe& out) {
    int fds[2] = {-1, -1};
    if (pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
    out.read_end.reset(fds[0]);
    out.write_end.reset(fds[1]);
    return true;
}

// Kills the child's whole process group and reaps the child unless that has
// already happened. Runs on every exit path of the capture loop.
class ChildGuard {
public:
    explicit ChildGuard(const pid_t pid) : pid_(pid) {}
    ChildGuard(const ChildGuard&) = delete;
    ChildGuard& operator=(const ChildGuard&) = delete;

    ~ChildGuard() {
        if (!reaped_) {
            kill_group();
            int status = 0;
            static_cast<void>(waitpid(pid_, &status, 0));
        }
    }

    // The leader is still unreaped here, so its pid cannot have been reused
    // as the id of some unrelated group.
    void kill_group() const {
        if (killpg(pid_, SIGKILL) != 0 && errno != ESRCH) {
            LOG_WARN("SnippetRunner: killpg(" + std::to_string(pid_) +
                     ") failed: " + std::strerror(errno));
        }
    }

    int reap() {
        int status = 0;
        while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
        reaped_ = true;
        return status;
    }

private:
    pid_t pid_;
    bool reaped_ = false;
};

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void drain_pipe(ScopedFd& fd, std::string& out) {
    if (!fd.is_open()) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd.get(), buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            fd.reset();
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        fd.reset();
        return;
    }
}

// Non-blocking "has the child exited?" that leaves it unreaped.
bool child_has_exited(const pid_t pid) {
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    if (waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
        return errno == ECHILD;
    }
    return info.si_pid == pid;
}

core::errors::Result<ProcessCapture> run_interpreter(
    const std::string& interpreter, const std::string& script_path,
    const std::uint32_t timeout_ms) {
    Pipe stdout_pipe;
    Pipe stderr_pipe;
    Pipe exec_status_pipe;
    if (!open_pipe(stdout_pipe) || !open_pipe(stderr_pipe) ||
        !open_pipe(exec_status_pipe)) {
        return ExecError{ErrorCategory::Internal,
                         std::string("Failed to create process pipes: ") +
                             std::strerror(errno),
                         "pipe_creation_failed"};
    }

    // Everything the child touches is prepared before fork().
    std::vector<char*> argv;
    std::string arg0 = interpreter;
    std::string arg1 = script_path;
    argv.push_back(arg0.data());
    argv.push_back(arg1.data());
    argv.push_back(nullptr);

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        return ExecError{ErrorCategory::Internal,
                         std::string("Failed to fork process: ") + std::strerror(errno),
                         "fork_failed"};
    }

    if (pid == 0) {
        // New process group for clean group-kill on timeout
        static_cast<void>(setpgid(0, 0));
        const int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            static_cast<void>(dup2(devnull, STDIN_FILENO));
        }
        static_cast<void>(dup2(stdout_pipe.write_end.get(), STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe.write_end.get(), STDERR_FILENO));
        execvp(argv[0], argv.data());
        const int exec_errno = errno;
        static_cast<void>(write(exec_status_pipe.write_end.get(), &exec_errno,
                                sizeof(exec_errno)));
        _exit(127);
    }

    ChildGuard child(pid);
    static_cast<void>(setpgid(pid, pid));  // mirror the child's setpgid
    stdout_pipe.write_end.reset();
    stderr_pipe.write_end.reset();
    exec_status_pipe.write_end.reset();

    // Blocks until exec succeeds (CLOEXEC closes the pipe) or the child
    // reports why it failed.
    int exec_errno = 0;
    ssize_t status_bytes = 0;
    do {
        status_bytes = read(exec_status_pipe.read_end.get(), &exec_errno,
                            sizeof(exec_errno));
    } while (status_bytes < 0 && errno == EINTR);
    if (status_bytes == static_cast<ssize_t>(sizeof(exec_errno))) {
        static_cast<void>(child.reap());
        return ExecError{ErrorCategory::Execution,
                         "Failed to launch interpreter '" + interpreter +
                             "': " + std::strerror(exec_errno),
                         "interpreter_launch_failed"};
    }

    set_nonblocking(stdout_pipe.read_end.get());
    set_nonblocking(stderr_pipe.read_end.get());

    const auto deadline = started + std::chrono::milliseconds(timeout_ms);
    ProcessCapture capture;
    bool child_exited = false;

    while (stdout_pipe.read_end.is_open() || stderr_pipe.read_end.is_open() ||
           !child_exited) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            capture.timed_out = true;
            break;
        }
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now)
                .count();
        const int wait_ms = static_cast<int>(std::max<long long>(
            1, std::min<long long>(50, static_cast<long long>(remaining))));

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_pipe.read_end.is_open()) {
            fds[nfds].fd = stdout_pipe.read_end.get();
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_pipe.read_end.is_open()) {
            fds[nfds].fd = stderr_pipe.read_end.get();
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        static_cast<void>(poll(nfds > 0 ? fds : nullptr, nfds, wait_ms));

        drain_pipe(stdout_pipe.read_end, capture.stdout_text);
        drain_pipe(stderr_pipe.read_end, capture.stderr_text);

        if (!child_exited) {
            child_exited = child_has_exited(pid);
        }
    }

    // Descendants that outlived the interpreter go down with the group.
    child.kill_group();
    const int status = child.reap();

    if (capture.timed_out) {
        LOG_WARN("SnippetRunner: pid " + std::to_string(pid) + " killed after " +
                 std::to_string(timeout_ms) + " ms");
    } else if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    }

    const auto ended = std::chrono::steady_clock::now();
    capture.duration_ms =
        std::chrono::duration<double, std::milli>(ended - started).count();
    return capture;
}

}  // namespace

SnippetRunner::SnippetRunner(RunnerOptions options) : options_(std::move(options)) {}

ExecutionResult SnippetRunner::run(const std::string& code,
                                   const std::uint32_t timeout_ms) const {
    ExecutionResult result;
    try {
        auto file_result = TempSourceFile::create(options_.temp_dir,
                                                  core::text::dedent(code));
        if (core::errors::is_error(file_result)) {
            const auto& err = core::errors::get_error(file_result);
            LOG_ERROR("SnippetRunner: [" + err.code + "] " + err.message);
            result.stderr_text = err.message;
            return result;
        }
        const TempSourceFile source =
            core::errors::take_value(std::move(file_result));

        LOG_DEBUG("SnippetRunner: launching " + options_.interpreter + " " +
                  source.path().string());
        auto capture_result =
            run_interpreter(options_.interpreter, source.path().string(), timeout_ms);
        if (core::errors::is_error(capture_result)) {
            const auto& err = core::errors::get_error(capture_result);
            LOG_ERROR("SnippetRunner: [" + err.code + "] " + err.message);
            result.stderr_text = err.message;
            return result;
        }

        const auto& capture = core::errors::get_value(capture_result);
        if (capture.timed_out) {
            result.timed_out = true;
            result.stderr_text = kTimeoutMessage;
            return result;
        }

        LOG_DEBUG("SnippetRunner: exit code " + std::to_string(capture.exit_code) +
                  " after " + std::to_string(capture.duration_ms) + " ms");
        result.stdout_text = core::text::strip(capture.stdout_text);
        result.stderr_text = core::text::strip(capture.stderr_text);
    } catch (const std::exception& ex) {
        LOG_ERROR(std::string("SnippetRunner: internal fault: ") + ex.what());
        result.stdout_text.clear();
        result.stderr_text = std::string("Internal runner error: ") + ex.what();
    }
    return result;
}

}  // namespace snipexec::runtime
