// ============================================================================
// FIGSEARCH FUZZ - PROCESS RUNNER
// Module: process_runner.h
// Description: spawns the program under test, captures its stdout through a
//              pipe and waits for it. stderr is inherited so the searcher's
//              own diagnostics stay visible on the console.
// ============================================================================

#pragma once

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

#include <poll.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace figfuzz::harness {

struct ProcessResult {
    bool spawned = false;
    bool exited = false;       // normal exit, exit_code is meaningful
    bool timed_out = false;
    int exit_code = -1;
    int term_signal = 0;
    double elapsed_ms = 0.0;
    std::string stdout_text;
    std::string error;

    bool succeeded() const {
        return spawned && exited && !timed_out && exit_code == 0;
    }

    std::string describe() const {
        if (!spawned) return "spawn failed: " + error;
        if (timed_out) return "timed out after " + std::to_string(static_cast<int64_t>(elapsed_ms)) + "ms";
        if (!exited) return "terminated by signal " + std::to_string(term_signal);
        return "exit code " + std::to_string(exit_code);
    }
};

class PipeGuard {
public:
    PipeGuard() = default;
    ~PipeGuard() {
        close_read();
        close_write();
    }
    PipeGuard(const PipeGuard&) = delete;
    PipeGuard& operator=(const PipeGuard&) = delete;

    bool open() {
        return ::pipe(fds_) == 0;
    }
    int read_fd() const { return fds_[0]; }
    int write_fd() const { return fds_[1]; }

    void close_read() {
        if (fds_[0] >= 0) { ::close(fds_[0]); fds_[0] = -1; }
    }
    void close_write() {
        if (fds_[1] >= 0) { ::close(fds_[1]); fds_[1] = -1; }
    }

private:
    int fds_[2] = {-1, -1};
};

inline int wait_child(pid_t pid, int& status) {
    for (;;) {
        const pid_t r = ::waitpid(pid, &status, 0);
        if (r == pid) return 0;
        if (r < 0 && errno == EINTR) continue;
        return errno != 0 ? errno : ECHILD;
    }
}

// Polls for exit until the deadline. Returns false when the child is still
// running once the budget is spent.
inline bool wait_child_until(pid_t pid, int& status, std::chrono::steady_clock::time_point deadline, int& err) {
    using namespace std::chrono;
    err = 0;
    for (;;) {
        const pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) return true;
        if (r < 0) {
            if (errno == EINTR) continue;
            err = errno;
            return true;
        }
        if (steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(milliseconds(1));
    }
}

// Blocks until the child exits. timeout_ms <= 0 waits forever; otherwise the
// child is killed with SIGKILL once the budget is spent. The budget covers the
// whole run, including a child that closed stdout and kept running.
inline ProcessResult run_process(const std::vector<std::string>& argv, int64_t timeout_ms = 0) {
    using namespace std::chrono;
    ProcessResult out;
    if (argv.empty()) {
        out.error = "empty command line";
        return out;
    }

    PipeGuard pipe_fds;
    if (!pipe_fds.open()) {
        out.error = std::string("pipe: ") + std::strerror(errno);
        return out;
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, pipe_fds.write_fd(), STDOUT_FILENO);
    posix_spawn_file_actions_addclose(&actions, pipe_fds.read_fd());
    posix_spawn_file_actions_addclose(&actions, pipe_fds.write_fd());

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    const auto start = steady_clock::now();
    pid_t pid = 0;
    const int spawn_rc = ::posix_spawnp(&pid, cargv[0], &actions, nullptr, cargv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    if (spawn_rc != 0) {
        out.error = std::string("posix_spawnp: ") + std::strerror(spawn_rc);
        return out;
    }
    out.spawned = true;
    pipe_fds.close_write();

    const auto deadline = start + milliseconds(timeout_ms > 0 ? timeout_ms : 0);
    char buf[4096];
    for (;;) {
        int wait_ms = -1;
        if (timeout_ms > 0) {
            const auto left = duration_cast<milliseconds>(deadline - steady_clock::now()).count();
            if (left <= 0) {
                out.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(left);
        }
        pollfd pfd{pipe_fds.read_fd(), POLLIN, 0};
        const int pr = ::poll(&pfd, 1, wait_ms);
        if (pr < 0) {
            if (errno == EINTR) continue;
            out.error = std::string("poll: ") + std::strerror(errno);
            break;
        }
        if (pr == 0) {
            out.timed_out = true;
            break;
        }
        const ssize_t n = ::read(pipe_fds.read_fd(), buf, sizeof(buf));
        if (n > 0) {
            out.stdout_text.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0) out.error = std::string("read: ") + std::strerror(errno);
        break;
    }
    pipe_fds.close_read();

    int status = 0;
    int wait_rc = 0;
    bool reaped = false;
    // After a pipe error the child is killed instead of waited on.
    if (!out.timed_out && out.error.empty() && timeout_ms > 0) {
        reaped = wait_child_until(pid, status, deadline, wait_rc);
        out.timed_out = !reaped;
    }
    if (!reaped) {
        if (out.timed_out || !out.error.empty()) {
            ::kill(pid, SIGKILL);
        }
        wait_rc = wait_child(pid, status);
    }
    out.elapsed_ms = duration<double, std::milli>(steady_clock::now() - start).count();
    if (wait_rc != 0) {
        out.error = std::string("waitpid: ") + std::strerror(wait_rc);
        return out;
    }
    if (WIFEXITED(status)) {
        out.exited = true;
        out.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        out.term_signal = WTERMSIG(status);
    }
    return out;
}

} // namespace figfuzz::harness
