/**
 * @file process_utils.cpp
 * @brief posix_spawn based process runner
 *
 * The child gets `/dev/null` on stdin and one pipe each for stdout and
 * stderr. The parent multiplexes both pipes with poll() so a chatty stderr
 * cannot deadlock a child blocked on a full stdout pipe.
 *
 * @date 2025
 */

#include "codebox/utils/process_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace codebox {
namespace utils {

namespace {

// ============================================================================
// FILE DESCRIPTOR HELPERS
// ============================================================================

class ScopedFd {
public:
    ScopedFd() = default;
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd() { Reset(); }

    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int Get() const { return fd_; }
    bool Valid() const { return fd_ >= 0; }

    void Reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_{-1};
};

void MakePipe(ScopedFd& read_end, ScopedFd& write_end) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe2");
    }
    read_end.Reset(fds[0]);
    write_end.Reset(fds[1]);
}

class SpawnActions {
public:
    SpawnActions() {
        int rc = posix_spawn_file_actions_init(&actions_);
        if (rc != 0) {
            throw std::system_error(rc, std::generic_category(), "posix_spawn_file_actions_init");
        }
    }
    ~SpawnActions() { posix_spawn_file_actions_destroy(&actions_); }

    SpawnActions(const SpawnActions&) = delete;
    SpawnActions& operator=(const SpawnActions&) = delete;

    void Dup2(int fd, int target) {
        int rc = posix_spawn_file_actions_adddup2(&actions_, fd, target);
        if (rc != 0) {
            throw std::system_error(rc, std::generic_category(), "posix_spawn_file_actions_adddup2");
        }
    }

    posix_spawn_file_actions_t* Get() { return &actions_; }

private:
    posix_spawn_file_actions_t actions_;
};

int WaitForChild(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitpid");
        }
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Appends up to the cap and discards the rest; returns false on EOF.
bool DrainInto(int fd, std::string& sink, std::size_t cap) {
    std::array<char, 4096> buffer;
    ssize_t n = ::read(fd, buffer.data(), buffer.size());
    if (n < 0) {
        return errno == EINTR || errno == EAGAIN;
    }
    if (n == 0) {
        return false;
    }
    if (sink.size() < cap) {
        std::size_t room = cap - sink.size();
        sink.append(buffer.data(), std::min(room, static_cast<std::size_t>(n)));
    }
    return true;
}

} // anonymous namespace

// ============================================================================
// PROCESS EXECUTION
// ============================================================================

ProcessResult RunProcess(const std::vector<std::string>& argv,
                         const ProcessOptions& options) {
    if (argv.empty()) {
        throw std::invalid_argument("RunProcess: empty argv");
    }

    ScopedFd dev_null(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (!dev_null.Valid()) {
        throw std::system_error(errno, std::generic_category(), "open /dev/null");
    }

    ScopedFd out_read, out_write, err_read, err_write;
    MakePipe(out_read, out_write);
    MakePipe(err_read, err_write);

    SpawnActions actions;
    actions.Dup2(dev_null.Get(), STDIN_FILENO);
    actions.Dup2(out_write.Get(), STDOUT_FILENO);
    actions.Dup2(err_write.Get(), STDERR_FILENO);

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    pid_t pid = 0;
    int rc = ::posix_spawnp(&pid, c_argv[0], actions.Get(), nullptr, c_argv.data(), environ);
    if (rc != 0) {
        throw std::system_error(rc, std::generic_category(), "posix_spawnp " + argv[0]);
    }

    // Parent keeps only the read ends
    out_write.Reset();
    err_write.Reset();
    dev_null.Reset();

    ProcessResult result;
    auto deadline = std::chrono::steady_clock::time_point::max();
    if (options.timeout) {
        deadline = std::chrono::steady_clock::now() + *options.timeout;
    }

    while (out_read.Valid() || err_read.Valid()) {
        std::array<pollfd, 2> fds{};
        nfds_t count = 0;
        if (out_read.Valid()) fds[count++] = {out_read.Get(), POLLIN, 0};
        if (err_read.Valid()) fds[count++] = {err_read.Get(), POLLIN, 0};

        int wait_ms = -1;
        if (options.timeout) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                result.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(remaining.count());
        }

        int ready = ::poll(fds.data(), count, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            int saved = errno;
            ::kill(pid, SIGKILL);
            WaitForChild(pid);
            throw std::system_error(saved, std::generic_category(), "poll");
        }
        if (ready == 0) {
            continue;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            bool is_stdout = fds[i].fd == out_read.Get();
            std::string& sink = is_stdout ? result.stdout_output : result.stderr_output;
            if (!DrainInto(fds[i].fd, sink, options.max_output_bytes)) {
                (is_stdout ? out_read : err_read).Reset();
            }
        }
    }

    // Both pipes may close before the child exits
    if (!result.timed_out && options.timeout) {
        int status = 0;
        pid_t reaped = 0;
        while ((reaped = ::waitpid(pid, &status, WNOHANG)) == 0) {
            if (std::chrono::steady_clock::now() >= deadline) {
                result.timed_out = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (reaped == pid) {
            result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status)
                             : WIFSIGNALED(status) ? 128 + WTERMSIG(status) : -1;
            return result;
        }
        if (reaped < 0 && errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitpid");
        }
    }

    if (result.timed_out) {
        spdlog::debug("Process '{}' exceeded its timeout, sending SIGKILL", argv[0]);
        ::kill(pid, SIGKILL);
    }

    result.exit_code = WaitForChild(pid);
    return result;
}

} // namespace utils
} // namespace codebox
