/**
 * @file process_launcher.cpp
 * @brief PosixProcessLauncher implementation.
 *
 * The child gets stdout on /dev/null and stderr on a pipe. Both pipe ends are
 * close-on-exec so engine processes spawned concurrently from other job
 * threads never inherit each other's pipes (which would delay EOF).
 */

#include "executor/process_launcher.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

extern char** environ;

namespace tracie {

namespace {

/**
 * @brief RAII wrapper over posix_spawn_file_actions_t.
 */
class SpawnFileActions {
public:
    SpawnFileActions() { ::posix_spawn_file_actions_init(&actions_); }
    ~SpawnFileActions() { ::posix_spawn_file_actions_destroy(&actions_); }

    SpawnFileActions(const SpawnFileActions&) = delete;
    SpawnFileActions& operator=(const SpawnFileActions&) = delete;

    posix_spawn_file_actions_t* get() noexcept { return &actions_; }

private:
    posix_spawn_file_actions_t actions_;
};

/**
 * @brief RAII wrapper over posix_spawnattr_t.
 *
 * The child starts with an empty signal mask: the executor blocks SIGINT and
 * SIGTERM in all of its threads, and an engine must stay interruptible.
 */
class SpawnAttributes {
public:
    SpawnAttributes() {
        ::posix_spawnattr_init(&attr_);
        sigset_t empty;
        sigemptyset(&empty);
        ::posix_spawnattr_setsigmask(&attr_, &empty);
        ::posix_spawnattr_setflags(&attr_, POSIX_SPAWN_SETSIGMASK);
    }
    ~SpawnAttributes() { ::posix_spawnattr_destroy(&attr_); }

    SpawnAttributes(const SpawnAttributes&) = delete;
    SpawnAttributes& operator=(const SpawnAttributes&) = delete;

    const posix_spawnattr_t* get() const noexcept { return &attr_; }

private:
    posix_spawnattr_t attr_;
};

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

std::string read_all(int fd) {
    std::string out;
    char buf[4096];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            break;
        }
    }
    return out;
}

}  // anonymous namespace

Result<ProcessResult> PosixProcessLauncher::run(const EngineCommand& command) {
    int pipe_fds[2] = {-1, -1};
    if (::pipe2(pipe_fds, O_CLOEXEC) != 0) {
        return Error{ErrorCode::JobExecutionFailure,
                     "Failed to create stderr pipe: " + std::string(strerror(errno))};
    }
    int read_fd = pipe_fds[0];
    int write_fd = pipe_fds[1];

    SpawnFileActions actions;
    ::posix_spawn_file_actions_addopen(actions.get(), STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    ::posix_spawn_file_actions_adddup2(actions.get(), write_fd, STDERR_FILENO);

    std::vector<char*> argv;
    argv.reserve(command.args.size() + 2);
    // posix_spawnp takes char* const[]; the strings outlive the call.
    argv.push_back(const_cast<char*>(command.executable.c_str()));
    for (const auto& arg : command.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    SpawnAttributes attributes;
    pid_t pid = -1;
    int rc = ::posix_spawnp(&pid, command.executable.c_str(), actions.get(), attributes.get(),
                            argv.data(), environ);
    close_fd(write_fd);

    if (rc != 0) {
        close_fd(read_fd);
        if (rc == ENOENT) {
            return Error{ErrorCode::EngineNotFound,
                         "Engine executable not found: " + command.executable};
        }
        return Error{ErrorCode::JobExecutionFailure,
                     "Failed to start " + command.executable + ": " + std::string(strerror(rc))};
    }

    ProcessResult result;
    result.stderr_output = read_all(read_fd);
    close_fd(read_fd);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return Error{ErrorCode::JobExecutionFailure,
                         "waitpid failed: " + std::string(strerror(errno))};
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    } else {
        result.exit_code = -1;
    }
    return result;
}

}  // namespace tracie
