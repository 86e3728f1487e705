/**
 * @file external_tool_runner.cpp
 * @brief ExternalToolRunner implementation.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#include "lanscope/core/external_tool_runner.hpp"
#include "lanscope/core/settle_once.hpp"
#include "lanscope/net/platform.hpp"
#include "lanscope/utils/logger.hpp"

#include <chrono>
#include <csignal>
#include <cstring>
#include <memory>
#include <mutex>
#include <thread>

#include <sys/wait.h>

namespace lanscope {
namespace core {

namespace {

constexpr const char* kTimeoutPrefix = "Timed out after ";
constexpr const char* kErrorPrefix = "Error: ";
constexpr std::chrono::milliseconds kPollInterval(50);
constexpr std::chrono::milliseconds kDrainWindow(200);

// Shared between the caller and the detached watcher thread.
struct ChildState {
    SettleOnce<ToolOutput> result;
    std::mutex mutex;       // guards output and reaped
    std::string output;
    bool reaped = false;
    pid_t pid = -1;
};

ToolOutput spawnFailure(const std::string& command, int error) {
    ToolOutput out;
    out.outcome = ToolOutcome::SpawnFailed;
    out.text = std::string(kErrorPrefix) + "Failed to launch " + command + ": " + std::strerror(error);
    return out;
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Appends whatever is readable now. Returns false once the pipe is at EOF.
bool readAvailable(ChildState& state, int fd) {
    char buf[4096];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            std::lock_guard<std::mutex> lock(state.mutex);
            state.output.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return true;
        }
        return false;
    }
}

// Non-reaping exit check. ECHILD counts as exited so the loop cannot spin.
bool childExited(pid_t pid) {
    siginfo_t info{};
    int rc;
    do {
        rc = ::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT);
    } while (rc < 0 && errno == EINTR);
    return rc != 0 || info.si_pid == pid;
}

void watchChild(std::shared_ptr<ChildState> state, int fd) {
    net::UniqueFd in(fd);
    ::fcntl(in.get(), F_SETFL, ::fcntl(in.get(), F_GETFL) | O_NONBLOCK);

    bool open = true;
    while (open && !childExited(state->pid)) {
        pollfd pfd{in.get(), POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(kPollInterval.count()));
        if (rc > 0) {
            open = readAvailable(*state, in.get());
        } else if (rc < 0 && errno != EINTR) {
            open = false;
        }
    }

    // The child is gone but a background descendant may still hold the
    // write end, so stop at EOF or when the drain window closes.
    auto drainUntil = std::chrono::steady_clock::now() + kDrainWindow;
    while (open) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            drainUntil - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            break;
        }
        pollfd pfd{in.get(), POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(left.count()));
        if (rc > 0) {
            open = readAvailable(*state, in.get());
        } else if (rc == 0 || errno != EINTR) {
            break;
        }
    }

    // Wait without reaping so a concurrent kill() cannot hit a recycled pid
    siginfo_t info{};
    while (::waitid(P_PID, static_cast<id_t>(state->pid), &info, WEXITED | WNOWAIT) < 0 &&
           errno == EINTR) {
    }

    ToolOutput done;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        int status = 0;
        if (::waitpid(state->pid, &status, 0) == state->pid) {
            done.exitCode = decodeStatus(status);
        }
        state->reaped = true;
        done.text = state->output;
    }
    done.outcome = ToolOutcome::Completed;
    state->result.settle(std::move(done));
}

}  // namespace

std::string timeoutMessage(const std::string& command, std::chrono::milliseconds timeout) {
    return std::string(kTimeoutPrefix) + std::to_string(timeout.count()) + "ms: " + command;
}

bool isTimeoutMessage(const std::string& text) {
    return text.rfind(kTimeoutPrefix, 0) == 0;
}

bool isSpawnError(const std::string& text) {
    return text.rfind(kErrorPrefix, 0) == 0;
}

std::string CommandRunner::run(const std::string& command,
                               const std::vector<std::string>& arguments,
                               std::chrono::milliseconds timeout) {
    ToolOutput out = execute(command, arguments, timeout);
    switch (out.outcome) {
        case ToolOutcome::Completed:
            return out.text.empty() ? std::string(kNoOutput) : out.text;
        case ToolOutcome::TimedOut:
            return timeoutMessage(command, timeout);
        case ToolOutcome::SpawnFailed:
            return out.text;
    }
    return out.text;
}

ToolOutput ExternalToolRunner::execute(const std::string& command,
                                       const std::vector<std::string>& arguments,
                                       std::chrono::milliseconds timeout) {
    // Build argv before fork; the child may only make async-signal-safe calls
    std::vector<std::string> args;
    args.reserve(arguments.size() + 1);
    args.push_back(command);
    args.insert(args.end(), arguments.begin(), arguments.end());
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int outPipe[2];
    if (::pipe2(outPipe, O_CLOEXEC) != 0) {
        return spawnFailure(command, errno);
    }
    int errPipe[2];
    if (::pipe2(errPipe, O_CLOEXEC) != 0) {
        int error = errno;
        ::close(outPipe[0]);
        ::close(outPipe[1]);
        return spawnFailure(command, error);
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int error = errno;
        for (int fd : {outPipe[0], outPipe[1], errPipe[0], errPipe[1]}) {
            ::close(fd);
        }
        return spawnFailure(command, error);
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(outPipe[1], STDERR_FILENO);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::execvp(argv[0], argv.data());
        int error = errno;
        ssize_t ignored = ::write(errPipe[1], &error, sizeof(error));
        (void)ignored;
        ::_exit(127);
    }

    // Mirror the child's setpgid so kill(-pid) works even if we win the race
    ::setpgid(pid, pid);

    net::UniqueFd readEnd(outPipe[0]);
    ::close(outPipe[1]);
    net::UniqueFd execStatus(errPipe[0]);
    ::close(errPipe[1]);

    // Closed by exec on success; carries errno on failure
    int childError = 0;
    ssize_t n;
    do {
        n = ::read(execStatus.get(), &childError, sizeof(childError));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(childError))) {
        ::waitpid(pid, nullptr, 0);
        LOG_WARN("ToolRunner", "Failed to launch {}: {}", command, std::strerror(childError));
        return spawnFailure(command, childError);
    }

    LOG_DEBUG("ToolRunner", "Started {} (pid {}, timeout {}ms)", command, pid, timeout.count());

    auto state = std::make_shared<ChildState>();
    state->pid = pid;
    std::thread(watchChild, state, readEnd.release()).detach();

    if (auto done = state->result.waitFor(timeout)) {
        LOG_TRACE("ToolRunner", "{} exited with {}", command, done->exitCode);
        return *done;
    }

    ToolOutput timedOut;
    timedOut.outcome = ToolOutcome::TimedOut;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        timedOut.text = state->output;
    }
    if (!state->result.settle(timedOut)) {
        // The watcher finished between the deadline and our settle
        return state->result.wait();
    }

    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (!state->reaped) {
            if (::kill(-pid, SIGKILL) != 0) {
                ::kill(pid, SIGKILL);
            }
        }
    }
    LOG_WARN("ToolRunner", "{} timed out after {}ms, killed", command, timeout.count());
    return timedOut;
}

}  // namespace core
}  // namespace lanscope
