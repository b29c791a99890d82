#include "sshmcp/sandbox.hpp"
#include "sshmcp/error.hpp"
#include "sshmcp/logging.hpp"
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <array>
#include <climits>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <thread>

namespace fs = std::filesystem;

namespace sshmcp {

namespace {

using Clock = std::chrono::steady_clock;

// Keeps started + timeout well inside steady_clock's range
constexpr std::chrono::hours MAX_DEADLINE{24 * 365};
constexpr std::chrono::milliseconds EXIT_CHECK_INTERVAL{100};
constexpr std::chrono::milliseconds DRAIN_WINDOW{200};

std::string errno_message(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

int exit_code_from_status(int status, int& term_signal) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) {
        term_signal = WTERMSIG(status);
        return 128 + term_signal;
    }
    return 1;
}

/// Non-blocking reap. Returns the wait status once the child is gone.
std::optional<int> try_reap(pid_t pid) {
    int status = 0;
    while (true) {
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) return status;
        if (r == 0) return std::nullopt;
        if (errno == EINTR) continue;
        return 0;   // ECHILD: already reaped elsewhere
    }
}

int reap_blocking(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return 0;
    }
    return status;
}

/// Poll for the child to exit until `until`. Returns status if it did.
std::optional<int> reap_until(pid_t pid, Clock::time_point until) {
    while (true) {
        if (auto status = try_reap(pid)) return status;
        if (Clock::now() >= until) return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

/// SIGTERM the process group, wait out the grace period, then SIGKILL.
int terminate_group(pid_t pid, std::chrono::milliseconds grace) {
    ::kill(-pid, SIGTERM);
    if (auto status = reap_until(pid, Clock::now() + grace)) {
        return *status;
    }
    logger()->warn("process {} ignored SIGTERM, sending SIGKILL", pid);
    ::kill(-pid, SIGKILL);
    return reap_blocking(pid);
}

} // anonymous namespace

// ----------- ArgsFile -----------

ArgsFile::ArgsFile(const nlohmann::json& args, const fs::path& dir) {
    std::string templ = (dir / "sshmcp-args-XXXXXX").string();
    int fd = ::mkstemp(templ.data());
    if (fd < 0) {
        throw SandboxError(errno_message("Failed to create argument file"));
    }
    path_ = templ;

    std::string data = args.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    data += '\n';
    const char* ptr = data.data();
    size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, ptr, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            std::string msg = errno_message("Failed to write argument file");
            ::close(fd);
            ::unlink(path_.c_str());
            throw SandboxError(msg);
        }
        ptr += written;
        remaining -= static_cast<size_t>(written);
    }
    if (::close(fd) != 0) {
        std::string msg = errno_message("Failed to close argument file");
        ::unlink(path_.c_str());
        throw SandboxError(msg);
    }
}

ArgsFile::~ArgsFile() {
    if (!path_.empty() && ::unlink(path_.c_str()) != 0 && errno != ENOENT) {
        logger()->warn("failed to remove argument file {}: {}", path_.string(),
                       std::strerror(errno));
    }
}

// ----------- Sandbox -----------

Sandbox::Sandbox() : Sandbox(Options{}) {}

Sandbox::Sandbox(Options opts) : opts_(std::move(opts)) {}

fs::path Sandbox::temp_dir() const {
    if (!opts_.temp_dir.empty()) return opts_.temp_dir;
    const char* env = std::getenv("TMPDIR");
    if (env && *env) return env;
    return "/tmp";
}

ExecutionOutcome Sandbox::execute(const ToolEntry& entry, const nlohmann::json& args) const {
    if (entry.kind != ToolKind::Script) {
        throw SandboxError("Tool " + entry.id + " is not an executable artifact");
    }

    ArgsFile args_file(args.is_null() ? nlohmann::json::object() : args, temp_dir());

    std::vector<std::string> argv;
    if (!opts_.interpreter.empty()) argv.push_back(opts_.interpreter);
    argv.push_back(entry.path.string());
    argv.push_back(args_file.path().string());

    logger()->debug("executing {} ({})", entry.id, entry.path.string());
    return run(argv);
}

ExecutionOutcome Sandbox::run(const std::vector<std::string>& argv) const {
    if (argv.empty()) {
        throw SandboxError("Empty command line");
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe2(out_pipe, O_CLOEXEC) < 0) {
        throw SandboxError(errno_message("Failed to create pipes"));
    }
    if (::pipe2(err_pipe, O_CLOEXEC) < 0) {
        std::string msg = errno_message("Failed to create pipes");
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        throw SandboxError(msg);
    }
    int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);

    // Build argv before fork: no allocation in the child
    std::vector<std::string> args_copy = argv;
    std::vector<char*> argv_vec;
    for (auto& a : args_copy) argv_vec.push_back(a.data());
    argv_vec.push_back(nullptr);

    auto started = Clock::now();
    pid_t pid = ::fork();
    if (pid < 0) {
        std::string msg = errno_message("Failed to fork process");
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        close_fd(devnull);
        throw SandboxError(msg);
    }

    if (pid == 0) {
        // Child: own process group so a timeout can take down grandchildren too
        ::setpgid(0, 0);
        ::signal(SIGPIPE, SIG_DFL);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvp(argv_vec[0], argv_vec.data());
        _exit(EXEC_FAILED_EXIT_CODE);
    }

    // Parent
    ::setpgid(pid, pid);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(devnull);

    ExecutionOutcome outcome;
    const bool bounded = opts_.timeout.count() > 0;
    const auto deadline = started + std::min<std::chrono::milliseconds>(opts_.timeout, MAX_DEADLINE);

    std::array<char, 4096> chunk;
    int fds[2] = {out_pipe[0], err_pipe[0]};
    std::string* sinks[2] = {&outcome.stdout_data, &outcome.stderr_data};

    // Once the tool itself has exited, pipes still held open by a leftover
    // background child are drained for at most DRAIN_WINDOW.
    std::optional<int> status;
    std::optional<Clock::time_point> drain_until;
    while (fds[0] >= 0 || fds[1] >= 0) {
        if (!status) {
            status = try_reap(pid);
            if (status) drain_until = Clock::now() + DRAIN_WINDOW;
        }

        int64_t wait_ms = -1;
        auto now = Clock::now();
        if (drain_until) {
            if (now >= *drain_until) {
                logger()->debug("process {} exited, abandoning pipes held by its children", pid);
                break;
            }
            wait_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                *drain_until - now).count() + 1;
        } else {
            if (bounded) {
                auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - now).count();
                if (left <= 0) {
                    outcome.timed_out = true;
                    break;
                }
                wait_ms = left;
            }
            // Wake periodically to notice the tool exiting
            if (wait_ms < 0 || wait_ms > EXIT_CHECK_INTERVAL.count()) {
                wait_ms = EXIT_CHECK_INTERVAL.count();
            }
        }

        struct pollfd pfds[2];
        for (int i = 0; i < 2; ++i) {
            pfds[i].fd = fds[i];
            pfds[i].events = POLLIN;
            pfds[i].revents = 0;
        }

        int ret = ::poll(pfds, 2, static_cast<int>(std::min<int64_t>(wait_ms, INT_MAX)));
        if (ret < 0) {
            if (errno == EINTR) continue;
            logger()->error("poll failed while waiting for process {}: {}", pid, std::strerror(errno));
            break;
        }
        if (ret == 0) continue;   // deadline re-checked at loop top

        for (int i = 0; i < 2; ++i) {
            if (fds[i] < 0) continue;
            if (!(pfds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t n = ::read(fds[i], chunk.data(), chunk.size());
            if (n > 0) {
                sinks[i]->append(chunk.data(), static_cast<size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                close_fd(fds[i]);   // EOF
            }
        }
    }

    if (!outcome.timed_out && !status) {
        // Output closed; the process may still be running (e.g. a detached child
        // holding no pipes), so the deadline still applies.
        if (bounded) {
            status = reap_until(pid, deadline);
            if (!status) outcome.timed_out = true;
        } else {
            status = reap_blocking(pid);
        }
    }

    if (outcome.timed_out) {
        logger()->warn("process {} exceeded {} ms, terminating", pid, opts_.timeout.count());
        terminate_group(pid, opts_.kill_grace);
        outcome.exit_code = TIMEOUT_EXIT_CODE;
    } else {
        outcome.exit_code = exit_code_from_status(*status, outcome.term_signal);
    }

    close_fd(fds[0]);
    close_fd(fds[1]);
    outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - started);
    logger()->debug("process {} finished with exit code {} in {} ms", pid,
                    outcome.exit_code, outcome.duration.count());
    return outcome;
}

} // namespace sshmcp
