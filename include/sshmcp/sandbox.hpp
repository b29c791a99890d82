#pragma once
#include "registry.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sshmcp {

struct ExecutionOutcome {
    int exit_code = 0;
    std::string stdout_data;
    std::string stderr_data;
    bool timed_out = false;
    int term_signal = 0;                    // signal that ended the process, 0 if it exited
    std::chrono::milliseconds duration{0};

    [[nodiscard]] bool succeeded() const { return exit_code == 0 && !timed_out; }
};

/// Uniquely named file holding a request's args. Removed on destruction.
class ArgsFile {
public:
    /// Throws SandboxError if the file cannot be created or written.
    ArgsFile(const nlohmann::json& args, const std::filesystem::path& dir);
    ~ArgsFile();

    ArgsFile(const ArgsFile&) = delete;
    ArgsFile& operator=(const ArgsFile&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

/// Runs tools as child processes. A tool receives the path of its args file
/// as its only argument, never the argument values themselves.
class Sandbox {
public:
    struct Options {
        std::string interpreter = "/bin/bash";   // empty: execute the tool directly
        std::chrono::milliseconds timeout{60000}; // 0 disables the deadline
        std::chrono::milliseconds kill_grace{2000};
        std::filesystem::path temp_dir;           // empty: $TMPDIR, else /tmp
    };

    static constexpr int TIMEOUT_EXIT_CODE = 124;
    static constexpr int EXEC_FAILED_EXIT_CODE = 127;

    Sandbox();
    explicit Sandbox(Options opts);

    /// Execute a script entry with the given args object.
    /// Throws SandboxError when the process cannot be started.
    [[nodiscard]] ExecutionOutcome execute(const ToolEntry& entry,
                                           const nlohmann::json& args) const;

    /// Run an argv vector under the same capture and deadline rules.
    [[nodiscard]] ExecutionOutcome run(const std::vector<std::string>& argv) const;

    [[nodiscard]] const Options& options() const { return opts_; }
    [[nodiscard]] std::filesystem::path temp_dir() const;

private:
    Options opts_;
};

} // namespace sshmcp
