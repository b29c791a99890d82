#pragma once
#include "config.hpp"
#include "error.hpp"
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sshmcp {

class UsageError : public SshMcpError {
public:
    using SshMcpError::SshMcpError;
};

struct CliOptions {
    enum class Mode {
        Stdin,      // read one request envelope from stdin
        List,       // meta.discover with no filter
        Describe,   // meta.describe for describe_tool
        Version,
        Help
    };

    Mode mode = Mode::Stdin;
    std::string describe_tool;

    std::vector<std::filesystem::path> tool_dirs;
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<std::filesystem::path> log_file;
    std::optional<std::filesystem::path> config_file;
    bool no_log = false;
    bool verbose = false;
};

/// Parse argv (without the program name). Throws UsageError.
[[nodiscard]] CliOptions parse_cli(const std::vector<std::string>& args);

/// Request body for the List and Describe shorthands.
[[nodiscard]] std::string shorthand_request(const CliOptions& cli);

/// Overlay command-line settings onto a loaded configuration.
void apply_cli(const CliOptions& cli, Config& cfg);

[[nodiscard]] std::string usage_text();
[[nodiscard]] std::string version_text();

} // namespace sshmcp
