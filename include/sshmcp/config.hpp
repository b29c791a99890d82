#pragma once
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sshmcp {

/// Longer timeouts are clamped to this.
constexpr std::chrono::hours MAX_TIMEOUT{24};

/// Runtime configuration of the dispatcher.
///
/// Sources, lowest to highest precedence:
///   1. built-in defaults (see Config::defaults)
///   2. JSON config file ($SSHMCP_HOME/config.json, or an explicit path)
///   3. environment (SSHMCP_*)
///   4. command-line flags (applied by the caller)
struct Config {
    /// ~/.ssh-mcp unless SSHMCP_HOME is set.
    std::filesystem::path home;

    /// Search directories in precedence order: <exe-dir>/install/tools (source
    /// checkout or build tree), <exe-dir>/../share/ssh-mcp/tools (installed
    /// copy), then the user-global directory.
    std::vector<std::filesystem::path> tool_dirs;

    std::filesystem::path log_file;
    bool log_enabled = true;
    std::string log_level = "warn";

    std::string interpreter = "/bin/bash";
    std::chrono::milliseconds timeout{60000};

    /// Defaults relative to the executable's directory and the home directory.
    static Config defaults(const std::filesystem::path& exe_dir,
                           const std::filesystem::path& home);

    /// defaults() + config file + environment. `getenv` is injectable for tests.
    /// Throws ConfigError on a malformed file or value.
    static Config load(const std::filesystem::path& exe_dir,
                       const std::optional<std::filesystem::path>& config_file = std::nullopt,
                       const std::function<const char*(const char*)>& getenv = nullptr);

    /// Overlay keys from a parsed config document.
    void apply_json(const nlohmann::json& j);

    /// Overlay SSHMCP_* environment variables.
    void apply_env(const std::function<const char*(const char*)>& getenv);

    /// Put directories ahead of the current search order.
    void prepend_tool_dirs(const std::vector<std::filesystem::path>& dirs);

    [[nodiscard]] std::filesystem::path global_tool_dir() const { return home / "tools"; }
};

/// Parse "30", "2.5" (seconds) into milliseconds, capped at MAX_TIMEOUT.
/// Throws ConfigError on malformed, negative or non-finite input.
std::chrono::milliseconds parse_timeout_seconds(const std::string& text);

/// Directory holding the running executable (falls back to the cwd).
std::filesystem::path executable_dir();

/// $HOME with a passwd fallback.
std::filesystem::path user_home();

} // namespace sshmcp
