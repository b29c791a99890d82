#include "sshmcp/config.hpp"
#include "sshmcp/error.hpp"
#include <pwd.h>
#include <unistd.h>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace sshmcp {

namespace {

const char* system_getenv(const char* name) {
    return std::getenv(name);
}

fs::path expand_path(const std::string& raw, const fs::path& base) {
    if (raw == "~") return user_home();
    if (raw.rfind("~/", 0) == 0) return user_home() / raw.substr(2);
    fs::path p(raw);
    if (p.is_relative() && !base.empty()) return base / p;
    return p;
}

std::vector<fs::path> split_path_list(const std::string& value) {
    std::vector<fs::path> dirs;
    size_t start = 0;
    while (start <= value.size()) {
        size_t colon = value.find(':', start);
        if (colon == std::string::npos) colon = value.size();
        std::string item = value.substr(start, colon - start);
        if (!item.empty()) dirs.push_back(expand_path(item, {}));
        start = colon + 1;
    }
    return dirs;
}

/// Seconds to milliseconds, capped at MAX_TIMEOUT. Rejects negative and non-finite values.
std::chrono::milliseconds timeout_from_seconds(double seconds, const std::string& source) {
    if (!std::isfinite(seconds) || seconds < 0) {
        throw ConfigError("Invalid timeout '" + source + "': expected non-negative seconds");
    }
    const double max_ms = static_cast<double>(
        std::chrono::duration_cast<std::chrono::milliseconds>(MAX_TIMEOUT).count());
    double ms = seconds * 1000.0;
    if (ms >= max_ms) return MAX_TIMEOUT;
    return std::chrono::milliseconds(static_cast<int64_t>(ms));
}

} // anonymous namespace

std::chrono::milliseconds parse_timeout_seconds(const std::string& text) {
    double seconds = 0;
    size_t consumed = 0;
    try {
        seconds = std::stod(text, &consumed);
    } catch (const std::exception&) {
        throw ConfigError("Invalid timeout '" + text + "': expected seconds");
    }
    if (consumed != text.size()) {
        throw ConfigError("Invalid timeout '" + text + "': expected non-negative seconds");
    }
    return timeout_from_seconds(seconds, text);
}

fs::path executable_dir() {
    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (!ec && exe.has_parent_path()) return exe.parent_path();
    fs::path cwd = fs::current_path(ec);
    return ec ? fs::path(".") : cwd;
}

fs::path user_home() {
    const char* home = std::getenv("HOME");
    if (home && *home) return home;
    if (const struct passwd* pw = ::getpwuid(::getuid())) {
        if (pw->pw_dir && *pw->pw_dir) return pw->pw_dir;
    }
    return ".";
}

Config Config::defaults(const fs::path& exe_dir, const fs::path& home) {
    Config cfg;
    cfg.home = home;
    cfg.tool_dirs = {
        exe_dir / "install" / "tools",
        (exe_dir / ".." / "share" / "ssh-mcp" / "tools").lexically_normal(),
        cfg.global_tool_dir(),
    };
    cfg.log_file = home / "mcp.log";
    return cfg;
}

Config Config::load(const fs::path& exe_dir,
                    const std::optional<fs::path>& config_file,
                    const std::function<const char*(const char*)>& getenv) {
    auto env = getenv ? getenv : std::function<const char*(const char*)>(system_getenv);

    fs::path home;
    const char* home_env = env("SSHMCP_HOME");
    if (home_env && *home_env) {
        home = expand_path(home_env, {});
    } else {
        home = user_home() / ".ssh-mcp";
    }

    Config cfg = defaults(exe_dir, home);

    fs::path file = config_file ? *config_file : home / "config.json";
    std::error_code ec;
    if (fs::exists(file, ec)) {
        std::ifstream in(file);
        if (!in) {
            throw ConfigError("Cannot read config file " + file.string());
        }
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(in);
        } catch (const nlohmann::json::exception& e) {
            throw ConfigError("Malformed config file " + file.string() + ": " + e.what());
        }
        cfg.apply_json(j);
    } else if (config_file) {
        throw ConfigError("Config file not found: " + file.string());
    }

    cfg.apply_env(env);
    return cfg;
}

void Config::apply_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("Config file must contain a JSON object");
    }

    try {
        if (j.contains("tool_dirs")) {
            std::vector<fs::path> dirs;
            for (const auto& d : j.at("tool_dirs")) {
                dirs.push_back(expand_path(d.get<std::string>(), home));
            }
            tool_dirs = std::move(dirs);
        }
        if (j.contains("log_file")) {
            std::string path = j.at("log_file").get<std::string>();
            if (path.empty()) {
                log_enabled = false;
            } else {
                log_file = expand_path(path, home);
            }
        }
        if (j.contains("log_enabled")) log_enabled = j.at("log_enabled").get<bool>();
        if (j.contains("log_level")) log_level = j.at("log_level").get<std::string>();
        if (j.contains("interpreter")) interpreter = j.at("interpreter").get<std::string>();
        if (j.contains("timeout_seconds")) {
            const auto& value = j.at("timeout_seconds");
            timeout = timeout_from_seconds(value.get<double>(), value.dump());
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid config value: ") + e.what());
    }
}

void Config::apply_env(const std::function<const char*(const char*)>& getenv) {
    if (const char* v = getenv("SSHMCP_TOOL_PATH"); v && *v) {
        prepend_tool_dirs(split_path_list(v));
    }
    if (const char* v = getenv("SSHMCP_LOG_FILE")) {
        if (*v) {
            log_file = expand_path(v, {});
            log_enabled = true;
        } else {
            log_enabled = false;
        }
    }
    if (const char* v = getenv("SSHMCP_TIMEOUT"); v && *v) {
        timeout = parse_timeout_seconds(v);
    }
    if (const char* v = getenv("SSHMCP_INTERPRETER")) {
        interpreter = v;
    }
    if (const char* v = getenv("SSHMCP_LOG_LEVEL"); v && *v) {
        log_level = v;
    }
}

void Config::prepend_tool_dirs(const std::vector<fs::path>& dirs) {
    std::vector<fs::path> merged = dirs;
    for (const auto& d : tool_dirs) merged.push_back(d);
    tool_dirs = std::move(merged);
}

} // namespace sshmcp
