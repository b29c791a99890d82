#include "sshmcp/cli.hpp"
#include "sshmcp/meta_tools.hpp"
#include "sshmcp/version.hpp"
#include <nlohmann/json.hpp>

namespace sshmcp {

CliOptions parse_cli(const std::vector<std::string>& args) {
    CliOptions cli;
    bool mode_set = false;

    auto set_mode = [&](CliOptions::Mode mode, const std::string& flag) {
        if (mode_set && cli.mode != mode) {
            throw UsageError("Option " + flag + " conflicts with an earlier option");
        }
        cli.mode = mode;
        mode_set = true;
    };

    auto value_of = [&args](size_t& i, const std::string& flag) -> std::string {
        if (i + 1 >= args.size() || args[i + 1].empty() || args[i + 1][0] == '-') {
            throw UsageError(flag + " requires a value");
        }
        return args[++i];
    };

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            set_mode(CliOptions::Mode::Help, arg);
        } else if (arg == "--version") {
            set_mode(CliOptions::Mode::Version, arg);
        } else if (arg == "--list") {
            set_mode(CliOptions::Mode::List, arg);
        } else if (arg == "--describe") {
            if (i + 1 >= args.size() || args[i + 1].empty() || args[i + 1][0] == '-') {
                throw UsageError("Tool name required\nUsage: ssh-mcp --describe TOOL");
            }
            set_mode(CliOptions::Mode::Describe, arg);
            cli.describe_tool = args[++i];
        } else if (arg == "--tools-dir") {
            cli.tool_dirs.emplace_back(value_of(i, arg));
        } else if (arg == "--timeout") {
            try {
                cli.timeout = parse_timeout_seconds(value_of(i, arg));
            } catch (const ConfigError& e) {
                throw UsageError(e.what());
            }
        } else if (arg == "--log-file") {
            cli.log_file = value_of(i, arg);
        } else if (arg == "--no-log") {
            cli.no_log = true;
        } else if (arg == "--config") {
            cli.config_file = value_of(i, arg);
        } else if (arg == "--verbose" || arg == "-v") {
            cli.verbose = true;
        } else {
            throw UsageError("Unknown option: " + arg);
        }
    }
    return cli;
}

std::string shorthand_request(const CliOptions& cli) {
    nlohmann::json req;
    switch (cli.mode) {
        case CliOptions::Mode::List:
            req = {{"tool", MetaTools::DISCOVER}, {"args", nlohmann::json::object()}};
            break;
        case CliOptions::Mode::Describe:
            req = {{"tool", MetaTools::DESCRIBE}, {"args", {{"tool", cli.describe_tool}}}};
            break;
        default:
            return {};
    }
    return req.dump();
}

void apply_cli(const CliOptions& cli, Config& cfg) {
    if (!cli.tool_dirs.empty()) cfg.prepend_tool_dirs(cli.tool_dirs);
    if (cli.timeout) cfg.timeout = *cli.timeout;
    if (cli.log_file) {
        cfg.log_file = *cli.log_file;
        cfg.log_enabled = true;
    }
    if (cli.no_log) cfg.log_enabled = false;
    if (cli.verbose) cfg.log_level = "debug";
}

std::string usage_text() {
    return
        "ssh-mcp: Machine Chat Protocol over SSH\n"
        "\n"
        "USAGE:\n"
        "  ssh-mcp                      Process one JSON request from stdin\n"
        "  ssh-mcp --list               List available tools\n"
        "  ssh-mcp --describe TOOL      Show details for a specific tool\n"
        "  ssh-mcp --version            Show version information\n"
        "  ssh-mcp --help               Show this help message\n"
        "\n"
        "OPTIONS:\n"
        "  --tools-dir DIR              Search DIR before the configured tool directories\n"
        "                               (repeatable)\n"
        "  --timeout SECONDS            Tool execution deadline, 0 disables (default 60)\n"
        "  --log-file PATH              Request/response log file\n"
        "  --no-log                     Do not write the request/response log\n"
        "  --config PATH                Configuration file (default $SSHMCP_HOME/config.json)\n"
        "  -v, --verbose                Debug diagnostics on stderr\n"
        "\n"
        "ENVIRONMENT:\n"
        "  SSHMCP_HOME                  State directory (default ~/.ssh-mcp)\n"
        "  SSHMCP_TOOL_PATH             Colon-separated directories searched first\n"
        "  SSHMCP_LOG_FILE              Request/response log file, empty disables\n"
        "  SSHMCP_TIMEOUT               Tool execution deadline in seconds\n"
        "  SSHMCP_INTERPRETER           Program used to run tools (default /bin/bash)\n"
        "  SSHMCP_LOG_LEVEL             Diagnostics level (trace, debug, info, warn, error, off)\n"
        "\n"
        "EXAMPLES:\n"
        "  echo '{\"tool\":\"system.info\",\"args\":{\"verbose\":true}}' | ssh-mcp\n"
        "  ssh-mcp --list\n"
        "  ssh-mcp --describe system.info\n";
}

std::string version_text() {
    return std::string(PROGRAM_NAME) + " version " + std::string(LIBRARY_VERSION);
}

} // namespace sshmcp
