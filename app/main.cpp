/// ssh-mcp dispatcher: reads one request envelope on stdin (or builds one
/// from --list / --describe) and writes one response envelope on stdout.

#include <sshmcp/sshmcp.hpp>
#include <csignal>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    std::signal(SIGPIPE, SIG_IGN);

    std::vector<std::string> args(argv + 1, argv + argc);

    sshmcp::CliOptions cli;
    try {
        cli = sshmcp::parse_cli(args);
    } catch (const sshmcp::UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << sshmcp::usage_text();
        return 1;
    }

    if (cli.mode == sshmcp::CliOptions::Mode::Help) {
        std::cout << sshmcp::usage_text();
        return 0;
    }
    if (cli.mode == sshmcp::CliOptions::Mode::Version) {
        std::cout << sshmcp::version_text() << "\n";
        return 0;
    }

    sshmcp::Config cfg;
    try {
        cfg = sshmcp::Config::load(sshmcp::executable_dir(), cli.config_file);
        sshmcp::apply_cli(cli, cfg);
    } catch (const sshmcp::ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (!sshmcp::set_log_level(cfg.log_level)) {
        sshmcp::logger()->warn("unknown log level '{}', keeping default", cfg.log_level);
    }
    sshmcp::logger()->debug("JSON parser backend: {}", sshmcp::Codec::json_backend());

    sshmcp::Dispatcher dispatcher(sshmcp::Dispatcher::options_from(cfg));

    std::string payload;
    if (cli.mode == sshmcp::CliOptions::Mode::Stdin) {
        std::ostringstream oss;
        oss << std::cin.rdbuf();
        payload = oss.str();
    } else {
        payload = sshmcp::shorthand_request(cli);
    }

    auto result = dispatcher.handle(payload);
    std::cout << result.body << std::endl;
    return result.exit_code;
}
