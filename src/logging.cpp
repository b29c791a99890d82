#include "sshmcp/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace sshmcp {

namespace {
constexpr const char* kLoggerName = "sshmcp";
std::once_flag g_logger_once;
} // anonymous namespace

std::shared_ptr<spdlog::logger> logger() {
    std::call_once(g_logger_once, [] {
        if (!spdlog::get(kLoggerName)) {
            auto log = spdlog::stderr_color_mt(kLoggerName);
            log->set_pattern("[%Y-%m-%dT%H:%M:%S.%e] [%n] [%^%l%$] %v");
            log->set_level(spdlog::level::warn);
        }
    });
    return spdlog::get(kLoggerName);
}

bool set_log_level(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"; only accept "off" when asked for
    if (parsed == spdlog::level::off && level != "off") {
        return false;
    }
    logger()->set_level(parsed);
    return true;
}

} // namespace sshmcp
