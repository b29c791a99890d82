#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace sshmcp {

/// Diagnostics logger ("sshmcp"), writing to stderr only.
/// stdout is reserved for the response envelope.
std::shared_ptr<spdlog::logger> logger();

/// Set the diagnostics level by spdlog level name ("debug", "warn", "off", ...).
/// Unknown names leave the level unchanged and return false.
bool set_log_level(const std::string& level);

} // namespace sshmcp
