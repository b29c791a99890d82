#pragma once
#include <string_view>

namespace sshmcp {

constexpr std::string_view PROGRAM_NAME     = "ssh-mcp";
constexpr std::string_view LIBRARY_VERSION  = "0.1.0";

} // namespace sshmcp
