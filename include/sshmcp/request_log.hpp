#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace sshmcp {

/// Append-only REQUEST/RESPONSE log shared by all dispatcher processes.
///
/// Line format:
///   <UTC %Y-%m-%dT%H:%M:%SZ> [<conversation_id>] REQUEST: <json>
///   <UTC %Y-%m-%dT%H:%M:%SZ> [<conversation_id>] RESPONSE: <json>
///
/// Each append takes an exclusive flock on the file, so concurrent writers
/// never interleave within a line. Failures are reported through the
/// diagnostics logger and returned as false; they never throw.
class RequestLog {
public:
    /// A default-constructed log is disabled and accepts every append.
    RequestLog() = default;
    explicit RequestLog(std::filesystem::path path);

    bool log_request(const std::string& conversation_id, std::string_view body);
    bool log_response(const std::string& conversation_id, std::string_view body);

    /// Write one record. Embedded newlines in `body` are escaped.
    bool append(const std::string& conversation_id, std::string_view kind,
                std::string_view body);

    [[nodiscard]] bool enabled() const { return !path_.empty(); }
    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    /// Build a record line (without trailing newline).
    [[nodiscard]] static std::string format_line(const std::string& timestamp,
                                                 const std::string& conversation_id,
                                                 std::string_view kind,
                                                 std::string_view body);

    /// Current UTC time as %Y-%m-%dT%H:%M:%SZ.
    [[nodiscard]] static std::string timestamp_now();

private:
    std::filesystem::path path_;
};

} // namespace sshmcp
