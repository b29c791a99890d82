#include "sshmcp/request_log.hpp"
#include "sshmcp/logging.hpp"
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <system_error>

namespace fs = std::filesystem;

namespace sshmcp {

namespace {

/// Holds an fd and its exclusive flock for the duration of one append.
class LockedFile {
public:
    explicit LockedFile(const fs::path& path) {
        fd_ = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0600);
        if (fd_ < 0) return;
        while (::flock(fd_, LOCK_EX) != 0) {
            if (errno != EINTR) {
                ::close(fd_);
                fd_ = -1;
                return;
            }
        }
    }

    ~LockedFile() {
        if (fd_ >= 0) {
            ::flock(fd_, LOCK_UN);
            ::close(fd_);
        }
    }

    LockedFile(const LockedFile&) = delete;
    LockedFile& operator=(const LockedFile&) = delete;

    [[nodiscard]] bool ok() const { return fd_ >= 0; }

    bool write_all(const std::string& data) {
        const char* ptr = data.data();
        size_t remaining = data.size();
        while (remaining > 0) {
            ssize_t written = ::write(fd_, ptr, remaining);
            if (written < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            ptr += written;
            remaining -= static_cast<size_t>(written);
        }
        return true;
    }

private:
    int fd_ = -1;
};

std::string single_line(std::string_view body) {
    std::string out;
    out.reserve(body.size());
    for (char c : body) {
        if (c == '\n') out += "\\n";
        else if (c == '\r') out += "\\r";
        else out += c;
    }
    return out;
}

} // anonymous namespace

RequestLog::RequestLog(fs::path path) : path_(std::move(path)) {}

bool RequestLog::log_request(const std::string& conversation_id, std::string_view body) {
    return append(conversation_id, "REQUEST", body);
}

bool RequestLog::log_response(const std::string& conversation_id, std::string_view body) {
    return append(conversation_id, "RESPONSE", body);
}

bool RequestLog::append(const std::string& conversation_id, std::string_view kind,
                        std::string_view body) {
    if (!enabled()) return true;

    try {
        std::error_code ec;
        if (path_.has_parent_path()) {
            fs::create_directories(path_.parent_path(), ec);
        }

        LockedFile file(path_);
        if (!file.ok()) {
            logger()->warn("request log {} unavailable: {}", path_.string(), std::strerror(errno));
            return false;
        }

        std::string line = format_line(timestamp_now(), conversation_id, kind, body);
        line += '\n';
        if (!file.write_all(line)) {
            logger()->warn("failed to append to request log {}: {}", path_.string(),
                           std::strerror(errno));
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        logger()->warn("request log {} failed: {}", path_.string(), e.what());
        return false;
    }
}

std::string RequestLog::format_line(const std::string& timestamp,
                                    const std::string& conversation_id,
                                    std::string_view kind,
                                    std::string_view body) {
    std::string line;
    line.reserve(timestamp.size() + conversation_id.size() + body.size() + 16);
    line += timestamp;
    line += " [";
    line += single_line(conversation_id);
    line += "] ";
    line += kind;
    line += ": ";
    line += single_line(body);
    return line;
}

std::string RequestLog::timestamp_now() {
    std::time_t t = std::time(nullptr);
    std::tm tm_buf;
    gmtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

} // namespace sshmcp
