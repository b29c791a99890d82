#pragma once
#include <sys/stat.h>
#include <unistd.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace sshmcp::testing {

/// Scratch directory removed with everything in it on destruction.
class TempDir {
public:
    TempDir() {
        std::string templ = (std::filesystem::temp_directory_path() / "sshmcp-test-XXXXXX").string();
        if (!::mkdtemp(templ.data())) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = templ;
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }
    [[nodiscard]] std::filesystem::path operator/(const std::string& name) const {
        return path_ / name;
    }

private:
    std::filesystem::path path_;
};

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

/// Write `<dir>/<id>.sh` with a header block followed by `body`.
inline std::filesystem::path write_tool(const std::filesystem::path& dir,
                                        const std::string& id,
                                        const std::string& body,
                                        const std::string& header = "") {
    auto path = dir / (id + ".sh");
    std::string text = "#!/bin/bash\n";
    text += header.empty() ? "# Tool: " + id + " - Test tool " + id + "\n" : header;
    text += "\n";
    text += body;
    text += "\n";
    write_file(path, text);
    ::chmod(path.c_str(), 0755);
    return path;
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

inline std::vector<std::string> read_lines(const std::filesystem::path& path) {
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

/// Files in `dir` whose name starts with `prefix`.
inline size_t count_files_with_prefix(const std::filesystem::path& dir,
                                      const std::string& prefix) {
    size_t n = 0;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (entry.path().filename().string().rfind(prefix, 0) == 0) ++n;
    }
    return n;
}

} // namespace sshmcp::testing
