#include "sshmcp/registry.hpp"
#include "sshmcp/error.hpp"
#include "sshmcp/logging.hpp"
#include <cctype>
#include <system_error>

namespace fs = std::filesystem;

namespace sshmcp {

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() > suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_id_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

} // anonymous namespace

// ----------- SearchPolicy -----------

SearchPolicy::SearchPolicy(std::vector<fs::path> directories, std::string extension)
    : directories_(std::move(directories)), extension_(std::move(extension)) {}

fs::path SearchPolicy::artifact_path(const fs::path& dir, const std::string& id) const {
    return dir / (id + extension_);
}

fs::path SearchPolicy::manifest_path(const fs::path& dir, const std::string& id) const {
    return dir / (id + MANIFEST_SUFFIX);
}

bool SearchPolicy::is_valid_tool_id(std::string_view id) {
    if (id.empty()) return false;
    bool segment_empty = true;
    for (char c : id) {
        if (c == '.') {
            if (segment_empty) return false;   // leading dot, "..", ".x"
            segment_empty = true;
        } else if (is_id_char(c)) {
            segment_empty = false;
        } else {
            return false;
        }
    }
    return !segment_empty;                      // trailing dot
}

// ----------- ToolRegistry -----------

ToolRegistry ToolRegistry::scan(const SearchPolicy& policy,
                                const std::vector<std::string>& builtin_ids) {
    ToolRegistry registry;
    registry.policy_ = policy;

    for (const auto& id : builtin_ids) {
        ToolEntry entry;
        entry.id = id;
        entry.kind = ToolKind::Builtin;
        registry.entries_.emplace(id, std::move(entry));
    }

    for (const auto& dir : policy.directories()) {
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) {
            logger()->debug("tool directory {} not present, skipped", dir.string());
            continue;
        }

        fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            logger()->warn("cannot read tool directory {}: {}", dir.string(), ec.message());
            continue;
        }

        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) {
                logger()->warn("error while scanning {}: {}", dir.string(), ec.message());
                break;
            }
            std::error_code st_ec;
            if (!it->is_regular_file(st_ec)) continue;

            std::string filename = it->path().filename().string();
            if (!ends_with(filename, policy.extension())) continue;

            std::string id = filename.substr(0, filename.size() - policy.extension().size());
            if (!SearchPolicy::is_valid_tool_id(id)) {
                logger()->debug("ignoring {}: not a valid tool id", it->path().string());
                continue;
            }
            if (registry.entries_.count(id)) continue;   // earlier directory wins

            ToolEntry entry;
            entry.id = id;
            entry.kind = ToolKind::Script;
            entry.path = it->path();
            entry.directory = dir;
            fs::path manifest = policy.manifest_path(dir, id);
            if (fs::is_regular_file(manifest, st_ec)) {
                entry.manifest = manifest;
            }
            registry.entries_.emplace(id, std::move(entry));
        }
    }

    logger()->debug("registry scan found {} tools in {} directories",
                    registry.entries_.size(), policy.directories().size());
    return registry;
}

std::optional<ToolEntry> ToolRegistry::resolve(const std::string& id) const {
    if (!SearchPolicy::is_valid_tool_id(id)) return std::nullopt;
    auto it = entries_.find(id);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

const ToolEntry& ToolRegistry::require(const std::string& id) const {
    auto it = entries_.find(id);
    if (!SearchPolicy::is_valid_tool_id(id) || it == entries_.end()) {
        throw ToolNotFoundError(id);
    }
    return it->second;
}

bool ToolRegistry::contains(const std::string& id) const {
    return SearchPolicy::is_valid_tool_id(id) && entries_.count(id) > 0;
}

std::vector<std::string> ToolRegistry::list() const {
    std::vector<std::string> ids;
    ids.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<ToolEntry> ToolRegistry::entries() const {
    std::vector<ToolEntry> out;
    out.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        out.push_back(entry);
    }
    return out;
}

} // namespace sshmcp
