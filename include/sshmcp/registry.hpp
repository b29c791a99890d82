#pragma once
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sshmcp {

enum class ToolKind {
    Script,   // executable artifact found in a search directory
    Builtin   // implemented in-process (meta.*)
};

struct ToolEntry {
    std::string id;
    ToolKind kind = ToolKind::Script;
    std::filesystem::path path;        // empty for built-ins
    std::filesystem::path directory;   // search directory that supplied the artifact
    std::optional<std::filesystem::path> manifest;

    bool operator==(const ToolEntry& o) const {
        return id == o.id && kind == o.kind && path == o.path
               && directory == o.directory && manifest == o.manifest;
    }
};

/// Where tools are looked up, in precedence order.
/// The same policy answers "does this tool exist" and "which copy runs".
class SearchPolicy {
public:
    static constexpr const char* DEFAULT_EXTENSION = ".sh";
    static constexpr const char* MANIFEST_SUFFIX = ".manifest.json";

    SearchPolicy() = default;
    explicit SearchPolicy(std::vector<std::filesystem::path> directories,
                          std::string extension = DEFAULT_EXTENSION);

    [[nodiscard]] const std::vector<std::filesystem::path>& directories() const {
        return directories_;
    }
    [[nodiscard]] const std::string& extension() const { return extension_; }

    [[nodiscard]] std::filesystem::path artifact_path(const std::filesystem::path& dir,
                                                      const std::string& id) const;
    [[nodiscard]] std::filesystem::path manifest_path(const std::filesystem::path& dir,
                                                      const std::string& id) const;

    /// Dotted identifier made of [A-Za-z0-9_-] segments. Rejects anything that
    /// could escape a search directory.
    [[nodiscard]] static bool is_valid_tool_id(std::string_view id);

private:
    std::vector<std::filesystem::path> directories_;
    std::string extension_ = DEFAULT_EXTENSION;
};

/// Snapshot of the tools visible to one request.
class ToolRegistry {
public:
    /// Enumerate every search directory. Built-in ids shadow on-disk artifacts.
    [[nodiscard]] static ToolRegistry scan(const SearchPolicy& policy,
                                           const std::vector<std::string>& builtin_ids = {});

    [[nodiscard]] std::optional<ToolEntry> resolve(const std::string& id) const;

    /// Throws ToolNotFoundError when the id is not resolvable.
    [[nodiscard]] const ToolEntry& require(const std::string& id) const;

    [[nodiscard]] bool contains(const std::string& id) const;

    /// All ids, sorted ascending.
    [[nodiscard]] std::vector<std::string> list() const;

    /// All entries, in id order.
    [[nodiscard]] std::vector<ToolEntry> entries() const;

    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] const SearchPolicy& policy() const { return policy_; }

private:
    SearchPolicy policy_;
    std::map<std::string, ToolEntry> entries_;
};

} // namespace sshmcp
