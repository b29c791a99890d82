#pragma once
#include "types.hpp"
#include "registry.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sshmcp {

/// Protocol self-description tools. They run in-process against the same
/// ToolRegistry the dispatcher resolves through, so what discover lists is
/// exactly what describe and schema can answer for.
class MetaTools {
public:
    static constexpr const char* DISCOVER = "meta.discover";
    static constexpr const char* DESCRIBE = "meta.describe";
    static constexpr const char* SCHEMA   = "meta.schema";

    static constexpr size_t MAX_SUGGESTIONS = 3;

    /// Ids of all built-in meta tools.
    [[nodiscard]] static std::vector<std::string> ids();

    /// Descriptor of a built-in meta tool. Throws ToolNotFoundError otherwise.
    [[nodiscard]] static ToolDescriptor builtin_descriptor(const std::string& id);

    explicit MetaTools(const ToolRegistry& registry);

    /// Descriptor for any registry entry (built-in or script).
    [[nodiscard]] ToolDescriptor describe_entry(const ToolEntry& entry) const;

    /// Run a meta tool by id. Throws ToolNotFoundError / InvalidArgumentsError.
    [[nodiscard]] nlohmann::json call(const std::string& id, const nlohmann::json& args) const;

    /// args: {category?: string, tags?: [string]}
    [[nodiscard]] nlohmann::json discover(const nlohmann::json& args) const;

    /// args: {tool: string}
    [[nodiscard]] nlohmann::json describe(const nlohmann::json& args) const;

    /// args: {tool: string}
    [[nodiscard]] nlohmann::json schema(const nlohmann::json& args) const;

    /// Filtered listing used by discover, in id order.
    [[nodiscard]] std::vector<ToolSummary> list(const std::string& category,
                                                const std::vector<std::string>& tags) const;

private:
    const ToolRegistry& registry_;
};

} // namespace sshmcp
