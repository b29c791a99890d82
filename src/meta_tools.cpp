#include "sshmcp/meta_tools.hpp"
#include "sshmcp/descriptor.hpp"
#include "sshmcp/error.hpp"
#include "sshmcp/logging.hpp"
#include <algorithm>

namespace sshmcp {

namespace {

// Built-in tools describe themselves with the same header convention that
// script tools use, and go through the same parser.

const char* kDiscoverHeader = R"HDR(# Tool: meta.discover - Lists all available tools with their descriptions
# Author: ssh-mcp Team
# Version: 0.1.0
# Tags: meta, discovery, documentation
#
# Args:
#   category: Optional filter for tool category (string, optional)
#   tags: Optional tags to filter by (array, optional)
#
# Example:
#   {"tool": "meta.discover", "args": {"category": "system"}}
#
# Schema:
# {
#   "type": "object",
#   "properties": {
#     "category": {
#       "type": "string",
#       "description": "Filter tools by category (e.g., 'system', 'file')"
#     },
#     "tags": {
#       "type": "array",
#       "items": {"type": "string"},
#       "description": "Filter tools by tags"
#     }
#   }
# }
# End Schema
)HDR";

const char* kDescribeHeader = R"(# Tool: meta.describe - Returns detailed description for a specific tool
# Author: ssh-mcp Team
# Version: 0.1.0
# Tags: meta, discovery, documentation
#
# Args:
#   tool: Name of the tool to describe (string, required)
#
# Example:
#   {"tool": "meta.describe", "args": {"tool": "system.info"}}
#
# Schema:
# {
#   "type": "object",
#   "properties": {
#     "tool": {"type": "string", "description": "Name of the tool to describe"}
#   },
#   "required": ["tool"]
# }
# End Schema
)";

const char* kSchemaHeader = R"(# Tool: meta.schema - Returns the JSON schema for a specific tool
# Author: ssh-mcp Team
# Version: 0.1.0
# Tags: meta, schema, validation
#
# Args:
#   tool: Name of the tool to get schema for (string, required)
#
# Example:
#   {"tool": "meta.schema", "args": {"tool": "system.info"}}
#
# Schema:
# {
#   "type": "object",
#   "properties": {
#     "tool": {"type": "string", "description": "Name of the tool to get schema for"}
#   },
#   "required": ["tool"]
# }
# End Schema
)";

std::string required_tool_arg(const nlohmann::json& args) {
    if (!args.is_object() || !args.contains("tool") || !args.at("tool").is_string()) {
        throw InvalidArgumentsError("Missing required parameter: tool (string)");
    }
    std::string tool = args.at("tool").get<std::string>();
    if (tool.empty()) {
        throw InvalidArgumentsError("Tool name parameter is required");
    }
    return tool;
}

nlohmann::json suggestion(const char* tool, const char* description) {
    return nlohmann::json{{"tool", tool}, {"description", description}};
}

} // anonymous namespace

std::vector<std::string> MetaTools::ids() {
    return {DESCRIBE, DISCOVER, SCHEMA};
}

ToolDescriptor MetaTools::builtin_descriptor(const std::string& id) {
    if (id == DISCOVER) return DescriptorParser::parse_header(id, kDiscoverHeader);
    if (id == DESCRIBE) return DescriptorParser::parse_header(id, kDescribeHeader);
    if (id == SCHEMA) return DescriptorParser::parse_header(id, kSchemaHeader);
    throw ToolNotFoundError(id);
}

MetaTools::MetaTools(const ToolRegistry& registry) : registry_(registry) {}

ToolDescriptor MetaTools::describe_entry(const ToolEntry& entry) const {
    if (entry.kind == ToolKind::Builtin) {
        return builtin_descriptor(entry.id);
    }
    return DescriptorParser::load(entry);
}

nlohmann::json MetaTools::call(const std::string& id, const nlohmann::json& args) const {
    if (id == DISCOVER) return discover(args);
    if (id == DESCRIBE) return describe(args);
    if (id == SCHEMA) return schema(args);
    throw ToolNotFoundError(id);
}

std::vector<ToolSummary> MetaTools::list(const std::string& category,
                                         const std::vector<std::string>& tags) const {
    const std::string prefix = category.empty() ? std::string() : category + ".";

    std::vector<ToolSummary> tools;
    for (const auto& entry : registry_.entries()) {
        if (!prefix.empty() && entry.id.rfind(prefix, 0) != 0) continue;

        ToolDescriptor d = describe_entry(entry);
        if (!tags.empty()) {
            bool match = std::any_of(tags.begin(), tags.end(),
                                     [&d](const std::string& t) { return d.has_tag(t); });
            if (!match) continue;
        }
        tools.push_back(ToolSummary::from(d));
    }
    return tools;
}

nlohmann::json MetaTools::discover(const nlohmann::json& args) const {
    std::string category;
    std::vector<std::string> tags;

    if (args.is_object()) {
        auto cat_it = args.find("category");
        if (cat_it != args.end() && !cat_it->is_null()) {
            if (!cat_it->is_string()) {
                throw InvalidArgumentsError("'category' must be a string");
            }
            category = cat_it->get<std::string>();
        }
        auto tags_it = args.find("tags");
        if (tags_it != args.end() && !tags_it->is_null()) {
            if (!tags_it->is_array()) {
                throw InvalidArgumentsError("'tags' must be an array of strings");
            }
            for (const auto& t : *tags_it) {
                if (!t.is_string()) {
                    throw InvalidArgumentsError("'tags' must be an array of strings");
                }
                tags.push_back(t.get<std::string>());
            }
        }
    }

    auto tools = list(category, tags);
    logger()->debug("meta.discover: {} of {} tools match", tools.size(), registry_.size());

    nlohmann::json suggestions = nlohmann::json::array();
    for (size_t i = 0; i < tools.size() && i < MAX_SUGGESTIONS; ++i) {
        suggestions.push_back({{"tool", tools[i].name}, {"description", "Try this tool"}});
    }

    return nlohmann::json{
        {"tools", tools},
        {"count", tools.size()},
        {"explanation", "These are all the available tools on this system. You can get "
                        "more details about a specific tool using meta.describe."},
        {"suggestions", suggestions}
    };
}

nlohmann::json MetaTools::describe(const nlohmann::json& args) const {
    std::string tool = required_tool_arg(args);
    const ToolEntry& entry = registry_.require(tool);
    ToolDescriptor d = describe_entry(entry);

    return nlohmann::json{
        {"tool", tool},
        {"description", d.description},
        {"metadata", {
            {"author", d.author},
            {"version", d.version},
            {"created", d.created},
            {"tags", d.tags}
        }},
        {"args_description", d.args_doc},
        {"examples", d.examples},
        {"schema", d.schema},
        {"explanation", "This tool (" + tool + ") is used for " + d.description +
                        ". It was created by " + d.author +
                        " and is currently at version " + d.version + "."},
        {"suggestions", nlohmann::json::array({
            suggestion(SCHEMA, "Get the JSON schema for this tool"),
            suggestion(DISCOVER, "Discover other available tools")
        })}
    };
}

nlohmann::json MetaTools::schema(const nlohmann::json& args) const {
    std::string tool = required_tool_arg(args);
    const ToolEntry& entry = registry_.require(tool);
    ToolDescriptor d = describe_entry(entry);

    return nlohmann::json{
        {"tool", tool},
        {"schema", d.schema},
        {"explanation", "This is the JSON schema for the " + tool +
                        " tool. It defines the expected input format."},
        {"suggestions", nlohmann::json::array({
            suggestion(DESCRIBE, "Get full description of this tool"),
            suggestion(DISCOVER, "Discover other available tools")
        })}
    };
}

} // namespace sshmcp
