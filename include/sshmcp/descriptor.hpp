#pragma once
#include "types.hpp"
#include "registry.hpp"
#include <string>
#include <string_view>

namespace sshmcp {

/// Builds ToolDescriptors from tool metadata.
///
/// Two sources are understood:
///   - a sidecar manifest `<id>.manifest.json` next to the tool, holding the
///     descriptor fields as a JSON object (preferred when present);
///   - the header block at the top of the tool source:
///
///       #!/bin/bash
///       # Tool: system.info - Returns basic system information
///       # Author: ssh-mcp Team
///       # Version: 0.1.0
///       # Tags: system, monitoring
///       #
///       # Args:
///       #   verbose: Include detailed information (boolean)
///       #
///       # Example:
///       #   {"tool": "system.info", "args": {"verbose": true}}
///       #
///       # Schema:
///       # { "type": "object", "properties": { ... } }
///       # End Schema
///
/// Parsing never fails: missing fields get defaults and a schema that is not
/// a JSON object becomes {} with schema_valid = false.
class DescriptorParser {
public:
    static constexpr const char* DEFAULT_AUTHOR = "Unknown";
    static constexpr const char* DEFAULT_VERSION = "1.0.0";
    static constexpr const char* DEFAULT_DESCRIPTION = "No description available";

    /// {"type":"object","properties":{}}, used when a tool declares no schema.
    [[nodiscard]] static nlohmann::json default_schema();

    [[nodiscard]] static ToolDescriptor parse_header(const std::string& id,
                                                     std::string_view source);

    [[nodiscard]] static ToolDescriptor parse_manifest(const std::string& id,
                                                       const nlohmann::json& manifest);

    /// Read a script entry from disk (manifest first, then header) and stamp
    /// the artifact's modification date.
    [[nodiscard]] static ToolDescriptor load(const ToolEntry& entry);
};

} // namespace sshmcp
