#pragma once
#include "types.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace sshmcp {

class Codec {
public:
    /// True when a JSON parsing backend is usable in this process.
    [[nodiscard]] static bool json_available();

    /// Name of the active JSON parsing backend (logged at debug level on startup).
    [[nodiscard]] static std::string json_backend();

    /// Parse raw bytes into a JSON document.
    /// Throws ParseError on empty input or invalid JSON.
    [[nodiscard]] static nlohmann::json parse(std::string_view raw);

    /// Validate a parsed document as a request envelope and apply defaults.
    /// Throws InvalidRequestError on structural violations.
    [[nodiscard]] static Request to_request(const nlohmann::json& doc);

    /// parse() followed by to_request().
    [[nodiscard]] static Request parse_request(std::string_view raw);

    /// Best-effort conversation id from a document that may fail validation.
    [[nodiscard]] static std::string peek_conversation_id(const nlohmann::json& doc);

    /// Serialize an envelope as a single line of JSON.
    /// Invalid UTF-8 in captured tool output is replaced, never thrown on.
    [[nodiscard]] static std::string serialize(const Response& resp);
    [[nodiscard]] static std::string serialize(const nlohmann::json& j);
};

} // namespace sshmcp
