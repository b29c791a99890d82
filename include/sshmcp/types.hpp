#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace sshmcp {

constexpr const char* DEFAULT_CONVERSATION_ID = "none";

// ---------- Request ----------

struct RequestContext {
    std::optional<std::string> user_intent;
    std::optional<std::string> reasoning;
    nlohmann::json extra = nlohmann::json::object(); // any other keys, kept verbatim

    bool operator==(const RequestContext& o) const {
        return user_intent == o.user_intent && reasoning == o.reasoning && extra == o.extra;
    }
};

struct Request {
    std::string tool;
    nlohmann::json args = nlohmann::json::object();
    std::string conversation_id = DEFAULT_CONVERSATION_ID;
    std::optional<RequestContext> context;

    bool operator==(const Request& o) const {
        return tool == o.tool && args == o.args && conversation_id == o.conversation_id
               && context == o.context;
    }
};

// ---------- Response ----------

struct Status {
    int code = 0;
    std::string message;

    bool operator==(const Status& o) const {
        return code == o.code && message == o.message;
    }
};

struct ErrorInfo {
    std::string code;
    std::string message;
    nlohmann::json details = nlohmann::json::object();

    bool operator==(const ErrorInfo& o) const {
        return code == o.code && message == o.message && details == o.details;
    }
};

struct Suggestion {
    std::string tool;
    std::string description;

    bool operator==(const Suggestion& o) const {
        return tool == o.tool && description == o.description;
    }
};

/// Exactly one of result / error is set.
struct Response {
    std::string conversation_id = DEFAULT_CONVERSATION_ID;
    Status status;
    std::optional<nlohmann::json> result;
    std::optional<ErrorInfo> error;
    std::optional<std::string> explanation;
    std::optional<std::vector<Suggestion>> suggestions;

    [[nodiscard]] bool ok() const { return status.code == 0 && !error; }

    bool operator==(const Response& o) const {
        return conversation_id == o.conversation_id && status == o.status
               && result == o.result && error == o.error
               && explanation == o.explanation && suggestions == o.suggestions;
    }
};

// ---------- Tool metadata ----------

struct ToolDescriptor {
    std::string name;
    std::string description;
    std::string version;
    std::string author;
    std::vector<std::string> tags;
    nlohmann::json schema = nlohmann::json::object();
    std::vector<std::string> args_doc;
    std::vector<std::string> examples;
    std::string created;        // YYYY-MM-DD of the artifact, empty for built-ins
    bool schema_valid = true;

    [[nodiscard]] bool has_tag(const std::string& tag) const;

    bool operator==(const ToolDescriptor& o) const {
        return name == o.name && description == o.description && version == o.version
               && author == o.author && tags == o.tags && schema == o.schema
               && args_doc == o.args_doc && examples == o.examples
               && created == o.created && schema_valid == o.schema_valid;
    }
};

/// Row of a meta.discover listing.
struct ToolSummary {
    std::string name;
    std::string description;
    std::string version;
    std::string author;
    std::vector<std::string> tags;

    static ToolSummary from(const ToolDescriptor& d);

    bool operator==(const ToolSummary& o) const {
        return name == o.name && description == o.description && version == o.version
               && author == o.author && tags == o.tags;
    }
};

// ---------- JSON conversions ----------

void to_json(nlohmann::json& j, const RequestContext& c);
void from_json(const nlohmann::json& j, RequestContext& c);

void to_json(nlohmann::json& j, const Request& r);

void to_json(nlohmann::json& j, const Status& s);
void from_json(const nlohmann::json& j, Status& s);

void to_json(nlohmann::json& j, const ErrorInfo& e);
void from_json(const nlohmann::json& j, ErrorInfo& e);

void to_json(nlohmann::json& j, const Suggestion& s);
void from_json(const nlohmann::json& j, Suggestion& s);

void to_json(nlohmann::json& j, const Response& r);
void from_json(const nlohmann::json& j, Response& r);

void to_json(nlohmann::json& j, const ToolSummary& t);
void from_json(const nlohmann::json& j, ToolSummary& t);

} // namespace sshmcp
