#include "sshmcp/types.hpp"
#include <algorithm>

namespace sshmcp {

// ---------- RequestContext ----------

void to_json(nlohmann::json& j, const RequestContext& c) {
    j = c.extra.is_object() ? c.extra : nlohmann::json::object();
    if (c.user_intent) j["user_intent"] = *c.user_intent;
    if (c.reasoning) j["reasoning"] = *c.reasoning;
}

void from_json(const nlohmann::json& j, RequestContext& c) {
    c.extra = nlohmann::json::object();
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.key() == "user_intent" && it.value().is_string()) {
            c.user_intent = it.value().get<std::string>();
        } else if (it.key() == "reasoning" && it.value().is_string()) {
            c.reasoning = it.value().get<std::string>();
        } else {
            c.extra[it.key()] = it.value();
        }
    }
}

// ---------- Request ----------

void to_json(nlohmann::json& j, const Request& r) {
    j = {{"tool", r.tool}, {"args", r.args}, {"conversation_id", r.conversation_id}};
    if (r.context) j["context"] = *r.context;
}

// ---------- Status ----------

void to_json(nlohmann::json& j, const Status& s) {
    j = {{"code", s.code}, {"message", s.message}};
}

void from_json(const nlohmann::json& j, Status& s) {
    s.code = j.at("code").get<int>();
    s.message = j.value("message", "");
}

// ---------- ErrorInfo ----------

void to_json(nlohmann::json& j, const ErrorInfo& e) {
    j = {{"code", e.code}, {"message", e.message}, {"details", e.details}};
}

void from_json(const nlohmann::json& j, ErrorInfo& e) {
    e.code = j.at("code").get<std::string>();
    e.message = j.value("message", "");
    if (j.contains("details") && j.at("details").is_object()) {
        e.details = j.at("details");
    }
}

// ---------- Suggestion ----------

void to_json(nlohmann::json& j, const Suggestion& s) {
    j = {{"tool", s.tool}, {"description", s.description}};
}

void from_json(const nlohmann::json& j, Suggestion& s) {
    s.tool = j.at("tool").get<std::string>();
    s.description = j.value("description", "");
}

// ---------- Response ----------

void to_json(nlohmann::json& j, const Response& r) {
    j = nlohmann::json::object();
    j["conversation_id"] = r.conversation_id;
    j["status"] = r.status;
    j["result"] = r.result ? *r.result : nlohmann::json(nullptr);
    j["error"] = r.error ? nlohmann::json(*r.error) : nlohmann::json(nullptr);
    if (r.explanation) j["explanation"] = *r.explanation;
    if (r.suggestions) j["suggestions"] = *r.suggestions;
}

void from_json(const nlohmann::json& j, Response& r) {
    r.conversation_id = j.value("conversation_id", DEFAULT_CONVERSATION_ID);
    r.status = j.at("status").get<Status>();
    if (j.contains("result") && !j.at("result").is_null()) r.result = j.at("result");
    if (j.contains("error") && !j.at("error").is_null()) r.error = j.at("error").get<ErrorInfo>();
    if (j.contains("explanation")) r.explanation = j.at("explanation").get<std::string>();
    if (j.contains("suggestions")) {
        r.suggestions = j.at("suggestions").get<std::vector<Suggestion>>();
    }
}

// ---------- ToolDescriptor / ToolSummary ----------

bool ToolDescriptor::has_tag(const std::string& tag) const {
    return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

ToolSummary ToolSummary::from(const ToolDescriptor& d) {
    return ToolSummary{d.name, d.description, d.version, d.author, d.tags};
}

void to_json(nlohmann::json& j, const ToolSummary& t) {
    j = {
        {"name", t.name},
        {"description", t.description},
        {"version", t.version},
        {"author", t.author},
        {"tags", t.tags}
    };
}

void from_json(const nlohmann::json& j, ToolSummary& t) {
    t.name = j.at("name").get<std::string>();
    t.description = j.value("description", "");
    t.version = j.value("version", "");
    t.author = j.value("author", "");
    if (j.contains("tags")) t.tags = j.at("tags").get<std::vector<std::string>>();
}

} // namespace sshmcp
