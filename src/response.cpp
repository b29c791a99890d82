#include "sshmcp/response.hpp"
#include <string>

namespace sshmcp {

namespace {

void lift_annotations(Response& resp, const nlohmann::json& result) {
    if (!result.is_object()) return;

    auto expl = result.find("explanation");
    if (expl != result.end() && expl->is_string()) {
        resp.explanation = expl->get<std::string>();
    }

    auto sugg = result.find("suggestions");
    if (sugg != result.end() && sugg->is_array()) {
        std::vector<Suggestion> suggestions;
        for (const auto& item : *sugg) {
            if (!item.is_object() || !item.contains("tool") || !item.at("tool").is_string()) {
                continue;
            }
            Suggestion s;
            s.tool = item.at("tool").get<std::string>();
            auto desc = item.find("description");
            if (desc != item.end() && desc->is_string()) s.description = desc->get<std::string>();
            suggestions.push_back(std::move(s));
        }
        resp.suggestions = std::move(suggestions);
    }
}

std::string trim_trailing_newlines(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
    return s;
}

} // anonymous namespace

Response ResponseBuilder::success(const std::string& conversation_id, nlohmann::json result) {
    Response resp;
    resp.conversation_id = conversation_id;
    resp.status = Status{error::StatusOk, "Success"};
    lift_annotations(resp, result);
    resp.result = std::move(result);
    return resp;
}

Response ResponseBuilder::error(const std::string& conversation_id,
                                int status_code,
                                const std::string& status_message,
                                const std::string& error_code,
                                const std::string& message,
                                nlohmann::json details) {
    Response resp;
    resp.conversation_id = conversation_id;
    resp.status = Status{status_code, status_message};
    resp.error = ErrorInfo{error_code, message,
                           details.is_object() ? std::move(details) : nlohmann::json::object()};
    return resp;
}

Response ResponseBuilder::from_error(const std::string& conversation_id,
                                     const ProtocolError& err) {
    return error(conversation_id, err.status, status_message_for(err.code),
                 err.code, err.what(), err.details);
}

Response ResponseBuilder::from_outcome(const std::string& conversation_id,
                                       const ExecutionOutcome& outcome,
                                       std::chrono::milliseconds timeout) {
    if (outcome.timed_out) {
        return error(conversation_id, error::StatusTimedOut, "Tool execution timed out",
                     error::ExecutionTimeout,
                     "Tool did not finish within " + std::to_string(timeout.count()) + " ms",
                     {{"exit_code", outcome.exit_code},
                      {"timeout_ms", timeout.count()},
                      {"stderr", outcome.stderr_data}});
    }

    if (outcome.exit_code != 0) {
        nlohmann::json details = {{"exit_code", outcome.exit_code},
                                  {"stderr", outcome.stderr_data}};
        if (outcome.term_signal != 0) details["signal"] = outcome.term_signal;
        return error(conversation_id, outcome.exit_code, "Tool execution failed",
                     error::ExecutionError, trim_trailing_newlines(outcome.stderr_data),
                     std::move(details));
    }

    // Exit 0: stdout must hold exactly one JSON value
    auto result = nlohmann::json::parse(outcome.stdout_data, nullptr, false);
    if (result.is_discarded() || result.is_null()) {
        return error(conversation_id, error::StatusBadOutput, "Invalid tool output",
                     error::InvalidToolOutput,
                     "Tool exited successfully but did not write a JSON value to stdout",
                     {{"exit_code", 0}, {"output", outcome.stdout_data}});
    }
    return success(conversation_id, std::move(result));
}

std::string ResponseBuilder::status_message_for(const std::string& error_code) {
    if (error_code == error::InvalidJson) return "Invalid JSON";
    if (error_code == error::InvalidRequest) return "Invalid request";
    if (error_code == error::InvalidArguments) return "Invalid arguments";
    if (error_code == error::MissingDependency) return "Missing dependency";
    if (error_code == error::ToolNotFound) return "Tool not found";
    if (error_code == error::ExecutionError) return "Tool execution failed";
    if (error_code == error::ExecutionTimeout) return "Tool execution timed out";
    if (error_code == error::InvalidToolOutput) return "Invalid tool output";
    return "Internal error";
}

} // namespace sshmcp
