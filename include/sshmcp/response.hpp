#pragma once
#include "types.hpp"
#include "error.hpp"
#include "sandbox.hpp"
#include <chrono>
#include <string>

namespace sshmcp {

/// Pure construction of response envelopes.
class ResponseBuilder {
public:
    /// status {0, "Success"}; explanation/suggestions are lifted from an
    /// object result that carries them.
    [[nodiscard]] static Response success(const std::string& conversation_id,
                                          nlohmann::json result);

    [[nodiscard]] static Response error(const std::string& conversation_id,
                                        int status_code,
                                        const std::string& status_message,
                                        const std::string& error_code,
                                        const std::string& message,
                                        nlohmann::json details = nlohmann::json::object());

    /// Pre-execution failures (invalid JSON, unknown tool, ...).
    [[nodiscard]] static Response from_error(const std::string& conversation_id,
                                             const ProtocolError& err);

    /// Classify a finished tool process. `timeout` is reported in the
    /// details of a timed-out run.
    [[nodiscard]] static Response from_outcome(const std::string& conversation_id,
                                               const ExecutionOutcome& outcome,
                                               std::chrono::milliseconds timeout =
                                                   std::chrono::milliseconds{0});

    /// status.message used for a protocol-level error code.
    [[nodiscard]] static std::string status_message_for(const std::string& error_code);
};

} // namespace sshmcp
