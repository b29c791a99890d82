#pragma once
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace sshmcp {

namespace error {
    // Envelope error codes
    constexpr const char* InvalidJson       = "INVALID_JSON";
    constexpr const char* InvalidRequest    = "INVALID_REQUEST";
    constexpr const char* InvalidArguments  = "INVALID_ARGUMENTS";
    constexpr const char* MissingDependency = "MISSING_DEPENDENCY";
    constexpr const char* ToolNotFound      = "TOOL_NOT_FOUND";
    constexpr const char* ExecutionError    = "EXECUTION_ERROR";
    constexpr const char* ExecutionTimeout  = "EXECUTION_TIMEOUT";
    constexpr const char* InvalidToolOutput = "INVALID_TOOL_OUTPUT";
    constexpr const char* InternalError     = "INTERNAL_ERROR";

    // status.code values for protocol-level failures
    constexpr int StatusOk          = 0;
    constexpr int StatusBadRequest  = 400;
    constexpr int StatusNotFound    = 404;
    constexpr int StatusInternal    = 500;
    constexpr int StatusBadOutput   = 502;
    constexpr int StatusTimedOut    = 124;
} // namespace error

class SshMcpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Failure that maps directly onto an error envelope.
class ProtocolError : public SshMcpError {
public:
    int status;
    std::string code;
    nlohmann::json details;

    ProtocolError(int status, std::string code, const std::string& msg,
                  nlohmann::json details = nlohmann::json::object())
        : SshMcpError(msg), status(status), code(std::move(code)),
          details(std::move(details)) {}
};

class ParseError : public ProtocolError {
public:
    explicit ParseError(const std::string& msg)
        : ProtocolError(error::StatusBadRequest, error::InvalidJson, msg) {}
};

class InvalidRequestError : public ProtocolError {
public:
    explicit InvalidRequestError(const std::string& msg)
        : ProtocolError(error::StatusBadRequest, error::InvalidRequest, msg) {}
};

class InvalidArgumentsError : public ProtocolError {
public:
    explicit InvalidArgumentsError(const std::string& msg)
        : ProtocolError(error::StatusBadRequest, error::InvalidArguments, msg) {}
};

class ToolNotFoundError : public ProtocolError {
public:
    explicit ToolNotFoundError(const std::string& tool)
        : ProtocolError(error::StatusNotFound, error::ToolNotFound,
                        "The requested tool does not exist: " + tool,
                        nlohmann::json{{"tool", tool}}) {}
};

class MissingDependencyError : public ProtocolError {
public:
    explicit MissingDependencyError(const std::string& msg)
        : ProtocolError(error::StatusInternal, error::MissingDependency, msg) {}
};

/// Raised when a tool process cannot be launched at all.
class SandboxError : public SshMcpError {
public:
    using SshMcpError::SshMcpError;
};

class ConfigError : public SshMcpError {
public:
    using SshMcpError::SshMcpError;
};

} // namespace sshmcp
