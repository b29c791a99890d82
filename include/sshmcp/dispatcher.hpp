#pragma once
#include "types.hpp"
#include "config.hpp"
#include "registry.hpp"
#include "sandbox.hpp"
#include "request_log.hpp"
#include <functional>
#include <string>
#include <string_view>

namespace sshmcp {

struct DispatchResult {
    Response response;
    std::string body;     // serialized envelope, one line
    int exit_code = 0;    // process exit code for the CLI
};

/// Runs one request end to end: validate, resolve, execute, build, log.
/// Every failure becomes an envelope; handle() never throws.
class Dispatcher {
public:
    struct Options {
        SearchPolicy policy;
        Sandbox::Options sandbox;
        std::filesystem::path log_file;          // empty disables the request log
        std::function<bool()> json_available;    // defaults to Codec::json_available
    };

    explicit Dispatcher(Options opts);

    static Options options_from(const Config& cfg);

    /// Handle a raw request body.
    [[nodiscard]] DispatchResult handle(std::string_view payload);

    /// Resolve and run an already validated request. Does not write the
    /// request log.
    [[nodiscard]] Response dispatch(const Request& req);

    /// Fresh registry snapshot, built-ins included.
    [[nodiscard]] ToolRegistry scan_registry();

    /// Number of registry scans performed so far.
    [[nodiscard]] size_t registry_scans() const { return scans_; }

    [[nodiscard]] const Options& options() const { return opts_; }

private:
    DispatchResult finish(const std::string& conversation_id, Response resp, int exit_code);

    Options opts_;
    Sandbox sandbox_;
    RequestLog log_;
    size_t scans_ = 0;
};

} // namespace sshmcp
