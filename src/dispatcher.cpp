#include "sshmcp/dispatcher.hpp"
#include "sshmcp/codec.hpp"
#include "sshmcp/error.hpp"
#include "sshmcp/logging.hpp"
#include "sshmcp/meta_tools.hpp"
#include "sshmcp/response.hpp"

namespace sshmcp {

namespace {

std::string_view strip_trailing_newlines(std::string_view s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

} // anonymous namespace

Dispatcher::Dispatcher(Options opts)
    : opts_(std::move(opts)),
      sandbox_(opts_.sandbox),
      log_(opts_.log_file) {
    if (!opts_.json_available) {
        opts_.json_available = &Codec::json_available;
    }
}

Dispatcher::Options Dispatcher::options_from(const Config& cfg) {
    Options opts;
    opts.policy = SearchPolicy(cfg.tool_dirs);
    opts.sandbox.interpreter = cfg.interpreter;
    opts.sandbox.timeout = cfg.timeout;
    if (cfg.log_enabled) opts.log_file = cfg.log_file;
    return opts;
}

ToolRegistry Dispatcher::scan_registry() {
    ++scans_;
    return ToolRegistry::scan(opts_.policy, MetaTools::ids());
}

DispatchResult Dispatcher::handle(std::string_view payload) {
    std::string_view body = strip_trailing_newlines(payload);

    if (!opts_.json_available()) {
        log_.log_request(DEFAULT_CONVERSATION_ID, body);
        MissingDependencyError err("No JSON parser is available in this environment");
        logger()->error("{}", err.what());
        return finish(DEFAULT_CONVERSATION_ID,
                      ResponseBuilder::from_error(DEFAULT_CONVERSATION_ID, err), 1);
    }

    nlohmann::json doc;
    try {
        doc = Codec::parse(body);
    } catch (const ParseError& e) {
        log_.log_request(DEFAULT_CONVERSATION_ID, body);
        logger()->debug("rejecting request: {}", e.what());
        ParseError err("The input is not valid JSON");
        err.details = {{"reason", e.what()}};
        return finish(DEFAULT_CONVERSATION_ID,
                      ResponseBuilder::from_error(DEFAULT_CONVERSATION_ID, err), 1);
    }

    std::string conversation_id = Codec::peek_conversation_id(doc);
    log_.log_request(conversation_id, body);

    Request req;
    try {
        req = Codec::to_request(doc);
    } catch (const InvalidRequestError& e) {
        logger()->debug("rejecting request: {}", e.what());
        return finish(conversation_id, ResponseBuilder::from_error(conversation_id, e), 0);
    }

    return finish(req.conversation_id, dispatch(req), 0);
}

Response Dispatcher::dispatch(const Request& req) {
    const std::string& conv = req.conversation_id;
    try {
        ToolRegistry registry = scan_registry();
        const ToolEntry& entry = registry.require(req.tool);

        if (entry.kind == ToolKind::Builtin) {
            MetaTools meta(registry);
            return ResponseBuilder::success(conv, meta.call(entry.id, req.args));
        }

        ExecutionOutcome outcome = sandbox_.execute(entry, req.args);
        if (!outcome.succeeded()) {
            logger()->info("{} failed with exit code {}", req.tool, outcome.exit_code);
        }
        return ResponseBuilder::from_outcome(conv, outcome, opts_.sandbox.timeout);
    } catch (const ProtocolError& e) {
        logger()->debug("{} rejected: {}", req.tool, e.what());
        return ResponseBuilder::from_error(conv, e);
    } catch (const SandboxError& e) {
        logger()->error("cannot run {}: {}", req.tool, e.what());
        return ResponseBuilder::error(conv, error::StatusInternal, "Internal error",
                                      error::InternalError, e.what());
    } catch (const std::exception& e) {
        logger()->error("unexpected failure while handling {}: {}", req.tool, e.what());
        return ResponseBuilder::error(conv, error::StatusInternal, "Internal error",
                                      error::InternalError, e.what());
    }
}

DispatchResult Dispatcher::finish(const std::string& conversation_id, Response resp,
                                  int exit_code) {
    DispatchResult result;
    result.body = Codec::serialize(resp);
    result.response = std::move(resp);
    result.exit_code = exit_code;
    log_.log_response(conversation_id, result.body);
    return result;
}

} // namespace sshmcp
