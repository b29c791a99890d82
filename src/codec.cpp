#include "sshmcp/codec.hpp"
#include "sshmcp/error.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <cctype>
#include <string>

namespace sshmcp {

namespace {

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            auto object = val.get_object();
            for (auto field : object) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            // Try integer first, then double
            auto result_int = val.get_int64();
            if (result_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_int.value());
            }
            auto result_uint = val.get_uint64();
            if (result_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_uint.value());
            }
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null: {
            bool is_null = val.is_null();
            if (!is_null) {
                throw ParseError("Invalid literal");
            }
            return nlohmann::json(nullptr);
        }
        default:
            throw ParseError("Unexpected JSON value");
    }
}

bool is_blank(std::string_view raw) {
    for (char c : raw) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // anonymous namespace

bool Codec::json_available() {
    const simdjson::implementation* impl = simdjson::get_active_implementation();
    return impl != nullptr && impl->name() != "unsupported";
}

std::string Codec::json_backend() {
    const simdjson::implementation* impl = simdjson::get_active_implementation();
    return impl ? std::string(impl->name()) : std::string("none");
}

nlohmann::json Codec::parse(std::string_view raw) {
    if (raw.empty() || is_blank(raw)) {
        throw ParseError("Empty input");
    }

    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw ParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    simdjson::ondemand::json_type type;
    error = doc.type().get(type);
    if (error) {
        throw ParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    // Top-level scalars are rare here (they are never valid requests), so they
    // go through nlohmann directly instead of the on-demand scalar API.
    if (type != simdjson::ondemand::json_type::object &&
        type != simdjson::ondemand::json_type::array) {
        try {
            return nlohmann::json::parse(raw);
        } catch (const nlohmann::json::parse_error& e) {
            throw ParseError(std::string("JSON parse error: ") + e.what());
        }
    }

    nlohmann::json j;
    try {
        auto val = doc.get_value();
        if (val.error()) {
            throw ParseError(std::string("JSON parse error: ") +
                             simdjson::error_message(val.error()));
        }
        j = simdjson_to_nlohmann(val.value());
    } catch (const ParseError&) {
        throw;
    } catch (const std::exception& e) {
        throw ParseError(std::string("JSON parse error: ") + e.what());
    }

    if (!doc.at_end()) {
        throw ParseError("JSON parse error: trailing content after document");
    }
    return j;
}

Request Codec::to_request(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw InvalidRequestError("Request must be a JSON object");
    }

    Request req;

    auto tool_it = doc.find("tool");
    if (tool_it == doc.end() || tool_it->is_null()) {
        throw InvalidRequestError("Missing 'tool' field");
    }
    if (!tool_it->is_string()) {
        throw InvalidRequestError("'tool' must be a string");
    }
    req.tool = tool_it->get<std::string>();
    if (req.tool.empty()) {
        throw InvalidRequestError("'tool' must not be empty");
    }

    auto args_it = doc.find("args");
    if (args_it != doc.end() && !args_it->is_null()) {
        if (!args_it->is_object()) {
            throw InvalidRequestError("'args' must be a JSON object");
        }
        req.args = *args_it;
    }

    auto conv_it = doc.find("conversation_id");
    if (conv_it != doc.end() && !conv_it->is_null()) {
        if (!conv_it->is_string()) {
            throw InvalidRequestError("'conversation_id' must be a string");
        }
        req.conversation_id = conv_it->get<std::string>();
    }

    auto ctx_it = doc.find("context");
    if (ctx_it != doc.end() && !ctx_it->is_null()) {
        if (!ctx_it->is_object()) {
            throw InvalidRequestError("'context' must be a JSON object");
        }
        req.context = ctx_it->get<RequestContext>();
    }

    return req;
}

Request Codec::parse_request(std::string_view raw) {
    return to_request(parse(raw));
}

std::string Codec::peek_conversation_id(const nlohmann::json& doc) {
    if (doc.is_object()) {
        auto it = doc.find("conversation_id");
        if (it != doc.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return DEFAULT_CONVERSATION_ID;
}

std::string Codec::serialize(const Response& resp) {
    return serialize(nlohmann::json(resp));
}

std::string Codec::serialize(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace sshmcp
