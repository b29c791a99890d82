#include <gtest/gtest.h>
#include "sshmcp/codec.hpp"
#include "sshmcp/error.hpp"

using namespace sshmcp;

// ---- Parse tests ----

TEST(CodecParse, ObjectDocument) {
    auto j = Codec::parse(R"({"tool":"system.info","args":{"verbose":true,"n":3,"x":1.5}})");
    ASSERT_TRUE(j.is_object());
    EXPECT_EQ(j["tool"], "system.info");
    EXPECT_EQ(j["args"]["verbose"], true);
    EXPECT_EQ(j["args"]["n"], 3);
    EXPECT_DOUBLE_EQ(j["args"]["x"].get<double>(), 1.5);
}

TEST(CodecParse, NestedArraysAndNull) {
    auto j = Codec::parse(R"({"a":[1,[2,3],{"b":null}],"c":"é"})");
    EXPECT_EQ(j["a"][1][1], 3);
    EXPECT_TRUE(j["a"][2]["b"].is_null());
    EXPECT_EQ(j["c"], "\xC3\xA9");
}

TEST(CodecParse, InvalidJson) {
    EXPECT_THROW((void)Codec::parse("{invalid json"), ParseError);
}

TEST(CodecParse, PlainTextIsInvalid) {
    EXPECT_THROW((void)Codec::parse("not json"), ParseError);
}

TEST(CodecParse, EmptyInput) {
    EXPECT_THROW((void)Codec::parse(""), ParseError);
    EXPECT_THROW((void)Codec::parse("  \n"), ParseError);
}

TEST(CodecParse, TrailingContent) {
    EXPECT_THROW((void)Codec::parse(R"({"tool":"a"} {"tool":"b"})"), ParseError);
}

TEST(CodecParse, TopLevelScalar) {
    EXPECT_EQ(Codec::parse("42"), 42);
    EXPECT_TRUE(Codec::parse("null").is_null());
}

TEST(CodecParse, ErrorCarriesInvalidJsonCode) {
    try {
        (void)Codec::parse("{");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.code, error::InvalidJson);
        EXPECT_EQ(e.status, error::StatusBadRequest);
    }
}

// ---- Request validation ----

TEST(CodecRequest, MinimalRequestGetsDefaults) {
    auto req = Codec::parse_request(R"({"tool":"system.info"})");
    EXPECT_EQ(req.tool, "system.info");
    EXPECT_EQ(req.args, nlohmann::json::object());
    EXPECT_EQ(req.conversation_id, "none");
    EXPECT_FALSE(req.context.has_value());
}

TEST(CodecRequest, NullArgsTreatedAsAbsent) {
    auto req = Codec::parse_request(R"({"tool":"x","args":null})");
    EXPECT_TRUE(req.args.is_object());
    EXPECT_TRUE(req.args.empty());
}

TEST(CodecRequest, FullRequest) {
    auto req = Codec::parse_request(R"({
        "tool": "file.list",
        "args": {"path": "/tmp"},
        "conversation_id": "conv-7",
        "context": {"user_intent": "see files", "reasoning": "asked", "turn": 3}
    })");
    EXPECT_EQ(req.tool, "file.list");
    EXPECT_EQ(req.args["path"], "/tmp");
    EXPECT_EQ(req.conversation_id, "conv-7");
    ASSERT_TRUE(req.context.has_value());
    EXPECT_EQ(req.context->user_intent, "see files");
    EXPECT_EQ(req.context->reasoning, "asked");
    EXPECT_EQ(req.context->extra["turn"], 3);
}

TEST(CodecRequest, MissingTool) {
    EXPECT_THROW((void)Codec::parse_request(R"({"args":{}})"), InvalidRequestError);
}

TEST(CodecRequest, NonStringTool) {
    EXPECT_THROW((void)Codec::parse_request(R"({"tool":5})"), InvalidRequestError);
}

TEST(CodecRequest, EmptyTool) {
    EXPECT_THROW((void)Codec::parse_request(R"({"tool":""})"), InvalidRequestError);
}

TEST(CodecRequest, ArgsMustBeObject) {
    EXPECT_THROW((void)Codec::parse_request(R"({"tool":"x","args":[1,2]})"), InvalidRequestError);
    EXPECT_THROW((void)Codec::parse_request(R"({"tool":"x","args":"a"})"), InvalidRequestError);
}

TEST(CodecRequest, NonStringConversationId) {
    EXPECT_THROW((void)Codec::parse_request(R"({"tool":"x","conversation_id":12})"),
                 InvalidRequestError);
}

TEST(CodecRequest, NonObjectDocument) {
    EXPECT_THROW((void)Codec::parse_request("[1,2,3]"), InvalidRequestError);
}

TEST(CodecRequest, PeekConversationIdFromInvalidRequest) {
    auto doc = Codec::parse(R"({"conversation_id":"c1","args":{}})");
    EXPECT_EQ(Codec::peek_conversation_id(doc), "c1");
    EXPECT_EQ(Codec::peek_conversation_id(Codec::parse("[]")), "none");
    EXPECT_EQ(Codec::peek_conversation_id(Codec::parse(R"({"conversation_id":3})")), "none");
}

// ---- Serialize tests ----

TEST(CodecSerialize, SingleLine) {
    Response resp;
    resp.conversation_id = "c";
    resp.status = {0, "Success"};
    resp.result = nlohmann::json{{"text", "line1\nline2"}};
    auto out = Codec::serialize(resp);
    EXPECT_EQ(out.find('\n'), std::string::npos);
    EXPECT_NE(out.find("\"conversation_id\":\"c\""), std::string::npos);
}

TEST(CodecSerialize, InvalidUtf8IsReplaced) {
    nlohmann::json j = {{"out", std::string("bad \xFF byte")}};
    std::string out;
    EXPECT_NO_THROW(out = Codec::serialize(j));
    EXPECT_NE(out.find("bad"), std::string::npos);
}

TEST(CodecSerialize, ParseOfSerializedEnvelope) {
    Response resp;
    resp.conversation_id = "abc";
    resp.status = {404, "Tool not found"};
    resp.error = ErrorInfo{"TOOL_NOT_FOUND", "nope", {{"tool", "x"}}};
    auto back = Codec::parse(Codec::serialize(resp)).get<Response>();
    EXPECT_EQ(back, resp);
}

TEST(CodecBackend, JsonAvailable) {
    EXPECT_TRUE(Codec::json_available());
    EXPECT_FALSE(Codec::json_backend().empty());
}
