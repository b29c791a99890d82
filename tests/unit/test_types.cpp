#include <gtest/gtest.h>
#include "sshmcp/types.hpp"

using namespace sshmcp;
using json = nlohmann::json;

TEST(Types, SuccessEnvelopeHasNullError) {
    Response resp;
    resp.conversation_id = "c1";
    resp.status = {0, "Success"};
    resp.result = json{{"hostname", "box"}};

    json j = resp;
    EXPECT_EQ(j["conversation_id"], "c1");
    EXPECT_EQ(j["status"]["code"], 0);
    EXPECT_EQ(j["status"]["message"], "Success");
    EXPECT_EQ(j["result"]["hostname"], "box");
    EXPECT_TRUE(j.contains("error"));
    EXPECT_TRUE(j["error"].is_null());
    EXPECT_FALSE(j.contains("explanation"));
    EXPECT_FALSE(j.contains("suggestions"));
    EXPECT_TRUE(resp.ok());
}

TEST(Types, ErrorEnvelopeHasNullResult) {
    Response resp;
    resp.status = {404, "Tool not found"};
    resp.error = ErrorInfo{"TOOL_NOT_FOUND", "missing", {{"tool", "x"}}};

    json j = resp;
    EXPECT_TRUE(j["result"].is_null());
    EXPECT_EQ(j["error"]["code"], "TOOL_NOT_FOUND");
    EXPECT_EQ(j["error"]["details"]["tool"], "x");
    EXPECT_EQ(j["conversation_id"], "none");
    EXPECT_FALSE(resp.ok());
}

TEST(Types, EnvelopeWithAnnotations) {
    Response resp;
    resp.status = {0, "Success"};
    resp.result = json::object();
    resp.explanation = "why";
    resp.suggestions = std::vector<Suggestion>{{"meta.discover", "more"}};

    json j = resp;
    EXPECT_EQ(j["explanation"], "why");
    ASSERT_EQ(j["suggestions"].size(), 1u);
    EXPECT_EQ(j["suggestions"][0]["tool"], "meta.discover");
    EXPECT_EQ(j.get<Response>(), resp);
}

TEST(Types, RequestContextKeepsUnknownKeys) {
    json ctx = {{"user_intent", "check"}, {"reasoning", "because"}, {"session", {{"n", 1}}}};
    auto c = ctx.get<RequestContext>();
    EXPECT_EQ(c.user_intent, "check");
    EXPECT_EQ(c.reasoning, "because");
    EXPECT_EQ(c.extra["session"]["n"], 1);

    json back = c;
    EXPECT_EQ(back, ctx);
}

TEST(Types, RequestToJson) {
    Request req;
    req.tool = "system.info";
    req.args = {{"verbose", true}};
    json j = req;
    EXPECT_EQ(j["tool"], "system.info");
    EXPECT_EQ(j["conversation_id"], "none");
    EXPECT_FALSE(j.contains("context"));
}

TEST(Types, ToolSummaryFromDescriptor) {
    ToolDescriptor d;
    d.name = "system.info";
    d.description = "info";
    d.version = "0.1.0";
    d.author = "team";
    d.tags = {"system", "monitoring"};
    d.schema = {{"type", "object"}};

    auto s = ToolSummary::from(d);
    json j = s;
    EXPECT_EQ(j["name"], "system.info");
    EXPECT_EQ(j["tags"], json({"system", "monitoring"}));
    EXPECT_FALSE(j.contains("schema"));
    EXPECT_EQ(j.get<ToolSummary>(), s);
    EXPECT_TRUE(d.has_tag("monitoring"));
    EXPECT_FALSE(d.has_tag("network"));
}
