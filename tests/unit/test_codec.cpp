#include <gtest/gtest.h>
#include "tix/codec.hpp"
#include "tix/error.hpp"

using namespace tix;

// ---- Parse tests ----

TEST(CodecParse, ValidRequest) {
    auto req = Codec::parse(R"({"id":"1","method":"initialize","params":{}})");
    EXPECT_EQ(req.id, "1");
    EXPECT_EQ(req.method, "initialize");
    ASSERT_TRUE(req.params.has_value());
    EXPECT_TRUE(req.params->is_object());
}

TEST(CodecParse, ParamsOptional) {
    auto req = Codec::parse(R"({"id":"2","method":"tools/list"})");
    EXPECT_EQ(req.method, "tools/list");
    EXPECT_FALSE(req.params.has_value());
}

TEST(CodecParse, MissingIdBecomesEmpty) {
    auto req = Codec::parse(R"({"method":"ping"})");
    EXPECT_EQ(req.id, "");
    EXPECT_EQ(req.method, "ping");
}

TEST(CodecParse, ExtraMembersIgnored) {
    auto req = Codec::parse(R"({"jsonrpc":"2.0","id":"abc-123","method":"tools/list"})");
    EXPECT_EQ(req.id, "abc-123");
    EXPECT_EQ(req.method, "tools/list");
}

TEST(CodecParse, RequestWithParams) {
    auto req = Codec::parse(R"({"id":"3","method":"tools/call","params":{"name":"get_done_tickets","arguments":{"x":1}}})");
    ASSERT_TRUE(req.params.has_value());
    EXPECT_EQ(req.params->at("name"), "get_done_tickets");
    EXPECT_EQ(req.params->at("arguments").at("x"), 1);
}

TEST(CodecParse, NonObjectParamsKeptOpaque) {
    auto req = Codec::parse(R"({"id":"3","method":"tools/call","params":[1,2]})");
    ASSERT_TRUE(req.params.has_value());
    EXPECT_TRUE(req.params->is_array());
}

TEST(CodecParse, InvalidJson) {
    EXPECT_THROW(Codec::parse("{invalid json"), TixParseError);
}

TEST(CodecParse, NotJsonAtAll) {
    try {
        (void)Codec::parse("this is not json");
        FAIL() << "expected TixParseError";
    } catch (const TixParseError& e) {
        EXPECT_EQ(e.request_id(), "");
    }
}

TEST(CodecParse, EmptyInput) {
    EXPECT_THROW(Codec::parse(""), TixParseError);
}

TEST(CodecParse, NotAnObject) {
    EXPECT_THROW(Codec::parse("[1,2,3]"), TixParseError);
    EXPECT_THROW(Codec::parse("42"), TixParseError);
}

TEST(CodecParse, NumericIdRejected) {
    try {
        (void)Codec::parse(R"({"id":7,"method":"ping"})");
        FAIL() << "expected TixParseError";
    } catch (const TixParseError& e) {
        EXPECT_EQ(e.request_id(), "");
    }
}

TEST(CodecParse, MissingMethodKeepsId) {
    try {
        (void)Codec::parse(R"({"id":"9","params":{}})");
        FAIL() << "expected TixParseError";
    } catch (const TixParseError& e) {
        EXPECT_EQ(e.request_id(), "9");
    }
}

TEST(CodecParse, NonStringMethodKeepsId) {
    try {
        (void)Codec::parse(R"({"id":"10","method":5})");
        FAIL() << "expected TixParseError";
    } catch (const TixParseError& e) {
        EXPECT_EQ(e.request_id(), "10");
    }
}

// ---- Response tests ----

TEST(CodecResponse, SuccessShape) {
    auto out = Codec::serialize(Response::success("1", {{"ok", true}}));
    auto j = nlohmann::json::parse(out);
    EXPECT_EQ(j.at("id"), "1");
    EXPECT_TRUE(j.at("result").at("ok").get<bool>());
    EXPECT_FALSE(j.contains("error"));
    EXPECT_FALSE(j.contains("jsonrpc"));
}

TEST(CodecResponse, EmptyResultIsObject) {
    auto out = Codec::serialize(Response::success("1", nullptr));
    auto j = nlohmann::json::parse(out);
    ASSERT_TRUE(j.contains("result"));
    EXPECT_TRUE(j.at("result").is_object());
}

TEST(CodecResponse, ErrorShape) {
    auto out = Codec::serialize(Response::failure("4", error::ToolNotFound, "Unknown tool: x"));
    auto j = nlohmann::json::parse(out);
    EXPECT_EQ(j.at("id"), "4");
    EXPECT_FALSE(j.contains("result"));
    EXPECT_EQ(j.at("error").at("code"), error::ToolNotFound);
    EXPECT_EQ(j.at("error").at("message"), "Unknown tool: x");
}

TEST(CodecResponse, RoundTripSuccess) {
    Response original = Response::success("abc", {
        {"tickets", nlohmann::json::array({{{"id", "T1"}, {"title", "Fix login bug"}, {"status", "pending"}}})},
        {"meta", {{"count", 1}}}
    });
    auto reparsed = Codec::parse_response(Codec::serialize(original));
    EXPECT_EQ(reparsed, original);
}

TEST(CodecResponse, RoundTripError) {
    Response original = Response::failure("", error::ParseError, "JSON parse error");
    auto reparsed = Codec::parse_response(Codec::serialize(original));
    EXPECT_EQ(reparsed, original);
}

TEST(CodecResponse, RejectsBothResultAndError) {
    EXPECT_THROW(Codec::parse_response(R"({"id":"1","result":{},"error":{"code":1,"message":"x"}})"),
                 TixParseError);
    EXPECT_THROW(Codec::parse_response(R"({"id":"1"})"), TixParseError);
}

TEST(CodecSerialize, RequestRoundTrip) {
    Request req{"5", "tools/call", nlohmann::json{{"name", "get_todo_tickets"}}};
    auto reparsed = Codec::parse(Codec::serialize(req));
    EXPECT_EQ(reparsed, req);
}
