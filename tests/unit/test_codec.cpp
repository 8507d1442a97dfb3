#include <gtest/gtest.h>
#include "lspc/codec.hpp"
#include "lspc/error.hpp"

using namespace lspc;

// ---- Parse tests ----

TEST(CodecParse, ValidRequest) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":"shutdown"})");
    ASSERT_TRUE(std::holds_alternative<Request>(msg));
    auto& req = std::get<Request>(msg);
    EXPECT_EQ(std::get<int64_t>(req.id), 1);
    EXPECT_EQ(req.method, "shutdown");
    EXPECT_FALSE(req.params.has_value());
}

TEST(CodecParse, RequestFromServerWithStringId) {
    auto msg = Codec::parse(
        R"({"jsonrpc":"2.0","id":"cfg-1","method":"workspace/configuration","params":{"items":[]}})");
    ASSERT_TRUE(std::holds_alternative<Request>(msg));
    EXPECT_EQ(std::get<std::string>(std::get<Request>(msg).id), "cfg-1");
}

TEST(CodecParse, ValidResponse) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":42,"result":{"contents":"x"}})");
    ASSERT_TRUE(std::holds_alternative<Response>(msg));
    auto& resp = std::get<Response>(msg);
    EXPECT_EQ(std::get<int64_t>(resp.id), 42);
    ASSERT_TRUE(resp.result.has_value());
    EXPECT_EQ(resp.result->at("contents"), "x");
}

TEST(CodecParse, NullResultIsAResult) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":2,"result":null})");
    ASSERT_TRUE(std::holds_alternative<Response>(msg));
    auto& resp = std::get<Response>(msg);
    ASSERT_TRUE(resp.result.has_value());
    EXPECT_TRUE(resp.result->is_null());
}

TEST(CodecParse, ValidErrorResponse) {
    auto msg = Codec::parse(
        R"({"jsonrpc":"2.0","id":1,"error":{"code":-32601,"message":"Method not found"}})");
    ASSERT_TRUE(std::holds_alternative<Response>(msg));
    auto& resp = std::get<Response>(msg);
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, -32601);
    EXPECT_EQ(resp.error->message, "Method not found");
}

TEST(CodecParse, ValidNotification) {
    auto msg = Codec::parse(
        R"({"jsonrpc":"2.0","method":"textDocument/publishDiagnostics","params":{"diagnostics":[]}})");
    ASSERT_TRUE(std::holds_alternative<Notification>(msg));
    EXPECT_EQ(std::get<Notification>(msg).method, "textDocument/publishDiagnostics");
}

TEST(CodecParse, UnicodeContent) {
    auto msg = Codec::parse(u8R"({"jsonrpc":"2.0","id":3,"result":"héllo ✓"})");
    ASSERT_TRUE(std::holds_alternative<Response>(msg));
    EXPECT_EQ(std::get<Response>(msg).result->get<std::string>(), u8"héllo ✓");
}

TEST(CodecParse, InvalidJson) {
    EXPECT_THROW((void)Codec::parse("{invalid json"), LspParseError);
}

TEST(CodecParse, MissingJsonrpc) {
    EXPECT_THROW((void)Codec::parse(R"({"id":1,"method":"ping"})"), LspParseError);
}

TEST(CodecParse, WrongJsonrpcVersion) {
    EXPECT_THROW((void)Codec::parse(R"({"jsonrpc":"1.0","id":1,"method":"ping"})"), LspParseError);
}

TEST(CodecParse, NullId) {
    EXPECT_THROW((void)Codec::parse(R"({"jsonrpc":"2.0","id":null,"error":{"code":-32700,"message":"x"}})"),
                 LspParseError);
}

TEST(CodecParse, ResponseWithoutResultOrError) {
    EXPECT_THROW((void)Codec::parse(R"({"jsonrpc":"2.0","id":4})"), LspParseError);
}

TEST(CodecParse, ResponseWithBothResultAndError) {
    EXPECT_THROW((void)Codec::parse(
                     R"({"jsonrpc":"2.0","id":4,"result":1,"error":{"code":1,"message":"m"}})"),
                 LspParseError);
}

TEST(CodecParse, MalformedErrorObject) {
    EXPECT_THROW((void)Codec::parse(R"({"jsonrpc":"2.0","id":4,"error":{"message":"no code"}})"),
                 LspParseError);
}

TEST(CodecParse, EmptyInput) {
    EXPECT_THROW((void)Codec::parse(""), LspParseError);
}

TEST(CodecParse, NotAnObject) {
    EXPECT_THROW((void)Codec::parse("[1,2,3]"), LspParseError);
}

TEST(CodecParse, MissingIdAndMethod) {
    EXPECT_THROW((void)Codec::parse(R"({"jsonrpc":"2.0","result":1})"), LspParseError);
}

// ---- Serialize tests ----

TEST(CodecSerialize, RequestMemberOrder) {
    Request req;
    req.id = RequestId{int64_t{1}};
    req.method = "initialize";
    req.params = nlohmann::json{{"processId", 10}};
    EXPECT_EQ(Codec::serialize(req),
              R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"processId":10}})");
}

TEST(CodecSerialize, ResponseMemberOrder) {
    Response resp;
    resp.id = RequestId{std::string("cfg-1")};
    resp.result = nlohmann::json::array({nullptr});
    EXPECT_EQ(Codec::serialize(resp), R"({"jsonrpc":"2.0","id":"cfg-1","result":[null]})");
}

TEST(CodecSerialize, ErrorResponse) {
    Response resp;
    resp.id = RequestId{int64_t{9}};
    resp.error = ResponseError{-32601, "Method not found", std::nullopt};
    EXPECT_EQ(Codec::serialize(resp),
              R"({"jsonrpc":"2.0","id":9,"error":{"code":-32601,"message":"Method not found"}})");
}

TEST(CodecSerialize, NotificationWithoutParams) {
    Notification notif;
    notif.method = "exit";
    EXPECT_EQ(Codec::serialize(notif), R"({"jsonrpc":"2.0","method":"exit"})");
}

TEST(CodecSerialize, InvalidUtf8IsReplaced) {
    Notification notif;
    notif.method = "window/logMessage";
    notif.params = nlohmann::json{{"message", std::string("bad \xff byte")}};
    std::string out;
    EXPECT_NO_THROW(out = Codec::serialize(notif));
    EXPECT_NE(out.find("bad "), std::string::npos);
}

TEST(CodecSerialize, ParsesBack) {
    const std::string original =
        R"({"jsonrpc":"2.0","id":1,"method":"textDocument/completion","params":{"position":{"character":2,"line":1}}})";
    auto msg = Codec::parse(original);
    EXPECT_EQ(Codec::serialize(msg), original);
}
