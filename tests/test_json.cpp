//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_json.cpp
// Purpose: JSON value codec and JSON-RPC envelope tests
//==========================================================================================================

#include <gtest/gtest.h>
#include "toolhost/JSONRPCTypes.h"
#include "toolhost/errors/Errors.h"

using namespace toolhost;

TEST(JSON, ParsesNestedDocument) {
    JSONValue v = ParseJSON(R"({"a":1,"b":[true,null,"x"],"c":{"d":-2.5},"e":"é😀"})");
    ASSERT_TRUE(v.IsObject());
    EXPECT_EQ(v.GetInt("a", 0), 1);
    const JSONValue* b = v.Find("b");
    ASSERT_TRUE(b && b->IsArray());
    const auto& arr = std::get<JSONValue::Array>(b->value);
    ASSERT_EQ(arr.size(), 3u);
    EXPECT_TRUE(std::get<bool>(arr[0]->value));
    EXPECT_TRUE(arr[1]->IsNull());
    EXPECT_EQ(std::get<std::string>(arr[2]->value), "x");
    const JSONValue* c = v.Find("c");
    ASSERT_TRUE(c != nullptr);
    EXPECT_DOUBLE_EQ(std::get<double>(c->Find("d")->value), -2.5);
    EXPECT_EQ(v.GetString("e"), "\xC3\xA9\xF0\x9F\x98\x80");
}

TEST(JSON, SerializeIsCompactAndSorted) {
    JSONValue v = ParseJSON(R"({ "z" : 1, "a" : "line\nbreak", "m" : [ ] })");
    EXPECT_EQ(SerializeJSON(v), R"({"a":"line\nbreak","m":[],"z":1})");
}

TEST(JSON, SerializeIndentedPrettyPrints) {
    JSONValue v = ParseJSON(R"({"servers":{"x":{"url":"http://h"}}})");
    const std::string expected =
        "{\n"
        "  \"servers\": {\n"
        "    \"x\": {\n"
        "      \"url\": \"http://h\"\n"
        "    }\n"
        "  }\n"
        "}";
    EXPECT_EQ(SerializeJSON(v, 2), expected);
    EXPECT_EQ(ParseJSON(SerializeJSON(v, 2)), v);
}

TEST(JSON, DoublesKeepTheirType) {
    JSONValue v = ParseJSON("[1.0, 3, 1e3]");
    const auto& arr = std::get<JSONValue::Array>(v.value);
    EXPECT_TRUE(std::holds_alternative<double>(arr[0]->value));
    EXPECT_TRUE(std::holds_alternative<int64_t>(arr[1]->value));
    EXPECT_TRUE(std::holds_alternative<double>(arr[2]->value));
    EXPECT_EQ(SerializeJSON(v), "[1.0,3,1000.0]");
}

TEST(JSON, RejectsMalformedInputWithOffset) {
    EXPECT_THROW(ParseJSON(""), JSONParseError);
    EXPECT_THROW(ParseJSON("{\"a\":}"), JSONParseError);
    EXPECT_THROW(ParseJSON("[1,2"), JSONParseError);
    EXPECT_THROW(ParseJSON("{} trailing"), JSONParseError);
    EXPECT_THROW(ParseJSON("\"unterminated"), JSONParseError);
    try {
        ParseJSON("[1, x]");
        FAIL() << "expected JSONParseError";
    } catch (const JSONParseError& e) {
        EXPECT_EQ(e.Offset(), 4u);
    }
}

TEST(JSON, RejectsExcessiveNesting) {
    std::string deep(1000, '[');
    deep += std::string(1000, ']');
    EXPECT_THROW(ParseJSON(deep), JSONParseError);
}

TEST(JSONRPC, RequestSerializesIdMethodAndParams) {
    JSONValue::Object p;
    p["name"] = std::make_shared<JSONValue>(std::string("add"));
    JSONRPCRequest req(int64_t{7}, "tools/call", JSONValue{p});
    EXPECT_EQ(req.Serialize(), R"({"id":7,"jsonrpc":"2.0","method":"tools/call","params":{"name":"add"}})");

    JSONRPCRequest noParams(int64_t{1}, "tools/list");
    EXPECT_EQ(noParams.Serialize(), R"({"id":1,"jsonrpc":"2.0","method":"tools/list"})");
}

TEST(JSONRPC, ResponseDecodesResultAndError) {
    JSONRPCResponse ok;
    ASSERT_TRUE(ok.Deserialize(R"({"jsonrpc":"2.0","id":3,"result":{"v":1}})"));
    EXPECT_EQ(JSONRPCIdToString(ok.id), "3");
    EXPECT_FALSE(ok.IsError());
    ASSERT_TRUE(ok.result.has_value());
    EXPECT_EQ(ok.result->GetInt("v", 0), 1);

    JSONRPCResponse err;
    ASSERT_TRUE(err.Deserialize(R"({"jsonrpc":"2.0","id":"abc","error":{"code":-32601,"message":"nope","data":[1]}})"));
    EXPECT_TRUE(err.IsError());
    auto rpc = errors::rpcErrorFromResponse(err);
    EXPECT_EQ(rpc.code(), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(rpc.rpcMessage(), "nope");
    ASSERT_TRUE(rpc.data().has_value());
    EXPECT_TRUE(rpc.data()->IsArray());
}

TEST(JSONRPC, ResponseRequiresIdAndOutcome) {
    JSONRPCResponse r;
    EXPECT_FALSE(r.Deserialize(R"({"jsonrpc":"2.0","result":{}})"));
    EXPECT_FALSE(r.Deserialize(R"({"jsonrpc":"2.0","id":1})"));
    EXPECT_FALSE(r.Deserialize("not json"));
}

TEST(JSONRPC, NotificationHasNoId) {
    JSONRPCNotification n("notifications/initialized");
    EXPECT_EQ(n.Serialize(), R"({"jsonrpc":"2.0","method":"notifications/initialized"})");

    JSONRPCNotification parsed;
    EXPECT_FALSE(parsed.Deserialize(R"({"jsonrpc":"2.0","id":1,"method":"ping"})"));
    EXPECT_TRUE(parsed.Deserialize(R"({"jsonrpc":"2.0","method":"notifications/message","params":{"level":"info"}})"));
    EXPECT_EQ(parsed.method, "notifications/message");
}

TEST(Errors, MalformedErrorObjectKeepsPayload) {
    auto r = JSONRPCResponse::Failure(int64_t{1}, JSONValue(std::string("boom")));
    auto rpc = errors::rpcErrorFromResponse(r);
    EXPECT_EQ(rpc.code(), JSONRPCErrorCodes::InternalError);
    ASSERT_TRUE(rpc.data().has_value());
    EXPECT_EQ(*rpc.data(), JSONValue(std::string("boom")));
    EXPECT_EQ(rpc.kind(), errors::ErrorKind::Rpc);
}
