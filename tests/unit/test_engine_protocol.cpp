#include <string>
#include <variant>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/engine_protocol.hpp"

namespace {

using inkbridge::core::errors::ErrorKind;
using inkbridge::core::errors::get_error;
using inkbridge::core::errors::get_value;
using inkbridge::core::errors::is_error;
using inkbridge::protocol::ChatRequest;
using inkbridge::protocol::DoneMessage;
using inkbridge::protocol::ErrorMessage;
using inkbridge::protocol::ModelsMessage;
using inkbridge::protocol::ToolCall;
using inkbridge::protocol::ToolCallMessage;
using inkbridge::protocol::ToolCallStatus;
using inkbridge::protocol::ToolResultEntry;
using inkbridge::protocol::capabilities_for_provider;
using inkbridge::protocol::parse_engine_message;
using nlohmann::json;

TEST(EngineProtocolTest, ChatRequestCarriesProviderAndMessages) {
    ChatRequest request;
    request.provider = json{{"id", "p1"}, {"baseURL", "https://api.example.com"}};
    request.parameters = json{{"model", "m"}};
    request.system_prompt = "be brief";
    request.messages = {json{{"role", "user"}, {"content", "hi"}}};

    const auto line = inkbridge::protocol::encode_chat_request(request);
    EXPECT_EQ(line.find('\n'), std::string::npos);

    const auto payload = json::parse(line);
    EXPECT_EQ(payload.at("type"), "chat");
    EXPECT_EQ(payload.at("systemPrompt"), "be brief");
    EXPECT_EQ(payload.at("provider").at("id"), "p1");
    ASSERT_EQ(payload.at("messages").size(), 1U);
    EXPECT_EQ(payload.at("messages")[0].at("content"), "hi");
}

TEST(EngineProtocolTest, ToolResultsOmitAbsentErrors) {
    const auto line = inkbridge::protocol::encode_tool_results(
        {ToolResultEntry{"c1", "ok", std::nullopt},
         ToolResultEntry{"c2", "", std::string("Tool not allowed in Discussion mode")}});
    const auto payload = json::parse(line);
    EXPECT_EQ(payload.at("type"), "tool_result");
    const auto& results = payload.at("results");
    ASSERT_EQ(results.size(), 2U);
    EXPECT_FALSE(results[0].contains("error"));
    EXPECT_EQ(results[0].at("result"), "ok");
    EXPECT_EQ(results[1].at("error"), "Tool not allowed in Discussion mode");
}

TEST(EngineProtocolTest, FetchModelsUsesEngineFieldNames) {
    const auto payload = json::parse(inkbridge::protocol::encode_fetch_models_request(
        "openai-compatible", "http://localhost:1234/v1", "key"));
    EXPECT_EQ(payload.at("type"), "fetch_models");
    EXPECT_EQ(payload.at("providerType"), "openai-compatible");
    EXPECT_EQ(payload.at("baseURL"), "http://localhost:1234/v1");
    EXPECT_EQ(payload.at("apiKey"), "key");
}

TEST(EngineProtocolTest, ParsesTerminalMessages) {
    auto done = parse_engine_message("{\"type\":\"done\",\"content\":\"Hello\"}\r\n");
    ASSERT_FALSE(is_error(done));
    ASSERT_TRUE(std::holds_alternative<DoneMessage>(get_value(done)));
    EXPECT_EQ(std::get<DoneMessage>(get_value(done)).content, "Hello");

    auto error = parse_engine_message("{\"type\":\"error\"}");
    ASSERT_FALSE(is_error(error));
    EXPECT_EQ(std::get<ErrorMessage>(get_value(error)).message, "Unknown error");
}

TEST(EngineProtocolTest, ParsesToolCallBatches) {
    auto parsed = parse_engine_message(
        R"({"type":"tool_call","calls":[{"id":"a","name":"read","args":{"path":"x.txt"}},)"
        R"({"id":"b","name":"list"}]})");
    ASSERT_FALSE(is_error(parsed));
    const auto& calls = std::get<ToolCallMessage>(get_value(parsed)).calls;
    ASSERT_EQ(calls.size(), 2U);
    EXPECT_EQ(calls[0].name, "read");
    EXPECT_EQ(calls[0].args.at("path"), "x.txt");
    EXPECT_TRUE(calls[1].args.is_null());
}

TEST(EngineProtocolTest, ParsesModelList) {
    auto parsed = parse_engine_message(R"({"type":"models","models":["a","b"]})");
    ASSERT_FALSE(is_error(parsed));
    const auto& models = std::get<ModelsMessage>(get_value(parsed)).models;
    ASSERT_EQ(models.size(), 2U);
    EXPECT_EQ(models[1], "b");
}

TEST(EngineProtocolTest, RejectsMalformedAndUnknownLines) {
    auto garbage = parse_engine_message("not json");
    ASSERT_TRUE(is_error(garbage));
    EXPECT_EQ(get_error(garbage).kind, ErrorKind::ProtocolViolation);
    EXPECT_NE(get_error(garbage).message.find("not json"), std::string::npos);

    const std::string bogus = R"({"type":"bogus"})";
    auto unknown = parse_engine_message(bogus);
    ASSERT_TRUE(is_error(unknown));
    EXPECT_EQ(get_error(unknown).message, "Unknown response type: " + bogus);

    auto bad_calls = parse_engine_message(R"({"type":"tool_call","calls":{}})");
    ASSERT_TRUE(is_error(bad_calls));
    EXPECT_EQ(get_error(bad_calls).code, "invalid_tool_call");

    auto array = parse_engine_message("[1,2]");
    ASSERT_TRUE(is_error(array));
    EXPECT_EQ(get_error(array).code, "malformed_response");
}

TEST(EngineProtocolTest, ToolCallRecordSerializesNullsForMissingFields) {
    ToolCall call;
    call.id = "c1";
    call.name = "append";
    call.args = json{{"path", "a.txt"}};
    call.status = ToolCallStatus::Error;
    call.error = "denied";
    call.duration_ms = 3;

    const auto payload = inkbridge::protocol::tool_call_to_json(call);
    EXPECT_EQ(payload.at("status"), "error");
    EXPECT_TRUE(payload.at("result").is_null());
    EXPECT_EQ(payload.at("error"), "denied");
    EXPECT_EQ(payload.at("duration"), 3);
}

TEST(EngineProtocolTest, CapabilitiesFollowFlagThenEndpoint) {
    EXPECT_TRUE(capabilities_for_provider(json::object()).supports_tool_result_round);
    EXPECT_FALSE(capabilities_for_provider(json{{"baseURL", "http://127.0.0.1:9/geminicli/v1"}})
                     .supports_tool_result_round);
    EXPECT_TRUE(capabilities_for_provider(json{{"baseURL", "http://127.0.0.1:9/geminicli/v1"},
                                               {"supportsToolResultRound", true}})
                    .supports_tool_result_round);
    EXPECT_FALSE(capabilities_for_provider(json{{"supportsToolResultRound", false}})
                     .supports_tool_result_round);
}

TEST(EngineProtocolTest, EndpointFallbackIsLoggedAndFlagIsPreferred) {
    auto& logger = inkbridge::core::logging::Logger::get();
    logger.set_min_level(inkbridge::core::logging::LogLevel::DEBUG);

    testing::internal::CaptureStderr();
    const auto explicit_flag = capabilities_for_provider(
        json{{"baseURL", "http://127.0.0.1:9/v1"}, {"supportsToolResultRound", false}});
    const auto flag_output = testing::internal::GetCapturedStderr();

    testing::internal::CaptureStderr();
    const auto from_table = capabilities_for_provider(
        json{{"baseURL", "http://127.0.0.1:9/geminicli/v1"}, {"supportsToolResultRound", "no"}});
    const auto table_output = testing::internal::GetCapturedStderr();
    logger.set_min_level(inkbridge::core::logging::LogLevel::INFO);

    EXPECT_FALSE(explicit_flag.supports_tool_result_round);
    EXPECT_EQ(flag_output.find("matches"), std::string::npos);
    EXPECT_FALSE(from_table.supports_tool_result_round);
    EXPECT_NE(table_output.find("ignoring non-boolean supportsToolResultRound"), std::string::npos);
    EXPECT_NE(table_output.find("[DEBUG]"), std::string::npos);
    EXPECT_NE(table_output.find("/geminicli/v1"), std::string::npos);
}

}  // namespace
