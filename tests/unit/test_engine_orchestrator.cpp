#include <atomic>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <signal.h>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/bridge_config.hpp"
#include "core/config/request_id.hpp"
#include "core/errors/bridge_errors.hpp"
#include "runtime/engine_orchestrator.hpp"

namespace {

using inkbridge::core::config::BridgeConfig;
using inkbridge::core::errors::ErrorKind;
using inkbridge::core::errors::get_error;
using inkbridge::core::errors::get_value;
using inkbridge::core::errors::is_error;
using inkbridge::protocol::ChatRequest;
using inkbridge::protocol::CompletionRequest;
using inkbridge::protocol::SessionMode;
using inkbridge::protocol::ToolCallEndEvent;
using inkbridge::protocol::ToolCallObserver;
using inkbridge::protocol::ToolCallStartEvent;
using inkbridge::protocol::ToolCallStatus;
using inkbridge::runtime::EngineOrchestrator;
using nlohmann::json;

// A scratch directory holding a fake engine script and a small project.
class EngineFixture {
public:
    EngineFixture() {
        root_ = std::filesystem::current_path() /
                (".tmp_orchestrator_" + inkbridge::core::config::generate_request_id());
        std::filesystem::create_directories(root_ / "project/chapters");
        write("project/chapters/chapter_001.txt", "It was dark.");
    }

    ~EngineFixture() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    void write(const std::string& relative, const std::string& content) const {
        std::ofstream out(root_ / relative, std::ios::binary);
        out << content;
    }

    std::string read(const std::string& relative) const {
        std::ifstream in(root_ / relative, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(in)),
                           std::istreambuf_iterator<char>());
    }

    // Installs `body` as a /bin/sh engine and returns a config pointing at it.
    BridgeConfig engine(const std::string& body,
                        std::chrono::milliseconds timeout = std::chrono::seconds(10)) const {
        const auto script = root_ / "engine.sh";
        write("engine.sh", "#!/bin/sh\n" + body);
        std::filesystem::permissions(script, std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::add);
        BridgeConfig config;
        config.engine_path_override = script;
        config.chat_timeout = timeout;
        config.complete_timeout = timeout;
        config.poll_interval = std::chrono::milliseconds(10);
        return config;
    }

    ChatRequest chat(SessionMode mode = SessionMode::Discussion) const {
        ChatRequest request;
        request.provider = json{{"id", "p"}, {"baseURL", "http://127.0.0.1:1"}};
        request.parameters = json{{"model", "m"}};
        request.system_prompt = "sys";
        request.messages = {json{{"role", "user"}, {"content", "hi"}}};
        request.project_dir = root_ / "project";
        request.mode = mode;
        return request;
    }

    std::string path(const std::string& relative) const { return (root_ / relative).string(); }

private:
    std::filesystem::path root_;
};

const char* kReadCall =
    R"({"type":"tool_call","calls":[{"id":"c1","name":"read","args":{"path":"chapters/chapter_001.txt"}}]})";

TEST(EngineOrchestratorTest, ReturnsDoneContent) {
    EngineFixture fixture;
    const EngineOrchestrator orchestrator(fixture.engine(
        "read -r req\n"
        "echo '{\"type\":\"done\",\"content\":\"Hello\"}'\n"));

    auto result = orchestrator.run_chat(fixture.chat());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).content, "Hello");
    EXPECT_TRUE(get_value(result).tool_calls.empty());
}

TEST(EngineOrchestratorTest, SendsTheChatRequestAsOneLine) {
    EngineFixture fixture;
    const EngineOrchestrator orchestrator(fixture.engine(
        "read -r req\n"
        "printf '%s\\n' \"$req\" > '" + fixture.path("request.json") + "'\n"
        "echo '{\"type\":\"done\",\"content\":\"\"}'\n"));

    ASSERT_FALSE(is_error(orchestrator.run_chat(fixture.chat())));
    const auto request = json::parse(fixture.read("request.json"));
    EXPECT_EQ(request.at("type"), "chat");
    EXPECT_EQ(request.at("systemPrompt"), "sys");
    EXPECT_EQ(request.at("messages")[0].at("content"), "hi");
}

TEST(EngineOrchestratorTest, EngineErrorIsReported) {
    EngineFixture fixture;
    const EngineOrchestrator orchestrator(fixture.engine(
        "read -r req\n"
        "echo '{\"type\":\"error\",\"message\":\"rate limited\"}'\n"));

    auto result = orchestrator.run_chat(fixture.chat());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::EngineReported);
    EXPECT_EQ(get_error(result).message, "rate limited");
}

TEST(EngineOrchestratorTest, UnknownMessageTypeIsAProtocolViolation) {
    EngineFixture fixture;
    const EngineOrchestrator orchestrator(fixture.engine(
        "read -r req\n"
        "echo '{\"type\":\"bogus\"}'\n"
        "sleep 30\n"));

    const auto started = std::chrono::steady_clock::now();
    auto result = orchestrator.run_chat(fixture.chat());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::ProtocolViolation);
    EXPECT_NE(get_error(result).message.find(R"({"type":"bogus"})"), std::string::npos);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
}

TEST(EngineOrchestratorTest, ExitWithoutAnswerIsACrash) {
    EngineFixture fixture;
    const EngineOrchestrator orchestrator(fixture.engine("read -r req\nexit 3\n"));

    auto result = orchestrator.run_chat(fixture.chat());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::EngineCrashed);
    EXPECT_NE(get_error(result).message.find("exit status: 3"), std::string::npos);
}

TEST(EngineOrchestratorTest, SilentEngineTimesOut) {
    EngineFixture fixture;
    const EngineOrchestrator orchestrator(
        fixture.engine("read -r req\nsleep 30\n", std::chrono::milliseconds(300)));

    const auto started = std::chrono::steady_clock::now();
    auto result = orchestrator.run_chat(fixture.chat());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::TimedOut);
    EXPECT_EQ(get_error(result).message, inkbridge::runtime::kChatTimeoutMessage);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
}

TEST(EngineOrchestratorTest, BlankLinesKeepASlowEngineAlive) {
    EngineFixture fixture;
    const EngineOrchestrator orchestrator(fixture.engine(
        "read -r req\n"
        "for i in 1 2 3 4; do sleep 0.2; echo ''; done\n"
        "echo '{\"type\":\"done\",\"content\":\"slow\"}'\n",
        std::chrono::milliseconds(500)));

    const auto started = std::chrono::steady_clock::now();
    auto result = orchestrator.run_chat(fixture.chat());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).content, "slow");
    EXPECT_GT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(500));
}

TEST(EngineOrchestratorTest, ToolTimeCountsTowardsTheIdleTimeout) {
    EngineFixture fixture;
    const EngineOrchestrator orchestrator(fixture.engine(
        "read -r req\n"
        "echo '" + std::string(kReadCall) + "'\n"
        "read -r results\n"
        "echo '{\"type\":\"done\",\"content\":\"late\"}'\n",
        std::chrono::milliseconds(300)));

    ToolCallObserver observer;
    observer.on_end = [](const ToolCallEndEvent&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    };

    auto result = orchestrator.run_chat(fixture.chat(), &observer);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::TimedOut);
    EXPECT_EQ(get_error(result).message, inkbridge::runtime::kChatTimeoutMessage);
}

TEST(EngineOrchestratorTest, CancelStopsTheEngineQuickly) {
    EngineFixture fixture;
    const std::string pid_file = fixture.path("engine.pid");
    const EngineOrchestrator orchestrator(fixture.engine(
        "echo $$ > '" + pid_file + "'\n"
        "read -r req\n"
        "sleep 30\n"));
    auto cancel = std::make_shared<std::atomic_bool>(false);

    std::thread canceller([cancel] {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        cancel->store(true);
    });
    const auto started = std::chrono::steady_clock::now();
    auto result = orchestrator.run_chat(fixture.chat(), nullptr, cancel);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();

    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::Cancelled);
    EXPECT_EQ(get_error(result).message, "Generation stopped");
    EXPECT_LT(elapsed, std::chrono::milliseconds(1500));

    const int pid = std::stoi(fixture.read("engine.pid"));
    const int signalled = ::kill(pid, 0);
    const int signal_errno = errno;
    EXPECT_EQ(signalled, -1);
    EXPECT_EQ(signal_errno, ESRCH);
}

TEST(EngineOrchestratorTest, PreCancelledRequestNeverSpawns) {
    EngineFixture fixture;
    const EngineOrchestrator orchestrator(
        fixture.engine("touch '" + fixture.path("spawned") + "'\n"));
    auto cancel = std::make_shared<std::atomic_bool>(true);

    auto result = orchestrator.run_chat(fixture.chat(), nullptr, cancel);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::Cancelled);
    EXPECT_FALSE(std::filesystem::exists(fixture.path("spawned")));
}

TEST(EngineOrchestratorTest, ToolRoundSendsResultsBack) {
    EngineFixture fixture;
    const EngineOrchestrator orchestrator(fixture.engine(
        "read -r req\n"
        "echo '" + std::string(kReadCall) + "'\n"
        "read -r results\n"
        "printf '%s\\n' \"$results\" > '" + fixture.path("results.json") + "'\n"
        "echo '{\"type\":\"done\",\"content\":\"after tools\"}'\n"));

    std::vector<std::string> events;
    ToolCallObserver observer;
    observer.on_start = [&events](const ToolCallStartEvent& event) {
        events.push_back("start:" + event.id + ":" + event.name);
    };
    observer.on_end = [&events](const ToolCallEndEvent& event) {
        events.push_back("end:" + event.id + (event.error.has_value() ? ":error" : ":ok"));
    };

    auto result = orchestrator.run_chat(fixture.chat(), &observer);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).content, "after tools");
    ASSERT_EQ(get_value(result).tool_calls.size(), 1U);
    const auto& call = get_value(result).tool_calls[0];
    EXPECT_EQ(call.status, ToolCallStatus::Success);
    EXPECT_TRUE(call.duration_ms.has_value());
    EXPECT_NE(call.result.value().find("00001| It was dark."), std::string::npos);

    ASSERT_EQ(events.size(), 2U);
    EXPECT_EQ(events[0], "start:c1:read");
    EXPECT_EQ(events[1], "end:c1:ok");

    const auto sent = json::parse(fixture.read("results.json"));
    EXPECT_EQ(sent.at("type"), "tool_result");
    ASSERT_EQ(sent.at("results").size(), 1U);
    EXPECT_EQ(sent.at("results")[0].at("id"), "c1");
    EXPECT_FALSE(sent.at("results")[0].contains("error"));
}

TEST(EngineOrchestratorTest, CancelDuringToolRoundSkipsRemainingCalls) {
    EngineFixture fixture;
    const std::string pid_file = fixture.path("engine.pid");
    const EngineOrchestrator orchestrator(fixture.engine(
        "echo $$ > '" + pid_file + "'\n"
        "read -r req\n"
        "echo '{\"type\":\"tool_call\",\"calls\":["
        "{\"id\":\"c1\",\"name\":\"read\",\"args\":{\"path\":\"chapters/chapter_001.txt\"}},"
        "{\"id\":\"c2\",\"name\":\"write\",\"args\":{\"path\":\"notes.txt\",\"content\":\"x\"}}]}'\n"
        "read -r results\n"
        "sleep 30\n"));
    auto cancel = std::make_shared<std::atomic_bool>(false);

    std::vector<std::string> started_ids;
    ToolCallObserver observer;
    observer.on_start = [&started_ids, cancel](const ToolCallStartEvent& event) {
        started_ids.push_back(event.id);
        if (event.id == "c1") {
            cancel->store(true);
        }
    };

    auto request = fixture.chat(SessionMode::Continue);
    request.allow_write = true;
    const auto started = std::chrono::steady_clock::now();
    auto result = orchestrator.run_chat(request, &observer, cancel);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::Cancelled);
    EXPECT_EQ(get_error(result).message, "Generation stopped");
    EXPECT_LT(elapsed, std::chrono::seconds(5));
    ASSERT_EQ(started_ids.size(), 1U);
    EXPECT_EQ(started_ids[0], "c1");
    EXPECT_FALSE(std::filesystem::exists(fixture.path("project/notes.txt")));

    const int pid = std::stoi(fixture.read("engine.pid"));
    const int signalled = ::kill(pid, 0);
    const int signal_errno = errno;
    EXPECT_EQ(signalled, -1);
    EXPECT_EQ(signal_errno, ESRCH);
}

TEST(EngineOrchestratorTest, DiscussionModeReportsBlockedWrites) {
    EngineFixture fixture;
    const EngineOrchestrator orchestrator(fixture.engine(
        "read -r req\n"
        "echo '{\"type\":\"tool_call\",\"calls\":[{\"id\":\"w1\",\"name\":\"append\","
        "\"args\":{\"path\":\"chapters/chapter_001.txt\",\"content\":\"more\"}},"
        "{\"id\":\"r1\",\"name\":\"read\",\"args\":{\"path\":\"chapters/chapter_001.txt\"}}]}'\n"
        "read -r results\n"
        "printf '%s\\n' \"$results\" > '" + fixture.path("results.json") + "'\n"
        "echo '{\"type\":\"done\",\"content\":\"ok\"}'\n"));

    auto result = orchestrator.run_chat(fixture.chat(SessionMode::Discussion));
    ASSERT_FALSE(is_error(result));
    const auto& calls = get_value(result).tool_calls;
    ASSERT_EQ(calls.size(), 2U);
    EXPECT_EQ(calls[0].status, ToolCallStatus::Error);
    EXPECT_EQ(calls[0].error.value(), "Tool not allowed in Discussion mode");
    EXPECT_EQ(calls[1].status, ToolCallStatus::Success);
    EXPECT_EQ(fixture.read("project/chapters/chapter_001.txt"), "It was dark.");

    const auto sent = json::parse(fixture.read("results.json"));
    ASSERT_EQ(sent.at("results").size(), 2U);
    EXPECT_EQ(sent.at("results")[0].at("error"), "Tool not allowed in Discussion mode");
    EXPECT_EQ(sent.at("results")[1].at("id"), "r1");
}

TEST(EngineOrchestratorTest, SingleRoundProviderGetsFormattedToolOutput) {
    EngineFixture fixture;
    const EngineOrchestrator orchestrator(fixture.engine(
        "read -r req\n"
        "echo '" + std::string(kReadCall) + "'\n"
        "sleep 30\n"));
    auto request = fixture.chat();
    request.capabilities.supports_tool_result_round = false;

    const auto started = std::chrono::steady_clock::now();
    auto result = orchestrator.run_chat(request);
    ASSERT_FALSE(is_error(result));
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
    const auto& content = get_value(result).content;
    EXPECT_EQ(content.rfind("[tool] read\nid: c1\nargs: ", 0), 0U);
    EXPECT_NE(content.find("result: "), std::string::npos);
    EXPECT_NE(content.back(), '\n');
}

TEST(EngineOrchestratorTest, MissingEngineFailsToSpawn) {
    EngineFixture fixture;
    BridgeConfig config;
    config.engine_path_override = fixture.path("no-such-engine");
    const EngineOrchestrator orchestrator(config);

    auto result = orchestrator.run_chat(fixture.chat());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::EngineSpawnFailed);
}

TEST(EngineOrchestratorTest, CompletionReturnsDoneContent) {
    EngineFixture fixture;
    const EngineOrchestrator orchestrator(fixture.engine(
        "read -r req\n"
        "echo '{\"type\":\"done\",\"content\":\" next words\"}'\n"));

    CompletionRequest request;
    request.messages = {json{{"role", "user"}, {"content", "Once"}}};
    auto result = orchestrator.run_complete(request);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), " next words");
}

TEST(EngineOrchestratorTest, CompletionRejectsToolCalls) {
    EngineFixture fixture;
    const EngineOrchestrator orchestrator(fixture.engine(
        "read -r req\n"
        "echo '" + std::string(kReadCall) + "'\n"
        "sleep 30\n"));

    auto result = orchestrator.run_complete(CompletionRequest{});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::ProtocolViolation);
    EXPECT_EQ(get_error(result).code, "unexpected_response_type");
}

TEST(EngineOrchestratorTest, CompactReturnsSummary) {
    EngineFixture fixture;
    const EngineOrchestrator orchestrator(fixture.engine(
        "read -r req\n"
        "echo '{\"type\":\"compact_summary\",\"content\":\"short version\"}'\n"));

    auto result = orchestrator.run_compact(json::object(), json::object(),
                                           {json{{"role", "user"}, {"content", "long"}}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "short version");
}

TEST(EngineOrchestratorTest, FetchModelsReturnsList) {
    EngineFixture fixture;
    const EngineOrchestrator orchestrator(fixture.engine(
        "read -r req\n"
        "echo '{\"type\":\"models\",\"models\":[\"m1\",\"m2\"]}'\n"));

    auto result = orchestrator.fetch_models("openai-compatible", "http://127.0.0.1:1/v1", "");
    ASSERT_FALSE(is_error(result));
    ASSERT_EQ(get_value(result).size(), 2U);
    EXPECT_EQ(get_value(result)[0], "m1");
}

TEST(FormatToolRunsTest, RendersResultsAndErrors) {
    inkbridge::protocol::ToolCall ok;
    ok.id = "a";
    ok.name = "list";
    ok.args = json::object();
    ok.result = "{}";
    inkbridge::protocol::ToolCall failed;
    failed.id = "b";
    failed.name = "write";
    failed.args = json{{"path", "x"}};
    failed.error = "denied";

    EXPECT_EQ(inkbridge::runtime::format_tool_runs({ok, failed}),
              "[tool] list\nid: a\nargs: {}\nresult: {}\n\n"
              "[tool] write\nid: b\nargs: {\"path\":\"x\"}\nerror: denied");
}

}  // namespace
