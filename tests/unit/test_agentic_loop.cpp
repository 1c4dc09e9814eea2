#include <gtest/gtest.h>
#include "gurgeh/engine/agentic_loop.hpp"
#include "mocks/mock_transport.hpp"
#include "fixtures/sse_streams.hpp"
#include "fixtures/tool_definitions.hpp"
#include <atomic>
#include <chrono>
#include <thread>

using namespace gurgeh;
using namespace gurgeh::engine;
using namespace gurgeh::testing;
using json = nlohmann::json;
using namespace std::chrono_literals;

class AgenticLoopTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.api_key = "sk-test";
        config.system_prompt = "You are Gurgeh.";
        registry->register_tool("getPlayerStats", "Player statistics",
            json{{"type", "object"}, {"properties", json::object()}},
            ToolHandler([this](const json&) -> Expected<json> {
                ++stats_calls;
                return json{{"stats", {{"currentElo", 1350}}}};
            }));
    }

    AgenticLoop make_loop() {
        return AgenticLoop(config, transport, registry);
    }

    Expected<ExchangeResult> run(const std::string& text, ExchangeCallbacks callbacks = {}) {
        ExchangeRequest request({}, Message::user(text), std::move(callbacks));
        return make_loop().process_request(request);
    }

    Config config;
    MockTransport transport;
    std::shared_ptr<ToolRegistry> registry = std::make_shared<ToolRegistry>();
    std::atomic<int> stats_calls{0};
};

// ============================================================================
// Single-round exchanges
// ============================================================================

TEST_F(AgenticLoopTest, TextOnlyExchangeCompletesInOneRound) {
    transport.enqueue_stream(sse::hello_stream());

    std::string streamed;
    std::string completed;
    int tool_events = 0;
    ExchangeCallbacks callbacks;
    callbacks.on_chunk = [&streamed](std::string_view t) { streamed += t; };
    callbacks.on_complete = [&completed](const std::string& t) { completed = t; };
    callbacks.on_tool_start = [&tool_events](const std::string&, const json&) { ++tool_events; };
    callbacks.on_tool_result = [&tool_events](const std::string&, const json&) { ++tool_events; };

    auto result = run("Hi", callbacks);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->state, ExchangeState::Done);
    EXPECT_EQ(result->text, "Hello");
    EXPECT_EQ(result->rounds_used, 1);
    EXPECT_EQ(result->tool_invocations, 0);
    EXPECT_FALSE(result->budget_exhausted);
    EXPECT_EQ(streamed, "Hello");
    EXPECT_EQ(completed, "Hello");
    EXPECT_EQ(tool_events, 0);

    ASSERT_EQ(result->new_messages.size(), 1u);
    EXPECT_EQ(result->new_messages[0], Message::assistant("Hello"));

    auto body = transport.request_body(0);
    ASSERT_EQ(body["messages"].size(), 2u);
    EXPECT_EQ(body["messages"][0]["role"], "system");
    EXPECT_EQ(body["messages"][1]["content"], "Hi");
    ASSERT_TRUE(body.contains("tools"));
    EXPECT_EQ(body["tools"][0]["function"]["name"], "getPlayerStats");
}

TEST_F(AgenticLoopTest, NoToolsRegisteredOmitsToolsField) {
    registry = std::make_shared<ToolRegistry>();
    transport.enqueue_stream(sse::hello_stream());

    ASSERT_TRUE(run("Hi").has_value());
    EXPECT_FALSE(transport.request_body(0).contains("tools"));
}

TEST_F(AgenticLoopTest, CorruptRecordDoesNotEndExchange) {
    transport.enqueue_stream(sse::join({
        sse::text("Keep "),
        "data: not json at all\n\n",
        sse::text("practicing."),
        sse::done()
    }));

    auto result = run("Tips?");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->state, ExchangeState::Done);
    EXPECT_EQ(result->text, "Keep practicing.");
}

// ============================================================================
// Tool rounds
// ============================================================================

TEST_F(AgenticLoopTest, ToolRoundFeedsResultIntoSecondRound) {
    transport.enqueue_stream(sse::player_stats_call_stream());
    transport.enqueue_stream(sse::answer_stream("You are rated 1350."));

    auto result = run("How am I doing?");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->state, ExchangeState::Done);
    EXPECT_EQ(result->text, "You are rated 1350.");
    EXPECT_EQ(result->rounds_used, 2);
    EXPECT_EQ(result->tool_invocations, 1);
    EXPECT_EQ(stats_calls.load(), 1);

    ASSERT_EQ(transport.request_count(), 2u);
    auto messages = transport.request_body(1)["messages"];
    ASSERT_EQ(messages.size(), 4u);
    EXPECT_EQ(messages[2]["role"], "assistant");
    EXPECT_EQ(messages[2]["tool_calls"][0]["id"], "call_stats");
    EXPECT_EQ(messages[2]["tool_calls"][0]["function"]["arguments"], "{}");
    EXPECT_EQ(messages[3]["role"], "tool");
    EXPECT_EQ(messages[3]["tool_call_id"], "call_stats");

    auto content = json::parse(messages[3]["content"].get<std::string>());
    EXPECT_EQ(content["success"], true);
    EXPECT_EQ(content["stats"]["currentElo"], 1350);

    // assistant(calls), tool, final assistant
    ASSERT_EQ(result->new_messages.size(), 3u);
    EXPECT_EQ(result->new_messages[1].role, Role::Tool);
    EXPECT_EQ(result->new_messages[2], Message::assistant("You are rated 1350."));
}

TEST_F(AgenticLoopTest, ParallelCallsAnsweredInFirstSeenOrder) {
    registry->register_tool("add", "Add", {"a", "b"}, tools::add);
    transport.enqueue_stream(sse::join({
        sse::tool_call(0, std::string("call_1"), std::string("add"), std::string("{\"a\":1,")),
        sse::tool_call(1, std::string("call_2"), std::string("getPlayerStats"), std::string("{}")),
        sse::tool_call(2, std::string("call_3"), std::string("add"), std::string("{\"a\":5,\"b\":5}")),
        sse::tool_call(0, std::nullopt, std::nullopt, std::string("\"b\":2}")),
        sse::finish("tool_calls"),
        sse::done()
    }));
    transport.enqueue_stream(sse::answer_stream("Done."));

    std::vector<std::string> started;
    ExchangeCallbacks callbacks;
    callbacks.on_tool_start = [&started](const std::string& name, const json&) { started.push_back(name); };

    auto result = run("Go", callbacks);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->tool_invocations, 3);
    EXPECT_EQ(started, (std::vector<std::string>{"add", "getPlayerStats", "add"}));

    auto messages = transport.request_body(1)["messages"];
    ASSERT_EQ(messages.size(), 6u);
    EXPECT_EQ(messages[3]["tool_call_id"], "call_1");
    EXPECT_EQ(messages[4]["tool_call_id"], "call_2");
    EXPECT_EQ(messages[5]["tool_call_id"], "call_3");
    EXPECT_EQ(json::parse(messages[3]["content"].get<std::string>())["result"], 3);
    EXPECT_EQ(json::parse(messages[5]["content"].get<std::string>())["result"], 10);
}

TEST_F(AgenticLoopTest, ToolCallbacksFireOncePerCall) {
    transport.enqueue_stream(sse::player_stats_call_stream());
    transport.enqueue_stream(sse::answer_stream("ok"));

    int starts = 0;
    json reported;
    ExchangeCallbacks callbacks;
    callbacks.on_tool_start = [&starts](const std::string& name, const json& args) {
        EXPECT_EQ(name, "getPlayerStats");
        EXPECT_EQ(args, json::object());
        ++starts;
    };
    callbacks.on_tool_result = [&reported](const std::string&, const json& result) { reported = result; };

    ASSERT_TRUE(run("Stats", callbacks).has_value());
    EXPECT_EQ(starts, 1);
    EXPECT_EQ(reported["success"], true);
    EXPECT_EQ(reported["stats"]["currentElo"], 1350);
}

TEST_F(AgenticLoopTest, UnknownToolBecomesFailedResult) {
    transport.enqueue_stream(sse::single_call_stream("call_x", "getOpponentSecrets", "{}"));
    transport.enqueue_stream(sse::answer_stream("I cannot do that."));

    auto result = run("Cheat?");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->state, ExchangeState::Done);
    EXPECT_EQ(result->text, "I cannot do that.");

    auto tool_msg = transport.request_body(1)["messages"][3];
    auto content = json::parse(tool_msg["content"].get<std::string>());
    EXPECT_EQ(content["success"], false);
    EXPECT_EQ(content["error"], "Unknown tool: getOpponentSecrets");
}

TEST_F(AgenticLoopTest, UnparsableArgumentsBecomeFailedResult) {
    transport.enqueue_stream(sse::single_call_stream("call_bad", "getPlayerStats", "{\"oops\":"));
    transport.enqueue_stream(sse::answer_stream("Retrying later."));

    auto result = run("Stats");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->state, ExchangeState::Done);
    EXPECT_EQ(stats_calls.load(), 0);

    auto messages = transport.request_body(1)["messages"];
    // Replayed call carries well-formed arguments
    EXPECT_EQ(messages[2]["tool_calls"][0]["function"]["arguments"], "{}");
    auto content = json::parse(messages[3]["content"].get<std::string>());
    EXPECT_EQ(content["success"], false);
}

TEST_F(AgenticLoopTest, BadSiblingCallsDoNotAbortRound) {
    transport.enqueue_stream(sse::join({
        sse::tool_call(0, std::string("call_a"), std::string("getOpeningBook"), std::string("{}")),
        sse::tool_call(1, std::string("call_b"), std::string("getPlayerStats"), std::string("{\"oops\":")),
        sse::tool_call(2, std::string("call_c"), std::string("getPlayerStats"), std::string("{}")),
        sse::finish("tool_calls"),
        sse::done()
    }));
    transport.enqueue_stream(sse::answer_stream("You are rated 1350."));

    std::vector<std::string> finished;
    ExchangeCallbacks callbacks;
    callbacks.on_tool_result = [&finished](const std::string& name, const json&) { finished.push_back(name); };

    auto result = run("How am I doing?", callbacks);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->state, ExchangeState::Done);
    EXPECT_EQ(result->text, "You are rated 1350.");
    EXPECT_EQ(result->rounds_used, 2);
    EXPECT_EQ(stats_calls.load(), 1);
    EXPECT_EQ(finished, (std::vector<std::string>{"getOpeningBook", "getPlayerStats", "getPlayerStats"}));

    ASSERT_EQ(transport.request_count(), 2u);
    auto messages = transport.request_body(1)["messages"];
    ASSERT_EQ(messages.size(), 6u);
    EXPECT_EQ(messages[2]["tool_calls"].size(), 3u);

    EXPECT_EQ(messages[3]["tool_call_id"], "call_a");
    auto unknown = json::parse(messages[3]["content"].get<std::string>());
    EXPECT_EQ(unknown["success"], false);
    EXPECT_EQ(unknown["error"], "Unknown tool: getOpeningBook");

    EXPECT_EQ(messages[4]["tool_call_id"], "call_b");
    EXPECT_EQ(json::parse(messages[4]["content"].get<std::string>())["success"], false);

    EXPECT_EQ(messages[5]["tool_call_id"], "call_c");
    auto valid = json::parse(messages[5]["content"].get<std::string>());
    EXPECT_EQ(valid["success"], true);
    EXPECT_EQ(valid["stats"]["currentElo"], 1350);
}

TEST_F(AgenticLoopTest, OutOfRangeIntegerArgumentFailsCall) {
    std::atomic<int> negate_calls{0};
    registry->register_tool("negate", "Negate", {"value"}, [&negate_calls](int v) {
        ++negate_calls;
        return -v;
    });
    transport.enqueue_stream(sse::single_call_stream("call_n", "negate", "{\"value\":1e10}"));
    transport.enqueue_stream(sse::answer_stream("That number is too large."));

    auto result = run("Negate ten billion");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->state, ExchangeState::Done);
    EXPECT_EQ(negate_calls.load(), 0);

    auto content = json::parse(transport.request_body(1)["messages"][3]["content"].get<std::string>());
    EXPECT_EQ(content["success"], false);
    EXPECT_EQ(content["error"], "Argument 'value' is above the maximum of 2147483647");
}

TEST_F(AgenticLoopTest, ArgumentsValidatedAgainstSchema) {
    registry->register_tool("add", "Add", {"a", "b"}, tools::add);
    transport.enqueue_stream(sse::single_call_stream("call_1", "add", "{\"a\":1}"));
    transport.enqueue_stream(sse::answer_stream("ok"));

    ASSERT_TRUE(run("Add").has_value());
    auto content = json::parse(transport.request_body(1)["messages"][3]["content"].get<std::string>());
    EXPECT_EQ(content["success"], false);
    EXPECT_NE(content["error"].get<std::string>().find("Missing required argument: b"), std::string::npos);
}

// ============================================================================
// Round budget
// ============================================================================

TEST_F(AgenticLoopTest, BudgetExhaustionIsSoftStop) {
    config.max_rounds = 1;
    transport.enqueue_stream(sse::join({
        sse::text("Let me check your stats."),
        sse::tool_call(0, std::string("call_stats"), std::string("getPlayerStats"), std::string("{}")),
        sse::finish("tool_calls"),
        sse::done()
    }));

    auto result = run("Stats");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->state, ExchangeState::Done);
    EXPECT_TRUE(result->budget_exhausted);
    EXPECT_EQ(result->rounds_used, 1);
    EXPECT_EQ(result->text, "Let me check your stats.");
    EXPECT_EQ(transport.request_count(), 1u);
    EXPECT_EQ(stats_calls.load(), 1);
}

TEST_F(AgenticLoopTest, NeverExceedsRoundBudget) {
    config.max_rounds = 3;
    for (int i = 0; i < 5; ++i) {
        transport.enqueue_stream(sse::single_call_stream("call_" + std::to_string(i), "getPlayerStats", "{}"));
    }

    auto result = run("Loop forever");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->rounds_used, 3);
    EXPECT_TRUE(result->budget_exhausted);
    EXPECT_EQ(transport.request_count(), 3u);
    EXPECT_EQ(transport.pending(), 2u);
}

TEST_F(AgenticLoopTest, UsageSummedAcrossRounds) {
    transport.enqueue_stream(sse::join({
        sse::tool_call(0, std::string("call_stats"), std::string("getPlayerStats"), std::string("{}")),
        sse::usage(100, 10),
        sse::done()
    }));
    transport.enqueue_stream(sse::join({sse::text("ok"), sse::usage(150, 20), sse::done()}));

    auto result = run("Stats");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->usage.prompt_tokens, 250);
    EXPECT_EQ(result->usage.completion_tokens, 30);
    EXPECT_EQ(result->usage.total_tokens, 280);
}

// ============================================================================
// Failures and cancellation
// ============================================================================

TEST_F(AgenticLoopTest, TransportErrorOnLaterRoundFailsExchange) {
    transport.enqueue_stream(sse::player_stats_call_stream());
    transport.enqueue_status(401, R"({"error":{"message":"Invalid API key"}})");

    std::optional<Error> reported;
    bool completed = false;
    ExchangeCallbacks callbacks;
    callbacks.on_error = [&reported](const Error& e) { reported = e; };
    callbacks.on_complete = [&completed](const std::string&) { completed = true; };

    auto result = run("Stats", callbacks);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->state, ExchangeState::Failed);
    ASSERT_TRUE(result->error.has_value());
    EXPECT_EQ(result->error->code, ErrorCode::HttpStatusError);
    ASSERT_TRUE(reported.has_value());
    EXPECT_EQ(reported->code, ErrorCode::HttpStatusError);
    EXPECT_FALSE(completed);

    // Round 1 traffic survives: assistant(calls), tool result, explanation
    ASSERT_EQ(result->new_messages.size(), 3u);
    EXPECT_EQ(result->new_messages[0].tool_calls.size(), 1u);
    EXPECT_EQ(result->new_messages[1].role, Role::Tool);
    EXPECT_EQ(result->rounds_used, 2);
    const auto& last = result->new_messages.back();
    EXPECT_EQ(last.role, Role::Assistant);
    EXPECT_NE(last.content.find("API key"), std::string::npos);
}

TEST_F(AgenticLoopTest, InvalidHistoryRejectedBeforeAnyRequest) {
    std::vector<Message> history = {Message::tool("{}", "call_1")};
    ExchangeRequest request(history, Message::user("x"));

    auto result = make_loop().process_request(request);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidMessageSequence);
    EXPECT_EQ(transport.request_count(), 0u);
}

TEST_F(AgenticLoopTest, CancelledBeforeStart) {
    ExchangeRequest request({}, Message::user("x"));
    request.cancelled->store(true);

    auto result = make_loop().process_request(request);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::RequestCancelled);
    EXPECT_EQ(transport.request_count(), 0u);
}

TEST_F(AgenticLoopTest, CancelDuringStreamEndsPromptly) {
    ScriptedResponse hanging;
    hanging.chunks.push_back(sse::text("Thinking"));
    hanging.hang_until_cancelled = true;
    transport.enqueue(std::move(hanging));

    ExchangeRequest request({}, Message::user("Analyze"));
    auto token = request.cancelled;
    std::thread canceller([token]() {
        std::this_thread::sleep_for(30ms);
        token->store(true);
    });

    auto result = make_loop().process_request(request);
    canceller.join();

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->state, ExchangeState::Failed);
    EXPECT_EQ(result->error->code, ErrorCode::RequestCancelled);
    EXPECT_EQ(result->new_messages.back().content, "Stopped.");
}

TEST_F(AgenticLoopTest, ToolTimeoutReportedToModel) {
    config.tool_timeout = 20ms;
    registry->register_tool("sleep_ms", "Sleep", {"ms"}, tools::sleep_ms);
    transport.enqueue_stream(sse::single_call_stream("call_slow", "sleep_ms", "{\"ms\":300}"));
    transport.enqueue_stream(sse::answer_stream("That took too long."));

    auto result = run("Slow");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->state, ExchangeState::Done);
    auto content = json::parse(transport.request_body(1)["messages"][3]["content"].get<std::string>());
    EXPECT_EQ(content["success"], false);
    EXPECT_NE(content["error"].get<std::string>().find("timed out"), std::string::npos);
}
