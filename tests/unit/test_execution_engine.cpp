#include <chrono>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/settings.hpp"
#include "core/errors/forge_errors.hpp"
#include "protocol/message_contract.hpp"
#include "provider/credential_pool.hpp"
#include "runtime/execution_engine.hpp"
#include "status/progress_sink.hpp"
#include "test_support.hpp"

namespace {

using neoforge::core::config::ExecutionLimits;
using neoforge::core::errors::ErrorCategory;
using neoforge::core::errors::get_error;
using neoforge::core::errors::get_value;
using neoforge::core::errors::is_error;
using neoforge::protocol::Role;
using neoforge::provider::CredentialPool;
using neoforge::runtime::AgentTurn;
using neoforge::runtime::backoff_seconds;
using neoforge::runtime::ExecutionEngine;
using neoforge::runtime::RunOutcome;
using neoforge::testing::ChatResult;
using neoforge::testing::count_messages;
using neoforge::testing::malformed_tool_call;
using neoforge::testing::provider_failure;
using neoforge::testing::rate_limited;
using neoforge::testing::ScriptedTransport;
using neoforge::testing::TempWorkspace;
using neoforge::testing::text_reply;
using neoforge::testing::tool_reply;
using neoforge::testing::write_call;

constexpr const char* kCorrection =
    "Your previous tool call was malformed. "
    "You MUST call tools using the provided JSON function schema - "
    "do NOT use XML-style <function=...> syntax. Please retry.";

CredentialPool make_pool(const std::vector<std::string>& keys) {
    auto pool = CredentialPool::build(keys);
    EXPECT_FALSE(is_error(pool));
    return get_value(pool);
}

AgentTurn make_turn(const TempWorkspace& workspace) {
    AgentTurn turn;
    turn.agent_label = "Architect";
    turn.system_prompt = "You are an architect.";
    turn.user_message = "Design the system.";
    turn.workspace_root = workspace.root();
    return turn;
}

struct RecordedSleeps {
    std::vector<std::chrono::milliseconds> waits;
};

void instrument(ExecutionEngine& engine, RecordedSleeps& sleeps, double jitter = 0.0) {
    engine.set_sleeper(
        [&sleeps](const std::chrono::milliseconds wait) { sleeps.waits.push_back(wait); });
    engine.set_jitter_source([jitter](double) { return jitter; });
}

const std::vector<std::string> kThreeKeys = {"key-alpha-0000000001", "key-bravo-0000000002",
                                             "key-charlie-00000003"};

TEST(ExecutionEngineTest, BackoffDoublesPerCycle) {
    EXPECT_DOUBLE_EQ(backoff_seconds(20.0, 1, 0.0), 20.0);
    EXPECT_DOUBLE_EQ(backoff_seconds(20.0, 2, 0.0), 40.0);
    EXPECT_DOUBLE_EQ(backoff_seconds(20.0, 3, 2.5), 82.5);
}

TEST(ExecutionEngineTest, TerminalReplyCompletesImmediately) {
    TempWorkspace workspace("engine");
    auto pool = make_pool(kThreeKeys);
    auto transport = ScriptedTransport::sequence({text_reply("All written.")});
    ExecutionEngine engine(transport, pool, "test-model");

    auto result = engine.run(make_turn(workspace));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).outcome, RunOutcome::Completed);
    EXPECT_EQ(get_value(result).text, "All written.");
    EXPECT_EQ(get_value(result).counters.productive_calls, 1u);

    ASSERT_EQ(transport.requests.size(), 1u);
    const auto& request = transport.requests[0];
    EXPECT_EQ(request.model, "test-model");
    EXPECT_EQ(request.tool_choice, "auto");
    EXPECT_EQ(request.tools.size(), 2u);
    ASSERT_EQ(request.messages.size(), 2u);
    EXPECT_EQ(request.messages[0].role, Role::System);
    EXPECT_EQ(request.messages[1].content, "Design the system.");
    EXPECT_EQ(transport.credentials[0], kThreeKeys[0]);
}

TEST(ExecutionEngineTest, ExecutesToolCallsAndAppendsResults) {
    TempWorkspace workspace("engine");
    auto pool = make_pool(kThreeKeys);
    auto transport = ScriptedTransport::sequence(
        {tool_reply({write_call("call_1", "ARCHITECTURE.md", "# Layers")}), text_reply("done")});
    ExecutionEngine engine(transport, pool, "test-model");

    auto result = engine.run(make_turn(workspace));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).counters.productive_calls, 2u);
    EXPECT_EQ(get_value(result).counters.tool_calls, 1u);
    EXPECT_EQ(neoforge::testing::read_file(workspace.root() / "ARCHITECTURE.md"), "# Layers");

    ASSERT_EQ(transport.requests.size(), 2u);
    const auto& messages = transport.requests[1].messages;
    ASSERT_EQ(messages.size(), 4u);
    EXPECT_EQ(messages[2].role, Role::Assistant);
    ASSERT_EQ(messages[2].tool_calls.size(), 1u);
    EXPECT_EQ(messages[3].role, Role::Tool);
    EXPECT_EQ(messages[3].tool_call_id.value(), "call_1");
    EXPECT_EQ(messages[3].content, "Successfully wrote to ARCHITECTURE.md");
}

TEST(ExecutionEngineTest, BadToolArgumentsBecomeToolErrorKeyedById) {
    TempWorkspace workspace("engine");
    auto pool = make_pool(kThreeKeys);
    auto transport = ScriptedTransport::sequence(
        {tool_reply({neoforge::protocol::ToolCall{"call_7", "write_file", "{broken"}}),
         text_reply("done")});
    ExecutionEngine engine(transport, pool, "test-model");

    auto result = engine.run(make_turn(workspace));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).outcome, RunOutcome::Completed);

    const auto& tool_message = transport.requests[1].messages.back();
    EXPECT_EQ(tool_message.role, Role::Tool);
    EXPECT_EQ(tool_message.tool_call_id.value(), "call_7");
    EXPECT_EQ(tool_message.content.rfind("Error: ", 0), 0u);
}

TEST(ExecutionEngineTest, EachKeyRateLimitedOnceTriggersOneExhaustion) {
    TempWorkspace workspace("engine");
    auto pool = make_pool(kThreeKeys);
    auto transport = ScriptedTransport::sequence(
        {rate_limited(), rate_limited(), rate_limited(), text_reply("done")});
    ExecutionEngine engine(transport, pool, "test-model");
    RecordedSleeps sleeps;
    instrument(engine, sleeps);

    auto result = engine.run(make_turn(workspace));
    ASSERT_FALSE(is_error(result));
    const auto& counters = get_value(result).counters;
    EXPECT_EQ(counters.rate_limit_hits, 3u);
    EXPECT_EQ(counters.rotations, 2u);
    EXPECT_EQ(counters.exhaustion_cycles, 1u);
    EXPECT_EQ(counters.productive_calls, 1u);
    ASSERT_EQ(sleeps.waits.size(), 1u);
    EXPECT_EQ(sleeps.waits[0], std::chrono::milliseconds(20000));

    ASSERT_EQ(transport.credentials.size(), 4u);
    EXPECT_EQ(transport.credentials[0], kThreeKeys[0]);
    EXPECT_EQ(transport.credentials[1], kThreeKeys[1]);
    EXPECT_EQ(transport.credentials[2], kThreeKeys[2]);
    EXPECT_EQ(transport.credentials[3], kThreeKeys[0]);
}

TEST(ExecutionEngineTest, SingleKeyBacksOffWithGrowingWaits) {
    TempWorkspace workspace("engine");
    auto pool = make_pool({"only-key-000000000001"});
    auto transport = ScriptedTransport::sequence(
        {rate_limited(), rate_limited(), rate_limited(), text_reply("done")});
    ExecutionEngine engine(transport, pool, "test-model");
    RecordedSleeps sleeps;
    instrument(engine, sleeps, 1.0);

    auto result = engine.run(make_turn(workspace));
    ASSERT_FALSE(is_error(result));
    const auto& backoffs = get_value(result).backoff_seconds;
    ASSERT_EQ(backoffs.size(), 3u);
    EXPECT_DOUBLE_EQ(backoffs[0], 21.0);
    EXPECT_DOUBLE_EQ(backoffs[1], 41.0);
    EXPECT_DOUBLE_EQ(backoffs[2], 81.0);
    ASSERT_EQ(sleeps.waits.size(), 3u);
    EXPECT_LT(sleeps.waits[0], sleeps.waits[1]);
    EXPECT_LT(sleeps.waits[1], sleeps.waits[2]);
    EXPECT_EQ(get_value(result).counters.rotations, 0u);
}

TEST(ExecutionEngineTest, ExhaustionCycleResetsAfterSuccess) {
    TempWorkspace workspace("engine");
    auto pool = make_pool({"only-key-000000000001"});
    auto transport = ScriptedTransport::sequence(
        {rate_limited(), rate_limited(),
         tool_reply({write_call("c1", "PRD.md", "x")}),
         rate_limited(), text_reply("done")});
    ExecutionEngine engine(transport, pool, "test-model");
    RecordedSleeps sleeps;
    instrument(engine, sleeps);

    auto result = engine.run(make_turn(workspace));
    ASSERT_FALSE(is_error(result));
    const auto& backoffs = get_value(result).backoff_seconds;
    ASSERT_EQ(backoffs.size(), 3u);
    EXPECT_DOUBLE_EQ(backoffs[0], 20.0);
    EXPECT_DOUBLE_EQ(backoffs[1], 40.0);
    EXPECT_DOUBLE_EQ(backoffs[2], 20.0);
}

TEST(ExecutionEngineTest, ExhaustionIsMeasuredFromTheSweepStart) {
    TempWorkspace workspace("engine");
    auto pool = make_pool(kThreeKeys);
    auto transport = ScriptedTransport::sequence(
        {rate_limited(),                                      // key0 -> key1
         tool_reply({write_call("c1", "PRD.md", "x")}),       // key1 answers
         rate_limited(),                                      // key1 starts a sweep
         rate_limited(),                                      // key2, wraps to key0
         rate_limited(),                                      // key0, back at key1
         text_reply("done")});
    ExecutionEngine engine(transport, pool, "test-model");
    std::vector<std::size_t> requests_at_sleep;
    engine.set_sleeper([&](std::chrono::milliseconds) {
        requests_at_sleep.push_back(transport.requests.size());
    });
    engine.set_jitter_source([](double) { return 0.0; });

    auto result = engine.run(make_turn(workspace));
    ASSERT_FALSE(is_error(result));
    ASSERT_EQ(requests_at_sleep.size(), 1u);
    EXPECT_EQ(requests_at_sleep[0], 5u);
    EXPECT_EQ(get_value(result).counters.exhaustion_cycles, 1u);
    EXPECT_EQ(get_value(result).counters.rotations, 3u);

    ASSERT_EQ(transport.credentials.size(), 6u);
    EXPECT_EQ(transport.credentials[2], kThreeKeys[1]);
    EXPECT_EQ(transport.credentials[4], kThreeKeys[0]);
    EXPECT_EQ(transport.credentials[5], kThreeKeys[1]);
}

TEST(ExecutionEngineTest, MalformedReplyEndsTheRateLimitSweep) {
    TempWorkspace workspace("engine");
    auto pool = make_pool({"key-alpha-0000000001", "key-bravo-0000000002"});
    auto transport = ScriptedTransport::sequence(
        {rate_limited(),            // key0 -> key1
         malformed_tool_call(),     // key1 answered
         rate_limited(),            // key1 starts a new sweep -> key0
         text_reply("done")});
    ExecutionEngine engine(transport, pool, "test-model");
    RecordedSleeps sleeps;
    instrument(engine, sleeps);

    auto result = engine.run(make_turn(workspace));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).outcome, RunOutcome::Completed);
    EXPECT_TRUE(sleeps.waits.empty());
    EXPECT_EQ(get_value(result).counters.rotations, 2u);
    EXPECT_EQ(get_value(result).counters.exhaustion_cycles, 0u);
}

TEST(ExecutionEngineTest, HealthyKeyServesAllProductiveCalls) {
    TempWorkspace workspace("engine");
    const std::string bad_key = "key-limited-000000001";
    const std::string good_key = "key-healthy-000000002";
    auto pool = make_pool({bad_key, good_key});

    int served = 0;
    ScriptedTransport transport(
        [&](const std::string& credential, const neoforge::protocol::ChatRequest&) -> ChatResult {
            if (credential == bad_key) {
                return rate_limited();
            }
            ++served;
            if (served < 4) {
                return tool_reply({write_call("c" + std::to_string(served),
                                              "notes/" + std::to_string(served) + ".md", "n")});
            }
            return text_reply("done");
        });
    ExecutionEngine engine(transport, pool, "test-model");
    RecordedSleeps sleeps;
    instrument(engine, sleeps);

    auto result = engine.run(make_turn(workspace));
    ASSERT_FALSE(is_error(result));
    const auto& counters = get_value(result).counters;
    EXPECT_EQ(counters.productive_calls, 4u);
    EXPECT_LE(counters.rotations, 2u * counters.productive_calls);
    EXPECT_EQ(counters.exhaustion_cycles, 0u);
    EXPECT_TRUE(sleeps.waits.empty());
    for (std::size_t i = 0; i < transport.credentials.size(); ++i) {
        if (transport.outcomes[i]) {
            EXPECT_EQ(transport.credentials[i], good_key);
        }
    }
}

TEST(ExecutionEngineTest, AbortsWhenRateLimitBudgetSpent) {
    TempWorkspace workspace("engine");
    auto pool = make_pool(kThreeKeys);
    ScriptedTransport transport(
        [](const std::string&, const neoforge::protocol::ChatRequest&) { return rate_limited(); });
    ExecutionLimits limits;
    limits.max_rate_limit_hits = 6;
    ExecutionEngine engine(transport, pool, "test-model", limits);
    RecordedSleeps sleeps;
    instrument(engine, sleeps);

    auto result = engine.run(make_turn(workspace));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).outcome, RunOutcome::RateLimitAborted);
    EXPECT_EQ(get_value(result).text, "Agent aborted: rate limit hit 6 times.");
    EXPECT_EQ(get_value(result).counters.productive_calls, 0u);
    EXPECT_EQ(get_value(result).counters.exhaustion_cycles, 2u);
    EXPECT_EQ(transport.requests.size(), 6u);
}

TEST(ExecutionEngineTest, StopsAtMaxProductiveCalls) {
    TempWorkspace workspace("engine");
    auto pool = make_pool(kThreeKeys);
    int call = 0;
    ScriptedTransport transport(
        [&call](const std::string&, const neoforge::protocol::ChatRequest&) -> ChatResult {
            ++call;
            return tool_reply({write_call("c" + std::to_string(call), "loop.md", "again")});
        });
    ExecutionLimits limits;
    limits.max_productive_calls = 3;
    ExecutionEngine engine(transport, pool, "test-model", limits);

    auto result = engine.run(make_turn(workspace));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).outcome, RunOutcome::MaxCallsReached);
    EXPECT_EQ(get_value(result).text, "Agent reached max tool calls.");
    EXPECT_EQ(transport.requests.size(), 3u);
}

TEST(ExecutionEngineTest, RateLimitsDoNotConsumeProductiveSlots) {
    TempWorkspace workspace("engine");
    auto pool = make_pool(kThreeKeys);
    auto transport = ScriptedTransport::sequence(
        {rate_limited(), rate_limited(), text_reply("finished")});
    ExecutionLimits limits;
    limits.max_productive_calls = 1;
    ExecutionEngine engine(transport, pool, "test-model", limits);
    RecordedSleeps sleeps;
    instrument(engine, sleeps);

    auto result = engine.run(make_turn(workspace));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).outcome, RunOutcome::Completed);
    EXPECT_EQ(get_value(result).text, "finished");
}

TEST(ExecutionEngineTest, MalformedCallsInjectCorrections) {
    TempWorkspace workspace("engine");
    auto pool = make_pool(kThreeKeys);
    auto transport = ScriptedTransport::sequence(
        {malformed_tool_call(), malformed_tool_call(),
         tool_reply({write_call("c1", "PRD.md", "# PRD")}), text_reply("done")});
    ExecutionEngine engine(transport, pool, "test-model");

    auto result = engine.run(make_turn(workspace));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).outcome, RunOutcome::Completed);
    EXPECT_EQ(get_value(result).counters.malformed_retries, 2u);
    EXPECT_EQ(get_value(result).counters.productive_calls, 2u);
    EXPECT_TRUE(std::filesystem::exists(workspace.root() / "PRD.md"));

    const auto& last = transport.requests.back().messages;
    EXPECT_EQ(count_messages(last, Role::User, kCorrection), 2u);
}

TEST(ExecutionEngineTest, MalformedBeyondBudgetDoesNotAbort) {
    TempWorkspace workspace("engine");
    auto pool = make_pool(kThreeKeys);
    auto transport = ScriptedTransport::sequence(
        {malformed_tool_call(), malformed_tool_call(), malformed_tool_call(),
         text_reply("recovered")});
    ExecutionEngine engine(transport, pool, "test-model");

    auto result = engine.run(make_turn(workspace));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).outcome, RunOutcome::Completed);
    EXPECT_EQ(get_value(result).text, "recovered");
    EXPECT_EQ(get_value(result).counters.malformed_retries, 2u);
    EXPECT_EQ(get_value(result).counters.productive_calls, 2u);
    EXPECT_EQ(count_messages(transport.requests.back().messages, Role::User, kCorrection), 2u);
}

TEST(ExecutionEngineTest, FatalProviderErrorPropagates) {
    TempWorkspace workspace("engine");
    auto pool = make_pool(kThreeKeys);
    auto transport = ScriptedTransport::sequence({provider_failure()});
    ExecutionEngine engine(transport, pool, "test-model");

    auto result = engine.run(make_turn(workspace));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Provider);
    EXPECT_EQ(transport.requests.size(), 1u);
}

TEST(ExecutionEngineTest, ReportsProgress) {
    TempWorkspace workspace("engine");
    auto pool = make_pool(kThreeKeys);
    auto transport = ScriptedTransport::sequence(
        {tool_reply({write_call("c1", "ARCHITECTURE.md", "x")}), text_reply("done")});
    neoforge::status::ProgressSink progress;
    ExecutionEngine engine(transport, pool, "test-model", {}, &progress);

    auto result = engine.run(make_turn(workspace));
    ASSERT_FALSE(is_error(result));
    const auto snapshot = progress.snapshot();
    EXPECT_EQ(snapshot.agent, "Architect");
    EXPECT_EQ(snapshot.task, "Done");
    ASSERT_FALSE(snapshot.logs.empty());
    EXPECT_EQ(snapshot.logs.front(), "[Architect] started");
    EXPECT_EQ(snapshot.logs.back(), "[Architect] completed");
}

}  // namespace
