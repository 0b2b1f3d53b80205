#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include "core/config/settings.hpp"
#include "core/errors/forge_errors.hpp"
#include "provider/chat_transport.hpp"
#include "provider/credential_pool.hpp"
#include "status/progress_sink.hpp"

namespace neoforge::runtime {

enum class RunOutcome {
    Completed,         // the model answered without tool calls
    MaxCallsReached,   // productive-call budget spent
    RateLimitAborted   // rate-limit-hit budget spent
};

struct EngineCounters {
    std::uint32_t productive_calls = 0;
    std::uint32_t rate_limit_hits = 0;
    std::uint32_t malformed_retries = 0;
    std::uint32_t rotations = 0;
    std::uint32_t exhaustion_cycles = 0;  // full-pool exhaustions over the whole run
    std::uint32_t tool_calls = 0;
};

struct EngineResult {
    RunOutcome outcome = RunOutcome::Completed;
    std::string text;
    EngineCounters counters;
    std::vector<double> backoff_seconds;  // one entry per full-pool exhaustion
};

// One bounded conversation: who is speaking, what they are told, and the only
// directory their tools may touch.
struct AgentTurn {
    std::string agent_label;
    std::string system_prompt;
    std::string user_message;
    std::filesystem::path workspace_root;
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;
// Returns a jitter addend in seconds, in [0, max_seconds).
using JitterSource = std::function<double(double max_seconds)>;

std::string to_string(RunOutcome outcome);

// base * 2^(cycle-1) + jitter
double backoff_seconds(double base_seconds, std::uint32_t cycle, double jitter_seconds);

// Drives one conversation to a terminal answer or a bounded-failure sentinel.
// Rate-limit hits never consume productive-call slots. Not safe to run
// concurrently; give each concurrent run its own engine and pool.
class ExecutionEngine {
public:
    ExecutionEngine(provider::ChatTransport& transport, const provider::CredentialPool& pool,
                    std::string model, core::config::ExecutionLimits limits = {},
                    status::ProgressSink* progress = nullptr);

    void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }
    void set_jitter_source(JitterSource jitter) { jitter_ = std::move(jitter); }

    // Fatal failures (anything that is neither a rate limit nor a malformed
    // tool call) come back as errors; budget exhaustion does not.
    core::errors::Result<EngineResult> run(const AgentTurn& turn);

    const core::config::ExecutionLimits& limits() const { return limits_; }
    const std::string& model() const { return model_; }

private:
    void report(const std::string& agent, const std::string& task,
                const std::string& log_line = "") const;

    provider::ChatTransport& transport_;
    const provider::CredentialPool& pool_;
    std::string model_;
    core::config::ExecutionLimits limits_;
    status::ProgressSink* progress_;
    Sleeper sleeper_;
    JitterSource jitter_;
};

}  // namespace neoforge::runtime
