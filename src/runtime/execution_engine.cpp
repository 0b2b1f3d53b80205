#include "runtime/execution_engine.hpp"

#include <cmath>
#include <iomanip>
#include <random>
#include <sstream>
#include <thread>
#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/chat_contract.hpp"
#include "protocol/message_contract.hpp"
#include "tools/tool_dispatcher.hpp"

namespace neoforge::runtime {

using core::errors::ErrorCategory;
using core::errors::ForgeError;
using protocol::ChatRequest;
using protocol::Message;
using protocol::Role;

namespace {

constexpr const char* kCorrectiveInstruction =
    "Your previous tool call was malformed. "
    "You MUST call tools using the provided JSON function schema - "
    "do NOT use XML-style <function=...> syntax. Please retry.";

constexpr const char* kRejectedToolCallNote =
    "Error: your tool call was rejected by the endpoint because its encoding was "
    "invalid. Use the provided JSON function schema.";

std::string format_seconds(const double seconds) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << seconds;
    return out.str();
}

std::string slot(const std::size_t index, const std::size_t size) {
    return "[" + std::to_string(index + 1) + "/" + std::to_string(size) + "]";
}

std::string argument_keys(const std::string& raw_arguments) {
    const auto args = nlohmann::json::parse(raw_arguments, nullptr, false);
    if (args.is_discarded() || !args.is_object()) {
        return "[]";
    }
    std::string keys = "[";
    for (auto it = args.begin(); it != args.end(); ++it) {
        if (keys.size() > 1) {
            keys += ", ";
        }
        keys += it.key();
    }
    return keys + "]";
}

}  // namespace

std::string to_string(const RunOutcome outcome) {
    switch (outcome) {
        case RunOutcome::Completed:
            return "completed";
        case RunOutcome::MaxCallsReached:
            return "max_calls_reached";
        case RunOutcome::RateLimitAborted:
            return "rate_limit_aborted";
        default:
            return "unknown";
    }
}

double backoff_seconds(const double base_seconds, const std::uint32_t cycle,
                       const double jitter_seconds) {
    const std::uint32_t exponent = cycle == 0 ? 0 : cycle - 1;
    return base_seconds * std::pow(2.0, static_cast<double>(exponent)) + jitter_seconds;
}

ExecutionEngine::ExecutionEngine(provider::ChatTransport& transport,
                                 const provider::CredentialPool& pool, std::string model,
                                 core::config::ExecutionLimits limits,
                                 status::ProgressSink* progress)
    : transport_(transport),
      pool_(pool),
      model_(std::move(model)),
      limits_(limits),
      progress_(progress),
      sleeper_([](const std::chrono::milliseconds duration) {
          std::this_thread::sleep_for(duration);
      }),
      jitter_([](const double max_seconds) {
          if (max_seconds <= 0.0) {
              return 0.0;
          }
          static thread_local std::mt19937 gen{std::random_device{}()};
          std::uniform_real_distribution<double> dis(0.0, max_seconds);
          return dis(gen);
      }) {}

void ExecutionEngine::report(const std::string& agent, const std::string& task,
                             const std::string& log_line) const {
    if (progress_ == nullptr) {
        return;
    }
    if (log_line.empty()) {
        progress_->update(agent, task);
    } else {
        progress_->update(agent, task, log_line);
    }
}

core::errors::Result<EngineResult> ExecutionEngine::run(const AgentTurn& turn) {
    const std::string& agent = turn.agent_label;
    const std::size_t pool_size = pool_.size();

    protocol::Conversation messages;
    messages.push_back(Message{Role::System, turn.system_prompt, {}, std::nullopt});
    messages.push_back(Message{Role::User, turn.user_message, {}, std::nullopt});

    const tools::ToolDispatcher dispatcher(turn.workspace_root);
    const nlohmann::json schema = tools::tool_schema();

    LOG_INFO("[" + agent + "] Starting | model=" + model_ + " | keys=" +
             std::to_string(pool_size) + " | root=" + turn.workspace_root.string());
    report(agent, "Thinking...", "[" + agent + "] started");

    EngineResult result;
    EngineCounters& counters = result.counters;

    std::size_t client_index = 0;
    // First slot of the current run of consecutive rate-limit failures.
    std::size_t sweep_start = 0;
    bool in_sweep = false;
    std::uint32_t exhaustion_cycle = 0;

    while (counters.productive_calls < limits_.max_productive_calls &&
           counters.rate_limit_hits < limits_.max_rate_limit_hits) {
        ChatRequest request;
        request.model = model_;
        request.messages = messages;
        request.tools = schema;
        request.tool_choice = "auto";
        request.temperature = limits_.temperature;

        auto response_result = transport_.complete(pool_.at(client_index), request);

        if (core::errors::is_error(response_result)) {
            const ForgeError& error = core::errors::get_error(response_result);

            if (error.category == ErrorCategory::Capacity) {
                ++counters.rate_limit_hits;
                if (!in_sweep) {
                    in_sweep = true;
                    sweep_start = client_index;
                }
                const std::size_t next_index = pool_.next_after(client_index);

                if (next_index == sweep_start) {
                    ++exhaustion_cycle;
                    ++counters.exhaustion_cycles;
                    const double wait = backoff_seconds(
                        limits_.backoff_base_seconds, exhaustion_cycle,
                        jitter_(limits_.backoff_jitter_seconds));
                    result.backoff_seconds.push_back(wait);
                    LOG_WARN("[" + agent + "] All " + std::to_string(pool_size) +
                             " key(s) exhausted (cycle " + std::to_string(exhaustion_cycle) +
                             "). Waiting " + format_seconds(wait) + "s... (rate hits: " +
                             std::to_string(counters.rate_limit_hits) + "/" +
                             std::to_string(limits_.max_rate_limit_hits) + ")");
                    report(agent, "All keys exhausted. Waiting " + format_seconds(wait) + "s...",
                           "[" + agent + "] all keys exhausted, backing off " +
                               format_seconds(wait) + "s");
                    sleeper_(std::chrono::milliseconds(
                        static_cast<std::int64_t>(std::llround(wait * 1000.0))));
                } else {
                    ++counters.rotations;
                    LOG_WARN("[" + agent + "] Key " + slot(client_index, pool_size) + " (" +
                             pool_.masked(client_index) + ") rate-limited. Rotating -> key " +
                             slot(next_index, pool_size) + " (rate hits: " +
                             std::to_string(counters.rate_limit_hits) + "/" +
                             std::to_string(limits_.max_rate_limit_hits) + ")");
                    report(agent, "Rotating -> key " + slot(next_index, pool_size) + "...");
                }
                client_index = next_index;
                continue;
            }

            if (error.category == ErrorCategory::Protocol && error.code == "tool_use_failed") {
                // The key answered, so any rate-limit sweep in progress is over.
                in_sweep = false;
                if (counters.malformed_retries < limits_.max_malformed_retries) {
                    ++counters.malformed_retries;
                    LOG_WARN("[" + agent + "] Malformed tool call (attempt " +
                             std::to_string(counters.malformed_retries) + "/" +
                             std::to_string(limits_.max_malformed_retries) +
                             "). Injecting correction...");
                    messages.push_back(
                        Message{Role::User, kCorrectiveInstruction, {}, std::nullopt});
                    continue;
                }
                // Correction budget spent: the rejection costs a productive slot and
                // is reported back to the model instead of ending the run.
                ++counters.productive_calls;
                LOG_WARN("[" + agent + "] Malformed tool call after " +
                         std::to_string(limits_.max_malformed_retries) +
                         " correction(s); feeding the rejection back to the model.");
                messages.push_back(Message{Role::User, kRejectedToolCallNote, {}, std::nullopt});
                continue;
            }

            LOG_ERROR("[" + agent + "] Fatal model endpoint failure [" + error.code +
                      "]: " + error.message);
            return error;
        }

        ++counters.productive_calls;
        exhaustion_cycle = 0;
        in_sweep = false;

        const protocol::ChatResponse& response = core::errors::get_value(response_result);
        if (response.is_terminal()) {
            LOG_INFO("[" + agent + "] Completed. Output: " +
                     std::to_string(response.content.size()) + " chars | calls: " +
                     std::to_string(counters.productive_calls) + " | rate hits: " +
                     std::to_string(counters.rate_limit_hits));
            report(agent, "Done", "[" + agent + "] completed");
            result.outcome = RunOutcome::Completed;
            result.text = response.content;
            return result;
        }

        messages.push_back(Message{Role::Assistant, response.content, response.tool_calls,
                                   std::nullopt});
        for (const auto& call : response.tool_calls) {
            ++counters.tool_calls;
            std::string tool_output;
            auto invocation = dispatcher.parse(call);
            if (core::errors::is_error(invocation)) {
                const ForgeError& parse_error = core::errors::get_error(invocation);
                LOG_ERROR("[" + agent + "] Rejected tool call " + call.name + " [" +
                          parse_error.code + "]: " + parse_error.message);
                tool_output = "Error: " + parse_error.message;
            } else {
                LOG_INFO("[" + agent + "] Tool: " + call.name + "(" +
                         argument_keys(call.arguments) + ")");
                report(agent, "Using tool: " + call.name,
                       "[" + agent + "] tool " + call.name);
                tool_output = dispatcher.dispatch(core::errors::get_value(invocation));
            }
            messages.push_back(Message{Role::Tool, std::move(tool_output), {}, call.id});
        }
    }

    if (counters.rate_limit_hits >= limits_.max_rate_limit_hits) {
        LOG_ERROR("[" + agent + "] Aborted: too many rate-limit hits (" +
                  std::to_string(counters.rate_limit_hits) + ").");
        report(agent, "Aborted: rate limited", "[" + agent + "] aborted after rate limits");
        result.outcome = RunOutcome::RateLimitAborted;
        result.text = "Agent aborted: rate limit hit " +
                      std::to_string(counters.rate_limit_hits) + " times.";
        return result;
    }

    LOG_WARN("[" + agent + "] Reached max tool calls (" +
             std::to_string(limits_.max_productive_calls) + ") without finishing.");
    report(agent, "Max calls reached", "[" + agent + "] reached max calls");
    result.outcome = RunOutcome::MaxCallsReached;
    result.text = "Agent reached max tool calls.";
    return result;
}

}  // namespace neoforge::runtime
