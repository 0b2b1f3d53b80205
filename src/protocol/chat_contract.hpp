#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/message_contract.hpp"

namespace neoforge::protocol {

struct ChatRequest {
    std::string model;
    Conversation messages;
    nlohmann::json tools = nlohmann::json::array();
    std::string tool_choice = "auto";
    double temperature = 0.3;
};

// Either terminal text (no tool calls) or an ordered list of tool calls.
struct ChatResponse {
    std::string content;
    std::vector<ToolCall> tool_calls;

    bool is_terminal() const { return tool_calls.empty(); }
};

}  // namespace neoforge::protocol
