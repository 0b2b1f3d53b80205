#pragma once
#include <string>
#include <vector>
#include <optional>
#include "tool_contract.hpp"

namespace neoforge::protocol {

    enum class Role {
        User,
        Assistant,
        System,
        Tool
    };

    struct Message {
        Role role;
        std::string content;

        // Assistant turns that request side effects list them here, in order.
        std::vector<ToolCall> tool_calls;

        // Tool turns name the call they answer.
        std::optional<std::string> tool_call_id;
    };

    // One model conversation, oldest message first. Only ever appended to.
    using Conversation = std::vector<Message>;

    inline std::string to_string(const Role role) {
        switch (role) {
            case Role::User:
                return "user";
            case Role::Assistant:
                return "assistant";
            case Role::System:
                return "system";
            case Role::Tool:
                return "tool";
            default:
                return "unknown";
        }
    }

} // namespace neoforge::protocol
