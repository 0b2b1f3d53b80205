#pragma once
#include <string>
#include <variant>

namespace neoforge::protocol {

    // How the model asks for a side effect
    struct ToolCall {
        std::string id;
        std::string name;       // e.g., "write_file", "read_file"
        std::string arguments;  // Raw JSON string of the arguments
    };

    // How the file tools reply back
    struct ToolResult {
        std::string tool_call_id;
        bool success;
        std::string output;         // file content, listing or confirmation
        std::string error_message;  // failure reason
        double duration_ms;
    };

    // The closed set of operations the dispatcher understands.
    enum class ToolKind {
        WriteFile,
        ReadFile,
        ListDirectory
    };

    struct WriteFileArgs {
        std::string path;
        std::string content;
    };

    struct ReadFileArgs {
        std::string path;
    };

    struct ListDirectoryArgs {
        std::string path = ".";
    };

    // A parsed, typed tool invocation. Exactly one alternative per ToolKind.
    using ToolInvocation = std::variant<WriteFileArgs, ReadFileArgs, ListDirectoryArgs>;

    inline std::string to_string(const ToolKind kind) {
        switch (kind) {
            case ToolKind::WriteFile:
                return "write_file";
            case ToolKind::ReadFile:
                return "read_file";
            case ToolKind::ListDirectory:
                return "list_directory";
            default:
                return "unknown";
        }
    }

} // namespace neoforge::protocol
