#include "tools/tool_dispatcher.hpp"

#include <type_traits>
#include <utility>

namespace neoforge::tools {

using core::errors::ErrorCategory;
using core::errors::ForgeError;
using nlohmann::json;
using protocol::ToolKind;

namespace {

json function_schema(const std::string& name, const std::string& description,
                     json properties, json required) {
    json schema;
    schema["type"] = "function";
    schema["function"]["name"] = name;
    schema["function"]["description"] = description;
    schema["function"]["parameters"] = {{"type", "object"},
                                        {"properties", std::move(properties)},
                                        {"required", std::move(required)}};
    return schema;
}

core::errors::Result<std::string> string_field(const json& args, const std::string& field,
                                               const std::string& tool_name) {
    const auto it = args.find(field);
    if (it == args.end() || !it->is_string()) {
        return ForgeError{ErrorCategory::Protocol,
                          "Invalid arguments for " + tool_name + ": '" + field +
                              "' must be a string.",
                          "invalid_tool_arguments"};
    }
    return it->get<std::string>();
}

std::string render(const core::errors::Result<protocol::ToolResult>& outcome) {
    if (core::errors::is_error(outcome)) {
        return "Error: " + core::errors::get_error(outcome).message;
    }
    const auto& result = core::errors::get_value(outcome);
    if (!result.success) {
        return "Error: " + result.error_message;
    }
    return result.output;
}

}  // namespace

std::optional<ToolKind> tool_kind_from_name(const std::string& name) {
    if (name == "write_file") {
        return ToolKind::WriteFile;
    }
    if (name == "read_file") {
        return ToolKind::ReadFile;
    }
    if (name == "list_directory") {
        return ToolKind::ListDirectory;
    }
    return std::nullopt;
}

json tool_schema() {
    json tools = json::array();
    tools.push_back(function_schema(
        "write_file", "Write content to a file at the given path.",
        {{"path", {{"type", "string"}, {"description", "Relative file path to write to."}}},
         {"content", {{"type", "string"}, {"description", "Content to write into the file."}}}},
        json::array({"path", "content"})));
    tools.push_back(function_schema(
        "read_file", "Read the content of a file at the given path.",
        {{"path", {{"type", "string"}, {"description", "Relative file path to read from."}}}},
        json::array({"path"})));
    return tools;
}

ToolDispatcher::ToolDispatcher(std::filesystem::path workspace_root)
    : workspace_root_(std::move(workspace_root)) {}

core::errors::Result<protocol::ToolInvocation> ToolDispatcher::parse(
    const protocol::ToolCall& call) const {
    const auto kind = tool_kind_from_name(call.name);
    if (!kind.has_value()) {
        return ForgeError{ErrorCategory::Input, "Unsupported tool '" + call.name + "'.",
                          "unsupported_tool"};
    }

    const json args = json::parse(call.arguments.empty() ? "{}" : call.arguments, nullptr,
                                  /*allow_exceptions=*/false);
    if (args.is_discarded() || !args.is_object()) {
        return ForgeError{ErrorCategory::Protocol,
                          "Could not parse tool arguments. Please retry with valid JSON.",
                          "invalid_tool_arguments"};
    }

    switch (kind.value()) {
        case ToolKind::WriteFile: {
            auto path = string_field(args, "path", call.name);
            if (core::errors::is_error(path)) {
                return core::errors::get_error(path);
            }
            auto content = string_field(args, "content", call.name);
            if (core::errors::is_error(content)) {
                return core::errors::get_error(content);
            }
            return protocol::WriteFileArgs{core::errors::get_value(path),
                                           core::errors::get_value(content)};
        }
        case ToolKind::ReadFile: {
            auto path = string_field(args, "path", call.name);
            if (core::errors::is_error(path)) {
                return core::errors::get_error(path);
            }
            return protocol::ReadFileArgs{core::errors::get_value(path)};
        }
        case ToolKind::ListDirectory: {
            protocol::ListDirectoryArgs list_args;
            if (args.contains("path")) {
                auto path = string_field(args, "path", call.name);
                if (core::errors::is_error(path)) {
                    return core::errors::get_error(path);
                }
                list_args.path = core::errors::get_value(path);
            }
            return list_args;
        }
    }
    return ForgeError{ErrorCategory::Internal, "Unhandled tool kind.", "unsupported_tool"};
}

std::string ToolDispatcher::dispatch(const protocol::ToolInvocation& invocation) const {
    return std::visit(
        [this](const auto& args) -> std::string {
            using Args = std::decay_t<decltype(args)>;
            if constexpr (std::is_same_v<Args, protocol::WriteFileArgs>) {
                return render(file_tools_.write_file(workspace_root_, args.path, args.content));
            } else if constexpr (std::is_same_v<Args, protocol::ReadFileArgs>) {
                return render(file_tools_.read_file(workspace_root_, args.path));
            } else {
                return render(file_tools_.list_directory(workspace_root_, args.path));
            }
        },
        invocation);
}

std::string ToolDispatcher::execute(const protocol::ToolCall& call) const {
    auto invocation = parse(call);
    if (core::errors::is_error(invocation)) {
        return "Error: " + core::errors::get_error(invocation).message;
    }
    return dispatch(core::errors::get_value(invocation));
}

}  // namespace neoforge::tools
