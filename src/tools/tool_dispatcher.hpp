#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/forge_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/file_tools.hpp"

namespace neoforge::tools {

// Maps a tool name to its operation kind; empty for names outside the closed set.
std::optional<protocol::ToolKind> tool_kind_from_name(const std::string& name);

// OpenAI-style function schema advertised to the model: write_file and read_file.
nlohmann::json tool_schema();

class ToolDispatcher {
public:
    explicit ToolDispatcher(std::filesystem::path workspace_root);

    // Decodes the raw JSON argument string into a typed invocation.
    // Protocol/invalid_tool_arguments when the JSON is unparsable or a field is
    // missing, Input/unsupported_tool when the name is unknown.
    core::errors::Result<protocol::ToolInvocation> parse(const protocol::ToolCall& call) const;

    // Runs a typed invocation and renders the outcome as plain text.
    std::string dispatch(const protocol::ToolInvocation& invocation) const;

    // parse + dispatch; failures become "Error: ..." text.
    std::string execute(const protocol::ToolCall& call) const;

    const std::filesystem::path& workspace_root() const { return workspace_root_; }

private:
    std::filesystem::path workspace_root_;
    FileTools file_tools_;
};

}  // namespace neoforge::tools
