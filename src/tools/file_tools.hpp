#pragma once

#include <filesystem>
#include <string>
#include "core/errors/forge_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace neoforge::tools {

// Sandboxed file access. Every call takes the project root explicitly.
// Containment violations come back as errors; ordinary I/O problems come back
// as unsuccessful ToolResults so they can be fed to the model.
class FileTools {
public:
    core::errors::Result<protocol::ToolResult> write_file(
        const std::filesystem::path& workspace_root,
        const std::filesystem::path& path,
        const std::string& content) const;

    core::errors::Result<protocol::ToolResult> read_file(
        const std::filesystem::path& workspace_root,
        const std::filesystem::path& path) const;

    core::errors::Result<protocol::ToolResult> list_directory(
        const std::filesystem::path& workspace_root,
        const std::filesystem::path& path) const;
};

}  // namespace neoforge::tools
