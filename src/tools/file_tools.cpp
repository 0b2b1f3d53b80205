#include "tools/file_tools.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <sstream>
#include <system_error>
#include <vector>
#include "core/logging/logger.hpp"
#include "policy/workspace_guard.hpp"

namespace neoforge::tools {

using protocol::ToolResult;

namespace {

bool is_probably_binary(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }

    constexpr std::size_t kProbeSize = 1024;
    char buffer[kProbeSize];
    in.read(buffer, static_cast<std::streamsize>(kProbeSize));
    const std::streamsize read_bytes = in.gcount();
    for (std::streamsize i = 0; i < read_bytes; ++i) {
        if (buffer[i] == '\0') {
            return true;
        }
    }
    return false;
}

double elapsed_ms_since(const std::chrono::steady_clock::time_point started) {
    const auto ended = std::chrono::steady_clock::now();
    return std::chrono::duration<double, std::milli>(ended - started).count();
}

}  // namespace

core::errors::Result<ToolResult> FileTools::write_file(
    const std::filesystem::path& workspace_root,
    const std::filesystem::path& path,
    const std::string& content) const {
    const auto started = std::chrono::steady_clock::now();
    const policy::WorkspaceGuard guard;
    auto resolved = guard.validate_path_in_workspace(workspace_root, path, "write");
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path file_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (std::filesystem::is_directory(file_path, ec)) {
        return ToolResult{"write_file", false, "",
                          "Path is a directory: " + path.string(), 0.0};
    }

    std::filesystem::create_directories(file_path.parent_path(), ec);
    if (ec) {
        LOG_ERROR("FileTools: unable to create parent of " + path.string() + " - " +
                  ec.message());
        return ToolResult{"write_file", false, "",
                          "Unable to create directory for " + path.string() + ": " +
                              ec.message(),
                          0.0};
    }

    std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        LOG_ERROR("FileTools: unable to open " + path.string() + " for writing");
        return ToolResult{"write_file", false, "",
                          "Failed to open file for writing: " + path.string(), 0.0};
    }
    out << content;
    out.flush();
    if (!out.good()) {
        LOG_ERROR("FileTools: I/O error writing " + path.string());
        return ToolResult{"write_file", false, "",
                          "I/O error while writing file: " + path.string(), 0.0};
    }

    LOG_INFO("FileTools: wrote " + std::to_string(content.size()) + " bytes to " +
             file_path.string());
    return ToolResult{"write_file", true, "Successfully wrote to " + path.string(), "",
                      elapsed_ms_since(started)};
}

core::errors::Result<ToolResult> FileTools::read_file(
    const std::filesystem::path& workspace_root,
    const std::filesystem::path& path) const {
    const auto started = std::chrono::steady_clock::now();
    const policy::WorkspaceGuard guard;
    auto resolved = guard.validate_path_in_workspace(workspace_root, path, "read");
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path file_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec) || ec) {
        return ToolResult{"read_file", false, "",
                          "File " + path.string() + " does not exist.", 0.0};
    }
    if (!std::filesystem::is_regular_file(file_path, ec) || ec) {
        return ToolResult{"read_file", false, "",
                          "Path is not a regular file: " + path.string(), 0.0};
    }
    if (is_probably_binary(file_path)) {
        return ToolResult{"read_file", false, "",
                          "Refusing to read binary file: " + path.string(), 0.0};
    }

    std::ifstream in(file_path, std::ios::binary);
    if (!in.is_open()) {
        return ToolResult{"read_file", false, "",
                          "Failed to open file: " + path.string(), 0.0};
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in.good() && !in.eof()) {
        return ToolResult{"read_file", false, "",
                          "I/O error while reading file: " + path.string(), 0.0};
    }

    LOG_INFO("FileTools: read from " + file_path.string());
    return ToolResult{"read_file", true, buffer.str(), "", elapsed_ms_since(started)};
}

core::errors::Result<ToolResult> FileTools::list_directory(
    const std::filesystem::path& workspace_root,
    const std::filesystem::path& path) const {
    const auto started = std::chrono::steady_clock::now();
    const policy::WorkspaceGuard guard;
    auto resolved = guard.validate_path_in_workspace(workspace_root, path, "list");
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path dir_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::is_directory(dir_path, ec) || ec) {
        return ToolResult{"list_directory", false, "",
                          "Directory " + path.string() + " does not exist.", 0.0};
    }

    std::vector<std::string> entries;
    for (std::filesystem::directory_iterator it(dir_path, ec), end; !ec && it != end;
         it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (it->is_directory(ec)) {
            name += "/";
        }
        entries.push_back(std::move(name));
    }
    if (ec) {
        return ToolResult{"list_directory", false, "",
                          "Error listing directory " + path.string() + ": " + ec.message(),
                          0.0};
    }
    std::sort(entries.begin(), entries.end());

    std::ostringstream out;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        if (i > 0) {
            out << "\n";
        }
        out << entries[i];
    }
    return ToolResult{"list_directory", true, out.str(), "", elapsed_ms_since(started)};
}

}  // namespace neoforge::tools
