#pragma once

#include <filesystem>
#include <string>
#include "core/errors/forge_errors.hpp"

namespace neoforge::policy {

// Confines file operations to one project root. The root is always passed in;
// the guard never consults the process working directory.
class WorkspaceGuard {
public:
    // Resolves target_path against workspace_root and returns the absolute,
    // normalized path. Fails with Containment/path_outside_workspace when the
    // result is not the root itself or a descendant of it.
    core::errors::Result<std::filesystem::path> validate_path_in_workspace(
        const std::filesystem::path& workspace_root,
        const std::filesystem::path& target_path,
        const std::string& action = "access") const;

    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);
};

}  // namespace neoforge::policy
