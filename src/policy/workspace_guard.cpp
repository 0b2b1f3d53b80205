#include "policy/workspace_guard.hpp"

#include <iterator>
#include <system_error>
#include "core/logging/logger.hpp"

namespace neoforge::policy {

using core::errors::ErrorCategory;
using core::errors::ForgeError;

bool WorkspaceGuard::is_within_root(const std::filesystem::path& root,
                                    const std::filesystem::path& child) {
    // Component-wise comparison: "/a/proj_evil" is not inside "/a/proj".
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (root_it->empty() && std::next(root_it) == root.end()) {
            // Trailing separator on the root yields an empty last component.
            return true;
        }
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end() ||
           (root_it->empty() && std::next(root_it) == root.end());
}

core::errors::Result<std::filesystem::path> WorkspaceGuard::validate_path_in_workspace(
    const std::filesystem::path& workspace_root,
    const std::filesystem::path& target_path,
    const std::string& action) const {
    std::error_code ec;
    if (!std::filesystem::exists(workspace_root, ec) || ec) {
        return ForgeError{ErrorCategory::Input,
                          "Workspace root does not exist: " +
                              workspace_root.string(),
                          "invalid_workspace_root"};
    }
    if (!std::filesystem::is_directory(workspace_root, ec) || ec) {
        return ForgeError{ErrorCategory::Input,
                          "Workspace root is not a directory: " +
                              workspace_root.string(),
                          "invalid_workspace_root"};
    }

    const std::filesystem::path canonical_root =
        std::filesystem::weakly_canonical(workspace_root, ec);
    if (ec) {
        return ForgeError{ErrorCategory::Input,
                          "Unable to resolve workspace root: " +
                              workspace_root.string(),
                          "invalid_workspace_root"};
    }

    // An absolute target replaces the root entirely, exactly like a path join.
    const std::filesystem::path candidate = canonical_root / target_path;

    const std::filesystem::path canonical_candidate =
        std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return ForgeError{ErrorCategory::Input,
                          "Unable to resolve target path: " + target_path.string(),
                          "invalid_path"};
    }

    if (!is_within_root(canonical_root, canonical_candidate)) {
        LOG_ERROR("Security alert: path traversal on " + action + ": " +
                  target_path.string());
        return ForgeError{ErrorCategory::Containment,
                          "Security violation. Cannot " + action +
                              " outside project root.",
                          "path_outside_workspace"};
    }

    return canonical_candidate;
}

}  // namespace neoforge::policy
