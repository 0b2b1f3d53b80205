#include <filesystem>
#include <string>
#include <gtest/gtest.h>
#include "core/config/settings.hpp"
#include "core/errors/forge_errors.hpp"
#include "policy/workspace_guard.hpp"
#include "test_support.hpp"

namespace {

using neoforge::core::errors::ErrorCategory;
using neoforge::core::errors::get_error;
using neoforge::core::errors::get_value;
using neoforge::core::errors::is_error;
using neoforge::policy::WorkspaceGuard;
using neoforge::testing::TempWorkspace;

TEST(WorkspaceGuardTest, AllowsPathInsideWorkspace) {
    TempWorkspace workspace("guard");
    neoforge::testing::write_file(workspace.root() / "sub/sample.txt", "ok");

    WorkspaceGuard guard;
    auto result = guard.validate_path_in_workspace(workspace.root(), "sub/sample.txt");
    ASSERT_FALSE(is_error(result));

    const auto resolved = get_value(result);
    EXPECT_TRUE(resolved.is_absolute());
    EXPECT_EQ(resolved.string(), (workspace.root() / "sub" / "sample.txt").string());
}

TEST(WorkspaceGuardTest, AllowsNotYetExistingNestedPath) {
    TempWorkspace workspace("guard");
    WorkspaceGuard guard;
    auto result = guard.validate_path_in_workspace(workspace.root(), "src/deep/new/file.py");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).string(), (workspace.root() / "src/deep/new/file.py").string());
}

TEST(WorkspaceGuardTest, NormalizesDotDotThatStaysInside) {
    TempWorkspace workspace("guard");
    WorkspaceGuard guard;
    auto result = guard.validate_path_in_workspace(workspace.root(), "src/../PRD.md");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).string(), (workspace.root() / "PRD.md").string());
}

TEST(WorkspaceGuardTest, RejectsDotDotEscape) {
    TempWorkspace workspace("guard");
    WorkspaceGuard guard;
    for (const std::string path : {"../outside.txt", "src/../../outside.txt", "a/b/../../../x"}) {
        auto result = guard.validate_path_in_workspace(workspace.root(), path, "write");
        ASSERT_TRUE(is_error(result)) << path;
        EXPECT_EQ(get_error(result).category, ErrorCategory::Containment);
        EXPECT_EQ(get_error(result).code, "path_outside_workspace");
        EXPECT_EQ(get_error(result).message,
                  "Security violation. Cannot write outside project root.");
    }
}

TEST(WorkspaceGuardTest, RejectsAbsolutePathOutsideWorkspace) {
    TempWorkspace workspace("guard");
    WorkspaceGuard guard;
    auto result = guard.validate_path_in_workspace(workspace.root(), "/etc/passwd");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "path_outside_workspace");
}

TEST(WorkspaceGuardTest, RejectsSiblingThatSharesThePrefix) {
    TempWorkspace workspace("guard");
    const auto sibling = workspace.root().string() + "_evil/file.txt";

    WorkspaceGuard guard;
    auto result = guard.validate_path_in_workspace(workspace.root(), sibling);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "path_outside_workspace");
}

TEST(WorkspaceGuardTest, RejectsSymlinkPointingOutside) {
    TempWorkspace workspace("guard");
    TempWorkspace outside("guard_outside");
    std::error_code ec;
    std::filesystem::create_directory_symlink(outside.root(), workspace.root() / "link", ec);
    ASSERT_FALSE(ec);

    WorkspaceGuard guard;
    auto result = guard.validate_path_in_workspace(workspace.root(), "link/secret.txt");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "path_outside_workspace");
}

TEST(WorkspaceGuardTest, RootItselfIsInside) {
    TempWorkspace workspace("guard");
    WorkspaceGuard guard;
    auto result = guard.validate_path_in_workspace(workspace.root(), ".");
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(WorkspaceGuard::is_within_root(workspace.root(), get_value(result)));
}

TEST(WorkspaceGuardTest, RejectsInvalidWorkspaceRoot) {
    WorkspaceGuard guard;
    const auto missing_root =
        std::filesystem::current_path() /
        ("__missing_workspace_root__" + neoforge::core::config::generate_run_id());
    auto result = guard.validate_path_in_workspace(missing_root, "a.txt");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_workspace_root");
}

TEST(WorkspaceGuardTest, ComponentWiseContainment) {
    EXPECT_TRUE(WorkspaceGuard::is_within_root("/a/proj", "/a/proj/src/x"));
    EXPECT_TRUE(WorkspaceGuard::is_within_root("/a/proj", "/a/proj"));
    EXPECT_FALSE(WorkspaceGuard::is_within_root("/a/proj", "/a/proj_evil/x"));
    EXPECT_FALSE(WorkspaceGuard::is_within_root("/a/proj", "/a"));
}

}  // namespace
