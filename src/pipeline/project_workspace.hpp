#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/forge_errors.hpp"

namespace neoforge::pipeline {

constexpr std::size_t kMaxRequirementLength = 2000;

// Subdirectories every project gets before the first phase runs.
const std::vector<std::string>& project_subdirs();

// "Build a snake game!" -> "build_a_snake_game" (at most 80 characters).
std::string slugify(const std::string& text);

// Trims the requirement and enforces 1..kMaxRequirementLength characters.
core::errors::Result<std::string> validate_requirement(const std::string& requirement);

// A project root plus its fixed subdirectories.
class ProjectWorkspace {
public:
    // Creates <projects_dir>/<slug>. When that directory already exists a
    // "_YYYYmmdd_HHMMSS" suffix taken from `now` is appended, then "_2", "_3", ...
    // while the stamped name is taken too.
    static core::errors::Result<ProjectWorkspace> create(
        const std::filesystem::path& projects_dir, const std::string& requirement,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    // Uses an existing directory as the root and makes sure the subdirectories exist.
    static core::errors::Result<ProjectWorkspace> open(const std::filesystem::path& root);

    const std::filesystem::path& root() const { return root_; }
    std::filesystem::path logs_dir() const { return root_ / "logs"; }

private:
    explicit ProjectWorkspace(std::filesystem::path root);

    std::filesystem::path root_;
};

}  // namespace neoforge::pipeline
