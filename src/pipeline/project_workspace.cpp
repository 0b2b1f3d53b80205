#include "pipeline/project_workspace.hpp"

#include <cctype>
#include <ctime>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"

namespace neoforge::pipeline {

using core::errors::ErrorCategory;
using core::errors::ForgeError;

namespace {

constexpr std::size_t kMaxSlugLength = 80;
constexpr std::size_t kMaxCreateAttempts = 100;

bool is_word_char(const unsigned char c) {
    return std::isalnum(c) != 0 || c == '_' || c >= 0x80;
}

std::string timestamp_suffix(const std::chrono::system_clock::time_point now) {
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&t, &local);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y%m%d_%H%M%S", &local);
    return buffer;
}

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

}  // namespace

const std::vector<std::string>& project_subdirs() {
    static const std::vector<std::string> kSubdirs = {"src", "tests", "frontend", "logs"};
    return kSubdirs;
}

std::string slugify(const std::string& text) {
    std::string kept;
    for (const char raw : trim(text)) {
        const auto c = static_cast<unsigned char>(raw);
        if (is_word_char(c) || std::isspace(c) != 0 || c == '-') {
            kept.push_back(static_cast<char>(std::tolower(c)));
        }
    }

    // Whitespace and '-' become '_', then runs of '_' collapse to one.
    std::string slug;
    for (const char c : kept) {
        const bool separator = std::isspace(static_cast<unsigned char>(c)) != 0 || c == '-' ||
                               c == '_';
        if (separator) {
            if (!slug.empty() && slug.back() == '_') {
                continue;
            }
            slug.push_back('_');
        } else {
            slug.push_back(c);
        }
    }

    const auto first = slug.find_first_not_of('_');
    if (first == std::string::npos) {
        return "";
    }
    slug = slug.substr(first, slug.find_last_not_of('_') - first + 1);
    if (slug.size() <= kMaxSlugLength) {
        return slug;
    }
    // Cut at kMaxSlugLength code points, never inside a multi-byte sequence.
    std::size_t cut = 0;
    std::size_t code_points = 0;
    while (cut < slug.size() && code_points < kMaxSlugLength) {
        ++cut;
        while (cut < slug.size() &&
               (static_cast<unsigned char>(slug[cut]) & 0xC0) == 0x80) {
            ++cut;
        }
        ++code_points;
    }
    slug = slug.substr(0, cut);
    const auto last = slug.find_last_not_of('_');
    return last == std::string::npos ? "" : slug.substr(0, last + 1);
}

core::errors::Result<std::string> validate_requirement(const std::string& requirement) {
    const std::string trimmed = trim(requirement);
    if (trimmed.empty()) {
        return ForgeError{ErrorCategory::Input, "Requirement cannot be empty.",
                          "invalid_requirement"};
    }
    if (trimmed.size() > kMaxRequirementLength) {
        return ForgeError{ErrorCategory::Input,
                          "Requirement too long (max " +
                              std::to_string(kMaxRequirementLength) + " chars, got " +
                              std::to_string(trimmed.size()) + ").",
                          "requirement_too_long"};
    }
    return trimmed;
}

ProjectWorkspace::ProjectWorkspace(std::filesystem::path root) : root_(std::move(root)) {}

core::errors::Result<ProjectWorkspace> ProjectWorkspace::create(
    const std::filesystem::path& projects_dir, const std::string& requirement,
    const std::chrono::system_clock::time_point now) {
    std::string name = slugify(requirement);
    if (name.empty()) {
        name = "project";
    }

    std::error_code ec;
    std::filesystem::create_directories(projects_dir, ec);
    if (ec) {
        return ForgeError{ErrorCategory::Execution,
                          "Unable to create projects directory " + projects_dir.string() +
                              ": " + ec.message(),
                          "workspace_create_failed"};
    }

    // An existing directory is never reused: <slug>, then <slug>_<ts>, then <slug>_<ts>_N.
    const std::string stamped = name + "_" + timestamp_suffix(now);
    std::filesystem::path project_dir;
    for (std::size_t attempt = 0; attempt < kMaxCreateAttempts; ++attempt) {
        std::string candidate = name;
        if (attempt == 1) {
            candidate = stamped;
        } else if (attempt > 1) {
            candidate = stamped + "_" + std::to_string(attempt);
        }

        const auto path = projects_dir / candidate;
        const bool created = std::filesystem::create_directory(path, ec);
        if (created && !ec) {
            project_dir = path;
            break;
        }
        if (ec && ec != std::errc::file_exists) {
            return ForgeError{ErrorCategory::Execution,
                              "Unable to create project directory " + path.string() + ": " +
                                  ec.message(),
                              "workspace_create_failed"};
        }
        ec.clear();
        LOG_INFO("Project folder " + path.string() + " already exists.");
    }

    if (project_dir.empty()) {
        return ForgeError{ErrorCategory::Execution,
                          "No free project directory for '" + name + "' under " +
                              projects_dir.string(),
                          "workspace_create_failed"};
    }
    LOG_INFO("Using project folder: " + project_dir.string());
    return open(project_dir);
}

core::errors::Result<ProjectWorkspace> ProjectWorkspace::open(const std::filesystem::path& root) {
    std::error_code ec;
    auto absolute_root = std::filesystem::absolute(root, ec);
    if (ec) {
        return ForgeError{ErrorCategory::Input,
                          "Project root cannot be resolved: " + root.string(),
                          "invalid_workspace_root"};
    }
    absolute_root = std::filesystem::weakly_canonical(absolute_root, ec);
    if (ec || !std::filesystem::is_directory(absolute_root, ec)) {
        return ForgeError{ErrorCategory::Input,
                          "Project root is not a directory: " + root.string(),
                          "invalid_workspace_root"};
    }

    for (const auto& subdir : project_subdirs()) {
        std::filesystem::create_directories(absolute_root / subdir, ec);
        if (ec) {
            return ForgeError{ErrorCategory::Execution,
                              "Unable to create " + (absolute_root / subdir).string() + ": " +
                                  ec.message(),
                              "workspace_create_failed"};
        }
    }
    return ProjectWorkspace(absolute_root);
}

}  // namespace neoforge::pipeline
