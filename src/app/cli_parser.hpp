#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/forge_errors.hpp"

namespace neoforge::app::cli {

    struct CliOptions {
        std::string requirement;
        std::optional<std::filesystem::path> projects_dir;
        std::optional<std::string> model;
        std::optional<std::filesystem::path> env_file;
        bool publish_status = true;
        bool verbose = false;
    };

    neoforge::core::errors::Result<CliOptions> parse_and_validate(int argc, char* argv[]);
}
