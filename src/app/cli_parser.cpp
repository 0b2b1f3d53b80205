#include "cli_parser.hpp"
#include <vector>
#include "pipeline/project_workspace.hpp"

namespace neoforge::app::cli {

    using namespace neoforge::core::errors;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> requirement;
        std::optional<std::string> projects_dir;
        std::optional<std::string> model;
        std::optional<std::string> env_file;
        bool no_status = false;
        bool verbose = false;
    };

    Result<CliOptions> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return ForgeError{ErrorCategory::Input, "No command provided.", "missing_command", "Usage: neoforge run --requirement \"...\""};
        }

        std::string command = argv[1];
        if (command != "run") {
            return ForgeError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Currently only the 'run' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--requirement") {
                if (i + 1 < args.size()) raw.requirement = args[++i];
                else return ForgeError{ErrorCategory::Input, "Missing value for --requirement", "missing_value"};
            } else if (args[i] == "--projects-dir") {
                if (i + 1 < args.size()) raw.projects_dir = args[++i];
                else return ForgeError{ErrorCategory::Input, "Missing value for --projects-dir", "missing_value"};
            } else if (args[i] == "--model") {
                if (i + 1 < args.size()) raw.model = args[++i];
                else return ForgeError{ErrorCategory::Input, "Missing value for --model", "missing_value"};
            } else if (args[i] == "--env-file") {
                if (i + 1 < args.size()) raw.env_file = args[++i];
                else return ForgeError{ErrorCategory::Input, "Missing value for --env-file", "missing_value"};
            } else if (args[i] == "--no-status") {
                raw.no_status = true;
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else if (!raw.requirement.has_value() && args[i].rfind("--", 0) != 0) {
                raw.requirement = args[i];  // positional requirement
            } else {
                return ForgeError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        if (!raw.requirement.has_value()) {
            return ForgeError{ErrorCategory::Input, "Must provide a requirement", "missing_required_flag",
                              "Example: neoforge run --requirement 'Create a Snake game in Python'"};
        }

        auto requirement = pipeline::validate_requirement(raw.requirement.value());
        if (is_error(requirement)) {
            return get_error(requirement);
        }

        CliOptions options;
        options.requirement = get_value(requirement);
        options.publish_status = !raw.no_status;
        options.verbose = raw.verbose;

        if (raw.model) {
            if (raw.model->empty()) {
                return ForgeError{ErrorCategory::Input, "--model cannot be empty", "missing_value"};
            }
            options.model = raw.model.value();
        }
        if (raw.projects_dir) {
            if (raw.projects_dir->empty()) {
                return ForgeError{ErrorCategory::Input, "--projects-dir cannot be empty", "invalid_path"};
            }
            options.projects_dir = std::filesystem::path(raw.projects_dir.value());
        }

        // Path validation
        if (raw.env_file) {
            std::filesystem::path p(raw.env_file.value());
            std::error_code path_ec;
            const bool is_file = std::filesystem::is_regular_file(p, path_ec);
            if (path_ec || !is_file) {
                return ForgeError{ErrorCategory::Input, "Env file does not exist or is not a regular file", "invalid_path"};
            }
            options.env_file = std::move(p);
        }

        return options;
    }

} // namespace neoforge::app::cli
