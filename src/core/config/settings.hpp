#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/forge_errors.hpp"

namespace neoforge::core::config {

// Looks up one environment variable; empty optional when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

struct ExecutionLimits {
    std::uint32_t max_productive_calls = 25;
    std::uint32_t max_rate_limit_hits = 30;
    std::uint32_t max_malformed_retries = 2;
    double backoff_base_seconds = 20.0;
    double backoff_jitter_seconds = 5.0;
    double temperature = 0.3;
};

struct Settings {
    std::vector<std::string> credentials;
    std::string api_base = "https://api.groq.com/openai/v1";
    std::string model = "llama-3.3-70b-versatile";
    std::filesystem::path projects_dir = "projects";
    std::filesystem::path log_file = "neoforge.log";
    long http_timeout_seconds = 120;
    ExecutionLimits limits;
};

// Reads the process environment.
EnvLookup process_environment();

// Parses KEY=VALUE lines of a dotenv file and exports the ones not already set.
// A missing file is not an error.
errors::Result<std::size_t> load_dotenv(const std::filesystem::path& path);

// Credentials from GROQ_API_KEY then GROQ_API_KEY_2..GROQ_API_KEY_5, skipping
// empty values and placeholders that start with "your_".
std::vector<std::string> collect_credentials(const EnvLookup& env);

Settings load_settings(const EnvLookup& env);

// Strips a "provider/" routing prefix such as "groq/" from a model identifier.
std::string normalize_model_id(const std::string& model);

// Generates an ID such as "run-3fa91c0e".
std::string generate_run_id();

}  // namespace neoforge::core::config
