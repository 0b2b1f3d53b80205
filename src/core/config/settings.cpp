#include "core/config/settings.hpp"

#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>

namespace neoforge::core::config {

using errors::ErrorCategory;
using errors::ForgeError;

namespace {

constexpr int kExtraCredentialSlots = 5;

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::string unquote(const std::string& value) {
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

bool is_usable_credential(const std::string& key) {
    return !key.empty() && key.rfind("your_", 0) != 0;
}

}  // namespace

EnvLookup process_environment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

errors::Result<std::size_t> load_dotenv(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        return std::size_t{0};
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return ForgeError{ErrorCategory::Configuration,
                          "Unable to open env file: " + path.string(),
                          "env_file_unreadable"};
    }

    std::size_t exported = 0;
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }
        const auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        const std::string key = trim(line.substr(0, eq));
        const std::string value = unquote(trim(line.substr(eq + 1)));
        if (std::getenv(key.c_str()) != nullptr) {
            continue;
        }
        if (setenv(key.c_str(), value.c_str(), 0) == 0) {
            ++exported;
        }
    }
    return exported;
}

std::vector<std::string> collect_credentials(const EnvLookup& env) {
    std::vector<std::string> keys;
    const auto primary = env("GROQ_API_KEY");
    if (primary.has_value() && is_usable_credential(trim(primary.value()))) {
        keys.push_back(trim(primary.value()));
    }
    for (int i = 2; i <= kExtraCredentialSlots; ++i) {
        const auto key = env("GROQ_API_KEY_" + std::to_string(i));
        if (key.has_value() && is_usable_credential(trim(key.value()))) {
            keys.push_back(trim(key.value()));
        }
    }
    return keys;
}

Settings load_settings(const EnvLookup& env) {
    Settings settings;
    settings.credentials = collect_credentials(env);

    if (const auto base = env("OPENAI_API_BASE"); base.has_value() && !trim(*base).empty()) {
        settings.api_base = trim(*base);
    }
    if (const auto model = env("OPENAI_MODEL_NAME"); model.has_value() && !trim(*model).empty()) {
        settings.model = normalize_model_id(trim(*model));
    }
    if (const auto dir = env("NEOFORGE_PROJECTS_DIR"); dir.has_value() && !trim(*dir).empty()) {
        settings.projects_dir = trim(*dir);
    }
    if (const auto log = env("NEOFORGE_LOG_FILE"); log.has_value() && !trim(*log).empty()) {
        settings.log_file = trim(*log);
    }
    return settings;
}

std::string normalize_model_id(const std::string& model) {
    constexpr const char* kProviderPrefix = "groq/";
    if (model.rfind(kProviderPrefix, 0) == 0) {
        return model.substr(5);
    }
    return model;
}

std::string generate_run_id() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<std::uint32_t> dis;

    std::ostringstream ss;
    ss << "run-" << std::hex << std::setw(8) << std::setfill('0') << dis(gen);
    return ss.str();
}

}  // namespace neoforge::core::config
