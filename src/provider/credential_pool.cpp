#include "provider/credential_pool.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace neoforge::provider {

using core::errors::ErrorCategory;
using core::errors::ForgeError;

std::string mask_credential(const std::string& credential) {
    constexpr std::size_t kHead = 8;
    constexpr std::size_t kTail = 4;
    if (credential.size() <= kHead + kTail) {
        return std::string(credential.size(), '*');
    }
    return credential.substr(0, kHead) + "..." + credential.substr(credential.size() - kTail);
}

CredentialPool::CredentialPool(std::vector<std::string> credentials)
    : credentials_(std::move(credentials)) {}

core::errors::Result<CredentialPool> CredentialPool::build(
    const std::vector<std::string>& source) {
    std::vector<std::string> usable;
    for (const auto& credential : source) {
        if (credential.empty() || credential.rfind("your_", 0) == 0) {
            continue;
        }
        usable.push_back(credential);
    }

    if (usable.empty()) {
        return ForgeError{ErrorCategory::Configuration, "No valid API keys found.",
                          "no_credentials", "Set GROQ_API_KEY in .env"};
    }

    LOG_INFO("API key pool initialized with " + std::to_string(usable.size()) + " key(s):");
    for (std::size_t i = 0; i < usable.size(); ++i) {
        LOG_INFO("  Key " + std::to_string(i + 1) + ": " + mask_credential(usable[i]));
    }
    return CredentialPool(std::move(usable));
}

std::size_t CredentialPool::next_after(const std::size_t index) const {
    return (index + 1) % credentials_.size();
}

std::string CredentialPool::masked(const std::size_t index) const {
    return mask_credential(credentials_.at(index));
}

}  // namespace neoforge::provider
