#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "core/errors/forge_errors.hpp"

namespace neoforge::provider {

// Immutable, ordered set of API credentials used round-robin. Credentials are
// never removed or marked dead; a rate-limited key is expected to recover.
class CredentialPool {
public:
    // Configuration/no_credentials when no usable credential is supplied.
    static core::errors::Result<CredentialPool> build(const std::vector<std::string>& source);

    std::size_t size() const { return credentials_.size(); }
    const std::string& at(std::size_t index) const { return credentials_.at(index); }

    // Pure round-robin: the slot after index, wrapping to 0.
    std::size_t next_after(std::size_t index) const;

    // "gsk_abcd...wxyz" style identifier that is safe to log.
    std::string masked(std::size_t index) const;

private:
    explicit CredentialPool(std::vector<std::string> credentials);

    std::vector<std::string> credentials_;
};

std::string mask_credential(const std::string& credential);

}  // namespace neoforge::provider
