#pragma once

#include <string>
#include "core/errors/forge_errors.hpp"
#include "protocol/chat_contract.hpp"

namespace neoforge::provider {

// One chat-completion round trip against the model endpoint.
//
// Failures are classified through ForgeError:
//   Capacity/rate_limit_exceeded  transient, the caller rotates credentials
//   Protocol/tool_use_failed      the model produced an invalid tool-call encoding
//   anything else                 fatal for the run
class ChatTransport {
public:
    virtual ~ChatTransport() = default;

    virtual core::errors::Result<protocol::ChatResponse> complete(
        const std::string& credential, const protocol::ChatRequest& request) = 0;
};

}  // namespace neoforge::provider
