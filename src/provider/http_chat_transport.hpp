#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/forge_errors.hpp"
#include "protocol/chat_contract.hpp"
#include "provider/chat_transport.hpp"

namespace neoforge::provider {

struct HttpChatConfig {
    std::string api_base = "https://api.groq.com/openai/v1";
    long timeout_seconds = 120;
};

// OpenAI-compatible POST {api_base}/chat/completions over libcurl.
class HttpChatTransport : public ChatTransport {
public:
    explicit HttpChatTransport(HttpChatConfig config);
    ~HttpChatTransport() override;

    HttpChatTransport(const HttpChatTransport&) = delete;
    HttpChatTransport& operator=(const HttpChatTransport&) = delete;

    core::errors::Result<protocol::ChatResponse> complete(
        const std::string& credential, const protocol::ChatRequest& request) override;

private:
    HttpChatConfig config_;
};

// Wire encoding, exposed for tests.
nlohmann::json encode_chat_request(const protocol::ChatRequest& request);

// Classifies an HTTP status + body into a response or a typed failure.
core::errors::Result<protocol::ChatResponse> decode_chat_response(long http_status,
                                                                  const std::string& body);

}  // namespace neoforge::provider
