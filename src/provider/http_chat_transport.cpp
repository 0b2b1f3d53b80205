#include "provider/http_chat_transport.hpp"

#include <memory>
#include <utility>
#include <curl/curl.h>
#include "core/logging/logger.hpp"

namespace neoforge::provider {

using core::errors::ErrorCategory;
using core::errors::ForgeError;
using nlohmann::json;
using protocol::ChatResponse;
using protocol::Message;
using protocol::Role;

namespace {

constexpr long kHttpTooManyRequests = 429;

struct CurlEasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct CurlListDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

std::size_t write_body(char* data, std::size_t size, std::size_t nmemb, void* userp) {
    auto* body = static_cast<std::string*>(userp);
    body->append(data, size * nmemb);
    return size * nmemb;
}

json message_to_json(const Message& message) {
    json payload;
    payload["role"] = protocol::to_string(message.role);
    if (message.role == Role::Assistant && !message.tool_calls.empty()) {
        payload["content"] = message.content.empty() ? json(nullptr) : json(message.content);
        json calls = json::array();
        for (const auto& call : message.tool_calls) {
            calls.push_back({{"id", call.id},
                             {"type", "function"},
                             {"function", {{"name", call.name}, {"arguments", call.arguments}}}});
        }
        payload["tool_calls"] = std::move(calls);
    } else {
        payload["content"] = message.content;
    }
    if (message.tool_call_id.has_value()) {
        payload["tool_call_id"] = message.tool_call_id.value();
    }
    return payload;
}

std::string error_text(const json& body, const std::string& raw) {
    if (body.is_object() && body.contains("error")) {
        return body["error"].dump();
    }
    return raw;
}

std::string string_or_empty(const json& object, const char* key) {
    const auto it = object.find(key);
    return it != object.end() && it->is_string() ? it->get<std::string>() : std::string();
}

}  // namespace

json encode_chat_request(const protocol::ChatRequest& request) {
    json payload;
    payload["model"] = request.model;
    payload["messages"] = json::array();
    for (const auto& message : request.messages) {
        payload["messages"].push_back(message_to_json(message));
    }
    if (!request.tools.empty()) {
        payload["tools"] = request.tools;
        payload["tool_choice"] = request.tool_choice;
    }
    payload["temperature"] = request.temperature;
    return payload;
}

core::errors::Result<ChatResponse> decode_chat_response(const long http_status,
                                                        const std::string& body) {
    const json parsed = json::parse(body, nullptr, /*allow_exceptions=*/false);

    if (http_status < 200 || http_status >= 300) {
        const std::string detail = error_text(parsed, body);
        if (http_status == kHttpTooManyRequests ||
            detail.find("rate_limit_exceeded") != std::string::npos) {
            return ForgeError{ErrorCategory::Capacity,
                              "Rate limit exceeded (HTTP " + std::to_string(http_status) +
                                  "): " + detail,
                              "rate_limit_exceeded"};
        }
        if (detail.find("tool_use_failed") != std::string::npos) {
            return ForgeError{ErrorCategory::Protocol,
                              "Model produced a malformed tool call: " + detail,
                              "tool_use_failed"};
        }
        return ForgeError{ErrorCategory::Provider,
                          "Chat request failed (HTTP " + std::to_string(http_status) +
                              "): " + detail,
                          "provider_request_failed"};
    }

    if (parsed.is_discarded() || !parsed.contains("choices") || !parsed["choices"].is_array() ||
        parsed["choices"].empty()) {
        return ForgeError{ErrorCategory::Provider, "Chat response has no choices.",
                          "provider_response_invalid"};
    }

    const json& choice = parsed["choices"][0];
    if (!choice.is_object() || !choice.contains("message") || !choice["message"].is_object()) {
        return ForgeError{ErrorCategory::Provider, "Chat response choice has no message.",
                          "provider_response_invalid"};
    }

    const json& message = choice["message"];
    ChatResponse response;
    if (message.contains("content") && message["content"].is_string()) {
        response.content = message["content"].get<std::string>();
    }
    if (message.contains("tool_calls") && message["tool_calls"].is_array()) {
        for (const auto& call : message["tool_calls"]) {
            if (!call.is_object() || !call.contains("function") || !call["function"].is_object()) {
                return ForgeError{ErrorCategory::Provider,
                                  "Chat response carries a tool call without a function.",
                                  "provider_response_invalid"};
            }
            const json& function = call["function"];
            protocol::ToolCall tool_call;
            tool_call.id = string_or_empty(call, "id");
            tool_call.name = string_or_empty(function, "name");
            if (function.contains("arguments")) {
                const json& arguments = function["arguments"];
                tool_call.arguments =
                    arguments.is_string() ? arguments.get<std::string>() : arguments.dump();
            }
            response.tool_calls.push_back(std::move(tool_call));
        }
    }
    return response;
}

HttpChatTransport::HttpChatTransport(HttpChatConfig config) : config_(std::move(config)) {
    curl_global_init(CURL_GLOBAL_ALL);
}

HttpChatTransport::~HttpChatTransport() { curl_global_cleanup(); }

core::errors::Result<ChatResponse> HttpChatTransport::complete(
    const std::string& credential, const protocol::ChatRequest& request) {
    std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
    if (!curl) {
        return ForgeError{ErrorCategory::Provider, "Failed to initialise libcurl.",
                          "provider_request_failed"};
    }

    std::string url = config_.api_base;
    if (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    url += "/chat/completions";

    const std::string payload =
        encode_chat_request(request).dump(-1, ' ', false, json::error_handler_t::replace);
    const std::string auth_header = "Authorization: Bearer " + credential;

    curl_slist* raw_headers = curl_slist_append(nullptr, "Content-Type: application/json");
    raw_headers = curl_slist_append(raw_headers, auth_header.c_str());
    std::unique_ptr<curl_slist, CurlListDeleter> headers(raw_headers);

    std::string body;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, config_.timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        LOG_ERROR("HttpChatTransport: request to " + url + " failed: " +
                  curl_easy_strerror(res));
        return ForgeError{ErrorCategory::Provider,
                          std::string("Chat request failed: ") + curl_easy_strerror(res),
                          "provider_request_failed"};
    }

    long http_status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);
    LOG_DEBUG("HttpChatTransport: HTTP " + std::to_string(http_status) + ", " +
              std::to_string(body.size()) + " bytes");
    return decode_chat_response(http_status, body);
}

}  // namespace neoforge::provider
