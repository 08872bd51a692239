#include "clausekit/providers/anthropic.hpp"

#include "clausekit/common/json_util.hpp"

#include <sstream>

namespace clausekit::providers {

namespace {

constexpr const char *kAnthropicVersion = "2023-06-01";

std::string build_anthropic_body(const ChatRequest &request) {
  std::ostringstream body;
  body << "{";
  body << "\"model\":\"" << common::json_escape(request.model) << "\",";
  body << "\"max_tokens\":" << request.max_tokens << ",";
  if (request.system_prompt.has_value()) {
    body << "\"system\":\"" << common::json_escape(*request.system_prompt) << "\",";
  }
  body << "\"messages\":[{\"role\":\"user\",\"content\":\"" << common::json_escape(request.message)
       << "\"}],";
  body << "\"temperature\":" << request.temperature;
  body << "}";
  return body.str();
}

} // namespace

AnthropicProvider::AnthropicProvider(std::string api_key, std::string base_url,
                                     std::shared_ptr<HttpClient> http_client)
    : api_key_(std::move(api_key)), base_url_(std::move(base_url)),
      http_client_(std::move(http_client)) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

common::Result<std::string> AnthropicProvider::complete(const ChatRequest &request) {
  if (api_key_.empty()) {
    return common::Result<std::string>::failure(
        ProviderError{.code = ProviderErrorCode::AuthError, .message = "missing API key"}.to_string());
  }

  const std::unordered_map<std::string, std::string> headers = {
      {"Content-Type", "application/json"},
      {"x-api-key", api_key_},
      {"anthropic-version", kAnthropicVersion},
  };

  const auto response = http_client_->post_json(base_url_ + "/v1/messages", headers,
                                                 build_anthropic_body(request), request.timeout_ms);
  const auto status = check_http_status(response);
  if (!status.ok()) {
    return common::Result<std::string>::failure(status.error());
  }

  auto parsed = parse_anthropic_content(response.body);
  if (!parsed.ok()) {
    return common::Result<std::string>::failure(
        ProviderError{.code = ProviderErrorCode::InvalidResponse, .message = parsed.error()}
            .to_string());
  }
  return parsed;
}

} // namespace clausekit::providers
