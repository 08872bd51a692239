#include "clausekit/providers/compatible.hpp"

#include "clausekit/common/json_util.hpp"

#include <sstream>

namespace clausekit::providers {

CompatibleProvider::CompatibleProvider(std::string name, std::string base_url, std::string api_key,
                                       std::shared_ptr<HttpClient> http_client,
                                       std::unordered_map<std::string, std::string> extra_headers)
    : name_(std::move(name)), base_url_(std::move(base_url)), api_key_(std::move(api_key)),
      http_client_(std::move(http_client)), extra_headers_(std::move(extra_headers)) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::string CompatibleProvider::build_body(const ChatRequest &request) {
  std::ostringstream body;
  body << "{";
  body << "\"model\":\"" << common::json_escape(request.model) << "\",";
  body << "\"messages\":[";
  if (request.system_prompt.has_value()) {
    body << "{\"role\":\"system\",\"content\":\"" << common::json_escape(*request.system_prompt)
         << "\"},";
  }
  body << "{\"role\":\"user\",\"content\":\"" << common::json_escape(request.message) << "\"}";
  body << "],";
  body << "\"temperature\":" << request.temperature << ",";
  body << "\"max_tokens\":" << request.max_tokens << ",";
  body << "\"stream\":false";
  body << "}";
  return body.str();
}

common::Result<std::string> CompatibleProvider::complete(const ChatRequest &request) {
  if (api_key_.empty()) {
    return common::Result<std::string>::failure(
        ProviderError{.code = ProviderErrorCode::AuthError, .message = "missing API key"}.to_string());
  }

  std::unordered_map<std::string, std::string> headers = {
      {"Content-Type", "application/json"},
      {"Authorization", "Bearer " + api_key_},
  };
  for (const auto &[key, value] : extra_headers_) {
    headers[key] = value;
  }

  const auto response = http_client_->post_json(base_url_ + "/chat/completions", headers,
                                                 build_body(request), request.timeout_ms);
  const auto status = check_http_status(response);
  if (!status.ok()) {
    return common::Result<std::string>::failure(status.error());
  }

  auto parsed = parse_openai_content(response.body);
  if (!parsed.ok()) {
    return common::Result<std::string>::failure(
        ProviderError{.code = ProviderErrorCode::InvalidResponse, .message = parsed.error()}
            .to_string());
  }
  return parsed;
}

std::string CompatibleProvider::name() const { return name_; }

} // namespace clausekit::providers
