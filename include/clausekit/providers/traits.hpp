#pragma once

#include "clausekit/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace clausekit::providers {

enum class ProviderErrorCode {
  ApiError,
  NetworkError,
  AuthError,
  RateLimitError,
  ModelNotFound,
  InvalidResponse,
  Timeout,
};

struct ProviderError {
  ProviderErrorCode code = ProviderErrorCode::ApiError;
  std::uint16_t status = 0;
  std::string message;
  std::optional<std::uint64_t> retry_after;

  [[nodiscard]] std::string to_string() const;
};

/// One single-turn completion.
struct ChatRequest {
  std::optional<std::string> system_prompt;
  std::string message;
  std::string model;
  double temperature = 0.1;
  std::uint32_t max_tokens = 1000;
  std::uint64_t timeout_ms = 30'000;
};

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  std::unordered_map<std::string, std::string> headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  [[nodiscard]] HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) override;
};

class Provider {
public:
  virtual ~Provider() = default;

  [[nodiscard]] virtual common::Result<std::string> complete(const ChatRequest &request) = 0;
  [[nodiscard]] virtual std::string name() const = 0;
};

/// Maps transport failures and non-2xx statuses to a ProviderError message.
[[nodiscard]] common::Status check_http_status(const HttpResponse &response);

[[nodiscard]] common::Result<std::string> parse_openai_content(const std::string &response);
[[nodiscard]] common::Result<std::string> parse_anthropic_content(const std::string &response);

} // namespace clausekit::providers
