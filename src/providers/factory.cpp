#include "clausekit/providers/factory.hpp"

#include "clausekit/common/fs.hpp"
#include "clausekit/providers/anthropic.hpp"
#include "clausekit/providers/compatible.hpp"
#include "clausekit/providers/reliable.hpp"

#include <cstdlib>

namespace clausekit::providers {

namespace {

std::optional<std::string> read_env(const std::string &name) {
  if (name.empty()) {
    return std::nullopt;
  }
  const char *value = std::getenv(name.c_str());
  if (value == nullptr) {
    return std::nullopt;
  }
  const std::string trimmed = common::trim(value);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  return trimmed;
}

std::string conventional_key_env(const std::string &provider) {
  if (provider == "qwen") {
    return "DASHSCOPE_API_KEY";
  }
  if (provider == "openai") {
    return "OPENAI_API_KEY";
  }
  if (provider == "claude") {
    return "ANTHROPIC_API_KEY";
  }
  return "";
}

} // namespace

std::string default_base_url(const std::string &provider) {
  const std::string normalized = common::to_lower(common::trim(provider));
  if (normalized == "qwen") {
    return "https://dashscope.aliyuncs.com/compatible-mode/v1";
  }
  if (normalized == "openai") {
    return "https://api.openai.com/v1";
  }
  if (normalized == "claude") {
    return "https://api.anthropic.com";
  }
  return "";
}

std::optional<std::string> resolve_api_key(const config::LlmConfig &config) {
  if (auto key = read_env(config.api_key_env); key.has_value()) {
    return key;
  }
  return read_env(conventional_key_env(common::to_lower(common::trim(config.provider))));
}

common::Result<std::shared_ptr<Provider>>
create_provider(const config::LlmConfig &config, std::shared_ptr<HttpClient> http_client) {
  const std::string provider = common::to_lower(common::trim(config.provider));
  std::string base_url = common::trim(config.base_url);
  if (base_url.empty()) {
    base_url = default_base_url(provider);
  }
  if (base_url.empty()) {
    return common::Result<std::shared_ptr<Provider>>::failure(
        "llm.base_url is required for provider '" + config.provider + "'");
  }

  const auto api_key = resolve_api_key(config);
  if (!api_key.has_value()) {
    return common::Result<std::shared_ptr<Provider>>::failure(
        "API key not found in environment variable " + config.api_key_env);
  }

  std::shared_ptr<Provider> base;
  if (provider == "claude") {
    base = std::make_shared<AnthropicProvider>(*api_key, base_url, std::move(http_client));
  } else if (provider == "qwen" || provider == "openai" || provider == "custom") {
    base = std::make_shared<CompatibleProvider>(provider, base_url, *api_key,
                                                std::move(http_client));
  } else {
    return common::Result<std::shared_ptr<Provider>>::failure("Unknown llm.provider: " +
                                                               config.provider);
  }

  // retry_times counts attempts, not extra retries.
  if (config.retry_times <= 1) {
    return common::Result<std::shared_ptr<Provider>>::success(std::move(base));
  }
  return common::Result<std::shared_ptr<Provider>>::success(std::make_shared<ReliableProvider>(
      std::move(base), config.retry_times - 1, config.retry_backoff_ms));
}

} // namespace clausekit::providers
