#pragma once

#include "clausekit/common/result.hpp"
#include "clausekit/config/schema.hpp"
#include "clausekit/providers/traits.hpp"

#include <memory>
#include <string>

namespace clausekit::providers {

/// Public endpoint used when llm.base_url is empty; empty for "custom".
[[nodiscard]] std::string default_base_url(const std::string &provider);

/// Reads llm.api_key_env, then the provider's conventional variable.
[[nodiscard]] std::optional<std::string> resolve_api_key(const config::LlmConfig &config);

/// Builds the configured provider wrapped in retry/backoff.
[[nodiscard]] common::Result<std::shared_ptr<Provider>>
create_provider(const config::LlmConfig &config,
                std::shared_ptr<HttpClient> http_client = std::make_shared<CurlHttpClient>());

} // namespace clausekit::providers
