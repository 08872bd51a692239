#pragma once

#include "clausekit/providers/traits.hpp"

#include <memory>
#include <string>

namespace clausekit::providers {

class AnthropicProvider : public Provider {
public:
  explicit AnthropicProvider(std::string api_key, std::string base_url = "https://api.anthropic.com",
                             std::shared_ptr<HttpClient> http_client =
                                 std::make_shared<CurlHttpClient>());

  [[nodiscard]] common::Result<std::string> complete(const ChatRequest &request) override;
  [[nodiscard]] std::string name() const override { return "claude"; }

private:
  std::string api_key_;
  std::string base_url_;
  std::shared_ptr<HttpClient> http_client_;
};

} // namespace clausekit::providers
