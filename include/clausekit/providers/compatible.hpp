#pragma once

#include "clausekit/providers/traits.hpp"

#include <memory>
#include <string>
#include <unordered_map>

namespace clausekit::providers {

/// Any endpoint speaking the OpenAI chat-completions dialect (DashScope
/// compatible mode, OpenAI, self-hosted gateways).
class CompatibleProvider : public Provider {
public:
  CompatibleProvider(std::string name, std::string base_url, std::string api_key,
                     std::shared_ptr<HttpClient> http_client = std::make_shared<CurlHttpClient>(),
                     std::unordered_map<std::string, std::string> extra_headers = {});

  [[nodiscard]] common::Result<std::string> complete(const ChatRequest &request) override;
  [[nodiscard]] std::string name() const override;

  [[nodiscard]] const std::string &base_url() const { return base_url_; }

private:
  [[nodiscard]] static std::string build_body(const ChatRequest &request);

  std::string name_;
  std::string base_url_;
  std::string api_key_;
  std::shared_ptr<HttpClient> http_client_;
  std::unordered_map<std::string, std::string> extra_headers_;
};

} // namespace clausekit::providers
