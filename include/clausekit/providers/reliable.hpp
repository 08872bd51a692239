#pragma once

#include "clausekit/providers/traits.hpp"

#include <chrono>
#include <functional>
#include <memory>

namespace clausekit::providers {

/// Retries the wrapped provider with exponential backoff (backoff_ms * 2^attempt).
class ReliableProvider final : public Provider {
public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  ReliableProvider(std::shared_ptr<Provider> primary, std::uint32_t max_retries,
                   std::uint64_t backoff_ms, Sleeper sleeper = {});

  [[nodiscard]] common::Result<std::string> complete(const ChatRequest &request) override;
  [[nodiscard]] std::string name() const override;

private:
  std::shared_ptr<Provider> primary_;
  std::uint32_t max_retries_;
  std::uint64_t backoff_ms_;
  Sleeper sleeper_;
};

} // namespace clausekit::providers
