#include "clausekit/providers/reliable.hpp"

#include <algorithm>
#include <thread>

namespace clausekit::providers {

ReliableProvider::ReliableProvider(std::shared_ptr<Provider> primary,
                                   const std::uint32_t max_retries, const std::uint64_t backoff_ms,
                                   Sleeper sleeper)
    : primary_(std::move(primary)), max_retries_(max_retries), backoff_ms_(backoff_ms),
      sleeper_(std::move(sleeper)) {
  if (!sleeper_) {
    sleeper_ = [](const std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
  }
}

common::Result<std::string> ReliableProvider::complete(const ChatRequest &request) {
  // request.timeout_ms bounds all attempts together, backoff included.
  const auto budget = std::chrono::milliseconds(request.timeout_ms);
  const auto started = std::chrono::steady_clock::now();
  const auto elapsed = [&started] {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                 started);
  };

  std::string last_error;
  std::uint32_t attempts = 0;
  for (std::uint32_t attempt = 0; attempt <= max_retries_; ++attempt) {
    ChatRequest attempt_request = request;
    attempt_request.timeout_ms =
        static_cast<std::uint64_t>(std::max<std::int64_t>((budget - elapsed()).count(), 1));
    auto result = primary_->complete(attempt_request);
    ++attempts;
    if (result.ok()) {
      return result;
    }

    last_error = result.error();
    if (attempt == max_retries_) {
      break;
    }
    const auto delay = std::chrono::milliseconds(backoff_ms_ * (1ULL << attempt));
    if (elapsed() + delay >= budget) {
      break;
    }
    sleeper_(delay);
  }

  return common::Result<std::string>::failure("after " + std::to_string(attempts) +
                                              " attempts: " + last_error);
}

std::string ReliableProvider::name() const { return primary_->name(); }

} // namespace clausekit::providers
