#include "tests/helpers/test_helpers.hpp"

#include "clausekit/common/json_util.hpp"
#include "clausekit/observability/global.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <random>

namespace clausekit::testing {

providers::HttpResponse
MockHttpClient::post_json(const std::string &url,
                          const std::unordered_map<std::string, std::string> &headers,
                          const std::string &body, const std::uint64_t timeout_ms) {
  last_url = url;
  last_headers = headers;
  last_body = body;
  last_timeout_ms = timeout_ms;
  const std::size_t index = calls++;
  if (responses.empty()) {
    return providers::HttpResponse{.network_error = true, .network_error_message = "no response"};
  }
  return responses[std::min(index, responses.size() - 1)];
}

SequenceProvider::SequenceProvider(std::vector<common::Result<std::string>> results,
                                   std::string name)
    : results_(std::move(results)), name_(std::move(name)) {}

common::Result<std::string> SequenceProvider::complete(const providers::ChatRequest &request) {
  std::lock_guard<std::mutex> lock(mutex_);
  requests_.push_back(request);
  if (index_ >= results_.size()) {
    return common::Result<std::string>::failure("out of responses");
  }
  return results_[index_++];
}

std::size_t SequenceProvider::calls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_.size();
}

std::vector<providers::ChatRequest> SequenceProvider::requests() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_;
}

void CapturingObserver::record_event(const observability::ObserverEvent &event) {
  log_->events.push_back(event);
}

void CapturingObserver::record_metric(const observability::ObserverMetric &metric) {
  log_->metrics.push_back(metric);
}

ObserverCapture::ObserverCapture() : log_(std::make_shared<CapturingObserver::Log>()) {
  observability::set_global_observer(std::make_unique<CapturingObserver>(log_));
}

ObserverCapture::~ObserverCapture() { observability::set_global_observer(nullptr); }

EnvGuard::EnvGuard(std::string key, std::optional<std::string> value) : key_(std::move(key)) {
  if (const char *existing = std::getenv(key_.c_str()); existing != nullptr) {
    old_value_ = existing;
  }
  if (value.has_value()) {
    setenv(key_.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key_.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value_.has_value()) {
    setenv(key_.c_str(), old_value_->c_str(), 1);
  } else {
    unsetenv(key_.c_str());
  }
}

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("clausekit-test-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

std::filesystem::path TempWorkspace::create_file(const std::string &name,
                                                 const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
  return file_path;
}

std::string openai_reply(const std::string &content) {
  return R"({"choices":[{"message":{"role":"assistant","content":")" +
         common::json_escape(content) + R"("}}]})";
}

} // namespace clausekit::testing
