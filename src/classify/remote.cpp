#include "clausekit/classify/remote.hpp"

#include "clausekit/common/hash.hpp"
#include "clausekit/common/json_util.hpp"
#include "clausekit/common/utf8.hpp"
#include "clausekit/observability/global.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <sstream>

namespace clausekit::classify {

namespace {

constexpr std::size_t kPromptTextLimit = 200;

int parse_level(const std::string &raw) {
  int value = 0;
  const auto *last = raw.data() + raw.size();
  auto [ptr, ec] = std::from_chars(raw.data(), last, value);
  if (raw.empty() || ec != std::errc()) {
    return 0;
  }
  return value;
}

double parse_confidence(const std::string &raw) {
  if (raw.empty()) {
    return 0.5;
  }
  char *end = nullptr;
  const double value = std::strtod(raw.c_str(), &end);
  if (end == raw.c_str()) {
    return 0.5;
  }
  return std::clamp(value, 0.0, 1.0);
}

} // namespace

ClassifyDeadline ClassifyDeadline::after(const std::chrono::milliseconds budget,
                                         const std::atomic<bool> *cancel) {
  return ClassifyDeadline{.expires_at = std::chrono::steady_clock::now() + budget, .cancel = cancel};
}

bool ClassifyDeadline::expired() const {
  if (cancel != nullptr && cancel->load()) {
    return true;
  }
  return std::chrono::steady_clock::now() >= expires_at;
}

std::chrono::milliseconds ClassifyDeadline::remaining() const {
  if (expires_at == std::chrono::steady_clock::time_point::max()) {
    return std::chrono::milliseconds::max();
  }
  const auto now = std::chrono::steady_clock::now();
  if (now >= expires_at) {
    return std::chrono::milliseconds(0);
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(expires_at - now);
}

std::size_t estimate_tokens(const std::string &text) {
  std::size_t words = 0;
  std::istringstream stream(text);
  std::string word;
  while (stream >> word) {
    ++words;
  }
  return common::codepoint_count(text) + words / 2;
}

std::string build_classification_prompt(const std::vector<std::string> &texts) {
  std::ostringstream prompt;
  prompt << "你是文档结构分析助手。请逐条判断下列文本片段是否为标题，并给出标题层级。\n\n"
         << "判断依据：\n"
         << "- 标题一般较短，不以句号、问号或感叹号结尾；\n"
         << "- 标题常带编号，如\"第一章\"、\"第一条\"、\"一、\"、\"（一）\"、\"1.\"；\n"
         << "- 以编号开头但内容完整的长句属于正文，不是标题。\n\n"
         << "层级从 1 开始，数字越大层级越深。\n"
         << "只返回一个 JSON 数组，按输入顺序每个片段一个对象：\n"
         << "[{\"is_heading\": true, \"level\": 1, \"confidence\": 0.9}]\n\n"
         << "待分析文本：\n";

  for (std::size_t i = 0; i < texts.size(); ++i) {
    const std::string_view head = common::utf8_prefix(texts[i], kPromptTextLimit);
    prompt << "\n" << (i + 1) << ". " << head;
    if (head.size() < texts[i].size()) {
      prompt << "...";
    }
  }
  prompt << "\n\n请返回 JSON 数组：";
  return prompt.str();
}

common::Result<std::vector<ClassificationResult>>
parse_classification_response(const std::string &response, const std::size_t expected) {
  using Parsed = common::Result<std::vector<ClassificationResult>>;

  const std::string array = common::json_extract_first_array(response);
  if (array.empty()) {
    return Parsed::failure("no JSON array in model reply");
  }

  const auto objects = common::json_split_top_level_objects(array);
  if (objects.size() != expected) {
    return Parsed::failure("expected " + std::to_string(expected) + " labels, got " +
                           std::to_string(objects.size()));
  }

  std::vector<ClassificationResult> results;
  results.reserve(objects.size());
  for (const auto &object : objects) {
    const bool is_heading = common::json_get_bool(object, "is_heading").value_or(false);
    const double confidence = parse_confidence(common::json_get_number(object, "confidence"));
    if (!is_heading) {
      results.push_back(plain_content(confidence));
      continue;
    }
    int level = parse_level(common::json_get_number(object, "level"));
    if (level < 1) {
      level = kDefaultLevel;
    }
    level = std::min(level, level_value(HeadingLevel::Numbering));
    results.push_back(heading_at(level, confidence));
  }
  return Parsed::success(std::move(results));
}

RemoteClassifier::RemoteClassifier(std::shared_ptr<providers::Provider> provider,
                                   std::shared_ptr<const IHeadingClassifier> fallback,
                                   RemoteOptions options)
    : provider_(std::move(provider)), fallback_(std::move(fallback)), options_(std::move(options)) {
  options_.max_texts_per_batch = std::max<std::size_t>(options_.max_texts_per_batch, 1);
}

ClassificationResult RemoteClassifier::classify(const std::string &text) const {
  return classify_batch(std::vector<std::string>{text}).front();
}

std::vector<ClassificationResult>
RemoteClassifier::classify_batch(const std::vector<std::string> &texts) const {
  return classify_batch(texts, ClassifyDeadline::after(options_.deadline));
}

std::vector<ClassificationResult>
RemoteClassifier::classify_batch(const std::vector<std::string> &texts,
                                 const ClassifyDeadline &deadline) const {
  std::vector<ClassificationResult> results(texts.size(), plain_content());
  std::vector<std::string> keys(texts.size());
  std::vector<std::size_t> pending;

  {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    for (std::size_t i = 0; i < texts.size(); ++i) {
      // Fragments this short are never headings; no need to ask.
      if (common::codepoint_count(common::utf8_trim(texts[i])) < 2) {
        continue;
      }
      if (options_.cache_enabled) {
        keys[i] = common::sha256_hex(texts[i]);
        if (const auto it = cache_.find(keys[i]); !keys[i].empty() && it != cache_.end()) {
          results[i] = it->second;
          continue;
        }
      }
      pending.push_back(i);
    }
  }

  for (const auto &batch : plan_batches(texts, pending)) {
    if (deadline.expired()) {
      const bool cancelled = deadline.cancel != nullptr && deadline.cancel->load();
      apply_fallback(texts, batch, cancelled ? "cancelled" : "deadline expired", results);
      continue;
    }

    std::vector<std::string> batch_texts;
    batch_texts.reserve(batch.size());
    for (const auto index : batch) {
      batch_texts.push_back(texts[index]);
    }

    const auto started = std::chrono::steady_clock::now();
    auto labelled = request_batch(batch_texts, deadline);
    observability::record_metric(observability::ClassifierLatencyMetric{
        .latency = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started),
        .texts = batch.size(),
    });

    if (!labelled.ok()) {
      apply_fallback(texts, batch, labelled.error(), results);
      continue;
    }

    std::lock_guard<std::mutex> lock(cache_mutex_);
    for (std::size_t j = 0; j < batch.size(); ++j) {
      results[batch[j]] = labelled.value()[j];
      if (options_.cache_enabled && !keys[batch[j]].empty()) {
        cache_[keys[batch[j]]] = labelled.value()[j];
      }
    }
  }

  return results;
}

std::size_t RemoteClassifier::cache_size() const {
  std::lock_guard<std::mutex> lock(cache_mutex_);
  return cache_.size();
}

std::vector<std::vector<std::size_t>>
RemoteClassifier::plan_batches(const std::vector<std::string> &texts,
                               const std::vector<std::size_t> &pending) const {
  std::vector<std::vector<std::size_t>> batches;
  std::vector<std::size_t> current;
  std::size_t current_tokens = 0;

  for (const auto index : pending) {
    const std::size_t tokens = estimate_tokens(texts[index]);
    if (!current.empty() && (current.size() >= options_.max_texts_per_batch ||
                             current_tokens + tokens > options_.max_tokens_per_batch)) {
      batches.push_back(std::move(current));
      current.clear();
      current_tokens = 0;
    }
    current.push_back(index);
    current_tokens += tokens;
  }
  if (!current.empty()) {
    batches.push_back(std::move(current));
  }
  return batches;
}

common::Result<std::vector<ClassificationResult>>
RemoteClassifier::request_batch(const std::vector<std::string> &texts,
                                const ClassifyDeadline &deadline) const {
  if (provider_ == nullptr) {
    return common::Result<std::vector<ClassificationResult>>::failure("no provider configured");
  }

  const auto timeout = std::min(options_.request_timeout, deadline.remaining());
  const providers::ChatRequest request{
      .message = build_classification_prompt(texts),
      .model = options_.model,
      .temperature = options_.temperature,
      .max_tokens = options_.max_tokens,
      .timeout_ms = static_cast<std::uint64_t>(std::max<std::int64_t>(timeout.count(), 1)),
  };

  const auto reply = provider_->complete(request);
  if (!reply.ok()) {
    return reply.forward_error<std::vector<ClassificationResult>>();
  }
  return parse_classification_response(reply.value(), texts.size());
}

void RemoteClassifier::apply_fallback(const std::vector<std::string> &texts,
                                      const std::vector<std::size_t> &indices,
                                      const std::string &reason,
                                      std::vector<ClassificationResult> &results) const {
  observability::record_classifier_fallback(std::string(name()), reason, indices.size());
  for (const auto index : indices) {
    results[index] = fallback_ != nullptr ? fallback_->classify(texts[index]) : plain_content();
  }
}

} // namespace clausekit::classify
