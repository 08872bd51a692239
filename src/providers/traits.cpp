#include "clausekit/providers/traits.hpp"

#include "clausekit/common/fs.hpp"
#include "clausekit/common/json_util.hpp"

#include <curl/curl.h>

#include <charconv>
#include <sstream>

namespace clausekit::providers {

namespace {

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *output = static_cast<std::string *>(userdata);
  output->append(ptr, total);
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  std::string header(buffer, total);
  auto *headers = static_cast<std::unordered_map<std::string, std::string> *>(userdata);

  const auto separator = header.find(':');
  if (separator != std::string::npos) {
    const std::string key = common::to_lower(common::trim(header.substr(0, separator)));
    const std::string value = common::trim(header.substr(separator + 1));
    (*headers)[key] = value;
  }

  return total;
}

std::optional<std::uint64_t> parse_retry_after(const std::string &raw) {
  const std::string value = common::trim(raw);
  std::uint64_t seconds = 0;
  const auto *last = value.data() + value.size();
  auto [ptr, ec] = std::from_chars(value.data(), last, seconds);
  if (value.empty() || ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return seconds;
}

// Error payloads look like {"error":{"message":"..."}} for both APIs.
std::string api_error_message(const std::string &body) {
  const std::string error = common::json_get_object(body, "error");
  if (error.empty()) {
    return body;
  }
  const std::string message = common::json_get_string(error, "message");
  return message.empty() ? error : message;
}

} // namespace

std::string ProviderError::to_string() const {
  std::ostringstream stream;
  stream << "Provider error [";
  switch (code) {
  case ProviderErrorCode::ApiError:
    stream << "api";
    break;
  case ProviderErrorCode::NetworkError:
    stream << "network";
    break;
  case ProviderErrorCode::AuthError:
    stream << "auth";
    break;
  case ProviderErrorCode::RateLimitError:
    stream << "rate_limit";
    break;
  case ProviderErrorCode::ModelNotFound:
    stream << "model_not_found";
    break;
  case ProviderErrorCode::InvalidResponse:
    stream << "invalid_response";
    break;
  case ProviderErrorCode::Timeout:
    stream << "timeout";
    break;
  }
  stream << "]";
  if (status != 0) {
    stream << " status=" << status;
  }
  if (retry_after.has_value()) {
    stream << " retry_after=" << *retry_after;
  }
  if (!message.empty()) {
    stream << " " << message;
  }
  return stream.str();
}

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::post_json(
    const std::string &url, const std::unordered_map<std::string, std::string> &headers,
    const std::string &body, const std::uint64_t timeout_ms) {
  HttpResponse response;

  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "clausekit/0.1");
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

  struct curl_slist *header_list = nullptr;
  for (const auto &[key, value] : headers) {
    const std::string line = key + ": " + value;
    header_list = curl_slist_append(header_list, line.c_str());
  }
  if (header_list != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  }

  const CURLcode code = curl_easy_perform(curl);
  if (code != CURLE_OK) {
    response.network_error = true;
    response.network_error_message = curl_easy_strerror(code);
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
  } else {
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<std::uint16_t>(status);
  }

  if (header_list != nullptr) {
    curl_slist_free_all(header_list);
  }
  curl_easy_cleanup(curl);

  return response;
}

common::Status check_http_status(const HttpResponse &response) {
  if (response.timeout) {
    return common::Status::error(
        ProviderError{.code = ProviderErrorCode::Timeout, .message = "request timed out"}.to_string());
  }

  if (response.network_error) {
    return common::Status::error(ProviderError{.code = ProviderErrorCode::NetworkError,
                                               .message = response.network_error_message}
                                     .to_string());
  }

  if (response.status >= 200 && response.status < 300) {
    return common::Status::success();
  }

  ProviderError error{.status = response.status, .message = api_error_message(response.body)};
  if (response.status == 401 || response.status == 403) {
    error.code = ProviderErrorCode::AuthError;
  } else if (response.status == 404) {
    error.code = ProviderErrorCode::ModelNotFound;
  } else if (response.status == 429) {
    error.code = ProviderErrorCode::RateLimitError;
    if (const auto it = response.headers.find("retry-after"); it != response.headers.end()) {
      error.retry_after = parse_retry_after(it->second);
    }
  }
  return common::Status::error(error.to_string());
}

common::Result<std::string> parse_openai_content(const std::string &response) {
  const std::string choices = common::json_get_array(response, "choices");
  if (choices.empty()) {
    return common::Result<std::string>::failure("choices field missing");
  }

  const auto entries = common::json_split_top_level_objects(choices);
  if (entries.empty()) {
    return common::Result<std::string>::failure("choices array is empty");
  }

  const std::string message = common::json_get_object(entries.front(), "message");
  if (message.empty() || message.find("\"content\"") == std::string::npos) {
    return common::Result<std::string>::failure("choices[0].message.content missing");
  }
  return common::Result<std::string>::success(common::json_get_string(message, "content"));
}

common::Result<std::string> parse_anthropic_content(const std::string &response) {
  const std::string content = common::json_get_array(response, "content");
  if (content.empty()) {
    return common::Result<std::string>::failure("content field missing");
  }

  std::string text;
  bool found = false;
  for (const auto &block : common::json_split_top_level_objects(content)) {
    if (common::json_get_string(block, "type") != "text") {
      continue;
    }
    text += common::json_get_string(block, "text");
    found = true;
  }
  if (!found) {
    return common::Result<std::string>::failure("content[].text missing");
  }
  return common::Result<std::string>::success(std::move(text));
}

} // namespace clausekit::providers
