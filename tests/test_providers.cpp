#include "test_framework.hpp"

#include "clausekit/config/schema.hpp"
#include "clausekit/providers/anthropic.hpp"
#include "clausekit/providers/compatible.hpp"
#include "clausekit/providers/factory.hpp"
#include "clausekit/providers/reliable.hpp"
#include "clausekit/providers/traits.hpp"

#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <memory>

void register_provider_tests(std::vector<clausekit::tests::TestCase> &tests) {
  using clausekit::tests::require;
  using clausekit::tests::require_error_contains;
  using clausekit::tests::require_ok;
  using clausekit::testing::EnvGuard;
  using clausekit::testing::MockHttpClient;
  using clausekit::testing::SequenceProvider;
  namespace p = clausekit::providers;
  namespace c = clausekit::common;

  tests.push_back({"compatible_posts_chat_completion", [] {
                     auto mock = std::make_shared<MockHttpClient>();
                     mock->responses.push_back(
                         {.status = 200, .body = clausekit::testing::openai_reply("[]")});
                     p::CompatibleProvider provider("qwen", "https://example.com/v1/", "key", mock);
                     const auto result = provider.complete(p::ChatRequest{
                         .system_prompt = "classify", .message = "第一条", .model = "qwen-plus",
                         .timeout_ms = 1234});
                     require_ok(result, "complete");
                     require(result.value() == "[]", "content parse");
                     require(mock->last_url == "https://example.com/v1/chat/completions",
                             "trailing slash trimmed");
                     require(mock->last_headers.at("Authorization") == "Bearer key", "bearer auth");
                     require(mock->last_body.find("\"max_tokens\":1000") != std::string::npos,
                             "max_tokens sent");
                     require(mock->last_body.find("\"role\":\"system\"") != std::string::npos,
                             "system prompt sent");
                     require(mock->last_timeout_ms == 1234, "timeout forwarded");
                   }});

  tests.push_back({"compatible_maps_http_errors", [] {
                     auto mock = std::make_shared<MockHttpClient>();
                     mock->responses.push_back(
                         {.status = 401, .body = R"({"error":{"message":"Invalid API key"}})"});
                     p::CompatibleProvider provider("openai", "https://example.com/v1", "key", mock);
                     const auto result = provider.complete(p::ChatRequest{.message = "hi"});
                     require_error_contains(result, "[auth]", "auth error code");
                     require_error_contains(result, "Invalid API key", "api message");

                     p::CompatibleProvider keyless("openai", "https://example.com/v1", "", mock);
                     require_error_contains(keyless.complete(p::ChatRequest{.message = "hi"}),
                                            "missing API key", "empty key");
                   }});

  tests.push_back({"check_http_status_classifies_failures", [] {
                     p::HttpResponse limited{.status = 429, .body = "{}"};
                     limited.headers["retry-after"] = "7";
                     const auto rate = p::check_http_status(limited);
                     require_error_contains(rate, "[rate_limit]", "rate limit code");
                     require_error_contains(rate, "retry_after=7", "retry after parsed");

                     require_error_contains(p::check_http_status({.status = 404, .body = "{}"}),
                                            "[model_not_found]", "404");
                     require_error_contains(p::check_http_status({.timeout = true, .network_error = true}),
                                            "[timeout]", "timeout");
                     require_error_contains(
                         p::check_http_status({.network_error = true,
                                               .network_error_message = "connection refused"}),
                         "connection refused", "network");
                     require_ok(p::check_http_status({.status = 204}), "2xx");
                   }});

  tests.push_back({"anthropic_reads_text_blocks", [] {
                     auto mock = std::make_shared<MockHttpClient>();
                     mock->responses.push_back(
                         {.status = 200,
                          .body = R"({"content":[{"type":"text","text":"[{\"is_heading\":"},)"
                                  R"({"type":"text","text":" true}]"}]})"});
                     p::AnthropicProvider provider("secret", "https://api.anthropic.com/", mock);
                     const auto result = provider.complete(
                         p::ChatRequest{.system_prompt = "sys", .message = "第一章", .model = "claude"});
                     require_ok(result, "complete");
                     require(result.value() == "[{\"is_heading\": true}]", "text blocks joined");
                     require(mock->last_url == "https://api.anthropic.com/v1/messages", "endpoint");
                     require(mock->last_headers.at("x-api-key") == "secret", "api key header");
                     require(mock->last_headers.at("anthropic-version") == "2023-06-01", "version");
                     require(mock->last_body.find("\"system\":\"sys\"") != std::string::npos,
                             "system prompt");
                     require(!p::parse_anthropic_content(R"({"content":[{"type":"image"}]})").ok(),
                             "no text block");
                   }});

  tests.push_back({"reliable_retries_with_exponential_backoff", [] {
                     auto primary = std::make_shared<SequenceProvider>(
                         std::vector<c::Result<std::string>>{
                             c::Result<std::string>::failure("first"),
                             c::Result<std::string>::failure("second"),
                             c::Result<std::string>::success("ok"),
                         });
                     std::vector<std::chrono::milliseconds> delays;
                     p::ReliableProvider provider(
                         primary, 3, 10, [&delays](std::chrono::milliseconds delay) {
                           delays.push_back(delay);
                         });
                     const auto result = provider.complete(p::ChatRequest{.message = "x"});
                     require_ok(result, "eventual success");
                     require(result.value() == "ok", "value");
                     require(primary->calls() == 3, "three attempts");
                     require(delays.size() == 2 && delays[0].count() == 10 && delays[1].count() == 20,
                             "backoff doubles");
                     require(provider.name() == "sequence", "name delegates");
                   }});

  tests.push_back({"reliable_stops_when_budget_is_spent", [] {
                     auto primary = std::make_shared<SequenceProvider>(
                         std::vector<c::Result<std::string>>{
                             c::Result<std::string>::failure("down"),
                             c::Result<std::string>::success("late"),
                         });
                     int sleeps = 0;
                     p::ReliableProvider provider(primary, 5, 1000,
                                                  [&sleeps](std::chrono::milliseconds) { ++sleeps; });
                     const auto result =
                         provider.complete(p::ChatRequest{.message = "x", .timeout_ms = 100});
                     require_error_contains(result, "after 1 attempts: down", "single attempt");
                     require(sleeps == 0, "no sleep past the budget");
                     const auto requests = primary->requests();
                     require(requests.size() == 1 && requests[0].timeout_ms <= 100,
                             "attempt gets the remaining budget");
                   }});

  tests.push_back({"factory_builds_configured_provider", [] {
                     EnvGuard key("CLAUSEKIT_TEST_LLM_KEY", "k-123");
                     auto mock = std::make_shared<MockHttpClient>();
                     mock->responses.push_back(
                         {.status = 200, .body = clausekit::testing::openai_reply("done")});

                     clausekit::config::LlmConfig config;
                     config.api_key_env = "CLAUSEKIT_TEST_LLM_KEY";
                     config.retry_times = 1;
                     const auto qwen = p::create_provider(config, mock);
                     require_ok(qwen, "qwen provider");
                     require(qwen.value()->name() == "qwen", "qwen name");
                     require_ok(qwen.value()->complete(p::ChatRequest{.message = "hi"}), "complete");
                     require(mock->last_url ==
                                 "https://dashscope.aliyuncs.com/compatible-mode/v1/chat/completions",
                             "default qwen endpoint");
                     require(mock->last_headers.at("Authorization") == "Bearer k-123", "key used");

                     config.provider = "claude";
                     config.retry_times = 3;
                     const auto claude = p::create_provider(config, mock);
                     require_ok(claude, "claude provider");
                     require(claude.value()->name() == "claude", "claude name");
                     require(p::default_base_url("openai") == "https://api.openai.com/v1", "openai url");
                   }});

  tests.push_back({"factory_rejects_incomplete_settings", [] {
                     EnvGuard key("CLAUSEKIT_TEST_LLM_KEY", "k-123");
                     EnvGuard missing("CLAUSEKIT_TEST_ABSENT_KEY", std::nullopt);
                     EnvGuard dashscope("DASHSCOPE_API_KEY", std::nullopt);
                     clausekit::config::LlmConfig config;
                     config.api_key_env = "CLAUSEKIT_TEST_LLM_KEY";
                     config.provider = "custom";
                     require_error_contains(p::create_provider(config), "base_url", "custom url");

                     config.provider = "gemini";
                     config.base_url = "https://example.com";
                     require_error_contains(p::create_provider(config), "Unknown llm.provider",
                                            "unknown provider");

                     config = clausekit::config::LlmConfig{};
                     config.api_key_env = "CLAUSEKIT_TEST_ABSENT_KEY";
                     require_error_contains(p::create_provider(config), "CLAUSEKIT_TEST_ABSENT_KEY",
                                            "missing key");
                     require(!p::resolve_api_key(config).has_value(), "no key resolved");
                   }});
}
