#include "test_framework.hpp"

#include "newsdesk/providers/circuit_breaker.hpp"
#include "newsdesk/providers/compatible.hpp"
#include "newsdesk/providers/factory.hpp"
#include "newsdesk/providers/reliable.hpp"
#include "newsdesk/providers/retry.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace {

namespace p = newsdesk::providers;
using newsdesk::common::ErrorCode;
using newsdesk::common::Result;

p::ChatRequest sample_request() {
  return p::ChatRequest{.model = "gpt-4o-mini",
                        .system_prompt = std::string("Be brief."),
                        .message = "What moved the markets?",
                        .temperature = 0.3,
                        .max_tokens = 2000};
}

p::HttpResponse ok_response(const std::string &content) {
  return p::HttpResponse{.status = 200,
                         .body = R"({"choices":[{"message":{"content":")" + content + R"("}}]})"};
}

} // namespace

void register_provider_tests(std::vector<newsdesk::tests::TestCase> &tests) {
  using newsdesk::tests::require;
  namespace t = newsdesk::testing;

  tests.push_back({"compatible_success_parse", [] {
                     auto mock = std::make_shared<t::MockHttpClient>();
                     mock->fallback = ok_response("hello");
                     p::CompatibleProvider provider("test", "https://example.com/v1/", "key", mock);
                     auto result = provider.chat(sample_request());
                     require(result.ok(), result.error());
                     require(result.value() == "hello", "content parse mismatch");
                     require(mock->last_url == "https://example.com/v1/chat/completions",
                             "url: " + mock->last_url);
                     require(mock->last_headers["Authorization"] == "Bearer key", "bearer header");
                   }});

  tests.push_back({"compatible_request_body_shape", [] {
                     auto mock = std::make_shared<t::MockHttpClient>();
                     mock->fallback = ok_response("ok");
                     p::CompatibleProvider provider("test", "https://example.com/v1", "key", mock);
                     auto result = provider.chat(sample_request());
                     require(result.ok(), result.error());
                     const std::string &body = mock->bodies.back();
                     require(body.find(R"("role":"system","content":"Be brief.")") !=
                                 std::string::npos,
                             "system message first");
                     require(body.find(R"("max_tokens":2000)") != std::string::npos, "max tokens");
                     require(body.find(R"("stream":false)") != std::string::npos, "no streaming");
                     require(body.find("system") < body.find("What moved"), "system before user");
                   }});

  tests.push_back({"compatible_omits_max_tokens_when_unset", [] {
                     auto mock = std::make_shared<t::MockHttpClient>();
                     p::CompatibleProvider provider("test", "https://example.com/v1", "key", mock);
                     auto request = sample_request();
                     request.max_tokens.reset();
                     request.system_prompt.reset();
                     const std::string body = provider.build_body(request);
                     require(body.find("max_tokens") == std::string::npos, "no max_tokens");
                     require(body.find("system") == std::string::npos, "no system message");
                   }});

  tests.push_back({"compatible_missing_key_skips_http", [] {
                     auto mock = std::make_shared<t::MockHttpClient>();
                     p::CompatibleProvider provider("test", "https://example.com/v1", "", mock);
                     auto result = provider.chat(sample_request());
                     require(!result.ok(), "missing key should fail");
                     require(result.code() == ErrorCode::ProviderUnavailable, "unavailable");
                     require(result.error().find("auth") != std::string::npos, "auth error");
                     require(mock->bodies.empty(), "no request sent");
                   }});

  tests.push_back({"compatible_maps_http_errors", [] {
                     auto mock = std::make_shared<t::MockHttpClient>();
                     mock->responses.push_back({.status = 401, .body = "bad key"});
                     mock->responses.push_back(
                         {.status = 429, .body = "slow down", .headers = {{"retry-after", "7"}}});
                     mock->responses.push_back({.status = 200, .body = R"({"id":"x"})"});
                     p::CompatibleProvider provider("test", "https://example.com/v1", "key", mock);

                     auto unauthorized = provider.chat(sample_request());
                     require(unauthorized.code() == ErrorCode::ProviderUnavailable, "401 code");
                     require(unauthorized.error().find("[auth] status=401") != std::string::npos,
                             unauthorized.error());

                     auto limited = provider.chat(sample_request());
                     require(limited.error().find("rate_limit") != std::string::npos, "429");
                     require(limited.error().find("retry_after=7") != std::string::npos,
                             "retry-after parsed");

                     auto malformed = provider.chat(sample_request());
                     require(malformed.error().find("invalid_response") != std::string::npos,
                             "missing choices");
                   }});

  tests.push_back({"compatible_network_error_and_timeout", [] {
                     auto mock = std::make_shared<t::MockHttpClient>();
                     mock->responses.push_back(
                         {.network_error = true, .network_error_message = "connection refused"});
                     mock->responses.push_back({.timeout = true, .network_error = true});
                     p::CompatibleProvider provider("test", "https://example.com/v1", "key", mock);
                     auto refused = provider.chat(sample_request());
                     require(refused.error().find("network") != std::string::npos, "network");
                     auto timed_out = provider.chat(sample_request());
                     require(timed_out.error().find("timeout") != std::string::npos, "timeout");
                   }});

  tests.push_back({"retry_policy_doubles_and_caps", [] {
                     const p::RetryPolicy policy{
                         .max_retries = 5, .initial_backoff_ms = 200, .max_backoff_ms = 1000};
                     require(policy.delay_for(0).count() == 200, "first delay");
                     require(policy.delay_for(1).count() == 400, "second delay");
                     require(policy.delay_for(2).count() == 800, "third delay");
                     require(policy.delay_for(3).count() == 1000, "capped");
                     require(policy.delay_for(40).count() == 1000, "large attempt capped");
                     require(policy.delay_for(0, std::uint64_t{0}).count() == 0, "retry-after zero");
                     require(policy.delay_for(0, std::uint64_t{7}).count() == 1000,
                             "retry-after capped");
                     require(policy.delay_for(1, std::nullopt).count() == 400, "no hint");
                   }});

  tests.push_back({"reliable_retries_then_succeeds", [] {
                     auto inner = std::make_shared<t::ScriptedProvider>();
                     inner->push(Result<std::string>::failure(ErrorCode::ProviderUnavailable, "e1"));
                     inner->push(Result<std::string>::failure(ErrorCode::ProviderUnavailable, "e2"));
                     inner->set_response("third time");
                     std::vector<std::chrono::milliseconds> delays;
                     p::ReliableProvider reliable(
                         inner, p::RetryPolicy{.max_retries = 3, .initial_backoff_ms = 200},
                         nullptr, [&delays](const std::chrono::milliseconds d) { delays.push_back(d); });

                     auto result = reliable.chat(sample_request());
                     require(result.ok(), result.error());
                     require(result.value() == "third time", "final response");
                     require(inner->calls() == 3, "three attempts");
                     require(delays.size() == 2, "two backoffs");
                     require(delays[0].count() == 200 && delays[1].count() == 400, "backoff");
                     require(reliable.name() == "reliable(scripted)", "name");
                   }});

  tests.push_back({"reliable_does_not_retry_auth_failures", [] {
                     auto mock = std::make_shared<t::MockHttpClient>();
                     mock->fallback = {.status = 401, .body = "bad key"};
                     auto inner = std::make_shared<p::CompatibleProvider>(
                         "test", "https://example.com/v1", "key", mock);
                     std::vector<std::chrono::milliseconds> delays;
                     p::ReliableProvider reliable(
                         inner, p::RetryPolicy{.max_retries = 3}, nullptr,
                         [&delays](const std::chrono::milliseconds d) { delays.push_back(d); });
                     auto result = reliable.chat(sample_request());
                     require(result.code() == ErrorCode::ProviderUnavailable, "code");
                     require(!result.error_detail().retryable, "marked permanent");
                     require(result.error().find("[auth]") != std::string::npos, result.error());
                     require(mock->bodies.size() == 1, "single attempt");
                     require(delays.empty(), "no backoff");

                     mock->fallback = {.status = 404, .body = "no such model"};
                     auto missing = reliable.chat(sample_request());
                     require(mock->bodies.size() == 2, "unknown model not retried");
                     require(missing.error().find("model_not_found") != std::string::npos,
                             missing.error());
                   }});

  tests.push_back({"reliable_waits_for_retry_after", [] {
                     auto mock = std::make_shared<t::MockHttpClient>();
                     mock->responses.push_back(
                         {.status = 429, .body = "slow down", .headers = {{"retry-after", "2"}}});
                     mock->responses.push_back(
                         {.status = 429, .body = "slow down", .headers = {{"retry-after", "60"}}});
                     mock->fallback = ok_response("done");
                     auto inner = std::make_shared<p::CompatibleProvider>(
                         "test", "https://example.com/v1", "key", mock);
                     std::vector<std::chrono::milliseconds> delays;
                     p::ReliableProvider reliable(
                         inner,
                         p::RetryPolicy{
                             .max_retries = 3, .initial_backoff_ms = 100, .max_backoff_ms = 5000},
                         nullptr, [&delays](const std::chrono::milliseconds d) { delays.push_back(d); });
                     auto result = reliable.chat(sample_request());
                     require(result.ok(), result.error());
                     require(delays.size() == 2, "two waits");
                     require(delays[0].count() == 2000, "server delay honored");
                     require(delays[1].count() == 5000, "server delay capped");
                   }});

  tests.push_back({"reliable_exhausted_is_provider_unavailable", [] {
                     auto inner = std::make_shared<t::ScriptedProvider>();
                     inner->set_error("upstream 503");
                     p::ReliableProvider reliable(inner, p::RetryPolicy{.max_retries = 2}, nullptr,
                                                  [](std::chrono::milliseconds) {});
                     auto result = reliable.chat(sample_request());
                     require(!result.ok(), "should fail");
                     require(result.code() == ErrorCode::ProviderUnavailable, "code");
                     require(result.error() == "upstream 503", "last error kept");
                     require(inner->calls() == 3, "initial + two retries");
                   }});

  tests.push_back({"circuit_breaker_opens_and_half_opens", [] {
                     t::ManualClock clock;
                     t::ScopedRecorder recorder;
                     p::CircuitBreaker breaker(
                         "chat",
                         p::CircuitBreakerOptions{.failure_threshold = 2,
                                                  .open_duration = std::chrono::milliseconds(1000)},
                         clock.steady());
                     require(breaker.allow_request(), "closed initially");
                     breaker.record_failure();
                     require(!breaker.is_open(), "below threshold");
                     breaker.record_failure();
                     require(breaker.is_open(), "open at threshold");
                     require(!breaker.allow_request(), "rejects while open");

                     clock.advance(std::chrono::milliseconds(999));
                     require(!breaker.allow_request(), "still open");
                     clock.advance(std::chrono::milliseconds(1));
                     require(breaker.allow_request(), "half-open trial allowed");
                     require(!breaker.allow_request(), "second caller waits for the trial");

                     breaker.record_success();
                     require(!breaker.is_open(), "closed after success");
                     require(breaker.consecutive_failures() == 0, "failures reset");

                     const auto states =
                         recorder.events().of<newsdesk::observability::CircuitStateEvent>();
                     require(states.size() == 2, "open then close recorded");
                     require(states[0].open && !states[1].open, "state order");
                   }});

  tests.push_back({"circuit_breaker_admits_one_trial_at_a_time", [] {
                     t::ManualClock clock;
                     p::CircuitBreaker breaker(
                         "embedding",
                         p::CircuitBreakerOptions{.failure_threshold = 1,
                                                  .open_duration = std::chrono::milliseconds(500)},
                         clock.steady());
                     breaker.record_failure();
                     clock.advance(std::chrono::milliseconds(500));

                     std::atomic<int> admitted{0};
                     std::vector<std::thread> callers;
                     for (int i = 0; i < 8; ++i) {
                       callers.emplace_back([&] {
                         if (breaker.allow_request()) {
                           admitted.fetch_add(1);
                         }
                       });
                     }
                     for (auto &caller : callers) {
                       caller.join();
                     }
                     require(admitted.load() == 1, "exactly one trial");

                     breaker.record_failure();
                     require(!breaker.allow_request(), "failed trial restarts the delay");
                     clock.advance(std::chrono::milliseconds(500));
                     require(breaker.allow_request(), "next trial after the delay");
                     breaker.record_success();
                     require(breaker.allow_request() && breaker.allow_request(), "closed again");
                   }});

  tests.push_back({"reliable_stops_when_circuit_open", [] {
                     t::ManualClock clock;
                     auto inner = std::make_shared<t::ScriptedProvider>();
                     inner->set_error("boom");
                     auto breaker = std::make_shared<p::CircuitBreaker>(
                         "chat", p::CircuitBreakerOptions{.failure_threshold = 2},
                         clock.steady());
                     p::ReliableProvider reliable(inner, p::RetryPolicy{.max_retries = 5}, breaker,
                                                  [](std::chrono::milliseconds) {});
                     auto result = reliable.chat(sample_request());
                     require(!result.ok(), "should fail");
                     require(result.code() == ErrorCode::ProviderUnavailable, "code");
                     require(result.error().find("circuit open for scripted: boom") == 0,
                             result.error());
                     require(inner->calls() == 2, "breaker stops retries");

                     auto rejected = reliable.chat(sample_request());
                     require(inner->calls() == 2, "no call while open");
                     require(rejected.error() == "circuit open for scripted", rejected.error());
                   }});

  tests.push_back({"factory_requires_api_key", [] {
                     newsdesk::testing::TempWorkspace workspace;
                     auto config = t::mock_config(workspace.path());
                     config.api_key.reset();
                     auto provider = p::create_chat_provider(config);
                     require(!provider.ok(), "missing key should fail");
                     require(provider.code() == ErrorCode::ConfigurationError, "configuration error");
                   }});

  tests.push_back({"factory_builds_reliable_provider", [] {
                     newsdesk::testing::TempWorkspace workspace;
                     auto config = t::mock_config(workspace.path());
                     config.llm.base_url = "https://llm.example.com/v1";
                     auto mock = std::make_shared<t::MockHttpClient>();
                     mock->fallback = ok_response("wired");
                     auto provider = p::create_chat_provider(config, mock);
                     require(provider.ok(), provider.error());
                     require(provider.value()->name() == "reliable(openai)", "wrapped provider");
                     auto result = provider.value()->chat(sample_request());
                     require(result.ok(), result.error());
                     require(mock->last_url == "https://llm.example.com/v1/chat/completions",
                             "configured base url");

                     const auto breaker = p::breaker_options_from(config.reliability);
                     require(breaker.failure_threshold == config.reliability.breaker_failure_threshold,
                             "breaker threshold");
                   }});
}
