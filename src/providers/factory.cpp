#include "newsdesk/providers/factory.hpp"

#include "newsdesk/providers/compatible.hpp"
#include "newsdesk/providers/reliable.hpp"

namespace newsdesk::providers {

RetryPolicy retry_policy_from(const config::ReliabilityConfig &reliability) {
  return RetryPolicy{.max_retries = reliability.max_retries,
                     .initial_backoff_ms = reliability.initial_backoff_ms,
                     .max_backoff_ms = reliability.max_backoff_ms};
}

CircuitBreakerOptions breaker_options_from(const config::ReliabilityConfig &reliability) {
  return CircuitBreakerOptions{
      .failure_threshold = reliability.breaker_failure_threshold,
      .open_duration = std::chrono::milliseconds(reliability.breaker_open_ms)};
}

common::Result<std::shared_ptr<Provider>>
create_chat_provider(const config::Config &config, std::shared_ptr<HttpClient> http_client) {
  if (!config.api_key.has_value() || config.api_key->empty()) {
    return common::Result<std::shared_ptr<Provider>>::failure(
        common::ErrorCode::ConfigurationError, "chat provider requires an API key");
  }
  if (!http_client) {
    http_client = std::make_shared<CurlHttpClient>();
  }

  auto compatible = std::make_shared<CompatibleProvider>(
      "openai", config.llm.base_url, *config.api_key, std::move(http_client),
      config.llm.timeout_ms);
  auto breaker =
      std::make_shared<CircuitBreaker>("chat", breaker_options_from(config.reliability));

  std::shared_ptr<Provider> provider = std::make_shared<ReliableProvider>(
      std::move(compatible), retry_policy_from(config.reliability), std::move(breaker));
  return common::Result<std::shared_ptr<Provider>>::success(std::move(provider));
}

} // namespace newsdesk::providers
