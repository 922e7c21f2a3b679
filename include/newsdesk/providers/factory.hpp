#pragma once

#include "newsdesk/common/result.hpp"
#include "newsdesk/config/schema.hpp"
#include "newsdesk/providers/circuit_breaker.hpp"
#include "newsdesk/providers/retry.hpp"
#include "newsdesk/providers/traits.hpp"

#include <memory>

namespace newsdesk::providers {

/// Chat provider for [llm], wrapped in retries and a circuit breaker. When
/// `http_client` is null a CurlHttpClient is created.
[[nodiscard]] common::Result<std::shared_ptr<Provider>>
create_chat_provider(const config::Config &config,
                     std::shared_ptr<HttpClient> http_client = nullptr);

[[nodiscard]] RetryPolicy retry_policy_from(const config::ReliabilityConfig &reliability);
[[nodiscard]] CircuitBreakerOptions breaker_options_from(const config::ReliabilityConfig &reliability);

} // namespace newsdesk::providers
