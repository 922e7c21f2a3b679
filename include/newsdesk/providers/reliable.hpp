#pragma once

#include "newsdesk/providers/circuit_breaker.hpp"
#include "newsdesk/providers/retry.hpp"
#include "newsdesk/providers/traits.hpp"

#include <functional>
#include <memory>

namespace newsdesk::providers {

using Sleeper = std::function<void(std::chrono::milliseconds)>;

void sleep_for(std::chrono::milliseconds delay);

class ReliableProvider : public Provider {
public:
  ReliableProvider(std::shared_ptr<Provider> primary, RetryPolicy policy,
                   std::shared_ptr<CircuitBreaker> breaker, Sleeper sleeper = sleep_for);

  [[nodiscard]] common::Result<std::string> chat(const ChatRequest &request) override;
  [[nodiscard]] std::string name() const override;

private:
  std::shared_ptr<Provider> primary_;
  RetryPolicy policy_;
  std::shared_ptr<CircuitBreaker> breaker_;
  Sleeper sleeper_;
};

} // namespace newsdesk::providers
