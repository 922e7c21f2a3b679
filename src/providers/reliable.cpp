#include "newsdesk/providers/reliable.hpp"

#include "newsdesk/observability/global.hpp"

#include <thread>

namespace newsdesk::providers {

void sleep_for(const std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); }

ReliableProvider::ReliableProvider(std::shared_ptr<Provider> primary, const RetryPolicy policy,
                                   std::shared_ptr<CircuitBreaker> breaker, Sleeper sleeper)
    : primary_(std::move(primary)), policy_(policy), breaker_(std::move(breaker)),
      sleeper_(std::move(sleeper)) {}

common::Result<std::string> ReliableProvider::chat(const ChatRequest &request) {
  std::string last_error;

  for (std::uint32_t attempt = 0; attempt <= policy_.max_retries; ++attempt) {
    if (breaker_ && !breaker_->allow_request()) {
      std::string message = "circuit open for " + primary_->name();
      if (!last_error.empty()) {
        message += ": " + last_error;
      }
      return common::Result<std::string>::failure(common::ErrorCode::ProviderUnavailable,
                                                  std::move(message));
    }

    const auto started = std::chrono::steady_clock::now();
    auto result = primary_->chat(request);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    observability::record_provider_call("chat", primary_->name(), elapsed, result.ok());

    if (result.ok()) {
      if (breaker_) {
        breaker_->record_success();
      }
      return result;
    }

    if (breaker_) {
      breaker_->record_failure();
    }
    const auto &detail = result.error_detail();
    if (!detail.retryable) {
      return result;
    }
    last_error = detail.message;
    if (attempt < policy_.max_retries) {
      sleeper_(policy_.delay_for(attempt, detail.retry_after_seconds));
    }
  }

  return common::Result<std::string>::failure(common::ErrorCode::ProviderUnavailable, last_error);
}

std::string ReliableProvider::name() const { return "reliable(" + primary_->name() + ")"; }

} // namespace newsdesk::providers
