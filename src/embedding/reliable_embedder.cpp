#include "newsdesk/embedding/reliable_embedder.hpp"

#include "newsdesk/observability/global.hpp"

namespace newsdesk::embedding {

ReliableEmbeddingProvider::ReliableEmbeddingProvider(
    std::unique_ptr<IEmbeddingProvider> inner, const providers::RetryPolicy policy,
    std::shared_ptr<providers::CircuitBreaker> breaker, providers::Sleeper sleeper)
    : inner_(std::move(inner)), policy_(policy), breaker_(std::move(breaker)),
      sleeper_(std::move(sleeper)) {}

std::string_view ReliableEmbeddingProvider::name() const { return inner_->name(); }

std::string ReliableEmbeddingProvider::model_id() const { return inner_->model_id(); }

std::size_t ReliableEmbeddingProvider::dimensions() const { return inner_->dimensions(); }

template <typename T, typename Call> common::Result<T> ReliableEmbeddingProvider::run(Call &&call) {
  std::string last_error;

  for (std::uint32_t attempt = 0; attempt <= policy_.max_retries; ++attempt) {
    if (breaker_ && !breaker_->allow_request()) {
      std::string message = "circuit open for " + std::string(inner_->name());
      if (!last_error.empty()) {
        message += ": " + last_error;
      }
      return common::Result<T>::failure(common::ErrorCode::ProviderUnavailable,
                                        std::move(message));
    }

    const auto started = std::chrono::steady_clock::now();
    auto result = call();
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    observability::record_provider_call("embedding", std::string(inner_->name()), elapsed,
                                        result.ok());

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

  return common::Result<T>::failure(common::ErrorCode::ProviderUnavailable, last_error);
}

common::Result<Vector> ReliableEmbeddingProvider::embed(const std::string_view text) {
  return run<Vector>([&]() { return inner_->embed(text); });
}

common::Result<std::vector<Vector>>
ReliableEmbeddingProvider::embed_batch(const std::vector<std::string> &texts) {
  return run<std::vector<Vector>>([&]() { return inner_->embed_batch(texts); });
}

} // namespace newsdesk::embedding
