#pragma once

#include "newsdesk/embedding/provider.hpp"
#include "newsdesk/providers/circuit_breaker.hpp"
#include "newsdesk/providers/reliable.hpp"
#include "newsdesk/providers/retry.hpp"

namespace newsdesk::embedding {

class ReliableEmbeddingProvider final : public IEmbeddingProvider {
public:
  ReliableEmbeddingProvider(std::unique_ptr<IEmbeddingProvider> inner,
                            providers::RetryPolicy policy,
                            std::shared_ptr<providers::CircuitBreaker> breaker,
                            providers::Sleeper sleeper = providers::sleep_for);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string model_id() const override;
  [[nodiscard]] std::size_t dimensions() const override;
  [[nodiscard]] common::Result<Vector> embed(std::string_view text) override;
  [[nodiscard]] common::Result<std::vector<Vector>>
  embed_batch(const std::vector<std::string> &texts) override;

private:
  template <typename T, typename Call> common::Result<T> run(Call &&call);

  std::unique_ptr<IEmbeddingProvider> inner_;
  providers::RetryPolicy policy_;
  std::shared_ptr<providers::CircuitBreaker> breaker_;
  providers::Sleeper sleeper_;
};

} // namespace newsdesk::embedding
