#pragma once

#include "newsdesk/common/result.hpp"
#include "newsdesk/config/schema.hpp"
#include "newsdesk/providers/traits.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace newsdesk::embedding {

using Vector = std::vector<float>;

class IEmbeddingProvider {
public:
  virtual ~IEmbeddingProvider() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  /// Identifies the vector space; persisted indexes are only loadable under the same id.
  [[nodiscard]] virtual std::string model_id() const = 0;
  [[nodiscard]] virtual std::size_t dimensions() const = 0;
  [[nodiscard]] virtual common::Result<Vector> embed(std::string_view text) = 0;
  [[nodiscard]] virtual common::Result<std::vector<Vector>>
  embed_batch(const std::vector<std::string> &texts) = 0;
};

enum class EmbeddingStrategy {
  OpenAi,
  LocalHash,
};

[[nodiscard]] common::Result<EmbeddingStrategy> parse_embedding_strategy(const std::string &name);

/// Builds the provider named by [embedding].strategy. The remote strategy comes
/// wrapped in retries and a circuit breaker.
[[nodiscard]] common::Result<std::unique_ptr<IEmbeddingProvider>>
create_embedding_provider(const config::Config &config,
                          std::shared_ptr<providers::HttpClient> http_client = nullptr);

} // namespace newsdesk::embedding
