#include "newsdesk/embedding/provider.hpp"

#include "newsdesk/common/fs.hpp"
#include "newsdesk/embedding/local_hash_embedder.hpp"
#include "newsdesk/embedding/openai_embedder.hpp"
#include "newsdesk/embedding/reliable_embedder.hpp"
#include "newsdesk/providers/factory.hpp"

namespace newsdesk::embedding {

common::Result<EmbeddingStrategy> parse_embedding_strategy(const std::string &name) {
  const std::string normalized = common::to_lower(common::trim(name));
  if (normalized == "openai") {
    return common::Result<EmbeddingStrategy>::success(EmbeddingStrategy::OpenAi);
  }
  if (normalized == "local_hash") {
    return common::Result<EmbeddingStrategy>::success(EmbeddingStrategy::LocalHash);
  }
  return common::Result<EmbeddingStrategy>::failure(common::ErrorCode::ConfigurationError,
                                                    "unknown embedding strategy: " + name);
}

common::Result<std::unique_ptr<IEmbeddingProvider>>
create_embedding_provider(const config::Config &config,
                          std::shared_ptr<providers::HttpClient> http_client) {
  using ProviderResult = common::Result<std::unique_ptr<IEmbeddingProvider>>;

  auto strategy = parse_embedding_strategy(config.embedding.strategy);
  if (!strategy.ok()) {
    return ProviderResult::failure(strategy.error_detail());
  }

  if (strategy.value() == EmbeddingStrategy::LocalHash) {
    return ProviderResult::success(
        std::make_unique<LocalHashEmbedder>(LocalHashEmbedder::kDefaultDimensions));
  }

  if (!config.api_key.has_value() || config.api_key->empty()) {
    return ProviderResult::failure(common::ErrorCode::ConfigurationError,
                                   "embedding strategy 'openai' requires an API key");
  }
  if (!http_client) {
    http_client = std::make_shared<providers::CurlHttpClient>();
  }

  auto remote = std::make_unique<OpenAiEmbedder>(
      OpenAiEmbedderOptions{.api_key = *config.api_key,
                            .model = config.embedding.model,
                            .dimensions = config.embedding.dimensions,
                            .base_url = config.embedding.base_url,
                            .timeout_ms = config.embedding.timeout_ms,
                            .batch_size = config.embedding.batch_size},
      std::move(http_client));
  auto breaker = std::make_shared<providers::CircuitBreaker>(
      "embedding", providers::breaker_options_from(config.reliability));

  return ProviderResult::success(std::make_unique<ReliableEmbeddingProvider>(
      std::move(remote), providers::retry_policy_from(config.reliability), std::move(breaker)));
}

} // namespace newsdesk::embedding
