#pragma once

#include "newsdesk/embedding/provider.hpp"

namespace newsdesk::embedding {

/// Offline embedder: hashes lowercased words and character trigrams into a
/// fixed number of buckets and L2-normalizes. Deterministic across platforms.
class LocalHashEmbedder final : public IEmbeddingProvider {
public:
  static constexpr std::size_t kDefaultDimensions = 384;

  explicit LocalHashEmbedder(std::size_t dimensions = kDefaultDimensions);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string model_id() const override;
  [[nodiscard]] std::size_t dimensions() const override;
  [[nodiscard]] common::Result<Vector> embed(std::string_view text) override;
  [[nodiscard]] common::Result<std::vector<Vector>>
  embed_batch(const std::vector<std::string> &texts) override;

private:
  std::size_t dimensions_;
};

} // namespace newsdesk::embedding
