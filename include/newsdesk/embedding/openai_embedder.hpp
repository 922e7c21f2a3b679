#pragma once

#include "newsdesk/embedding/provider.hpp"

namespace newsdesk::embedding {

struct OpenAiEmbedderOptions {
  std::string api_key;
  std::string model = "text-embedding-3-large";
  std::size_t dimensions = 3072;
  std::string base_url = "https://api.openai.com/v1";
  std::uint64_t timeout_ms = 30'000;
  std::size_t batch_size = 128;
};

class OpenAiEmbedder final : public IEmbeddingProvider {
public:
  OpenAiEmbedder(OpenAiEmbedderOptions options,
                 std::shared_ptr<providers::HttpClient> http_client);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string model_id() const override;
  [[nodiscard]] std::size_t dimensions() const override;
  [[nodiscard]] common::Result<Vector> embed(std::string_view text) override;
  [[nodiscard]] common::Result<std::vector<Vector>>
  embed_batch(const std::vector<std::string> &texts) override;

  [[nodiscard]] std::string build_body(const std::vector<std::string> &texts) const;

private:
  [[nodiscard]] common::Result<std::vector<Vector>>
  request_batch(const std::vector<std::string> &texts);

  OpenAiEmbedderOptions options_;
  std::shared_ptr<providers::HttpClient> http_client_;
};

} // namespace newsdesk::embedding
