#include "newsdesk/embedding/openai_embedder.hpp"

#include "newsdesk/common/fs.hpp"
#include "newsdesk/common/json_util.hpp"

#include <algorithm>
#include <cstdlib>
#include <sstream>

namespace newsdesk::embedding {

namespace {

common::Result<Vector> parse_embedding_values(const std::string &array_json) {
  if (array_json.size() < 2) {
    return common::Result<Vector>::failure("embedding array missing");
  }

  Vector values;
  std::stringstream stream(array_json.substr(1, array_json.size() - 2));
  std::string item;
  while (std::getline(stream, item, ',')) {
    const std::string trimmed = common::trim(item);
    char *end = nullptr;
    const float value = std::strtof(trimmed.c_str(), &end);
    if (trimmed.empty() || end != trimmed.c_str() + trimmed.size()) {
      return common::Result<Vector>::failure("invalid embedding value '" + trimmed + "'");
    }
    values.push_back(value);
  }
  return common::Result<Vector>::success(std::move(values));
}

common::Error unavailable(const std::string &message) {
  return providers::provider_unavailable(providers::ProviderError{
      .code = providers::ProviderErrorCode::InvalidResponse, .message = message});
}

} // namespace

OpenAiEmbedder::OpenAiEmbedder(OpenAiEmbedderOptions options,
                               std::shared_ptr<providers::HttpClient> http_client)
    : options_(std::move(options)), http_client_(std::move(http_client)) {
  while (!options_.base_url.empty() && options_.base_url.back() == '/') {
    options_.base_url.pop_back();
  }
  if (options_.batch_size == 0) {
    options_.batch_size = 1;
  }
}

std::string_view OpenAiEmbedder::name() const { return "openai"; }

std::string OpenAiEmbedder::model_id() const { return options_.model; }

std::size_t OpenAiEmbedder::dimensions() const { return options_.dimensions; }

std::string OpenAiEmbedder::build_body(const std::vector<std::string> &texts) const {
  std::ostringstream body;
  body << "{";
  body << "\"model\":\"" << common::json_escape(options_.model) << "\",";
  body << "\"input\":" << common::json_string_array(texts);
  // Only the text-embedding-3 family accepts a reduced output size.
  if (common::starts_with(options_.model, "text-embedding-3")) {
    body << ",\"dimensions\":" << options_.dimensions;
  }
  body << "}";
  return body.str();
}

common::Result<std::vector<Vector>>
OpenAiEmbedder::request_batch(const std::vector<std::string> &texts) {
  using BatchResult = common::Result<std::vector<Vector>>;

  if (options_.api_key.empty()) {
    return BatchResult::failure(providers::provider_unavailable(providers::ProviderError{
        .code = providers::ProviderErrorCode::AuthError, .message = "missing API key"}));
  }

  const providers::HttpHeaders headers = {
      {"Content-Type", "application/json"},
      {"Authorization", "Bearer " + options_.api_key},
  };
  const auto response = http_client_->post_json(options_.base_url + "/embeddings", headers,
                                                 build_body(texts), options_.timeout_ms);
  if (const auto error = providers::classify_response(response); error.has_value()) {
    return BatchResult::failure(providers::provider_unavailable(*error));
  }

  const std::string data = common::json_get_array(response.body, "data");
  const auto objects = common::json_split_top_level_objects(data);
  if (objects.size() != texts.size()) {
    return BatchResult::failure(unavailable("expected " + std::to_string(texts.size()) +
                                            " embeddings, got " +
                                            std::to_string(objects.size())));
  }

  std::vector<Vector> out(texts.size());
  std::vector<bool> filled(texts.size(), false);
  for (std::size_t i = 0; i < objects.size(); ++i) {
    const std::string index_text = common::json_get_number(objects[i], "index");
    std::size_t index = i;
    if (!index_text.empty()) {
      char *end = nullptr;
      const unsigned long long parsed = std::strtoull(index_text.c_str(), &end, 10);
      if (end != index_text.c_str() + index_text.size() || parsed >= texts.size()) {
        return BatchResult::failure(unavailable("invalid embedding index " + index_text));
      }
      index = static_cast<std::size_t>(parsed);
    }
    if (filled[index]) {
      return BatchResult::failure(unavailable("duplicate embedding index " + index_text));
    }

    auto values = parse_embedding_values(common::json_get_array(objects[i], "embedding"));
    if (!values.ok()) {
      return BatchResult::failure(unavailable(values.error()));
    }
    if (values.value().size() != options_.dimensions) {
      return BatchResult::failure(unavailable(
          "embedding has " + std::to_string(values.value().size()) + " dimensions, expected " +
          std::to_string(options_.dimensions)));
    }
    out[index] = std::move(values.value());
    filled[index] = true;
  }

  return BatchResult::success(std::move(out));
}

common::Result<Vector> OpenAiEmbedder::embed(const std::string_view text) {
  auto batch = request_batch({std::string(text)});
  if (!batch.ok()) {
    return common::Result<Vector>::failure(batch.error_detail());
  }
  return common::Result<Vector>::success(std::move(batch.value().front()));
}

common::Result<std::vector<Vector>>
OpenAiEmbedder::embed_batch(const std::vector<std::string> &texts) {
  std::vector<Vector> out;
  out.reserve(texts.size());
  for (std::size_t start = 0; start < texts.size(); start += options_.batch_size) {
    const std::size_t end = std::min(texts.size(), start + options_.batch_size);
    const std::vector<std::string> slice(texts.begin() + static_cast<std::ptrdiff_t>(start),
                                         texts.begin() + static_cast<std::ptrdiff_t>(end));
    auto batch = request_batch(slice);
    if (!batch.ok()) {
      return batch;
    }
    for (auto &vector : batch.value()) {
      out.push_back(std::move(vector));
    }
  }
  return common::Result<std::vector<Vector>>::success(std::move(out));
}

} // namespace newsdesk::embedding
