#include "newsdesk/embedding/local_hash_embedder.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>

namespace newsdesk::embedding {

namespace {

std::uint64_t fnv1a(const std::string_view text) {
  std::uint64_t hash = 14695981039346656037ULL;
  for (const char ch : text) {
    hash ^= static_cast<unsigned char>(ch);
    hash *= 1099511628211ULL;
  }
  return hash;
}

void add_feature(Vector &values, const std::string_view feature, const float weight) {
  const std::uint64_t hash = fnv1a(feature);
  const std::size_t idx = static_cast<std::size_t>(hash % values.size());
  // Top bit picks the sign so unrelated features tend to cancel.
  const float sign = (hash >> 63U) != 0 ? -1.0F : 1.0F;
  values[idx] += sign * weight;
}

void normalize(Vector &values) {
  double norm = 0.0;
  for (const float v : values) {
    norm += static_cast<double>(v) * static_cast<double>(v);
  }
  norm = std::sqrt(norm);
  if (norm < 1e-9) {
    return;
  }
  for (float &v : values) {
    v = static_cast<float>(static_cast<double>(v) / norm);
  }
}

} // namespace

LocalHashEmbedder::LocalHashEmbedder(const std::size_t dimensions)
    : dimensions_(dimensions == 0 ? kDefaultDimensions : dimensions) {}

std::string_view LocalHashEmbedder::name() const { return "local_hash"; }

std::string LocalHashEmbedder::model_id() const {
  return "local-hash-" + std::to_string(dimensions_);
}

std::size_t LocalHashEmbedder::dimensions() const { return dimensions_; }

common::Result<Vector> LocalHashEmbedder::embed(const std::string_view text) {
  Vector values(dimensions_, 0.0F);

  std::string word;
  const auto flush_word = [&]() {
    if (word.empty()) {
      return;
    }
    add_feature(values, word, 1.0F);
    const std::string padded = "#" + word + "#";
    for (std::size_t i = 0; i + 3 <= padded.size(); ++i) {
      add_feature(values, std::string_view(padded).substr(i, 3), 0.5F);
    }
    word.clear();
  };

  for (const char ch : text) {
    const auto byte = static_cast<unsigned char>(ch);
    // Bytes >= 0x80 belong to multi-byte UTF-8 sequences and stay in the word.
    if (std::isalnum(byte) != 0 || byte >= 0x80) {
      word.push_back(static_cast<char>(std::tolower(byte)));
    } else {
      flush_word();
    }
  }
  flush_word();

  normalize(values);
  return common::Result<Vector>::success(std::move(values));
}

common::Result<std::vector<Vector>>
LocalHashEmbedder::embed_batch(const std::vector<std::string> &texts) {
  std::vector<Vector> out;
  out.reserve(texts.size());
  for (const auto &text : texts) {
    auto emb = embed(text);
    if (!emb.ok()) {
      return common::Result<std::vector<Vector>>::failure(emb.error_detail());
    }
    out.push_back(std::move(emb.value()));
  }
  return common::Result<std::vector<Vector>>::success(std::move(out));
}

} // namespace newsdesk::embedding
