#pragma once

#include "newsdesk/common/result.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace newsdesk::index {

struct VectorMatch {
  std::string key;
  float score = 0.0F;
};

/// Brute-force cosine index. Copies share the stored vectors.
class VectorIndex {
public:
  explicit VectorIndex(std::size_t dimensions = 0);

  [[nodiscard]] common::Status add(const std::string &key, std::vector<float> embedding);
  bool remove(const std::string &key);
  void clear();

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t dimensions() const { return dimensions_; }
  [[nodiscard]] bool contains(const std::string &key) const;
  [[nodiscard]] const std::vector<float> *get(const std::string &key) const;

  /// Cosine similarity of `query` against every key accepted by `filter`
  /// (all keys when empty). Unordered.
  [[nodiscard]] common::Result<std::vector<VectorMatch>>
  score(const std::vector<float> &query,
        const std::function<bool(const std::string &)> &filter = {}) const;

  [[nodiscard]] common::Status save(const std::filesystem::path &path) const;
  [[nodiscard]] static common::Result<VectorIndex> load(const std::filesystem::path &path);

private:
  std::size_t dimensions_;
  std::unordered_map<std::string, std::shared_ptr<const std::vector<float>>> vectors_;
};

[[nodiscard]] float cosine_similarity(const std::vector<float> &a, const std::vector<float> &b);

} // namespace newsdesk::index
