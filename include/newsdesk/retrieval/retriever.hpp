#pragma once

#include "newsdesk/common/result.hpp"
#include "newsdesk/embedding/cache.hpp"
#include "newsdesk/index/index_state.hpp"
#include "newsdesk/index/taxonomy.hpp"

#include <memory>
#include <string>
#include <vector>

namespace newsdesk::retrieval {

struct ScoredDocument {
  index::Document document;
  float score = 0.0F;
};

struct Retrieval {
  std::string query;
  std::vector<ScoredDocument> results;
};

struct CategorySection {
  std::string category;
  std::vector<ScoredDocument> results;
  /// True when the category has no documents in the index.
  bool empty = true;
};

struct CategoryRetrieval {
  std::string query;
  /// One section per taxonomy category, in taxonomy order.
  std::vector<CategorySection> sections;

  [[nodiscard]] std::size_t fragment_count() const;
  [[nodiscard]] std::vector<ScoredDocument> fragments() const;
};

class Retriever {
public:
  Retriever(index::CategoryTaxonomy taxonomy, std::shared_ptr<embedding::EmbeddingCache> cache);

  /// Top `k` documents by cosine similarity. Ties go to the most recently
  /// ingested document, then to the smaller id.
  [[nodiscard]] common::Result<Retrieval> search(const index::IndexState &state,
                                                 const std::string &query, std::size_t k) const;

  [[nodiscard]] common::Result<CategoryRetrieval>
  search_all_categories(const index::IndexState &state, const std::string &query,
                        std::size_t per_category_k) const;

  [[nodiscard]] const index::CategoryTaxonomy &taxonomy() const { return taxonomy_; }

private:
  [[nodiscard]] common::Result<std::vector<float>> embed_query(const index::IndexState &state,
                                                               const std::string &query) const;

  index::CategoryTaxonomy taxonomy_;
  std::shared_ptr<embedding::EmbeddingCache> cache_;
};

} // namespace newsdesk::retrieval
