#include "newsdesk/retrieval/retriever.hpp"

#include "newsdesk/common/fs.hpp"

#include <algorithm>

namespace newsdesk::retrieval {

namespace {

struct Candidate {
  const index::Document *document = nullptr;
  float score = 0.0F;
};

bool ranks_before(const Candidate &lhs, const Candidate &rhs) {
  if (lhs.score != rhs.score) {
    return lhs.score > rhs.score;
  }
  if (lhs.document->ingested_at != rhs.document->ingested_at) {
    return lhs.document->ingested_at > rhs.document->ingested_at;
  }
  if (lhs.document->sequence != rhs.document->sequence) {
    return lhs.document->sequence > rhs.document->sequence;
  }
  return lhs.document->id < rhs.document->id;
}

std::vector<ScoredDocument> top_k(const index::IndexState &state,
                                  const std::vector<index::VectorMatch> &matches,
                                  const std::size_t k) {
  std::vector<Candidate> candidates;
  candidates.reserve(matches.size());
  for (const auto &match : matches) {
    if (const auto *doc = state.documents.get(match.key); doc != nullptr) {
      candidates.push_back(Candidate{.document = doc, .score = match.score});
    }
  }

  const std::size_t limit = std::min(k, candidates.size());
  std::partial_sort(candidates.begin(), candidates.begin() + static_cast<std::ptrdiff_t>(limit),
                    candidates.end(), ranks_before);

  std::vector<ScoredDocument> out;
  out.reserve(limit);
  for (std::size_t i = 0; i < limit; ++i) {
    out.push_back(ScoredDocument{.document = *candidates[i].document, .score = candidates[i].score});
  }
  return out;
}

} // namespace

std::size_t CategoryRetrieval::fragment_count() const {
  std::size_t count = 0;
  for (const auto &section : sections) {
    count += section.results.size();
  }
  return count;
}

std::vector<ScoredDocument> CategoryRetrieval::fragments() const {
  std::vector<ScoredDocument> out;
  out.reserve(fragment_count());
  for (const auto &section : sections) {
    out.insert(out.end(), section.results.begin(), section.results.end());
  }
  return out;
}

Retriever::Retriever(index::CategoryTaxonomy taxonomy,
                     std::shared_ptr<embedding::EmbeddingCache> cache)
    : taxonomy_(std::move(taxonomy)), cache_(std::move(cache)) {}

common::Result<std::vector<float>> Retriever::embed_query(const index::IndexState &state,
                                                          const std::string &query) const {
  auto vector = cache_->get_or_compute(query);
  if (!vector.ok()) {
    return vector;
  }
  if (vector.value().size() != state.vectors.dimensions()) {
    return common::Result<std::vector<float>>::failure(
        common::ErrorCode::ProviderUnavailable,
        "query embedding has " + std::to_string(vector.value().size()) +
            " dimensions, index has " + std::to_string(state.vectors.dimensions()));
  }
  return vector;
}

common::Result<Retrieval> Retriever::search(const index::IndexState &state,
                                            const std::string &query, const std::size_t k) const {
  if (common::trim(query).empty()) {
    return common::Result<Retrieval>::failure(common::ErrorCode::InvalidArgument,
                                              "query is empty");
  }
  if (k == 0) {
    return common::Result<Retrieval>::failure(common::ErrorCode::InvalidArgument,
                                              "k must be at least 1");
  }
  if (state.documents.empty()) {
    return common::Result<Retrieval>::failure(common::ErrorCode::EmptyIndex,
                                              "index contains no documents");
  }

  auto vector = embed_query(state, query);
  if (!vector.ok()) {
    return common::Result<Retrieval>::failure(vector.error_detail());
  }
  auto matches = state.vectors.score(vector.value());
  if (!matches.ok()) {
    return common::Result<Retrieval>::failure(matches.error_detail());
  }

  return common::Result<Retrieval>::success(
      Retrieval{.query = query, .results = top_k(state, matches.value(), k)});
}

common::Result<CategoryRetrieval>
Retriever::search_all_categories(const index::IndexState &state, const std::string &query,
                                 const std::size_t per_category_k) const {
  if (common::trim(query).empty()) {
    return common::Result<CategoryRetrieval>::failure(common::ErrorCode::InvalidArgument,
                                                      "query is empty");
  }
  if (per_category_k == 0) {
    return common::Result<CategoryRetrieval>::failure(common::ErrorCode::InvalidArgument,
                                                      "per_category_k must be at least 1");
  }

  CategoryRetrieval retrieval{.query = query};
  retrieval.sections.reserve(taxonomy_.size());
  for (const auto &category : taxonomy_.names()) {
    retrieval.sections.push_back(CategorySection{.category = category});
  }
  if (state.documents.empty()) {
    return common::Result<CategoryRetrieval>::success(std::move(retrieval));
  }

  auto vector = embed_query(state, query);
  if (!vector.ok()) {
    return common::Result<CategoryRetrieval>::failure(vector.error_detail());
  }

  auto matches = state.vectors.score(vector.value());
  if (!matches.ok()) {
    return common::Result<CategoryRetrieval>::failure(matches.error_detail());
  }
  std::vector<std::vector<index::VectorMatch>> by_category(taxonomy_.size());
  for (auto &match : matches.value()) {
    const auto *doc = state.documents.get(match.key);
    if (doc == nullptr) {
      continue;
    }
    // Documents outside the taxonomy never fill another category's section.
    if (const auto slot = taxonomy_.index_of(doc->category); slot.has_value()) {
      by_category[*slot].push_back(std::move(match));
    }
  }

  for (std::size_t i = 0; i < retrieval.sections.size(); ++i) {
    auto &section = retrieval.sections[i];
    section.results = top_k(state, by_category[i], per_category_k);
    section.empty = section.results.empty();
  }

  return common::Result<CategoryRetrieval>::success(std::move(retrieval));
}

} // namespace newsdesk::retrieval
