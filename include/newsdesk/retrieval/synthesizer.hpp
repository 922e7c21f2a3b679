#pragma once

#include "newsdesk/common/result.hpp"
#include "newsdesk/index/taxonomy.hpp"
#include "newsdesk/providers/traits.hpp"
#include "newsdesk/retrieval/retriever.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace newsdesk::retrieval {

enum class AnswerMode {
  Focused,
  AllCategories,
};

struct Answer {
  std::string text;
  /// Unicode code points in `text`.
  std::size_t character_count = 0;
  AnswerMode mode = AnswerMode::Focused;
  /// Fragments that made it into the model's context.
  std::size_t fragments_used = 0;
  std::vector<std::string> fragment_ids;
  std::vector<std::string> categories_with_data;
  std::vector<std::string> categories_empty;
  std::string model;
  bool llm_used = false;
};

struct SynthesizerOptions {
  std::string model = "gpt-4o-mini";
  double temperature = 0.3;
  std::uint32_t max_tokens = 2000;
  std::size_t context_max_chars = 18'000;
  std::optional<std::string> system_prompt;
};

class AnswerSynthesizer {
public:
  AnswerSynthesizer(std::shared_ptr<providers::Provider> provider,
                    index::CategoryTaxonomy taxonomy, SynthesizerOptions options);

  /// One LLM call over the retrieved fragments. SynthesisError when the call
  /// fails or returns nothing.
  [[nodiscard]] common::Result<Answer> answer(const Retrieval &retrieval) const;

  /// One section per taxonomy category; empty categories are marked as having
  /// no data. Skips the LLM entirely when every category is empty.
  [[nodiscard]] common::Result<Answer>
  answer_all_categories(const CategoryRetrieval &retrieval) const;

  [[nodiscard]] const SynthesizerOptions &options() const { return options_; }

private:
  [[nodiscard]] common::Result<std::string> complete(std::string system_prompt,
                                                     std::string message,
                                                     std::optional<std::uint32_t> max_tokens) const;

  std::shared_ptr<providers::Provider> provider_;
  index::CategoryTaxonomy taxonomy_;
  SynthesizerOptions options_;
};

struct Context {
  std::string text;
  /// Ids of the fragments rendered into `text`, in order.
  std::vector<std::string> document_ids;
};

/// Numbered fragment blocks joined by blank lines, stopping before the block
/// that would exceed `max_chars`.
[[nodiscard]] Context build_context(const std::vector<ScoredDocument> &fragments,
                                    std::size_t max_chars);

/// Per-category share of the context budget, never below 600 characters.
[[nodiscard]] std::size_t category_context_budget(std::size_t max_chars, std::size_t categories);

/// User-facing text for when synthesis is unavailable: a preview of up to
/// eight fragments.
[[nodiscard]] std::string render_unavailable(const std::string &query,
                                             const std::vector<ScoredDocument> &fragments);

} // namespace newsdesk::retrieval
