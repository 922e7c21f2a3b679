#include "newsdesk/retrieval/synthesizer.hpp"

#include "newsdesk/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace newsdesk::retrieval {

namespace {

constexpr std::size_t kMinCategoryBudget = 600;
constexpr std::size_t kPreviewFragments = 8;
constexpr std::size_t kPreviewChars = 220;

constexpr const char *kFocusedSystemPrompt =
    "You are a news analyst. Answer briefly and clearly. "
    "Use only the supplied fragments. If the data is incomplete, say what is missing.";

constexpr const char *kBriefingSystemPrompt =
    "You are an experienced business journalist preparing a morning briefing for executives. "
    "Write professional, concise prose with numbers, dates, companies and people when available. "
    "Do not use bullet points. Each category is its own paragraph of 2-4 sentences. "
    "You MUST cover EVERY listed category, even when it has no information. "
    "Never move facts from one category into another. Use ONLY the supplied context.";

std::string upper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](const unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
  return value;
}

} // namespace

Context build_context(const std::vector<ScoredDocument> &fragments,
                      const std::size_t max_chars) {
  Context context;
  std::vector<std::string> blocks;
  std::size_t total = 0;

  for (std::size_t i = 0; i < fragments.size(); ++i) {
    const auto &doc = fragments[i].document;
    const std::string text = common::trim(doc.text);
    if (text.empty()) {
      continue;
    }

    std::ostringstream block;
    block << "Fragment " << (i + 1) << " (cat=" << doc.category << ", chunk=" << doc.chunk_index
          << ")\n";
    block << "Title: " << doc.title.value_or("untitled") << "\n";
    block << "URL: " << doc.source_url.value_or("") << "\n";
    block << text;

    std::string chunk = block.str();
    if (total + chunk.size() > max_chars) {
      break;
    }
    total += chunk.size();
    blocks.push_back(std::move(chunk));
    context.document_ids.push_back(doc.id);
  }

  std::string out;
  for (std::size_t i = 0; i < blocks.size(); ++i) {
    if (i > 0) {
      out += "\n\n";
    }
    out += blocks[i];
  }
  context.text = common::trim(out);
  return context;
}

std::size_t category_context_budget(const std::size_t max_chars, const std::size_t categories) {
  const std::size_t share = max_chars / std::max<std::size_t>(categories, 1);
  return std::max(share, kMinCategoryBudget);
}

std::string render_unavailable(const std::string &query,
                               const std::vector<ScoredDocument> &fragments) {
  std::ostringstream out;
  out << "Answer synthesis is currently unavailable. Found " << fragments.size()
      << " fragments.\n";
  out << "Question: " << query << "\n";

  const std::size_t shown = std::min(fragments.size(), kPreviewFragments);
  for (std::size_t i = 0; i < shown; ++i) {
    const auto &doc = fragments[i].document;
    std::string content = common::trim(doc.text);
    if (common::utf8_length(content) > kPreviewChars) {
      content = common::trim(common::utf8_truncate(content, kPreviewChars)) + "\xE2\x80\xA6";
    }
    out << "\n- (" << doc.category << ", chunk=" << doc.chunk_index << ") "
        << doc.title.value_or("untitled") << " | " << doc.source_url.value_or("") << "\n  "
        << content;
  }

  if (fragments.size() > shown) {
    out << "\n\n... +" << (fragments.size() - shown) << " more fragments";
  }
  return out.str();
}

AnswerSynthesizer::AnswerSynthesizer(std::shared_ptr<providers::Provider> provider,
                                     index::CategoryTaxonomy taxonomy,
                                     SynthesizerOptions options)
    : provider_(std::move(provider)), taxonomy_(std::move(taxonomy)),
      options_(std::move(options)) {}

common::Result<std::string>
AnswerSynthesizer::complete(std::string system_prompt, std::string message,
                            const std::optional<std::uint32_t> max_tokens) const {
  providers::ChatRequest request{
      .model = options_.model,
      .system_prompt = options_.system_prompt.value_or(std::move(system_prompt)),
      .message = std::move(message),
      .temperature = options_.temperature,
      .max_tokens = max_tokens,
  };

  auto completion = provider_->chat(request);
  if (!completion.ok()) {
    return common::Result<std::string>::failure(common::ErrorCode::SynthesisError,
                                                "language model call failed: " +
                                                    completion.error());
  }
  std::string text = common::trim(completion.value());
  if (text.empty()) {
    return common::Result<std::string>::failure(common::ErrorCode::SynthesisError,
                                                "language model returned an empty completion");
  }
  return common::Result<std::string>::success(std::move(text));
}

common::Result<Answer> AnswerSynthesizer::answer(const Retrieval &retrieval) const {
  Context context = build_context(retrieval.results, options_.context_max_chars);
  if (context.document_ids.empty()) {
    return common::Result<Answer>::failure(common::ErrorCode::SynthesisError,
                                           "no fragments fit the context budget");
  }

  std::ostringstream message;
  message << "User question:\n" << retrieval.query << "\n\n";
  message << "Fragments from the knowledge base:\n" << context.text << "\n\n";
  message << "Write a plain-language answer in 4-8 sentences. "
             "If it fits, add 3 short bullet points with the key facts.";

  auto text = complete(kFocusedSystemPrompt, message.str(), std::nullopt);
  if (!text.ok()) {
    return common::Result<Answer>::failure(text.error_detail());
  }

  Answer answer{
      .text = std::move(text.value()),
      .mode = AnswerMode::Focused,
      .fragments_used = context.document_ids.size(),
      .fragment_ids = std::move(context.document_ids),
      .model = options_.model,
      .llm_used = true,
  };
  answer.character_count = common::utf8_length(answer.text);
  const auto included = [&answer](const ScoredDocument &r) {
    return std::find(answer.fragment_ids.begin(), answer.fragment_ids.end(), r.document.id) !=
           answer.fragment_ids.end();
  };
  for (const auto &category : taxonomy_.names()) {
    const bool present =
        std::any_of(retrieval.results.begin(), retrieval.results.end(),
                    [&](const auto &r) { return r.document.category == category && included(r); });
    (present ? answer.categories_with_data : answer.categories_empty).push_back(category);
  }
  return common::Result<Answer>::success(std::move(answer));
}

common::Result<Answer>
AnswerSynthesizer::answer_all_categories(const CategoryRetrieval &retrieval) const {
  const std::size_t budget =
      category_context_budget(options_.context_max_chars, retrieval.sections.size());

  Answer answer{.mode = AnswerMode::AllCategories, .model = options_.model};
  std::ostringstream sources;
  std::string category_list;
  for (std::size_t i = 0; i < retrieval.sections.size(); ++i) {
    const auto &section = retrieval.sections[i];
    Context context;
    if (!section.empty) {
      context = build_context(section.results, std::min(options_.context_max_chars, budget));
    }

    if (i > 0) {
      sources << "\n\n";
      category_list += ", ";
    }
    category_list += section.category;
    sources << "### " << upper(section.category) << " ###\n";
    if (context.document_ids.empty()) {
      sources << "(NO DATA - state that there is no information)";
      answer.categories_empty.push_back(section.category);
    } else {
      sources << context.text;
      answer.categories_with_data.push_back(section.category);
      answer.fragments_used += context.document_ids.size();
      answer.fragment_ids.insert(answer.fragment_ids.end(), context.document_ids.begin(),
                                 context.document_ids.end());
    }
  }

  if (answer.categories_with_data.empty()) {
    std::ostringstream text;
    for (std::size_t i = 0; i < retrieval.sections.size(); ++i) {
      if (i > 0) {
        text << "\n\n";
      }
      text << upper(retrieval.sections[i].category) << "\nNo new information in this category.";
    }
    answer.text = text.str();
    answer.character_count = common::utf8_length(answer.text);
    return common::Result<Answer>::success(std::move(answer));
  }

  const std::size_t count = retrieval.sections.size();
  std::ostringstream message;
  message << "Prepare a professional news summary. You MUST cover ALL categories.\n\n";
  message << "CATEGORIES TO COVER (" << count << "): " << category_list << "\n\n";
  message << "SOURCES (per category):\n" << sources.str() << "\n\n";
  message << "INSTRUCTIONS:\n";
  message << "1. Write a summary for EACH of the " << count << " categories listed above, "
          << "in the listed order\n";
  message << "2. Start each section with the category name\n";
  message << "3. Write 2-4 sentences of flowing prose per category (NO bullet points)\n";
  message << "4. If a category is marked '(NO DATA)', write: 'No new information in this "
             "category.'\n";
  message << "5. Include numbers, dates and company names when available\n";
  message << "6. Use each category's sources only for that category\n\n";
  message << "IMPORTANT: The answer MUST contain a section for EVERY category!";

  auto text = complete(kBriefingSystemPrompt, message.str(), options_.max_tokens);
  if (!text.ok()) {
    return common::Result<Answer>::failure(text.error_detail());
  }
  answer.text = std::move(text.value());
  answer.character_count = common::utf8_length(answer.text);
  answer.llm_used = true;
  return common::Result<Answer>::success(std::move(answer));
}

} // namespace newsdesk::retrieval
