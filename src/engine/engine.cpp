#include "newsdesk/engine/engine.hpp"

#include "newsdesk/common/fs.hpp"
#include "newsdesk/config/config.hpp"
#include "newsdesk/index/chunker.hpp"
#include "newsdesk/observability/global.hpp"
#include "newsdesk/providers/factory.hpp"

#include <unordered_map>

namespace newsdesk::engine {

namespace {

std::optional<std::string> non_empty(const std::optional<std::string> &value) {
  if (!value.has_value()) {
    return std::nullopt;
  }
  std::string trimmed = common::trim(*value);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  return trimmed;
}

std::chrono::milliseconds elapsed_since(const common::SteadyClock &clock,
                                        const std::chrono::steady_clock::time_point started) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(clock() - started);
}

} // namespace

common::Result<std::unique_ptr<Engine>> Engine::create(const config::Config &config) {
  auto embedder = embedding::create_embedding_provider(config);
  if (!embedder.ok()) {
    return common::Result<std::unique_ptr<Engine>>::failure(embedder.error_detail());
  }
  auto chat = providers::create_chat_provider(config);
  if (!chat.ok()) {
    return common::Result<std::unique_ptr<Engine>>::failure(chat.error_detail());
  }

  return create(config, EngineDependencies{.embedder = std::move(embedder.value()),
                                           .chat_provider = std::move(chat.value())});
}

common::Result<std::unique_ptr<Engine>> Engine::create(const config::Config &config,
                                                       EngineDependencies dependencies) {
  using EngineResult = common::Result<std::unique_ptr<Engine>>;

  auto validation = config::validate_config(config);
  if (!validation.ok()) {
    return EngineResult::failure(validation.error_detail());
  }
  for (const auto &warning : validation.value()) {
    observability::record_warning("config", warning);
  }

  if (!dependencies.embedder) {
    return EngineResult::failure(common::ErrorCode::ConfigurationError,
                                 "no embedding provider configured");
  }
  if (!dependencies.chat_provider) {
    return EngineResult::failure(common::ErrorCode::ConfigurationError,
                                 "no chat provider configured");
  }
  if (!dependencies.wall_clock || !dependencies.steady_clock) {
    return EngineResult::failure(common::ErrorCode::ConfigurationError, "clocks must be set");
  }

  auto taxonomy = index::CategoryTaxonomy::create(config.taxonomy.categories);
  if (!taxonomy.ok()) {
    return EngineResult::failure(taxonomy.error_detail());
  }

  return EngineResult::success(std::unique_ptr<Engine>(
      new Engine(config, std::move(taxonomy.value()), std::move(dependencies))));
}

Engine::Engine(const config::Config &config, index::CategoryTaxonomy taxonomy,
               EngineDependencies dependencies)
    : config_(config), taxonomy_(std::move(taxonomy)), dependencies_(std::move(dependencies)),
      cache_(std::make_shared<embedding::EmbeddingCache>(
          dependencies_.embedder,
          embedding::CacheOptions{.capacity = config.cache.capacity,
                                  .ttl = std::chrono::seconds(config.cache.ttl_seconds)},
          dependencies_.steady_clock)),
      retriever_(taxonomy_, cache_),
      synthesizer_(dependencies_.chat_provider, taxonomy_,
                   retrieval::SynthesizerOptions{
                       .model = config.llm.model,
                       .temperature = config.llm.temperature,
                       .max_tokens = config.llm.max_tokens,
                       .context_max_chars = config.retrieval.context_max_chars,
                   }),
      persistence_(common::expand_path(config.persistence.root), config.persistence.keep_snapshots,
                   dependencies_.wall_clock),
      backup_(persistence_, config.backup.max_bundle_bytes), state_(empty_state()) {}

std::shared_ptr<index::IndexState> Engine::empty_state() const {
  auto state = std::make_shared<index::IndexState>();
  state->vectors = index::VectorIndex(dependencies_.embedder->dimensions());
  state->embedding_model = dependencies_.embedder->model_id();
  return state;
}

std::shared_ptr<const index::IndexState> Engine::snapshot() const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  return state_;
}

void Engine::publish(std::shared_ptr<const index::IndexState> next, const std::size_t added,
                     const std::size_t removed) {
  const auto documents = next->size();
  {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    state_ = std::move(next);
  }
  observability::record_index_published(documents, added, removed);
}

persistence::LoadExpectations Engine::load_expectations() const {
  return persistence::LoadExpectations{.embedding_model = dependencies_.embedder->model_id(),
                                       .dimensions = dependencies_.embedder->dimensions()};
}

common::Result<index::Document> Engine::make_document(const index::DocumentInput &input,
                                                      const std::size_t chunk_index) const {
  std::string text = common::trim(input.text);
  if (text.empty()) {
    return common::Result<index::Document>::failure(common::ErrorCode::InvalidArgument,
                                                    "document text is empty");
  }
  std::string category = common::trim(input.category);
  if (!taxonomy_.contains(category)) {
    return common::Result<index::Document>::failure(common::ErrorCode::InvalidArgument,
                                                    "unknown category: " + input.category);
  }

  const std::string hash = index::content_hash_for(text);
  return common::Result<index::Document>::success(index::Document{
      .id = index::document_id_for(hash),
      .text = std::move(text),
      .category = std::move(category),
      .source_url = non_empty(input.source_url),
      .title = non_empty(input.title),
      .chunk_index = chunk_index,
      .content_hash = hash,
      .ingested_at = common::format_rfc3339(dependencies_.wall_clock()),
  });
}

common::Result<Engine::PreparedBatch>
Engine::apply_batch(index::IndexState &target, const index::IndexState *previous,
                    const std::vector<index::Document> &candidates) const {
  using BatchResult = common::Result<PreparedBatch>;

  PreparedBatch batch;
  std::vector<const index::Document *> fresh;
  std::unordered_map<std::string, std::string> batch_ids;
  for (const auto &doc : candidates) {
    if (const auto existing = target.documents.find_by_hash(doc.content_hash);
        existing.has_value()) {
      batch.ids.push_back(*existing);
      ++batch.duplicates;
      continue;
    }
    if (const auto seen = batch_ids.find(doc.content_hash); seen != batch_ids.end()) {
      batch.ids.push_back(seen->second);
      ++batch.duplicates;
      continue;
    }
    batch_ids.emplace(doc.content_hash, doc.id);
    batch.ids.push_back(doc.id);
    fresh.push_back(&doc);
  }

  // Vectors of documents the previous state already held are reused as-is.
  std::vector<std::optional<std::vector<float>>> vectors(fresh.size());
  std::vector<std::string> texts;
  std::vector<std::size_t> slots;
  for (std::size_t i = 0; i < fresh.size(); ++i) {
    if (previous != nullptr) {
      if (const auto id = previous->documents.find_by_hash(fresh[i]->content_hash);
          id.has_value()) {
        if (const auto *vector = previous->vectors.get(*id); vector != nullptr) {
          vectors[i] = *vector;
          continue;
        }
      }
    }
    texts.push_back(index::embedding_text(*fresh[i]));
    slots.push_back(i);
  }

  if (!texts.empty()) {
    auto embedded = cache_->get_or_compute_batch(texts, config_.embedding.batch_size);
    if (!embedded.ok()) {
      return BatchResult::failure(embedded.error_detail());
    }
    for (std::size_t i = 0; i < slots.size(); ++i) {
      vectors[slots[i]] = std::move(embedded.value()[i]);
    }
  }

  const std::size_t dimensions = target.vectors.dimensions();
  for (std::size_t i = 0; i < fresh.size(); ++i) {
    if (vectors[i]->size() != dimensions) {
      return BatchResult::failure(common::ErrorCode::ProviderUnavailable,
                                  "embedding has " + std::to_string(vectors[i]->size()) +
                                      " dimensions, index expects " + std::to_string(dimensions));
    }
  }

  for (std::size_t i = 0; i < fresh.size(); ++i) {
    if (auto status = target.documents.add(*fresh[i]); !status.ok()) {
      return BatchResult::failure(status.error_detail());
    }
    if (auto status = target.vectors.add(fresh[i]->id, std::move(*vectors[i])); !status.ok()) {
      return BatchResult::failure(status.error_detail());
    }
    ++batch.added;
  }
  return BatchResult::success(std::move(batch));
}

common::Result<std::string> Engine::ingest(const index::DocumentInput &input) {
  auto document = make_document(input, 0);
  if (!document.ok()) {
    return common::Result<std::string>::failure(document.error_detail());
  }

  std::lock_guard<std::mutex> writer(writer_mutex_);
  const auto current = snapshot();
  if (const auto existing = current->documents.find_by_hash(document.value().content_hash);
      existing.has_value()) {
    observability::record_ingest(*existing, document.value().category, true);
    return common::Result<std::string>::success(*existing);
  }

  auto next = std::make_shared<index::IndexState>(*current);
  auto batch = apply_batch(*next, nullptr, {document.value()});
  if (!batch.ok()) {
    observability::record_error("ingest", batch.error_detail().to_string());
    return common::Result<std::string>::failure(batch.error_detail());
  }

  observability::record_ingest(document.value().id, document.value().category, false);
  publish(std::move(next), batch.value().added, 0);
  return common::Result<std::string>::success(document.value().id);
}

common::Result<std::vector<std::string>> Engine::ingest_article(const index::ArticleInput &article) {
  using IdsResult = common::Result<std::vector<std::string>>;

  const auto chunks =
      index::chunk_text(article.body, config_.retrieval.chunk_size, config_.retrieval.chunk_overlap);
  if (chunks.empty()) {
    return IdsResult::failure(common::ErrorCode::InvalidArgument, "article body is empty");
  }

  std::vector<index::Document> candidates;
  candidates.reserve(chunks.size());
  for (const auto &chunk : chunks) {
    auto document = make_document(index::DocumentInput{.text = chunk.content,
                                                       .category = article.category,
                                                       .source_url = article.url,
                                                       .title = article.title},
                                  chunk.index);
    if (!document.ok()) {
      return IdsResult::failure(document.error_detail());
    }
    candidates.push_back(std::move(document.value()));
  }

  std::lock_guard<std::mutex> writer(writer_mutex_);
  const auto current = snapshot();
  auto next = std::make_shared<index::IndexState>(*current);
  auto batch = apply_batch(*next, nullptr, candidates);
  if (!batch.ok()) {
    observability::record_error("ingest", batch.error_detail().to_string());
    return IdsResult::failure(batch.error_detail());
  }

  for (const auto &doc : candidates) {
    observability::record_ingest(doc.id, doc.category, current->documents.contains(doc.id));
  }
  if (batch.value().added > 0) {
    publish(std::move(next), batch.value().added, 0);
  }
  return IdsResult::success(std::move(batch.value().ids));
}

common::Result<BuildReport> Engine::build_index(const std::vector<index::DocumentInput> &documents,
                                                const BuildMode mode) {
  std::vector<index::Document> candidates;
  candidates.reserve(documents.size());
  for (const auto &input : documents) {
    auto document = make_document(input, 0);
    if (!document.ok()) {
      return common::Result<BuildReport>::failure(document.error_detail());
    }
    candidates.push_back(std::move(document.value()));
  }

  std::lock_guard<std::mutex> writer(writer_mutex_);
  const auto current = snapshot();
  std::shared_ptr<index::IndexState> next;
  const index::IndexState *previous = nullptr;
  if (mode == BuildMode::Replace) {
    next = empty_state();
    previous = current.get();
  } else {
    next = std::make_shared<index::IndexState>(*current);
  }

  auto batch = apply_batch(*next, previous, candidates);
  if (!batch.ok()) {
    observability::record_error("build_index", batch.error_detail().to_string());
    return common::Result<BuildReport>::failure(batch.error_detail());
  }

  const BuildReport report{
      .added = batch.value().added,
      .duplicates = batch.value().duplicates,
      .removed = mode == BuildMode::Replace ? current->size() : 0,
      .total = next->size(),
  };
  publish(std::move(next), report.added, report.removed);
  return common::Result<BuildReport>::success(report);
}

common::Result<bool> Engine::remove(const std::string &id) {
  std::lock_guard<std::mutex> writer(writer_mutex_);
  const auto current = snapshot();
  if (!current->documents.contains(id)) {
    return common::Result<bool>::success(false);
  }

  auto next = std::make_shared<index::IndexState>(*current);
  next->documents.remove(id);
  next->vectors.remove(id);
  publish(std::move(next), 0, 1);
  return common::Result<bool>::success(true);
}

common::Result<retrieval::Retrieval> Engine::search(const std::string &query,
                                                    const std::optional<std::size_t> k) const {
  const auto started = dependencies_.steady_clock();
  const auto state = snapshot();
  auto result = retriever_.search(*state, query, k.value_or(config_.retrieval.top_k));
  observability::record_query_latency("focused", elapsed_since(dependencies_.steady_clock, started));
  return result;
}

common::Result<retrieval::CategoryRetrieval>
Engine::search_all_categories(const std::string &query,
                              const std::optional<std::size_t> per_category_k) const {
  const auto started = dependencies_.steady_clock();
  const auto state = snapshot();
  auto result = retriever_.search_all_categories(
      *state, query, per_category_k.value_or(config_.retrieval.per_category_k));
  observability::record_query_latency("all_categories", elapsed_since(dependencies_.steady_clock, started));
  return result;
}

common::Result<AnswerResponse> Engine::answer(const std::string &query,
                                              const std::optional<std::size_t> k) const {
  auto retrieved = search(query, k);
  if (!retrieved.ok()) {
    return common::Result<AnswerResponse>::failure(retrieved.error_detail());
  }

  auto answer = synthesizer_.answer(retrieved.value());
  if (!answer.ok()) {
    observability::record_error("synthesis", answer.error_detail().to_string());
  }
  return common::Result<AnswerResponse>::success(
      AnswerResponse{.answer = std::move(answer), .retrieval = std::move(retrieved.value())});
}

common::Result<CategoryAnswerResponse>
Engine::answer_all_categories(const std::string &query,
                              const std::optional<std::size_t> per_category_k) const {
  auto retrieved = search_all_categories(query, per_category_k);
  if (!retrieved.ok()) {
    return common::Result<CategoryAnswerResponse>::failure(retrieved.error_detail());
  }

  auto answer = synthesizer_.answer_all_categories(retrieved.value());
  if (!answer.ok()) {
    observability::record_error("synthesis", answer.error_detail().to_string());
  }
  return common::Result<CategoryAnswerResponse>::success(CategoryAnswerResponse{
      .answer = std::move(answer), .retrieval = std::move(retrieved.value())});
}

common::Result<persistence::SnapshotInfo> Engine::save() {
  std::lock_guard<std::mutex> writer(writer_mutex_);
  const auto state = snapshot();
  return persistence_.save(*state, persistence::SnapshotMetadata{.chat_model = config_.llm.model,
                                                                 .taxonomy = taxonomy_.names()});
}

common::Status Engine::load() {
  std::lock_guard<std::mutex> writer(writer_mutex_);
  auto loaded = persistence_.load(load_expectations());
  if (!loaded.ok()) {
    observability::record_error("load", loaded.error_detail().to_string());
    return common::Status::error(loaded.error_detail());
  }

  const auto previous = snapshot()->size();
  const auto documents = loaded.value().size();
  publish(std::make_shared<const index::IndexState>(std::move(loaded.value())), documents,
          previous);
  return common::Status::success();
}

common::Result<persistence::BundleInfo>
Engine::export_bundle(const std::filesystem::path &destination) {
  // Holding the writer lock keeps a concurrent save from collecting the
  // snapshot being archived.
  std::lock_guard<std::mutex> writer(writer_mutex_);
  return backup_.export_bundle(destination);
}

common::Result<ImportReport> Engine::import_bundle(const std::filesystem::path &bundle) {
  std::lock_guard<std::mutex> writer(writer_mutex_);
  auto imported = backup_.import_bundle(bundle, load_expectations());
  if (!imported.ok()) {
    return common::Result<ImportReport>::failure(imported.error_detail());
  }

  auto &value = imported.value();
  const ImportReport report{.snapshot_id = value.state.snapshot_id,
                            .document_count = value.state.documents.size(),
                            .vector_count = value.state.vectors.size(),
                            .bundle_bytes = value.bundle_bytes};
  const auto previous = snapshot()->size();
  publish(std::make_shared<const index::IndexState>(std::move(value.state)),
          report.document_count, previous);
  return common::Result<ImportReport>::success(report);
}

IndexStatus Engine::status() const {
  const auto state = snapshot();
  IndexStatus status{
      .loaded = !state->documents.empty() || !state->snapshot_id.empty(),
      .document_count = state->documents.size(),
      .vector_count = state->vectors.size(),
      .backup_complete = backup_.backup_complete(),
      .embedding_model = dependencies_.embedder->model_id(),
      .dimensions = dependencies_.embedder->dimensions(),
      .chat_model = config_.llm.model,
      .taxonomy = taxonomy_.names(),
      .cache = cache_->stats(),
  };
  if (auto active = persistence_.inspect(); active.ok()) {
    status.active_snapshot = active.value().directory.filename().string();
    status.size_bytes = active.value().size_bytes;
  }

  observability::record_metric(observability::CacheStatsMetric{
      .hits = status.cache.hits, .misses = status.cache.misses, .size = status.cache.size});
  return status;
}

} // namespace newsdesk::engine
