#pragma once

#include "newsdesk/common/result.hpp"
#include "newsdesk/common/time.hpp"
#include "newsdesk/config/schema.hpp"
#include "newsdesk/embedding/cache.hpp"
#include "newsdesk/embedding/provider.hpp"
#include "newsdesk/index/document.hpp"
#include "newsdesk/index/index_state.hpp"
#include "newsdesk/index/taxonomy.hpp"
#include "newsdesk/persistence/backup_manager.hpp"
#include "newsdesk/persistence/persistence_manager.hpp"
#include "newsdesk/providers/traits.hpp"
#include "newsdesk/retrieval/retriever.hpp"
#include "newsdesk/retrieval/synthesizer.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace newsdesk::engine {

enum class BuildMode {
  /// The batch becomes the whole index.
  Replace,
  /// The batch is added to the current index.
  Incremental,
};

/// Collaborators normally built from configuration. Tests inject fakes here.
struct EngineDependencies {
  std::shared_ptr<embedding::IEmbeddingProvider> embedder;
  std::shared_ptr<providers::Provider> chat_provider;
  common::WallClock wall_clock = common::system_now;
  common::SteadyClock steady_clock = common::steady_now;
};

struct BuildReport {
  std::size_t added = 0;
  std::size_t duplicates = 0;
  std::size_t removed = 0;
  std::size_t total = 0;
};

/// The answer may fail while the retrieval still succeeded, so callers can
/// fall back to showing fragments.
struct AnswerResponse {
  common::Result<retrieval::Answer> answer;
  retrieval::Retrieval retrieval;
};

struct CategoryAnswerResponse {
  common::Result<retrieval::Answer> answer;
  retrieval::CategoryRetrieval retrieval;
};

struct ImportReport {
  std::string snapshot_id;
  std::size_t document_count = 0;
  std::size_t vector_count = 0;
  std::uint64_t bundle_bytes = 0;
};

struct IndexStatus {
  bool loaded = false;
  std::size_t document_count = 0;
  std::size_t vector_count = 0;
  bool backup_complete = false;
  std::string embedding_model;
  std::size_t dimensions = 0;
  std::string chat_model;
  std::optional<std::string> active_snapshot;
  std::uint64_t size_bytes = 0;
  std::vector<std::string> taxonomy;
  embedding::CacheStats cache;
};

/// Readers work on an immutable IndexState snapshot; writers build a new
/// state off to the side and publish it with one pointer swap.
class Engine {
public:
  [[nodiscard]] static common::Result<std::unique_ptr<Engine>> create(const config::Config &config);
  [[nodiscard]] static common::Result<std::unique_ptr<Engine>>
  create(const config::Config &config, EngineDependencies dependencies);

  Engine(const Engine &) = delete;
  Engine &operator=(const Engine &) = delete;

  /// Returns the id of the stored document; identical content returns the
  /// existing id without embedding again.
  [[nodiscard]] common::Result<std::string> ingest(const index::DocumentInput &input);

  /// Splits the article body into chunks and ingests them as one batch.
  [[nodiscard]] common::Result<std::vector<std::string>>
  ingest_article(const index::ArticleInput &article);

  /// All embeddings are computed before anything is published; on failure
  /// the index is unchanged.
  [[nodiscard]] common::Result<BuildReport>
  build_index(const std::vector<index::DocumentInput> &documents, BuildMode mode);

  [[nodiscard]] common::Result<bool> remove(const std::string &id);

  [[nodiscard]] common::Result<retrieval::Retrieval>
  search(const std::string &query, std::optional<std::size_t> k = std::nullopt) const;
  [[nodiscard]] common::Result<retrieval::CategoryRetrieval>
  search_all_categories(const std::string &query,
                        std::optional<std::size_t> per_category_k = std::nullopt) const;

  [[nodiscard]] common::Result<AnswerResponse>
  answer(const std::string &query, std::optional<std::size_t> k = std::nullopt) const;
  [[nodiscard]] common::Result<CategoryAnswerResponse>
  answer_all_categories(const std::string &query,
                        std::optional<std::size_t> per_category_k = std::nullopt) const;

  [[nodiscard]] common::Result<persistence::SnapshotInfo> save();
  [[nodiscard]] common::Status load();

  [[nodiscard]] common::Result<persistence::BundleInfo>
  export_bundle(const std::filesystem::path &destination);
  [[nodiscard]] common::Result<ImportReport> import_bundle(const std::filesystem::path &bundle);

  [[nodiscard]] IndexStatus status() const;
  [[nodiscard]] std::shared_ptr<const index::IndexState> snapshot() const;
  [[nodiscard]] const index::CategoryTaxonomy &taxonomy() const { return taxonomy_; }

private:
  Engine(const config::Config &config, index::CategoryTaxonomy taxonomy,
         EngineDependencies dependencies);

  struct PreparedBatch {
    std::vector<std::string> ids;
    std::size_t added = 0;
    std::size_t duplicates = 0;
  };

  [[nodiscard]] std::shared_ptr<index::IndexState> empty_state() const;
  [[nodiscard]] common::Result<PreparedBatch>
  apply_batch(index::IndexState &target, const index::IndexState *previous,
              const std::vector<index::Document> &candidates) const;
  [[nodiscard]] common::Result<index::Document> make_document(const index::DocumentInput &input,
                                                              std::size_t chunk_index) const;
  void publish(std::shared_ptr<const index::IndexState> next, std::size_t added,
               std::size_t removed);
  [[nodiscard]] persistence::LoadExpectations load_expectations() const;

  config::Config config_;
  index::CategoryTaxonomy taxonomy_;
  EngineDependencies dependencies_;
  std::shared_ptr<embedding::EmbeddingCache> cache_;
  retrieval::Retriever retriever_;
  retrieval::AnswerSynthesizer synthesizer_;
  persistence::PersistenceManager persistence_;
  persistence::BackupManager backup_;

  std::mutex writer_mutex_;
  mutable std::shared_mutex state_mutex_;
  std::shared_ptr<const index::IndexState> state_;
};

} // namespace newsdesk::engine
