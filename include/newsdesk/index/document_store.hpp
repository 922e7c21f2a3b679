#pragma once

#include "newsdesk/common/result.hpp"
#include "newsdesk/index/document.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace newsdesk::index {

/// Documents keyed by id and deduplicated by content hash. Copies share the
/// immutable Document objects.
class DocumentStore {
public:
  [[nodiscard]] std::optional<std::string> find_by_hash(const std::string &content_hash) const;
  [[nodiscard]] const Document *get(const std::string &id) const;
  [[nodiscard]] bool contains(const std::string &id) const;

  /// Fails with InvalidArgument when the id or content hash is already present.
  [[nodiscard]] common::Status add(Document document);
  bool remove(const std::string &id);
  void clear();

  [[nodiscard]] std::size_t size() const { return by_id_.size(); }
  [[nodiscard]] bool empty() const { return by_id_.empty(); }
  [[nodiscard]] std::uint64_t next_sequence() const { return next_sequence_; }

  /// All documents ordered by ingestion sequence.
  [[nodiscard]] std::vector<const Document *> documents() const;
  [[nodiscard]] std::size_t count_in(const std::string &category) const;

  /// Writes a fresh SQLite database at `path`, replacing any file there.
  [[nodiscard]] common::Status save(const std::filesystem::path &path) const;
  [[nodiscard]] static common::Result<DocumentStore> load(const std::filesystem::path &path);

private:
  std::unordered_map<std::string, std::shared_ptr<const Document>> by_id_;
  std::unordered_map<std::string, std::string> id_by_hash_;
  std::map<std::uint64_t, std::string> id_by_sequence_;
  std::uint64_t next_sequence_ = 1;
};

} // namespace newsdesk::index
