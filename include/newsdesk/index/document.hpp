#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace newsdesk::index {

struct DocumentInput {
  std::string text;
  std::string category;
  std::optional<std::string> source_url;
  std::optional<std::string> title;
};

/// A whole article, split into chunk documents on ingest.
struct ArticleInput {
  std::string body;
  std::string category;
  std::optional<std::string> url;
  std::optional<std::string> title;
};

struct Document {
  std::string id;
  std::string text;
  std::string category;
  std::optional<std::string> source_url;
  std::optional<std::string> title;
  std::size_t chunk_index = 0;
  std::string content_hash;
  std::string ingested_at;
  /// Monotonic ingestion order; breaks ties between equal timestamps.
  std::uint64_t sequence = 0;
};

/// SHA-256 hex of the trimmed text.
[[nodiscard]] std::string content_hash_for(std::string_view text);

/// "doc-" followed by the first 24 hex characters of the content hash.
[[nodiscard]] std::string document_id_for(const std::string &content_hash);

/// Text handed to the embedder: "[<category>] <title>\n<text>".
[[nodiscard]] std::string embedding_text(const Document &document);

} // namespace newsdesk::index
