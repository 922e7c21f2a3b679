#pragma once

#include "newsdesk/common/result.hpp"
#include "newsdesk/index/document_store.hpp"
#include "newsdesk/index/vector_index.hpp"

#include <string>

namespace newsdesk::index {

/// Documents and their vectors, published and persisted as one unit.
struct IndexState {
  DocumentStore documents;
  VectorIndex vectors;
  std::string embedding_model;
  /// Snapshot this state was loaded or imported from, if any.
  std::string snapshot_id;

  [[nodiscard]] std::size_t size() const { return documents.size(); }

  /// Corrupt when a document lacks a vector or a vector lacks a document.
  [[nodiscard]] common::Status verify_consistency() const;
};

} // namespace newsdesk::index
