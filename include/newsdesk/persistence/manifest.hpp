#pragma once

#include "newsdesk/common/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace newsdesk::persistence {

inline constexpr std::uint32_t kManifestFormatVersion = 1;
inline constexpr const char *kManifestFile = "manifest.json";
inline constexpr const char *kIndexFile = "index.bin";
inline constexpr const char *kDocumentsFile = "documents.db";

struct ManifestFile {
  std::string name;
  std::uint64_t size = 0;
  std::string sha256;
};

struct Manifest {
  std::uint32_t format_version = kManifestFormatVersion;
  std::string snapshot_id;
  std::string embedding_model;
  std::uint64_t dimensions = 0;
  std::string chat_model;
  std::vector<std::string> taxonomy;
  std::uint64_t document_count = 0;
  std::uint64_t vector_count = 0;
  std::string created_at;
  std::vector<ManifestFile> files;

  [[nodiscard]] const ManifestFile *find_file(const std::string &name) const;
  [[nodiscard]] std::uint64_t total_bytes() const;
};

[[nodiscard]] std::string manifest_to_json(const Manifest &manifest);

/// Corrupt when a field is missing or malformed.
[[nodiscard]] common::Result<Manifest> parse_manifest(const std::string &json);

} // namespace newsdesk::persistence
