#pragma once

#include "newsdesk/common/result.hpp"
#include "newsdesk/persistence/persistence_manager.hpp"

#include <filesystem>
#include <string>

namespace newsdesk::persistence {

struct BundleInfo {
  std::filesystem::path path;
  std::uint64_t bytes = 0;
  std::string sha256;
  Manifest manifest;
};

struct ImportedSnapshot {
  index::IndexState state;
  SnapshotInfo snapshot;
  std::uint64_t bundle_bytes = 0;
};

/// Packs the active snapshot into one archive and restores from one. An
/// import is fully validated in a staging directory before it replaces the
/// active snapshot.
class BackupManager {
public:
  BackupManager(PersistenceManager &persistence, std::uint64_t max_bundle_bytes);

  /// NotFound when nothing has been saved yet.
  [[nodiscard]] common::Result<BundleInfo> export_bundle(const std::filesystem::path &destination) const;

  /// ImportRejected for anything wrong with the bundle; the active snapshot
  /// is untouched in that case.
  [[nodiscard]] common::Result<ImportedSnapshot>
  import_bundle(const std::filesystem::path &bundle, const LoadExpectations &expected);

  /// True when the active snapshot has every file its manifest declares,
  /// with matching sizes.
  [[nodiscard]] bool backup_complete() const;

  [[nodiscard]] std::uint64_t max_bundle_bytes() const { return max_bundle_bytes_; }

private:
  PersistenceManager &persistence_;
  std::uint64_t max_bundle_bytes_;
};

} // namespace newsdesk::persistence
