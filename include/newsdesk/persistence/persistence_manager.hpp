#pragma once

#include "newsdesk/common/result.hpp"
#include "newsdesk/common/time.hpp"
#include "newsdesk/index/index_state.hpp"
#include "newsdesk/persistence/manifest.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace newsdesk::persistence {

/// What a snapshot must match to be loadable by the running engine.
struct LoadExpectations {
  std::string embedding_model;
  std::size_t dimensions = 0;
};

/// Recorded alongside the index in the manifest.
struct SnapshotMetadata {
  std::string chat_model;
  std::vector<std::string> taxonomy;
};

struct SnapshotInfo {
  Manifest manifest;
  std::filesystem::path directory;
  /// Bytes on disk, manifest included.
  std::uint64_t size_bytes = 0;
};

/// Generational snapshots under one root:
///
///   <root>/current -> snapshots/<id>
///   <root>/snapshots/<id>/{index.bin,documents.db,manifest.json}
///
/// A snapshot directory is complete before it gets its final name, and
/// `current` only ever moves by rename(2) of a fresh symlink.
class PersistenceManager {
public:
  PersistenceManager(std::filesystem::path root, std::size_t keep_snapshots,
                     common::WallClock clock = common::system_now);

  [[nodiscard]] common::Result<SnapshotInfo> save(const index::IndexState &state,
                                                  const SnapshotMetadata &metadata);

  /// NotFound when nothing was saved yet; Corrupt when the active snapshot
  /// fails any check. Never returns a partially loaded state.
  [[nodiscard]] common::Result<index::IndexState> load(const LoadExpectations &expected) const;

  [[nodiscard]] static common::Result<index::IndexState>
  load_snapshot(const std::filesystem::path &directory, const LoadExpectations &expected);

  /// Manifest and disk usage of the active snapshot.
  [[nodiscard]] common::Result<SnapshotInfo> inspect() const;

  /// Moves a complete snapshot directory into place and activates it.
  [[nodiscard]] common::Result<SnapshotInfo> promote(const std::filesystem::path &staged);

  /// Fresh empty directory for assembling an import.
  [[nodiscard]] common::Result<std::filesystem::path> create_staging_dir();

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }
  [[nodiscard]] std::filesystem::path snapshots_dir() const { return root_ / "snapshots"; }
  [[nodiscard]] std::filesystem::path current_link() const { return root_ / "current"; }

private:
  [[nodiscard]] common::Result<std::filesystem::path> active_dir() const;
  [[nodiscard]] std::string next_snapshot_id() const;
  [[nodiscard]] common::Status activate(const std::string &snapshot_id);
  void collect_garbage(const std::string &active_id);

  std::filesystem::path root_;
  std::size_t keep_snapshots_;
  common::WallClock clock_;
};

/// Size and SHA-256 of `directory/name`.
[[nodiscard]] common::Result<ManifestFile> describe_file(const std::filesystem::path &directory,
                                                         const std::string &name);

} // namespace newsdesk::persistence
