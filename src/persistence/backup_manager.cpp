#include "newsdesk/persistence/backup_manager.hpp"

#include "newsdesk/common/hash.hpp"
#include "newsdesk/observability/global.hpp"
#include "newsdesk/persistence/tar.hpp"

#include <algorithm>

namespace newsdesk::persistence {

namespace {

common::Result<ImportedSnapshot> rejected(const std::filesystem::path &bundle,
                                          const std::string &message) {
  observability::record_bundle("import", bundle.string(), 0, false, message);
  return common::Result<ImportedSnapshot>::failure(common::ErrorCode::ImportRejected, message);
}

/// Removes the staging directory unless released.
class StagingGuard {
public:
  explicit StagingGuard(std::filesystem::path path) : path_(std::move(path)) {}
  ~StagingGuard() {
    if (!path_.empty()) {
      std::error_code ec;
      std::filesystem::remove_all(path_, ec);
    }
  }
  StagingGuard(const StagingGuard &) = delete;
  StagingGuard &operator=(const StagingGuard &) = delete;

  void release() { path_.clear(); }

private:
  std::filesystem::path path_;
};

} // namespace

BackupManager::BackupManager(PersistenceManager &persistence, const std::uint64_t max_bundle_bytes)
    : persistence_(persistence), max_bundle_bytes_(max_bundle_bytes) {}

common::Result<BundleInfo>
BackupManager::export_bundle(const std::filesystem::path &destination) const {
  auto snapshot = persistence_.inspect();
  if (!snapshot.ok()) {
    return common::Result<BundleInfo>::failure(snapshot.error_detail());
  }
  const auto &info = snapshot.value();

  std::vector<TarMember> members;
  members.push_back(TarMember{.name = kManifestFile, .source = info.directory / kManifestFile});
  for (const auto &file : info.manifest.files) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(info.directory / file.name, ec)) {
      return common::Result<BundleInfo>::failure(common::ErrorCode::Corrupt,
                                                 "active snapshot lacks " + file.name);
    }
    members.push_back(TarMember{.name = file.name, .source = info.directory / file.name});
  }

  if (destination.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(destination.parent_path(), ec);
  }
  const std::filesystem::path tmp = destination.string() + ".tmp";
  if (auto status = write_tar(tmp, members); !status.ok()) {
    std::error_code ignored;
    std::filesystem::remove(tmp, ignored);
    observability::record_bundle("export", destination.string(), 0, false, status.error());
    return common::Result<BundleInfo>::failure(status.error_detail());
  }

  std::error_code ec;
  std::filesystem::rename(tmp, destination, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp, ignored);
    return common::Result<BundleInfo>::failure(common::ErrorCode::IoError,
                                               "cannot write " + destination.string() + ": " +
                                                   ec.message());
  }

  auto digest = common::sha256_file_hex(destination);
  if (!digest.ok()) {
    return common::Result<BundleInfo>::failure(digest.error_detail());
  }
  const auto bytes = static_cast<std::uint64_t>(std::filesystem::file_size(destination, ec));
  observability::record_bundle("export", destination.string(), bytes, true);

  return common::Result<BundleInfo>::success(BundleInfo{.path = destination,
                                                        .bytes = bytes,
                                                        .sha256 = digest.value(),
                                                        .manifest = info.manifest});
}

common::Result<ImportedSnapshot> BackupManager::import_bundle(const std::filesystem::path &bundle,
                                                              const LoadExpectations &expected) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(bundle, ec)) {
    return rejected(bundle, "bundle not found: " + bundle.string());
  }
  const auto bytes = static_cast<std::uint64_t>(std::filesystem::file_size(bundle, ec));
  if (ec) {
    return rejected(bundle, "cannot stat bundle: " + ec.message());
  }
  if (bytes > max_bundle_bytes_) {
    return rejected(bundle, "bundle is " + std::to_string(bytes) + " bytes, limit is " +
                                std::to_string(max_bundle_bytes_));
  }

  auto staging = persistence_.create_staging_dir();
  if (!staging.ok()) {
    return common::Result<ImportedSnapshot>::failure(staging.error_detail());
  }
  StagingGuard guard(staging.value());

  auto names = extract_tar(bundle, staging.value());
  if (!names.ok()) {
    return rejected(bundle, names.error());
  }
  const auto &extracted = names.value();
  if (std::find(extracted.begin(), extracted.end(), kManifestFile) == extracted.end()) {
    return rejected(bundle, "bundle has no manifest");
  }
  for (const auto &name : extracted) {
    if (name != kManifestFile && name != kIndexFile && name != kDocumentsFile) {
      return rejected(bundle, "unexpected bundle member " + name);
    }
  }

  auto state = PersistenceManager::load_snapshot(staging.value(), expected);
  if (!state.ok()) {
    return rejected(bundle, state.error());
  }

  auto promoted = persistence_.promote(staging.value());
  if (!promoted.ok()) {
    observability::record_bundle("import", bundle.string(), bytes, false, promoted.error());
    return common::Result<ImportedSnapshot>::failure(promoted.error_detail());
  }
  guard.release();

  state.value().snapshot_id = promoted.value().directory.filename().string();
  observability::record_bundle("import", bundle.string(), bytes, true);
  return common::Result<ImportedSnapshot>::success(
      ImportedSnapshot{.state = std::move(state.value()),
                       .snapshot = std::move(promoted.value()),
                       .bundle_bytes = bytes});
}

bool BackupManager::backup_complete() const {
  auto snapshot = persistence_.inspect();
  if (!snapshot.ok()) {
    return false;
  }
  const auto &info = snapshot.value();
  for (const char *required : {kIndexFile, kDocumentsFile}) {
    if (info.manifest.find_file(required) == nullptr) {
      return false;
    }
  }
  for (const auto &file : info.manifest.files) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(info.directory / file.name, ec);
    if (ec || static_cast<std::uint64_t>(size) != file.size) {
      return false;
    }
  }
  return true;
}

} // namespace newsdesk::persistence
