#include "newsdesk/persistence/persistence_manager.hpp"

#include "newsdesk/common/fs.hpp"
#include "newsdesk/common/hash.hpp"
#include "newsdesk/observability/global.hpp"

#include <algorithm>
#include <charconv>
#include <iomanip>
#include <optional>
#include <sstream>

namespace newsdesk::persistence {

namespace {

constexpr const char *kTmpPrefix = ".tmp-";
constexpr const char *kStagingDir = "staging";

/// Snapshot ids are zero-padded generation numbers so they sort by age.
std::optional<std::uint64_t> parse_generation(const std::string &name) {
  std::uint64_t value = 0;
  const auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), value);
  if (name.empty() || ec != std::errc() || ptr != name.data() + name.size()) {
    return std::nullopt;
  }
  return value;
}

std::string format_generation(const std::uint64_t generation) {
  std::ostringstream out;
  out << std::setw(10) << std::setfill('0') << generation;
  return out.str();
}

std::uint64_t directory_bytes(const std::filesystem::path &directory) {
  std::uint64_t total = 0;
  std::error_code ec;
  for (const auto &entry : std::filesystem::directory_iterator(directory, ec)) {
    if (entry.is_regular_file(ec)) {
      total += static_cast<std::uint64_t>(entry.file_size(ec));
    }
  }
  return total;
}

common::Result<Manifest> read_manifest(const std::filesystem::path &directory) {
  auto text = common::read_file(directory / kManifestFile);
  if (!text.ok()) {
    return common::Result<Manifest>::failure(common::ErrorCode::Corrupt,
                                             "manifest missing in " + directory.string());
  }
  return parse_manifest(text.value());
}

template <typename T> common::Result<T> corrupt(const std::string &message) {
  return common::Result<T>::failure(common::ErrorCode::Corrupt, message);
}

} // namespace

common::Result<ManifestFile> describe_file(const std::filesystem::path &directory,
                                           const std::string &name) {
  const auto path = directory / name;
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    return common::Result<ManifestFile>::failure(common::ErrorCode::IoError,
                                                 "cannot stat " + path.string() + ": " +
                                                     ec.message());
  }
  auto digest = common::sha256_file_hex(path);
  if (!digest.ok()) {
    return common::Result<ManifestFile>::failure(digest.error_detail());
  }
  return common::Result<ManifestFile>::success(ManifestFile{
      .name = name, .size = static_cast<std::uint64_t>(size), .sha256 = digest.value()});
}

PersistenceManager::PersistenceManager(std::filesystem::path root, const std::size_t keep_snapshots,
                                       common::WallClock clock)
    : root_(std::move(root)), keep_snapshots_(std::max<std::size_t>(keep_snapshots, 1)),
      clock_(std::move(clock)) {}

std::string PersistenceManager::next_snapshot_id() const {
  std::uint64_t highest = 0;
  std::error_code ec;
  for (const auto &entry : std::filesystem::directory_iterator(snapshots_dir(), ec)) {
    std::string name = entry.path().filename().string();
    if (common::starts_with(name, kTmpPrefix)) {
      name = name.substr(std::char_traits<char>::length(kTmpPrefix));
    }
    if (const auto generation = parse_generation(name); generation.has_value()) {
      highest = std::max(highest, *generation);
    }
  }
  return format_generation(highest + 1);
}

common::Result<std::filesystem::path> PersistenceManager::active_dir() const {
  std::error_code ec;
  const auto link = current_link();
  if (!std::filesystem::is_symlink(std::filesystem::symlink_status(link, ec))) {
    return common::Result<std::filesystem::path>::failure(common::ErrorCode::NotFound,
                                                          "no saved index at " + root_.string());
  }
  const auto target = std::filesystem::read_symlink(link, ec);
  if (ec) {
    return corrupt<std::filesystem::path>("cannot read " + link.string() + ": " + ec.message());
  }
  const auto directory = target.is_absolute() ? target : root_ / target;
  if (!std::filesystem::is_directory(directory, ec)) {
    return corrupt<std::filesystem::path>("active snapshot missing: " + directory.string());
  }
  return common::Result<std::filesystem::path>::success(directory);
}

common::Status PersistenceManager::activate(const std::string &snapshot_id) {
  const auto tmp_link = root_ / "current.tmp";
  std::error_code ec;
  std::filesystem::remove(tmp_link, ec);
  std::filesystem::create_directory_symlink(std::filesystem::path("snapshots") / snapshot_id,
                                            tmp_link, ec);
  if (ec) {
    return common::Status::error(common::ErrorCode::IoError,
                                 "cannot create " + tmp_link.string() + ": " + ec.message());
  }
  std::filesystem::rename(tmp_link, current_link(), ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp_link, ignored);
    return common::Status::error(common::ErrorCode::IoError,
                                 "cannot activate snapshot " + snapshot_id + ": " + ec.message());
  }
  return common::Status::success();
}

void PersistenceManager::collect_garbage(const std::string &active_id) {
  std::vector<std::pair<std::uint64_t, std::filesystem::path>> complete;
  std::error_code ec;
  for (const auto &entry : std::filesystem::directory_iterator(snapshots_dir(), ec)) {
    const std::string name = entry.path().filename().string();
    if (common::starts_with(name, kTmpPrefix)) {
      // Leftover from an interrupted save.
      std::error_code remove_ec;
      std::filesystem::remove_all(entry.path(), remove_ec);
      continue;
    }
    if (const auto generation = parse_generation(name); generation.has_value()) {
      complete.emplace_back(*generation, entry.path());
    }
  }

  std::sort(complete.begin(), complete.end(),
            [](const auto &lhs, const auto &rhs) { return lhs.first > rhs.first; });
  for (std::size_t i = keep_snapshots_; i < complete.size(); ++i) {
    if (complete[i].second.filename().string() == active_id) {
      continue;
    }
    std::error_code remove_ec;
    std::filesystem::remove_all(complete[i].second, remove_ec);
    if (remove_ec) {
      observability::record_error("persistence", "cannot remove " +
                                                     complete[i].second.string() + ": " +
                                                     remove_ec.message());
    }
  }
}

common::Result<SnapshotInfo> PersistenceManager::save(const index::IndexState &state,
                                                      const SnapshotMetadata &metadata) {
  const auto started = std::chrono::steady_clock::now();

  auto consistent = state.verify_consistency();
  if (!consistent.ok()) {
    return common::Result<SnapshotInfo>::failure(consistent.error_detail());
  }
  auto snapshots = common::ensure_dir(snapshots_dir());
  if (!snapshots.ok()) {
    return common::Result<SnapshotInfo>::failure(snapshots.error_detail());
  }

  const std::string snapshot_id = next_snapshot_id();
  const auto tmp_dir = snapshots_dir() / (std::string(kTmpPrefix) + snapshot_id);
  const auto final_dir = snapshots_dir() / snapshot_id;
  const auto fail = [&](const common::Error &error) {
    std::error_code ignored;
    std::filesystem::remove_all(tmp_dir, ignored);
    observability::record_error("persistence", "save failed: " + error.message);
    return common::Result<SnapshotInfo>::failure(error);
  };

  std::error_code ec;
  std::filesystem::create_directories(tmp_dir, ec);
  if (ec) {
    return fail(common::Error{.code = common::ErrorCode::IoError,
                              .message = "cannot create " + tmp_dir.string()});
  }

  if (auto status = state.vectors.save(tmp_dir / kIndexFile); !status.ok()) {
    return fail(status.error_detail());
  }
  if (auto status = state.documents.save(tmp_dir / kDocumentsFile); !status.ok()) {
    return fail(status.error_detail());
  }

  Manifest manifest{
      .snapshot_id = snapshot_id,
      .embedding_model = state.embedding_model,
      .dimensions = state.vectors.dimensions(),
      .chat_model = metadata.chat_model,
      .taxonomy = metadata.taxonomy,
      .document_count = state.documents.size(),
      .vector_count = state.vectors.size(),
      .created_at = common::format_rfc3339(clock_()),
  };
  for (const char *name : {kIndexFile, kDocumentsFile}) {
    auto file = describe_file(tmp_dir, name);
    if (!file.ok()) {
      return fail(file.error_detail());
    }
    manifest.files.push_back(std::move(file.value()));
  }
  if (auto status = common::write_file_atomic(tmp_dir / kManifestFile, manifest_to_json(manifest));
      !status.ok()) {
    return fail(status.error_detail());
  }

  std::filesystem::rename(tmp_dir, final_dir, ec);
  if (ec) {
    return fail(common::Error{.code = common::ErrorCode::IoError,
                              .message = "cannot finalize snapshot: " + ec.message()});
  }
  if (auto status = activate(snapshot_id); !status.ok()) {
    std::error_code ignored;
    std::filesystem::remove_all(final_dir, ignored);
    return common::Result<SnapshotInfo>::failure(status.error_detail());
  }
  collect_garbage(snapshot_id);

  const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_snapshot_saved(snapshot_id, manifest.document_count, duration);

  return common::Result<SnapshotInfo>::success(SnapshotInfo{
      .manifest = std::move(manifest),
      .directory = final_dir,
      .size_bytes = directory_bytes(final_dir)});
}

common::Result<index::IndexState>
PersistenceManager::load_snapshot(const std::filesystem::path &directory,
                                  const LoadExpectations &expected) {
  using StateResult = common::Result<index::IndexState>;

  auto manifest = read_manifest(directory);
  if (!manifest.ok()) {
    return StateResult::failure(manifest.error_detail());
  }
  const auto &m = manifest.value();

  for (const char *name : {kIndexFile, kDocumentsFile}) {
    const auto *declared = m.find_file(name);
    if (declared == nullptr) {
      return corrupt<index::IndexState>(std::string("manifest does not list ") + name);
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(directory / name, ec)) {
      return corrupt<index::IndexState>(std::string("missing file ") + name);
    }
    auto actual = describe_file(directory, name);
    if (!actual.ok()) {
      return corrupt<index::IndexState>(actual.error());
    }
    if (actual.value().size != declared->size) {
      return corrupt<index::IndexState>(std::string("size mismatch for ") + name);
    }
    if (actual.value().sha256 != declared->sha256) {
      return corrupt<index::IndexState>(std::string("checksum mismatch for ") + name);
    }
  }

  if (m.embedding_model != expected.embedding_model) {
    return corrupt<index::IndexState>("snapshot was built with embedding model '" +
                                      m.embedding_model + "', running '" +
                                      expected.embedding_model + "'");
  }
  if (m.dimensions != expected.dimensions) {
    return corrupt<index::IndexState>("snapshot has " + std::to_string(m.dimensions) +
                                      " dimensions, running " +
                                      std::to_string(expected.dimensions));
  }

  auto vectors = index::VectorIndex::load(directory / kIndexFile);
  if (!vectors.ok()) {
    return StateResult::failure(vectors.error_detail());
  }
  auto documents = index::DocumentStore::load(directory / kDocumentsFile);
  if (!documents.ok()) {
    return StateResult::failure(documents.error_detail());
  }
  if (vectors.value().dimensions() != m.dimensions) {
    return corrupt<index::IndexState>("index.bin dimensions disagree with manifest");
  }
  if (documents.value().size() != m.document_count) {
    return corrupt<index::IndexState>("document count " +
                                      std::to_string(documents.value().size()) +
                                      " disagrees with manifest " +
                                      std::to_string(m.document_count));
  }
  if (vectors.value().size() != m.vector_count) {
    return corrupt<index::IndexState>("vector count " + std::to_string(vectors.value().size()) +
                                      " disagrees with manifest " +
                                      std::to_string(m.vector_count));
  }

  index::IndexState state{.documents = std::move(documents.value()),
                          .vectors = std::move(vectors.value()),
                          .embedding_model = m.embedding_model,
                          .snapshot_id = directory.filename().string()};
  if (auto status = state.verify_consistency(); !status.ok()) {
    return StateResult::failure(status.error_detail());
  }
  return StateResult::success(std::move(state));
}

common::Result<index::IndexState> PersistenceManager::load(const LoadExpectations &expected) const {
  auto directory = active_dir();
  if (!directory.ok()) {
    return common::Result<index::IndexState>::failure(directory.error_detail());
  }
  auto state = load_snapshot(directory.value(), expected);
  if (state.ok()) {
    observability::record_snapshot_loaded(state.value().snapshot_id, state.value().size());
  }
  return state;
}

common::Result<SnapshotInfo> PersistenceManager::inspect() const {
  auto directory = active_dir();
  if (!directory.ok()) {
    return common::Result<SnapshotInfo>::failure(directory.error_detail());
  }
  auto manifest = read_manifest(directory.value());
  if (!manifest.ok()) {
    return common::Result<SnapshotInfo>::failure(manifest.error_detail());
  }
  return common::Result<SnapshotInfo>::success(
      SnapshotInfo{.manifest = std::move(manifest.value()),
                   .directory = directory.value(),
                   .size_bytes = directory_bytes(directory.value())});
}

common::Result<std::filesystem::path> PersistenceManager::create_staging_dir() {
  const auto staging_root = root_ / kStagingDir;
  auto ensured = common::ensure_dir(staging_root);
  if (!ensured.ok()) {
    return ensured;
  }
  for (std::uint64_t attempt = 0;; ++attempt) {
    const auto candidate = staging_root / ("import-" + next_snapshot_id() + "-" +
                                           std::to_string(attempt));
    std::error_code ec;
    if (std::filesystem::create_directory(candidate, ec)) {
      return common::Result<std::filesystem::path>::success(candidate);
    }
    if (ec) {
      return common::Result<std::filesystem::path>::failure(
          common::ErrorCode::IoError, "cannot create " + candidate.string() + ": " + ec.message());
    }
  }
}

common::Result<SnapshotInfo> PersistenceManager::promote(const std::filesystem::path &staged) {
  auto snapshots = common::ensure_dir(snapshots_dir());
  if (!snapshots.ok()) {
    return common::Result<SnapshotInfo>::failure(snapshots.error_detail());
  }
  auto manifest = read_manifest(staged);
  if (!manifest.ok()) {
    return common::Result<SnapshotInfo>::failure(manifest.error_detail());
  }

  const std::string snapshot_id = next_snapshot_id();
  const auto final_dir = snapshots_dir() / snapshot_id;
  std::error_code ec;
  std::filesystem::rename(staged, final_dir, ec);
  if (ec) {
    return common::Result<SnapshotInfo>::failure(common::ErrorCode::IoError,
                                                 "cannot move staged snapshot: " + ec.message());
  }
  if (auto status = activate(snapshot_id); !status.ok()) {
    std::error_code ignored;
    std::filesystem::remove_all(final_dir, ignored);
    return common::Result<SnapshotInfo>::failure(status.error_detail());
  }
  collect_garbage(snapshot_id);

  return common::Result<SnapshotInfo>::success(SnapshotInfo{
      .manifest = std::move(manifest.value()),
      .directory = final_dir,
      .size_bytes = directory_bytes(final_dir)});
}

} // namespace newsdesk::persistence
