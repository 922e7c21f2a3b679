#include "newsdesk/persistence/manifest.hpp"

#include "newsdesk/common/json_util.hpp"

#include <charconv>
#include <sstream>

namespace newsdesk::persistence {

namespace {

bool parse_u64(const std::string &text, std::uint64_t &out) {
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
  return ec == std::errc() && ptr == text.data() + text.size();
}

common::Result<Manifest> corrupt(const std::string &message) {
  return common::Result<Manifest>::failure(common::ErrorCode::Corrupt, "manifest: " + message);
}

} // namespace

const ManifestFile *Manifest::find_file(const std::string &name) const {
  for (const auto &file : files) {
    if (file.name == name) {
      return &file;
    }
  }
  return nullptr;
}

std::uint64_t Manifest::total_bytes() const {
  std::uint64_t total = 0;
  for (const auto &file : files) {
    total += file.size;
  }
  return total;
}

std::string manifest_to_json(const Manifest &manifest) {
  std::ostringstream out;
  out << "{\n";
  out << "  \"format_version\": " << manifest.format_version << ",\n";
  out << "  \"snapshot_id\": \"" << common::json_escape(manifest.snapshot_id) << "\",\n";
  out << "  \"embedding_model\": \"" << common::json_escape(manifest.embedding_model) << "\",\n";
  out << "  \"dimensions\": " << manifest.dimensions << ",\n";
  out << "  \"chat_model\": \"" << common::json_escape(manifest.chat_model) << "\",\n";
  out << "  \"taxonomy\": " << common::json_string_array(manifest.taxonomy) << ",\n";
  out << "  \"document_count\": " << manifest.document_count << ",\n";
  out << "  \"vector_count\": " << manifest.vector_count << ",\n";
  out << "  \"created_at\": \"" << common::json_escape(manifest.created_at) << "\",\n";
  out << "  \"files\": [";
  for (std::size_t i = 0; i < manifest.files.size(); ++i) {
    const auto &file = manifest.files[i];
    out << (i == 0 ? "\n" : ",\n");
    out << "    {\"name\": \"" << common::json_escape(file.name) << "\", \"size\": " << file.size
        << ", \"sha256\": \"" << file.sha256 << "\"}";
  }
  out << (manifest.files.empty() ? "]\n" : "\n  ]\n");
  out << "}\n";
  return out.str();
}

common::Result<Manifest> parse_manifest(const std::string &json) {
  Manifest manifest;

  std::uint64_t version = 0;
  if (!parse_u64(common::json_get_number(json, "format_version"), version)) {
    return corrupt("format_version missing");
  }
  if (version != kManifestFormatVersion) {
    return corrupt("unsupported format_version " + std::to_string(version));
  }
  manifest.format_version = static_cast<std::uint32_t>(version);

  manifest.snapshot_id = common::json_get_string(json, "snapshot_id");
  manifest.embedding_model = common::json_get_string(json, "embedding_model");
  manifest.chat_model = common::json_get_string(json, "chat_model");
  manifest.created_at = common::json_get_string(json, "created_at");
  if (manifest.embedding_model.empty()) {
    return corrupt("embedding_model missing");
  }
  if (!parse_u64(common::json_get_number(json, "dimensions"), manifest.dimensions)) {
    return corrupt("dimensions missing");
  }
  if (!parse_u64(common::json_get_number(json, "document_count"), manifest.document_count)) {
    return corrupt("document_count missing");
  }
  if (!parse_u64(common::json_get_number(json, "vector_count"), manifest.vector_count)) {
    return corrupt("vector_count missing");
  }
  manifest.taxonomy = common::json_get_string_array(json, "taxonomy");

  const std::string files = common::json_get_array(json, "files");
  if (files.empty()) {
    return corrupt("files missing");
  }
  for (const auto &object : common::json_split_top_level_objects(files)) {
    ManifestFile file{.name = common::json_get_string(object, "name"),
                      .sha256 = common::json_get_string(object, "sha256")};
    if (file.name.empty() || file.sha256.size() != 64 ||
        !parse_u64(common::json_get_number(object, "size"), file.size)) {
      return corrupt("malformed file entry");
    }
    if (manifest.find_file(file.name) != nullptr) {
      return corrupt("duplicate file entry " + file.name);
    }
    manifest.files.push_back(std::move(file));
  }

  return common::Result<Manifest>::success(std::move(manifest));
}

} // namespace newsdesk::persistence
