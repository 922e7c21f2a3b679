#include "newsdesk/index/vector_index.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstring>
#include <fstream>
#include <iterator>

namespace newsdesk::index {

namespace {

constexpr std::array<char, 4> kMagic = {'N', 'D', 'V', 'X'};
constexpr std::uint16_t kVersion = 1;
constexpr std::size_t kHeaderSize = 24;

template <typename T> void append_le(std::string &out, const T value) {
  for (std::size_t i = 0; i < sizeof(T); ++i) {
    out.push_back(static_cast<char>((static_cast<std::uint64_t>(value) >> (8U * i)) & 0xFFU));
  }
}

template <typename T> bool read_le(const std::string &bytes, std::size_t &offset, T &out) {
  if (offset + sizeof(T) > bytes.size()) {
    return false;
  }
  std::uint64_t value = 0;
  for (std::size_t i = 0; i < sizeof(T); ++i) {
    value |= static_cast<std::uint64_t>(static_cast<unsigned char>(bytes[offset + i])) << (8U * i);
  }
  out = static_cast<T>(value);
  offset += sizeof(T);
  return true;
}

common::Result<VectorIndex> corrupt(const std::string &message) {
  return common::Result<VectorIndex>::failure(common::ErrorCode::Corrupt,
                                              "vector index: " + message);
}

} // namespace

float cosine_similarity(const std::vector<float> &a, const std::vector<float> &b) {
  if (a.empty() || b.empty() || a.size() != b.size()) {
    return 0.0F;
  }

  double dot = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;

  for (std::size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
    norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
  }

  if (norm_a < 1e-9 || norm_b < 1e-9) {
    return 0.0F;
  }

  return static_cast<float>(dot / (std::sqrt(norm_a) * std::sqrt(norm_b)));
}

VectorIndex::VectorIndex(const std::size_t dimensions) : dimensions_(dimensions) {}

common::Status VectorIndex::add(const std::string &key, std::vector<float> embedding) {
  if (embedding.size() != dimensions_) {
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 "embedding has " + std::to_string(embedding.size()) +
                                     " dimensions, index expects " +
                                     std::to_string(dimensions_));
  }
  vectors_[key] = std::make_shared<const std::vector<float>>(std::move(embedding));
  return common::Status::success();
}

bool VectorIndex::remove(const std::string &key) { return vectors_.erase(key) > 0; }

void VectorIndex::clear() { vectors_.clear(); }

std::size_t VectorIndex::size() const { return vectors_.size(); }

bool VectorIndex::contains(const std::string &key) const { return vectors_.contains(key); }

const std::vector<float> *VectorIndex::get(const std::string &key) const {
  const auto it = vectors_.find(key);
  return it == vectors_.end() ? nullptr : it->second.get();
}

common::Result<std::vector<VectorMatch>>
VectorIndex::score(const std::vector<float> &query,
                   const std::function<bool(const std::string &)> &filter) const {
  if (query.size() != dimensions_) {
    return common::Result<std::vector<VectorMatch>>::failure(
        common::ErrorCode::ProviderUnavailable,
        "query has " + std::to_string(query.size()) + " dimensions, index expects " +
            std::to_string(dimensions_));
  }

  std::vector<VectorMatch> results;
  results.reserve(vectors_.size());
  for (const auto &[key, embedding] : vectors_) {
    if (filter && !filter(key)) {
      continue;
    }
    results.push_back(VectorMatch{.key = key, .score = cosine_similarity(query, *embedding)});
  }
  return common::Result<std::vector<VectorMatch>>::success(std::move(results));
}

common::Status VectorIndex::save(const std::filesystem::path &path) const {
  // Sorted keys keep the file byte-identical for identical contents.
  std::vector<const std::string *> keys;
  keys.reserve(vectors_.size());
  for (const auto &[key, embedding] : vectors_) {
    keys.push_back(&key);
  }
  std::sort(keys.begin(), keys.end(), [](const auto *lhs, const auto *rhs) { return *lhs < *rhs; });

  std::string buffer;
  buffer.reserve(kHeaderSize + vectors_.size() * (32 + dimensions_ * sizeof(float)));
  buffer.append(kMagic.data(), kMagic.size());
  append_le<std::uint16_t>(buffer, kVersion);
  append_le<std::uint16_t>(buffer, 0);
  append_le<std::uint64_t>(buffer, dimensions_);
  append_le<std::uint64_t>(buffer, vectors_.size());

  for (const auto *key : keys) {
    append_le<std::uint32_t>(buffer, static_cast<std::uint32_t>(key->size()));
    buffer.append(*key);
    for (const float value : *vectors_.at(*key)) {
      std::uint32_t bits = 0;
      static_assert(sizeof(bits) == sizeof(value));
      std::memcpy(&bits, &value, sizeof(bits));
      append_le<std::uint32_t>(buffer, bits);
    }
  }

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return common::Status::error(common::ErrorCode::IoError,
                                 "failed to open " + path.string() + " for write");
  }
  out.write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
  out.flush();
  return out ? common::Status::success()
             : common::Status::error(common::ErrorCode::IoError,
                                     "failed to write " + path.string());
}

common::Result<VectorIndex> VectorIndex::load(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return corrupt("cannot open " + path.string());
  }
  const std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

  if (bytes.size() < kHeaderSize || !std::equal(kMagic.begin(), kMagic.end(), bytes.begin())) {
    return corrupt("bad magic");
  }
  std::size_t offset = kMagic.size();
  std::uint16_t version = 0;
  std::uint16_t reserved = 0;
  std::uint64_t dims = 0;
  std::uint64_t count = 0;
  (void)read_le(bytes, offset, version);
  (void)read_le(bytes, offset, reserved);
  (void)read_le(bytes, offset, dims);
  (void)read_le(bytes, offset, count);
  if (version != kVersion) {
    return corrupt("unsupported version " + std::to_string(version));
  }
  if (dims == 0 || dims > (1U << 20U)) {
    return corrupt("invalid dimensions " + std::to_string(dims));
  }

  VectorIndex index(static_cast<std::size_t>(dims));
  for (std::uint64_t i = 0; i < count; ++i) {
    std::uint32_t key_size = 0;
    if (!read_le(bytes, offset, key_size) || offset + key_size > bytes.size()) {
      return corrupt("truncated key at record " + std::to_string(i));
    }
    std::string key = bytes.substr(offset, key_size);
    offset += key_size;

    std::vector<float> embedding(static_cast<std::size_t>(dims));
    for (auto &value : embedding) {
      std::uint32_t bits = 0;
      if (!read_le(bytes, offset, bits)) {
        return corrupt("truncated vector at record " + std::to_string(i));
      }
      std::memcpy(&value, &bits, sizeof(value));
    }
    if (index.contains(key)) {
      return corrupt("duplicate key " + key);
    }
    (void)index.add(key, std::move(embedding));
  }
  if (offset != bytes.size()) {
    return corrupt("trailing bytes after " + std::to_string(count) + " records");
  }

  return common::Result<VectorIndex>::success(std::move(index));
}

} // namespace newsdesk::index
