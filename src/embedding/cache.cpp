#include "newsdesk/embedding/cache.hpp"

#include "newsdesk/common/hash.hpp"

#include <algorithm>

namespace newsdesk::embedding {

EmbeddingCache::EmbeddingCache(std::shared_ptr<IEmbeddingProvider> provider,
                               const CacheOptions options, common::SteadyClock clock)
    : provider_(std::move(provider)), options_(options), clock_(std::move(clock)) {
  options_.capacity = std::max<std::size_t>(options_.capacity, 1);
}

std::string EmbeddingCache::key_for(const std::string &text) const {
  return common::sha256_hex(provider_->model_id() + ":" + text);
}

std::optional<Vector> EmbeddingCache::lookup_locked(const std::string &key) {
  const auto found = index_.find(key);
  if (found == index_.end()) {
    ++misses_;
    return std::nullopt;
  }

  const auto now = clock_();
  auto entry = found->second;
  if (now - entry->created_at >= options_.ttl) {
    lru_.erase(entry);
    index_.erase(found);
    ++expirations_;
    ++misses_;
    return std::nullopt;
  }

  entry->last_accessed_at = now;
  lru_.splice(lru_.begin(), lru_, entry);
  ++hits_;
  return entry->vector;
}

void EmbeddingCache::store_locked(const std::string &key, Vector vector) {
  const auto now = clock_();
  if (const auto found = index_.find(key); found != index_.end()) {
    // Another caller computed the same key meanwhile; keep the newer value.
    found->second->vector = std::move(vector);
    found->second->created_at = now;
    found->second->last_accessed_at = now;
    lru_.splice(lru_.begin(), lru_, found->second);
    return;
  }

  lru_.push_front(Entry{.key = key,
                        .vector = std::move(vector),
                        .created_at = now,
                        .last_accessed_at = now});
  index_[key] = lru_.begin();

  while (lru_.size() > options_.capacity) {
    index_.erase(lru_.back().key);
    lru_.pop_back();
    ++evictions_;
  }
}

common::Result<Vector> EmbeddingCache::get_or_compute(const std::string &text) {
  const std::string key = key_for(text);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto cached = lookup_locked(key); cached.has_value()) {
      return common::Result<Vector>::success(std::move(*cached));
    }
  }

  auto computed = provider_->embed(text);
  if (!computed.ok()) {
    return computed;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  store_locked(key, computed.value());
  return computed;
}

common::Result<std::vector<Vector>>
EmbeddingCache::get_or_compute_batch(const std::vector<std::string> &texts,
                                     const std::size_t batch_size) {
  using BatchResult = common::Result<std::vector<Vector>>;

  std::vector<std::string> keys;
  keys.reserve(texts.size());
  for (const auto &text : texts) {
    keys.push_back(key_for(text));
  }

  std::vector<std::optional<Vector>> resolved(texts.size());
  std::vector<std::string> pending_texts;
  std::vector<std::string> pending_keys;
  std::unordered_map<std::string, std::size_t> pending_slot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (std::size_t i = 0; i < texts.size(); ++i) {
      if (pending_slot.contains(keys[i])) {
        continue;
      }
      resolved[i] = lookup_locked(keys[i]);
      if (!resolved[i].has_value()) {
        pending_slot.emplace(keys[i], pending_texts.size());
        pending_texts.push_back(texts[i]);
        pending_keys.push_back(keys[i]);
      }
    }
  }

  std::vector<Vector> computed;
  computed.reserve(pending_texts.size());
  const std::size_t step = std::max<std::size_t>(batch_size, 1);
  for (std::size_t start = 0; start < pending_texts.size(); start += step) {
    const std::size_t end = std::min(pending_texts.size(), start + step);
    const std::vector<std::string> slice(
        pending_texts.begin() + static_cast<std::ptrdiff_t>(start),
        pending_texts.begin() + static_cast<std::ptrdiff_t>(end));
    auto batch = provider_->embed_batch(slice);
    if (!batch.ok()) {
      return BatchResult::failure(batch.error_detail());
    }
    if (batch.value().size() != slice.size()) {
      return BatchResult::failure(common::ErrorCode::ProviderUnavailable,
                                  "embedding batch returned " +
                                      std::to_string(batch.value().size()) + " vectors for " +
                                      std::to_string(slice.size()) + " texts");
    }
    for (auto &vector : batch.value()) {
      computed.push_back(std::move(vector));
    }
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (std::size_t i = 0; i < pending_keys.size(); ++i) {
      store_locked(pending_keys[i], computed[i]);
    }
  }

  std::vector<Vector> out;
  out.reserve(texts.size());
  for (std::size_t i = 0; i < texts.size(); ++i) {
    if (resolved[i].has_value()) {
      out.push_back(std::move(*resolved[i]));
    } else {
      out.push_back(computed[pending_slot.at(keys[i])]);
    }
  }
  return BatchResult::success(std::move(out));
}

CacheStats EmbeddingCache::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return CacheStats{.size = lru_.size(),
                    .capacity = options_.capacity,
                    .hits = hits_,
                    .misses = misses_,
                    .evictions = evictions_,
                    .expirations = expirations_};
}

void EmbeddingCache::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  lru_.clear();
  index_.clear();
}

} // namespace newsdesk::embedding
