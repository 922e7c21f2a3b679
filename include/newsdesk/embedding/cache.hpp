#pragma once

#include "newsdesk/common/time.hpp"
#include "newsdesk/embedding/provider.hpp"

#include <chrono>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace newsdesk::embedding {

struct CacheOptions {
  std::size_t capacity = 10'000;
  std::chrono::seconds ttl{3600};
};

struct CacheStats {
  std::size_t size = 0;
  std::size_t capacity = 0;
  std::uint64_t hits = 0;
  std::uint64_t misses = 0;
  std::uint64_t evictions = 0;
  std::uint64_t expirations = 0;
};

/// Content-addressed embedding cache with LRU eviction and lazy TTL expiry.
/// Keys are SHA-256 of "<model_id>:<text>", so a model change never serves
/// stale vectors. The lock is never held while the provider is called.
class EmbeddingCache {
public:
  EmbeddingCache(std::shared_ptr<IEmbeddingProvider> provider, CacheOptions options,
                 common::SteadyClock clock = common::steady_now);

  [[nodiscard]] common::Result<Vector> get_or_compute(const std::string &text);

  /// Looks every text up, computes the misses in batches of `batch_size`
  /// (deduplicated), and returns vectors in input order.
  [[nodiscard]] common::Result<std::vector<Vector>>
  get_or_compute_batch(const std::vector<std::string> &texts, std::size_t batch_size);

  [[nodiscard]] CacheStats stats() const;
  void clear();

  [[nodiscard]] IEmbeddingProvider &provider() { return *provider_; }
  [[nodiscard]] const IEmbeddingProvider &provider() const { return *provider_; }

private:
  using Clock = std::chrono::steady_clock;

  struct Entry {
    std::string key;
    Vector vector;
    Clock::time_point created_at;
    Clock::time_point last_accessed_at;
  };

  [[nodiscard]] std::string key_for(const std::string &text) const;
  [[nodiscard]] std::optional<Vector> lookup_locked(const std::string &key);
  void store_locked(const std::string &key, Vector vector);

  std::shared_ptr<IEmbeddingProvider> provider_;
  CacheOptions options_;
  common::SteadyClock clock_;

  mutable std::mutex mutex_;
  std::list<Entry> lru_; // front = most recently used
  std::unordered_map<std::string, std::list<Entry>::iterator> index_;
  std::uint64_t hits_ = 0;
  std::uint64_t misses_ = 0;
  std::uint64_t evictions_ = 0;
  std::uint64_t expirations_ = 0;
};

} // namespace newsdesk::embedding
