#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace newsdesk::config {

struct EmbeddingConfig {
  std::string strategy = "openai";
  std::string model = "text-embedding-3-large";
  std::size_t dimensions = 3072;
  std::string base_url = "https://api.openai.com/v1";
  std::uint64_t timeout_ms = 30'000;
  std::size_t batch_size = 128;
};

struct LlmConfig {
  std::string model = "gpt-4o-mini";
  std::string base_url = "https://api.openai.com/v1";
  double temperature = 0.3;
  std::uint32_t max_tokens = 2000;
  std::uint64_t timeout_ms = 60'000;
};

struct CacheConfig {
  std::size_t capacity = 10'000;
  std::uint64_t ttl_seconds = 3600;
};

struct RetrievalConfig {
  std::size_t top_k = 5;
  std::size_t per_category_k = 2;
  std::size_t context_max_chars = 18'000;
  std::size_t chunk_size = 900;
  std::size_t chunk_overlap = 120;
};

struct TaxonomyConfig {
  std::vector<std::string> categories = {"Premium",    "Economy",  "Markets",
                                         "Law",        "Technology", "Business",
                                         "RealEstate", "Jobs",     "PersonalFinance"};
};

struct PersistenceConfig {
  std::string root = "~/.newsdesk/index";
  std::size_t keep_snapshots = 2;
};

struct BackupConfig {
  std::uint64_t max_bundle_bytes = 250ULL * 1024ULL * 1024ULL;
};

struct ReliabilityConfig {
  std::uint32_t max_retries = 3;
  std::uint64_t initial_backoff_ms = 200;
  std::uint64_t max_backoff_ms = 5'000;
  std::uint32_t breaker_failure_threshold = 5;
  std::uint64_t breaker_open_ms = 30'000;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  std::optional<std::string> api_key;
  EmbeddingConfig embedding;
  LlmConfig llm;
  CacheConfig cache;
  RetrievalConfig retrieval;
  TaxonomyConfig taxonomy;
  PersistenceConfig persistence;
  BackupConfig backup;
  ReliabilityConfig reliability;
  ObservabilityConfig observability;
};

} // namespace newsdesk::config
