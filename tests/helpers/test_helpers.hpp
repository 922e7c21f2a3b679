#pragma once

#include "newsdesk/common/time.hpp"
#include "newsdesk/config/schema.hpp"
#include "newsdesk/embedding/local_hash_embedder.hpp"
#include "newsdesk/embedding/provider.hpp"
#include "newsdesk/index/index_state.hpp"
#include "newsdesk/observability/observer.hpp"
#include "newsdesk/providers/traits.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace newsdesk::testing {

/// local_hash embeddings, no observer, index rooted under `root`.
config::Config mock_config(const std::filesystem::path &root);

/// Wraps the local hash embedder and counts how many texts reach it.
class CountingEmbedder final : public embedding::IEmbeddingProvider {
public:
  explicit CountingEmbedder(std::size_t dimensions = 64, std::string model_id = "");

  [[nodiscard]] std::string_view name() const override { return "counting"; }
  [[nodiscard]] std::string model_id() const override;
  [[nodiscard]] std::size_t dimensions() const override { return inner_.dimensions(); }
  [[nodiscard]] common::Result<embedding::Vector> embed(std::string_view text) override;
  [[nodiscard]] common::Result<std::vector<embedding::Vector>>
  embed_batch(const std::vector<std::string> &texts) override;

  void set_failing(bool failing) { failing_.store(failing); }
  /// Returns vectors of the wrong length.
  void set_wrong_dimensions(bool wrong) { wrong_dimensions_.store(wrong); }

  [[nodiscard]] std::size_t texts_embedded() const { return texts_embedded_.load(); }
  [[nodiscard]] std::size_t calls() const { return calls_.load(); }

private:
  embedding::LocalHashEmbedder inner_;
  std::string model_id_;
  std::atomic<bool> failing_{false};
  std::atomic<bool> wrong_dimensions_{false};
  std::atomic<std::size_t> texts_embedded_{0};
  std::atomic<std::size_t> calls_{0};
};

/// Replays queued results, then falls back to a fixed response.
class ScriptedProvider final : public providers::Provider {
public:
  void push(common::Result<std::string> result);
  void set_response(std::string response);
  void set_error(std::string message);

  [[nodiscard]] common::Result<std::string> chat(const providers::ChatRequest &request) override;
  [[nodiscard]] std::string name() const override { return "scripted"; }

  [[nodiscard]] std::size_t calls() const;
  [[nodiscard]] std::optional<providers::ChatRequest> last_request() const;

private:
  mutable std::mutex mutex_;
  std::deque<common::Result<std::string>> queued_;
  std::string response_ = "scripted answer";
  std::optional<std::string> error_;
  std::size_t calls_ = 0;
  std::optional<providers::ChatRequest> last_request_;
};

class MockHttpClient final : public providers::HttpClient {
public:
  std::deque<providers::HttpResponse> responses;
  providers::HttpResponse fallback;
  std::vector<std::string> bodies;
  std::string last_url;
  providers::HttpHeaders last_headers;

  [[nodiscard]] providers::HttpResponse post_json(const std::string &url,
                                                  const providers::HttpHeaders &headers,
                                                  const std::string &body,
                                                  std::uint64_t timeout_ms) override;
};

/// Steady and wall clock that only move when told to.
class ManualClock {
public:
  void advance(std::chrono::milliseconds delta);

  [[nodiscard]] common::SteadyClock steady();
  [[nodiscard]] common::WallClock wall();

private:
  std::atomic<std::int64_t> offset_ms_{0};
};

struct RecordedEvents {
  std::mutex mutex;
  std::vector<observability::ObserverEvent> events;
  std::vector<observability::ObserverMetric> metrics;

  template <typename T> std::vector<T> of() {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<T> out;
    for (const auto &event : events) {
      if (const auto *typed = std::get_if<T>(&event); typed != nullptr) {
        out.push_back(*typed);
      }
    }
    return out;
  }
};

class RecordingObserver final : public observability::IObserver {
public:
  explicit RecordingObserver(std::shared_ptr<RecordedEvents> sink) : sink_(std::move(sink)) {}

  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

private:
  std::shared_ptr<RecordedEvents> sink_;
};

/// Installs a RecordingObserver as the global observer for its lifetime.
class ScopedRecorder {
public:
  ScopedRecorder();
  ~ScopedRecorder();

  ScopedRecorder(const ScopedRecorder &) = delete;
  ScopedRecorder &operator=(const ScopedRecorder &) = delete;

  [[nodiscard]] RecordedEvents &events() { return *sink_; }

private:
  std::shared_ptr<RecordedEvents> sink_;
};

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

[[nodiscard]] std::string read_text(const std::filesystem::path &path);

/// Consistent state over (text, category) pairs embedded with 64-dim local hash.
[[nodiscard]] index::IndexState
make_index_state(const std::vector<std::pair<std::string, std::string>> &items);

/// Three documents across Markets, Law and RealEstate.
[[nodiscard]] index::IndexState sample_index_state();

} // namespace newsdesk::testing
