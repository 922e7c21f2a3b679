#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace newsdesk::observability {

struct IngestEvent {
  std::string document_id;
  std::string category;
  bool duplicate = false;
};

struct IndexPublishedEvent {
  std::uint64_t documents = 0;
  std::uint64_t added = 0;
  std::uint64_t removed = 0;
};

struct SnapshotSavedEvent {
  std::string snapshot_id;
  std::uint64_t documents = 0;
  std::chrono::milliseconds duration{0};
};

struct SnapshotLoadedEvent {
  std::string snapshot_id;
  std::uint64_t documents = 0;
};

struct BundleEvent {
  std::string action;
  std::string path;
  std::uint64_t bytes = 0;
  bool success = false;
  std::string detail;
};

struct ProviderCallEvent {
  std::string kind;
  std::string provider;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct CircuitStateEvent {
  std::string breaker;
  bool open = false;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<IngestEvent, IndexPublishedEvent, SnapshotSavedEvent, SnapshotLoadedEvent,
                 BundleEvent, ProviderCallEvent, CircuitStateEvent, WarningEvent, ErrorEvent>;

struct QueryLatencyMetric {
  std::string mode;
  std::chrono::milliseconds latency{0};
};

struct CacheStatsMetric {
  std::uint64_t hits = 0;
  std::uint64_t misses = 0;
  std::uint64_t size = 0;
};

struct IndexSizeMetric {
  std::uint64_t documents = 0;
};

using ObserverMetric = std::variant<QueryLatencyMetric, CacheStatsMetric, IndexSizeMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

} // namespace newsdesk::observability
