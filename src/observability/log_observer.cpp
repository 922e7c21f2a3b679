#include "newsdesk/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace newsdesk::observability {

namespace {

std::string yes_no(const bool value) { return value ? "true" : "false"; }

} // namespace

std::string_view log_level_name(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

LogObserver::LogObserver(const LogLevel min_level) : out_(&std::cerr), min_level_(min_level) {}

LogObserver::LogObserver(std::ostream &out, const LogLevel min_level)
    : out_(&out), min_level_(min_level) {}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (level < min_level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << "[" << log_level_name(level) << "] " << message << "\n";
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_->flush();
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, IngestEvent>) {
          log_line(LogLevel::Debug, "ingest id=" + evt.document_id + " category=" + evt.category +
                                        " duplicate=" + yes_no(evt.duplicate));
        } else if constexpr (std::is_same_v<T, IndexPublishedEvent>) {
          log_line(LogLevel::Info, "index.published documents=" + std::to_string(evt.documents) +
                                       " added=" + std::to_string(evt.added) +
                                       " removed=" + std::to_string(evt.removed));
        } else if constexpr (std::is_same_v<T, SnapshotSavedEvent>) {
          log_line(LogLevel::Info, "snapshot.saved id=" + evt.snapshot_id +
                                       " documents=" + std::to_string(evt.documents) +
                                       " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, SnapshotLoadedEvent>) {
          log_line(LogLevel::Info, "snapshot.loaded id=" + evt.snapshot_id +
                                       " documents=" + std::to_string(evt.documents));
        } else if constexpr (std::is_same_v<T, BundleEvent>) {
          const std::string line = "bundle." + evt.action + " path=" + evt.path +
                                   " bytes=" + std::to_string(evt.bytes) +
                                   " success=" + yes_no(evt.success) +
                                   (evt.detail.empty() ? "" : " detail=" + evt.detail);
          log_line(evt.success ? LogLevel::Info : LogLevel::Warn, line);
        } else if constexpr (std::is_same_v<T, ProviderCallEvent>) {
          log_line(evt.success ? LogLevel::Debug : LogLevel::Warn,
                   "provider." + evt.kind + " name=" + evt.provider +
                       " duration_ms=" + std::to_string(evt.duration.count()) +
                       " success=" + yes_no(evt.success));
        } else if constexpr (std::is_same_v<T, CircuitStateEvent>) {
          log_line(LogLevel::Warn, "circuit." + evt.breaker + (evt.open ? " open" : " closed"));
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line(LogLevel::Warn, evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, QueryLatencyMetric>) {
          log_line(LogLevel::Debug,
                   "metric.query_latency_ms mode=" + m.mode + " value=" +
                       std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, CacheStatsMetric>) {
          log_line(LogLevel::Debug, "metric.cache hits=" + std::to_string(m.hits) +
                                        " misses=" + std::to_string(m.misses) +
                                        " size=" + std::to_string(m.size));
        } else if constexpr (std::is_same_v<T, IndexSizeMetric>) {
          log_line(LogLevel::Debug, "metric.index_documents=" + std::to_string(m.documents));
        }
      },
      metric);
}

} // namespace newsdesk::observability
