#include "newsdesk/observability/global.hpp"

#include <mutex>

namespace newsdesk::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_ingest(const std::string &document_id, const std::string &category,
                   const bool duplicate) {
  record_event(
      IngestEvent{.document_id = document_id, .category = category, .duplicate = duplicate});
}

void record_index_published(const std::uint64_t documents, const std::uint64_t added,
                            const std::uint64_t removed) {
  record_event(IndexPublishedEvent{.documents = documents, .added = added, .removed = removed});
  record_metric(IndexSizeMetric{.documents = documents});
}

void record_snapshot_saved(const std::string &snapshot_id, const std::uint64_t documents,
                           const std::chrono::milliseconds duration) {
  record_event(SnapshotSavedEvent{
      .snapshot_id = snapshot_id, .documents = documents, .duration = duration});
}

void record_snapshot_loaded(const std::string &snapshot_id, const std::uint64_t documents) {
  record_event(SnapshotLoadedEvent{.snapshot_id = snapshot_id, .documents = documents});
}

void record_bundle(const std::string &action, const std::string &path, const std::uint64_t bytes,
                   const bool success, const std::string &detail) {
  record_event(BundleEvent{
      .action = action, .path = path, .bytes = bytes, .success = success, .detail = detail});
}

void record_provider_call(const std::string &kind, const std::string &provider,
                          const std::chrono::milliseconds duration, const bool success) {
  record_event(ProviderCallEvent{
      .kind = kind, .provider = provider, .duration = duration, .success = success});
}

void record_circuit_state(const std::string &breaker, const bool open) {
  record_event(CircuitStateEvent{.breaker = breaker, .open = open});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

void record_query_latency(const std::string &mode, const std::chrono::milliseconds latency) {
  record_metric(QueryLatencyMetric{.mode = mode, .latency = latency});
}

} // namespace newsdesk::observability
