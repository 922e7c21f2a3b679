#pragma once

#include "newsdesk/observability/observer.hpp"

#include <memory>

namespace newsdesk::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_ingest(const std::string &document_id, const std::string &category, bool duplicate);
void record_index_published(std::uint64_t documents, std::uint64_t added, std::uint64_t removed);
void record_snapshot_saved(const std::string &snapshot_id, std::uint64_t documents,
                           std::chrono::milliseconds duration);
void record_snapshot_loaded(const std::string &snapshot_id, std::uint64_t documents);
void record_bundle(const std::string &action, const std::string &path, std::uint64_t bytes,
                   bool success, const std::string &detail = "");
void record_provider_call(const std::string &kind, const std::string &provider,
                          std::chrono::milliseconds duration, bool success);
void record_circuit_state(const std::string &breaker, bool open);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

void record_query_latency(const std::string &mode, std::chrono::milliseconds latency);

} // namespace newsdesk::observability
