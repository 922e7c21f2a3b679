#include "newsdesk/observability/factory.hpp"

#include "newsdesk/common/fs.hpp"
#include "newsdesk/observability/log_observer.hpp"

#include <sstream>

namespace newsdesk::observability {

namespace {

std::unique_ptr<IObserver> create_single(const std::string &backend) {
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  if (backend == "log:debug") {
    return std::make_unique<LogObserver>(LogLevel::Debug);
  }
  if (backend == "log:warn") {
    return std::make_unique<LogObserver>(LogLevel::Warn);
  }
  return std::make_unique<LogObserver>(LogLevel::Info);
}

} // namespace

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer != nullptr) {
    observers_.push_back(std::move(observer));
  }
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for (auto &observer : observers_) {
    observer->record_event(event);
  }
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for (auto &observer : observers_) {
    observer->record_metric(metric);
  }
}

void MultiObserver::flush() {
  for (auto &observer : observers_) {
    observer->flush();
  }
}

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.find(',') == std::string::npos) {
    return create_single(backend);
  }

  auto multi = std::make_unique<MultiObserver>();
  std::stringstream stream(backend);
  std::string part;
  while (std::getline(stream, part, ',')) {
    multi->add(create_single(common::trim(part)));
  }
  return multi;
}

} // namespace newsdesk::observability
