#include "test_framework.hpp"

#include "newsdesk/config/schema.hpp"
#include "newsdesk/observability/factory.hpp"
#include "newsdesk/observability/global.hpp"
#include "newsdesk/observability/log_observer.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <memory>
#include <sstream>
#include <string>

namespace {

struct CounterState {
  int events = 0;
  int metrics = 0;
  int flushes = 0;
};

class CountingObserver final : public newsdesk::observability::IObserver {
public:
  explicit CountingObserver(CounterState *state) : state_(state) {}

  void record_event(const newsdesk::observability::ObserverEvent &) override { ++state_->events; }
  void record_metric(const newsdesk::observability::ObserverMetric &) override {
    ++state_->metrics;
  }
  void flush() override { ++state_->flushes; }
  [[nodiscard]] std::string_view name() const override { return "counting"; }

private:
  CounterState *state_ = nullptr;
};

} // namespace

void register_observability_tests(std::vector<newsdesk::tests::TestCase> &tests) {
  using newsdesk::tests::require;
  namespace ob = newsdesk::observability;

  tests.push_back({"observability_global_noop", [] {
                     ob::set_global_observer(std::make_unique<ob::NoopObserver>());
                     require(ob::get_global_observer() != nullptr, "observer should be set");
                     require(ob::get_global_observer()->name() == "noop", "expected noop observer");

                     ob::record_ingest("doc-1", "Markets", false);
                     ob::record_query_latency("focused", std::chrono::milliseconds(5));
                     ob::record_metric(ob::IndexSizeMetric{.documents = 42});

                     // Reset to prevent dangling references during static destruction
                     ob::set_global_observer(nullptr);
                   }});

  tests.push_back({"observability_record_without_observer_is_safe", [] {
                     ob::set_global_observer(nullptr);
                     ob::record_error("test", "nobody listening");
                     ob::record_metric(ob::CacheStatsMetric{.hits = 1});
                   }});

  tests.push_back({"observability_multi_forwards_to_children", [] {
                     CounterState one;
                     CounterState two;
                     auto multi = std::make_unique<ob::MultiObserver>();
                     multi->add(std::make_unique<CountingObserver>(&one));
                     multi->add(std::make_unique<CountingObserver>(&two));
                     require(multi->size() == 2, "two children");

                     multi->record_event(ob::SnapshotLoadedEvent{.snapshot_id = "s", .documents = 1});
                     multi->record_metric(ob::QueryLatencyMetric{.mode = "focused"});
                     multi->flush();
                     require(one.events == 1 && two.events == 1, "events forwarded");
                     require(one.metrics == 1 && two.metrics == 1, "metrics forwarded");
                     require(one.flushes == 1 && two.flushes == 1, "flush forwarded");
                   }});

  tests.push_back({"observability_factory_backends", [] {
                     newsdesk::config::Config config;
                     config.observability.backend = "none";
                     require(ob::create_observer(config)->name() == "noop", "none -> noop");
                     config.observability.backend = "log";
                     require(ob::create_observer(config)->name() == "log", "log -> log");
                     config.observability.backend = "log, none";
                     require(ob::create_observer(config)->name() == "multi", "list -> multi");
                   }});

  tests.push_back({"observability_log_lines_have_level_prefix", [] {
                     std::ostringstream out;
                     ob::LogObserver log(out, ob::LogLevel::Info);
                     log.record_event(ob::IndexPublishedEvent{.documents = 3, .added = 2});
                     log.record_event(ob::WarningEvent{.component = "config", .message = "slow"});
                     log.record_event(ob::ErrorEvent{.component = "load", .message = "corrupt"});
                     const std::string text = out.str();
                     require(text.find("[INFO] index.published documents=3 added=2 removed=0") !=
                                 std::string::npos,
                             "info line: " + text);
                     require(text.find("[WARN] config: slow") != std::string::npos, "warn line");
                     require(text.find("[ERROR] load: corrupt") != std::string::npos, "error line");
                   }});

  tests.push_back({"observability_log_drops_lines_below_min_level", [] {
                     std::ostringstream out;
                     ob::LogObserver log(out, ob::LogLevel::Warn);
                     log.record_event(ob::IngestEvent{.document_id = "doc-1", .category = "Law"});
                     log.record_metric(ob::CacheStatsMetric{.hits = 3});
                     log.record_event(ob::CircuitStateEvent{.breaker = "chat", .open = true});
                     const std::string text = out.str();
                     require(text.find("ingest") == std::string::npos, "debug line dropped");
                     require(text.find("metric") == std::string::npos, "metric dropped");
                     require(text.find("[WARN] circuit.chat open") != std::string::npos,
                             "warn kept");
                   }});

  tests.push_back({"observability_recorder_captures_global_events", [] {
                     newsdesk::testing::ScopedRecorder recorder;
                     ob::record_warning("config", "context budget small");
                     ob::record_bundle("export", "/tmp/x.tar", 10, true);
                     const auto warnings = recorder.events().of<ob::WarningEvent>();
                     require(warnings.size() == 1, "one warning");
                     require(warnings.front().component == "config", "component kept");
                     require(recorder.events().of<ob::BundleEvent>().size() == 1, "bundle event");
                   }});
}
