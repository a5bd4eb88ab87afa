#include "test_framework.hpp"

#include "textguard/config/schema.hpp"
#include "textguard/observability/factory.hpp"
#include "textguard/observability/global.hpp"
#include "textguard/observability/log_observer.hpp"
#include "textguard/observability/multi_observer.hpp"
#include "textguard/observability/noop_observer.hpp"
#include "textguard/observability/stats_observer.hpp"

#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace {

struct CounterState {
  int events = 0;
  int metrics = 0;
  int flushes = 0;
};

class CountingObserver final : public textguard::observability::IObserver {
public:
  explicit CountingObserver(CounterState *state) : state_(state) {}

  void record_event(const textguard::observability::ObserverEvent &) override { ++state_->events; }
  void record_metric(const textguard::observability::ObserverMetric &) override {
    ++state_->metrics;
  }
  void flush() override { ++state_->flushes; }
  [[nodiscard]] std::string_view name() const override { return "counting"; }

private:
  CounterState *state_ = nullptr;
};

} // namespace

void register_observability_tests(std::vector<textguard::tests::TestCase> &tests) {
  using textguard::tests::require;
  namespace ob = textguard::observability;

  tests.push_back({"observability_global_noop", [] {
                     ob::set_global_observer(std::make_unique<ob::NoopObserver>());
                     require(ob::get_global_observer() != nullptr, "observer should be set");
                     require(ob::get_global_observer()->name() == "noop", "expected noop observer");

                     ob::record_scan_completed("high", 3, 120, std::chrono::milliseconds(4));
                     ob::record_clean_completed(5, std::chrono::milliseconds(1));
                     ob::record_history_cleared(2);

                     ob::set_global_observer(nullptr);
                   }});

  tests.push_back({"observability_record_without_observer", [] {
                     ob::set_global_observer(nullptr);
                     require(ob::get_global_observer() == nullptr, "no observer installed");
                     ob::record_error("unit", "nobody listens");
                   }});

  tests.push_back({"observability_scan_completed_emits_metrics", [] {
                     CounterState state;
                     ob::set_global_observer(std::make_unique<CountingObserver>(&state));
                     ob::record_scan_completed("critical", 4, 64, std::chrono::milliseconds(2));
                     require(state.events == 1, "one scan event");
                     require(state.metrics == 2, "latency and findings metrics");

                     ob::record_clean_completed(-1, std::chrono::milliseconds(0));
                     ob::record_history_cleared(7);
                     require(state.events == 3, "clean and clear are events");
                     require(state.metrics == 2, "no extra metrics");

                     ob::set_global_observer(nullptr);
                   }});

  tests.push_back({"observability_multi_forwards_to_children", [] {
                     CounterState one;
                     CounterState two;
                     auto multi = std::make_unique<ob::MultiObserver>();
                     require(multi->add(std::make_unique<CountingObserver>(&one)), "first child");
                     require(!multi->add(std::make_unique<CountingObserver>(&two)),
                             "second child with the same name is refused");
                     require(!multi->add(nullptr), "null child is refused");
                     require(multi->add(std::make_unique<ob::NoopObserver>()), "other backend");
                     require(multi->size() == 2, "one child per name");
                     ob::set_global_observer(std::move(multi));
                     ob::record_event(ob::ErrorEvent{.component = "unit", .message = "boom"});
                     ob::record_metric(ob::FindingsMetric{.count = 3});
                     ob::get_global_observer()->flush();

                     require(one.events == 1, "event should be forwarded");
                     require(one.metrics == 1, "metric should be forwarded");
                     require(one.flushes == 1, "flush should be forwarded");
                     require(two.events == 0, "refused child sees nothing");

                     ob::set_global_observer(nullptr);
                   }});

  tests.push_back({"observability_factory_selects_backend", [] {
                     textguard::config::Config config;
                     config.observability.backend = "none";
                     require(ob::create_observer(config)->name() == "noop", "none maps to noop");

                     config.observability.backend = "";
                     require(ob::create_observer(config)->name() == "noop", "empty maps to noop");

                     config.observability.backend = " LOG ";
                     require(ob::create_observer(config)->name() == "log", "log backend");

                     config.observability.backend = "stats";
                     require(ob::create_observer(config)->name() == "stats", "stats backend");

                     config.observability.backend = "log, LOG,none";
                     require(ob::create_observer(config)->name() == "log",
                             "repeated names collapse to one backend");

                     config.observability.backend = "noop,none";
                     require(ob::create_observer(config)->name() == "noop", "no real backend");

                     config.observability.backend = "log,stats,log";
                     auto multi = ob::create_observer(config);
                     require(multi->name() == "multi", "two backends fan out");
                     const auto *as_multi = dynamic_cast<const ob::MultiObserver *>(multi.get());
                     require(as_multi != nullptr, "multi observer");
                     require(as_multi->backend_names() ==
                                 std::vector<std::string_view>{"log", "stats"},
                             "config order kept");
                   }});

  tests.push_back({"observability_stats_summarizes_session", [] {
                     std::ostringstream out;
                     ob::StatsObserver stats(out);
                     stats.flush();
                     require(out.str().empty(), "nothing recorded, nothing written");

                     stats.record_event(ob::ScanCompletedEvent{.threat_level = "high",
                                                               .findings = 3,
                                                               .input_chars = 40,
                                                               .duration =
                                                                   std::chrono::milliseconds(4)});
                     stats.record_event(ob::ScanCompletedEvent{.threat_level = "safe",
                                                               .findings = 0,
                                                               .input_chars = 5,
                                                               .duration =
                                                                   std::chrono::milliseconds(1)});
                     stats.record_event(ob::ScanCompletedEvent{.threat_level = "high",
                                                               .findings = 1,
                                                               .input_chars = 9,
                                                               .duration =
                                                                   std::chrono::milliseconds(0)});
                     stats.record_event(ob::CleanCompletedEvent{
                         .characters_removed = 6, .duration = std::chrono::milliseconds(2)});
                     stats.record_event(ob::ErrorEvent{.component = "history", .message = "busy"});
                     stats.record_metric(ob::FindingsMetric{.count = 3});
                     stats.flush();

                     require(out.str() == "[INFO] session scans=3 findings=4 cleans=1 "
                                          "characters_removed=6 errors=1 busy_ms=7 "
                                          "levels=high:2,safe:1\n",
                             out.str());

                     stats.flush();
                     require(out.str().find("session", 10) == std::string::npos,
                             "tally starts over after flush");
                   }});

  tests.push_back({"observability_log_observer_lines", [] {
                     std::ostringstream out;
                     ob::LogObserver observer(out);
                     observer.record_event(ob::ScanCompletedEvent{.threat_level = "high",
                                                                  .findings = 2,
                                                                  .input_chars = 30,
                                                                  .duration =
                                                                      std::chrono::milliseconds(5)});
                     observer.record_event(ob::ErrorEvent{.component = "history", .message = "disk full"});
                     observer.record_event(ob::HistoryClearedEvent{.deleted = 9});
                     observer.record_metric(ob::FindingsMetric{.count = 2});

                     const std::string text = out.str();
                     require(text.find("[INFO] scan.completed threat_level=high findings=2 "
                                       "input_chars=30 duration_ms=5\n") != std::string::npos,
                             "scan line");
                     require(text.find("[ERROR] history: disk full\n") != std::string::npos,
                             "error line");
                     require(text.find("[INFO] history.cleared deleted=9\n") != std::string::npos,
                             "history line");
                     require(text.find("[DEBUG] metric.findings=2\n") != std::string::npos,
                             "metric line");
                   }});
}
