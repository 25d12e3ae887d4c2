#pragma once

#include "Clock.h"
#include "Scenario.h"

#include <chrono>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace mockprom {

struct MetricValues {
    double error_rate = 0.0;   // percent, 0..100
    double latency = 0.0;      // milliseconds
    double up = 0.0;           // 0 or 1
};

struct ScenarioStatus {
    ScenarioType type;
    std::string name;
    std::string description;
    Clock::time_point start_time;
    std::string elapsed;
    MetricValues metrics;
};

// Holds the active scenario and the moment it became active.
//
// Both fields live behind a single shared_mutex: readers take a shared lock
// and always see a matching (scenario, start_time) pair; set_scenario and
// reset_timer take the exclusive lock and replace the pair as a unit.
// Nothing runs in the background, every value is computed on the calling
// thread from the clock.
class ScenarioEngine {
public:
    explicit ScenarioEngine(std::string_view initial_scenario, std::shared_ptr<Clock> clock = make_system_clock());
    ScenarioEngine(const ScenarioEngine&) = delete;
    ScenarioEngine& operator=(const ScenarioEngine&) = delete;

    MetricValues get_current_metrics() const;
    ScenarioStatus get_status() const;

    // Unknown names select the healthy scenario; callers that need strict
    // behavior validate with is_valid_scenario_name() first.
    void set_scenario(std::string_view name);
    void set_scenario(ScenarioType type);
    void reset_timer();
    void shutdown();

    Clock::time_point now() const { return clock_->now(); }

private:
    struct Snapshot {
        Scenario scenario;
        Clock::time_point start_time;
    };
    Snapshot snapshot() const;
    static MetricValues compute(const Scenario& s, std::chrono::nanoseconds elapsed);

    std::shared_ptr<Clock> clock_;
    mutable std::shared_mutex mu_;
    Scenario scenario_;
    Clock::time_point start_time_;
};

std::string format_duration(std::chrono::nanoseconds d);

}
