#include "ScenarioEngine.h"
#include "observability/Logging.h"

#include <cstdio>
#include <mutex>

namespace mockprom {

using observability::log_info;

ScenarioEngine::ScenarioEngine(std::string_view initial_scenario, std::shared_ptr<Clock> clock)
    : clock_(clock ? std::move(clock) : make_system_clock()), scenario_(get_scenario(initial_scenario)), start_time_(clock_->now()) {
    log_info("mock_prometheus_initialized", {{"scenario", scenario_.name()}, {"description", scenario_.description}});
}

ScenarioEngine::Snapshot ScenarioEngine::snapshot() const {
    std::shared_lock lock(mu_);
    return Snapshot{scenario_, start_time_};
}

MetricValues ScenarioEngine::compute(const Scenario& s, std::chrono::nanoseconds elapsed) {
    MetricValues m;
    m.error_rate = s.calculate_error_rate(elapsed);
    m.latency = s.calculate_latency(elapsed);
    m.up = s.calculate_up();
    return m;
}

MetricValues ScenarioEngine::get_current_metrics() const {
    auto snap = snapshot();
    auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(clock_->now() - snap.start_time);
    return compute(snap.scenario, elapsed);
}

ScenarioStatus ScenarioEngine::get_status() const {
    auto snap = snapshot();
    auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(clock_->now() - snap.start_time);
    ScenarioStatus st;
    st.type = snap.scenario.type;
    st.name = snap.scenario.name();
    st.description = snap.scenario.description;
    st.start_time = snap.start_time;
    st.elapsed = format_duration(elapsed);
    st.metrics = compute(snap.scenario, elapsed);
    return st;
}

void ScenarioEngine::set_scenario(std::string_view name) {
    set_scenario(get_scenario(name).type);
}

void ScenarioEngine::set_scenario(ScenarioType type) {
    const Scenario& next = get_scenario(type);
    {
        std::unique_lock lock(mu_);
        scenario_ = next;
        start_time_ = clock_->now();
    }
    log_info("scenario_changed", {{"scenario", next.name()}, {"description", next.description}});
}

void ScenarioEngine::reset_timer() {
    std::string name;
    {
        std::unique_lock lock(mu_);
        start_time_ = clock_->now();
        name = scenario_.name();
    }
    log_info("scenario_timer_reset", {{"scenario", name}});
}

void ScenarioEngine::shutdown() {
    log_info("mock_prometheus_stopped");
}

std::string format_duration(std::chrono::nanoseconds d) {
    using namespace std::chrono;
    if (d.count() < 0) d = nanoseconds::zero();
    int64_t total = duration_cast<seconds>(d + milliseconds(500)).count();
    int64_t h = total / 3600;
    int64_t m = (total / 60) % 60;
    int64_t s = total % 60;
    char buf[64];
    if (h > 0) std::snprintf(buf, sizeof(buf), "%lldh %lldm %llds", (long long)h, (long long)m, (long long)s);
    else if (m > 0) std::snprintf(buf, sizeof(buf), "%lldm %llds", (long long)m, (long long)s);
    else std::snprintf(buf, sizeof(buf), "%llds", (long long)s);
    return std::string(buf);
}

}
