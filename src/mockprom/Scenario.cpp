#include "Scenario.h"

namespace mockprom {

using namespace std::chrono_literals;

static double progress_of(std::chrono::nanoseconds elapsed, std::chrono::nanoseconds duration) {
    if (elapsed.count() < 0) return 0.0;
    return static_cast<double>(elapsed.count()) / static_cast<double>(duration.count());
}

double Scenario::calculate_error_rate(std::chrono::nanoseconds elapsed) const {
    if (error_rate_duration.count() <= 0) return error_rate_start;
    double p = progress_of(elapsed, error_rate_duration);
    if (p >= 1.0) return error_rate_end;
    return error_rate_start + (error_rate_end - error_rate_start) * p;
}

double Scenario::calculate_latency(std::chrono::nanoseconds elapsed) const {
    if (latency_duration.count() <= 0) return latency_start;
    double p = progress_of(elapsed, latency_duration);
    if (p >= 1.0) return latency_end;
    return latency_start + (latency_end - latency_start) * p * p;
}

double Scenario::calculate_up() const { return up; }

std::string Scenario::name() const { return scenario_type_name(type); }

const char* scenario_type_name(ScenarioType t) {
    switch (t) {
        case ScenarioType::Healthy: return "healthy";
        case ScenarioType::HighErrors: return "high-errors";
        case ScenarioType::LatencySpike: return "latency-spike";
        case ScenarioType::GradualDegradation: return "gradual-degradation";
    }
    return "healthy";
}

std::optional<ScenarioType> parse_scenario_type(std::string_view name) {
    for (const auto& s : all_scenarios()) {
        if (name == scenario_type_name(s.type)) return s.type;
    }
    return std::nullopt;
}

const std::vector<Scenario>& all_scenarios() {
    static const std::vector<Scenario> catalog = {
        {ScenarioType::Healthy, "Healthy application with minimal errors and low latency",
         0.1, 0.1, 0ns,
         100, 100, 0ns,
         1},
        {ScenarioType::HighErrors, "High error rate that progressively increases",
         5.0, 25.0, 5min,
         200, 200, 0ns,
         1},
        {ScenarioType::LatencySpike, "Latency spike with gradual increase",
         0.5, 0.5, 0ns,
         150, 2000, 3min,
         1},
        {ScenarioType::GradualDegradation, "Both errors and latency degrade over time",
         0.5, 15.0, 10min,
         120, 800, 10min,
         1},
    };
    return catalog;
}

const Scenario& get_scenario(ScenarioType t) {
    for (const auto& s : all_scenarios()) {
        if (s.type == t) return s;
    }
    return all_scenarios().front();
}

const Scenario& get_scenario(std::string_view name) {
    auto t = parse_scenario_type(name);
    return get_scenario(t.value_or(ScenarioType::Healthy));
}

std::vector<std::string> valid_scenario_names() {
    std::vector<std::string> out;
    out.reserve(all_scenarios().size());
    for (const auto& s : all_scenarios()) out.emplace_back(scenario_type_name(s.type));
    return out;
}

bool is_valid_scenario_name(std::string_view name) {
    return parse_scenario_type(name).has_value();
}

}
