#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mockprom {

enum class ScenarioType { Healthy, HighErrors, LatencySpike, GradualDegradation };

struct Scenario {
    ScenarioType type;
    std::string description;

    double error_rate_start;
    double error_rate_end;
    std::chrono::nanoseconds error_rate_duration;

    double latency_start;
    double latency_end;
    std::chrono::nanoseconds latency_duration;

    double up;

    std::string name() const;

    // Linear from start to end over error_rate_duration, then held at end.
    double calculate_error_rate(std::chrono::nanoseconds elapsed) const;
    // Quadratic (progress^2) from start to end over latency_duration, then held at end.
    double calculate_latency(std::chrono::nanoseconds elapsed) const;
    double calculate_up() const;
};

const char* scenario_type_name(ScenarioType t);
std::optional<ScenarioType> parse_scenario_type(std::string_view name);

const std::vector<Scenario>& all_scenarios();
const Scenario& get_scenario(ScenarioType t);
// Unknown names resolve to the healthy scenario.
const Scenario& get_scenario(std::string_view name);

std::vector<std::string> valid_scenario_names();
bool is_valid_scenario_name(std::string_view name);

}
