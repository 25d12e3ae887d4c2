#include <iostream>
#include <string>
#include <chrono>
#include <vector>
#include "mockprom/Scenario.h"
#include "test_util.h"

using namespace mockprom;
using namespace std::chrono_literals;

int main() {
    
    {
        const auto& all = all_scenarios();
        if (all.size() != 4) { std::cerr << "expected 4 scenarios got " << all.size() << "\n"; return 1; }
        std::vector<std::string> expected = {"healthy", "high-errors", "latency-spike", "gradual-degradation"};
        auto names = valid_scenario_names();
        if (names != expected) { std::cerr << "valid_scenario_names order mismatch\n"; return 1; }
        for (size_t i = 0; i < all.size(); ++i) {
            if (all[i].name() != expected[i]) { std::cerr << "catalog order mismatch at " << i << "\n"; return 1; }
            if (all[i].description.empty()) { std::cerr << "empty description for " << expected[i] << "\n"; return 1; }
        }
    }

    
    {
        if (get_scenario("nope").type != ScenarioType::Healthy) { std::cerr << "unknown name did not fall back to healthy\n"; return 1; }
        if (get_scenario("").type != ScenarioType::Healthy) { std::cerr << "empty name did not fall back to healthy\n"; return 1; }
        if (get_scenario("HIGH-ERRORS").type != ScenarioType::Healthy) { std::cerr << "lookup must be case-sensitive\n"; return 1; }
        if (get_scenario("latency-spike").type != ScenarioType::LatencySpike) { std::cerr << "latency-spike lookup failed\n"; return 1; }
        if (is_valid_scenario_name("nope") || !is_valid_scenario_name("gradual-degradation")) { std::cerr << "is_valid_scenario_name wrong\n"; return 1; }
        if (parse_scenario_type("high-errors") != ScenarioType::HighErrors) { std::cerr << "parse_scenario_type wrong\n"; return 1; }
    }

    
    {
        const auto& h = get_scenario(ScenarioType::Healthy);
        if (!approx_eq(h.calculate_error_rate(0ns), 0.1)) { std::cerr << "healthy error rate != 0.1\n"; return 1; }
        if (!approx_eq(h.calculate_latency(0ns), 100.0)) { std::cerr << "healthy latency != 100\n"; return 1; }
        if (!approx_eq(h.calculate_up(), 1.0)) { std::cerr << "healthy up != 1\n"; return 1; }
    }

    
    for (const auto& s : all_scenarios()) {
        for (auto e : {std::chrono::nanoseconds(0), std::chrono::nanoseconds(1min), std::chrono::nanoseconds(24h * 365)}) {
            if (s.error_rate_duration.count() == 0 && s.calculate_error_rate(e) != s.error_rate_start) {
                std::cerr << s.name() << " constant error rate drifted\n"; return 1;
            }
            if (s.latency_duration.count() == 0 && s.calculate_latency(e) != s.latency_start) {
                std::cerr << s.name() << " constant latency drifted\n"; return 1;
            }
        }
        if (s.error_rate_duration.count() > 0) {
            if (s.calculate_error_rate(0ns) != s.error_rate_start) { std::cerr << s.name() << " error rate at 0 != start\n"; return 1; }
            if (s.calculate_error_rate(s.error_rate_duration) != s.error_rate_end) { std::cerr << s.name() << " error rate at duration != end\n"; return 1; }
            if (s.calculate_error_rate(s.error_rate_duration + 1h) != s.error_rate_end) { std::cerr << s.name() << " error rate not clamped\n"; return 1; }
        }
        if (s.latency_duration.count() > 0) {
            if (s.calculate_latency(0ns) != s.latency_start) { std::cerr << s.name() << " latency at 0 != start\n"; return 1; }
            if (s.calculate_latency(s.latency_duration) != s.latency_end) { std::cerr << s.name() << " latency at duration != end\n"; return 1; }
            if (s.calculate_latency(s.latency_duration + 1h) != s.latency_end) { std::cerr << s.name() << " latency not clamped\n"; return 1; }
        }
    }

    
    {
        const auto& he = get_scenario(ScenarioType::HighErrors);
        double v = he.calculate_error_rate(5min);
        if (!approx_eq(v, 25.0)) { std::cerr << "high-errors at 5m expected 25 got " << v << "\n"; return 1; }
        double mid = he.calculate_error_rate(150s);
        if (!approx_eq(mid, 15.0)) { std::cerr << "high-errors at 2m30s expected 15 got " << mid << "\n"; return 1; }
    }

    
    {
        const auto& ls = get_scenario(ScenarioType::LatencySpike);
        double half = ls.calculate_latency(90s);
        double expected = 150.0 + (2000.0 - 150.0) * 0.25;
        if (!approx_eq(half, expected)) { std::cerr << "latency-spike midpoint expected " << expected << " got " << half << "\n"; return 1; }

        double prev = -1.0;
        for (int sec = 0; sec <= 240; ++sec) {
            double v = ls.calculate_latency(std::chrono::seconds(sec));
            if (v < prev) { std::cerr << "latency decreased at " << sec << "s: " << v << " < " << prev << "\n"; return 1; }
            if (v > ls.latency_end) { std::cerr << "latency overshoot at " << sec << "s\n"; return 1; }
            prev = v;
        }
    }

    
    {
        const auto& gd = get_scenario(ScenarioType::GradualDegradation);
        if (gd.calculate_error_rate(-5s) != gd.error_rate_start) { std::cerr << "negative elapsed not treated as 0\n"; return 1; }
        if (gd.calculate_latency(-5s) != gd.latency_start) { std::cerr << "negative elapsed latency not treated as 0\n"; return 1; }
    }

    std::cout << "scenario_unit ok\n";
    return 0;
}
