#pragma once

#include "ScenarioEngine.h"

#include <string>
#include <vector>

namespace mockprom {

const std::vector<double>& latency_bucket_bounds();

// Cumulative counts for latency_bucket_bounds(), synthesized from a single
// latency value with a square-root curve. Non-decreasing; the last entry is
// always the full simulated request count.
std::vector<double> histogram_bucket_counts(double latency_ms);

std::string render_exposition(const MetricValues& metrics);
std::string render_exposition(const ScenarioEngine& engine);

}
