#include "Exposition.h"
#include "QueryEvaluator.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <sstream>

namespace mockprom {

static constexpr double kMinLatencySeconds = 0.001;

static std::string fmt(const char* format, double v) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), format, v);
    return std::string(buf);
}

const std::vector<double>& latency_bucket_bounds() {
    static const std::vector<double> buckets = {0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10};
    return buckets;
}

static double floored_latency_seconds(double latency_ms) {
    return std::max(latency_ms / 1000.0, kMinLatencySeconds);
}

std::vector<double> histogram_bucket_counts(double latency_ms) {
    const double latency = floored_latency_seconds(latency_ms);
    const double total = kBaselineRequestsPerSecond;
    std::vector<double> out;
    out.reserve(latency_bucket_bounds().size());
    for (double b : latency_bucket_bounds()) {
        if (b >= latency) out.push_back(total);
        else out.push_back(total * std::sqrt(b / latency));
    }
    return out;
}

std::string render_exposition(const MetricValues& m) {
    const std::string job = std::string("job=\"") + kJobLabel + "\"";
    const double total = kBaselineRequestsPerSecond;
    std::ostringstream ss;

    ss << "# HELP " << kErrorsMetric << " Total number of HTTP request errors\n";
    ss << "# TYPE " << kErrorsMetric << " counter\n";
    ss << kErrorsMetric << "{" << job << "} " << fmt("%.2f", (m.error_rate / 100.0) * total) << "\n";
    ss << "\n";

    ss << "# HELP " << kLatencyMetric << " HTTP request latency\n";
    ss << "# TYPE " << kLatencyMetric << " histogram\n";
    const auto& bounds = latency_bucket_bounds();
    auto counts = histogram_bucket_counts(m.latency);
    for (size_t i = 0; i < bounds.size(); ++i) {
        ss << kLatencyMetric << "_bucket{" << job << ",le=\"" << fmt("%.3f", bounds[i]) << "\"} " << fmt("%.0f", counts[i]) << "\n";
    }
    ss << kLatencyMetric << "_bucket{" << job << ",le=\"+Inf\"} " << fmt("%.0f", total) << "\n";
    ss << kLatencyMetric << "_sum{" << job << "} " << fmt("%.3f", floored_latency_seconds(m.latency) * total) << "\n";
    ss << kLatencyMetric << "_count{" << job << "} " << fmt("%.0f", total) << "\n";
    ss << "\n";

    ss << "# HELP " << kUpMetric << " Service is up\n";
    ss << "# TYPE " << kUpMetric << " gauge\n";
    ss << kUpMetric << "{" << job << "} " << fmt("%.0f", m.up) << "\n";

    return ss.str();
}

std::string render_exposition(const ScenarioEngine& engine) {
    return render_exposition(engine.get_current_metrics());
}

}
