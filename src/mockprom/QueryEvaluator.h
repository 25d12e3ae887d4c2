#pragma once

#include "ScenarioEngine.h"

#include <map>
#include <string>
#include <string_view>
#include <variant>

namespace mockprom {

inline constexpr double kBaselineRequestsPerSecond = 100.0;
inline constexpr const char* kJobLabel = "demo-app";
inline constexpr const char* kErrorsMetric = "http_requests_errors_total";
inline constexpr const char* kLatencyMetric = "http_request_duration_seconds";
inline constexpr const char* kUpMetric = "up";

enum class QueryErrorKind { BadQuerySyntax, UnknownMetric, InvalidQuantile };

const char* query_error_kind_name(QueryErrorKind k);

struct QueryError {
    QueryErrorKind kind;
    std::string message;
};

struct QueryResult {
    double value = 0.0;
    double timestamp = 0.0;    // seconds since epoch
    std::map<std::string, std::string> metric;

    std::string formatted_value() const;
};

using QueryOutcome = std::variant<QueryResult, QueryError>;

// rate(<metric>[<window>])
struct RateQuery { std::string metric; };
// histogram_quantile(<q>, ...)
struct HistogramQuantileQuery { double quantile; };
// bare metric reference, matched by substring
struct DirectMetricQuery { std::string metric; };
struct UnrecognizedQuery { std::string text; };

using ParsedQuery = std::variant<RateQuery, HistogramQuantileQuery, DirectMetricQuery, UnrecognizedQuery>;

// Extraction and validation only; no metric values are read.
std::variant<ParsedQuery, QueryError> classify_query(std::string_view query);

double quantile_multiplier(double q);

class QueryEvaluator {
public:
    explicit QueryEvaluator(const ScenarioEngine& engine) : engine_(engine) {}

    QueryOutcome evaluate(std::string_view query) const;

    static std::variant<double, QueryError> evaluate_against(const ParsedQuery& q, const MetricValues& m);

private:
    const ScenarioEngine& engine_;
};

// Prometheus HTTP API body for an /api/v1/query response.
std::string to_prometheus_json(const QueryOutcome& outcome);

}
