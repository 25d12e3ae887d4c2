#include "QueryEvaluator.h"
#include "net/MiniJson.h"

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <regex>
#include <sstream>

namespace mockprom {

namespace {

const std::regex& rate_regex() {
    static const std::regex re(R"(rate\(([^\[]+)\[)");
    return re;
}

const std::regex& histogram_regex() {
    static const std::regex re(R"(histogram_quantile\(([\d.]+),)");
    return re;
}

std::string trim(std::string_view s) {
    size_t a = 0; while (a < s.size() && std::isspace((unsigned char)s[a])) ++a;
    size_t b = s.size(); while (b > a && std::isspace((unsigned char)s[b-1])) --b;
    return std::string(s.substr(a, b - a));
}

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

bool contains(const std::string& s, const char* needle) {
    return s.find(needle) != std::string::npos;
}

std::optional<double> parse_double_strict(const std::string& s) {
    if (s.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size() || errno == ERANGE) return std::nullopt;
    return v;
}

double error_count_per_second(const MetricValues& m) {
    return (m.error_rate / 100.0) * kBaselineRequestsPerSecond;
}

}

const char* query_error_kind_name(QueryErrorKind k) {
    switch (k) {
        case QueryErrorKind::BadQuerySyntax: return "bad_syntax";
        case QueryErrorKind::UnknownMetric: return "unknown_metric";
        case QueryErrorKind::InvalidQuantile: return "invalid_quantile";
    }
    return "bad_syntax";
}

std::string QueryResult::formatted_value() const {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.6f", value);
    return std::string(buf);
}

std::variant<ParsedQuery, QueryError> classify_query(std::string_view raw) {
    std::string query = trim(raw);

    if (starts_with(query, "rate(")) {
        std::smatch m;
        if (!std::regex_search(query, m, rate_regex()) || m.size() < 2) {
            return QueryError{QueryErrorKind::BadQuerySyntax, "invalid rate query format"};
        }
        return ParsedQuery{RateQuery{trim(m[1].str())}};
    }

    if (starts_with(query, "histogram_quantile(")) {
        std::smatch m;
        if (!std::regex_search(query, m, histogram_regex()) || m.size() < 2) {
            return QueryError{QueryErrorKind::BadQuerySyntax, "invalid histogram_quantile format"};
        }
        std::string raw_q = m[1].str();
        auto q = parse_double_strict(raw_q);
        if (!q.has_value()) {
            return QueryError{QueryErrorKind::InvalidQuantile, "invalid quantile value: " + raw_q};
        }
        if (*q < 0.0 || *q > 1.0) {
            char buf[96];
            std::snprintf(buf, sizeof(buf), "quantile must be between 0 and 1, got: %f", *q);
            return QueryError{QueryErrorKind::InvalidQuantile, buf};
        }
        return ParsedQuery{HistogramQuantileQuery{*q}};
    }

    if (contains(query, kErrorsMetric)) return ParsedQuery{DirectMetricQuery{kErrorsMetric}};
    if (contains(query, kLatencyMetric)) return ParsedQuery{DirectMetricQuery{kLatencyMetric}};
    if (contains(query, kUpMetric)) return ParsedQuery{DirectMetricQuery{kUpMetric}};

    return ParsedQuery{UnrecognizedQuery{query}};
}

double quantile_multiplier(double q) {
    if (q >= 0.99) return 2.5;
    if (q >= 0.95) return 1.5 + (q - 0.95) / (0.99 - 0.95) * (2.5 - 1.5);
    if (q >= 0.50) return 0.8 + (q - 0.50) / (0.95 - 0.50) * (1.5 - 0.8);
    return q / 0.50 * 0.8;
}

std::variant<double, QueryError> QueryEvaluator::evaluate_against(const ParsedQuery& parsed, const MetricValues& m) {
    struct Visitor {
        const MetricValues& m;

        std::variant<double, QueryError> operator()(const RateQuery& q) const {
            if (contains(q.metric, kErrorsMetric)) return error_count_per_second(m);
            // not a real rate of change; the latency itself in seconds
            if (contains(q.metric, kLatencyMetric)) return m.latency / 1000.0;
            return QueryError{QueryErrorKind::UnknownMetric, "unknown metric in rate query: " + q.metric};
        }
        std::variant<double, QueryError> operator()(const HistogramQuantileQuery& q) const {
            return (m.latency / 1000.0) * quantile_multiplier(q.quantile);
        }
        std::variant<double, QueryError> operator()(const DirectMetricQuery& q) const {
            if (q.metric == kErrorsMetric) return error_count_per_second(m);
            if (q.metric == kLatencyMetric) return m.latency / 1000.0;
            return m.up;
        }
        std::variant<double, QueryError> operator()(const UnrecognizedQuery& q) const {
            return QueryError{QueryErrorKind::UnknownMetric, "unsupported metric query: " + q.text};
        }
    };
    return std::visit(Visitor{m}, parsed);
}

QueryOutcome QueryEvaluator::evaluate(std::string_view query) const {
    auto classified = classify_query(query);
    if (auto* err = std::get_if<QueryError>(&classified)) return *err;

    auto metrics = engine_.get_current_metrics();
    auto value = evaluate_against(std::get<ParsedQuery>(classified), metrics);
    if (auto* err = std::get_if<QueryError>(&value)) return *err;

    QueryResult r;
    r.value = std::get<double>(value);
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(engine_.now().time_since_epoch()).count();
    r.timestamp = static_cast<double>(secs);
    r.metric.emplace("job", kJobLabel);
    return r;
}

std::string to_prometheus_json(const QueryOutcome& outcome) {
    std::ostringstream ss;
    if (const auto* err = std::get_if<QueryError>(&outcome)) {
        ss << "{\"status\":\"error\",\"errorType\":\"bad_data\",\"error\":\"" << json_escape_resp(err->message)
           << "\",\"errorKind\":\"" << query_error_kind_name(err->kind) << "\"}";
        return ss.str();
    }
    const auto& r = std::get<QueryResult>(outcome);
    char ts[32];
    std::snprintf(ts, sizeof(ts), "%.0f", r.timestamp);
    ss << "{\"status\":\"success\",\"data\":{\"resultType\":\"vector\",\"result\":[{\"metric\":{";
    bool first = true;
    for (const auto& p : r.metric) {
        if (!first) ss << ',';
        first = false;
        ss << '"' << json_escape_resp(p.first) << "\":\"" << json_escape_resp(p.second) << '"';
    }
    ss << "},\"value\":[" << ts << ",\"" << r.formatted_value() << "\"]}]}}";
    return ss.str();
}

}
