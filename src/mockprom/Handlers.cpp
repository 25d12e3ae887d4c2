#include "Handlers.h"
#include "AdminPage.h"
#include "Exposition.h"
#include "QueryEvaluator.h"
#include "net/MiniJson.h"
#include "net/UrlParams.h"
#include "observability/Logging.h"

#include <boost/beast/http.hpp>
#include <cstdio>
#include <ctime>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <variant>

namespace mockprom {

namespace http = boost::beast::http;
using observability::log_debug;
using observability::log_info;
using observability::log_warn;

std::string format_iso8601_utc(Clock::time_point tp) {
    using namespace std::chrono;
    auto ms = duration_cast<milliseconds>(tp.time_since_epoch()).count();
    std::time_t t = static_cast<std::time_t>(ms / 1000);
    int frac = static_cast<int>(ms % 1000);
    if (frac < 0) { frac += 1000; t -= 1; }
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
        tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
        tm.tm_hour, tm.tm_min, tm.tm_sec, frac);
    return std::string(buf);
}

std::string status_json(const ScenarioStatus& st) {
    std::ostringstream ss;
    ss << "{\"type\":" << json_quote(st.name)
       << ",\"description\":" << json_quote(st.description)
       << ",\"start_time\":" << json_quote(format_iso8601_utc(st.start_time))
       << ",\"elapsed\":" << json_quote(st.elapsed)
       << ",\"metrics\":{\"error_rate\":" << json_number(st.metrics.error_rate)
       << ",\"latency\":" << json_number(st.metrics.latency)
       << ",\"up\":" << json_number(st.metrics.up) << "}}";
    return ss.str();
}

static std::string success_with_status(const ScenarioEngine& engine) {
    return "{\"status\":\"success\",\"data\":" + status_json(engine.get_status()) + "}";
}

static std::optional<std::string> extract_query(const Request& req) {
    if (req.method() == http::verb::post && !req.body().empty()) {
        auto ct = req[http::field::content_type];
        if (ct.empty() || ct.find("application/x-www-form-urlencoded") != boost::beast::string_view::npos) {
            auto q = form_param(req.body(), "query");
            if (q.has_value() && !q->empty()) return q;
        }
    }
    return query_param(target_view(req), "query");
}

static Response handle_query(const Request& req, const ScenarioEngine& engine) {
    auto query = extract_query(req);
    if (!query.has_value() || query->empty()) {
        return json_response(req, http::status::bad_request,
            "{\"status\":\"error\",\"errorType\":\"bad_data\",\"error\":\"query parameter is required\"}");
    }
    QueryEvaluator evaluator(engine);
    auto outcome = evaluator.evaluate(*query);
    if (const auto* err = std::get_if<QueryError>(&outcome)) {
        log_info("query_error", {{"query", *query}, {"kind", std::string(query_error_kind_name(err->kind))}, {"error", err->message}});
    } else {
        log_debug("query", {{"query", *query}, {"value", std::get<QueryResult>(outcome).value}});
    }
    return json_response(req, http::status::ok, to_prometheus_json(outcome));
}

static Response handle_set_scenario(const Request& req, ScenarioEngine& engine) {
    std::string name;
    try {
        if (!json_looks_like_object(req.body())) throw std::runtime_error("body must be a JSON object");
        auto pr = json_extract_string_present(req.body(), "scenario");
        if (!pr.first || pr.second.empty()) throw std::runtime_error("field 'scenario' is required");
        name = pr.second;
    } catch (const std::runtime_error& e) {
        return json_response(req, http::status::bad_request,
            "{\"status\":\"error\",\"error\":" + json_quote(std::string("invalid request: ") + e.what()) + "}");
    }
    if (!is_valid_scenario_name(name)) {
        log_warn("invalid_scenario_name", {{"scenario", name}});
        return json_response(req, http::status::bad_request,
            "{\"status\":\"error\",\"error\":\"invalid scenario type\",\"valid_scenarios\":" + json_string_array(valid_scenario_names()) + "}");
    }
    engine.set_scenario(name);
    return json_response(req, http::status::ok, success_with_status(engine));
}

static std::string scenario_list_json() {
    std::ostringstream ss;
    ss << "{\"status\":\"success\",\"data\":[";
    bool first = true;
    for (const auto& s : all_scenarios()) {
        if (!first) ss << ',';
        first = false;
        ss << "{\"type\":" << json_quote(s.name()) << ",\"description\":" << json_quote(s.description) << '}';
    }
    ss << "]}";
    return ss.str();
}

void register_routes(Router& router, ScenarioEngine& engine) {
    router.add_route("GET", "/api/v1/query", [&engine](const Request& req) { return handle_query(req, engine); });
    router.add_route("POST", "/api/v1/query", [&engine](const Request& req) { return handle_query(req, engine); });

    router.add_route("GET", "/metrics", [&engine](const Request& req) {
        return make_response(req, http::status::ok, "text/plain; version=0.0.4", render_exposition(engine));
    });

    router.add_route("GET", "/prometheus/api/scenario", [&engine](const Request& req) {
        return json_response(req, http::status::ok, success_with_status(engine));
    });
    router.add_route("POST", "/prometheus/api/scenario", [&engine](const Request& req) {
        return handle_set_scenario(req, engine);
    });
    router.add_route("POST", "/prometheus/api/scenario/reset", [&engine](const Request& req) {
        engine.reset_timer();
        return json_response(req, http::status::ok,
            "{\"status\":\"success\",\"message\":\"timer reset\",\"data\":" + status_json(engine.get_status()) + "}");
    });
    router.add_route("GET", "/prometheus/api/scenarios", [](const Request& req) {
        return json_response(req, http::status::ok, scenario_list_json());
    });
    router.add_route("GET", "/prometheus/admin", [](const Request& req) {
        return make_response(req, http::status::ok, "text/html; charset=utf-8", admin_page_html());
    });
}

}
