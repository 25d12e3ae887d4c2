#include "Logging.h"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace observability {

static std::atomic<int> g_level{LOG_INFO};
static std::mutex g_sink_mu;
static std::ostream* g_sink = nullptr;

void set_log_level(int level) { g_level = std::clamp(level, int(LOG_DEBUG), int(LOG_ERROR)); }

int log_level() { return g_level; }

int parse_log_level(const std::string& name) {
    std::string u = name;
    std::transform(u.begin(), u.end(), u.begin(), [](unsigned char c) { return char(std::toupper(c)); });
    if (u == "DEBUG") return LOG_DEBUG;
    if (u == "WARN" || u == "WARNING") return LOG_WARN;
    if (u == "ERROR") return LOG_ERROR;
    return LOG_INFO;
}

void set_log_sink(std::ostream* sink) {
    std::lock_guard lock(g_sink_mu);
    g_sink = sink;
}

static int64_t now_ms() {
    using namespace std::chrono;
    return static_cast<int64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

static std::string escape_json(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default: out += c; break;
        }
    }
    return out;
}

static void write_field(std::ostringstream& ss, const FieldValue& v) {
    if (std::holds_alternative<std::string>(v)) {
        ss << '"' << escape_json(std::get<std::string>(v)) << '"';
    } else if (std::holds_alternative<int64_t>(v)) {
        ss << std::get<int64_t>(v);
    } else if (std::holds_alternative<double>(v)) {
        std::ostringstream tmp; tmp << std::fixed << std::setprecision(3) << std::get<double>(v);
        ss << tmp.str();
    }
}

static void log_generic(int level, const char* lvl_name, const std::string& msg, const Fields& fields) {
    if (level < g_level) return;
    std::ostringstream ss;
    ss << '{';
    ss << "\"ts\":" << now_ms() << ',';
    ss << "\"level\":\"" << lvl_name << "\",";
    ss << "\"msg\":\"" << escape_json(msg) << "\"";
    for (const auto& p : fields) {
        ss << ",\"" << escape_json(p.first) << "\":";
        write_field(ss, p.second);
    }
    ss << "}\n";
    std::lock_guard lock(g_sink_mu);
    std::ostream& out = g_sink ? *g_sink : std::cout;
    out << ss.str();
    out.flush();
}

void log_debug(const std::string& msg, const Fields& fields) { log_generic(LOG_DEBUG, "DEBUG", msg, fields); }
void log_info(const std::string& msg, const Fields& fields) { log_generic(LOG_INFO, "INFO", msg, fields); }
void log_warn(const std::string& msg, const Fields& fields) { log_generic(LOG_WARN, "WARN", msg, fields); }
void log_error(const std::string& msg, const Fields& fields) { log_generic(LOG_ERROR, "ERROR", msg, fields); }

} // namespace observability
