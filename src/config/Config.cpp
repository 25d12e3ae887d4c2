#include "Config.h"
#include "observability/Logging.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

namespace config {

static std::string getenv_or(const char* name, const char* def) {
    const char* v = std::getenv(name);
    return (v && v[0]) ? std::string(v) : std::string(def);
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return char(std::tolower(c)); });
    return s;
}

static Config::LogLevel parse_level(const std::string& s) {
    switch (observability::parse_log_level(s)) {
        case observability::LOG_DEBUG: return Config::LogLevel::DEBUG;
        case observability::LOG_WARN: return Config::LogLevel::WARN;
        case observability::LOG_ERROR: return Config::LogLevel::ERROR;
        default: return Config::LogLevel::INFO;
    }
}

static std::optional<uint16_t> parse_port(const std::string& s) {
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        if (used != s.size() || v < 1 || v > 65535) return std::nullopt;
        return static_cast<uint16_t>(v);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool parse_bool(const std::string& s, bool def) {
    std::string v = lower(s);
    if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
    if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    return def;
}

int log_level_number(Config::LogLevel l) {
    switch (l) {
        case Config::LogLevel::DEBUG: return 1;
        case Config::LogLevel::INFO: return 2;
        case Config::LogLevel::WARN: return 3;
        case Config::LogLevel::ERROR: return 4;
    }
    return 2;
}

const char* log_level_name(Config::LogLevel l) {
    switch (l) {
        case Config::LogLevel::DEBUG: return "DEBUG";
        case Config::LogLevel::INFO: return "INFO";
        case Config::LogLevel::WARN: return "WARN";
        case Config::LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

Config Config::from_env(int argc, char** argv) {
    Config c;
    if (auto p = parse_port(getenv_or("PORT", "8080"))) c.port = *p;
    c.host = getenv_or("HOST", "0.0.0.0");
    c.log_level = parse_level(getenv_or("LOG_LEVEL", "INFO"));
    c.access_log = parse_bool(getenv_or("ACCESS_LOG", "1"), true);
    c.prometheus_enabled = parse_bool(getenv_or("PROMETHEUS_ENABLED", "true"), true);
    c.prometheus_scenario = getenv_or("STAGE_PROMETHEUS_SCENARIO", "healthy");

    c.http_threads = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    try {
        auto t = getenv_or("HTTP_THREADS", "");
        if (!t.empty()) c.http_threads = std::stoi(t);
    } catch (const std::exception&) {}
    c.http_threads = std::clamp(c.http_threads, 1, 64);

    // command line wins over the environment
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--port" && i+1 < argc) { if (auto p = parse_port(argv[++i])) c.port = *p; }
        else if (a == "--host" && i+1 < argc) c.host = argv[++i];
        else if (a == "--scenario" && i+1 < argc) c.prometheus_scenario = argv[++i];
    }
    return c;
}

}
