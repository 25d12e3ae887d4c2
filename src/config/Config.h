#pragma once

#include <cstdint>
#include <string>

namespace config {

struct Config {
    enum class LogLevel { DEBUG, INFO, WARN, ERROR };
    uint16_t port = 8080;
    std::string host = "0.0.0.0";
    LogLevel log_level = LogLevel::INFO;
    bool access_log = true;
    bool prometheus_enabled = true;
    std::string prometheus_scenario = "healthy";
    int http_threads = 1;
    static Config from_env(int argc, char** argv);
};

int log_level_number(Config::LogLevel l);
const char* log_level_name(Config::LogLevel l);

// true/1/yes/on and false/0/no/off, case-insensitive; anything else keeps `def`.
bool parse_bool(const std::string& s, bool def);

}
