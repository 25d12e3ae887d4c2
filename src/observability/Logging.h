#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <unordered_map>
#include <variant>

namespace observability {

using FieldValue = std::variant<std::string, int64_t, double>;
using Fields = std::unordered_map<std::string, FieldValue>;

enum LogLevel { LOG_DEBUG = 1, LOG_INFO = 2, LOG_WARN = 3, LOG_ERROR = 4 };

void log_debug(const std::string& msg, const Fields& fields = {});
void log_info(const std::string& msg, const Fields& fields = {});
void log_warn(const std::string& msg, const Fields& fields = {});
void log_error(const std::string& msg, const Fields& fields = {});

void set_log_level(int level);
int log_level();
int parse_log_level(const std::string& name);

// nullptr restores stdout.
void set_log_sink(std::ostream* sink);

}
