#pragma once

#include <string>
#include <optional>
#include <utility>
#include <vector>

// Scanner-style lookups over a JSON object text; only top-level keys of the
// outermost object are matched. Throw std::runtime_error on malformed input.
std::pair<bool, std::optional<std::string>> json_extract_string_opt_present(const std::string& js, const std::string& key);
std::pair<bool,std::string> json_extract_string_present(const std::string& js, const std::string& key);

// Cheap shape check: first and last non-space characters are '{' and '}'.
bool json_looks_like_object(const std::string& js);

std::string json_escape_resp(const std::string& s);
std::string json_quote(const std::string& s);
std::string json_number(double v, int precision = 6);
std::string json_string_array(const std::vector<std::string>& items);
