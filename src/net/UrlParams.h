#pragma once

#include <optional>
#include <string>
#include <string_view>

// Decodes %XX escapes and '+' as space. A truncated or malformed escape ends the output.
std::string url_decode(std::string_view s);

// Looks up `key` in an application/x-www-form-urlencoded string (a URL query
// string or a form body). Returns the decoded value of the first match.
std::optional<std::string> form_param(std::string_view encoded, std::string_view key);

// Same as form_param on the part of `target` after '?'.
std::optional<std::string> query_param(std::string_view target, std::string_view key);
