#include "MiniJson.h"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <stdexcept>


static std::pair<std::string,size_t> decode_json_string(const std::string& js, size_t start) {
    // start points at the first character after the opening '"'
    const size_t n = js.size();
    std::string out;
    size_t i = start;
    for (;; ++i) {
        if (i >= n) throw std::runtime_error("unterminated json string");
        char c = js[i];
        if (c == '"') return {out, i};
        if (c == '\\') {
            if (i + 1 >= n) throw std::runtime_error("unterminated escape in json string");
            char e = js[i+1];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'u': {
                    // BMP only
                    if (i + 5 >= n) throw std::runtime_error("invalid unicode escape in json string");
                    int code = 0;
                    for (size_t k = i+2; k <= i+5; ++k) {
                        char ch = js[k];
                        code <<= 4;
                        if (ch >= '0' && ch <= '9') code += ch - '0';
                        else if (ch >= 'a' && ch <= 'f') code += 10 + (ch - 'a');
                        else if (ch >= 'A' && ch <= 'F') code += 10 + (ch - 'A');
                        else throw std::runtime_error("invalid hex in unicode escape");
                    }
                    if (code <= 0x7f) out.push_back((char)code);
                    else if (code <= 0x7ff) {
                        out.push_back((char)(0xc0 | ((code >> 6) & 0x1f)));
                        out.push_back((char)(0x80 | (code & 0x3f)));
                    } else {
                        out.push_back((char)(0xe0 | ((code >> 12) & 0x0f)));
                        out.push_back((char)(0x80 | ((code >> 6) & 0x3f)));
                        out.push_back((char)(0x80 | (code & 0x3f)));
                    }
                    i += 4;
                    break;
                }
                default: throw std::runtime_error("unsupported escape in json string");
            }
            ++i;
            continue;
        }
        out.push_back(c);
    }
}

std::pair<bool, std::optional<std::string>> json_extract_string_opt_present(const std::string& js, const std::string& key) {
    const size_t n = js.size();
    std::vector<char> stack;

    for (size_t i = 0; i < n; ++i) {
        char c = js[i];
        if (c == '"') {
            auto dec = decode_json_string(js, i+1);
            size_t closing = dec.second;

            size_t before = i;
            while (before > 0 && isspace((unsigned char)js[before-1])) --before;
            bool prev_obj_or_comma = (before > 0 && (js[before-1] == '{' || js[before-1] == ','));

            size_t after = closing + 1;
            while (after < n && isspace((unsigned char)js[after])) ++after;

            bool top_level_object = (stack.size() == 1 && stack.back() == '{');
            if (top_level_object && prev_obj_or_comma && after < n && js[after] == ':') {
                if (dec.first == key) {
                    size_t valpos = after + 1;
                    while (valpos < n && isspace((unsigned char)js[valpos])) ++valpos;
                    if (valpos >= n) throw std::runtime_error("missing value for string field");
                    if (js.compare(valpos, 4, "null") == 0) return {true, std::nullopt};
                    if (js[valpos] != '"') throw std::runtime_error("invalid type for json string field");
                    return {true, decode_json_string(js, valpos+1).first};
                }
            } else if (top_level_object && prev_obj_or_comma && after < n && js[after] != ':') {
                throw std::runtime_error("missing ':' after string field");
            }
            i = closing;
            continue;
        }
        if (c == '{' || c == '[') { stack.push_back(c); }
        else if (c == '}' || c == ']') { if (!stack.empty()) stack.pop_back(); }
    }
    return {false, std::nullopt};
}

std::pair<bool,std::string> json_extract_string_present(const std::string& js, const std::string& key) {
    auto p = json_extract_string_opt_present(js, key);
    if (!p.first) return {false, std::string()};
    if (!p.second.has_value()) return {true, std::string()};
    return {true, p.second.value()};
}

bool json_looks_like_object(const std::string& js) {
    size_t a = 0; while (a < js.size() && isspace((unsigned char)js[a])) ++a;
    size_t b = js.size(); while (b > a && isspace((unsigned char)js[b-1])) --b;
    return b - a >= 2 && js[a] == '{' && js[b-1] == '}';
}

// control chars < 0x20 become \u00XX
std::string json_escape_resp(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out; out.reserve(s.size()+8);
    for (unsigned char uc : s) {
        if (uc == '"') { out += "\\\""; }
        else if (uc == '\\') { out += "\\\\"; }
        else if (uc == '\n') { out += "\\n"; }
        else if (uc == '\r') { out += "\\r"; }
        else if (uc == '\t') { out += "\\t"; }
        else if (uc < 0x20) {
            out.push_back('\\'); out.push_back('u'); out.push_back('0'); out.push_back('0');
            out.push_back(hex[(uc >> 4) & 0xF]); out.push_back(hex[uc & 0xF]);
        } else out.push_back((char)uc);
    }
    return out;
}

std::string json_quote(const std::string& s) {
    return "\"" + json_escape_resp(s) + "\"";
}

std::string json_number(double v, int precision) {
    if (!std::isfinite(v)) return "null";
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", precision, v);
    std::string s(buf);
    if (s.find('.') != std::string::npos) {
        while (!s.empty() && s.back() == '0') s.pop_back();
        if (!s.empty() && s.back() == '.') s.pop_back();
    }
    if (s == "-0") s = "0";
    return s;
}

std::string json_string_array(const std::vector<std::string>& items) {
    std::string out = "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out.push_back(',');
        out += json_quote(items[i]);
    }
    out.push_back(']');
    return out;
}
