#include "UrlParams.h"

static int hex_value(char h) {
    if (h >= '0' && h <= '9') return h - '0';
    if (h >= 'a' && h <= 'f') return 10 + (h - 'a');
    if (h >= 'A' && h <= 'F') return 10 + (h - 'A');
    return -1;
}

std::string url_decode(std::string_view s) {
    std::string out; out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '%') {
            if (i + 2 >= s.size()) return out;
            int hi = hex_value(s[i+1]); int lo = hex_value(s[i+2]); if (hi < 0 || lo < 0) return out;
            out.push_back(char((hi << 4) | lo)); i += 2;
        } else if (c == '+') out.push_back(' ');
        else out.push_back(c);
    }
    return out;
}

std::optional<std::string> form_param(std::string_view encoded, std::string_view key) {
    size_t pos = 0;
    while (pos <= encoded.size()) {
        size_t amp = encoded.find('&', pos);
        if (amp == std::string_view::npos) amp = encoded.size();
        std::string_view pair = encoded.substr(pos, amp - pos);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            std::string name = url_decode(pair.substr(0, eq));
            if (name == key) {
                if (eq == std::string_view::npos) return std::string();
                return url_decode(pair.substr(eq + 1));
            }
        }
        pos = amp + 1;
    }
    return std::nullopt;
}

std::optional<std::string> query_param(std::string_view target, std::string_view key) {
    auto q = target.find('?');
    if (q == std::string_view::npos) return std::nullopt;
    return form_param(target.substr(q + 1), key);
}
