#pragma once

#include "Request.h"
#include "Response.h"
#include <string>
#include <string_view>
#include <functional>
#include <unordered_map>

// Exact method + path dispatch. The query string is not part of the key.
class Router {
public:
    using Handler = std::function<Response(const Request&)>;
    void add_route(std::string method, std::string path, Handler h);
    Response route(const Request& req) const;
    bool has_path(const std::string& path) const;
private:
    struct Key { std::string method; std::string path; };
    struct KeyHash {
        size_t operator()(Key const& k) const noexcept { return std::hash<std::string>()(k.method + "#" + k.path); }
    };
    struct KeyEq { bool operator()(Key const& a, Key const& b) const noexcept { return a.method==b.method && a.path==b.path; } };
    std::unordered_map<Key, Handler, KeyHash, KeyEq> routes_;
};

std::string target_path(std::string_view target);
