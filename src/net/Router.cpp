#include "Router.h"
#include "observability/Logging.h"
#include <boost/beast/http.hpp>
#include <exception>

namespace http = boost::beast::http;

Response make_response(const Request& req, http::status st, const std::string& content_type, std::string body) {
    Response res{st, req.version()};
    res.set(http::field::content_type, content_type);
    res.keep_alive(req.keep_alive());
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

Response json_response(const Request& req, http::status st, std::string body) {
    return make_response(req, st, "application/json; charset=utf-8", std::move(body));
}

std::string target_path(std::string_view target) {
    auto q = target.find('?');
    if (q != std::string_view::npos) target = target.substr(0, q);
    return std::string(target);
}

void Router::add_route(std::string method, std::string path, Handler h) {
    Key k{std::move(method), std::move(path)};
    routes_.insert_or_assign(std::move(k), std::move(h));
}

bool Router::has_path(const std::string& path) const {
    for (const auto& p : routes_) {
        if (p.first.path == path) return true;
    }
    return false;
}

Response Router::route(const Request& req) const {
    Key k{std::string(req.method_string()), target_path(target_view(req))};
    auto it = routes_.find(k);
    if (it == routes_.end()) {
        if (has_path(k.path)) {
            return json_response(req, http::status::method_not_allowed, "{\"error\":\"method not allowed\"}");
        }
        return json_response(req, http::status::not_found, "{\"error\":\"not found\"}");
    }
    try {
        return it->second(req);
    } catch (const std::exception& e) {
        observability::log_error("handler_exception", {{"path", k.path}, {"err", std::string(e.what())}});
        return json_response(req, http::status::internal_server_error, "{\"error\":\"internal\"}");
    }
}
