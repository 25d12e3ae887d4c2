#include <iostream>
#include <stdexcept>
#include <string>
#include "net/Router.h"
#include "net/Request.h"
#include "net/Response.h"
#include "observability/Logging.h"
#include <boost/beast/http.hpp>

using namespace boost::beast::http;

static Request make_request(verb m, const std::string& target) {
    Request req{m, target, 11};
    req.set(field::host, "localhost");
    req.prepare_payload();
    return req;
}

int main() {
    observability::set_log_level(observability::LOG_ERROR);
    Router r;

    
    {
        auto res = r.route(make_request(verb::get, "/nope"));
        if (res.result() != status::not_found) { std::cerr << "expected 404 for /nope, got " << res.result_int() << "\n"; return 1; }
        if (res.body() != "{\"error\":\"not found\"}") { std::cerr << "404 body: " << res.body() << "\n"; return 1; }
    }

    r.add_route("GET", "/ping", [](const Request& req) {
        return make_response(req, status::ok, "text/plain", "pong");
    });

    
    {
        auto res = r.route(make_request(verb::post, "/ping"));
        if (res.result() != status::method_not_allowed) {
            std::cerr << "expected 405 for POST /ping, got " << res.result_int() << "\n"; return 1;
        }
    }

    
    {
        auto res = r.route(make_request(verb::get, "/ping"));
        if (res.result() != status::ok) { std::cerr << "expected 200 for GET /ping\n"; return 1; }
        if (res.body() != "pong") { std::cerr << "GET /ping body mismatch: " << res.body() << "\n"; return 1; }
        if (std::string(res[field::content_type]) != "text/plain") { std::cerr << "content type not set\n"; return 1; }
    }

    
    {
        auto res = r.route(make_request(verb::get, "/ping?x=1&y=2"));
        if (res.result() != status::ok) { std::cerr << "query string must not affect matching\n"; return 1; }
        if (r.route(make_request(verb::get, "/ping/")).result() != status::not_found) { std::cerr << "trailing slash must not match\n"; return 1; }
    }

    
    r.add_route("GET", "/ping", [](const Request& req) { return make_response(req, status::ok, "text/plain", "pong2"); });
    if (r.route(make_request(verb::get, "/ping")).body() != "pong2") { std::cerr << "re-registration did not replace handler\n"; return 1; }

    
    r.add_route("GET", "/boom", [](const Request&) -> Response { throw std::runtime_error("boom"); });
    {
        auto res = r.route(make_request(verb::get, "/boom"));
        if (res.result() != status::internal_server_error) { std::cerr << "handler exception expected 500 got " << res.result_int() << "\n"; return 1; }
    }

    
    {
        auto res = json_response(make_request(verb::get, "/x"), status::created, "{}");
        if (std::string(res[field::content_type]) != "application/json; charset=utf-8") { std::cerr << "json_response content type wrong\n"; return 1; }
        if (res[field::content_length] != "2") { std::cerr << "payload not prepared\n"; return 1; }
    }

    if (target_path("/a/b?c=d") != "/a/b" || target_path("/a") != "/a") { std::cerr << "target_path wrong\n"; return 1; }
    if (!r.has_path("/ping") || r.has_path("/pong")) { std::cerr << "has_path wrong\n"; return 1; }

    std::cout << "router_unit ok\n";
    return 0;
}
