#include <iostream>
#include <string>
#include <thread>
#include "http_test_util.h"
#include "net/HttpServer.h"
#include "net/Router.h"
#include "mockprom/Handlers.h"
#include "test_util.h"

static bool contains(const std::string& s, const std::string& needle) {
    return s.find(needle) != std::string::npos;
}

static bool test_oversized_header(unsigned short port) {
    asio::io_context ioc;
    asio::ip::tcp::socket sock(ioc);
    sock.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
    std::string big(9000, 'A');
    std::string req = "GET /metrics HTTP/1.1\r\nHost: example\r\nX-Big: " + big + "\r\n\r\n";
    asio::write(sock, asio::buffer(req));
    beast::flat_buffer b;
    http::response<http::string_body> res;
    try {
        http::read(sock, b, res);
        if (res.result_int() != 431) { std::cerr << "oversized header: expected 431 got " << res.result_int() << std::endl; return false; }
    } catch (const std::exception& e) {
        std::cerr << "oversized header: read exception: " << e.what() << std::endl; return false;
    }
    std::string rest;
    if (!read_until_eof(sock, rest, 1000)) { std::cerr << "oversized header: server did not close connection" << std::endl; return false; }
    return true;
}

static bool test_keep_alive(unsigned short port) {
    asio::io_context ioc;
    beast::tcp_stream stream(ioc);
    stream.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
    for (int i = 0; i < 3; ++i) {
        http::request<http::string_body> req{http::verb::get, "/api/v1/query?query=up", 11};
        req.set(http::field::host, "127.0.0.1");
        req.keep_alive(true);
        http::write(stream, req);
        beast::flat_buffer b;
        http::response<http::string_body> res;
        http::read(stream, b, res);
        if (res.result_int() != 200 || !res.keep_alive()) { std::cerr << "keep-alive request " << i << " failed\n"; return false; }
    }
    beast::error_code ec;
    stream.socket().shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    return true;
}

int main() {
    quiet_logs();
    auto clock = make_manual_clock();
    mockprom::ScenarioEngine engine("healthy", clock);

    Router router;
    router.add_route("GET", "/health", [](const Request& req) {
        return json_response(req, http::status::ok, "{\"status\":\"ok\"}");
    });
    mockprom::register_routes(router, engine);

    asio::io_context io;
    HttpServer server(io, "127.0.0.1", 0, router, false);
    server.run();
    unsigned short port = server.local_port();
    std::thread runner([&io] { io.run(); });

    int rc = 0;
    try {
        auto res = do_request(port, http::verb::get, "/health");
        if (res.status != 200 || res.body != "{\"status\":\"ok\"}") { std::cerr << "/health failed: " << res.status << "\n"; rc = 1; }

        if (rc == 0) {
            res = do_request(port, http::verb::get, "/api/v1/query?query=up");
            if (res.status != 200 || !contains(res.body, "\"1.000000\"")) { std::cerr << "query failed: " << res.body << "\n"; rc = 1; }
            if (res.allow_origin != "*") { std::cerr << "missing CORS origin: '" << res.allow_origin << "'\n"; rc = 1; }
        }
        if (rc == 0) {
            res = do_request(port, http::verb::get, "/metrics");
            if (res.status != 200 || res.content_type != "text/plain; version=0.0.4" || !contains(res.body, "up{job=\"demo-app\"} 1")) {
                std::cerr << "/metrics failed: " << res.status << " " << res.content_type << "\n"; rc = 1;
            }
        }
        if (rc == 0) {
            res = do_request(port, http::verb::post, "/prometheus/api/scenario", "{\"scenario\":\"latency-spike\"}", "application/json");
            if (res.status != 200 || !contains(res.body, "\"type\":\"latency-spike\"")) { std::cerr << "set scenario failed: " << res.body << "\n"; rc = 1; }
            res = do_request(port, http::verb::get, "/api/v1/query?query=http_request_duration_seconds");
            if (!contains(res.body, "\"0.150000\"")) { std::cerr << "latency after switch: " << res.body << "\n"; rc = 1; }
        }
        if (rc == 0) {
            res = do_request(port, http::verb::post, "/api/v1/query", "query=rate%28http_requests_errors_total%5B5m%5D%29", "application/x-www-form-urlencoded");
            if (res.status != 200 || !contains(res.body, "\"0.500000\"")) { std::cerr << "form POST query: " << res.body << "\n"; rc = 1; }
        }
        if (rc == 0) {
            res = do_request(port, http::verb::options, "/api/v1/query");
            if (res.status != 204) { std::cerr << "OPTIONS expected 204 got " << res.status << "\n"; rc = 1; }
        }
        if (rc == 0) {
            res = do_request(port, http::verb::get, "/prometheus/admin");
            if (res.status != 200 || !contains(res.body, "Prometheus Mock")) { std::cerr << "admin page failed\n"; rc = 1; }
            res = do_request(port, http::verb::put, "/metrics");
            if (res.status != 405) { std::cerr << "PUT /metrics expected 405 got " << res.status << "\n"; rc = 1; }
        }
        if (rc == 0 && !test_keep_alive(port)) rc = 1;
        if (rc == 0 && !test_oversized_header(port)) rc = 1;
    } catch (const std::exception& e) {
        std::cerr << "http_smoke exception: " << e.what() << "\n";
        rc = 1;
    }

    server.stop();
    io.stop();
    runner.join();
    engine.shutdown();

    if (rc != 0) return rc;
    std::cout << "http_smoke ok\n";
    return 0;
}
