#include <boost/asio.hpp>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "net/Router.h"
#include "net/HttpServer.h"
#include "observability/Logging.h"
#include "config/Config.h"
#include "mockprom/Handlers.h"
#include "mockprom/Scenario.h"
#include "mockprom/ScenarioEngine.h"

using config::Config;
using observability::log_info;
using observability::log_warn;
using observability::set_log_level;

int main(int argc, char** argv) {
    auto cfg = Config::from_env(argc, argv);
    set_log_level(config::log_level_number(cfg.log_level));

    log_info("config_loaded", {
        {"host", cfg.host},
        {"port", int64_t(cfg.port)},
        {"log_level", std::string(config::log_level_name(cfg.log_level))},
        {"prometheus_enabled", int64_t(cfg.prometheus_enabled ? 1 : 0)},
        {"prometheus_scenario", cfg.prometheus_scenario},
        {"http_threads", int64_t(cfg.http_threads)}});

    try {
        boost::asio::io_context io;

        Router router;
        router.add_route("GET", "/health", [](const Request& req) {
            return json_response(req, boost::beast::http::status::ok, "{\"status\":\"ok\"}");
        });

        std::optional<mockprom::ScenarioEngine> engine;
        if (cfg.prometheus_enabled) {
            if (!mockprom::is_valid_scenario_name(cfg.prometheus_scenario)) {
                log_warn("unknown_initial_scenario", {{"scenario", cfg.prometheus_scenario}, {"fallback", std::string("healthy")}});
            }
            engine.emplace(cfg.prometheus_scenario);
            mockprom::register_routes(router, *engine);
        } else {
            log_info("prometheus_disabled");
        }

        HttpServer server(io, cfg.host, cfg.port, router, cfg.access_log);

        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int sig) {
            if (ec) return;
            log_info("signal_received", {{"signal", int64_t(sig)}});
            server.stop();
            io.stop();
        });

        server.run();
        log_info("server_start", {{"host", cfg.host}, {"port", int64_t(server.local_port())}});

        std::vector<std::thread> workers;
        workers.reserve(cfg.http_threads - 1);
        for (int i = 1; i < cfg.http_threads; ++i) workers.emplace_back([&io] { io.run(); });
        io.run();
        for (auto& t : workers) t.join();

        if (engine) engine->shutdown();
        log_info("server_stop");
    } catch (const std::exception& e) {
        std::cerr << "server error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
