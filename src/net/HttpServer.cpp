#include "HttpServer.h"
#include "Request.h"
#include "Response.h"
#include "observability/Logging.h"
#include <array>
#include <boost/beast/http.hpp>
#include <chrono>
#include <memory>
#include <optional>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;

static constexpr std::size_t kHeaderLimit = 8 * 1024;
static constexpr std::size_t kBodyLimit = 1 * 1024 * 1024;

struct Session : std::enable_shared_from_this<Session> {
    net::ip::tcp::socket socket;
    beast::flat_buffer buffer;
    net::steady_timer read_timer;
    Router& router;
    bool access_log;
    unsigned http_version = 11;
    Request req;
    std::optional<http::request_parser<http::string_body>> parser;
    std::chrono::steady_clock::time_point start_ts;

    Session(net::ip::tcp::socket&& s, Router& r, bool al)
        : socket(std::move(s)), read_timer(socket.get_executor()), router(r), access_log(al) {}

    void run() { do_read(); }

    void arm_timer(std::chrono::seconds timeout) {
        read_timer.expires_after(timeout);
        read_timer.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
            if (!ec) self->close_socket();
        });
    }

    void do_read() {
        req = {};
        http_version = 11;
        parser.emplace();
        parser->header_limit(kHeaderLimit);
        parser->body_limit(kBodyLimit);

        arm_timer(std::chrono::seconds(5));
        http::async_read_header(socket, buffer, *parser, [self = shared_from_this()](beast::error_code ec, std::size_t) {
            self->read_timer.cancel();
            if (ec) {
                if (ec == http::error::header_limit) {
                    self->reply_error(http::status::request_header_fields_too_large, "{\"error\":\"header_too_large\"}");
                    return;
                }
                if (ec == http::error::bad_target || ec == http::error::bad_method || ec == http::error::bad_version ||
                    ec == http::error::bad_field) {
                    self->reply_error(http::status::bad_request, "{\"error\":\"bad_request\"}");
                    return;
                }
                self->close_socket();
                return;
            }
            self->http_version = self->parser->get().version();
            if (auto len = self->parser->content_length(); len && *len > kBodyLimit) {
                self->reply_error(http::status::payload_too_large, "{\"error\":\"body_too_large\"}");
                return;
            }
            self->arm_timer(std::chrono::seconds(20));
            http::async_read(self->socket, self->buffer, *self->parser, [self](beast::error_code ec2, std::size_t) {
                self->read_timer.cancel();
                if (ec2) {
                    if (ec2 == http::error::body_limit) {
                        self->reply_error(http::status::payload_too_large, "{\"error\":\"payload_too_large\"}");
                        return;
                    }
                    self->close_socket();
                    return;
                }
                self->req = self->parser->release();
                self->start_ts = std::chrono::steady_clock::now();
                self->handle_request();
            });
        });
    }

    void handle_request() {
        if (req.method() == http::verb::options) {
            auto res = std::make_shared<Response>(http::status::no_content, req.version());
            res->set("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            res->set("Access-Control-Allow-Headers", "Content-Type, Authorization, X-Requested-With");
            res->keep_alive(req.keep_alive());
            res->prepare_payload();
            send_response(res);
            return;
        }
        send_response(std::make_shared<Response>(router.route(req)));
    }

    void set_cors(Response& res) const {
        auto it = req.find(http::field::origin);
        if (it != req.end()) res.set("Access-Control-Allow-Origin", std::string(it->value()));
        else res.set("Access-Control-Allow-Origin", "*");
        res.set("Access-Control-Allow-Credentials", "true");
    }

    void send_response(std::shared_ptr<Response> res) {
        if (res->find(http::field::connection) == res->end()) res->keep_alive(req.keep_alive());
        set_cors(*res);
        if (access_log) {
            auto us = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start_ts).count();
            observability::log_info("access", {
                {"method", std::string(req.method_string())},
                {"path", target_path(target_view(req))},
                {"status", int64_t(res->result_int())},
                {"latency_ms", double(us) / 1000.0}});
        }
        http::async_write(socket, *res, [self = shared_from_this(), res](beast::error_code ec, std::size_t) {
            if (ec) {
                observability::log_warn("write_error", {{"path", target_path(target_view(self->req))}, {"err", int64_t(ec.value())}});
                self->close_socket();
                return;
            }
            if (res->keep_alive()) self->do_read();
            else self->close_socket(false);
        });
    }

    void reply_error(http::status st, const std::string& body) {
        auto res = std::make_shared<Response>(st, http_version);
        res->set(http::field::content_type, "application/json");
        res->keep_alive(false);
        res->body() = body;
        res->prepare_payload();
        set_cors(*res);
        http::async_write(socket, *res, [self = shared_from_this(), res](beast::error_code ec, std::size_t) {
            if (ec) observability::log_warn("write_error", {{"path", std::string("(error)")}, {"err", int64_t(ec.value())}});
            self->close_socket(false);
        });
    }

    void close_socket(bool hard_shutdown = true) {
        boost::system::error_code ignored;
        read_timer.cancel();
        socket.shutdown(hard_shutdown ? net::ip::tcp::socket::shutdown_both : net::ip::tcp::socket::shutdown_send, ignored);
        socket.close(ignored);
    }
};

HttpServer::HttpServer(net::io_context& ioc, const std::string& host, unsigned short port, Router& router, bool access_log)
    : ioc_(ioc), acceptor_(ioc), router_(router), access_log_(access_log) {
    net::ip::tcp::endpoint ep(net::ip::make_address(host), port);
    acceptor_.open(ep.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(ep);
    acceptor_.listen(net::socket_base::max_listen_connections);
}

void HttpServer::run() { do_accept(); }

void HttpServer::stop() {
    boost::system::error_code ignored;
    acceptor_.close(ignored);
}

unsigned short HttpServer::local_port() const { return acceptor_.local_endpoint().port(); }

void HttpServer::do_accept() {
    acceptor_.async_accept(net::make_strand(ioc_), [this](beast::error_code ec, net::ip::tcp::socket socket) {
        if (ec == net::error::operation_aborted) return;
        if (!ec) std::make_shared<Session>(std::move(socket), router_, access_log_)->run();
        else observability::log_warn("accept_error", {{"err", int64_t(ec.value())}});
        do_accept();
    });
}
