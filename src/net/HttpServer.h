#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include "Router.h"
#include <string>

class HttpServer {
public:
    // port 0 binds an ephemeral port, see local_port().
    HttpServer(boost::asio::io_context& ioc, const std::string& host, unsigned short port, Router& router, bool access_log);
    void run();
    void stop();
    unsigned short local_port() const;
private:
    void do_accept();
    boost::asio::io_context& ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    Router& router_;
    bool access_log_;
};
