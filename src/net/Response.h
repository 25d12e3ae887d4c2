#pragma once

#include <boost/beast/http.hpp>
#include "Request.h"
#include <string>

using Response = boost::beast::http::response<boost::beast::http::string_body>;

Response make_response(const Request& req, boost::beast::http::status st, const std::string& content_type, std::string body);
Response json_response(const Request& req, boost::beast::http::status st, std::string body);
