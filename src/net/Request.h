#pragma once

#include <boost/beast/http.hpp>
#include <string_view>

using Request = boost::beast::http::request<boost::beast::http::string_body>;

inline std::string_view target_view(const Request& req) {
    auto t = req.target();
    return std::string_view(t.data(), t.size());
}
