#pragma once

#include <boost/beast/http.hpp>
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace ds::protocols::http {

using request = boost::beast::http::request<boost::beast::http::string_body>;
using string_response = boost::beast::http::response<boost::beast::http::string_body>;

using field = boost::beast::http::field;
using verb = boost::beast::http::verb;
using status = boost::beast::http::status;

struct Router {
    static string_response route(request&& req);

    static string_response handleDrives(const request& req);

    static string_response makeErrorResponse(const request& req,
                                             const std::string& msg,
                                             const status& status = status::not_found);

    static string_response makeJsonResponse(const request& req, const nlohmann::json& j);
};

}
