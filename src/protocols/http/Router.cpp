#include "protocols/http/Router.hpp"
#include "drives/Enumerator.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>

using namespace ds::protocols::http;

namespace {
std::string_view pathOf(const request& req) {
    const std::string_view target(req.target().data(), req.target().size());
    return target.substr(0, target.find('?'));
}
}

string_response Router::route(request&& req) {
    if (req.method() != verb::get)
        return makeErrorResponse(req, "Invalid request", status::bad_request);

    if (pathOf(req) == "/api/drives") return handleDrives(req);

    return makeErrorResponse(req, "Not found", status::not_found);
}

string_response Router::handleDrives(const request& req) {
    const auto drives = drives::Enumerator::list();
    log::Registry::http()->debug("[Router] Listing {} drive(s)", drives.size());
    return makeJsonResponse(req, drives);
}

string_response Router::makeErrorResponse(const request& req, const std::string& msg, const status& status) {
    string_response res{status, req.version()};
    res.set(field::server, "diskscout");
    res.set(field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    res.body() = nlohmann::json{{"error", msg}}.dump();
    res.prepare_payload();
    return res;
}

string_response Router::makeJsonResponse(const request& req, const nlohmann::json& j) {
    string_response res{status::ok, req.version()};
    res.set(field::server, "diskscout");
    res.set(field::content_type, "application/json");
    res.set(field::access_control_allow_origin, "*");
    res.keep_alive(req.keep_alive());
    res.body() = j.dump();
    res.prepare_payload();
    return res;
}
