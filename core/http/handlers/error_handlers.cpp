#include <utility>

#include "../../logging/logger.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace waypoint {
namespace http {

namespace {
constexpr int kStatusBadRequest = 400;
constexpr int kStatusNotFound = 404;

bool is_get_like(const std::string &method) { return method == "GET" || method == "HEAD"; }
}  // namespace

void fill_error_body(const httplib::Request &, httplib::Response &res) {
    if (!res.body.empty()) {
        return;
    }

    nlohmann::json body;
    if (res.status == kStatusNotFound) {
        body = make_error_response(StatusCode::NOT_FOUND);
    } else {
        body = {{"detail", httplib::status_message(res.status)}};
    }
    res.set_content(body.dump(), kContentTypeJson);
}

void handle_exception(const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
    try {
        std::rethrow_exception(std::move(ep));
    } catch (const std::exception &e) {
        LOG_ERROR("[HTTP] Exception handling " << req.method << " " << req.path << ": " << e.what());
    } catch (...) {
        LOG_ERROR("[HTTP] Unknown exception handling " << req.method << " " << req.path);
    }

    send_error(res, StatusCode::INTERNAL);
}

void log_request(const httplib::Request &req, const httplib::Response &res) {
    LOG_DEBUG("[HTTP] " << req.method << " " << req.path << " -> " << res.status);
}

//=============================================================================
// Error statuses raised by httplib
//=============================================================================
void HttpServer::handle_error(const httplib::Request &req, httplib::Response &res) {
    // httplib answers 400 for methods it has no handler table for (TRACE,
    // CONNECT, ...). On a served path that is a method error, not a bad request.
    if (res.body.empty() && res.status == kStatusBadRequest && !is_get_like(req.method)) {
        auto allowed = allowed_methods(req.path);
        if (!allowed.empty()) {
            send_method_not_allowed(res, allowed);
            return;
        }
    }

    fill_error_body(req, res);
}

}  // namespace http
}  // namespace waypoint
