#include "../../logging/logger.hpp"
#include "../responder.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace waypoint {
namespace http {

//=============================================================================
// GET /, GET /api, GET /api/health (and 405 for other methods on those paths)
//=============================================================================
void HttpServer::handle_route(const httplib::Request &req, httplib::Response &res) {
    MatchResult match = responder_.match(req.method, req.path);

    switch (match.status) {
        case MatchStatus::FOUND:
            send_json(res, StatusCode::OK, match.route->body);
            return;
        case MatchStatus::METHOD_NOT_ALLOWED:
            send_method_not_allowed(res, match.allowed_methods);
            return;
        case MatchStatus::NOT_FOUND:
        default:
            // Only reachable if a pattern was registered for a path the
            // Responder does not know
            LOG_WARN("[HTTP] No route for " << req.method << " " << req.path);
            send_error(res, StatusCode::NOT_FOUND);
            return;
    }
}

}  // namespace http
}  // namespace waypoint
