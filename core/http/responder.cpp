#include "responder.hpp"

#include <algorithm>
#include <utility>

namespace waypoint {
namespace http {

Responder::Responder() {
    add_route("GET", "/", "Root greeting", {{"hello", "world"}, {"docs", "/docs"}});
    add_route("GET", "/api", "API root", {{"ok", true}, {"msg", "FastAPI running on Vercel"}});
    add_route("GET", "/api/health", "Health check", {{"status", "healthy"}});
}

void Responder::add_route(const std::string &method, const std::string &path, const std::string &summary,
                          nlohmann::ordered_json payload) {
    Route route;
    route.method = method;
    route.path = path;
    route.summary = summary;
    route.body = payload.dump();
    route.payload = std::move(payload);
    routes_.push_back(std::move(route));
}

MatchResult Responder::match(const std::string &method, const std::string &path) const {
    MatchResult result;

    // HEAD is answered by the GET route with the body stripped by the server
    const std::string effective_method = method == "HEAD" ? "GET" : method;

    for (const auto &route : routes_) {
        if (route.path == path && route.method == effective_method) {
            result.status = MatchStatus::FOUND;
            result.route = &route;
            return result;
        }
    }

    result.allowed_methods = allowed_methods(path);
    if (!result.allowed_methods.empty()) {
        result.status = MatchStatus::METHOD_NOT_ALLOWED;
    }
    return result;
}

bool Responder::has_path(const std::string &path) const {
    return std::any_of(routes_.begin(), routes_.end(), [&path](const Route &route) { return route.path == path; });
}

std::vector<std::string> Responder::allowed_methods(const std::string &path) const {
    std::vector<std::string> methods;
    auto add = [&methods](const std::string &method) {
        if (std::find(methods.begin(), methods.end(), method) == methods.end()) {
            methods.push_back(method);
        }
    };

    for (const auto &route : routes_) {
        if (route.path != path) {
            continue;
        }
        add(route.method);
        if (route.method == "GET") {
            add("HEAD");
        }
    }
    return methods;
}

std::string join_methods(const std::vector<std::string> &methods) {
    std::string joined;
    for (const auto &method : methods) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += method;
    }
    return joined;
}

}  // namespace http
}  // namespace waypoint
