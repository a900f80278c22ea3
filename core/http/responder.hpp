#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace waypoint {
namespace http {

/**
 * @brief A fixed (method, path) pair and its precomputed JSON payload
 *
 * The payload keeps its declaration key order (ordered_json) and is
 * serialized exactly once, so every response for the route carries the
 * same bytes.
 */
struct Route {
    std::string method;
    std::string path;
    std::string summary;             // Used by the API documentation only
    nlohmann::ordered_json payload;  // Structured form, for documentation and tests
    std::string body;                // Compact serialization sent on the wire
};

enum class MatchStatus { FOUND, NOT_FOUND, METHOD_NOT_ALLOWED };

struct MatchResult {
    MatchStatus status = MatchStatus::NOT_FOUND;
    const Route *route = nullptr;              // Set when status == FOUND
    std::vector<std::string> allowed_methods;  // Set when status == METHOD_NOT_ALLOWED
};

/**
 * @brief Static route table
 *
 * Holds the service's three read-only routes:
 * - GET /            -> {"hello":"world","docs":"/docs"}
 * - GET /api         -> {"ok":true,"msg":"FastAPI running on Vercel"}
 * - GET /api/health  -> {"status":"healthy"}
 *
 * The table is built in the constructor and never modified afterwards, so
 * match() may be called concurrently from any number of request threads.
 * Paths compare exactly; "/api/" does not match "/api". HEAD is accepted
 * wherever GET is.
 */
class Responder {
public:
    Responder();

    const std::vector<Route> &routes() const { return routes_; }

    MatchResult match(const std::string &method, const std::string &path) const;

    bool has_path(const std::string &path) const;

    /**
     * @brief Methods accepted on a path, in declaration order
     *
     * Includes HEAD for every GET route. Empty for unknown paths.
     */
    std::vector<std::string> allowed_methods(const std::string &path) const;

private:
    void add_route(const std::string &method, const std::string &path, const std::string &summary,
                   nlohmann::ordered_json payload);

    std::vector<Route> routes_;
};

// "GET, HEAD" style list for the Allow header
std::string join_methods(const std::vector<std::string> &methods);

}  // namespace http
}  // namespace waypoint
