#pragma once

// Prevent Windows macro pollution (must be before httplib.h)
#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#endif

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <httplib.h>
#include "responder.hpp"
#include "runtime/config.hpp"

namespace waypoint {
namespace http {

/**
 * @brief HTTP server exposing the Responder's route table
 *
 * Thread model:
 * - Server runs in its own thread (via httplib::Server::listen_after_bind)
 * - Request handlers execute in httplib's thread pool
 * - Handlers only read immutable data (route table, prebuilt docs)
 *
 * Routing policy:
 * - GET/HEAD on a Responder route -> 200 with the route's JSON payload
 * - Any other method on a known path -> 405 with an Allow header
 *   (including methods httplib cannot route, such as TRACE)
 * - Unknown path -> 404 {"detail":"Not Found"}
 * - Handler exception -> 500 {"detail":"Internal Server Error"}
 *
 * Lifecycle:
 * - start() binds to configured port and spawns server thread
 * - stop() signals shutdown and joins server thread
 */
class HttpServer {
public:
    /**
     * @brief Construct HTTP server
     *
     * @param config Runtime configuration (http, docs and service sections)
     * @param responder Route table; must outlive the server
     */
    HttpServer(const runtime::RuntimeConfig &config, const Responder &responder);

    ~HttpServer();

    /**
     * @brief Start HTTP server
     *
     * Binds to configured address/port and starts server thread.
     * Port 0 binds an ephemeral port, reported by get_port().
     *
     * @param error Populated with error message on failure
     * @return true if server started
     */
    bool start(std::string &error);

    /**
     * @brief Stop HTTP server
     *
     * Safe to call multiple times.
     */
    void stop();

    bool is_running() const { return running_.load(); }

    /**
     * @brief Get the port server is listening on
     */
    int get_port() const { return port_; }

private:
    runtime::HttpConfig config_;
    runtime::DocsConfig docs_config_;
    int port_ = 0;

    const Responder &responder_;

    // Documentation bodies, rendered once at construction
    std::string openapi_body_;
    std::string docs_page_;

    // Server state
    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};

    void setup_routes();

    // Route handlers (implemented in handlers/)
    void handle_route(const httplib::Request &req, httplib::Response &res);
    void handle_get_openapi(const httplib::Request &req, httplib::Response &res);
    void handle_get_docs(const httplib::Request &req, httplib::Response &res);
    void handle_docs_method_not_allowed(const httplib::Request &req, httplib::Response &res);
    void handle_error(const httplib::Request &req, httplib::Response &res);

    // GET and HEAD for every served path, empty for unknown paths
    std::vector<std::string> allowed_methods(const std::string &path) const;

    void send_method_not_allowed(httplib::Response &res, const std::vector<std::string> &allowed);
};

}  // namespace http
}  // namespace waypoint
