#include "server.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

#include "errors.hpp"
#include "handlers/utils.hpp"
#include "logging/logger.hpp"
#include "openapi.hpp"

namespace waypoint {
namespace http {

namespace {
// httplib treats route patterns as regular expressions
std::string regex_escape(const std::string &path) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string escaped;
    for (char c : path) {
        if (special.find(c) != std::string::npos) {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}
}  // namespace

HttpServer::HttpServer(const runtime::RuntimeConfig &config, const Responder &responder)
    : config_(config.http),
      docs_config_(config.docs),
      responder_(responder),
      openapi_body_(build_openapi_document(responder, config.service).dump()),
      docs_page_(render_docs_page(responder, config.service)) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    LOG_INFO("[HTTP] Starting server on " << config_.bind << ":" << config_.port);

    server_ = std::make_unique<httplib::Server>();

    server_->set_read_timeout(std::chrono::milliseconds(config_.read_timeout_ms));
    server_->set_write_timeout(std::chrono::milliseconds(config_.write_timeout_ms));

    int pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    setup_routes();

    // Default JSON body for HTTP errors raised by httplib itself (e.g. 404).
    // Handlers that already set a body keep it.
    server_->set_error_handler([this](const httplib::Request &req, httplib::Response &res) { handle_error(req, res); });
    server_->set_exception_handler(handle_exception);
    server_->set_logger(log_request);

    // Bind first so the listening socket exists before the thread starts
    if (config_.port == 0) {
        int bound = server_->bind_to_any_port(config_.bind.c_str());
        if (bound < 0) {
            error = "Failed to bind to " + config_.bind + " on an ephemeral port";
            server_.reset();
            return false;
        }
        port_ = bound;
    } else {
        if (!server_->bind_to_port(config_.bind.c_str(), config_.port)) {
            error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
            server_.reset();
            return false;
        }
        port_ = config_.port;
    }

    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_DEBUG("[HTTP] Server thread started");
        server_->listen_after_bind();
        LOG_DEBUG("[HTTP] Server thread exiting");
    });

    // stop() is a no-op until httplib reports running, so wait for it here
    server_->wait_until_ready();

    LOG_INFO("[HTTP] Server listening on " << config_.bind << ":" << port_);
    return true;
}

void HttpServer::stop() {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("[HTTP] Stopping server");
    running_.store(false);

    if (server_) {
        server_->stop();
    }

    if (server_thread_ && server_thread_->joinable()) {
        server_thread_->join();
    }

    server_thread_.reset();
    server_.reset();
    LOG_INFO("[HTTP] Server stopped");
}

void HttpServer::setup_routes() {
    auto route_handler = [this](const httplib::Request &req, httplib::Response &res) { handle_route(req, res); };

    // Every method is routed through the Responder, which decides between
    // the payload and 405. HEAD is served by the GET handler.
    std::vector<std::string> registered;
    for (const auto &route : responder_.routes()) {
        if (std::find(registered.begin(), registered.end(), route.path) != registered.end()) {
            continue;
        }
        registered.push_back(route.path);

        const std::string pattern = regex_escape(route.path);
        server_->Get(pattern, route_handler);
        server_->Post(pattern, route_handler);
        server_->Put(pattern, route_handler);
        server_->Patch(pattern, route_handler);
        server_->Delete(pattern, route_handler);
        server_->Options(pattern, route_handler);
    }

    if (docs_config_.enabled) {
        auto docs_not_allowed = [this](const httplib::Request &req, httplib::Response &res) {
            handle_docs_method_not_allowed(req, res);
        };

        server_->Get(regex_escape(kOpenApiPath),
                     [this](const httplib::Request &req, httplib::Response &res) { handle_get_openapi(req, res); });
        server_->Get(regex_escape(kDocsPath),
                     [this](const httplib::Request &req, httplib::Response &res) { handle_get_docs(req, res); });

        for (const char *path : {kOpenApiPath, kDocsPath}) {
            const std::string pattern = regex_escape(path);
            server_->Post(pattern, docs_not_allowed);
            server_->Put(pattern, docs_not_allowed);
            server_->Patch(pattern, docs_not_allowed);
            server_->Delete(pattern, docs_not_allowed);
            server_->Options(pattern, docs_not_allowed);
        }
    }

    LOG_INFO("[HTTP] Routes configured:");
    for (const auto &route : responder_.routes()) {
        LOG_INFO("[HTTP]   " << route.method << "  " << route.path);
    }
    if (docs_config_.enabled) {
        LOG_INFO("[HTTP]   GET  " << kOpenApiPath);
        LOG_INFO("[HTTP]   GET  " << kDocsPath);
    }
}

std::vector<std::string> HttpServer::allowed_methods(const std::string &path) const {
    if (docs_config_.enabled && (path == kOpenApiPath || path == kDocsPath)) {
        return {"GET", "HEAD"};
    }
    return responder_.allowed_methods(path);
}

void HttpServer::send_method_not_allowed(httplib::Response &res, const std::vector<std::string> &allowed) {
    res.set_header("Allow", join_methods(allowed));
    send_error(res, StatusCode::METHOD_NOT_ALLOWED);
}

}  // namespace http
}  // namespace waypoint
