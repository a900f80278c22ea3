#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "config.hpp"
#include "http/responder.hpp"
#include "http/server.hpp"

namespace waypoint {
namespace runtime {

class Runtime {
public:
    explicit Runtime(const RuntimeConfig &config);
    ~Runtime();

    // Builds the route table and starts the HTTP server
    bool initialize(std::string &error);

    // Main runtime loop (blocking) until stop() or a shutdown signal
    void run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    // Stops the HTTP server; safe to call more than once
    void shutdown();

    const http::Responder &get_responder() const { return *responder_; }

    // Null before initialize()
    http::HttpServer *get_http_server() { return http_server_.get(); }

private:
    RuntimeConfig config_;

    std::unique_ptr<http::Responder> responder_;
    std::unique_ptr<http::HttpServer> http_server_;

    std::atomic<bool> running_{false};
};

}  // namespace runtime
}  // namespace waypoint
