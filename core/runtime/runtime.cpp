#include "runtime.hpp"

#include <chrono>
#include <thread>

#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace waypoint {
namespace runtime {

namespace {
constexpr auto kLoopInterval = std::chrono::milliseconds(100);
}  // namespace

Runtime::Runtime(const RuntimeConfig &config) : config_(config) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing " << config_.service.title);

    responder_ = std::make_unique<http::Responder>();
    LOG_INFO("[Runtime] Route table ready (" << responder_->routes().size() << " routes)");

    http_server_ = std::make_unique<http::HttpServer>(config_, *responder_);
    if (!http_server_->start(error)) {
        error = "HTTP server failed to start: " + error;
        http_server_.reset();
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

void Runtime::run() {
    LOG_INFO("[Runtime] Starting main loop");
    running_ = true;

    LOG_INFO("[Runtime] Press Ctrl+C to exit");

    while (running_) {
        std::this_thread::sleep_for(kLoopInterval);

        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Runtime] Signal received, stopping...");
            running_ = false;
            break;
        }
    }

    LOG_INFO("[Runtime] Main loop exited");
    shutdown();
}

void Runtime::shutdown() {
    if (http_server_ && http_server_->is_running()) {
        LOG_INFO("[Runtime] Stopping HTTP server");
        http_server_->stop();
    }
}

}  // namespace runtime
}  // namespace waypoint
