// Waypoint server
// Static JSON routes over HTTP, optional YAML config

#include <iostream>
#include <string>
#include "logging/logger.hpp"
#include "runtime/cli.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"

int main(int argc, char **argv)
{
    waypoint::runtime::CliOptions options;
    std::string error;

    if (!waypoint::runtime::parse_args(argc, argv, options, error))
    {
        // Using cerr here as logger might not be configured yet
        std::cerr << error << "\n";
        std::cerr << "Use --help for usage information\n";
        return 1;
    }

    if (options.show_help)
    {
        std::cerr << waypoint::runtime::usage();
        return 0;
    }

    waypoint::runtime::RuntimeConfig config;
    if (!waypoint::runtime::resolve_config(options, config, error))
    {
        LOG_ERROR(error);
        return 1;
    }

    waypoint::logging::Logger::set_level(waypoint::logging::string_to_level(config.logging.level));

    LOG_INFO("Waypoint server starting...");

    waypoint::runtime::Runtime runtime(config);

    if (!runtime.initialize(error))
    {
        LOG_ERROR("Runtime initialization failed: " << error);
        return 1;
    }

    // Install signal handler for graceful shutdown
    waypoint::runtime::SignalHandler::install();

    LOG_INFO("Server Ready");
    LOG_INFO("  Listening: " << config.http.bind << ":" << runtime.get_http_server()->get_port());
    LOG_INFO("  Routes: " << runtime.get_responder().routes().size());
    LOG_INFO("  Log level: " << waypoint::logging::level_to_string(waypoint::logging::Logger::level()));

    // Run main loop (blocking)
    runtime.run();

    waypoint::runtime::SignalHandler::restore();
    LOG_INFO("Shutdown complete");
    return 0;
}
