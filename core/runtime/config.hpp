#pragma once

#include <string>

namespace waypoint {
namespace runtime {

// Service identity (service: in YAML), published in the API documentation
struct ServiceConfig {
    std::string title = "FastAPI on Vercel";
    std::string version = "0.1.0";
};

struct HttpConfig {
    std::string bind = "127.0.0.1";  // Bind address
    int port = 8080;                 // HTTP port (0 = ephemeral)
    int thread_pool_size = 8;        // Worker thread pool size
    int read_timeout_ms = 5000;      // Socket read timeout
    int write_timeout_ms = 5000;     // Socket write timeout
};

struct DocsConfig {
    bool enabled = true;  // Serve /docs and /openapi.json
};

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct RuntimeConfig {
    ServiceConfig service;
    HttpConfig http;
    DocsConfig docs;
    LoggingConfig logging;
};

// Loads configuration from a YAML file, then validates it
bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RuntimeConfig &config, std::string &error);

}  // namespace runtime
}  // namespace waypoint
