#pragma once

#include <optional>
#include <string>

#include "config.hpp"

namespace waypoint {
namespace runtime {

// Command-line options for waypoint-server
struct CliOptions {
    std::string config_path;  // Empty = built-in defaults
    std::optional<int> port;  // Overrides http.port when set
    bool show_help = false;
};

/**
 * @brief Parse waypoint-server arguments
 *
 * Accepts --config PATH, --config=PATH, --port N, --port=N, --help and -h.
 * Parsing stops at --help. An empty or missing value, a non-numeric port,
 * or an unknown argument fails with a message in error.
 */
bool parse_args(int argc, const char *const *argv, CliOptions &options, std::string &error);

/**
 * @brief Build the effective configuration from parsed options
 *
 * Loads the config file when one was given (a missing file is an error),
 * applies the port override, then validates the result.
 */
bool resolve_config(const CliOptions &options, RuntimeConfig &config, std::string &error);

std::string usage();

}  // namespace runtime
}  // namespace waypoint
