#include "cli.hpp"

#include <filesystem>
#include <stdexcept>

#include "../logging/logger.hpp"

namespace waypoint {
namespace runtime {

namespace {
const std::string kConfigFlag = "--config";
const std::string kPortFlag = "--port";

// Matches "--flag VALUE" and "--flag=VALUE". Returns false when arg is not this flag.
bool take_value(const std::string &flag, int argc, const char *const *argv, int &i, std::string &value,
                bool &missing) {
    const std::string arg = argv[i];
    missing = false;

    if (arg == flag) {
        if (i + 1 >= argc) {
            missing = true;
            return true;
        }
        value = argv[++i];
        return true;
    }
    if (arg.rfind(flag + "=", 0) == 0) {
        value = arg.substr(flag.size() + 1);
        return true;
    }
    return false;
}

bool parse_port(const std::string &value, int &port) {
    try {
        size_t consumed = 0;
        port = std::stoi(value, &consumed);
        return consumed == value.size();
    } catch (const std::invalid_argument &) {
        return false;
    } catch (const std::out_of_range &) {
        return false;
    }
}
}  // namespace

bool parse_args(int argc, const char *const *argv, CliOptions &options, std::string &error) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        std::string value;
        bool missing = false;

        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            return true;
        }

        if (take_value(kConfigFlag, argc, argv, i, value, missing)) {
            if (missing || value.empty()) {
                error = "--config requires a file path";
                return false;
            }
            options.config_path = value;
            continue;
        }

        if (take_value(kPortFlag, argc, argv, i, value, missing)) {
            if (missing || value.empty()) {
                error = "--port requires a value";
                return false;
            }
            int port = 0;
            if (!parse_port(value, port)) {
                error = "Invalid port: " + value;
                return false;
            }
            options.port = port;
            continue;
        }

        error = "Unknown argument: " + arg;
        return false;
    }

    return true;
}

bool resolve_config(const CliOptions &options, RuntimeConfig &config, std::string &error) {
    if (!options.config_path.empty()) {
        if (!std::filesystem::exists(options.config_path)) {
            error = "Config file not found: " + options.config_path;
            return false;
        }

        LOG_INFO("Loading config: " << options.config_path);
        if (!load_config(options.config_path, config, error)) {
            error = "Failed to load config: " + error;
            return false;
        }
    } else {
        LOG_INFO("No config file given, using defaults");
    }

    if (options.port) {
        config.http.port = *options.port;
    }

    if (!validate_config(config, error)) {
        error = "Invalid configuration: " + error;
        return false;
    }
    return true;
}

std::string usage() {
    return "Usage: waypoint-server [OPTIONS]\n\n"
           "Options:\n"
           "  --config=PATH    Path to YAML config file (default: built-in defaults)\n"
           "  --port=N         Override http.port from config\n"
           "  --help, -h       Show this help\n";
}

}  // namespace runtime
}  // namespace waypoint
