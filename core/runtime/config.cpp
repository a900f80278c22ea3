#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <vector>

#include "../logging/logger.hpp"

namespace waypoint {
namespace runtime {

namespace {
std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
}  // namespace

bool validate_config(const RuntimeConfig &config, std::string &error) {
    // Validate HTTP settings
    if (config.http.bind.empty()) {
        error = "http.bind must not be empty";
        return false;
    }
    if (config.http.port < 0 || config.http.port > 65535) {
        error = "HTTP port must be between 0 and 65535";
        return false;
    }
    if (config.http.thread_pool_size < 1) {
        error = "HTTP thread_pool_size must be at least 1";
        return false;
    }
    if (config.http.read_timeout_ms < 1 || config.http.write_timeout_ms < 1) {
        error = "HTTP read/write timeouts must be >= 1ms";
        return false;
    }

    // Validate service identity
    if (config.service.title.empty()) {
        error = "service.title must not be empty";
        return false;
    }

    // Validate Logging settings
    // Level names are case-insensitive, like logging::string_to_level()
    const std::string level = to_lower(config.logging.level);
    if (level != "debug" && level != "info" && level != "warn" && level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // An empty file keeps every default
        if (!yaml.IsNull() && !yaml.IsMap()) {
            error = "Config root must be a mapping";
            return false;
        }

        if (yaml.IsMap()) {
            // Check for unknown top-level keys
            const std::vector<std::string> valid_keys = {"service", "http", "docs", "logging"};
            for (const auto &key_node : yaml) {
                std::string key = key_node.first.as<std::string>();
                if (std::find(valid_keys.begin(), valid_keys.end(), key) == valid_keys.end()) {
                    LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
                }
            }

            // Load service identity
            if (yaml["service"]) {
                if (yaml["service"]["title"]) {
                    config.service.title = yaml["service"]["title"].as<std::string>();
                }
                if (yaml["service"]["version"]) {
                    config.service.version = yaml["service"]["version"].as<std::string>();
                }
            }

            // Load HTTP config
            if (yaml["http"]) {
                if (yaml["http"]["bind"]) {
                    config.http.bind = yaml["http"]["bind"].as<std::string>();
                }
                if (yaml["http"]["port"]) {
                    config.http.port = yaml["http"]["port"].as<int>();
                }
                if (yaml["http"]["thread_pool_size"]) {
                    config.http.thread_pool_size = yaml["http"]["thread_pool_size"].as<int>();
                }
                if (yaml["http"]["read_timeout_ms"]) {
                    config.http.read_timeout_ms = yaml["http"]["read_timeout_ms"].as<int>();
                }
                if (yaml["http"]["write_timeout_ms"]) {
                    config.http.write_timeout_ms = yaml["http"]["write_timeout_ms"].as<int>();
                }
            }

            // Load docs config
            if (yaml["docs"]) {
                if (yaml["docs"]["enabled"]) {
                    config.docs.enabled = yaml["docs"]["enabled"].as<bool>();
                }
            }

            // Load logging config
            if (yaml["logging"]) {
                if (yaml["logging"]["level"]) {
                    config.logging.level = to_lower(yaml["logging"]["level"].as<std::string>());
                }
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        LOG_INFO("[Config] Service: " << config.service.title << " " << config.service.version);
        LOG_INFO("[Config] HTTP: " << config.http.bind << ":" << config.http.port << " ("
                                   << config.http.thread_pool_size << " threads)");
        LOG_INFO("[Config] Docs: " << (config.docs.enabled ? "enabled" : "disabled"));
        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace waypoint
