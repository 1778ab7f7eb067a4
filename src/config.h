#pragma once

#include <string>
#include <stdexcept>
#include "constants.h"

namespace runbox {

class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& message)
        : std::invalid_argument(message) {}
};

// Server configuration. Command-line flags win over environment variables,
// which win over defaults.
struct ServerConfig {
    int port = DEFAULT_PORT;                          // --port / PORT
    std::string docker_socket = DEFAULT_DOCKER_SOCKET; // --docker-socket / DOCKER_SOCKET
    std::string temp_dir = "temp";                    // --temp-dir / RUNBOX_TEMP_DIR
    std::string log_dir = "logs";                     // --log-dir / RUNBOX_LOG_DIR ("" disables)
    std::string log_level = "info";                   // --log-level / RUNBOX_LOG_LEVEL
    std::string languages_file;                       // --languages (JSON overrides)
    bool show_help = false;                           // --help

    // Throws ConfigError on unknown flags or invalid values
    static ServerConfig parse(int argc, const char* const argv[]);

    static std::string usage(const std::string& program);
};

} // namespace runbox
