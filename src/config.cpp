#include "config.h"
#include "logger.h"
#include <cstdlib>
#include <sstream>

namespace runbox {

namespace {

int parse_port(const std::string& value) {
    size_t consumed = 0;
    int port = 0;
    try {
        port = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigError("Invalid port: " + value);
    }
    if (consumed != value.size() || port <= 0 || port > 65535) {
        throw ConfigError("Invalid port: " + value);
    }
    return port;
}

void apply_env(const char* name, std::string& field) {
    const char* value = std::getenv(name);
    if (value != nullptr) {
        field = value;
    }
}

} // namespace

ServerConfig ServerConfig::parse(int argc, const char* const argv[]) {
    ServerConfig config;

    // Environment first; flags override
    if (const char* port = std::getenv("PORT")) {
        if (*port != '\0') config.port = parse_port(port);
    }
    apply_env("DOCKER_SOCKET", config.docker_socket);
    apply_env("RUNBOX_TEMP_DIR", config.temp_dir);
    apply_env("RUNBOX_LOG_DIR", config.log_dir);
    apply_env("RUNBOX_LOG_LEVEL", config.log_level);

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto next_value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw ConfigError("Missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "--port") {
            config.port = parse_port(next_value());
        } else if (arg == "--docker-socket") {
            config.docker_socket = next_value();
        } else if (arg == "--temp-dir") {
            config.temp_dir = next_value();
        } else if (arg == "--log-dir") {
            config.log_dir = next_value();
        } else if (arg == "--log-level") {
            config.log_level = next_value();
        } else if (arg == "--languages") {
            config.languages_file = next_value();
        } else if (arg == "--help" || arg == "-h") {
            config.show_help = true;
        } else {
            throw ConfigError("Unknown option: " + arg);
        }
    }

    if (config.docker_socket.empty()) {
        throw ConfigError("Docker socket path must not be empty");
    }
    if (config.temp_dir.empty()) {
        throw ConfigError("Temp directory must not be empty");
    }
    try {
        Logger::parse_level(config.log_level);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }

    return config;
}

std::string ServerConfig::usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "  --port N              HTTP port (env PORT, default " << DEFAULT_PORT << ")\n"
        << "  --docker-socket PATH  Docker control socket (env DOCKER_SOCKET, default "
        << DEFAULT_DOCKER_SOCKET << ")\n"
        << "  --temp-dir DIR        Job workspace root (env RUNBOX_TEMP_DIR, default ./temp)\n"
        << "  --log-dir DIR         Daily log files; empty disables (env RUNBOX_LOG_DIR, default ./logs)\n"
        << "  --log-level LEVEL     error|warn|info|debug (env RUNBOX_LOG_LEVEL, default info)\n"
        << "  --languages FILE      JSON file overriding/extending the language table\n"
        << "  --help                Show this message\n";
    return out.str();
}

} // namespace runbox
