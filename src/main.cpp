/*
 * runbox - Ephemeral multi-language code execution
 * One Docker container per request, always cleaned up
 */

#include "api_handler.h"
#include "config.h"
#include "constants.h"
#include "docker_client.h"
#include "engine_connection.h"
#include "executor.h"
#include "http_server.h"
#include "language_registry.h"
#include "logger.h"
#include "workspace.h"
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <thread>

using namespace runbox;

namespace {

HttpServer* g_server = nullptr;

void handle_shutdown_signal(int) {
    if (g_server) {
        g_server->stop();
    }
}

// Last line of defence: record what escaped before the process dies
void log_terminate() {
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("Uncaught exception: ") + e.what());
        } catch (...) {
            LOG_ERROR("Uncaught non-standard exception");
        }
    } else {
        LOG_ERROR("std::terminate called without an active exception");
    }
    std::abort();
}

} // namespace

int main(int argc, char* argv[]) {
    ServerConfig config;
    try {
        config = ServerConfig::parse(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << e.what() << "\n\n" << ServerConfig::usage(argv[0]);
        return 1;
    }
    if (config.show_help) {
        std::cout << ServerConfig::usage(argv[0]);
        return 0;
    }

    std::set_terminate(log_terminate);
    // Socket writes to vanished peers must fail, not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    Logger::set_level(Logger::parse_level(config.log_level));
    if (!config.log_dir.empty()) {
        try {
            Logger::set_log_dir(config.log_dir);
            Logger::prune_old_logs(LOG_RETENTION_FILES);
        } catch (const std::exception& e) {
            std::cerr << "Cannot use log directory " << config.log_dir << ": " << e.what() << std::endl;
            return 1;
        }
    }

    LanguageRegistry languages;
    if (!config.languages_file.empty()) {
        try {
            languages.load_overrides(config.languages_file);
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to load languages: " + std::string(e.what()));
            return 1;
        }
    }

    LOG_INFO("runbox - Ephemeral Code Execution");
    LOG_INFO("Docker socket: " + config.docker_socket);
    LOG_INFO("Workspace root: " + config.temp_dir);
    LOG_INFO("Languages: " + std::to_string(languages.size()));

    WorkspaceManager workspaces(config.temp_dir);
    EngineConnection connection(std::make_shared<DockerClient>(config.docker_socket, DOCKER_API_VERSION));
    CodeExecutor executor(connection, languages, workspaces);
    ApiHandler api(executor, languages);

    HttpServer server(config.port);
    api.register_routes(server);

    // One-shot startup probe; the server answers health checks meanwhile
    std::thread probe([&connection]() {
        connection.establish(MAX_CONNECT_ATTEMPTS,
            std::chrono::duration_cast<std::chrono::milliseconds>(CONNECT_RETRY_DELAY));
    });

    g_server = &server;
    std::signal(SIGINT, handle_shutdown_signal);
    std::signal(SIGTERM, handle_shutdown_signal);

    int exit_code = 0;
    try {
        server.start();
    } catch (const std::exception& e) {
        LOG_ERROR("Server failed: " + std::string(e.what()));
        exit_code = 1;
    }

    g_server = nullptr;
    probe.join();
    return exit_code;
}
