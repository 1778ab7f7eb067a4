#include "engine_connection.h"
#include "logger.h"
#include <thread>

namespace runbox {

const char* connection_state_to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED: return "disconnected";
        case ConnectionState::CONNECTING:   return "connecting";
        case ConnectionState::CONNECTED:    return "connected";
        case ConnectionState::FAILED:       return "failed";
    }
    return "unknown";
}

ConnectResult connect_with_retry(EngineClient& client,
                                 int max_attempts,
                                 std::chrono::milliseconds delay,
                                 const Sleeper& sleeper) {
    ConnectResult result;

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        result.attempts = attempt;
        try {
            client.ping();
            result.connected = true;
            result.last_error.clear();
            LOG_INFO("[Engine] Docker daemon connection established (attempt " +
                     std::to_string(attempt) + ")");
            return result;
        } catch (const EngineError& e) {
            result.last_error = e.what();
            LOG_ERROR("[Engine] Docker connection attempt " + std::to_string(attempt) +
                      " failed: " + e.what());
        }

        if (attempt < max_attempts) {
            if (sleeper) {
                sleeper(delay);
            } else {
                std::this_thread::sleep_for(delay);
            }
        }
    }

    LOG_ERROR("[Engine] Failed to reach Docker daemon after " + std::to_string(max_attempts) +
              " attempts; execution requests will be rejected");
    return result;
}

EngineConnection::EngineConnection(std::shared_ptr<EngineClient> client)
    : client_(std::move(client)), state_(ConnectionState::DISCONNECTED) {}

ConnectResult EngineConnection::establish(int max_attempts,
                                          std::chrono::milliseconds delay,
                                          const Sleeper& sleeper) {
    if (!client_) {
        state_ = ConnectionState::FAILED;
        ConnectResult result;
        result.last_error = "No engine client configured";
        LOG_ERROR("[Engine] " + result.last_error);
        return result;
    }

    state_ = ConnectionState::CONNECTING;
    ConnectResult result = connect_with_retry(*client_, max_attempts, delay, sleeper);
    state_ = result.connected ? ConnectionState::CONNECTED : ConnectionState::FAILED;
    return result;
}

std::shared_ptr<EngineClient> EngineConnection::client() const {
    return is_connected() ? client_ : nullptr;
}

} // namespace runbox
