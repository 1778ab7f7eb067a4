#pragma once

#include "engine_client.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace runbox {

enum class ConnectionState {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    FAILED
};

const char* connection_state_to_string(ConnectionState state);

struct ConnectResult {
    bool connected = false;
    int attempts = 0;
    std::string last_error;
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

// Ping `client` up to `max_attempts` times, sleeping `delay` between
// failed attempts (not after the last one). Logs one line per attempt.
ConnectResult connect_with_retry(EngineClient& client,
                                 int max_attempts,
                                 std::chrono::milliseconds delay,
                                 const Sleeper& sleeper = {});

// Process-wide reachability of the container engine. Created once in main
// and injected into the executor. The state only moves forward during the
// startup probe; there is no reconnect loop.
class EngineConnection {
public:
    explicit EngineConnection(std::shared_ptr<EngineClient> client);

    // Run the startup probe. Ends in CONNECTED or FAILED.
    ConnectResult establish(int max_attempts,
                            std::chrono::milliseconds delay,
                            const Sleeper& sleeper = {});

    ConnectionState state() const { return state_.load(); }
    bool is_connected() const { return state() == ConnectionState::CONNECTED; }

    // The client, or nullptr unless CONNECTED
    std::shared_ptr<EngineClient> client() const;

private:
    std::shared_ptr<EngineClient> client_;
    std::atomic<ConnectionState> state_;
};

} // namespace runbox
