#pragma once

#include <string>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <cstdint>
#include "constants.h"
#include "engine_client.h"
#include "language_registry.h"

namespace runbox {

// Where in the job lifecycle a failure happened
enum class ExecutionPhase {
    ENGINE_UNAVAILABLE,
    WORKSPACE,
    CREATE,
    START,
    ATTACH,
    INPUT,
    WAIT,
    TIMEOUT,
    INTERNAL
};

const char* phase_to_string(ExecutionPhase phase);

// A job failed before producing a result. what() is the caller-facing message.
class ExecutionError : public std::runtime_error {
public:
    ExecutionError(ExecutionPhase phase, const std::string& message)
        : std::runtime_error(message), phase_(phase) {}

    ExecutionPhase phase() const { return phase_; }

private:
    ExecutionPhase phase_;
};

// Job execution result
struct JobResult {
    std::string job_id;
    std::string output;                    // Captured stdout
    std::string error;                     // Captured stderr
    int64_t exit_code = 0;
    std::chrono::milliseconds wall_time{0};
};

// Sandbox configuration
struct SandboxConfig {
    int64_t memory_limit_bytes = CONTAINER_MEMORY_LIMIT_BYTES;
    int64_t cpu_period_us = CONTAINER_CPU_PERIOD_US;
    int64_t cpu_quota_us = CONTAINER_CPU_QUOTA_US;
    std::string container_workdir = CONTAINER_WORKDIR;
    size_t max_output_bytes = MAX_OUTPUT_SIZE;       // Per stream
    std::chrono::milliseconds drain_grace =
        std::chrono::duration_cast<std::chrono::milliseconds>(DRAIN_GRACE_PERIOD);
};

// Runs one job in a fresh container:
// create -> start -> attach -> feed input -> drain output || wait -> remove.
// The container is force-removed on every path out of execute().
class Sandbox {
public:
    explicit Sandbox(EngineClient& engine, const SandboxConfig& config = SandboxConfig{});

    // Run `language` against the files in `workspace_path`.
    // Returns on normal termination (any exit code); throws ExecutionError otherwise.
    JobResult execute(const std::string& job_id,
                      const LanguageSpec& language,
                      const std::string& workspace_path,
                      const std::string& input);

    // Container description for a job (exposed for tests)
    ContainerSpec make_container_spec(const LanguageSpec& language,
                                      const std::string& workspace_path) const;

private:
    void log_initial_logs(const std::string& container_id);
    void capture_diagnostics(const std::string& container_id);

    EngineClient& engine_;
    SandboxConfig config_;
};

} // namespace runbox
