#include "sandbox.h"
#include "stream_demux.h"
#include "logger.h"
#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace runbox {

const char* phase_to_string(ExecutionPhase phase) {
    switch (phase) {
        case ExecutionPhase::ENGINE_UNAVAILABLE: return "engine-unavailable";
        case ExecutionPhase::WORKSPACE:          return "workspace";
        case ExecutionPhase::CREATE:             return "create";
        case ExecutionPhase::START:              return "start";
        case ExecutionPhase::ATTACH:             return "attach";
        case ExecutionPhase::INPUT:              return "input";
        case ExecutionPhase::WAIT:               return "wait";
        case ExecutionPhase::TIMEOUT:            return "timeout";
        case ExecutionPhase::INTERNAL:           return "internal";
    }
    return "unknown";
}

namespace {

std::string short_id(const std::string& id) {
    return id.substr(0, 12);
}

// Force-removes the container when the job scope ends
class ContainerGuard {
public:
    ContainerGuard(EngineClient& engine, std::string id)
        : engine_(engine), id_(std::move(id)) {}

    ~ContainerGuard() {
        LOG_INFO("[Sandbox] Removing container: " + short_id(id_));
        try {
            engine_.remove_container(id_, true);
        } catch (const std::exception& e) {
            // Never mask the job's own result
            LOG_ERROR("[Sandbox] Failed to remove container " + short_id(id_) + ": " + e.what());
        }
    }

    ContainerGuard(const ContainerGuard&) = delete;
    ContainerGuard& operator=(const ContainerGuard&) = delete;

private:
    EngineClient& engine_;
    std::string id_;
};

// Drains the attach channel into a StreamDemuxer on its own thread, so the
// request thread can wait on the container at the same time.
class OutputPump {
public:
    OutputPump(std::unique_ptr<AttachStream> stream, const std::string& job_id, size_t max_output_bytes)
        : stream_(std::move(stream)), job_id_(job_id), demux_(max_output_bytes) {
        thread_ = std::thread([this]() { run(); });
    }

    ~OutputPump() {
        stream_->close();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    OutputPump(const OutputPump&) = delete;
    OutputPump& operator=(const OutputPump&) = delete;

    AttachStream& stream() { return *stream_; }

    // Give the channel `grace` to reach EOF on its own, then shut it down.
    // Returns the demultiplexed stdout/stderr as valid UTF-8.
    void finish(std::chrono::milliseconds grace, std::string& out, std::string& err) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (!done_cv_.wait_for(lock, grace, [this] { return done_; })) {
                LOG_WARN("[Sandbox] Output channel still open after exit for job " + job_id_ +
                         "; closing it");
            }
        }
        stream_->close();
        if (thread_.joinable()) {
            thread_.join();
        }
        out = StreamDemuxer::to_valid_utf8(demux_.take_stdout());
        err = StreamDemuxer::to_valid_utf8(demux_.take_stderr());
    }

private:
    void run() {
        char buffer[PIPE_BUFFER_SIZE];
        try {
            while (true) {
                size_t n = stream_->read(buffer, sizeof(buffer));
                if (n == 0) break;
                demux_.feed(buffer, n);
            }
            LOG_DEBUG("[Sandbox] Stream ended for job " + job_id_);
        } catch (const std::exception& e) {
            LOG_ERROR("[Sandbox] Stream error for job " + job_id_ + ": " + e.what());
        }

        size_t dangling = demux_.finish();
        if (dangling > 0) {
            LOG_WARN("[Sandbox] Stream for job " + job_id_ + " ended mid-frame (" +
                     std::to_string(dangling) + " bytes in partial frame)");
        }
        LOG_DEBUG("[Sandbox] Decoded " + std::to_string(demux_.frames_decoded()) +
                  " frames for job " + job_id_);
        if (demux_.dropped_bytes() > 0) {
            LOG_WARN("[Sandbox] Output limit reached for job " + job_id_ + "; dropped " +
                     std::to_string(demux_.dropped_bytes()) + " bytes");
        }

        std::lock_guard<std::mutex> lock(mutex_);
        done_ = true;
        done_cv_.notify_all();
    }

    std::unique_ptr<AttachStream> stream_;
    std::string job_id_;
    StreamDemuxer demux_;
    std::mutex mutex_;
    std::condition_variable done_cv_;
    bool done_ = false;
    std::thread thread_;
};

} // namespace

Sandbox::Sandbox(EngineClient& engine, const SandboxConfig& config)
    : engine_(engine), config_(config) {}

ContainerSpec Sandbox::make_container_spec(const LanguageSpec& language,
                                           const std::string& workspace_path) const {
    ContainerSpec spec;
    spec.image = language.image;
    spec.command = {"/bin/sh", "-c", language.command_line()};
    spec.working_dir = config_.container_workdir;
    spec.binds = {workspace_path + ":" + config_.container_workdir};
    spec.memory_bytes = config_.memory_limit_bytes;
    spec.cpu_period_us = config_.cpu_period_us;
    spec.cpu_quota_us = config_.cpu_quota_us;
    spec.open_stdin = true;
    return spec;
}

JobResult Sandbox::execute(const std::string& job_id,
                           const LanguageSpec& language,
                           const std::string& workspace_path,
                           const std::string& input) {
    auto start_time = std::chrono::steady_clock::now();

    if (!language.compile_command.empty()) {
        LOG_INFO("[Sandbox] Compilation command: " + language.compile_command);
    }
    LOG_INFO("[Sandbox] Execution command: " + language.run_command);

    // Create
    LOG_INFO("[Sandbox] Creating container for image: " + language.image);
    std::string container_id;
    try {
        container_id = engine_.create_container(make_container_spec(language, workspace_path));
    } catch (const EngineError& e) {
        LOG_ERROR("[Sandbox] Failed to create container: " + std::string(e.what()));
        throw ExecutionError(ExecutionPhase::CREATE, e.what());
    }
    ContainerGuard guard(engine_, container_id);
    LOG_INFO("[Sandbox] Created container " + short_id(container_id) + " for job " + job_id);

    if (Logger::level() >= LogLevel::DEBUG) {
        log_initial_logs(container_id);
    }

    // Start
    LOG_INFO("[Sandbox] Starting container for job: " + job_id);
    try {
        engine_.start_container(container_id);
    } catch (const EngineError& e) {
        LOG_ERROR("[Sandbox] Failed to start container: " + std::string(e.what()));
        throw ExecutionError(ExecutionPhase::START, e.what());
    }

    // Attach
    LOG_INFO("[Sandbox] Attaching to container for output");
    std::unique_ptr<AttachStream> stream;
    try {
        stream = engine_.attach_container(container_id);
    } catch (const EngineError& e) {
        LOG_ERROR("[Sandbox] Failed to attach to container: " + std::string(e.what()));
        throw ExecutionError(ExecutionPhase::ATTACH, e.what());
    }

    // One deadline from attach covers both feeding input and the wait
    auto deadline = std::chrono::steady_clock::now() + language.timeout;
    auto time_left = [&deadline]() {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        return std::max(left, std::chrono::milliseconds(0));
    };

    // Draining starts now and overlaps with the wait below
    OutputPump pump(std::move(stream), job_id, config_.max_output_bytes);

    std::string timeout_message = "Execution timed out after " +
        std::to_string(language.timeout.count()) + " seconds";

    if (!input.empty()) {
        LOG_INFO("[Sandbox] Feeding " + std::to_string(input.size()) + " bytes of input to container");
        try {
            pump.stream().write(input, time_left());
        } catch (const EngineTimeoutError&) {
            LOG_ERROR("[Sandbox] Container did not consume input for job " + job_id);
            capture_diagnostics(container_id);
            throw ExecutionError(ExecutionPhase::TIMEOUT, timeout_message);
        } catch (const EngineError& e) {
            LOG_ERROR("[Sandbox] Failed to write input: " + std::string(e.what()));
            throw ExecutionError(ExecutionPhase::INPUT, e.what());
        }
    }
    // StdinOnce: closing our side gives the program EOF
    pump.stream().close_write();

    // Wait
    LOG_INFO("[Sandbox] Waiting for container to finish (timeout " +
             std::to_string(language.timeout.count()) + "s)");
    WaitResult wait_result;
    try {
        auto remaining = time_left();
        if (remaining.count() == 0) {
            throw EngineTimeoutError("Deadline passed before wait");
        }
        wait_result = engine_.wait_container(container_id, remaining);
    } catch (const EngineTimeoutError&) {
        LOG_ERROR("[Sandbox] Container for job " + job_id + " exceeded " +
                  std::to_string(language.timeout.count()) + "s deadline");
        capture_diagnostics(container_id);
        throw ExecutionError(ExecutionPhase::TIMEOUT, timeout_message);
    } catch (const EngineError& e) {
        LOG_ERROR("[Sandbox] Failed to wait for container: " + std::string(e.what()));
        capture_diagnostics(container_id);
        throw ExecutionError(ExecutionPhase::WAIT, e.what());
    }

    if (!wait_result.error.empty()) {
        LOG_WARN("[Sandbox] Engine reported wait error: " + wait_result.error);
    }

    JobResult result;
    result.job_id = job_id;
    result.exit_code = wait_result.status_code;
    pump.finish(config_.drain_grace, result.output, result.error);
    result.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    LOG_INFO("[Sandbox] Container exit code: " + std::to_string(result.exit_code) +
             " (stdout " + std::to_string(result.output.size()) + " bytes, stderr " +
             std::to_string(result.error.size()) + " bytes, " +
             std::to_string(result.wall_time.count()) + "ms)");
    LOG_DEBUG("[Sandbox] Raw output: " + result.output);
    LOG_DEBUG("[Sandbox] Raw error: " + result.error);

    return result;
}

void Sandbox::log_initial_logs(const std::string& container_id) {
    try {
        std::string out, err;
        StreamDemuxer::split(engine_.container_logs(container_id), out, err);
        LOG_DEBUG("[Sandbox] Initial container logs: " + out + err);
    } catch (const std::exception& e) {
        LOG_ERROR("[Sandbox] Failed to capture initial logs: " + std::string(e.what()));
    }
}

void Sandbox::capture_diagnostics(const std::string& container_id) {
    try {
        LOG_INFO("[Sandbox] Container inspect: " + engine_.inspect_state(container_id));
        std::string out, err;
        StreamDemuxer::split(engine_.container_logs(container_id), out, err);
        LOG_INFO("[Sandbox] Container logs: " + out + err);
    } catch (const std::exception& e) {
        LOG_ERROR("[Sandbox] Failed to inspect container: " + std::string(e.what()));
    }
}

} // namespace runbox
