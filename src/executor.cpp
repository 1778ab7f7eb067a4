#include "executor.h"
#include "job_id.h"
#include "constants.h"
#include "logger.h"
#include <memory>
#include <stdexcept>

namespace runbox {

CodeExecutor::CodeExecutor(const EngineConnection& connection,
                           const LanguageRegistry& languages,
                           const WorkspaceManager& workspaces,
                           const SandboxConfig& config)
    : connection_(connection), languages_(languages), workspaces_(workspaces), config_(config) {}

JobResult CodeExecutor::execute(const ExecutionRequest& request) const {
    const LanguageSpec* language = languages_.lookup(request.language);
    if (!language) {
        throw std::invalid_argument("Unsupported language");
    }
    if (request.code.empty()) {
        throw std::invalid_argument("Code is required");
    }

    std::shared_ptr<EngineClient> engine = connection_.client();
    if (!engine) {
        LOG_ERROR("[Executor] Docker daemon is not available (state: " +
                  std::string(connection_state_to_string(connection_.state())) + ")");
        throw ExecutionError(ExecutionPhase::ENGINE_UNAVAILABLE, "Docker service unavailable");
    }

    std::string job_id;
    try {
        job_id = generate_job_id();
    } catch (const std::exception& e) {
        throw ExecutionError(ExecutionPhase::INTERNAL, e.what());
    }
    LOG_INFO("[Executor] Job " + job_id + " started (" + language->name + ")");

    // Owns the directory from here on; removed when this scope ends
    std::unique_ptr<ScopedWorkspace> workspace;
    try {
        workspace = std::make_unique<ScopedWorkspace>(workspaces_, job_id);
        workspace->write(language->source_file_name(), request.code);
        if (!request.input.empty()) {
            workspace->write(INPUT_FILE_NAME, request.input);
        }
    } catch (const WorkspaceError& e) {
        LOG_ERROR("[Executor] Workspace setup failed for job " + job_id + ": " + e.what());
        throw ExecutionError(ExecutionPhase::WORKSPACE, e.what());
    }

    Sandbox sandbox(*engine, config_);
    try {
        JobResult result = sandbox.execute(job_id, *language, workspace->path(), request.input);
        if (result.exit_code != 0) {
            LOG_ERROR("[Executor] Job " + job_id + " failed with status code: " +
                      std::to_string(result.exit_code));
        } else {
            LOG_INFO("[Executor] Job " + job_id + " completed");
        }
        return result;
    } catch (const ExecutionError& e) {
        LOG_ERROR("[Executor] Job " + job_id + " failed during " +
                  phase_to_string(e.phase()) + ": " + e.what());
        throw;
    } catch (const std::exception& e) {
        LOG_ERROR("[Executor] Unexpected fault in job " + job_id + ": " + e.what());
        throw ExecutionError(ExecutionPhase::INTERNAL, e.what());
    }
}

} // namespace runbox
