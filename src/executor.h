#pragma once

#include "sandbox.h"
#include "engine_connection.h"
#include "language_registry.h"
#include "workspace.h"
#include <string>

namespace runbox {

// One code submission
struct ExecutionRequest {
    std::string language;
    std::string code;
    std::string input;                     // Empty: no stdin
};

// Job orchestrator: validates preconditions, materializes the workspace,
// runs the sandbox and always cleans up. Stateless between calls, so any
// number of jobs may run concurrently.
class CodeExecutor {
public:
    CodeExecutor(const EngineConnection& connection,
                 const LanguageRegistry& languages,
                 const WorkspaceManager& workspaces,
                 const SandboxConfig& config = SandboxConfig{});

    // Returns the result for any exit code.
    // Throws std::invalid_argument for an unsupported language or empty code,
    // and ExecutionError for every failure after that.
    JobResult execute(const ExecutionRequest& request) const;

private:
    const EngineConnection& connection_;
    const LanguageRegistry& languages_;
    const WorkspaceManager& workspaces_;
    SandboxConfig config_;
};

} // namespace runbox
