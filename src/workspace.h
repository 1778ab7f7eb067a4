#pragma once

#include <string>
#include <stdexcept>

namespace runbox {

class WorkspaceError : public std::runtime_error {
public:
    explicit WorkspaceError(const std::string& message)
        : std::runtime_error(message) {}
};

// Per-job directories under a shared temp root. The directory is
// bind-mounted into the job's container.
class WorkspaceManager {
public:
    explicit WorkspaceManager(std::string root);

    // Create <root>/<job_id>. Throws WorkspaceError.
    std::string create(const std::string& job_id) const;

    // Write a file into the workspace. Throws WorkspaceError.
    void write(const std::string& path, const std::string& filename, const std::string& content) const;

    // Recursively remove the workspace. Never throws; missing paths are fine.
    void destroy(const std::string& path) const noexcept;

    std::string path_for(const std::string& job_id) const;
    const std::string& root() const { return root_; }

private:
    std::string root_;
};

// Owns one job workspace; destroys it when the scope ends
class ScopedWorkspace {
public:
    ScopedWorkspace(const WorkspaceManager& manager, const std::string& job_id)
        : manager_(manager), path_(manager.create(job_id)) {}

    ~ScopedWorkspace() { manager_.destroy(path_); }

    ScopedWorkspace(const ScopedWorkspace&) = delete;
    ScopedWorkspace& operator=(const ScopedWorkspace&) = delete;

    const std::string& path() const { return path_; }

    void write(const std::string& filename, const std::string& content) const {
        manager_.write(path_, filename, content);
    }

private:
    const WorkspaceManager& manager_;
    std::string path_;
};

} // namespace runbox
