#include "workspace.h"
#include "logger.h"
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace runbox {

WorkspaceManager::WorkspaceManager(std::string root) {
    // Docker bind mounts need absolute host paths
    std::error_code ec;
    fs::path absolute = fs::absolute(root, ec);
    root_ = ec ? root : absolute.lexically_normal().string();
    while (root_.size() > 1 && root_.back() == '/') {
        root_.pop_back();
    }
}

std::string WorkspaceManager::path_for(const std::string& job_id) const {
    return root_ + "/" + job_id;
}

std::string WorkspaceManager::create(const std::string& job_id) const {
    if (job_id.empty() || job_id.find('/') != std::string::npos || job_id == "." || job_id == "..") {
        throw WorkspaceError("Invalid job id for workspace: " + job_id);
    }

    std::string path = path_for(job_id);
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        throw WorkspaceError("Failed to create workspace root " + root_ + ": " + ec.message());
    }
    if (!fs::create_directory(path, ec)) {
        throw WorkspaceError("Failed to create workspace " + path + ": " +
                             (ec ? ec.message() : std::string("already exists")));
    }

    LOG_INFO("[Workspace] Created working directory: " + path);
    return path;
}

void WorkspaceManager::write(const std::string& path, const std::string& filename,
                             const std::string& content) const {
    if (filename.empty() || filename.find('/') != std::string::npos) {
        throw WorkspaceError("Invalid workspace file name: " + filename);
    }

    std::string file_path = path + "/" + filename;
    std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw WorkspaceError("Failed to open " + file_path + " for writing");
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
        throw WorkspaceError("Failed to write " + file_path);
    }

    LOG_DEBUG("[Workspace] Wrote " + std::to_string(content.size()) + " bytes to " + file_path);
}

void WorkspaceManager::destroy(const std::string& path) const noexcept {
    if (path.empty()) return;

    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        LOG_ERROR("[Workspace] Failed to remove " + path + ": " + ec.message());
    } else {
        LOG_INFO("[Workspace] Cleaned up working directory: " + path);
    }
}

} // namespace runbox
