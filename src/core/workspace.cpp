#include <sandkernel/core/workspace.hpp>
#include <sandkernel/core/logger.hpp>
#include <sandkernel/core/utils.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sys/stat.h>
#include <dirent.h>

namespace sandkernel {

namespace {

void walk(const std::string& root, const std::string& rel, std::vector<FileEntry>& out) {
    std::string dir = rel.empty() ? root : root + "/" + rel;
    DIR* d = opendir(dir.c_str());
    if (!d) return;

    struct dirent* ent;
    while ((ent = readdir(d)) != nullptr) {
        std::string name = ent->d_name;
        if (name.empty() || name[0] == '.') continue;

        std::string child_rel = rel.empty() ? name : rel + "/" + name;
        struct stat st;
        if (lstat((root + "/" + child_rel).c_str(), &st) != 0) continue;

        if (S_ISDIR(st.st_mode)) {
            walk(root, child_rel, out);
        } else if (S_ISREG(st.st_mode)) {
            FileEntry entry;
            entry.filename = child_rel;
            entry.size = static_cast<int64_t>(st.st_size);
            entry.modified_at = static_cast<int64_t>(st.st_mtime);
            out.push_back(entry);
        }
    }
    closedir(d);
}

} // anonymous namespace

// ============================================================================
// Workspace Implementation
// ============================================================================

Workspace::Workspace(const SandboxSettings& settings, const PathGuard& guard)
    : settings_(settings)
    , guard_(guard)
{}

bool Workspace::init() {
    if (!ensure_directory(guard_.sessions_root())) {
        LOG_ERROR("[Workspace] Failed to create sessions directory: %s (%s)",
                  guard_.sessions_root().c_str(), strerror(errno));
        return false;
    }
    if (!settings_.upload_dir.empty() && !ensure_directory(settings_.upload_dir)) {
        LOG_ERROR("[Workspace] Failed to create upload directory: %s (%s)",
                  settings_.upload_dir.c_str(), strerror(errno));
        return false;
    }
    if (settings_.storage_enabled && !create_parent_directory(settings_.db_path)) {
        LOG_ERROR("[Workspace] Failed to create database directory for %s (%s)",
                  settings_.db_path.c_str(), strerror(errno));
        return false;
    }
    for (const auto& dir : settings_.shared_dirs) {
        struct stat st;
        if (stat(dir.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
            LOG_WARN("[Workspace] Shared directory %s does not exist", dir.c_str());
        }
    }

    LOG_INFO("[Workspace] Directories initialized:");
    LOG_INFO("[Workspace]   sessions: %s", guard_.sessions_root().c_str());
    LOG_INFO("[Workspace]   uploads:  %s", settings_.upload_dir.c_str());
    if (settings_.storage_enabled) {
        LOG_INFO("[Workspace]   db:       %s", settings_.db_path.c_str());
    }
    return true;
}

bool Workspace::create_session_dir(const std::string& session_id) const {
    std::string dir = session_dir(session_id);
    if (!ensure_directory(dir)) {
        LOG_ERROR("[Workspace] Failed to create session directory %s (%s)", dir.c_str(), strerror(errno));
        return false;
    }
    return true;
}

bool Workspace::remove_session_dir(const std::string& session_id) const {
    if (!PathGuard::is_valid_session_id(session_id)) return false;
    std::string dir = session_dir(session_id);
    if (!session_dir_exists(session_id)) return true;
    if (!remove_tree(dir)) {
        LOG_WARN("[Workspace] Failed to remove %s (%s)", dir.c_str(), strerror(errno));
        return false;
    }
    LOG_DEBUG("[Workspace] Removed %s", dir.c_str());
    return true;
}

bool Workspace::session_dir_exists(const std::string& session_id) const {
    struct stat st;
    return stat(session_dir(session_id).c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool Workspace::list_files(const std::string& session_id, std::vector<FileEntry>& out) const {
    out.clear();
    if (!PathGuard::is_valid_session_id(session_id)) return false;
    if (!session_dir_exists(session_id)) return false;

    walk(session_dir(session_id), "", out);
    std::sort(out.begin(), out.end(), [](const FileEntry& a, const FileEntry& b) {
        return a.filename < b.filename;
    });
    return true;
}

} // namespace sandkernel
