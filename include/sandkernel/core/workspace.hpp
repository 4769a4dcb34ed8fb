/*
 * sandkernel C++ - Workspace
 *
 * On-disk layout: the sessions root holding one directory per session,
 * the upload directory scripts may read from, and the database directory
 * for the artifact store.
 */
#ifndef sandkernel_CORE_WORKSPACE_HPP
#define sandkernel_CORE_WORKSPACE_HPP

#include "settings.hpp"
#include "path_guard.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace sandkernel {

struct FileEntry {
    std::string filename;       // relative to the session directory
    int64_t size;
    int64_t modified_at;        // unix seconds

    FileEntry() : size(0), modified_at(0) {}
};

class Workspace {
public:
    Workspace(const SandboxSettings& settings, const PathGuard& guard);

    // Create the directory structure; false when any of it cannot be made
    bool init();

    bool create_session_dir(const std::string& session_id) const;
    bool remove_session_dir(const std::string& session_id) const;
    bool session_dir_exists(const std::string& session_id) const;

    // Regular files below the session directory, sorted by name.
    // Hidden files (partial downloads) are skipped.
    bool list_files(const std::string& session_id, std::vector<FileEntry>& out) const;

    std::string session_dir(const std::string& session_id) const { return guard_.session_dir(session_id); }
    const std::string& sessions_root() const { return guard_.sessions_root(); }

private:
    const SandboxSettings& settings_;
    const PathGuard& guard_;
};

} // namespace sandkernel

#endif // sandkernel_CORE_WORKSPACE_HPP
