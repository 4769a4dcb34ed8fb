/*
 * sandkernel C++ - Path Guard
 *
 * Maps every path a script hands to a file operation onto the session
 * directory tree. Upload and shared roots are reachable for reads only.
 *
 * resolve() is lexical: it never touches the filesystem and keeps no
 * state, so the same (path, session, mode) always yields the same
 * decision and resolving a confined result again returns it unchanged.
 */
#ifndef sandkernel_CORE_PATH_GUARD_HPP
#define sandkernel_CORE_PATH_GUARD_HPP

#include "settings.hpp"
#include <string>
#include <vector>

namespace sandkernel {

enum class AccessMode {
    Read,
    Write
};

enum class PathRejection {
    None,
    Invalid,        // empty, NUL byte, bad session id
    Traversal,      // ".." walked out of the session directory
    OutsideRoots,   // absolute path outside every permitted root
    ReadOnly        // write into the upload or a shared root
};

const char* path_rejection_name(PathRejection reason);

struct PathDecision {
    enum Kind {
        Confined,
        SharedReadOnly,
        Rejected
    };

    Kind kind;
    std::string path;
    PathRejection reason;
    std::string message;

    PathDecision() : kind(Rejected), reason(PathRejection::Invalid) {}

    bool ok() const { return kind != Rejected; }

    static PathDecision confined(const std::string& p) {
        PathDecision d;
        d.kind = Confined;
        d.path = p;
        d.reason = PathRejection::None;
        return d;
    }

    static PathDecision shared(const std::string& p) {
        PathDecision d;
        d.kind = SharedReadOnly;
        d.path = p;
        d.reason = PathRejection::None;
        return d;
    }

    static PathDecision rejected(PathRejection why, const std::string& msg) {
        PathDecision d;
        d.kind = Rejected;
        d.reason = why;
        d.message = msg;
        return d;
    }
};

class PathGuard {
public:
    explicit PathGuard(const SandboxSettings& settings);

    PathDecision resolve(const std::string& raw_path, const std::string& session_id, AccessMode mode) const;

    std::string session_dir(const std::string& session_id) const;

    const std::string& sessions_root() const { return sessions_root_; }

    // 1-128 chars of [A-Za-z0-9_.-], not "." or ".."
    static bool is_valid_session_id(const std::string& session_id);

private:
    bool strip_temp_prefix(const std::string& path, std::string& relative) const;
    bool under_read_only_root(const std::string& path) const;

    std::string sessions_root_;
    std::vector<std::string> read_only_roots_;
    std::vector<std::string> temp_prefixes_;
};

} // namespace sandkernel

#endif // sandkernel_CORE_PATH_GUARD_HPP
