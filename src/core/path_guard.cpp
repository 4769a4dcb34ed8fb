#include <sandkernel/core/path_guard.hpp>
#include <sandkernel/core/utils.hpp>

#include <algorithm>
#include <cctype>

namespace sandkernel {

namespace {

bool within(const std::string& path, const std::string& root) {
    return path == root || starts_with(path, root + "/");
}

bool has_parent_segment(const std::string& path) {
    for (const auto& part : split(path, '/')) {
        if (part == "..") return true;
    }
    return false;
}

// Offset just past the first temp-like directory segment in a
// lowercased drive-relative path, npos when there is none.
size_t find_temp_segment(const std::string& lower) {
    static const char* const segments[] = { "/temp/", "/tmp/" };
    size_t best = std::string::npos;
    size_t best_len = 0;
    for (const char* seg : segments) {
        size_t pos = lower.find(seg);
        if (pos != std::string::npos && pos < best) {
            best = pos;
            best_len = std::char_traits<char>::length(seg);
        }
    }
    return best == std::string::npos ? best : best + best_len;
}

} // anonymous namespace

const char* path_rejection_name(PathRejection reason) {
    switch (reason) {
        case PathRejection::None: return "none";
        case PathRejection::Invalid: return "invalid";
        case PathRejection::Traversal: return "traversal";
        case PathRejection::OutsideRoots: return "outside_roots";
        case PathRejection::ReadOnly: return "read_only";
    }
    return "unknown";
}

PathGuard::PathGuard(const SandboxSettings& settings)
    : sessions_root_(normalize_path(settings.sessions_root))
{
    if (!settings.upload_dir.empty()) {
        read_only_roots_.push_back(normalize_path(settings.upload_dir));
    }
    for (const auto& dir : settings.shared_dirs) {
        read_only_roots_.push_back(normalize_path(dir));
    }

    temp_prefixes_.push_back("/tmp");
    temp_prefixes_.push_back("/var/tmp");
    if (!settings.temp_dir.empty()) {
        std::string temp = normalize_path(settings.temp_dir);
        if (std::find(temp_prefixes_.begin(), temp_prefixes_.end(), temp) == temp_prefixes_.end()) {
            temp_prefixes_.push_back(temp);
        }
    }
}

bool PathGuard::is_valid_session_id(const std::string& session_id) {
    if (session_id.empty() || session_id.size() > 128) return false;
    if (session_id == "." || session_id == "..") return false;
    for (char c : session_id) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '_' && c != '-' && c != '.') return false;
    }
    return true;
}

std::string PathGuard::session_dir(const std::string& session_id) const {
    return sessions_root_ + "/" + session_id;
}

bool PathGuard::strip_temp_prefix(const std::string& path, std::string& relative) const {
    for (const auto& prefix : temp_prefixes_) {
        if (path == prefix) {
            relative.clear();
            return true;
        }
        if (starts_with(path, prefix + "/")) {
            relative = path.substr(prefix.size() + 1);
            return true;
        }
    }
    return false;
}

bool PathGuard::under_read_only_root(const std::string& path) const {
    for (const auto& root : read_only_roots_) {
        if (within(path, root)) return true;
    }
    return false;
}

PathDecision PathGuard::resolve(const std::string& raw_path, const std::string& session_id, AccessMode mode) const {
    if (!is_valid_session_id(session_id)) {
        return PathDecision::rejected(PathRejection::Invalid, "invalid session id");
    }
    if (raw_path.empty() || raw_path.find('\0') != std::string::npos) {
        return PathDecision::rejected(PathRejection::Invalid, "empty or malformed path");
    }

    const std::string own = session_dir(session_id);

    std::string p = raw_path;
    std::replace(p.begin(), p.end(), '\\', '/');

    std::string relative;
    bool is_relative = true;

    if (p.size() >= 2 && std::isalpha(static_cast<unsigned char>(p[0])) && p[1] == ':') {
        // Foreign drive: keep what follows a temp directory, else the bare file name
        std::string rest = p.substr(2);
        size_t after_temp = find_temp_segment(to_lower(rest));
        if (after_temp != std::string::npos) {
            relative = rest.substr(after_temp);
        } else {
            relative = base_name(rest);
            if (relative.empty() || relative == "." || relative == "..") {
                return PathDecision::rejected(PathRejection::Invalid, "no file name in '" + raw_path + "'");
            }
        }
    } else if (p == "~" || starts_with(p, "~/")) {
        relative = p.size() > 2 ? p.substr(2) : "";
    } else if (p[0] != '/') {
        relative = p;
    } else {
        is_relative = false;
    }

    if (!is_relative) {
        std::string norm = normalize_path(p);
        if (within(norm, own)) {
            return PathDecision::confined(norm);
        }
        if (under_read_only_root(norm)) {
            if (mode == AccessMode::Read) {
                return PathDecision::shared(norm);
            }
            return PathDecision::rejected(PathRejection::ReadOnly, "'" + raw_path + "' is read-only");
        }
        if (within(norm, sessions_root_)) {
            return PathDecision::rejected(has_parent_segment(p) ? PathRejection::Traversal : PathRejection::OutsideRoots,
                                          "'" + raw_path + "' belongs to another session");
        }
        if (!strip_temp_prefix(p, relative)) {
            if (has_parent_segment(p)) {
                return PathDecision::rejected(PathRejection::Traversal, "'" + raw_path + "' escapes the sandbox");
            }
            return PathDecision::rejected(PathRejection::OutsideRoots, "'" + raw_path + "' is outside the sandbox");
        }
    }

    // A relative path that repeats the session directory (without its
    // leading slash) is collapsed, as many times as it repeats.
    const std::string own_rel = own.substr(1);
    for (;;) {
        while (starts_with(relative, "./")) {
            relative = relative.substr(2);
        }
        while (!relative.empty() && relative[0] == '/') {
            relative = relative.substr(1);
        }
        if (relative == own_rel) {
            relative.clear();
        } else if (starts_with(relative, own_rel + "/")) {
            relative = relative.substr(own_rel.size() + 1);
        } else {
            break;
        }
    }

    std::string candidate = relative.empty() ? own : normalize_path(own + "/" + relative);
    if (within(candidate, own)) {
        return PathDecision::confined(candidate);
    }
    return PathDecision::rejected(PathRejection::Traversal, "'" + raw_path + "' escapes the session directory");
}

} // namespace sandkernel
