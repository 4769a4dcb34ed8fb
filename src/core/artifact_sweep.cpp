#include <sandkernel/core/artifact_sweep.hpp>
#include <sandkernel/core/logger.hpp>
#include <sandkernel/core/utils.hpp>

#include <set>
#include <sys/stat.h>
#include <dirent.h>

namespace sandkernel {

namespace {

const std::set<std::string>& storable_extensions() {
    static const std::set<std::string> exts = {
        "csv", "tsv", "json", "jsonl", "txt", "md", "xlsx", "xls", "parquet",
        "pdf", "png", "jpg", "jpeg", "gif", "svg", "html", "xml", "zip"
    };
    return exts;
}

void scan(const std::string& root, const std::string& rel, std::map<std::string, FileStamp>& out) {
    std::string dir = rel.empty() ? root : root + "/" + rel;
    DIR* d = opendir(dir.c_str());
    if (!d) return;

    struct dirent* ent;
    while ((ent = readdir(d)) != nullptr) {
        std::string name = ent->d_name;
        if (name == "." || name == "..") continue;

        std::string child = rel.empty() ? name : rel + "/" + name;
        struct stat st;
        if (lstat((root + "/" + child).c_str(), &st) != 0) continue;

        if (S_ISDIR(st.st_mode)) {
            scan(root, child, out);
        } else if (S_ISREG(st.st_mode)) {
            int64_t mtime_ns = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000LL + st.st_mtim.tv_nsec;
            out[child] = FileStamp(static_cast<int64_t>(st.st_size), mtime_ns);
        }
    }
    closedir(d);
}

} // anonymous namespace

// ============================================================================
// DirSnapshot Implementation
// ============================================================================

DirSnapshot DirSnapshot::take(const std::string& dir) {
    DirSnapshot snap;
    scan(dir, "", snap.files_);
    return snap;
}

// ============================================================================
// ArtifactSweep Implementation
// ============================================================================

ArtifactSweep::ArtifactSweep(int64_t max_file_size)
    : max_file_size_(max_file_size)
{}

bool ArtifactSweep::is_storable(const std::string& filename) {
    return storable_extensions().count(file_extension(filename)) > 0;
}

std::vector<ArtifactFile> ArtifactSweep::collect_files(const std::string& dir, const DirSnapshot& before) const {
    std::vector<ArtifactFile> out;
    DirSnapshot after = DirSnapshot::take(dir);

    for (const auto& kv : after.files()) {
        const std::string& rel = kv.first;
        const FileStamp& stamp = kv.second;

        auto prev = before.files().find(rel);
        bool created = prev == before.files().end();
        if (!created && prev->second == stamp) continue;

        // partial downloads and dotfiles are never artifacts
        if (base_name(rel).empty() || base_name(rel)[0] == '.') continue;
        if (!is_storable(rel)) {
            LOG_DEBUG("[Sweep] Skipping %s (extension not storable)", rel.c_str());
            continue;
        }

        ArtifactFile file;
        file.filename = rel;
        file.path = dir + "/" + rel;
        file.size = stamp.size;
        file.modified_at = stamp.mtime_ns / 1000000000LL;
        file.created = created;

        if (stamp.size > max_file_size_) {
            file.oversized = true;
            LOG_INFO("[Sweep] %s is %lld bytes, above the inline limit", rel.c_str(),
                     static_cast<long long>(stamp.size));
        } else if (read_file(file.path, file.content)) {
            file.size = static_cast<int64_t>(file.content.size());
            file.sha256 = sha256_hex(file.content);
        } else {
            LOG_WARN("[Sweep] Could not read %s", file.path.c_str());
            continue;
        }
        out.push_back(file);
    }
    return out;
}

void ArtifactSweep::drain_charts(ChartSurface& surface, std::vector<ChartImage>& charts) {
    size_t already = charts.size();
    surface.flush_pending_renders(charts);
    for (size_t i = already; i < charts.size(); ++i) {
        charts[i].index = static_cast<int>(i);
    }
    surface.close_all();
    LOG_DEBUG("[Sweep] %zu chart(s), %zu left open", charts.size(), charts.size() - already);
}

} // namespace sandkernel
