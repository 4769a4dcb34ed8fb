/*
 * sandkernel C++ - Artifact Sweep
 *
 * Collects what a run left behind: files created or modified in the
 * session directory (found by comparing directory snapshots), swept by
 * the daemon, and chart figures still open when the script finished,
 * drained inside the kernel process.
 */
#ifndef sandkernel_CORE_ARTIFACT_SWEEP_HPP
#define sandkernel_CORE_ARTIFACT_SWEEP_HPP

#include "types.hpp"
#include <string>
#include <vector>
#include <map>
#include <cstdint>

namespace sandkernel {

// Process-wide chart state the sweep drains once a run is over
class ChartSurface {
public:
    virtual ~ChartSurface() {}

    // Render open figures that were not captured during the run
    virtual void flush_pending_renders(std::vector<ChartImage>& out) = 0;

    virtual void close_all() = 0;
};

struct FileStamp {
    int64_t size;
    int64_t mtime_ns;

    FileStamp() : size(0), mtime_ns(0) {}
    FileStamp(int64_t s, int64_t m) : size(s), mtime_ns(m) {}

    bool operator==(const FileStamp& o) const { return size == o.size && mtime_ns == o.mtime_ns; }
    bool operator!=(const FileStamp& o) const { return !(*this == o); }
};

// Relative path -> stamp for every regular file under a directory
class DirSnapshot {
public:
    static DirSnapshot take(const std::string& dir);

    const std::map<std::string, FileStamp>& files() const { return files_; }
    bool contains(const std::string& rel) const { return files_.count(rel) > 0; }
    size_t size() const { return files_.size(); }

private:
    std::map<std::string, FileStamp> files_;
};

class ArtifactSweep {
public:
    explicit ArtifactSweep(int64_t max_file_size);

    // Appends the figures still open after a run to charts, numbering
    // them after the ones captured during it, then closes them all
    static void drain_charts(ChartSurface& surface, std::vector<ChartImage>& charts);

    // New or modified storable files, in path order
    std::vector<ArtifactFile> collect_files(const std::string& dir, const DirSnapshot& before) const;

    static bool is_storable(const std::string& filename);

private:
    int64_t max_file_size_;
};

} // namespace sandkernel

#endif // sandkernel_CORE_ARTIFACT_SWEEP_HPP
