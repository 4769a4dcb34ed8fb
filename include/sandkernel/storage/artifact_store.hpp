/*
 * sandkernel C++ - Artifact Store
 *
 * Outbound storage for files produced by runs. A stored artifact gets an
 * opaque handle and expires after the configured TTL.
 *
 *   ArtifactStore        - interface the engine talks to
 *   SqliteArtifactStore  - content kept as BLOBs in one SQLite table
 */
#ifndef sandkernel_STORAGE_ARTIFACT_STORE_HPP
#define sandkernel_STORAGE_ARTIFACT_STORE_HPP

#include <string>
#include <vector>
#include <mutex>
#include <cstdint>
#include <sqlite3.h>

namespace sandkernel {

struct StoredArtifact {
    std::string id;             // download handle
    std::string session_id;
    std::string filename;
    std::string mime;
    int64_t size;
    std::string sha256;
    std::string content;        // empty in listings
    int64_t created_at;         // unix seconds
    int64_t expires_at;         // unix seconds

    StoredArtifact() : size(0), created_at(0), expires_at(0) {}
};

class ArtifactStore {
public:
    virtual ~ArtifactStore() {}

    // Returns the handle, empty on failure
    virtual std::string store(const std::string& bytes, const std::string& filename,
                              const std::string& session_id, int ttl_hours) = 0;

    virtual bool fetch(const std::string& handle, StoredArtifact& out) = 0;

    virtual std::vector<StoredArtifact> list_for_session(const std::string& session_id) = 0;

    // Removes expired rows; returns how many
    virtual int cleanup_expired() = 0;
};

class SqliteArtifactStore : public ArtifactStore {
public:
    SqliteArtifactStore();
    ~SqliteArtifactStore();

    bool open(const std::string& db_path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    std::string store(const std::string& bytes, const std::string& filename,
                      const std::string& session_id, int ttl_hours) override;
    bool fetch(const std::string& handle, StoredArtifact& out) override;
    std::vector<StoredArtifact> list_for_session(const std::string& session_id) override;
    int cleanup_expired() override;

    // Same as above against an explicit clock (unix seconds)
    int cleanup_expired_at(int64_t now);
    bool fetch_at(const std::string& handle, int64_t now, StoredArtifact& out);

    static std::string guess_mime(const std::string& filename);

private:
    SqliteArtifactStore(const SqliteArtifactStore&);
    SqliteArtifactStore& operator=(const SqliteArtifactStore&);

    bool exec_sql(const std::string& sql);
    bool init_tables();

    sqlite3* db_;
    std::mutex mutex_;
};

} // namespace sandkernel

#endif // sandkernel_STORAGE_ARTIFACT_STORE_HPP
