/*
 * sandkernel C++ - Artifact Store Implementation
 *
 * SQLite backend: one row per stored file, content as a BLOB, expiry as
 * a unix timestamp checked on read and purged by cleanup_expired().
 */
#include <sandkernel/storage/artifact_store.hpp>
#include <sandkernel/core/logger.hpp>
#include <sandkernel/core/utils.hpp>
#include <map>

namespace sandkernel {

namespace {

std::string column_text(sqlite3_stmt* stmt, int col) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

void read_row(sqlite3_stmt* stmt, StoredArtifact& a) {
    a.id = column_text(stmt, 0);
    a.session_id = column_text(stmt, 1);
    a.filename = column_text(stmt, 2);
    a.mime = column_text(stmt, 3);
    a.size = sqlite3_column_int64(stmt, 4);
    a.sha256 = column_text(stmt, 5);
    a.created_at = sqlite3_column_int64(stmt, 6);
    a.expires_at = sqlite3_column_int64(stmt, 7);
}

} // anonymous namespace

// ============================================================================
// SqliteArtifactStore Implementation
// ============================================================================

SqliteArtifactStore::SqliteArtifactStore() : db_(nullptr) {}

SqliteArtifactStore::~SqliteArtifactStore() {
    close();
}

bool SqliteArtifactStore::open(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }

    if (!create_parent_directory(db_path)) {
        LOG_ERROR("[ArtifactStore] Failed to create parent directory for '%s'", db_path.c_str());
        return false;
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        LOG_ERROR("[ArtifactStore] Failed to open database '%s': %s", db_path.c_str(), sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    exec_sql("PRAGMA journal_mode=WAL");
    exec_sql("PRAGMA synchronous=NORMAL");
    exec_sql("PRAGMA busy_timeout=5000");

    if (!init_tables()) {
        LOG_ERROR("[ArtifactStore] Failed to initialize tables");
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    LOG_INFO("[ArtifactStore] Database opened: %s", db_path.c_str());
    return true;
}

void SqliteArtifactStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SqliteArtifactStore::exec_sql(const std::string& sql) {
    if (!db_) return false;

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        LOG_ERROR("[ArtifactStore] SQL error: %s\n  Query: %s", err_msg ? err_msg : "unknown", sql.c_str());
        if (err_msg) sqlite3_free(err_msg);
        return false;
    }
    return true;
}

bool SqliteArtifactStore::init_tables() {
    bool ok = exec_sql(
        "CREATE TABLE IF NOT EXISTS artifacts ("
        "  id TEXT PRIMARY KEY,"
        "  session_id TEXT NOT NULL,"
        "  filename TEXT NOT NULL,"
        "  mime TEXT NOT NULL DEFAULT 'application/octet-stream',"
        "  size INTEGER NOT NULL,"
        "  sha256 TEXT NOT NULL,"
        "  content BLOB NOT NULL,"
        "  created_at INTEGER NOT NULL,"
        "  expires_at INTEGER NOT NULL"
        ")"
    );
    if (!ok) return false;

    exec_sql("CREATE INDEX IF NOT EXISTS idx_artifacts_session ON artifacts(session_id)");
    exec_sql("CREATE INDEX IF NOT EXISTS idx_artifacts_expires ON artifacts(expires_at)");
    return true;
}

std::string SqliteArtifactStore::store(const std::string& bytes, const std::string& filename,
                                       const std::string& session_id, int ttl_hours) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return "";

    std::string id = generate_uuid();
    int64_t now = current_timestamp();
    int64_t expires = now + static_cast<int64_t>(ttl_hours) * 3600;

    const char* sql =
        "INSERT INTO artifacts (id, session_id, filename, mime, size, sha256, content, created_at, expires_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("[ArtifactStore] store prepare failed: %s", sqlite3_errmsg(db_));
        return "";
    }

    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, session_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, filename.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, guess_mime(filename).c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(bytes.size()));
    sqlite3_bind_text(stmt, 6, sha256_hex(bytes).c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_blob64(stmt, 7, bytes.data(), static_cast<sqlite3_uint64>(bytes.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 8, now);
    sqlite3_bind_int64(stmt, 9, expires);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR("[ArtifactStore] store step failed: %s", sqlite3_errmsg(db_));
        return "";
    }

    LOG_DEBUG("[ArtifactStore] Stored %s for %s as %s (%zu bytes)", filename.c_str(), session_id.c_str(),
              id.c_str(), bytes.size());
    return id;
}

bool SqliteArtifactStore::fetch(const std::string& handle, StoredArtifact& out) {
    return fetch_at(handle, current_timestamp(), out);
}

bool SqliteArtifactStore::fetch_at(const std::string& handle, int64_t now, StoredArtifact& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return false;

    const char* sql =
        "SELECT id, session_id, filename, mime, size, sha256, created_at, expires_at, content "
        "FROM artifacts WHERE id = ? AND expires_at > ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("[ArtifactStore] fetch prepare failed: %s", sqlite3_errmsg(db_));
        return false;
    }
    sqlite3_bind_text(stmt, 1, handle.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, now);

    bool found = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        read_row(stmt, out);
        const void* blob = sqlite3_column_blob(stmt, 8);
        int len = sqlite3_column_bytes(stmt, 8);
        out.content.assign(blob ? static_cast<const char*>(blob) : "", blob ? static_cast<size_t>(len) : 0);
        found = true;
    }
    sqlite3_finalize(stmt);
    return found;
}

std::vector<StoredArtifact> SqliteArtifactStore::list_for_session(const std::string& session_id) {
    std::vector<StoredArtifact> results;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return results;

    const char* sql =
        "SELECT id, session_id, filename, mime, size, sha256, created_at, expires_at "
        "FROM artifacts WHERE session_id = ? AND expires_at > ? ORDER BY created_at, filename";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("[ArtifactStore] list prepare failed: %s", sqlite3_errmsg(db_));
        return results;
    }
    sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, current_timestamp());

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        StoredArtifact a;
        read_row(stmt, a);
        results.push_back(a);
    }
    sqlite3_finalize(stmt);
    return results;
}

int SqliteArtifactStore::cleanup_expired() {
    return cleanup_expired_at(current_timestamp());
}

int SqliteArtifactStore::cleanup_expired_at(int64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return 0;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "DELETE FROM artifacts WHERE expires_at <= ?", -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("[ArtifactStore] cleanup prepare failed: %s", sqlite3_errmsg(db_));
        return 0;
    }
    sqlite3_bind_int64(stmt, 1, now);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR("[ArtifactStore] cleanup failed: %s", sqlite3_errmsg(db_));
        return 0;
    }

    int removed = sqlite3_changes(db_);
    if (removed > 0) {
        LOG_INFO("[ArtifactStore] Removed %d expired artifacts", removed);
    }
    return removed;
}

std::string SqliteArtifactStore::guess_mime(const std::string& filename) {
    static const std::map<std::string, std::string> types = {
        {"csv", "text/csv"},
        {"tsv", "text/tab-separated-values"},
        {"json", "application/json"},
        {"jsonl", "application/x-ndjson"},
        {"txt", "text/plain"},
        {"md", "text/markdown"},
        {"html", "text/html"},
        {"xml", "application/xml"},
        {"pdf", "application/pdf"},
        {"png", "image/png"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"gif", "image/gif"},
        {"svg", "image/svg+xml"},
        {"zip", "application/zip"},
        {"xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {"xls", "application/vnd.ms-excel"},
        {"parquet", "application/vnd.apache.parquet"}
    };
    auto it = types.find(file_extension(filename));
    return it == types.end() ? "application/octet-stream" : it->second;
}

} // namespace sandkernel
