/*
 * Warden C++ - Session Snapshot Store Implementation
 *
 * SQLite storage for VFS contents and quota counters.
 */
#include <warden/store/session_store.hpp>
#include <warden/session/session.hpp>
#include <warden/core/logger.hpp>
#include <warden/core/utils.hpp>

#include <map>

namespace warden {

SessionStore::SessionStore() : db_(nullptr) {}

SessionStore::~SessionStore() {
    close();
}

bool SessionStore::open(const std::string& db_path) {
    if (db_) {
        close();
    }

    if (db_path != ":memory:" && !create_parent_directory(db_path)) {
        last_error_ = "cannot create parent directory for '" + db_path + "'";
        LOG_ERROR("[SessionStore] %s", last_error_.c_str());
        return false;
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        last_error_ = std::string("failed to open '") + db_path + "': " +
                      (db_ ? sqlite3_errmsg(db_) : "out of memory");
        LOG_ERROR("[SessionStore] %s", last_error_.c_str());
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    exec_sql("PRAGMA journal_mode=WAL");
    exec_sql("PRAGMA synchronous=NORMAL");
    exec_sql("PRAGMA busy_timeout=5000");

    if (!ensure_schema()) {
        LOG_ERROR("[SessionStore] Failed to initialize tables");
        close();
        return false;
    }

    path_ = db_path;
    LOG_INFO("[SessionStore] Database opened: %s", db_path.c_str());
    return true;
}

void SessionStore::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SessionStore::exec_sql(const std::string& sql) {
    if (!db_) {
        last_error_ = "database is not open";
        return false;
    }

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);

    if (rc != SQLITE_OK) {
        last_error_ = err_msg ? err_msg : "unknown";
        LOG_ERROR("[SessionStore] SQL error: %s\n  Query: %s", last_error_.c_str(), sql.c_str());
        if (err_msg) sqlite3_free(err_msg);
        return false;
    }

    return true;
}

bool SessionStore::fail(const std::string& what) {
    last_error_ = what + ": " + (db_ ? sqlite3_errmsg(db_) : "database is not open");
    LOG_ERROR("[SessionStore] %s", last_error_.c_str());
    return false;
}

bool SessionStore::ensure_schema() {
    bool ok = exec_sql(
        "CREATE TABLE IF NOT EXISTS vfs_files ("
        "  session_id TEXT NOT NULL,"
        "  path TEXT NOT NULL,"
        "  data BLOB NOT NULL,"
        "  updated_at INTEGER NOT NULL,"
        "  PRIMARY KEY (session_id, path)"
        ")"
    );
    if (!ok) return false;

    return exec_sql(
        "CREATE TABLE IF NOT EXISTS quota_counters ("
        "  session_id TEXT NOT NULL,"
        "  cap_key TEXT NOT NULL,"
        "  calls_used INTEGER NOT NULL,"
        "  PRIMARY KEY (session_id, cap_key)"
        ")"
    );
}

// ============================================================================
// Save
// ============================================================================

bool SessionStore::save_session(const Session& session) {
    if (!db_) {
        last_error_ = "database is not open";
        return false;
    }

    const std::string& id = session.id();
    if (!exec_sql("BEGIN IMMEDIATE")) return false;

    sqlite3_stmt* stmt = nullptr;
    bool ok = true;

    // Drop the previous snapshot
    const char* clear_sql[] = {
        "DELETE FROM vfs_files WHERE session_id = ?",
        "DELETE FROM quota_counters WHERE session_id = ?"
    };
    for (size_t i = 0; ok && i < 2; ++i) {
        if (sqlite3_prepare_v2(db_, clear_sql[i], -1, &stmt, nullptr) != SQLITE_OK) {
            ok = fail("prepare delete");
            break;
        }
        sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt) != SQLITE_DONE) ok = fail("delete snapshot");
        sqlite3_finalize(stmt);
        stmt = nullptr;
    }

    // Files
    if (ok) {
        if (sqlite3_prepare_v2(db_,
                "INSERT INTO vfs_files (session_id, path, data, updated_at) VALUES (?, ?, ?, ?)",
                -1, &stmt, nullptr) != SQLITE_OK) {
            ok = fail("prepare insert file");
        } else {
            int64_t now = current_timestamp_ms();
            const std::map<std::string, std::string>& files = session.vfs().files();
            for (std::map<std::string, std::string>::const_iterator it = files.begin();
                 it != files.end(); ++it) {
                sqlite3_reset(stmt);
                sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_text(stmt, 2, it->first.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_blob(stmt, 3, it->second.data(), static_cast<int>(it->second.size()),
                                  SQLITE_TRANSIENT);
                sqlite3_bind_int64(stmt, 4, now);
                if (sqlite3_step(stmt) != SQLITE_DONE) {
                    ok = fail("insert file '" + it->first + "'");
                    break;
                }
            }
            sqlite3_finalize(stmt);
            stmt = nullptr;
        }
    }

    // Quota counters
    if (ok) {
        if (sqlite3_prepare_v2(db_,
                "INSERT INTO quota_counters (session_id, cap_key, calls_used) VALUES (?, ?, ?)",
                -1, &stmt, nullptr) != SQLITE_OK) {
            ok = fail("prepare insert counter");
        } else {
            std::map<std::string, int64_t> usage = session.capabilities().usage();
            for (std::map<std::string, int64_t>::const_iterator it = usage.begin();
                 it != usage.end(); ++it) {
                sqlite3_reset(stmt);
                sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_text(stmt, 2, it->first.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_int64(stmt, 3, it->second);
                if (sqlite3_step(stmt) != SQLITE_DONE) {
                    ok = fail("insert counter '" + it->first + "'");
                    break;
                }
            }
            sqlite3_finalize(stmt);
            stmt = nullptr;
        }
    }

    if (!ok) {
        exec_sql("ROLLBACK");
        return false;
    }
    if (!exec_sql("COMMIT")) {
        exec_sql("ROLLBACK");
        return false;
    }

    LOG_DEBUG("[SessionStore] Saved session %s (%zu files)", id.c_str(), session.vfs().file_count());
    return true;
}

// ============================================================================
// Load
// ============================================================================

bool SessionStore::load_session(const std::string& session_id, Session& session) {
    if (!db_) {
        last_error_ = "database is not open";
        return false;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT path, data FROM vfs_files WHERE session_id = ? ORDER BY path",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        return fail("prepare load files");
    }
    sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);

    size_t files = 0;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        const char* path = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        const void* blob = sqlite3_column_blob(stmt, 1);
        int size = sqlite3_column_bytes(stmt, 1);

        std::string data;
        if (blob != nullptr && size > 0) {
            data.assign(static_cast<const char*>(blob), static_cast<size_t>(size));
        }

        std::string error;
        if (!session.vfs().restore_file(path ? path : "", data, error)) {
            LOG_WARN("[SessionStore] Skipping stored file: %s", error.c_str());
            continue;
        }
        ++files;
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return fail("load files");
    }

    if (sqlite3_prepare_v2(db_, "SELECT cap_key, calls_used FROM quota_counters WHERE session_id = ?",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        return fail("prepare load counters");
    }
    sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        const char* key = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        int64_t used = sqlite3_column_int64(stmt, 1);
        session.capabilities().restore_usage(key ? key : "", used);
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return fail("load counters");
    }

    LOG_DEBUG("[SessionStore] Loaded session %s (%zu files)", session_id.c_str(), files);
    return true;
}

// ============================================================================
// Management
// ============================================================================

bool SessionStore::has_session(const std::string& session_id) {
    if (!db_) return false;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_,
            "SELECT 1 FROM vfs_files WHERE session_id = ?1 "
            "UNION SELECT 1 FROM quota_counters WHERE session_id = ?1 LIMIT 1",
            -1, &stmt, nullptr) != SQLITE_OK) {
        return fail("prepare has_session");
    }
    sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
    bool found = sqlite3_step(stmt) == SQLITE_ROW;
    sqlite3_finalize(stmt);
    return found;
}

bool SessionStore::delete_session(const std::string& session_id) {
    if (!db_) {
        last_error_ = "database is not open";
        return false;
    }

    const char* sqls[] = {
        "DELETE FROM vfs_files WHERE session_id = ?",
        "DELETE FROM quota_counters WHERE session_id = ?"
    };
    for (size_t i = 0; i < 2; ++i) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, sqls[i], -1, &stmt, nullptr) != SQLITE_OK) {
            return fail("prepare delete_session");
        }
        sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return fail("delete_session");
        }
    }
    LOG_INFO("[SessionStore] Deleted session %s", session_id.c_str());
    return true;
}

std::vector<std::string> SessionStore::list_sessions() {
    std::vector<std::string> out;
    if (!db_) return out;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_,
            "SELECT session_id FROM vfs_files UNION SELECT session_id FROM quota_counters "
            "ORDER BY session_id",
            -1, &stmt, nullptr) != SQLITE_OK) {
        fail("prepare list_sessions");
        return out;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* id = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        if (id) out.push_back(id);
    }
    sqlite3_finalize(stmt);
    return out;
}

} // namespace warden
