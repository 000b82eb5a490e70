/*
 * warden C++17 - Session Snapshot Store
 *
 * SQLite persistence for the durable parts of a Session so it can be
 * picked up again by a later process:
 *   vfs_files       (session_id, path, data, updated_at)
 *   quota_counters  (session_id, cap_key, calls_used)
 *
 * Restoring never lowers a counter the live table already holds and never
 * pushes one past its rule's max_calls.
 */
#ifndef warden_STORE_SESSION_STORE_HPP
#define warden_STORE_SESSION_STORE_HPP

#include <string>
#include <vector>
#include <sqlite3.h>

namespace warden {

class Session;

class SessionStore {
public:
    SessionStore();
    ~SessionStore();

    // Opens (creating if needed) the database and its schema
    bool open(const std::string& db_path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    bool ensure_schema();

    // Replace the stored snapshot of this session
    bool save_session(const Session& session);

    // Apply a stored snapshot onto `session`. A session with no snapshot
    // loads as a no-op.
    bool load_session(const std::string& session_id, Session& session);

    bool has_session(const std::string& session_id);
    bool delete_session(const std::string& session_id);
    std::vector<std::string> list_sessions();

    const std::string& last_error() const { return last_error_; }

private:
    SessionStore(const SessionStore&);
    SessionStore& operator=(const SessionStore&);

    bool exec_sql(const std::string& sql);
    bool fail(const std::string& what);

    sqlite3* db_;
    std::string path_;
    std::string last_error_;
};

} // namespace warden

#endif // warden_STORE_SESSION_STORE_HPP
