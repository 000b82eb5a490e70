/*
 * warden C++17 - Audit Log
 *
 * Structured record of everything a sandbox did on a guest's behalf.
 * Entries are kept in memory and, when an output path is configured,
 * appended to it as JSON lines:
 *
 *   {"type":"tool_call","session_id":"...","timestamp":"2026-...Z",
 *    "timestamp_ms":...,"turn_id":1,"data":{...}}
 */
#ifndef warden_AUDIT_AUDIT_HPP
#define warden_AUDIT_AUDIT_HPP

#include <warden/core/json.hpp>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace warden {

class Config;

namespace audit_type {
    extern const char* const EXECUTE_START;
    extern const char* const EXECUTE_END;
    extern const char* const TOOL_CALL;
    extern const char* const CAPABILITY_DENIED;
    extern const char* const TOOL_ERROR;
    extern const char* const VFS_READ;
    extern const char* const VFS_WRITE;
    extern const char* const SLEEP;
    extern const char* const CANCEL;
}

struct AuditConfig {
    bool enabled;
    std::string output_path;   // empty = memory only
    std::string agent_id;
    std::string trace_id;

    AuditConfig() : enabled(true) {}

    static AuditConfig from_config(const Config& cfg);
};

struct AuditEntry {
    std::string type;
    std::string session_id;
    int64_t timestamp_ms;
    Json data;
    std::string agent_id;
    std::string trace_id;
    int64_t turn_id;

    AuditEntry() : timestamp_ms(0), turn_id(0) {}

    Json to_json() const;
    std::string to_jsonl() const;
};

class AuditCollector {
public:
    AuditCollector(const std::string& session_id, const AuditConfig& config);

    void record(const std::string& type, const Json& data = Json::object());

    std::vector<AuditEntry> entries() const;
    std::vector<AuditEntry> entries_of(const std::string& type) const;
    size_t size() const;
    void clear();

    // Start a new execution turn; returns the new turn id (1-based)
    int64_t next_turn();
    int64_t turn_id() const;

    bool enabled() const { return config_.enabled; }
    const AuditConfig& config() const { return config_; }

    // Stable SHA-256 of call arguments, so logs need not carry raw values
    static std::string params_hash(const Json& args);

private:
    AuditCollector(const AuditCollector&);
    AuditCollector& operator=(const AuditCollector&);

    void append_to_file(const AuditEntry& entry);

    std::string session_id_;
    AuditConfig config_;
    std::vector<AuditEntry> entries_;
    int64_t turn_id_;
    bool file_failed_;
    mutable std::mutex mutex_;
};

} // namespace warden

#endif // warden_AUDIT_AUDIT_HPP
