/*
 * Warden C++ - Audit Log Implementation
 */
#include <warden/audit/audit.hpp>
#include <warden/core/config.hpp>
#include <warden/core/logger.hpp>
#include <warden/core/utils.hpp>

#include <fstream>

namespace warden {

namespace audit_type {
    const char* const EXECUTE_START = "execute_start";
    const char* const EXECUTE_END = "execute_end";
    const char* const TOOL_CALL = "tool_call";
    const char* const CAPABILITY_DENIED = "capability_denied";
    const char* const TOOL_ERROR = "tool_error";
    const char* const VFS_READ = "vfs_read";
    const char* const VFS_WRITE = "vfs_write";
    const char* const SLEEP = "sleep";
    const char* const CANCEL = "cancel";
}

AuditConfig AuditConfig::from_config(const Config& cfg) {
    AuditConfig config;
    config.enabled = cfg.get_bool("audit.enabled", true);
    config.output_path = cfg.get_string("audit.output_path", "");
    config.agent_id = cfg.get_string("audit.agent_id", "");
    config.trace_id = cfg.get_string("audit.trace_id", "");
    return config;
}

// ============================================================================
// AuditEntry
// ============================================================================

Json AuditEntry::to_json() const {
    Json j = Json::object();
    j["type"] = type;
    j["session_id"] = session_id;
    j["timestamp"] = format_timestamp_ms(timestamp_ms);
    j["timestamp_ms"] = timestamp_ms;
    j["turn_id"] = turn_id;
    j["data"] = data;
    if (!agent_id.empty()) j["agent_id"] = agent_id;
    if (!trace_id.empty()) j["trace_id"] = trace_id;
    return j;
}

std::string AuditEntry::to_jsonl() const {
    return to_json().dump(-1, ' ', false, Json::error_handler_t::replace);
}

// ============================================================================
// AuditCollector
// ============================================================================

AuditCollector::AuditCollector(const std::string& session_id, const AuditConfig& config)
    : session_id_(session_id)
    , config_(config)
    , turn_id_(0)
    , file_failed_(false)
{
    if (config_.enabled && !config_.output_path.empty()) {
        if (!create_parent_directory(config_.output_path)) {
            LOG_WARN("[Audit] Cannot create directory for %s", config_.output_path.c_str());
        }
    }
}

std::string AuditCollector::params_hash(const Json& args) {
    // nlohmann objects iterate in key order, so dump() is canonical
    return sha256_hex(args.dump(-1, ' ', false, Json::error_handler_t::replace));
}

void AuditCollector::record(const std::string& type, const Json& data) {
    if (!config_.enabled) return;

    AuditEntry entry;
    entry.type = type;
    entry.session_id = session_id_;
    entry.timestamp_ms = current_timestamp_ms();
    entry.data = data;
    entry.agent_id = config_.agent_id;
    entry.trace_id = config_.trace_id;

    std::lock_guard<std::mutex> lock(mutex_);
    entry.turn_id = turn_id_;
    entries_.push_back(entry);
    if (!config_.output_path.empty()) {
        append_to_file(entry);
    }
}

void AuditCollector::append_to_file(const AuditEntry& entry) {
    std::ofstream file(config_.output_path.c_str(), std::ios::out | std::ios::app);
    if (!file) {
        if (!file_failed_) {
            LOG_ERROR("[Audit] Cannot open %s for append", config_.output_path.c_str());
            file_failed_ = true;
        }
        return;
    }
    file << entry.to_jsonl() << "\n";
}

std::vector<AuditEntry> AuditCollector::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

std::vector<AuditEntry> AuditCollector::entries_of(const std::string& type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AuditEntry> out;
    for (size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].type == type) out.push_back(entries_[i]);
    }
    return out;
}

size_t AuditCollector::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void AuditCollector::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

int64_t AuditCollector::next_turn() {
    std::lock_guard<std::mutex> lock(mutex_);
    return ++turn_id_;
}

int64_t AuditCollector::turn_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return turn_id_;
}

} // namespace warden
