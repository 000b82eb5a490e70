/*
 * warden C++17 - Capability Table
 *
 * Ordered set of MethodCapability rules plus their per-session usage
 * counters. Resolution is FIRST-MATCH-WINS: the first rule (in declaration
 * order) whose pattern matches the method decides the call, even if a later
 * rule would be more specific or more permissive. Put narrow rules before
 * broad ones.
 *
 * authorize() is safe to call from several threads; the quota check and the
 * counter increment happen under one lock, so a capped rule never grants
 * more than max_calls times.
 */
#ifndef warden_CAPABILITY_CAPABILITY_TABLE_HPP
#define warden_CAPABILITY_CAPABILITY_TABLE_HPP

#include <warden/capability/capability.hpp>
#include <warden/core/json.hpp>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace warden {

enum class CapabilityErrorKind {
    NO_MATCHING_RULE,
    CONSTRAINT_VIOLATION,
    QUOTA_EXCEEDED
};

// "no_matching_rule", "constraint_violation", "quota_exceeded"
const char* capability_error_kind_to_string(CapabilityErrorKind kind);

struct CapabilityError {
    CapabilityErrorKind kind;
    std::string method;         // method that was attempted
    std::string pattern;        // matched rule, empty for NO_MATCHING_RULE
    std::string parameter;      // offending parameter (CONSTRAINT_VIOLATION)
    std::string predicate;      // failing predicate, e.g. "amount <= 1000"
    Json attempted_value;       // argument value seen, null if missing
    int64_t max_calls;          // quota of the matched rule (QUOTA_EXCEEDED)

    CapabilityError() : kind(CapabilityErrorKind::NO_MATCHING_RULE), max_calls(UNLIMITED_CALLS) {}

    std::string message() const;
    Json to_json() const;
};

struct AuthorizationGrant {
    std::string method;
    std::string capability_key;
    size_t capability_index;
    int64_t calls_used;         // counter value after this grant
    int64_t remaining;          // UNLIMITED_CALLS if the rule has no quota

    AuthorizationGrant() : capability_index(0), calls_used(0), remaining(UNLIMITED_CALLS) {}
};

struct AuthorizationResult {
    bool success;
    AuthorizationGrant grant;
    CapabilityError error;

    AuthorizationResult() : success(false) {}

    static AuthorizationResult ok(const AuthorizationGrant& g) {
        AuthorizationResult r;
        r.success = true;
        r.grant = g;
        return r;
    }

    static AuthorizationResult denied(const CapabilityError& e) {
        AuthorizationResult r;
        r.success = false;
        r.error = e;
        return r;
    }
};

// Parse a JSON array of capability objects. Entries without a "max_calls"
// key get `default_max_calls`; an explicit null stays unlimited.
// Throws PatternConfigError.
std::vector<MethodCapability> parse_capabilities(const Json& arr,
                                                 int64_t default_max_calls = UNLIMITED_CALLS);

class CapabilityTable {
public:
    // Validates every pattern; throws PatternConfigError on the first bad one.
    explicit CapabilityTable(const std::vector<MethodCapability>& capabilities);

    // Decide a call and, on success, consume one unit of the rule's quota.
    AuthorizationResult authorize(const std::string& method, const Json& args);

    // Same decision as authorize() without consuming quota.
    AuthorizationResult check(const std::string& method, const Json& args) const;
    bool can_call(const std::string& method, const Json& args) const;

    // Remaining calls for a capability key; UNLIMITED_CALLS when uncapped.
    // Returns false if no capability has this key.
    bool remaining_calls(const std::string& key, int64_t& out) const;

    // key -> remaining calls (UNLIMITED_CALLS when uncapped)
    std::map<std::string, int64_t> call_counts() const;

    // key -> calls used, for snapshots
    std::map<std::string, int64_t> usage() const;

    // Raise a counter to a previously persisted value. Never lowers a
    // counter and never exceeds the rule's max_calls.
    void restore_usage(const std::string& key, int64_t calls_used);

    const std::vector<MethodCapability>& capabilities() const { return capabilities_; }
    size_t capability_count() const { return capabilities_.size(); }

private:
    CapabilityTable(const CapabilityTable&);
    CapabilityTable& operator=(const CapabilityTable&);

    // Steps 1-4 of authorization against the current counters.
    // Caller holds mutex_. On success `index` is the matched rule.
    bool evaluate_locked(const std::string& method, const Json& args,
                         size_t& index, CapabilityError& error) const;

    int64_t index_of(const std::string& key) const;

    std::vector<MethodCapability> capabilities_;
    std::vector<int64_t> calls_used_;
    mutable std::mutex mutex_;
};

} // namespace warden

#endif // warden_CAPABILITY_CAPABILITY_TABLE_HPP
