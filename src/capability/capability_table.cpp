/*
 * Warden C++ - Capability Table Implementation
 */
#include <warden/capability/capability_table.hpp>
#include <warden/capability/pattern.hpp>
#include <warden/core/logger.hpp>

#include <sstream>

namespace warden {

// ============================================================================
// CapabilityError
// ============================================================================

const char* capability_error_kind_to_string(CapabilityErrorKind kind) {
    switch (kind) {
        case CapabilityErrorKind::NO_MATCHING_RULE: return "no_matching_rule";
        case CapabilityErrorKind::CONSTRAINT_VIOLATION: return "constraint_violation";
        case CapabilityErrorKind::QUOTA_EXCEEDED: return "quota_exceeded";
    }
    return "unknown";
}

std::string CapabilityError::message() const {
    std::ostringstream oss;
    switch (kind) {
        case CapabilityErrorKind::NO_MATCHING_RULE:
            oss << "No capability grants access to '" << method << "'";
            break;
        case CapabilityErrorKind::CONSTRAINT_VIOLATION:
            oss << "Constraint violated for '" << method << "': " << predicate;
            if (!parameter.empty()) {
                // Guest strings may carry invalid UTF-8
                std::string shown = attempted_value.is_null()
                                        ? std::string("<missing>")
                                        : attempted_value.dump(-1, ' ', false, Json::error_handler_t::replace);
                oss << " (" << parameter << " = " << shown << ")";
            }
            break;
        case CapabilityErrorKind::QUOTA_EXCEEDED:
            oss << "Call limit exceeded for '" << method << "' (pattern '" << pattern
                << "', max_calls=" << max_calls << ")";
            break;
    }
    return oss.str();
}

Json CapabilityError::to_json() const {
    Json j = Json::object();
    j["kind"] = capability_error_kind_to_string(kind);
    j["method"] = method;
    j["message"] = message();
    if (!pattern.empty()) j["pattern"] = pattern;
    if (kind == CapabilityErrorKind::CONSTRAINT_VIOLATION) {
        j["parameter"] = parameter;
        j["predicate"] = predicate;
        j["attempted_value"] = attempted_value;
    }
    if (kind == CapabilityErrorKind::QUOTA_EXCEEDED) {
        j["max_calls"] = max_calls;
    }
    return j;
}

// ============================================================================
// Construction
// ============================================================================

std::vector<MethodCapability> parse_capabilities(const Json& arr, int64_t default_max_calls) {
    std::vector<MethodCapability> caps;
    if (arr.is_null()) {
        return caps;
    }
    if (!arr.is_array()) {
        throw PatternConfigError("capabilities", "expected an array of capability objects");
    }
    for (size_t i = 0; i < arr.size(); ++i) {
        MethodCapability cap = MethodCapability::from_json(arr[i]);
        if (default_max_calls >= 0 && !arr[i].contains("max_calls")) {
            cap.max_calls = default_max_calls;
        }
        caps.push_back(cap);
    }
    return caps;
}

CapabilityTable::CapabilityTable(const std::vector<MethodCapability>& capabilities)
    : capabilities_(capabilities)
    , calls_used_(capabilities.size(), 0)
{
    for (size_t i = 0; i < capabilities_.size(); ++i) {
        const MethodCapability& cap = capabilities_[i];
        validate_pattern(cap.method_pattern);
        if (cap.max_calls < UNLIMITED_CALLS) {
            throw PatternConfigError(cap.method_pattern, "'max_calls' must be non-negative");
        }
        LOG_DEBUG("[CapabilityTable] #%zu %s constraints=%zu max_calls=%lld",
                  i, cap.method_pattern.c_str(), cap.constraints.size(),
                  static_cast<long long>(cap.max_calls));
    }
    LOG_INFO("[CapabilityTable] Loaded %zu capabilities", capabilities_.size());
}

// ============================================================================
// Authorization
// ============================================================================

bool CapabilityTable::evaluate_locked(const std::string& method, const Json& args,
                                      size_t& index, CapabilityError& error) const {
    error = CapabilityError();
    error.method = method;

    // 1. First matching rule in declaration order
    size_t i = 0;
    for (; i < capabilities_.size(); ++i) {
        if (method_matches_pattern(capabilities_[i].method_pattern, method)) break;
    }

    // 2. No rule
    if (i == capabilities_.size()) {
        error.kind = CapabilityErrorKind::NO_MATCHING_RULE;
        return false;
    }

    const MethodCapability& cap = capabilities_[i];
    error.pattern = cap.method_pattern;

    // 3. Constraints (quota untouched on failure)
    const Constraint* violation = cap.constraints.first_violation(args);
    if (violation != nullptr) {
        error.kind = CapabilityErrorKind::CONSTRAINT_VIOLATION;
        error.parameter = violation->param();
        error.predicate = violation->describe();
        if (!violation->param().empty()) {
            const Json* seen = lookup_param(args, violation->param());
            if (seen != nullptr) error.attempted_value = *seen;
        }
        return false;
    }

    // 4. Quota
    if (cap.has_limit() && calls_used_[i] >= cap.max_calls) {
        error.kind = CapabilityErrorKind::QUOTA_EXCEEDED;
        error.max_calls = cap.max_calls;
        return false;
    }

    index = i;
    return true;
}

AuthorizationResult CapabilityTable::authorize(const std::string& method, const Json& args) {
    size_t index = 0;
    CapabilityError error;
    AuthorizationGrant grant;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!evaluate_locked(method, args, index, error)) {
            LOG_WARN("[CapabilityTable] Denied %s: %s", method.c_str(), error.message().c_str());
            return AuthorizationResult::denied(error);
        }

        // 5. Consume inside the same critical section as the quota check
        const MethodCapability& cap = capabilities_[index];
        calls_used_[index] += 1;

        grant.method = method;
        grant.capability_key = cap.key();
        grant.capability_index = index;
        grant.calls_used = calls_used_[index];
        grant.remaining = cap.has_limit() ? cap.max_calls - calls_used_[index] : UNLIMITED_CALLS;
    }

    LOG_DEBUG("[CapabilityTable] Granted %s via %s (used=%lld)",
              method.c_str(), grant.capability_key.c_str(),
              static_cast<long long>(grant.calls_used));
    return AuthorizationResult::ok(grant);
}

AuthorizationResult CapabilityTable::check(const std::string& method, const Json& args) const {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t index = 0;
    CapabilityError error;
    if (!evaluate_locked(method, args, index, error)) {
        return AuthorizationResult::denied(error);
    }

    const MethodCapability& cap = capabilities_[index];
    AuthorizationGrant grant;
    grant.method = method;
    grant.capability_key = cap.key();
    grant.capability_index = index;
    grant.calls_used = calls_used_[index];
    grant.remaining = cap.has_limit() ? cap.max_calls - calls_used_[index] : UNLIMITED_CALLS;
    return AuthorizationResult::ok(grant);
}

bool CapabilityTable::can_call(const std::string& method, const Json& args) const {
    return check(method, args).success;
}

// ============================================================================
// Quota Introspection
// ============================================================================

int64_t CapabilityTable::index_of(const std::string& key) const {
    for (size_t i = 0; i < capabilities_.size(); ++i) {
        if (capabilities_[i].key() == key) return static_cast<int64_t>(i);
    }
    return -1;
}

bool CapabilityTable::remaining_calls(const std::string& key, int64_t& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t idx = index_of(key);
    if (idx < 0) return false;

    const MethodCapability& cap = capabilities_[idx];
    out = cap.has_limit() ? cap.max_calls - calls_used_[idx] : UNLIMITED_CALLS;
    return true;
}

std::map<std::string, int64_t> CapabilityTable::call_counts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, int64_t> out;
    for (size_t i = 0; i < capabilities_.size(); ++i) {
        const MethodCapability& cap = capabilities_[i];
        // Duplicate keys: report the rule that would actually be consulted first
        if (out.count(cap.key())) continue;
        out[cap.key()] = cap.has_limit() ? cap.max_calls - calls_used_[i] : UNLIMITED_CALLS;
    }
    return out;
}

std::map<std::string, int64_t> CapabilityTable::usage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, int64_t> out;
    for (size_t i = 0; i < capabilities_.size(); ++i) {
        if (out.count(capabilities_[i].key())) continue;
        out[capabilities_[i].key()] = calls_used_[i];
    }
    return out;
}

void CapabilityTable::restore_usage(const std::string& key, int64_t calls_used) {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t idx = index_of(key);
    if (idx < 0) {
        LOG_WARN("[CapabilityTable] Ignoring usage for unknown capability %s", key.c_str());
        return;
    }

    const MethodCapability& cap = capabilities_[idx];
    int64_t value = calls_used;
    if (cap.has_limit() && value > cap.max_calls) value = cap.max_calls;
    if (value > calls_used_[idx]) {
        calls_used_[idx] = value;
    }
}

} // namespace warden
