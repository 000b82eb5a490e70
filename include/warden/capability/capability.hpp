/*
 * warden C++17 - Method Capability
 *
 * One authorization rule: a method pattern, the constraints a call's
 * arguments must satisfy, and an optional call quota. The usage counter is
 * not part of the rule; it lives in the CapabilityTable that owns the rule.
 */
#ifndef warden_CAPABILITY_CAPABILITY_HPP
#define warden_CAPABILITY_CAPABILITY_HPP

#include <warden/capability/constraint.hpp>
#include <warden/core/json.hpp>
#include <cstdint>
#include <string>

namespace warden {

// max_calls value meaning "no quota"
constexpr int64_t UNLIMITED_CALLS = -1;

struct MethodCapability {
    std::string method_pattern;
    ConstraintSet constraints;
    int64_t max_calls;          // UNLIMITED_CALLS = no ceiling

    MethodCapability() : max_calls(UNLIMITED_CALLS) {}
    MethodCapability(const std::string& pattern,
                     const ConstraintSet& c = ConstraintSet(),
                     int64_t limit = UNLIMITED_CALLS)
        : method_pattern(pattern), constraints(c), max_calls(limit) {}

    bool has_limit() const { return max_calls >= 0; }

    // Stable identifier used for quota introspection: "cap:method:<pattern>"
    std::string key() const { return "cap:method:" + method_pattern; }

    // {"pattern": "...", "constraints": [...], "max_calls": 10}
    Json to_json() const;

    // Accepts "pattern" (or "method_pattern"), optional "constraints" in
    // either array or shorthand-object form, optional "max_calls" (null or
    // absent = unlimited). Throws PatternConfigError.
    static MethodCapability from_json(const Json& j);
};

} // namespace warden

#endif // warden_CAPABILITY_CAPABILITY_HPP
