/*
 * warden C++17 - Method Pattern Matching
 *
 * Method names and patterns are split on '/' and '.' into segments:
 *   literal  matches the same segment exactly (case-sensitive)
 *   *        matches exactly one segment
 *   **       matches zero or more remaining segments (final segment only)
 *
 *   "stripe/charges/*"  matches "stripe/charges/create", not "stripe/charges/create/extra"
 *   "stripe/**"         matches "stripe", "stripe/charges", "stripe/charges/create/extra"
 */
#ifndef warden_CAPABILITY_PATTERN_HPP
#define warden_CAPABILITY_PATTERN_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace warden {

// Malformed capability specification (bad pattern, unknown constraint
// operator, wrong operand shape). Raised while a capability table is being
// built, never while a call is being authorized.
class PatternConfigError : public std::runtime_error {
public:
    PatternConfigError(const std::string& subject, const std::string& reason)
        : std::runtime_error("invalid capability spec '" + subject + "': " + reason)
        , subject_(subject) {}

    // The offending pattern, or the constraint/parameter being parsed
    const std::string& subject() const { return subject_; }

private:
    std::string subject_;
};

// Split a method name or pattern into its segments
std::vector<std::string> method_segments(const std::string& name);

// Throws PatternConfigError if the pattern is empty or '**' is not terminal
void validate_pattern(const std::string& pattern);

// Pure segment matcher. Assumes the pattern passed validate_pattern();
// a non-terminal '**' never matches.
bool method_matches_pattern(const std::string& pattern, const std::string& method);

// True if every method matched by `child` is also matched by `parent`.
// Used to check that a derived capability list only narrows authority.
bool pattern_is_subset(const std::string& child, const std::string& parent);

} // namespace warden

#endif // warden_CAPABILITY_PATTERN_HPP
