/*
 * Warden C++ - Method Pattern Matching Implementation
 */
#include <warden/capability/pattern.hpp>
#include <warden/core/utils.hpp>

namespace warden {

namespace {

const char* const kSegmentDelimiters = "/.";

bool is_wildcard(const std::string& seg) {
    return seg == "*" || seg == "**";
}

} // anonymous namespace

std::vector<std::string> method_segments(const std::string& name) {
    return split_any(name, kSegmentDelimiters);
}

void validate_pattern(const std::string& pattern) {
    std::vector<std::string> segs = method_segments(pattern);
    if (segs.empty()) {
        throw PatternConfigError(pattern, "pattern has no segments");
    }

    for (size_t i = 0; i < segs.size(); ++i) {
        const std::string& seg = segs[i];
        if (seg == "**" && i + 1 != segs.size()) {
            throw PatternConfigError(pattern, "'**' must be the final segment");
        }
        if (!is_wildcard(seg) && seg.find('*') != std::string::npos) {
            throw PatternConfigError(pattern, "wildcards must span a whole segment ('" + seg + "')");
        }
    }
}

bool method_matches_pattern(const std::string& pattern, const std::string& method) {
    std::vector<std::string> pat = method_segments(pattern);
    std::vector<std::string> cand = method_segments(method);

    size_t j = 0;
    for (size_t i = 0; i < pat.size(); ++i) {
        if (pat[i] == "**") {
            return i + 1 == pat.size();
        }
        if (j >= cand.size()) {
            return false;
        }
        if (pat[i] != "*" && pat[i] != cand[j]) {
            return false;
        }
        ++j;
    }
    return j == cand.size();
}

bool pattern_is_subset(const std::string& child, const std::string& parent) {
    std::vector<std::string> c = method_segments(child);
    std::vector<std::string> p = method_segments(parent);

    size_t i = 0;
    for (; i < p.size(); ++i) {
        if (p[i] == "**") {
            return true;
        }
        if (i >= c.size()) {
            return false;
        }
        if (c[i] == "**") {
            return false;
        }
        if (p[i] == "*") {
            continue;
        }
        if (c[i] != p[i]) {
            return false;
        }
    }
    return c.size() == p.size();
}

} // namespace warden
