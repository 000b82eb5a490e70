/*
 * Warden C++ - Method Capability Serialization
 */
#include <warden/capability/capability.hpp>
#include <warden/capability/pattern.hpp>

namespace warden {

Json MethodCapability::to_json() const {
    Json j = Json::object();
    j["pattern"] = method_pattern;
    j["constraints"] = constraints.to_json();
    j["max_calls"] = has_limit() ? Json(max_calls) : Json();
    return j;
}

MethodCapability MethodCapability::from_json(const Json& j) {
    if (!j.is_object()) {
        throw PatternConfigError(j.dump(), "capability must be an object");
    }

    MethodCapability cap;
    if (j.contains("pattern") && j["pattern"].is_string()) {
        cap.method_pattern = j["pattern"].get<std::string>();
    } else if (j.contains("method_pattern") && j["method_pattern"].is_string()) {
        cap.method_pattern = j["method_pattern"].get<std::string>();
    } else {
        throw PatternConfigError(j.dump(), "capability is missing 'pattern'");
    }

    if (j.contains("constraints")) {
        cap.constraints = ConstraintSet::from_json(j["constraints"]);
    }

    if (j.contains("max_calls") && !j["max_calls"].is_null()) {
        const Json& limit = j["max_calls"];
        if (!limit.is_number_integer() || limit.get<int64_t>() < 0) {
            throw PatternConfigError(cap.method_pattern, "'max_calls' must be a non-negative integer or null");
        }
        cap.max_calls = limit.get<int64_t>();
    }

    return cap;
}

} // namespace warden
