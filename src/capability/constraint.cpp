/*
 * Warden C++ - Parameter Constraints Implementation
 */
#include <warden/capability/constraint.hpp>
#include <warden/capability/pattern.hpp>
#include <warden/core/logger.hpp>
#include <warden/core/utils.hpp>

#include <sstream>

namespace warden {

// ============================================================================
// Helpers
// ============================================================================

namespace {

struct OpName {
    ConstraintOp op;
    const char* name;
};

const OpName kOpNames[] = {
    { ConstraintOp::GE,          ">=" },
    { ConstraintOp::LE,          "<=" },
    { ConstraintOp::GT,          ">" },
    { ConstraintOp::LT,          "<" },
    { ConstraintOp::EQ,          "==" },
    { ConstraintOp::NE,          "!=" },
    { ConstraintOp::IN,          "in" },
    { ConstraintOp::NOT_IN,      "not_in" },
    { ConstraintOp::STARTS_WITH, "starts_with" },
    { ConstraintOp::ENDS_WITH,   "ends_with" },
    { ConstraintOp::CONTAINS,    "contains" },
    { ConstraintOp::EXISTS,      "exists" },
    { ConstraintOp::NOT_EXISTS,  "not_exists" },
    { ConstraintOp::ALL_OF,      "all_of" },
    { ConstraintOp::ANY_OF,      "any_of" },
};

bool is_composite(ConstraintOp op) {
    return op == ConstraintOp::ALL_OF || op == ConstraintOp::ANY_OF;
}

bool is_numeric_op(ConstraintOp op) {
    return op == ConstraintOp::GE || op == ConstraintOp::LE ||
           op == ConstraintOp::GT || op == ConstraintOp::LT;
}

// Three-way numeric comparison without losing int64/uint64 precision.
// Both values must be numbers.
int compare_numbers(const Json& a, const Json& b) {
    if (a.is_number_integer() && b.is_number_integer()) {
        bool a_unsigned = a.is_number_unsigned();
        bool b_unsigned = b.is_number_unsigned();
        if (!a_unsigned && !b_unsigned) {
            int64_t x = a.get<int64_t>();
            int64_t y = b.get<int64_t>();
            return x < y ? -1 : (x > y ? 1 : 0);
        }
        if (!a_unsigned && a.get<int64_t>() < 0) return -1;
        if (!b_unsigned && b.get<int64_t>() < 0) return 1;
        uint64_t x = a.get<uint64_t>();
        uint64_t y = b.get<uint64_t>();
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    double x = a.get<double>();
    double y = b.get<double>();
    return x < y ? -1 : (x > y ? 1 : 0);
}

// Numbers compare across integer/float representations; everything else
// must share the JSON type.
bool same_kind(const Json& a, const Json& b) {
    if (a.is_number() && b.is_number()) return true;
    return a.type() == b.type();
}

bool values_equal(const Json& a, const Json& b) {
    if (!same_kind(a, b)) return false;
    if (a.is_number()) return compare_numbers(a, b) == 0;
    return a == b;
}

bool set_contains(const Json& set, const Json& value) {
    if (!set.is_array()) return false;
    for (size_t i = 0; i < set.size(); ++i) {
        if (values_equal(set[i], value)) return true;
    }
    return false;
}

// "1000" -> 1000, "2.5" -> 2.5; throws std::invalid_argument / std::out_of_range
Json parse_number(const std::string& text) {
    std::string s = trim(text);
    size_t used = 0;
    Json out;
    if (s.find('.') != std::string::npos || s.find('e') != std::string::npos) {
        out = std::stod(s, &used);
    } else {
        out = static_cast<int64_t>(std::stoll(s, &used));
    }
    if (used != s.size()) {
        throw std::invalid_argument("trailing characters in '" + s + "'");
    }
    return out;
}

} // anonymous namespace

const char* constraint_op_to_string(ConstraintOp op) {
    for (size_t i = 0; i < sizeof(kOpNames) / sizeof(kOpNames[0]); ++i) {
        if (kOpNames[i].op == op) return kOpNames[i].name;
    }
    return "unknown";
}

bool constraint_op_from_string(const std::string& name, ConstraintOp& out) {
    for (size_t i = 0; i < sizeof(kOpNames) / sizeof(kOpNames[0]); ++i) {
        if (name == kOpNames[i].name) {
            out = kOpNames[i].op;
            return true;
        }
    }
    return false;
}

const Json* lookup_param(const Json& args, const std::string& param) {
    const Json* node = &args;
    std::vector<std::string> parts = split_any(param, "/");
    if (parts.empty()) return nullptr;

    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) return nullptr;
        Json::const_iterator it = node->find(parts[i]);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node->is_null() ? nullptr : node;
}

// ============================================================================
// Constraint Implementation
// ============================================================================

Constraint::Constraint(ConstraintOp op, const std::string& param, const Json& operand)
    : op_(op), param_(param), operand_(operand) {}

Constraint Constraint::ge(const std::string& param, const Json& value) {
    return Constraint(ConstraintOp::GE, param, value);
}

Constraint Constraint::le(const std::string& param, const Json& value) {
    return Constraint(ConstraintOp::LE, param, value);
}

Constraint Constraint::gt(const std::string& param, const Json& value) {
    return Constraint(ConstraintOp::GT, param, value);
}

Constraint Constraint::lt(const std::string& param, const Json& value) {
    return Constraint(ConstraintOp::LT, param, value);
}

Constraint Constraint::eq(const std::string& param, const Json& value) {
    return Constraint(ConstraintOp::EQ, param, value);
}

Constraint Constraint::ne(const std::string& param, const Json& value) {
    return Constraint(ConstraintOp::NE, param, value);
}

Constraint Constraint::is_in(const std::string& param, const Json& values) {
    return Constraint(ConstraintOp::IN, param, values);
}

Constraint Constraint::not_in(const std::string& param, const Json& values) {
    return Constraint(ConstraintOp::NOT_IN, param, values);
}

Constraint Constraint::starts_with(const std::string& param, const std::string& prefix) {
    return Constraint(ConstraintOp::STARTS_WITH, param, prefix);
}

Constraint Constraint::ends_with(const std::string& param, const std::string& suffix) {
    return Constraint(ConstraintOp::ENDS_WITH, param, suffix);
}

Constraint Constraint::contains(const std::string& param, const Json& needle) {
    return Constraint(ConstraintOp::CONTAINS, param, needle);
}

Constraint Constraint::exists(const std::string& param) {
    return Constraint(ConstraintOp::EXISTS, param, Json());
}

Constraint Constraint::not_exists(const std::string& param) {
    return Constraint(ConstraintOp::NOT_EXISTS, param, Json());
}

Constraint Constraint::all_of(const std::vector<Constraint>& children) {
    Constraint c(ConstraintOp::ALL_OF, "", Json());
    c.children_ = children;
    return c;
}

Constraint Constraint::any_of(const std::vector<Constraint>& children) {
    Constraint c(ConstraintOp::ANY_OF, "", Json());
    c.children_ = children;
    return c;
}

bool Constraint::evaluate(const Json& args) const {
    if (op_ == ConstraintOp::ALL_OF) {
        for (size_t i = 0; i < children_.size(); ++i) {
            if (!children_[i].evaluate(args)) return false;
        }
        return true;
    }
    if (op_ == ConstraintOp::ANY_OF) {
        for (size_t i = 0; i < children_.size(); ++i) {
            if (children_[i].evaluate(args)) return true;
        }
        return false;
    }

    const Json* value = lookup_param(args, param_);
    if (op_ == ConstraintOp::NOT_EXISTS) {
        return value == nullptr;
    }
    if (value == nullptr) {
        return false;
    }

    switch (op_) {
        case ConstraintOp::EXISTS:
            return true;

        case ConstraintOp::GE:
        case ConstraintOp::LE:
        case ConstraintOp::GT:
        case ConstraintOp::LT: {
            if (!value->is_number() || !operand_.is_number()) return false;
            int cmp = compare_numbers(*value, operand_);
            if (op_ == ConstraintOp::GE) return cmp >= 0;
            if (op_ == ConstraintOp::LE) return cmp <= 0;
            if (op_ == ConstraintOp::GT) return cmp > 0;
            return cmp < 0;
        }

        case ConstraintOp::EQ:
            return values_equal(*value, operand_);

        case ConstraintOp::NE:
            return same_kind(*value, operand_) && !values_equal(*value, operand_);

        case ConstraintOp::IN:
            return set_contains(operand_, *value);

        case ConstraintOp::NOT_IN:
            return operand_.is_array() && !set_contains(operand_, *value);

        case ConstraintOp::STARTS_WITH:
            return value->is_string() && operand_.is_string() &&
                   warden::starts_with(value->get<std::string>(), operand_.get<std::string>());

        case ConstraintOp::ENDS_WITH:
            return value->is_string() && operand_.is_string() &&
                   warden::ends_with(value->get<std::string>(), operand_.get<std::string>());

        case ConstraintOp::CONTAINS:
            if (value->is_string() && operand_.is_string()) {
                return value->get<std::string>().find(operand_.get<std::string>()) != std::string::npos;
            }
            if (value->is_array()) {
                return set_contains(*value, operand_);
            }
            return false;

        default:
            return false;
    }
}

std::string Constraint::describe() const {
    std::ostringstream oss;
    if (is_composite(op_)) {
        oss << constraint_op_to_string(op_) << "(";
        for (size_t i = 0; i < children_.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << children_[i].describe();
        }
        oss << ")";
        return oss.str();
    }

    oss << param_ << " " << constraint_op_to_string(op_);
    if (op_ != ConstraintOp::EXISTS && op_ != ConstraintOp::NOT_EXISTS) {
        oss << " " << operand_.dump(-1, ' ', false, Json::error_handler_t::replace);
    }
    return oss.str();
}

Json Constraint::to_json() const {
    Json j = Json::object();
    j["op"] = constraint_op_to_string(op_);
    if (is_composite(op_)) {
        Json arr = Json::array();
        for (size_t i = 0; i < children_.size(); ++i) {
            arr.push_back(children_[i].to_json());
        }
        j["constraints"] = arr;
        return j;
    }
    j["param"] = param_;
    if (op_ != ConstraintOp::EXISTS && op_ != ConstraintOp::NOT_EXISTS) {
        j["value"] = operand_;
    }
    return j;
}

Constraint Constraint::from_json(const Json& j) {
    if (!j.is_object()) {
        throw PatternConfigError(j.dump(), "constraint must be an object");
    }
    if (!j.contains("op") || !j["op"].is_string()) {
        throw PatternConfigError(j.dump(), "constraint is missing 'op'");
    }

    ConstraintOp op;
    std::string op_name = j["op"].get<std::string>();
    if (!constraint_op_from_string(op_name, op)) {
        throw PatternConfigError(j.dump(), "unknown constraint operator '" + op_name + "'");
    }

    if (is_composite(op)) {
        if (!j.contains("constraints") || !j["constraints"].is_array()) {
            throw PatternConfigError(j.dump(), op_name + " requires a 'constraints' array");
        }
        std::vector<Constraint> children;
        for (size_t i = 0; i < j["constraints"].size(); ++i) {
            children.push_back(from_json(j["constraints"][i]));
        }
        return op == ConstraintOp::ALL_OF ? all_of(children) : any_of(children);
    }

    if (!j.contains("param") || !j["param"].is_string() || j["param"].get<std::string>().empty()) {
        throw PatternConfigError(j.dump(), "constraint is missing 'param'");
    }
    std::string param = j["param"].get<std::string>();

    if (op == ConstraintOp::EXISTS || op == ConstraintOp::NOT_EXISTS) {
        return Constraint(op, param, Json());
    }

    if (!j.contains("value")) {
        throw PatternConfigError(param, std::string("operator '") + op_name + "' requires a 'value'");
    }
    const Json& value = j["value"];

    if (is_numeric_op(op) && !value.is_number()) {
        throw PatternConfigError(param, std::string("operator '") + op_name + "' requires a numeric value");
    }
    if ((op == ConstraintOp::IN || op == ConstraintOp::NOT_IN) && !value.is_array()) {
        throw PatternConfigError(param, std::string("operator '") + op_name + "' requires an array value");
    }
    if ((op == ConstraintOp::STARTS_WITH || op == ConstraintOp::ENDS_WITH) && !value.is_string()) {
        throw PatternConfigError(param, std::string("operator '") + op_name + "' requires a string value");
    }

    return Constraint(op, param, value);
}

// ============================================================================
// ConstraintSet Implementation
// ============================================================================

bool ConstraintSet::evaluate(const Json& args) const {
    return first_violation(args) == nullptr;
}

const Constraint* ConstraintSet::first_violation(const Json& args) const {
    for (size_t i = 0; i < constraints_.size(); ++i) {
        if (!constraints_[i].evaluate(args)) {
            return &constraints_[i];
        }
    }
    return nullptr;
}

Json ConstraintSet::to_json() const {
    Json arr = Json::array();
    for (size_t i = 0; i < constraints_.size(); ++i) {
        arr.push_back(constraints_[i].to_json());
    }
    return arr;
}

ConstraintSet ConstraintSet::from_json(const Json& j) {
    if (j.is_null()) {
        return ConstraintSet();
    }
    if (j.is_object()) {
        return from_shorthand(j);
    }
    if (!j.is_array()) {
        throw PatternConfigError(j.dump(), "constraints must be an array or a shorthand object");
    }

    std::vector<Constraint> out;
    for (size_t i = 0; i < j.size(); ++i) {
        out.push_back(Constraint::from_json(j[i]));
    }
    return ConstraintSet(out);
}

ConstraintSet ConstraintSet::from_shorthand(const Json& spec) {
    std::vector<Constraint> out;
    if (!spec.is_object()) {
        return ConstraintSet(out);
    }

    for (Json::const_iterator it = spec.begin(); it != spec.end(); ++it) {
        const std::string& param = it.key();
        const Json& value = it.value();

        if (value.is_array()) {
            out.push_back(Constraint::is_in(param, value));
            continue;
        }
        if (value.is_number() || value.is_boolean()) {
            out.push_back(Constraint::eq(param, value));
            continue;
        }
        if (!value.is_string()) {
            LOG_WARN("[ConstraintSet] Skipping constraint for '%s': unsupported shorthand %s",
                     param.c_str(), value.dump(-1, ' ', false, Json::error_handler_t::replace).c_str());
            continue;
        }

        std::string text = value.get<std::string>();
        try {
            if (warden::starts_with(text, "<=")) {
                out.push_back(Constraint::le(param, parse_number(text.substr(2))));
            } else if (warden::starts_with(text, ">=")) {
                out.push_back(Constraint::ge(param, parse_number(text.substr(2))));
            } else if (warden::starts_with(text, "==")) {
                out.push_back(Constraint::eq(param, parse_number(text.substr(2))));
            } else if (warden::starts_with(text, "<")) {
                out.push_back(Constraint::lt(param, parse_number(text.substr(1))));
            } else if (warden::starts_with(text, ">")) {
                out.push_back(Constraint::gt(param, parse_number(text.substr(1))));
            } else if (warden::starts_with(text, "startswith:")) {
                out.push_back(Constraint::starts_with(param, text.substr(11)));
            } else {
                LOG_WARN("[ConstraintSet] Skipping constraint for '%s': unrecognised spec '%s'",
                         param.c_str(), text.c_str());
            }
        } catch (const std::exception& e) {
            LOG_WARN("[ConstraintSet] Skipping invalid constraint for '%s': %s (spec: '%s')",
                     param.c_str(), e.what(), text.c_str());
        }
    }

    return ConstraintSet(out);
}

} // namespace warden
