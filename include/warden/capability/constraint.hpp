/*
 * warden C++17 - Parameter Constraints
 *
 * A Constraint is an immutable predicate over one named call parameter:
 *
 *   Param("amount").le(1000)
 *   Param("currency").is_in({"usd", "eur"})
 *   Param("path").starts_with("/api/")
 *   Constraint::any_of({Param("role").eq("admin"), Param("role").eq("owner")})
 *
 * Evaluation is total: a missing parameter or a type mismatch makes the
 * predicate fail, it never throws and never defaults to permissive.
 * Parameter names may address nested objects with '/' ("user/role").
 */
#ifndef warden_CAPABILITY_CONSTRAINT_HPP
#define warden_CAPABILITY_CONSTRAINT_HPP

#include <warden/core/json.hpp>
#include <string>
#include <vector>

namespace warden {

enum class ConstraintOp {
    GE,
    LE,
    GT,
    LT,
    EQ,
    NE,
    IN,
    NOT_IN,
    STARTS_WITH,
    ENDS_WITH,
    CONTAINS,
    EXISTS,
    NOT_EXISTS,
    ALL_OF,
    ANY_OF
};

const char* constraint_op_to_string(ConstraintOp op);

// Returns false if the name is not a known operator
bool constraint_op_from_string(const std::string& name, ConstraintOp& out);

// Resolve a (possibly nested) parameter. Explicit JSON null counts as
// missing. Returns nullptr when absent.
const Json* lookup_param(const Json& args, const std::string& param);

class Constraint {
public:
    // ---- Comparison (numeric operand, numeric argument) ----
    static Constraint ge(const std::string& param, const Json& value);
    static Constraint le(const std::string& param, const Json& value);
    static Constraint gt(const std::string& param, const Json& value);
    static Constraint lt(const std::string& param, const Json& value);

    // ---- Equality (same JSON kind required) ----
    static Constraint eq(const std::string& param, const Json& value);
    static Constraint ne(const std::string& param, const Json& value);

    // ---- Membership ----
    static Constraint is_in(const std::string& param, const Json& values);
    static Constraint not_in(const std::string& param, const Json& values);

    // ---- Strings ----
    static Constraint starts_with(const std::string& param, const std::string& prefix);
    static Constraint ends_with(const std::string& param, const std::string& suffix);
    static Constraint contains(const std::string& param, const Json& needle);

    // ---- Existence ----
    static Constraint exists(const std::string& param);
    static Constraint not_exists(const std::string& param);

    // ---- Composites ----
    static Constraint all_of(const std::vector<Constraint>& children);
    static Constraint any_of(const std::vector<Constraint>& children);

    bool evaluate(const Json& args) const;

    ConstraintOp op() const { return op_; }
    const std::string& param() const { return param_; }
    const Json& operand() const { return operand_; }
    const std::vector<Constraint>& children() const { return children_; }

    // Human readable form, e.g. "amount <= 1000"
    std::string describe() const;

    // {"param": "amount", "op": "<=", "value": 1000}
    // {"op": "any_of", "constraints": [...]}
    Json to_json() const;

    // Throws PatternConfigError on unknown operators or bad operands
    static Constraint from_json(const Json& j);

private:
    Constraint(ConstraintOp op, const std::string& param, const Json& operand);

    ConstraintOp op_;
    std::string param_;
    Json operand_;
    std::vector<Constraint> children_;
};

// Fluent builder over a single parameter name
class Param {
public:
    explicit Param(const std::string& name) : name_(name) {}

    Constraint ge(const Json& value) const { return Constraint::ge(name_, value); }
    Constraint le(const Json& value) const { return Constraint::le(name_, value); }
    Constraint gt(const Json& value) const { return Constraint::gt(name_, value); }
    Constraint lt(const Json& value) const { return Constraint::lt(name_, value); }
    Constraint eq(const Json& value) const { return Constraint::eq(name_, value); }
    Constraint ne(const Json& value) const { return Constraint::ne(name_, value); }
    Constraint is_in(const Json& values) const { return Constraint::is_in(name_, values); }
    Constraint not_in(const Json& values) const { return Constraint::not_in(name_, values); }
    Constraint starts_with(const std::string& prefix) const { return Constraint::starts_with(name_, prefix); }
    Constraint ends_with(const std::string& suffix) const { return Constraint::ends_with(name_, suffix); }
    Constraint contains(const Json& needle) const { return Constraint::contains(name_, needle); }
    Constraint exists() const { return Constraint::exists(name_); }
    Constraint not_exists() const { return Constraint::not_exists(name_); }

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

// Ordered conjunction of constraints. Empty set always holds.
class ConstraintSet {
public:
    ConstraintSet() {}
    ConstraintSet(const std::vector<Constraint>& constraints) : constraints_(constraints) {}

    bool evaluate(const Json& args) const;

    // First failing constraint in declaration order, nullptr if all hold
    const Constraint* first_violation(const Json& args) const;

    bool empty() const { return constraints_.empty(); }
    size_t size() const { return constraints_.size(); }
    const std::vector<Constraint>& constraints() const { return constraints_; }

    Json to_json() const;
    static ConstraintSet from_json(const Json& j);

    // Shorthand map used in config files:
    //   {"amount": "<=1000", "currency": ["usd", "eur"], "path": "startswith:/api/", "n": 3}
    // Unrecognised or unparseable entries are skipped with a warning.
    static ConstraintSet from_shorthand(const Json& spec);

private:
    std::vector<Constraint> constraints_;
};

} // namespace warden

#endif // warden_CAPABILITY_CONSTRAINT_HPP
