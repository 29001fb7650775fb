// ============================================================================
// z3_solver.cpp — Implementation of the Z3 propositional checker
// ============================================================================

#include "xi/z3_solver.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace xi {

const char* z3_result_name(Z3Result r) noexcept {
    switch (r) {
        case Z3Result::SAT:     return "sat";
        case Z3Result::UNSAT:   return "unsat";
        case Z3Result::UNKNOWN: return "unknown";
    }
    return "?";
}

const char* semantic_class_name(SemanticClass c) noexcept {
    switch (c) {
        case SemanticClass::Contradiction: return "contradiction";
        case SemanticClass::Tautology:     return "tautology";
        case SemanticClass::Contingent:    return "contingent";
        case SemanticClass::Unknown:       return "unknown";
    }
    return "?";
}

// ── Z3Checker ───────────────────────────────────────────────────────────────

Z3Checker::Z3Checker(const ExpressionFactory& factory)
    : factory_(factory), ctx_(), solver_(ctx_) {}

void Z3Checker::reset() {
    solver_.reset();
    bool_vars_.clear();
}

z3::expr Z3Checker::get_bool_var(const std::string& name) {
    auto it = bool_vars_.find(name);
    if (it != bool_vars_.end()) {
        return *it->second;
    }
    auto var = std::make_unique<z3::expr>(ctx_.bool_const(name.c_str()));
    z3::expr result = *var;
    bool_vars_[name] = std::move(var);
    return result;
}

z3::expr Z3Checker::to_z3_bool(ExprId id) {
    const ExprNode& n = factory_.node(id);

    switch (n.kind) {
        case ExprKind::Atom: {
            z3::expr atom = get_bool_var(n.atom_name);
            return n.negated ? !atom : atom;
        }

        case ExprKind::Not:
            return !to_z3_bool(n.children[0]);

        case ExprKind::And: {
            z3::expr lhs = to_z3_bool(n.children[0]);
            z3::expr rhs = to_z3_bool(n.children[1]);
            return lhs && rhs;
        }

        case ExprKind::Or: {
            z3::expr lhs = to_z3_bool(n.children[0]);
            z3::expr rhs = to_z3_bool(n.children[1]);
            return lhs || rhs;
        }
    }

    throw std::runtime_error("to_z3_bool: unsupported node kind " +
                             std::string(expr_kind_name(n.kind)));
}

void Z3Checker::add_expression(ExprId id) {
    solver_.add(to_z3_bool(id));
}

static Z3Result from_check_result(z3::check_result result) {
    switch (result) {
        case z3::sat:     return Z3Result::SAT;
        case z3::unsat:   return Z3Result::UNSAT;
        case z3::unknown: return Z3Result::UNKNOWN;
    }
    return Z3Result::UNKNOWN;
}

Z3Result Z3Checker::check() {
    return from_check_result(solver_.check());
}

Z3Result Z3Checker::check_expression(ExprId id) {
    z3::expr e = to_z3_bool(id);
    solver_.push();
    solver_.add(e);
    Z3Result r = from_check_result(solver_.check());
    solver_.pop();
    return r;
}

SemanticClass Z3Checker::classify(ExprId id) {
    z3::expr e = to_z3_bool(id);

    solver_.push();
    solver_.add(e);
    Z3Result pos = from_check_result(solver_.check());
    solver_.pop();
    if (pos == Z3Result::UNSAT) return SemanticClass::Contradiction;

    solver_.push();
    solver_.add(!e);
    Z3Result neg = from_check_result(solver_.check());
    solver_.pop();
    if (neg == Z3Result::UNSAT) return SemanticClass::Tautology;

    if (pos == Z3Result::UNKNOWN || neg == Z3Result::UNKNOWN) {
        return SemanticClass::Unknown;
    }
    return SemanticClass::Contingent;
}

std::string Z3Checker::get_model() {
    if (solver_.check() != z3::sat) {
        return "(no model available)";
    }

    z3::model model = solver_.get_model();

    // Sorted by name so the output is stable.
    std::vector<std::string> names;
    names.reserve(bool_vars_.size());
    for (const auto& entry : bool_vars_) {
        names.push_back(entry.first);
    }
    std::sort(names.begin(), names.end());

    std::string result = "{";
    bool first = true;
    for (const auto& name : names) {
        if (!first) {
            result += ", ";
        }
        first = false;
        z3::expr value = model.eval(*bool_vars_.at(name), true);
        result += name + " = " + value.to_string();
    }
    result += "}";
    return result;
}

}  // namespace xi
