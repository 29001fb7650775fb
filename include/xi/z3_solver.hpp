// ============================================================================
// xi/z3_solver.hpp — Z3 wrapper for propositional semantics
// ============================================================================
//
// Translates expressions (Atom / Not / And / Or) into Z3 boolean terms,
// with one boolean constant per predicate name, and checks them.
//
// Usage:
//   Z3Checker checker(factory);
//   checker.add_expression(id);
//   if (checker.check() == Z3Result::UNSAT) {
//       // id is a contradiction
//   }
//
// IMPORTANT: Z3 is only an oracle for the validator.  Canonical form and
// closure membership are decided purely structurally (algebra.hpp); Z3
// never influences which expressions an attractor contains.
//
// A Z3Checker owns its own z3::context and is not shareable between
// threads.  Parallel callers create one checker per thread.
//
// ============================================================================

#ifndef XI_Z3_SOLVER_HPP
#define XI_Z3_SOLVER_HPP

#include "xi/ast.hpp"

#include <z3++.h>

#include <memory>
#include <string>
#include <unordered_map>

namespace xi {

// ── Z3Result ────────────────────────────────────────────────────────────────

enum class Z3Result {
    SAT,
    UNSAT,
    UNKNOWN
};

const char* z3_result_name(Z3Result r) noexcept;

// ── SemanticClass ───────────────────────────────────────────────────────────

enum class SemanticClass {
    Contradiction,
    Tautology,
    Contingent,
    Unknown
};

const char* semantic_class_name(SemanticClass c) noexcept;

// ── Z3Checker ───────────────────────────────────────────────────────────────

class Z3Checker {
public:
    explicit Z3Checker(const ExpressionFactory& factory);

    /// Assert an expression permanently (until reset()).
    void add_expression(ExprId id);

    /// Check satisfiability of all asserted expressions.
    Z3Result check();

    /// Check `id` together with the asserted expressions, without keeping
    /// it asserted afterwards.
    Z3Result check_expression(ExprId id);

    /// Contradiction if unsat, tautology if its negation is unsat.
    SemanticClass classify(ExprId id);

    /// Reset the solver to empty state.
    void reset();

    /// Get a model (if check() returned SAT), e.g. "{X = true}".
    std::string get_model();

private:
    z3::expr to_z3_bool(ExprId id);

    // Get or create a Z3 boolean constant for the given predicate name.
    z3::expr get_bool_var(const std::string& name);

    const ExpressionFactory& factory_;
    z3::context              ctx_;
    z3::solver               solver_;

    std::unordered_map<std::string, std::unique_ptr<z3::expr>> bool_vars_;
};

}  // namespace xi

#endif  // XI_Z3_SOLVER_HPP
