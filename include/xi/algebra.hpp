// ============================================================================
// xi/algebra.hpp — Canonical negation, conjunction and disjunction
// ============================================================================
//
// The algebra turns raw interned structure into canonical form.  Canonical
// form is what the closure engine deduplicates on: two expressions are the
// same element of an attractor iff their canonical ids (equivalently their
// canonical keys) are equal.
//
// Rules applied in every mode:
//
//   !!φ          ≡   φ                       (double-negation collapse)
//   !X           ≡   X with negated polarity (negation rests in the atom)
//   φ & ψ        ≡   ψ & φ                   (children ordered by key)
//   φ | ψ        ≡   ψ | φ
//
// Additional rules in Simplification::Lattice:
//
//   φ & φ        ≡   φ                       (idempotence)
//   (φ & ψ) & ψ  ≡   φ & ψ                   (repeated operand)
//   φ & (φ | ψ)  ≡   φ                       (absorption)
//   !(φ & ψ)     ≡   !φ | !ψ                 (De Morgan)
//   ... and the duals with & and | exchanged.
//
// Contradictions (φ & !φ) and tautologies (φ | !φ) are never reduced to
// constants: they are exactly the elements the validator looks for.
//
// All functions are pure with respect to meaning: they may intern new
// nodes and fill the canonicalization memo of the factory, but never
// change an existing node.
//
// ============================================================================

#ifndef XI_ALGEBRA_HPP
#define XI_ALGEBRA_HPP

#include "xi/ast.hpp"

#include <string>

namespace xi {

/// Canonical representative of `e`.  Idempotent: canonicalize of a
/// canonical expression returns it unchanged.
ExprId canonicalize(ExprId e, ExpressionFactory& f);

/// Canonical negation of `e`.  negate(negate(e)) == canonicalize(e).
ExprId negate(ExprId e, ExpressionFactory& f);

/// Canonical conjunction.  conjoin(a, b) == conjoin(b, a).
ExprId conjoin(ExprId a, ExprId b, ExpressionFactory& f);

/// Canonical disjunction.  disjoin(a, b) == disjoin(b, a).
ExprId disjoin(ExprId a, ExprId b, ExpressionFactory& f);

/// Printed key of canonicalize(e).
const std::string& canonical_key(ExprId e, ExpressionFactory& f);

/// True if `e` is its own canonical representative.
bool is_canonical(ExprId e, ExpressionFactory& f);

}  // namespace xi

#endif  // XI_ALGEBRA_HPP
