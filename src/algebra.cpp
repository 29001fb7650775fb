// ============================================================================
// algebra.cpp — Canonicalization rules
// ============================================================================
//
// canonicalize() is a bottom-up rebuild through negate_canonical() and
// combine(), memoised per node in the factory.  Every node produced by
// combine() or negate_canonical() is registered as its own canonical
// representative.
//
// IMPORTANT: copy node kind and children out of the factory BEFORE any
// call that may intern, because interning can reallocate the node table
// and invalidate `const ExprNode&` references.
//
// ============================================================================

#include "xi/algebra.hpp"

#include <utility>

namespace xi {

namespace {

ExprId mark_canonical(ExprId id, ExpressionFactory& f) {
    f.remember_canonical(id, id);
    return id;
}

bool has_child(const ExprNode& n, ExprId c) noexcept {
    return n.children[0] == c || n.children[1] == c;
}

// ── combine ─────────────────────────────────────────────────────────────────
// Build op(a, b) from two canonical operands.

ExprId combine(ExprKind op, ExprId a, ExprId b, ExpressionFactory& f) {
    ExprId lo = a;
    ExprId hi = b;
    if (f.key(hi) < f.key(lo)) {
        std::swap(lo, hi);
    }

    if (f.simplification() == Simplification::Lattice) {
        if (lo == hi) {
            return lo;
        }
        const ExprKind dual = (op == ExprKind::And) ? ExprKind::Or : ExprKind::And;
        const ExprId order[2][2] = {{lo, hi}, {hi, lo}};
        for (const auto& xy : order) {
            const ExprNode& x = f.node(xy[0]);
            const ExprNode& y = f.node(xy[1]);
            // (φ op ψ) op ψ  →  φ op ψ
            if (x.kind == op && has_child(x, xy[1])) {
                return xy[0];
            }
            // φ op (φ dual ψ)  →  φ
            if (y.kind == dual && has_child(y, xy[0])) {
                return xy[0];
            }
        }
    }

    ExprId id = (op == ExprKind::And) ? f.make_and(lo, hi) : f.make_or(lo, hi);
    return mark_canonical(id, f);
}

// ── negate_canonical ────────────────────────────────────────────────────────
// Negation of an expression already in canonical form.

ExprId negate_canonical(ExprId c, ExpressionFactory& f) {
    ExprKind kind = f.node(c).kind;
    ExprId child0 = f.node(c).children[0];
    ExprId child1 = f.node(c).children[1];

    switch (kind) {
        case ExprKind::Atom:
            return mark_canonical(f.flip_atom(c), f);

        case ExprKind::Not:
            // Canonical Not never wraps an atom or another Not, and its
            // child is canonical.
            return child0;

        case ExprKind::And:
        case ExprKind::Or: {
            if (f.simplification() == Simplification::Structural) {
                return mark_canonical(f.make_not(c), f);
            }
            ExprId n0 = negate_canonical(child0, f);
            ExprId n1 = negate_canonical(child1, f);
            ExprKind dual = (kind == ExprKind::And) ? ExprKind::Or : ExprKind::And;
            return combine(dual, n0, n1, f);
        }
    }
    return c;
}

}  // namespace

// ── canonicalize ────────────────────────────────────────────────────────────

ExprId canonicalize(ExprId e, ExpressionFactory& f) {
    ExprId memo = f.canonical_of(e);
    if (memo != kInvalidId) {
        return memo;
    }

    ExprKind kind = f.node(e).kind;
    ExprId child0 = f.node(e).children[0];
    ExprId child1 = f.node(e).children[1];

    ExprId result = e;
    switch (kind) {
        case ExprKind::Atom:
            result = e;
            break;
        case ExprKind::Not:
            result = negate_canonical(canonicalize(child0, f), f);
            break;
        case ExprKind::And:
        case ExprKind::Or: {
            ExprId c0 = canonicalize(child0, f);
            ExprId c1 = canonicalize(child1, f);
            result = combine(kind, c0, c1, f);
            break;
        }
    }

    f.remember_canonical(e, result);
    f.remember_canonical(result, result);
    return result;
}

// ── negate / conjoin / disjoin ──────────────────────────────────────────────

ExprId negate(ExprId e, ExpressionFactory& f) {
    return negate_canonical(canonicalize(e, f), f);
}

ExprId conjoin(ExprId a, ExprId b, ExpressionFactory& f) {
    ExprId ca = canonicalize(a, f);
    ExprId cb = canonicalize(b, f);
    return combine(ExprKind::And, ca, cb, f);
}

ExprId disjoin(ExprId a, ExprId b, ExpressionFactory& f) {
    ExprId ca = canonicalize(a, f);
    ExprId cb = canonicalize(b, f);
    return combine(ExprKind::Or, ca, cb, f);
}

const std::string& canonical_key(ExprId e, ExpressionFactory& f) {
    return f.key(canonicalize(e, f));
}

bool is_canonical(ExprId e, ExpressionFactory& f) {
    return canonicalize(e, f) == e;
}

}  // namespace xi
