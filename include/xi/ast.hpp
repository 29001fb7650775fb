// ============================================================================
// xi/ast.hpp — Interned expression DAG
// ============================================================================
//
// Design notes:
//
//   Every expression is a node in an interned DAG.  Two expressions that
//   are structurally identical share the same ExprId, so structural
//   equality is an integer comparison and nodes are shared read-only by
//   every closure set built on the same factory.
//
//   Node types:
//     - Atom : predicate reference (name + polarity)
//     - Not  : negation, child[0]
//     - And  : conjunction, child[0] & child[1]
//     - Or   : disjunction, child[0] | child[1]
//
//   Each node caches its printed key at intern time.  The key of a node is
//   built from the cached keys of its children, so producing it costs time
//   linear in the size of the expression and looking it up afterwards is
//   O(1).  Printed form:
//
//     Atom X        X          Not e       !<e>
//     Atom !X       !X         And a b     (<a> & <b>)
//                              Or  a b     (<a> | <b>)
//
//   The factory also owns the canonicalization memo used by algebra.hpp:
//   canonical_of(id) is the canonical representative of id, once known.
//
// ============================================================================

#ifndef XI_AST_HPP
#define XI_AST_HPP

#include "xi/predicate.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace xi {

// ── ExprId ──────────────────────────────────────────────────────────────────
// Index into the ExpressionFactory node table.  kInvalidId means "none".

using ExprId = std::uint32_t;
inline constexpr ExprId kInvalidId = static_cast<ExprId>(-1);

// ── ExprKind ────────────────────────────────────────────────────────────────

enum class ExprKind : std::uint8_t {
    Atom,
    Not,
    And,
    Or
};

/// Human-readable string for an ExprKind.
const char* expr_kind_name(ExprKind k) noexcept;

// ── Simplification ──────────────────────────────────────────────────────────
// Canonicalization strength, fixed per factory.
//
//   Structural : commutative ordering + double-negation collapse.
//   Lattice    : additionally idempotence, absorption and De Morgan
//                push-down (negation only rests on atoms).

enum class Simplification : std::uint8_t {
    Structural,
    Lattice
};

const char* simplification_name(Simplification s) noexcept;

// ── ExprNode ────────────────────────────────────────────────────────────────
// Immutable stored node.  The ExpressionFactory is the sole owner.

struct ExprNode {
    ExprKind    kind{};
    std::string atom_name;   // non-empty for Atom nodes
    bool        negated = false;
    ExprId      children[2]{kInvalidId, kInvalidId};

    // Structural equality (used by the interning table).
    bool operator==(const ExprNode& o) const noexcept;
};

struct ExprNodeHash {
    std::size_t operator()(const ExprNode& n) const noexcept;
};

// ── ExpressionFactory ───────────────────────────────────────────────────────
// Owns node storage, the interning map, the printed-key cache and the
// canonicalization memo.  Not safe for concurrent construction; concurrent
// readers are fine while nobody interns.

class ExpressionFactory {
public:
    explicit ExpressionFactory(Simplification mode = Simplification::Structural);

    // ── Constructors (raw structure, no canonicalization) ───────────────
    ExprId make_atom(const Predicate& p);
    ExprId make_not(ExprId child);
    ExprId make_and(ExprId lhs, ExprId rhs);
    ExprId make_or(ExprId lhs, ExprId rhs);

    /// The atom with the same name as `atom` and opposite polarity.
    /// Throws std::invalid_argument if `atom` is not an Atom node.
    ExprId flip_atom(ExprId atom);

    // ── Accessors ───────────────────────────────────────────────────────
    const ExprNode&    node(ExprId id) const;
    const std::string& key(ExprId id) const;
    std::size_t        size() const noexcept;

    /// Number of nodes in the tree rooted at `id` (shared subtrees counted
    /// once per occurrence).
    std::size_t        expression_size(ExprId id) const;

    Simplification     simplification() const noexcept { return mode_; }

    /// Printed form; identical to key().
    std::string to_string(ExprId id) const { return key(id); }

    // ── Canonicalization memo ───────────────────────────────────────────
    /// Canonical representative of `id`, or kInvalidId if not yet known.
    ExprId canonical_of(ExprId id) const noexcept;
    void   remember_canonical(ExprId id, ExprId canonical);

private:
    // Intern a node: return the existing id when structurally equal,
    // otherwise allocate a new slot with its key and size.
    ExprId intern(ExprNode node);

    Simplification                                     mode_;
    std::vector<ExprNode>                              nodes_;
    std::vector<std::string>                           keys_;
    std::vector<std::size_t>                           sizes_;
    std::vector<ExprId>                                canonical_;
    std::unordered_map<ExprNode, ExprId, ExprNodeHash> intern_;
};

// ── ExprSet ─────────────────────────────────────────────────────────────────
// Canonical sorted vector of ExprIds.  Deterministic iteration and
// O(log n) membership; used to compare generation snapshots.

class ExprSet {
public:
    ExprSet() = default;
    explicit ExprSet(const std::vector<ExprId>& ids);

    void insert(ExprId id);
    bool contains(ExprId id) const noexcept;
    bool empty() const noexcept;
    std::size_t size() const noexcept;

    /// True if every element of `o` is also in this set.
    bool includes(const ExprSet& o) const noexcept;

    const std::vector<ExprId>& elements() const noexcept;

    bool operator==(const ExprSet& o) const noexcept;
    bool operator!=(const ExprSet& o) const noexcept { return !(*this == o); }

private:
    std::vector<ExprId> data_;  // sorted, unique
};

}  // namespace xi

#endif  // XI_AST_HPP
