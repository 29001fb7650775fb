// ============================================================================
// ast.cpp — Expression interning, printed keys, and ExprSet
// ============================================================================

#include "xi/ast.hpp"

#include <algorithm>
#include <stdexcept>

namespace xi {

// ── expr_kind_name ──────────────────────────────────────────────────────────

const char* expr_kind_name(ExprKind k) noexcept {
    switch (k) {
        case ExprKind::Atom: return "Atom";
        case ExprKind::Not:  return "!";
        case ExprKind::And:  return "&";
        case ExprKind::Or:   return "|";
    }
    return "?";
}

const char* simplification_name(Simplification s) noexcept {
    switch (s) {
        case Simplification::Structural: return "structural";
        case Simplification::Lattice:    return "lattice";
    }
    return "?";
}

// ── ExprNode equality ───────────────────────────────────────────────────────

bool ExprNode::operator==(const ExprNode& o) const noexcept {
    return kind == o.kind &&
           negated == o.negated &&
           atom_name == o.atom_name &&
           children[0] == o.children[0] &&
           children[1] == o.children[1];
}

// ── ExprNodeHash ────────────────────────────────────────────────────────────
// Combine kind, polarity, atom_name and children via FNV-like mixing.

std::size_t ExprNodeHash::operator()(const ExprNode& n) const noexcept {
    std::size_t h = static_cast<std::size_t>(n.kind);
    h ^= std::hash<bool>{}(n.negated) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= std::hash<std::string>{}(n.atom_name) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= std::hash<ExprId>{}(n.children[0]) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= std::hash<ExprId>{}(n.children[1]) + 0x9e3779b9 + (h << 6) + (h >> 2);
    return h;
}

// ── ExpressionFactory ───────────────────────────────────────────────────────

ExpressionFactory::ExpressionFactory(Simplification mode) : mode_(mode) {}

ExprId ExpressionFactory::intern(ExprNode n) {
    auto it = intern_.find(n);
    if (it != intern_.end()) {
        return it->second;
    }

    // Key and size come from the already-interned children.
    std::string k;
    std::size_t sz = 1;
    switch (n.kind) {
        case ExprKind::Atom:
            k = n.negated ? "!" + n.atom_name : n.atom_name;
            break;
        case ExprKind::Not:
            k = "!" + keys_[n.children[0]];
            sz += sizes_[n.children[0]];
            break;
        case ExprKind::And:
            k = "(" + keys_[n.children[0]] + " & " + keys_[n.children[1]] + ")";
            sz += sizes_[n.children[0]] + sizes_[n.children[1]];
            break;
        case ExprKind::Or:
            k = "(" + keys_[n.children[0]] + " | " + keys_[n.children[1]] + ")";
            sz += sizes_[n.children[0]] + sizes_[n.children[1]];
            break;
    }

    ExprId id = static_cast<ExprId>(nodes_.size());
    nodes_.push_back(std::move(n));
    keys_.push_back(std::move(k));
    sizes_.push_back(sz);
    canonical_.push_back(kInvalidId);
    intern_[nodes_.back()] = id;
    return id;
}

// ── make_* helpers ──────────────────────────────────────────────────────────

ExprId ExpressionFactory::make_atom(const Predicate& p) {
    ExprNode n;
    n.kind = ExprKind::Atom;
    n.atom_name = p.name();
    n.negated = p.negated();
    return intern(std::move(n));
}

ExprId ExpressionFactory::make_not(ExprId child) {
    node(child);  // range check
    ExprNode n;
    n.kind = ExprKind::Not;
    n.children[0] = child;
    return intern(std::move(n));
}

ExprId ExpressionFactory::make_and(ExprId lhs, ExprId rhs) {
    node(lhs);
    node(rhs);
    ExprNode n;
    n.kind = ExprKind::And;
    n.children[0] = lhs;
    n.children[1] = rhs;
    return intern(std::move(n));
}

ExprId ExpressionFactory::make_or(ExprId lhs, ExprId rhs) {
    node(lhs);
    node(rhs);
    ExprNode n;
    n.kind = ExprKind::Or;
    n.children[0] = lhs;
    n.children[1] = rhs;
    return intern(std::move(n));
}

ExprId ExpressionFactory::flip_atom(ExprId atom) {
    const ExprNode& a = node(atom);
    if (a.kind != ExprKind::Atom) {
        throw std::invalid_argument("ExpressionFactory::flip_atom: not an atom");
    }
    ExprNode n;
    n.kind = ExprKind::Atom;
    n.atom_name = a.atom_name;
    n.negated = !a.negated;
    return intern(std::move(n));
}

// ── Accessors ───────────────────────────────────────────────────────────────

const ExprNode& ExpressionFactory::node(ExprId id) const {
    if (id >= nodes_.size()) {
        throw std::out_of_range("ExpressionFactory::node: invalid ExprId");
    }
    return nodes_[id];
}

const std::string& ExpressionFactory::key(ExprId id) const {
    if (id >= keys_.size()) {
        throw std::out_of_range("ExpressionFactory::key: invalid ExprId");
    }
    return keys_[id];
}

std::size_t ExpressionFactory::size() const noexcept {
    return nodes_.size();
}

std::size_t ExpressionFactory::expression_size(ExprId id) const {
    if (id >= sizes_.size()) {
        throw std::out_of_range("ExpressionFactory::expression_size: invalid ExprId");
    }
    return sizes_[id];
}

ExprId ExpressionFactory::canonical_of(ExprId id) const noexcept {
    return id < canonical_.size() ? canonical_[id] : kInvalidId;
}

void ExpressionFactory::remember_canonical(ExprId id, ExprId canonical) {
    if (id >= canonical_.size() || canonical >= canonical_.size()) {
        throw std::out_of_range("ExpressionFactory::remember_canonical: invalid ExprId");
    }
    canonical_[id] = canonical;
}

// ── ExprSet ─────────────────────────────────────────────────────────────────

ExprSet::ExprSet(const std::vector<ExprId>& ids) : data_(ids) {
    std::sort(data_.begin(), data_.end());
    data_.erase(std::unique(data_.begin(), data_.end()), data_.end());
}

void ExprSet::insert(ExprId id) {
    auto pos = std::lower_bound(data_.begin(), data_.end(), id);
    if (pos == data_.end() || *pos != id) {
        data_.insert(pos, id);
    }
}

bool ExprSet::contains(ExprId id) const noexcept {
    return std::binary_search(data_.begin(), data_.end(), id);
}

bool ExprSet::empty() const noexcept {
    return data_.empty();
}

std::size_t ExprSet::size() const noexcept {
    return data_.size();
}

bool ExprSet::includes(const ExprSet& o) const noexcept {
    return std::includes(data_.begin(), data_.end(),
                         o.data_.begin(), o.data_.end());
}

const std::vector<ExprId>& ExprSet::elements() const noexcept {
    return data_;
}

bool ExprSet::operator==(const ExprSet& o) const noexcept {
    return data_ == o.data_;
}

}  // namespace xi
