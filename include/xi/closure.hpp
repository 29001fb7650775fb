// ============================================================================
// xi/closure.hpp — Generation-by-generation attractor construction
// ============================================================================
//
// Algorithm Overview:
// ──────────────────
//   1. Generation 0 = { P, !P }.
//   2. Step k: for every element a of generation k-1 (insertion order) and
//      every base element b in (P, !P):
//          admit conjoin(a, b), then disjoin(a, b);
//      then admit negate(a).  A candidate is admitted only if its canonical
//      id is not yet a member.
//   3. If a step admits nothing, generation k equals generation k-1: the
//      fixed point is reached, converged = true, stop.
//   4. Stop after max_depth steps regardless.
//
// Snapshots are cumulative, so generation k ⊇ generation k-1.  Iteration
// order is fixed and every candidate is canonical, so the output ordering
// is a pure function of (seed, max_depth, simplification mode).
//
// Resource bound:
// ──────────────
// Admitting an element that would make the set larger than max_set_size
// throws DepthLimitError immediately.  Nothing partial is returned.
//
// ============================================================================

#ifndef XI_CLOSURE_HPP
#define XI_CLOSURE_HPP

#include "xi/ast.hpp"
#include "xi/predicate.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace xi {

// ── AttractorResult ─────────────────────────────────────────────────────────
// Output of one build.  Ids refer to the factory the engine was built on.

struct AttractorResult {
    AttractorResult(Predicate seed_, std::uint32_t max_depth_,
                    std::size_t max_set_size_)
        : seed(std::move(seed_)), max_depth(max_depth_),
          max_set_size(max_set_size_) {}

    Predicate     seed;
    std::uint32_t max_depth;
    std::size_t   max_set_size;

    /// Cumulative snapshots; generations[0] is the base set.
    std::vector<std::vector<ExprId>> generations;
    bool   converged = false;
    double elapsed_s = 0.0;

    /// The last snapshot.  Throws InvalidArgumentError if empty.
    const std::vector<ExprId>& final_set() const;

    /// Number of expansion steps performed (generations.size() - 1).
    std::uint32_t steps() const noexcept;
};

/// Printed keys of `ids`, in order.
std::vector<std::string> keys_of(const std::vector<ExprId>& ids,
                                 const ExpressionFactory& factory);

// ── ClosureStats ────────────────────────────────────────────────────────────

struct ClosureStats {
    std::uint64_t candidates_built    = 0;
    std::uint64_t duplicates_skipped  = 0;
    std::uint32_t generations         = 0;
    std::size_t   final_size          = 0;
    std::size_t   max_expression_size = 0;
    double        elapsed_s           = 0.0;

    void reset() noexcept { *this = ClosureStats{}; }

    std::string to_string() const;
};

// ── ClosureEngine ───────────────────────────────────────────────────────────

class ClosureEngine {
public:
    explicit ClosureEngine(ExpressionFactory& factory);

    // Non-copyable (holds a factory reference and per-build state).
    ClosureEngine(const ClosureEngine&) = delete;
    ClosureEngine& operator=(const ClosureEngine&) = delete;

    /// Build the attractor of `seed`.
    /// Throws InvalidArgumentError if max_depth < 0 or max_set_size <= 0,
    /// and DepthLimitError if the set would outgrow max_set_size.
    AttractorResult build(const Predicate& seed, int max_depth, int max_set_size);

    /// Log one line per generation to std::cerr.
    void set_verbose(bool enable) { verbose_ = enable; }

    /// Statistics about the last build.
    std::string stats() const { return stats_.to_string(); }
    const ClosureStats& statistics() const noexcept { return stats_; }

    ExpressionFactory& factory() const { return factory_; }

private:
    // Admit a canonical candidate into the working set.
    void admit(ExprId candidate, std::uint32_t generation);

    // One expansion step over the first `frontier` elements of current_.
    void expand(std::size_t frontier, std::uint32_t generation);

    ExpressionFactory& factory_;
    bool               verbose_ = false;
    ClosureStats       stats_;

    // Per-build state.
    const Predicate*           seed_ = nullptr;
    std::size_t                bound_ = 0;
    std::array<ExprId, 2>      base_{kInvalidId, kInvalidId};
    std::vector<ExprId>        current_;
    std::unordered_set<ExprId> members_;
};

// ── Convenience free function ───────────────────────────────────────────────
// Validates the name (InvalidPredicateError) before any generation work.

AttractorResult build_attractor(ExpressionFactory& factory,
                                const std::string& seed_name,
                                int max_depth, int max_set_size);

}  // namespace xi

#endif  // XI_CLOSURE_HPP
