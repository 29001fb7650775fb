// ============================================================================
// closure.cpp — Attractor construction
// ============================================================================

#include "xi/closure.hpp"
#include "xi/algebra.hpp"
#include "xi/errors.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <sstream>

namespace xi {

// ── AttractorResult ─────────────────────────────────────────────────────────

const std::vector<ExprId>& AttractorResult::final_set() const {
    if (generations.empty()) {
        throw InvalidArgumentError("attractor of '" + seed.name() +
                                   "' has no generations");
    }
    return generations.back();
}

std::uint32_t AttractorResult::steps() const noexcept {
    return generations.empty()
        ? 0 : static_cast<std::uint32_t>(generations.size() - 1);
}

std::vector<std::string> keys_of(const std::vector<ExprId>& ids,
                                 const ExpressionFactory& factory) {
    std::vector<std::string> out;
    out.reserve(ids.size());
    for (ExprId id : ids) {
        out.push_back(factory.key(id));
    }
    return out;
}

// ── ClosureStats ────────────────────────────────────────────────────────────

std::string ClosureStats::to_string() const {
    std::ostringstream oss;
    oss << "generations=" << generations
        << " final_size=" << final_size
        << " candidates=" << candidates_built
        << " duplicates=" << duplicates_skipped
        << " max_expr_size=" << max_expression_size
        << " elapsed=" << elapsed_s << "s";
    return oss.str();
}

// ── ClosureEngine ───────────────────────────────────────────────────────────

ClosureEngine::ClosureEngine(ExpressionFactory& factory) : factory_(factory) {}

void ClosureEngine::admit(ExprId candidate, std::uint32_t generation) {
    ++stats_.candidates_built;
    if (members_.count(candidate) > 0) {
        ++stats_.duplicates_skipped;
        return;
    }
    if (current_.size() >= bound_) {
        throw DepthLimitError(seed_->name(), generation,
                              current_.size() + 1, bound_);
    }
    members_.insert(candidate);
    current_.push_back(candidate);
    stats_.max_expression_size =
        std::max(stats_.max_expression_size, factory_.expression_size(candidate));
}

void ClosureEngine::expand(std::size_t frontier, std::uint32_t generation) {
    // current_ grows while we iterate; only the previous generation's
    // elements (indices below `frontier`) are expanded.
    for (std::size_t i = 0; i < frontier; ++i) {
        ExprId a = current_[i];
        for (ExprId b : base_) {
            admit(conjoin(a, b, factory_), generation);
            admit(disjoin(a, b, factory_), generation);
        }
        admit(negate(a, factory_), generation);
    }
}

AttractorResult ClosureEngine::build(const Predicate& seed, int max_depth,
                                     int max_set_size) {
    if (max_depth < 0) {
        throw InvalidArgumentError("max_depth must be non-negative, got " +
                                   std::to_string(max_depth));
    }
    if (max_set_size <= 0) {
        throw InvalidArgumentError("max_set_size must be positive, got " +
                                   std::to_string(max_set_size));
    }

    // Reset state from previous runs.
    stats_.reset();
    current_.clear();
    members_.clear();
    seed_ = &seed;
    bound_ = static_cast<std::size_t>(max_set_size);

    const auto t_start = std::chrono::steady_clock::now();

    AttractorResult result(seed, static_cast<std::uint32_t>(max_depth), bound_);

    // Generation 0: the base set.  The seed may itself be a negated
    // predicate; the base is always (seed, negation of seed).
    base_[0] = canonicalize(factory_.make_atom(seed), factory_);
    base_[1] = negate(base_[0], factory_);
    admit(base_[0], 0);
    admit(base_[1], 0);
    result.generations.push_back(current_);

    if (verbose_) {
        std::cerr << "[closure] seed " << seed.to_string()
                  << " mode=" << simplification_name(factory_.simplification())
                  << " max_depth=" << max_depth
                  << " max_set_size=" << max_set_size << "\n";
        std::cerr << "[closure] generation 0: " << current_.size()
                  << " expressions\n";
    }

    for (std::uint32_t gen = 1; gen <= static_cast<std::uint32_t>(max_depth); ++gen) {
        const std::size_t before = current_.size();
        expand(before, gen);
        result.generations.push_back(current_);

        if (verbose_) {
            std::cerr << "[closure] generation " << gen << ": "
                      << current_.size() << " expressions (+"
                      << (current_.size() - before) << ")\n";
        }

        if (current_.size() == before) {
            result.converged = true;
            if (verbose_) {
                std::cerr << "[closure] fixed point at generation " << gen << "\n";
            }
            break;
        }
    }

    result.elapsed_s = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - t_start).count();

    stats_.generations = result.steps();
    stats_.final_size = current_.size();
    stats_.elapsed_s = result.elapsed_s;
    seed_ = nullptr;
    return result;
}

// ── build_attractor ─────────────────────────────────────────────────────────

AttractorResult build_attractor(ExpressionFactory& factory,
                                const std::string& seed_name,
                                int max_depth, int max_set_size) {
    Predicate seed(seed_name);
    ClosureEngine engine(factory);
    return engine.build(seed, max_depth, max_set_size);
}

}  // namespace xi
