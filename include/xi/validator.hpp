// ============================================================================
// xi/validator.hpp — Structural, statistical and semantic checks
// ============================================================================
//
// The validator inspects an AttractorResult (and, independently, an
// oscillator sequence) and produces an immutable report.  Invariant
// violations never throw: each check is recorded as a CheckEntry and a
// report passes iff every entry passed.  Only malformed input (an
// attractor without generations) raises InvalidArgumentError.
//
// Checks on an attractor:
//   contradiction_present  canonical P & !P is in the final set
//   tautology_present      canonical P | !P is in the final set (info)
//   base_present           P and !P are both in every snapshot
//   converged_consistent   converged flag == (last two snapshots equal)
//   monotone               every snapshot includes its predecessor
//   entropy_conserved      base-distribution entropy equal at every
//                          generation (1 bit for a well-formed attractor)
//   z3_contradiction_unsat / z3_tautology_valid
//
// Optional semantic census: every final-set member classified by Z3 as
// contradiction / tautology / contingent / unknown.  The census is the
// only parallel region (OpenMP, one Z3Checker per thread); the factory is
// only read during it.
//
// ============================================================================

#ifndef XI_VALIDATOR_HPP
#define XI_VALIDATOR_HPP

#include "xi/ast.hpp"
#include "xi/closure.hpp"
#include "xi/predicate.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace xi {

// ── CheckEntry ──────────────────────────────────────────────────────────────

struct CheckEntry {
    std::string name;
    bool        passed = false;
    std::string detail;
};

/// True if every entry passed (vacuously true for an empty list).
bool all_passed(const std::vector<CheckEntry>& checks) noexcept;

// ── SemanticCensus ──────────────────────────────────────────────────────────

struct SemanticCensus {
    std::size_t contradictions = 0;
    std::size_t tautologies    = 0;
    std::size_t contingent     = 0;
    std::size_t unknown        = 0;

    std::size_t total() const noexcept {
        return contradictions + tautologies + contingent + unknown;
    }
};

// ── ValidationReport ────────────────────────────────────────────────────────

struct ValidationReport {
    std::string   seed;
    std::uint32_t max_depth    = 0;
    std::size_t   max_set_size = 0;
    Simplification simplification = Simplification::Structural;
    std::size_t   generations  = 0;   // number of snapshots
    std::size_t   total_expressions = 0;

    bool contradiction_present = false;
    bool tautology_present     = false;
    bool base_predicate_present = false;
    bool base_negation_present  = false;

    bool converged            = false;
    bool converged_consistent = false;
    bool monotone             = false;

    double entropy_bits      = 0.0;   // at generation 0
    bool   entropy_conserved = false;

    std::optional<SemanticCensus> census;

    std::vector<CheckEntry> checks;

    bool passed() const noexcept { return all_passed(checks); }
};

// ── OscillationReport ───────────────────────────────────────────────────────

enum class Periodicity {
    Periodic,
    InsufficientData
};

/// "periodic" / "insufficient-data".
const char* periodicity_to_string(Periodicity p) noexcept;

struct OscillationReport {
    std::size_t        length = 0;
    std::optional<int> period;
    Periodicity        classification = Periodicity::InsufficientData;
    double             entropy_bits = 0.0;
    std::vector<CheckEntry> checks;

    bool passed() const noexcept { return all_passed(checks); }
};

// ── Validator ───────────────────────────────────────────────────────────────

struct ValidatorOptions {
    bool semantic_census = true;
    int  num_threads     = 0;   // OpenMP threads for the census (0 = default)
    bool verbose         = false;
};

class Validator {
public:
    explicit Validator(ExpressionFactory& factory, ValidatorOptions opts = {});

    /// Validate `attractor`, built on this validator's factory from `seed`.
    /// Throws InvalidArgumentError if the attractor has no generations.
    ValidationReport validate(const AttractorResult& attractor,
                              const Predicate& seed);

private:
    SemanticCensus run_census(const std::vector<ExprId>& ids) const;

    ExpressionFactory& factory_;
    ValidatorOptions   opts_;
};

// ── Free functions ──────────────────────────────────────────────────────────

ValidationReport validate(ExpressionFactory& factory,
                          const AttractorResult& attractor,
                          const Predicate& seed,
                          const ValidatorOptions& opts = {});

OscillationReport validate_oscillation(const std::vector<bool>& sequence);

/// Shannon entropy in bits of the distribution given by `counts`.
/// Zero counts contribute nothing; an all-zero input has entropy 0.
double shannon_entropy(const std::vector<std::size_t>& counts);

/// End-to-end self-verification over fresh factories:
///   contradiction preserved at every depth 1..max_depth,
///   lattice closure converges,
///   oscillator period stable over 100 steps,
///   oscillator entropy exactly 1 bit over 1000 steps.
std::vector<CheckEntry> run_verification(const std::string& seed_name,
                                         int max_depth, int max_set_size);

}  // namespace xi

#endif  // XI_VALIDATOR_HPP
