// ============================================================================
// validator.cpp — Attractor and oscillation validation
// ============================================================================

#include "xi/validator.hpp"
#include "xi/algebra.hpp"
#include "xi/errors.hpp"
#include "xi/oscillator.hpp"
#include "xi/z3_solver.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <memory>
#include <sstream>

#ifdef XI_USE_OPENMP
#include <omp.h>
#endif

namespace xi {

namespace {

constexpr double kEntropyTolerance = 1e-12;

// Depth bound used when probing lattice convergence in run_verification().
constexpr int kLatticeProbeDepth = 8;

// Longest period validate_oscillation() searches for.
constexpr std::size_t kMaxPeriodSearch = 64;

void record(std::vector<CheckEntry>& checks, std::string name, bool passed,
            std::string detail) {
    checks.push_back(CheckEntry{std::move(name), passed, std::move(detail)});
}

bool contains(const std::vector<ExprId>& ids, ExprId id) {
    for (ExprId x : ids) {
        if (x == id) return true;
    }
    return false;
}

// Entropy of the base distribution (membership of P and !P) in `snapshot`.
double base_entropy(const std::vector<ExprId>& snapshot, ExprId p, ExprId not_p) {
    std::vector<std::size_t> counts{
        contains(snapshot, p) ? 1u : 0u,
        contains(snapshot, not_p) ? 1u : 0u
    };
    return shannon_entropy(counts);
}

}  // namespace

bool all_passed(const std::vector<CheckEntry>& checks) noexcept {
    for (const auto& c : checks) {
        if (!c.passed) return false;
    }
    return true;
}

const char* periodicity_to_string(Periodicity p) noexcept {
    switch (p) {
        case Periodicity::Periodic:         return "periodic";
        case Periodicity::InsufficientData: return "insufficient-data";
    }
    return "?";
}

// ── shannon_entropy ─────────────────────────────────────────────────────────

double shannon_entropy(const std::vector<std::size_t>& counts) {
    std::size_t total = 0;
    for (std::size_t c : counts) total += c;
    if (total == 0) return 0.0;

    double h = 0.0;
    for (std::size_t c : counts) {
        if (c == 0) continue;
        double p = static_cast<double>(c) / static_cast<double>(total);
        h -= p * std::log2(p);
    }
    return h;
}

// ── Validator ───────────────────────────────────────────────────────────────

Validator::Validator(ExpressionFactory& factory, ValidatorOptions opts)
    : factory_(factory), opts_(opts) {}

SemanticCensus Validator::run_census(const std::vector<ExprId>& ids) const {
    std::vector<SemanticClass> classes(ids.size(), SemanticClass::Unknown);
    const long n = static_cast<long>(ids.size());

#ifdef XI_USE_OPENMP
    if (opts_.num_threads > 0) omp_set_num_threads(opts_.num_threads);

    // Exceptions must not leave the parallel region or the worksharing loop.
    // The first one is recorded and rethrown after the region.  A thread
    // without a checker still runs through the loop so that every thread
    // reaches the implicit barrier.
    std::exception_ptr error;
    #pragma omp parallel shared(classes, error)
    {
        std::unique_ptr<Z3Checker> checker;
        try {
            checker = std::make_unique<Z3Checker>(factory_);
        } catch (...) {
            #pragma omp critical(xi_census_error)
            {
                if (!error) error = std::current_exception();
            }
        }

        #pragma omp for schedule(dynamic, 16)
        for (long i = 0; i < n; ++i) {
            if (!checker) continue;
            try {
                classes[static_cast<std::size_t>(i)] =
                    checker->classify(ids[static_cast<std::size_t>(i)]);
            } catch (...) {
                #pragma omp critical(xi_census_error)
                {
                    if (!error) error = std::current_exception();
                }
                checker.reset();
            }
        }
    }
    if (error) std::rethrow_exception(error);
#else
    Z3Checker checker(factory_);
    for (long i = 0; i < n; ++i) {
        classes[static_cast<std::size_t>(i)] =
            checker.classify(ids[static_cast<std::size_t>(i)]);
    }
#endif

    SemanticCensus census;
    for (SemanticClass c : classes) {
        switch (c) {
            case SemanticClass::Contradiction: ++census.contradictions; break;
            case SemanticClass::Tautology:     ++census.tautologies;    break;
            case SemanticClass::Contingent:    ++census.contingent;     break;
            case SemanticClass::Unknown:       ++census.unknown;        break;
        }
    }
    return census;
}

ValidationReport Validator::validate(const AttractorResult& attractor,
                                     const Predicate& seed) {
    if (attractor.generations.empty()) {
        throw InvalidArgumentError("cannot validate attractor of '" +
                                   seed.to_string() + "': no generations");
    }

    ValidationReport rep;
    rep.seed = seed.to_string();
    rep.max_depth = attractor.max_depth;
    rep.max_set_size = attractor.max_set_size;
    rep.simplification = factory_.simplification();
    rep.generations = attractor.generations.size();
    rep.converged = attractor.converged;

    const std::vector<ExprId>& final_set = attractor.final_set();
    rep.total_expressions = final_set.size();

    // All reference expressions are interned up front; the census below
    // must not mutate the factory.
    const ExprId p = canonicalize(factory_.make_atom(seed), factory_);
    const ExprId not_p = negate(p, factory_);
    const ExprId contradiction = conjoin(p, not_p, factory_);
    const ExprId tautology = disjoin(p, not_p, factory_);

    // ── Membership ──────────────────────────────────────────────────────
    rep.contradiction_present = contains(final_set, contradiction);
    rep.tautology_present = contains(final_set, tautology);
    rep.base_predicate_present = true;
    rep.base_negation_present = true;
    for (const auto& snap : attractor.generations) {
        rep.base_predicate_present = rep.base_predicate_present && contains(snap, p);
        rep.base_negation_present = rep.base_negation_present && contains(snap, not_p);
    }

    record(rep.checks, "contradiction_present", rep.contradiction_present,
           factory_.key(contradiction) +
           (rep.contradiction_present ? " in final set" : " missing from final set"));
    record(rep.checks, "base_present",
           rep.base_predicate_present && rep.base_negation_present,
           factory_.key(p) + " and " + factory_.key(not_p) + " in every generation");

    // ── Convergence ─────────────────────────────────────────────────────
    const std::size_t n = attractor.generations.size();
    bool recomputed = false;
    if (n >= 2) {
        recomputed = ExprSet(attractor.generations[n - 1]) ==
                     ExprSet(attractor.generations[n - 2]);
    }
    rep.converged_consistent = (recomputed == attractor.converged);
    record(rep.checks, "converged_consistent", rep.converged_consistent,
           std::string("flag=") + (attractor.converged ? "true" : "false") +
           " recomputed=" + (recomputed ? "true" : "false"));

    // ── Monotone growth ─────────────────────────────────────────────────
    rep.monotone = true;
    std::size_t first_violation = 0;
    for (std::size_t g = 1; g < n; ++g) {
        if (!ExprSet(attractor.generations[g])
                 .includes(ExprSet(attractor.generations[g - 1]))) {
            rep.monotone = false;
            first_violation = g;
            break;
        }
    }
    record(rep.checks, "monotone", rep.monotone,
           rep.monotone ? "every generation includes its predecessor"
                        : "generation " + std::to_string(first_violation) +
                          " drops elements of generation " +
                          std::to_string(first_violation - 1));

    // ── Entropy ─────────────────────────────────────────────────────────
    rep.entropy_bits = base_entropy(attractor.generations[0], p, not_p);
    rep.entropy_conserved = true;
    for (std::size_t g = 1; g < n; ++g) {
        double h = base_entropy(attractor.generations[g], p, not_p);
        if (std::abs(h - rep.entropy_bits) > kEntropyTolerance) {
            rep.entropy_conserved = false;
            break;
        }
    }
    {
        std::ostringstream oss;
        oss << "base entropy " << rep.entropy_bits << " bits";
        record(rep.checks, "entropy_conserved", rep.entropy_conserved, oss.str());
    }

    // ── Semantics (Z3) ──────────────────────────────────────────────────
    {
        Z3Checker checker(factory_);
        SemanticClass c = checker.classify(contradiction);
        record(rep.checks, "z3_contradiction_unsat",
               c == SemanticClass::Contradiction,
               factory_.key(contradiction) + " is " + semantic_class_name(c));
        SemanticClass t = checker.classify(tautology);
        record(rep.checks, "z3_tautology_valid",
               t == SemanticClass::Tautology,
               factory_.key(tautology) + " is " + semantic_class_name(t));
    }

    if (opts_.semantic_census) {
        rep.census = run_census(final_set);
        if (opts_.verbose) {
            std::cerr << "[validate] census: " << rep.census->contradictions
                      << " contradictions, " << rep.census->tautologies
                      << " tautologies, " << rep.census->contingent
                      << " contingent, " << rep.census->unknown << " unknown\n";
        }
    }

    if (opts_.verbose) {
        std::cerr << "[validate] " << rep.seed << ": "
                  << (rep.passed() ? "passed" : "FAILED") << " ("
                  << rep.checks.size() << " checks)\n";
    }
    return rep;
}

ValidationReport validate(ExpressionFactory& factory,
                          const AttractorResult& attractor,
                          const Predicate& seed,
                          const ValidatorOptions& opts) {
    Validator v(factory, opts);
    return v.validate(attractor, seed);
}

// ── validate_oscillation ────────────────────────────────────────────────────

OscillationReport validate_oscillation(const std::vector<bool>& sequence) {
    OscillationReport rep;
    rep.length = sequence.size();

    std::size_t trues = 0;
    for (bool b : sequence) {
        if (b) ++trues;
    }
    rep.entropy_bits = shannon_entropy({trues, sequence.size() - trues});

    if (sequence.size() < 2) {
        rep.classification = Periodicity::InsufficientData;
        return rep;
    }

    // Smallest p <= kMaxPeriodSearch with s[i] == s[i-p] for all i >= p.
    // Without one the whole sequence is a single period.
    const std::size_t n = sequence.size();
    const std::size_t limit = std::min(n, kMaxPeriodSearch);
    std::size_t period = n;
    for (std::size_t p = 1; p <= limit; ++p) {
        bool ok = true;
        for (std::size_t i = p; i < n; ++i) {
            if (sequence[i] != sequence[i - p]) {
                ok = false;
                break;
            }
        }
        if (ok) {
            period = p;
            break;
        }
    }

    rep.classification = Periodicity::Periodic;
    rep.period = static_cast<int>(period);
    record(rep.checks, "oscillation_period", period == 2,
           "period " + std::to_string(period) + ", expected 2");
    return rep;
}

// ── run_verification ────────────────────────────────────────────────────────

std::vector<CheckEntry> run_verification(const std::string& seed_name,
                                         int max_depth, int max_set_size) {
    if (max_depth < 1) {
        throw InvalidArgumentError("verification depth must be at least 1, got " +
                                   std::to_string(max_depth));
    }
    Predicate seed(seed_name);
    std::vector<CheckEntry> checks;

    // Contradiction preservation at every depth.
    for (int depth = 1; depth <= max_depth; ++depth) {
        const std::string name = "contradiction_depth_" + std::to_string(depth);
        ExpressionFactory factory;
        try {
            AttractorResult res = ClosureEngine(factory).build(seed, depth, max_set_size);
            ExprId p = canonicalize(factory.make_atom(seed), factory);
            ExprId c = conjoin(p, negate(p, factory), factory);
            bool present = contains(res.final_set(), c);
            record(checks, name, present,
                   std::to_string(res.final_set().size()) + " expressions");
        } catch (const DepthLimitError& e) {
            record(checks, name, false, e.what());
        }
    }

    // Lattice convergence.
    {
        ExpressionFactory factory(Simplification::Lattice);
        try {
            AttractorResult res =
                ClosureEngine(factory).build(seed, kLatticeProbeDepth, max_set_size);
            record(checks, "lattice_convergence", res.converged,
                   res.converged
                       ? "fixed point at generation " + std::to_string(res.steps()) +
                         " with " + std::to_string(res.final_set().size()) +
                         " expressions"
                       : "no fixed point within " +
                         std::to_string(kLatticeProbeDepth) + " generations");
        } catch (const DepthLimitError& e) {
            record(checks, "lattice_convergence", false, e.what());
        }
    }

    // Oscillator.
    {
        Oscillator osc(true);
        OscillationReport rep = validate_oscillation(osc.iterate(100));
        bool ok = osc.is_stable(100) && rep.period && *rep.period == Oscillator::period();
        record(checks, "oscillator_period", ok,
               "period " + (rep.period ? std::to_string(*rep.period) : std::string("none")) +
               " over 100 steps");
    }
    {
        OscillationReport rep = validate_oscillation(iterate(true, 1000));
        std::ostringstream oss;
        oss << rep.entropy_bits << " bits over 1000 steps";
        record(checks, "oscillator_entropy", rep.entropy_bits == 1.0, oss.str());
    }

    return checks;
}

}  // namespace xi
