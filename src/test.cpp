// ============================================================================
// test.cpp — Self-test suite for the xi attractor tool
// ============================================================================
//
// Contains tests covering:
//   - Lexer tokenisation and parser correctness / errors
//   - Predicate validation and negation
//   - Canonicalization (structural and lattice modes)
//   - Closure construction, bounds, determinism, convergence
//   - Oscillator sequences and periodicity classification
//   - Validator checks, failure entries, entropy, Z3 census
//   - Report JSON and text round trip
//   - CLI argument parsing and the verification suite
//
// ============================================================================

#include "xi/test.hpp"
#include "xi/algebra.hpp"
#include "xi/ast.hpp"
#include "xi/cli.hpp"
#include "xi/closure.hpp"
#include "xi/errors.hpp"
#include "xi/lexer.hpp"
#include "xi/oscillator.hpp"
#include "xi/parser.hpp"
#include "xi/report.hpp"
#include "xi/utils.hpp"
#include "xi/validator.hpp"
#include "xi/z3_solver.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace xi {

// ── TestContext ──────────────────────────────────────────────────────────────

void TestContext::check(bool condition, const std::string& description) {
    ++total_;
    if (!condition) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n";
    }
}

void TestContext::check_eq(const std::string& actual,
                           const std::string& expected,
                           const std::string& description) {
    ++total_;
    if (actual != expected) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n"
                  << "    expected: " << expected << "\n"
                  << "    actual:   " << actual << "\n";
    }
}

// ── TestRunner ──────────────────────────────────────────────────────────────

void TestRunner::run(const std::string& name, TestFunc func) {
    ++tests_run_;
    TestContext ctx;
    ctx.current_test_ = name;

    std::cerr << "TEST: " << name << "\n";
    try {
        func(ctx);
    } catch (const std::exception& e) {
        std::cerr << "  EXCEPTION: " << e.what() << "\n";
        ++ctx.failed_;
    }

    checks_total_ += ctx.total();
    checks_failed_ += ctx.failed();
    if (ctx.failed() > 0) {
        ++tests_failed_;
    } else {
        std::cerr << "  OK (" << ctx.total() << " checks)\n";
    }
}

int TestRunner::summarise() const {
    std::cerr << "\n=== Test Summary ===\n"
              << "Tests:  " << tests_run_ << " run, "
              << (tests_run_ - tests_failed_) << " passed, "
              << tests_failed_ << " failed\n"
              << "Checks: " << checks_total_ << " total, "
              << (checks_total_ - checks_failed_) << " passed, "
              << checks_failed_ << " failed\n";

    if (tests_failed_ == 0) {
        std::cerr << "ALL TESTS PASSED\n";
        return 0;
    } else {
        std::cerr << "SOME TESTS FAILED\n";
        return 1;
    }
}

// ============================================================================
// Helpers
// ============================================================================

// Parse and print raw structure.
static std::string pp(const std::string& input,
                      Simplification mode = Simplification::Structural) {
    ExpressionFactory f(mode);
    return f.key(parse_expression(input, f));
}

// Parse and print the canonical key.
static std::string canon(const std::string& input,
                         Simplification mode = Simplification::Structural) {
    ExpressionFactory f(mode);
    return canonical_key(parse_expression(input, f), f);
}

static std::string join(const std::vector<std::string>& v) {
    std::string out = "[";
    for (std::size_t i = 0; i < v.size(); ++i) {
        if (i > 0) out += ", ";
        out += v[i];
    }
    return out + "]";
}

static std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        lines.push_back(line);
    }
    return lines;
}

static const CheckEntry* find_check(const std::vector<CheckEntry>& checks,
                                    const std::string& name) {
    for (const auto& c : checks) {
        if (c.name == name) return &c;
    }
    return nullptr;
}

static bool check_failed(const std::vector<CheckEntry>& checks,
                         const std::string& name) {
    const CheckEntry* c = find_check(checks, name);
    return c != nullptr && !c->passed;
}

// Run parse_args on a literal argument list.
static Options args(std::vector<std::string> words) {
    std::vector<char*> argv;
    argv.reserve(words.size());
    for (auto& w : words) {
        argv.push_back(w.data());
    }
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

// Expressions exercised by the algebra property tests.
static const std::vector<std::string> kSampleExpressions = {
    "X", "!X", "!!X", "X & !X", "!X | X", "X & X", "(X & Y) | !Z",
    "!(X & Y)", "!!(X | !Y)", "(X | Y) & (Y | X)", "X & (X | Y)",
    "!((X & !X) | (Y & Y))", "((X & Y) & Y) | !!!Z"
};

// ============================================================================
// Lexer / parser
// ============================================================================

static void test_lexer_tokens(TestContext& ctx) {
    auto toks = tokenise("(!X & Y_1) | _z");
    ctx.check(toks.size() == 9, "token count");
    ctx.check(toks[0].kind == TokenKind::LParen, "lparen");
    ctx.check(toks[1].kind == TokenKind::Bang, "bang");
    ctx.check(toks[2].kind == TokenKind::Identifier && toks[2].text == "X", "ident X");
    ctx.check(toks[3].kind == TokenKind::Amp, "amp");
    ctx.check(toks[4].text == "Y_1", "ident with digit and underscore");
    ctx.check(toks[6].kind == TokenKind::Pipe, "pipe");
    ctx.check(toks[7].text == "_z", "leading underscore");
    ctx.check(toks[8].kind == TokenKind::Eof, "eof");
    ctx.check(toks[7].pos.column == 14, "column of _z");

    auto commented = tokenise("X # trailing comment");
    ctx.check(commented.size() == 2, "comment skipped");
}

static void test_lexer_errors(TestContext& ctx) {
    try {
        tokenise("X $ Y", 7);
        ctx.check(false, "unexpected character should throw");
    } catch (const std::runtime_error& e) {
        ctx.check_eq(e.what(), "7: ERROR: unexpected character '$' at column 3",
                     "lexer error format");
    }
}

static void test_parse_structure(TestContext& ctx) {
    ctx.check_eq(pp("X"), "X", "atom");
    ctx.check_eq(pp("!X"), "!X", "negation");
    ctx.check_eq(pp("!!X"), "!!X", "double negation is kept raw");
    ctx.check_eq(pp("X & Y"), "(X & Y)", "conjunction");
    ctx.check_eq(pp("Y | X"), "(Y | X)", "disjunction keeps order raw");
    ctx.check_eq(pp("X | Y & Z"), "(X | (Y & Z))", "& binds tighter than |");
    ctx.check_eq(pp("X & Y & Z"), "((X & Y) & Z)", "& is left-assoc");
    ctx.check_eq(pp("(X)"), "X", "parentheses");
    ctx.check_eq(pp("!(X & Y)"), "!(X & Y)", "negated group");

    ExpressionFactory f;
    ExprId a = parse_expression("(X & Y)", f);
    ExprId b = parse_expression("X & Y", f);
    ctx.check(a == b, "structurally equal expressions share an id");
}

static void test_parse_errors(TestContext& ctx) {
    ExpressionFactory f;
    ctx.check_throws<std::runtime_error>([&] { parse_expression("X &", f); },
                                         "dangling operator");
    ctx.check_throws<std::runtime_error>([&] { parse_expression("(X", f); },
                                         "unclosed paren");
    ctx.check_throws<std::runtime_error>([&] { parse_expression("X Y", f); },
                                         "trailing token");
    ctx.check_throws<std::runtime_error>([&] { parse_expression("", f); },
                                         "empty input");
    ctx.check_throws<InvalidPredicateError>([&] { parse_expression("X & true", f); },
                                            "reserved name in expression");
    try {
        parse_expression("X |", f, 4);
        ctx.check(false, "expected throw");
    } catch (const std::runtime_error& e) {
        ctx.check_eq(e.what(), "4: ERROR: unexpected end of input at column 4",
                     "parser error format");
    }
}

// ============================================================================
// Predicate
// ============================================================================

static void test_predicate(TestContext& ctx) {
    Predicate x("X");
    ctx.check_eq(x.name(), "X", "name");
    ctx.check(!x.negated(), "asserted by default");
    ctx.check_eq(x.to_string(), "X", "to_string");

    Predicate nx = x.negation();
    ctx.check_eq(nx.name(), "X", "negation keeps name");
    ctx.check(nx.negated(), "negation flips polarity");
    ctx.check_eq(nx.to_string(), "!X", "negated to_string");
    ctx.check(x != nx, "predicate differs from its negation");
    ctx.check(nx.negation() == x, "double negation");
    ctx.check(!x.negated(), "negation does not mutate");

    ctx.check(Predicate("Valid_Name2") == Predicate("Valid_Name2"), "value equality");
    ctx.check(Predicate("_p").name() == "_p", "leading underscore accepted");
}

static void test_predicate_invalid(TestContext& ctx) {
    for (const char* bad : {"", "1X", "X-1", "X Y", "and", "or", "not", "true", "false"}) {
        ctx.check_throws<InvalidPredicateError>([&] { Predicate p(bad); },
                                                std::string("reject '") + bad + "'");
    }
    try {
        Predicate p("and");
        ctx.check(false, "expected throw");
    } catch (const InvalidPredicateError& e) {
        ctx.check_eq(e.name(), "and", "error carries the name");
        ctx.check_eq(e.what(), "invalid predicate 'and': reserved name", "message");
    }
    ctx.check(is_identifier("abc_9"), "is_identifier");
    ctx.check(!is_identifier("9abc"), "is_identifier digit first");
    ctx.check(is_reserved_name("not"), "is_reserved_name");
}

// ============================================================================
// Canonicalization
// ============================================================================

static void test_canonical_structural(TestContext& ctx) {
    ctx.check_eq(canon("X & !X"), "(!X & X)", "contradiction ordered by key");
    ctx.check_eq(canon("X | !X"), "(!X | X)", "tautology ordered by key");
    ctx.check_eq(canon("!!X"), "X", "double negation collapse");
    ctx.check_eq(canon("!X"), "!X", "negated atom");
    ctx.check_eq(canon("Y | X"), "(X | Y)", "commutative ordering");
    ctx.check_eq(canon("X & X"), "(X & X)", "no idempotence");
    ctx.check_eq(canon("!(X & Y)"), "!(X & Y)", "no De Morgan");
    ctx.check_eq(canon("!!(Y & X)"), "(X & Y)", "collapse above compound");
    ctx.check_eq(canon("(Z | Y) & !!X"), "((Y | Z) & X)", "nested ordering");
}

static void test_canonical_lattice(TestContext& ctx) {
    const auto L = Simplification::Lattice;
    ctx.check_eq(canon("X & X", L), "X", "idempotence &");
    ctx.check_eq(canon("X | X", L), "X", "idempotence |");
    ctx.check_eq(canon("X & !X", L), "(!X & X)", "contradiction kept");
    ctx.check_eq(canon("X | !X", L), "(!X | X)", "tautology kept");
    ctx.check_eq(canon("!(X & Y)", L), "(!X | !Y)", "De Morgan &");
    ctx.check_eq(canon("!(X | !Y)", L), "(!X & Y)", "De Morgan |");
    ctx.check_eq(canon("X & (X | Y)", L), "X", "absorption");
    ctx.check_eq(canon("X | (Y & X)", L), "X", "dual absorption");
    ctx.check_eq(canon("(X & Y) & Y", L), "(X & Y)", "repeated operand");
    ctx.check_eq(canon("(X & !X) | X", L), "X", "absorption of contradiction");
    ctx.check_eq(canon("!(X & !X)", L), "(!X | X)", "negated contradiction");
}

static void test_canonical_idempotent(TestContext& ctx) {
    for (Simplification mode : {Simplification::Structural, Simplification::Lattice}) {
        ExpressionFactory f(mode);
        for (const auto& s : kSampleExpressions) {
            ExprId c = canonicalize(parse_expression(s, f), f);
            ctx.check(canonicalize(c, f) == c,
                      std::string("idempotent (") + simplification_name(mode) + "): " + s);
            ctx.check(is_canonical(c, f), "is_canonical: " + s);
        }
    }
}

static void test_double_negation(TestContext& ctx) {
    for (Simplification mode : {Simplification::Structural, Simplification::Lattice}) {
        ExpressionFactory f(mode);
        for (const auto& s : kSampleExpressions) {
            ExprId e = parse_expression(s, f);
            ctx.check(negate(negate(e, f), f) == canonicalize(e, f),
                      std::string("negate twice (") + simplification_name(mode) + "): " + s);
            ctx.check(negate(e, f) != canonicalize(e, f), "negate changes: " + s);
        }
    }
}

static void test_commutativity(TestContext& ctx) {
    for (Simplification mode : {Simplification::Structural, Simplification::Lattice}) {
        ExpressionFactory f(mode);
        for (std::size_t i = 0; i + 1 < kSampleExpressions.size(); ++i) {
            ExprId a = parse_expression(kSampleExpressions[i], f);
            ExprId b = parse_expression(kSampleExpressions[i + 1], f);
            ctx.check(conjoin(a, b, f) == conjoin(b, a, f),
                      "conjoin commutes: " + kSampleExpressions[i]);
            ctx.check(disjoin(a, b, f) == disjoin(b, a, f),
                      "disjoin commutes: " + kSampleExpressions[i]);
        }
    }
}

static void test_factory(TestContext& ctx) {
    ExpressionFactory f;
    ExprId x = f.make_atom(Predicate("X"));
    ExprId nx = f.flip_atom(x);
    ctx.check_eq(f.key(nx), "!X", "flip_atom");
    ctx.check(f.flip_atom(nx) == x, "flip_atom twice");
    ExprId a = f.make_and(x, nx);
    ctx.check(f.make_and(x, nx) == a, "interning");
    ctx.check(f.expression_size(a) == 3, "expression size");
    ctx.check(f.node(a).kind == ExprKind::And, "node kind");
    ctx.check_throws<std::out_of_range>([&] { f.node(1000); }, "invalid id");
    ctx.check_throws<std::invalid_argument>([&] { f.flip_atom(a); }, "flip non-atom");

    ExprSet s({a, x, a});
    ctx.check(s.size() == 2, "ExprSet dedups");
    ctx.check(s.contains(x) && !s.contains(nx), "ExprSet contains");
    ExprSet t({x});
    ctx.check(s.includes(t) && !t.includes(s), "ExprSet includes");
    t.insert(a);
    ctx.check(s == t, "ExprSet equality ignores order");
}

// ============================================================================
// Closure
// ============================================================================

static void test_closure_base(TestContext& ctx) {
    ExpressionFactory f;
    AttractorResult r = build_attractor(f, "X", 0, 100);
    ctx.check(r.generations.size() == 1, "depth 0 gives one snapshot");
    ctx.check_eq(join(keys_of(r.final_set(), f)), "[X, !X]", "base set");
    ctx.check(!r.converged, "depth 0 not converged");
    ctx.check(r.steps() == 0, "no steps");
}

static void test_closure_depth1(TestContext& ctx) {
    ExpressionFactory f;
    AttractorResult r = build_attractor(f, "X", 1, 100);
    ctx.check(r.generations.size() == 2, "two snapshots");
    ctx.check_eq(join(keys_of(r.final_set(), f)),
                 "[X, !X, (X & X), (X | X), (!X & X), (!X | X), (!X & !X), (!X | !X)]",
                 "generation 1 order");
    ctx.check(!r.converged, "not converged at depth 1");

    ExprId p = canonicalize(f.make_atom(Predicate("X")), f);
    ExprId contradiction = conjoin(p, negate(p, f), f);
    ctx.check(ExprSet(r.final_set()).contains(contradiction), "contradiction present");
}

static void test_closure_negated_seed(TestContext& ctx) {
    ExpressionFactory f;
    ClosureEngine engine(f);
    AttractorResult r = engine.build(Predicate("X").negation(), 1, 100);
    ctx.check_eq(join(keys_of(r.generations[0], f)), "[!X, X]", "negated base");
    ctx.check_eq(r.seed.to_string(), "!X", "seed recorded");
    ValidationReport rep = validate(f, r, r.seed, ValidatorOptions{false, 0, false});
    ctx.check(rep.contradiction_present, "contradiction for negated seed");
}

static void test_closure_set_limit(TestContext& ctx) {
    ExpressionFactory f;
    try {
        build_attractor(f, "X", 50, 4);
        ctx.check(false, "max_set_size 4 should throw");
    } catch (const DepthLimitError& e) {
        ctx.check_eq(e.seed(), "X", "seed");
        ctx.check(e.generation() == 1, "generation");
        ctx.check(e.attempted_size() == 5, "attempted size");
        ctx.check(e.bound() == 4, "bound");
    }
    try {
        build_attractor(f, "X", 3, 1);
        ctx.check(false, "max_set_size 1 should throw");
    } catch (const DepthLimitError& e) {
        ctx.check(e.generation() == 0, "base set is bounded too");
        ctx.check(e.attempted_size() == 2, "attempted size at base");
    }
}

static void test_closure_invalid(TestContext& ctx) {
    ExpressionFactory f;
    ctx.check_throws<InvalidArgumentError>([&] { build_attractor(f, "X", -1, 10); },
                                           "negative depth");
    ctx.check_throws<InvalidArgumentError>([&] { build_attractor(f, "X", 1, 0); },
                                           "zero max_set_size");
    ctx.check_throws<InvalidPredicateError>([&] { build_attractor(f, "", 1, 10); },
                                            "empty name");
    ctx.check_throws<InvalidPredicateError>([&] { build_attractor(f, "not", 1, 10); },
                                            "reserved name");
    ctx.check(f.size() == 0, "no work done for invalid input");
}

static void test_closure_monotone(TestContext& ctx) {
    ExpressionFactory f;
    AttractorResult r = build_attractor(f, "X", 3, 1000);
    ctx.check(r.generations.size() == 4, "four snapshots");
    for (std::size_t g = 1; g < r.generations.size(); ++g) {
        ExprSet cur(r.generations[g]);
        ExprSet prev(r.generations[g - 1]);
        ctx.check(cur.includes(prev), "generation " + std::to_string(g) + " includes predecessor");
        ctx.check(cur.size() > prev.size(), "structural mode keeps growing");
        // Prefix property: earlier snapshot is a prefix of the later one.
        bool prefix = true;
        for (std::size_t i = 0; i < r.generations[g - 1].size(); ++i) {
            prefix = prefix && r.generations[g][i] == r.generations[g - 1][i];
        }
        ctx.check(prefix, "insertion order preserved");
    }
}

static void test_closure_determinism(TestContext& ctx) {
    for (Simplification mode : {Simplification::Structural, Simplification::Lattice}) {
        ExpressionFactory f1(mode);
        ExpressionFactory f2(mode);
        AttractorResult a = build_attractor(f1, "Q", 3, 1000);
        AttractorResult b = build_attractor(f2, "Q", 3, 1000);
        ctx.check(a.generations.size() == b.generations.size(), "same generation count");
        for (std::size_t g = 0; g < a.generations.size() && g < b.generations.size(); ++g) {
            ctx.check(keys_of(a.generations[g], f1) == keys_of(b.generations[g], f2),
                      std::string("identical keys (") + simplification_name(mode) +
                      ") at generation " + std::to_string(g));
        }
        ctx.check(a.converged == b.converged, "same convergence");
    }
}

static void test_closure_lattice_convergence(TestContext& ctx) {
    ExpressionFactory f(Simplification::Lattice);
    AttractorResult r = build_attractor(f, "X", 10, 100);
    ctx.check(r.converged, "lattice closure converges");
    ctx.check(r.steps() == 2, "fixed point at generation 2");
    ctx.check_eq(join(keys_of(r.final_set(), f)), "[X, !X, (!X & X), (!X | X)]",
                 "fixed point contents");
    std::size_t n = r.generations.size();
    ctx.check(n >= 2 && ExprSet(r.generations[n - 1]) == ExprSet(r.generations[n - 2]),
              "converged implies last two snapshots equal");

    // Converges even with the tightest bound that fits the fixed point.
    ExpressionFactory g(Simplification::Lattice);
    ctx.check(build_attractor(g, "X", 50, 4).converged, "fits in max_set_size 4");
}

// Candidates of one more expansion step from the final set that are not
// already members.
static std::size_t fresh_after_step(const AttractorResult& r, ExpressionFactory& f) {
    ExprSet members(r.final_set());
    ExprId p = canonicalize(f.make_atom(r.seed), f);
    ExprId np = negate(p, f);
    std::size_t fresh = 0;
    auto note = [&](ExprId id) {
        if (!members.contains(id)) ++fresh;
    };
    for (ExprId a : r.final_set()) {
        for (ExprId b : {p, np}) {
            note(conjoin(a, b, f));
            note(disjoin(a, b, f));
        }
        note(negate(a, f));
    }
    return fresh;
}

static void test_closure_fixed_point_closed(TestContext& ctx) {
    ExpressionFactory f(Simplification::Lattice);
    AttractorResult r = build_attractor(f, "X", 10, 100);
    ctx.check(r.converged, "converged");
    ctx.check(fresh_after_step(r, f) == 0, "one more step adds nothing");

    ExpressionFactory g(Simplification::Lattice);
    ClosureEngine engine(g);
    AttractorResult neg = engine.build(Predicate("X").negation(), 10, 100);
    ctx.check(neg.converged && fresh_after_step(neg, g) == 0,
              "negated seed fixed point is closed");

    // A structural run stopped by max_depth is not closed.
    ExpressionFactory h;
    AttractorResult open = build_attractor(h, "X", 2, 1000);
    ctx.check(!open.converged, "structural run not converged");
    ctx.check(fresh_after_step(open, h) > 0, "structural set still grows");
}

static void test_closure_stats(TestContext& ctx) {
    ExpressionFactory f;
    ClosureEngine engine(f);
    engine.build(Predicate("X"), 1, 100);
    const ClosureStats& s = engine.statistics();
    ctx.check(s.generations == 1, "generations");
    ctx.check(s.final_size == 8, "final size");
    ctx.check(s.candidates_built == 12, "candidates");
    ctx.check(s.duplicates_skipped == 4, "duplicates");
    ctx.check(s.max_expression_size == 3, "largest expression");
    ctx.check(engine.stats().find("final_size=8") != std::string::npos, "stats string");
}

// ============================================================================
// Oscillator
// ============================================================================

static void test_oscillator(TestContext& ctx) {
    ctx.check(iterate(true, 5) == std::vector<bool>{true, false, true, false, true},
              "iterate(true, 5)");
    ctx.check(iterate(false, 3) == std::vector<bool>{false, true, false},
              "iterate(false, 3)");
    ctx.check(iterate(true, 0).empty(), "zero steps");
    ctx.check_throws<InvalidArgumentError>([] { iterate(true, -1); }, "negative steps");

    Oscillator osc(false);
    ctx.check(!osc.initial(), "initial");
    ctx.check(Oscillator::period() == 2, "period");
    ctx.check(osc.is_stable(), "stable default");
    ctx.check(osc.is_stable(0), "stable with minimum steps");
    ctx.check(osc.at(3) == true && osc.at(4) == false, "at()");
    ctx.check_throws<InvalidArgumentError>([&] { osc.at(-1); }, "negative index");
}

static void test_oscillation_validation(TestContext& ctx) {
    OscillationReport r = validate_oscillation(iterate(false, 6));
    ctx.check(r.classification == Periodicity::Periodic, "periodic");
    ctx.check(r.period && *r.period == 2, "period 2");
    ctx.check(r.passed(), "passes");
    ctx.check(r.length == 6, "length");
    ctx.check(r.entropy_bits == 1.0, "entropy 1 bit");

    OscillationReport one = validate_oscillation({true});
    ctx.check(one.classification == Periodicity::InsufficientData, "insufficient data");
    ctx.check(!one.period.has_value(), "no period");
    ctx.check_eq(periodicity_to_string(one.classification), "insufficient-data", "name");

    OscillationReport flat = validate_oscillation({true, true, true, true});
    ctx.check(flat.period && *flat.period == 1, "constant sequence has period 1");
    ctx.check(!flat.passed(), "period 1 fails");
    ctx.check(check_failed(flat.checks, "oscillation_period"), "failed entry recorded");
    ctx.check(flat.entropy_bits == 0.0, "constant sequence entropy");

    OscillationReport odd = validate_oscillation({true, false, false, true, false, false});
    ctx.check(odd.period && *odd.period == 3, "period 3");
    ctx.check(!odd.passed(), "period 3 fails");

    std::vector<bool> spike(10000, false);
    spike[0] = true;
    OscillationReport single = validate_oscillation(spike);
    ctx.check(single.classification == Periodicity::Periodic, "long sequence classified");
    ctx.check(single.period && *single.period == 10000, "no short period found");
    ctx.check(check_failed(single.checks, "oscillation_period"), "long sequence fails");

    OscillationReport long_ok = validate_oscillation(iterate(true, 9999));
    ctx.check(long_ok.period && *long_ok.period == 2 && long_ok.passed(),
              "long alternating sequence has period 2");
}

static void test_entropy(TestContext& ctx) {
    ctx.check(shannon_entropy({1, 1}) == 1.0, "two equal outcomes");
    ctx.check(shannon_entropy({1, 1, 1, 1}) == 2.0, "four equal outcomes");
    ctx.check(shannon_entropy({4}) == 0.0, "certain outcome");
    ctx.check(shannon_entropy({}) == 0.0, "empty");
    ctx.check(shannon_entropy({0, 0}) == 0.0, "all zero");
    ctx.check(shannon_entropy({3, 0}) == 0.0, "zero counts ignored");
    OscillationReport r = validate_oscillation(iterate(true, 1000));
    ctx.check(r.entropy_bits == 1.0, "oscillator entropy over 1000 steps");
}

// ============================================================================
// Validator
// ============================================================================

static void test_validator_pass(TestContext& ctx) {
    ExpressionFactory f;
    AttractorResult r = build_attractor(f, "X", 2, 1000);
    ValidationReport rep = validate(f, r, Predicate("X"));
    ctx.check(rep.passed(), "structural attractor passes");
    ctx.check(rep.contradiction_present, "contradiction present");
    ctx.check(rep.tautology_present, "tautology present");
    ctx.check(rep.base_predicate_present && rep.base_negation_present, "base present");
    ctx.check(rep.converged_consistent, "convergence consistent");
    ctx.check(rep.monotone, "monotone");
    ctx.check(rep.entropy_bits == 1.0, "entropy 1 bit");
    ctx.check(rep.entropy_conserved, "entropy conserved");
    ctx.check(rep.total_expressions == r.final_set().size(), "total expressions");
    ctx.check(rep.generations == 3, "generations");
    ctx.check(rep.simplification == Simplification::Structural, "structural mode recorded");
    ctx.check(rep.census.has_value(), "census computed");
    if (rep.census) {
        ctx.check(rep.census->total() == r.final_set().size(), "census covers final set");
        ctx.check(rep.census->contradictions >= 1, "census finds contradictions");
        ctx.check(rep.census->tautologies >= 1, "census finds tautologies");
        ctx.check(rep.census->contingent >= 2, "X and !X are contingent");
        ctx.check(rep.census->unknown == 0, "no unknowns");
    }
    ctx.check(!check_failed(rep.checks, "z3_contradiction_unsat"), "z3 contradiction");
    ctx.check(!check_failed(rep.checks, "z3_tautology_valid"), "z3 tautology");
}

static void test_validator_lattice(TestContext& ctx) {
    ExpressionFactory f(Simplification::Lattice);
    AttractorResult r = build_attractor(f, "X", 10, 100);
    ValidatorOptions opts;
    opts.num_threads = 2;
    ValidationReport rep = validate(f, r, Predicate("X"), opts);
    ctx.check(rep.passed(), "lattice attractor passes");
    ctx.check(rep.converged && rep.converged_consistent, "converged and consistent");
    ctx.check(rep.simplification == Simplification::Lattice, "lattice mode recorded");
    ctx.check(rep.census && rep.census->contradictions == 1 &&
              rep.census->tautologies == 1 && rep.census->contingent == 2,
              "census of the fixed point");
}

static void test_validator_census_threads(TestContext& ctx) {
    ExpressionFactory f;
    AttractorResult r = build_attractor(f, "X", 2, 1000);
    ValidatorOptions serial;
    serial.num_threads = 1;
    ValidatorOptions parallel;
    parallel.num_threads = 4;

    ValidationReport a = validate(f, r, Predicate("X"), serial);
    ValidationReport b = validate(f, r, Predicate("X"), parallel);
    ctx.check(a.census && b.census, "both censuses computed");
    if (a.census && b.census) {
        ctx.check(b.census->total() == r.final_set().size(), "every expression classified");
        ctx.check(b.census->unknown == 0, "no unknowns with four threads");
        ctx.check(a.census->contradictions == b.census->contradictions &&
                  a.census->tautologies == b.census->tautologies &&
                  a.census->contingent == b.census->contingent,
                  "thread count does not change the census");
    }
    ctx.check(b.passed(), "parallel run passes");
}

static void test_validator_failures(TestContext& ctx) {
    ExpressionFactory f;
    ExprId x = canonicalize(f.make_atom(Predicate("X")), f);
    ExprId nx = negate(x, f);

    // Shrinking, claims convergence, no contradiction.
    AttractorResult bad(Predicate("X"), 1, 10);
    bad.generations = {{x, nx}, {x}};
    bad.converged = true;

    ValidationReport rep = validate(f, bad, Predicate("X"), ValidatorOptions{false, 0, false});
    ctx.check(!rep.passed(), "report fails");
    ctx.check(check_failed(rep.checks, "contradiction_present"), "missing contradiction");
    ctx.check(check_failed(rep.checks, "converged_consistent"), "inconsistent convergence");
    ctx.check(check_failed(rep.checks, "monotone"), "not monotone");
    ctx.check(check_failed(rep.checks, "entropy_conserved"), "entropy not conserved");
    ctx.check(check_failed(rep.checks, "base_present"), "base missing");
    ctx.check(!rep.census.has_value(), "census disabled");
    ctx.check(!check_failed(rep.checks, "z3_contradiction_unsat"), "z3 check still passes");

    AttractorResult empty(Predicate("X"), 1, 10);
    ctx.check_throws<InvalidArgumentError>([&] { validate(f, empty, Predicate("X")); },
                                           "no generations");
    ctx.check_throws<InvalidArgumentError>([&] { empty.final_set(); },
                                           "final_set of empty result");
}

static void test_validator_depth0(TestContext& ctx) {
    ExpressionFactory f;
    AttractorResult r = build_attractor(f, "X", 0, 10);
    ValidationReport rep = validate(f, r, Predicate("X"), ValidatorOptions{false, 0, false});
    ctx.check(!rep.contradiction_present, "no contradiction at depth 0");
    ctx.check(!rep.passed(), "depth 0 fails validation");
    ctx.check(rep.converged_consistent, "single snapshot is consistent");
    ctx.check(rep.entropy_conserved && rep.entropy_bits == 1.0, "entropy at depth 0");
}

// ============================================================================
// Z3
// ============================================================================

static void test_z3_checker(TestContext& ctx) {
    ExpressionFactory f;
    ExprId contradiction = parse_expression("X & !X", f);
    ExprId tautology = parse_expression("!X | X", f);
    ExprId contingent = parse_expression("X & Y", f);
    ExprId x = parse_expression("X", f);
    ExprId nx = parse_expression("!X", f);

    Z3Checker checker(f);
    ctx.check(checker.classify(contradiction) == SemanticClass::Contradiction, "contradiction");
    ctx.check(checker.classify(tautology) == SemanticClass::Tautology, "tautology");
    ctx.check(checker.classify(contingent) == SemanticClass::Contingent, "contingent");
    ctx.check(checker.classify(negate(tautology, f)) == SemanticClass::Contradiction,
              "negated tautology");

    ctx.check(checker.check_expression(contradiction) == Z3Result::UNSAT, "scoped unsat");
    ctx.check(checker.check() == Z3Result::SAT, "scope popped");

    checker.add_expression(x);
    ctx.check(checker.check_expression(nx) == Z3Result::UNSAT, "X and !X");
    ctx.check(checker.check() == Z3Result::SAT, "X alone");
    ctx.check(checker.get_model().find("X = true") != std::string::npos, "model");

    checker.add_expression(nx);
    ctx.check(checker.check() == Z3Result::UNSAT, "asserted contradiction");
    ctx.check_eq(checker.get_model(), "(no model available)", "no model");
    checker.reset();
    ctx.check(checker.check() == Z3Result::SAT, "reset");
    ctx.check_eq(z3_result_name(Z3Result::UNSAT), "unsat", "result name");
}

// ============================================================================
// Report I/O
// ============================================================================

static void test_report_text_roundtrip(TestContext& ctx) {
    for (Simplification mode : {Simplification::Structural, Simplification::Lattice}) {
        ExpressionFactory f(mode);
        AttractorResult r = build_attractor(f, "Phi", 2, 1000);
        std::ostringstream oss;
        write_attractor_text(oss, r, f);

        ExpressionFactory g(mode);
        AttractorResult back = read_attractor_text(split_lines(oss.str()), g);
        const std::string m = simplification_name(mode);
        ctx.check(back.seed == r.seed, "seed (" + m + ")");
        ctx.check(back.max_depth == r.max_depth, "max_depth (" + m + ")");
        ctx.check(back.max_set_size == r.max_set_size, "max_set_size (" + m + ")");
        ctx.check(back.converged == r.converged, "converged (" + m + ")");
        ctx.check(back.generations.size() == r.generations.size(), "generations (" + m + ")");
        for (std::size_t i = 0; i < r.generations.size() && i < back.generations.size(); ++i) {
            ctx.check(keys_of(back.generations[i], g) == keys_of(r.generations[i], f),
                      "keys at generation " + std::to_string(i) + " (" + m + ")");
        }
    }
}

static void test_report_text_errors(TestContext& ctx) {
    ExpressionFactory f;
    auto expect_error = [&](const std::vector<std::string>& lines,
                            const std::string& fragment, const std::string& what) {
        try {
            read_attractor_text(lines, f);
            ctx.check(false, what + ": expected error");
        } catch (const std::runtime_error& e) {
            std::string msg = e.what();
            ctx.check(msg.find("ERROR") != std::string::npos &&
                      msg.find(fragment) != std::string::npos,
                      what + ": got '" + msg + "'");
        }
    };

    const std::vector<std::string> header = {
        "seed X", "max_depth 1", "max_set_size 10", "converged false"
    };
    auto with = [&](std::vector<std::string> body) {
        std::vector<std::string> lines = header;
        lines.insert(lines.end(), body.begin(), body.end());
        return lines;
    };

    expect_error({"max_depth 1", "max_set_size 10", "generation 0", "X"},
                 "generation before seed", "missing seed");
    expect_error({"max_depth 1", "max_set_size 10"}, "missing seed", "seed never given");
    expect_error(with({"generation 0", "X", "!X", "generation 2", "X"}),
                 "expected generation 1", "numbering gap");
    expect_error(with({"generation 0", "(X & !X)"}), "non-canonical", "non-canonical key");
    expect_error(with({"generation 0", "X", "X"}), "duplicate", "duplicate key");
    expect_error({"seed X", "colour red"}, "unknown directive", "unknown directive");
    expect_error({"seed and"}, "reserved name", "invalid seed");
    expect_error({"seed X", "simplification lattice"}, "lattice", "mode mismatch");
    expect_error(with({}), "no generations", "empty body");
    expect_error({"seed X", "max_depth two"}, "expects an integer", "bad number");

    // Bad predicate names keep their type and gain the line number.
    ctx.check_throws<InvalidPredicateError>([&] { read_attractor_text({"seed and"}, f); },
                                            "invalid seed type");
    try {
        read_attractor_text(with({"generation 0", "X", "or"}), f);
        ctx.check(false, "reserved key: expected error");
    } catch (const InvalidPredicateError& e) {
        ctx.check(e.line() == 7, "reserved key line");
        ctx.check_eq(e.name(), "or", "reserved key name");
        ctx.check(std::string(e.what()).starts_with("7: ERROR: invalid predicate 'or'"),
                  std::string("reserved key message: ") + e.what());
    }
    try {
        read_attractor_text({"# header", "seed !not"}, f);
        ctx.check(false, "negated reserved seed: expected error");
    } catch (const InvalidPredicateError& e) {
        ctx.check(e.line() == 2 && e.reason() == "reserved name", "seed line and reason");
    }

    // Comments and blank lines are ignored, keys re-parse through the lexer.
    AttractorResult ok = read_attractor_text(
        with({"# comment", "", "generation 0", "X", "!X  # trailing"}), f);
    ctx.check(ok.generations.size() == 1 && ok.generations[0].size() == 2,
              "comments ignored");
}

static void test_report_json(TestContext& ctx) {
    ExpressionFactory f;
    AttractorResult r = build_attractor(f, "X", 1, 100);
    std::string json = attractor_to_json(r, f);
    ctx.check(json.find("\"seed\": \"X\"") != std::string::npos, "seed field");
    ctx.check(json.find("\"converged\": false") != std::string::npos, "converged field");
    ctx.check(json.find("\"(!X & X)\"") != std::string::npos, "contradiction key");
    ctx.check(json.find("\"simplification\": \"structural\"") != std::string::npos, "mode");

    ValidationReport rep = validate(f, r, Predicate("X"), ValidatorOptions{false, 0, false});
    std::string rj = report_to_json(rep);
    ctx.check(rj.find("\"passed\": true") != std::string::npos, "report passed");
    ctx.check(rj.find("\"name\": \"monotone\"") != std::string::npos, "check entry");
    ctx.check(rj.find("\"census\"") == std::string::npos, "no census field");
    ctx.check(rj.find("\"simplification\": \"structural\"") != std::string::npos,
              "report mode");

    std::vector<bool> seq = iterate(true, 4);
    std::string oj = oscillation_to_json(seq, validate_oscillation(seq));
    ctx.check(oj.find("\"period\": 2") != std::string::npos, "period");
    ctx.check(oj.find("[true, false, true, false]") != std::string::npos, "sequence");
    std::string none = oscillation_to_json({}, validate_oscillation({}));
    ctx.check(none.find("\"period\": null") != std::string::npos, "null period");
    ctx.check(none.find("\"insufficient-data\"") != std::string::npos, "classification");

    ctx.check_eq(json_escape("a\"b\\c\n"), "a\\\"b\\\\c\\n", "json_escape");
}

// ============================================================================
// Utilities / CLI
// ============================================================================

static void test_utils(TestContext& ctx) {
    ctx.check_eq(trim("  a b \t"), "a b", "trim");
    ctx.check_eq(strip_comment("X  # note"), "X", "strip_comment");
    ctx.check(is_blank_or_comment("   # only"), "comment line");
    auto parts = split_first_word("generation   3 ");
    ctx.check_eq(parts.first, "generation", "first word");
    ctx.check_eq(parts.second, "3", "rest");
    ctx.check(parse_int("-12", "n") == -12, "parse_int");
    ctx.check_throws<std::runtime_error>([] { parse_int("12x", "n"); }, "trailing garbage");
    ctx.check_throws<std::runtime_error>([] { parse_int("99999999999", "n"); }, "overflow");
    ctx.check(parse_bool("false", "b") == false, "parse_bool");
    ctx.check_throws<std::runtime_error>([] { parse_bool("yes", "b"); }, "bad bool");
    ctx.check_throws<std::runtime_error>([] { read_lines("/nonexistent/xi/file"); },
                                         "missing file");
}

static void test_cli_args(TestContext& ctx) {
    Options o = args({"xi", "symbolic", "--predicate", "Q", "--depth", "3", "--lattice",
                      "--validate", "--no-census", "-j", "4"});
    ctx.check(o.command == Command::Symbolic, "symbolic command");
    ctx.check_eq(o.predicate, "Q", "predicate");
    ctx.check(o.depth == 3 && o.lattice && o.validate && !o.census, "flags");
    ctx.check(o.num_threads == 4, "threads");

    Options d = args({"xi", "symbolic"});
    ctx.check(d.depth == 2 && d.max_size == 1000 && d.predicate == "X", "defaults");

    Options c = args({"xi", "canon", "X & !X"});
    ctx.check(c.command == Command::Canon && c.argument == "X & !X", "canon argument");

    Options osc = args({"xi", "oscillate", "--steps", "6", "--initial", "false"});
    ctx.check(osc.steps == 6 && !osc.initial, "oscillate options");

    ctx.check(args({"xi", "--selftest"}).selftest, "selftest");
    ctx.check(args({"xi", "--help"}).help, "help");

    ctx.check_throws<std::runtime_error>([] { args({"xi"}); }, "no command");
    ctx.check_throws<std::runtime_error>([] { args({"xi", "frobnicate"}); }, "unknown command");
    ctx.check_throws<std::runtime_error>([] { args({"xi", "symbolic", "--bogus"}); },
                                         "unknown option");
    ctx.check_throws<std::runtime_error>([] { args({"xi", "symbolic", "--depth", "-1"}); },
                                         "negative depth");
    ctx.check_throws<std::runtime_error>([] { args({"xi", "symbolic", "--depth"}); },
                                         "missing value");
    ctx.check_throws<std::runtime_error>([] { args({"xi", "load"}); }, "load without file");
    ctx.check_throws<std::runtime_error>([] { args({"xi", "symbolic", "extra"}); },
                                         "stray argument");
    ctx.check_eq(command_name(Command::Verify), "verify", "command_name");
}

// ============================================================================
// Verification suite
// ============================================================================

static void test_verification_suite(TestContext& ctx) {
    std::vector<CheckEntry> checks = run_verification("X", 3, 1000);
    ctx.check(all_passed(checks), "verification passes");
    ctx.check(checks.size() == 6, "three depths, lattice, period, entropy");
    const CheckEntry* lattice = find_check(checks, "lattice_convergence");
    ctx.check(lattice != nullptr &&
              lattice->detail.find("generation 2") != std::string::npos,
              "convergence depth reported");

    std::vector<CheckEntry> tight = run_verification("X", 2, 4);
    ctx.check(!all_passed(tight), "tight bound fails");
    ctx.check(check_failed(tight, "contradiction_depth_1"), "depth limit recorded");
    ctx.check(!check_failed(tight, "lattice_convergence"), "lattice still converges");

    ctx.check_throws<InvalidArgumentError>([] { run_verification("X", 0, 10); },
                                           "depth 0");
    ctx.check_throws<InvalidPredicateError>([] { run_verification("or", 1, 10); },
                                            "bad seed");
}

// ============================================================================
// run_selftests
// ============================================================================

int run_selftests() {
    TestRunner runner;

    // Lexer / parser
    runner.run("lexer_tokens",                 test_lexer_tokens);
    runner.run("lexer_errors",                 test_lexer_errors);
    runner.run("parse_structure",              test_parse_structure);
    runner.run("parse_errors",                 test_parse_errors);

    // Predicates
    runner.run("predicate",                    test_predicate);
    runner.run("predicate_invalid",            test_predicate_invalid);

    // Canonicalization
    runner.run("factory",                      test_factory);
    runner.run("canonical_structural",         test_canonical_structural);
    runner.run("canonical_lattice",            test_canonical_lattice);
    runner.run("canonical_idempotent",         test_canonical_idempotent);
    runner.run("double_negation",              test_double_negation);
    runner.run("commutativity",                test_commutativity);

    // Closure
    runner.run("closure_base",                 test_closure_base);
    runner.run("closure_depth1",               test_closure_depth1);
    runner.run("closure_negated_seed",         test_closure_negated_seed);
    runner.run("closure_set_limit",            test_closure_set_limit);
    runner.run("closure_invalid",              test_closure_invalid);
    runner.run("closure_monotone",             test_closure_monotone);
    runner.run("closure_determinism",          test_closure_determinism);
    runner.run("closure_lattice_convergence",  test_closure_lattice_convergence);
    runner.run("closure_fixed_point_closed",   test_closure_fixed_point_closed);
    runner.run("closure_stats",                test_closure_stats);

    // Oscillator
    runner.run("oscillator",                   test_oscillator);
    runner.run("oscillation_validation",       test_oscillation_validation);
    runner.run("entropy",                      test_entropy);

    // Validator
    runner.run("validator_pass",               test_validator_pass);
    runner.run("validator_lattice",            test_validator_lattice);
    runner.run("validator_census_threads",     test_validator_census_threads);
    runner.run("validator_failures",           test_validator_failures);
    runner.run("validator_depth0",             test_validator_depth0);
    runner.run("z3_checker",                   test_z3_checker);

    // Report I/O
    runner.run("report_text_roundtrip",        test_report_text_roundtrip);
    runner.run("report_text_errors",           test_report_text_errors);
    runner.run("report_json",                  test_report_json);

    // Utilities / CLI
    runner.run("utils",                        test_utils);
    runner.run("cli_args",                     test_cli_args);

    // End-to-end
    runner.run("verification_suite",           test_verification_suite);

    return runner.summarise();
}

}  // namespace xi
