// ============================================================================
// cli.cpp — Command-line interface and main driver
// ============================================================================

#include "xi/cli.hpp"
#include "xi/algebra.hpp"
#include "xi/ast.hpp"
#include "xi/closure.hpp"
#include "xi/errors.hpp"
#include "xi/oscillator.hpp"
#include "xi/parser.hpp"
#include "xi/report.hpp"
#include "xi/test.hpp"
#include "xi/utils.hpp"
#include "xi/validator.hpp"

#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace xi {

const char* command_name(Command c) noexcept {
    switch (c) {
        case Command::None:      return "none";
        case Command::Symbolic:  return "symbolic";
        case Command::Oscillate: return "oscillate";
        case Command::Canon:     return "canon";
        case Command::Load:      return "load";
        case Command::Verify:    return "verify";
    }
    return "?";
}

// ── parse_args ──────────────────────────────────────────────────────────────

namespace {

Command command_from(const std::string& word) {
    if (word == "symbolic")  return Command::Symbolic;
    if (word == "oscillate") return Command::Oscillate;
    if (word == "canon")     return Command::Canon;
    if (word == "load")      return Command::Load;
    if (word == "verify")    return Command::Verify;
    throw std::runtime_error("unknown command: " + word);
}

// Value of the option at argv[i], advancing i.
std::string option_value(int argc, char* argv[], int& i, const std::string& opt,
                         const char* what) {
    if (i + 1 >= argc) {
        throw std::runtime_error(opt + " requires " + what);
    }
    return argv[++i];
}

}  // namespace

Options parse_args(int argc, char* argv[]) {
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--selftest") {
            opts.selftest = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--predicate" || arg == "-p") {
            opts.predicate = option_value(argc, argv, i, arg, "a predicate name");
        } else if (arg == "--depth" || arg == "-d") {
            opts.depth = parse_int(option_value(argc, argv, i, arg, "a number"), arg);
            if (opts.depth < 0) {
                throw std::runtime_error("--depth must be >= 0");
            }
        } else if (arg == "--max-size") {
            opts.max_size = parse_int(option_value(argc, argv, i, arg, "a number"), arg);
            if (opts.max_size <= 0) {
                throw std::runtime_error("--max-size must be > 0");
            }
        } else if (arg == "--steps") {
            opts.steps = parse_int(option_value(argc, argv, i, arg, "a number"), arg);
            if (opts.steps < 0) {
                throw std::runtime_error("--steps must be >= 0");
            }
        } else if (arg == "--initial") {
            opts.initial = parse_bool(option_value(argc, argv, i, arg, "true or false"), arg);
        } else if (arg == "--lattice") {
            opts.lattice = true;
        } else if (arg == "--validate") {
            opts.validate = true;
        } else if (arg == "--no-census") {
            opts.census = false;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--stats") {
            opts.show_stats = true;
        } else if (arg == "--json") {
            opts.json = true;
        } else if (arg == "--output" || arg == "-o") {
            opts.output = option_value(argc, argv, i, arg, "a file argument");
        } else if (arg == "--threads" || arg == "-j") {
            opts.num_threads = parse_int(option_value(argc, argv, i, arg, "a number"), arg);
            if (opts.num_threads < 0) {
                throw std::runtime_error("--threads must be >= 0");
            }
        } else if (arg.starts_with("--")) {
            throw std::runtime_error("unknown option: " + arg);
        } else if (opts.command == Command::None) {
            opts.command = command_from(arg);
        } else if (opts.argument.empty() &&
                   (opts.command == Command::Canon || opts.command == Command::Load)) {
            opts.argument = arg;
        } else {
            throw std::runtime_error("unexpected argument: " + arg);
        }
    }

    if (!opts.selftest && !opts.help) {
        if (opts.command == Command::None) {
            throw std::runtime_error("no command specified (use --help for usage)");
        }
        if (opts.command == Command::Canon && opts.argument.empty()) {
            throw std::runtime_error("canon requires an expression argument");
        }
        if (opts.command == Command::Load && opts.argument.empty()) {
            throw std::runtime_error("load requires a file argument");
        }
        if (opts.command == Command::Verify && opts.depth < 1) {
            throw std::runtime_error("verify requires --depth >= 1");
        }
    }

    return opts;
}

// ── print_usage ─────────────────────────────────────────────────────────────

void print_usage(const char* program_name) {
    std::cerr
        << "Usage: " << program_name << " <command> [OPTIONS]\n"
        << "       " << program_name << " --selftest\n"
        << "\n"
        << "Xi attractor: closure of a predicate under negation, conjunction\n"
        << "and disjunction with its base set.\n"
        << "\n"
        << "Commands:\n"
        << "  symbolic            Build the attractor of a predicate\n"
        << "  oscillate           Print a two-state oscillator sequence\n"
        << "  canon <expr>        Print the canonical key of an expression\n"
        << "  load <file>         Read an attractor saved with symbolic --output\n"
        << "  verify              Run the verification suite\n"
        << "\n"
        << "Options:\n"
        << "  --predicate X, -p X  Seed predicate (default X)\n"
        << "  --depth N, -d N      Generation bound (default 2)\n"
        << "  --max-size N         Set-size bound (default 1000)\n"
        << "  --lattice            Lattice simplification (idempotence, absorption,\n"
        << "                       De Morgan) instead of structural\n"
        << "  --validate           Validate the attractor\n"
        << "  --no-census          Skip the per-expression Z3 census\n"
        << "  --steps N            Oscillator steps (default 10)\n"
        << "  --initial true|false Oscillator initial state (default true)\n"
        << "  --json               Print results as JSON\n"
        << "  --output F, -o F     Write results to F (.json: JSON, otherwise the\n"
        << "                       attractor text format / CSV for oscillate)\n"
        << "  --verbose, -v        Per-generation diagnostics on stderr\n"
        << "  --stats              Show engine statistics\n"
        << "  --threads N, -j N    OpenMP threads for the census (0 = auto)\n"
        << "  --selftest           Run built-in tests\n"
        << "  --help, -h           Show this message\n";
}

// ── Command handlers ────────────────────────────────────────────────────────

namespace {

Simplification mode_of(const Options& opts) {
    return opts.lattice ? Simplification::Lattice : Simplification::Structural;
}

void print_checks(const std::vector<CheckEntry>& checks) {
    for (const auto& c : checks) {
        std::cout << "  [" << (c.passed ? "PASS" : "FAIL") << "] " << c.name;
        if (!c.detail.empty()) std::cout << ": " << c.detail;
        std::cout << "\n";
    }
}

void print_validation(const ValidationReport& rep) {
    std::cout << "Validation: " << (rep.passed() ? "PASSED" : "FAILED") << "\n";
    std::cout << "Simplification: " << simplification_name(rep.simplification) << "\n";
    std::cout << "Contains contradiction: " << (rep.contradiction_present ? "true" : "false") << "\n";
    std::cout << "Contains tautology: " << (rep.tautology_present ? "true" : "false") << "\n";
    std::cout << "Entropy: " << rep.entropy_bits << " bits"
              << (rep.entropy_conserved ? " (conserved)" : " (NOT conserved)") << "\n";
    if (rep.census) {
        std::cout << "Census: " << rep.census->contradictions << " contradictions, "
                  << rep.census->tautologies << " tautologies, "
                  << rep.census->contingent << " contingent, "
                  << rep.census->unknown << " unknown\n";
    }
    print_checks(rep.checks);
}

// Shared by symbolic and load: print, optionally validate, optionally save.
int report_attractor(const Options& opts, const AttractorResult& result,
                     ExpressionFactory& factory, const ClosureEngine* engine) {
    std::optional<ValidationReport> rep;
    if (opts.validate) {
        ValidatorOptions vopts;
        vopts.semantic_census = opts.census;
        vopts.num_threads = opts.num_threads;
        vopts.verbose = opts.verbose;
        rep = validate(factory, result, result.seed, vopts);
    }

    if (opts.json) {
        std::cout << attractor_to_json(result, factory);
        if (rep) std::cout << report_to_json(*rep);
    } else {
        std::cout << "Xi attractor for '" << result.seed.to_string() << "' at depth "
                  << result.max_depth << " ("
                  << simplification_name(factory.simplification()) << "):\n";
        std::cout << "Total expressions: " << result.final_set().size() << "\n";
        std::cout << "Generations: " << result.steps()
                  << (result.converged ? " (converged)" : "") << "\n";
        if (opts.verbose) {
            std::cout << "\nExpressions:\n";
            const auto& ids = result.final_set();
            for (std::size_t i = 0; i < ids.size(); ++i) {
                std::cout << "  " << (i + 1) << ": " << factory.key(ids[i]) << "\n";
            }
            std::cout << "\n";
        }
        if (rep) print_validation(*rep);
    }

    if (opts.show_stats && engine != nullptr) {
        std::cout << "  Stats: " << engine->stats() << "\n";
    }

    if (!opts.output.empty()) {
        if (opts.output.ends_with(".json")) {
            write_text_file(opts.output, attractor_to_json(result, factory));
        } else {
            save_attractor(opts.output, result, factory);
        }
        std::cerr << "Attractor saved to " << opts.output << "\n";
    }

    return (rep && !rep->passed()) ? 1 : 0;
}

int cmd_symbolic(const Options& opts) {
    ExpressionFactory factory(mode_of(opts));
    Predicate seed(opts.predicate);
    ClosureEngine engine(factory);
    engine.set_verbose(opts.verbose);
    AttractorResult result = engine.build(seed, opts.depth, opts.max_size);
    return report_attractor(opts, result, factory, &engine);
}

int cmd_load(const Options& opts) {
    ExpressionFactory factory(mode_of(opts));
    AttractorResult result = load_attractor(opts.argument, factory);
    return report_attractor(opts, result, factory, nullptr);
}

int cmd_oscillate(const Options& opts) {
    Oscillator osc(opts.initial);
    std::vector<bool> history = osc.iterate(opts.steps);
    OscillationReport rep = validate_oscillation(history);

    if (opts.json) {
        std::cout << oscillation_to_json(history, rep);
    } else {
        std::cout << "Oscillation history:\n";
        for (std::size_t i = 0; i < history.size(); ++i) {
            std::cout << "Step " << i << ": " << (history[i] ? "true" : "false") << "\n";
        }
        std::cout << "Classification: " << periodicity_to_string(rep.classification);
        if (rep.period) std::cout << " (period " << *rep.period << ")";
        std::cout << "\n";
    }

    if (!opts.output.empty()) {
        if (opts.output.ends_with(".json")) {
            write_text_file(opts.output, oscillation_to_json(history, rep));
        } else {
            std::ostringstream csv;
            for (std::size_t i = 0; i < history.size(); ++i) {
                csv << i << "," << (history[i] ? "true" : "false") << "\n";
            }
            write_text_file(opts.output, csv.str());
        }
        std::cerr << "Oscillation history saved to " << opts.output << "\n";
    }
    return rep.passed() ? 0 : 1;
}

int cmd_canon(const Options& opts) {
    ExpressionFactory factory(mode_of(opts));
    ExprId parsed = parse_expression(opts.argument, factory);
    std::cout << canonical_key(parsed, factory) << "\n";
    return 0;
}

int cmd_verify(const Options& opts) {
    std::cerr << "[verify] seed " << opts.predicate << " depth 1.." << opts.depth
              << " max_set_size " << opts.max_size << "\n";
    std::vector<CheckEntry> checks =
        run_verification(opts.predicate, opts.depth, opts.max_size);

    if (opts.json) {
        std::cout << checks_to_json(checks);
    } else {
        std::cout << "Verification Results:\n";
        print_checks(checks);
        std::cout << (all_passed(checks) ? "ALL CHECKS PASSED" : "SOME CHECKS FAILED")
                  << "\n";
    }
    if (!opts.output.empty()) {
        write_text_file(opts.output, checks_to_json(checks));
        std::cerr << "Results saved to " << opts.output << "\n";
    }
    return all_passed(checks) ? 0 : 1;
}

}  // namespace

// ── run ─────────────────────────────────────────────────────────────────────

int run(const Options& opts) {
    if (opts.selftest) {
        return run_selftests();
    }

    try {
        switch (opts.command) {
            case Command::Symbolic:  return cmd_symbolic(opts);
            case Command::Oscillate: return cmd_oscillate(opts);
            case Command::Canon:     return cmd_canon(opts);
            case Command::Load:      return cmd_load(opts);
            case Command::Verify:    return cmd_verify(opts);
            case Command::None:      break;
        }
    } catch (const DepthLimitError& e) {
        std::cerr << "ERROR: " << e.what() << "\n"
                  << "  (raise --max-size, lower --depth, or use --lattice)\n";
        return 1;
    } catch (const std::exception& e) {
        // Parser and loader messages already carry "<line>: ERROR:".
        const std::string msg = e.what();
        if (msg.find(": ERROR: ") == std::string::npos) {
            std::cerr << "ERROR: ";
        }
        std::cerr << msg << "\n";
        return 1;
    }

    std::cerr << "ERROR: no command specified (use --help for usage)\n";
    return 1;
}

}  // namespace xi
