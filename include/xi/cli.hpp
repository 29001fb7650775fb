// ============================================================================
// xi/cli.hpp — Command-line interface handling
// ============================================================================
//
// Parses argv into a structured Options object and dispatches to one of
// the commands: symbolic, oscillate, canon, load, verify.
//
// ============================================================================

#ifndef XI_CLI_HPP
#define XI_CLI_HPP

#include <string>

namespace xi {

// ── Command ─────────────────────────────────────────────────────────────────

enum class Command {
    None,
    Symbolic,    // build (and optionally validate) an attractor
    Oscillate,   // print an oscillator sequence
    Canon,       // canonical key of one expression
    Load,        // read a saved attractor
    Verify       // run the verification suite
};

const char* command_name(Command c) noexcept;

// ── Options ─────────────────────────────────────────────────────────────────

struct Options {
    Command     command = Command::None;
    std::string argument;          // expression for canon, path for load
    std::string predicate = "X";
    int         depth = 2;
    int         max_size = 1000;
    int         steps = 10;
    bool        initial = true;
    bool        lattice = false;
    bool        validate = false;
    bool        census = true;
    bool        verbose = false;
    bool        show_stats = false;
    bool        json = false;
    std::string output;            // file to write results to (empty = none)
    int         num_threads = 0;   // OpenMP threads for the census (0 = default)
    bool        selftest = false;
    bool        help = false;
};

/// Parse command-line arguments.  Throws std::runtime_error on bad usage.
Options parse_args(int argc, char* argv[]);

/// Print usage information to stderr.
void print_usage(const char* program_name);

/// Main driver.  Returns the process exit code (0 = ok, 1 = errors or a
/// failed validation).
int run(const Options& opts);

}  // namespace xi

#endif  // XI_CLI_HPP
