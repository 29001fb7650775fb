// ============================================================================
// report.cpp — JSON rendering and attractor text I/O
// ============================================================================

#include "xi/report.hpp"
#include "xi/algebra.hpp"
#include "xi/errors.hpp"
#include "xi/parser.hpp"
#include "xi/utils.hpp"

#include <iomanip>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace xi {

namespace {

void write_key_array(std::ostringstream& oss, const std::vector<ExprId>& ids,
                     const ExpressionFactory& factory) {
    oss << "[";
    bool first = true;
    for (ExprId id : ids) {
        if (!first) oss << ", ";
        oss << "\"" << json_escape(factory.key(id)) << "\"";
        first = false;
    }
    oss << "]";
}

void write_checks(std::ostringstream& oss, const std::vector<CheckEntry>& checks,
                  const std::string& indent) {
    oss << "[";
    bool first = true;
    for (const auto& c : checks) {
        oss << (first ? "\n" : ",\n");
        oss << indent << "  {\"name\": \"" << json_escape(c.name) << "\", "
            << "\"passed\": " << (c.passed ? "true" : "false") << ", "
            << "\"detail\": \"" << json_escape(c.detail) << "\"}";
        first = false;
    }
    if (!first) oss << "\n" << indent;
    oss << "]";
}

const char* bool_str(bool b) { return b ? "true" : "false"; }

[[noreturn]] void load_error(std::size_t line, const std::string& msg) {
    throw std::runtime_error(std::to_string(line) + ": ERROR: " + msg +
                             " at column 1");
}

// Run `fn`, turning any runtime_error into a positioned load error.  Bad
// predicate names keep their type.
template <typename Fn>
auto at_line(std::size_t line, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const InvalidPredicateError& e) {
        throw InvalidPredicateError(e.name(), e.reason(), line);
    } catch (const std::runtime_error& e) {
        load_error(line, e.what());
    }
}

Predicate parse_seed(const std::string& text) {
    if (!text.empty() && text[0] == '!') {
        return Predicate(text.substr(1)).negation();
    }
    return Predicate(text);
}

}  // namespace

// ── JSON ────────────────────────────────────────────────────────────────────

std::string attractor_to_json(const AttractorResult& result,
                              const ExpressionFactory& factory) {
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"seed\": \"" << json_escape(result.seed.to_string()) << "\",\n";
    oss << "  \"simplification\": \""
        << simplification_name(factory.simplification()) << "\",\n";
    oss << "  \"max_depth\": " << result.max_depth << ",\n";
    oss << "  \"max_set_size\": " << result.max_set_size << ",\n";
    oss << "  \"converged\": " << bool_str(result.converged) << ",\n";
    oss << "  \"elapsed_s\": " << std::setprecision(6) << result.elapsed_s << ",\n";
    oss << "  \"generations\": [";
    for (std::size_t g = 0; g < result.generations.size(); ++g) {
        oss << (g == 0 ? "\n    " : ",\n    ");
        write_key_array(oss, result.generations[g], factory);
    }
    if (!result.generations.empty()) oss << "\n  ";
    oss << "],\n";
    oss << "  \"final_set\": ";
    if (result.generations.empty()) {
        oss << "[]";
    } else {
        write_key_array(oss, result.generations.back(), factory);
    }
    oss << "\n}\n";
    return oss.str();
}

std::string report_to_json(const ValidationReport& report) {
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"seed\": \"" << json_escape(report.seed) << "\",\n";
    oss << "  \"max_depth\": " << report.max_depth << ",\n";
    oss << "  \"max_set_size\": " << report.max_set_size << ",\n";
    oss << "  \"simplification\": \"" << simplification_name(report.simplification) << "\",\n";
    oss << "  \"generations\": " << report.generations << ",\n";
    oss << "  \"total_expressions\": " << report.total_expressions << ",\n";
    oss << "  \"contradiction_present\": " << bool_str(report.contradiction_present) << ",\n";
    oss << "  \"tautology_present\": " << bool_str(report.tautology_present) << ",\n";
    oss << "  \"base_predicate_present\": " << bool_str(report.base_predicate_present) << ",\n";
    oss << "  \"base_negation_present\": " << bool_str(report.base_negation_present) << ",\n";
    oss << "  \"converged\": " << bool_str(report.converged) << ",\n";
    oss << "  \"converged_consistent\": " << bool_str(report.converged_consistent) << ",\n";
    oss << "  \"monotone\": " << bool_str(report.monotone) << ",\n";
    oss << "  \"entropy_bits\": " << report.entropy_bits << ",\n";
    oss << "  \"entropy_conserved\": " << bool_str(report.entropy_conserved) << ",\n";
    if (report.census) {
        const SemanticCensus& c = *report.census;
        oss << "  \"census\": {\"contradictions\": " << c.contradictions
            << ", \"tautologies\": " << c.tautologies
            << ", \"contingent\": " << c.contingent
            << ", \"unknown\": " << c.unknown << "},\n";
    }
    oss << "  \"passed\": " << bool_str(report.passed()) << ",\n";
    oss << "  \"checks\": ";
    write_checks(oss, report.checks, "  ");
    oss << "\n}\n";
    return oss.str();
}

std::string oscillation_to_json(const std::vector<bool>& sequence,
                                const OscillationReport& report) {
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"length\": " << report.length << ",\n";
    oss << "  \"sequence\": [";
    for (std::size_t i = 0; i < sequence.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << bool_str(sequence[i]);
    }
    oss << "],\n";
    oss << "  \"classification\": \""
        << periodicity_to_string(report.classification) << "\",\n";
    oss << "  \"period\": ";
    if (report.period) {
        oss << *report.period;
    } else {
        oss << "null";
    }
    oss << ",\n";
    oss << "  \"entropy_bits\": " << report.entropy_bits << ",\n";
    oss << "  \"passed\": " << bool_str(report.passed()) << ",\n";
    oss << "  \"checks\": ";
    write_checks(oss, report.checks, "  ");
    oss << "\n}\n";
    return oss.str();
}

std::string checks_to_json(const std::vector<CheckEntry>& checks) {
    std::ostringstream oss;
    oss << "{\n  \"passed\": " << bool_str(all_passed(checks)) << ",\n";
    oss << "  \"checks\": ";
    write_checks(oss, checks, "  ");
    oss << "\n}\n";
    return oss.str();
}

// ── Text format ─────────────────────────────────────────────────────────────

void write_attractor_text(std::ostream& out, const AttractorResult& result,
                          const ExpressionFactory& factory) {
    out << "# xi attractor\n";
    out << "seed " << result.seed.to_string() << "\n";
    out << "simplification " << simplification_name(factory.simplification()) << "\n";
    out << "max_depth " << result.max_depth << "\n";
    out << "max_set_size " << result.max_set_size << "\n";
    out << "converged " << bool_str(result.converged) << "\n";
    for (std::size_t g = 0; g < result.generations.size(); ++g) {
        out << "generation " << g << "\n";
        for (ExprId id : result.generations[g]) {
            out << factory.key(id) << "\n";
        }
    }
}

AttractorResult read_attractor_text(const std::vector<std::string>& lines,
                                    ExpressionFactory& factory) {
    std::optional<Predicate> seed;
    int  max_depth = 0;
    int  max_set_size = 0;
    bool converged = false;
    bool seen_max_depth = false;
    bool seen_max_set_size = false;

    std::vector<std::vector<ExprId>> generations;
    std::unordered_set<ExprId> in_snapshot;

    for (std::size_t i = 0; i < lines.size(); ++i) {
        const std::size_t line_no = i + 1;
        std::string content = strip_comment(lines[i]);
        if (content.empty()) continue;

        const auto parts = split_first_word(content);
        const std::string& word = parts.first;
        const std::string& arg = parts.second;

        if (word == "generation" && !arg.empty()) {
            int n = at_line(line_no, [&] { return parse_int(arg, "generation"); });
            if (n != static_cast<int>(generations.size())) {
                load_error(line_no, "expected generation " +
                           std::to_string(generations.size()) + ", found " + arg);
            }
            if (!seed) {
                load_error(line_no, "generation before seed");
            }
            generations.emplace_back();
            in_snapshot.clear();
            continue;
        }

        if (generations.empty()) {
            // Header directives.
            if (word == "seed") {
                seed = at_line(line_no, [&] { return parse_seed(arg); });
            } else if (word == "simplification") {
                if (arg != simplification_name(factory.simplification())) {
                    load_error(line_no, "attractor was built in " + arg +
                               " mode, factory is " +
                               simplification_name(factory.simplification()));
                }
            } else if (word == "max_depth") {
                max_depth = at_line(line_no, [&] { return parse_int(arg, "max_depth"); });
                seen_max_depth = true;
            } else if (word == "max_set_size") {
                max_set_size =
                    at_line(line_no, [&] { return parse_int(arg, "max_set_size"); });
                seen_max_set_size = true;
            } else if (word == "converged") {
                converged = at_line(line_no, [&] { return parse_bool(arg, "converged"); });
            } else {
                load_error(line_no, "unknown directive '" + word + "'");
            }
            continue;
        }

        // Expression key inside a generation block.  Syntax errors from the
        // parser already carry the position.
        ExprId parsed = kInvalidId;
        try {
            parsed = parse_expression(content, factory,
                                      static_cast<std::uint32_t>(line_no));
        } catch (const InvalidPredicateError& e) {
            throw InvalidPredicateError(e.name(), e.reason(), line_no);
        }
        ExprId canon = canonicalize(parsed, factory);
        if (factory.key(canon) != content) {
            load_error(line_no, "non-canonical key '" + content +
                       "' (canonical form is '" + factory.key(canon) + "')");
        }
        if (!in_snapshot.insert(canon).second) {
            load_error(line_no, "duplicate key '" + content + "' in generation " +
                       std::to_string(generations.size() - 1));
        }
        generations.back().push_back(canon);
    }

    const std::size_t last_line = lines.empty() ? 1 : lines.size();
    if (!seed) {
        load_error(last_line, "missing seed directive");
    }
    if (!seen_max_depth || !seen_max_set_size) {
        load_error(last_line, "missing max_depth or max_set_size directive");
    }
    if (max_depth < 0 || max_set_size <= 0) {
        load_error(last_line, "invalid bounds max_depth " + std::to_string(max_depth) +
                   ", max_set_size " + std::to_string(max_set_size));
    }
    if (generations.empty()) {
        load_error(last_line, "no generations");
    }

    AttractorResult result(*seed, static_cast<std::uint32_t>(max_depth),
                           static_cast<std::size_t>(max_set_size));
    result.generations = std::move(generations);
    result.converged = converged;
    return result;
}

void save_attractor(const std::string& path, const AttractorResult& result,
                    const ExpressionFactory& factory) {
    std::ostringstream oss;
    write_attractor_text(oss, result, factory);
    write_text_file(path, oss.str());
}

AttractorResult load_attractor(const std::string& path,
                               ExpressionFactory& factory) {
    return read_attractor_text(read_lines(path), factory);
}

}  // namespace xi
