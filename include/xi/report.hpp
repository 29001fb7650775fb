// ============================================================================
// xi/report.hpp — JSON rendering and the attractor text format
// ============================================================================
//
// Text format (one directive or key per line, '#' comments and blank lines
// ignored):
//
//   # xi attractor
//   seed X
//   simplification structural
//   max_depth 3
//   max_set_size 1000
//   converged false
//   generation 0
//   X
//   !X
//   generation 1
//   X
//   !X
//   (X & X)
//   ...
//
// Each "generation <n>" header starts a full (cumulative) snapshot; the
// keys below it are canonical keys in insertion order.  Headers must be
// numbered 0, 1, 2, ... without gaps.  Reading re-parses every key and
// rejects any that is not canonical under the reading factory's
// simplification mode, so a loaded attractor is indistinguishable from a
// freshly built one except for elapsed_s.
//
// Read errors are std::runtime_error formatted like parser errors:
//   <line>: ERROR: <msg> at column <n>
//
// ============================================================================

#ifndef XI_REPORT_HPP
#define XI_REPORT_HPP

#include "xi/ast.hpp"
#include "xi/closure.hpp"
#include "xi/validator.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace xi {

// ── JSON ────────────────────────────────────────────────────────────────────

std::string attractor_to_json(const AttractorResult& result,
                              const ExpressionFactory& factory);

std::string report_to_json(const ValidationReport& report);

std::string oscillation_to_json(const std::vector<bool>& sequence,
                                const OscillationReport& report);

std::string checks_to_json(const std::vector<CheckEntry>& checks);

// ── Text format ─────────────────────────────────────────────────────────────

void write_attractor_text(std::ostream& out, const AttractorResult& result,
                          const ExpressionFactory& factory);

/// Parse the text format.  Keys are interned into `factory`.
AttractorResult read_attractor_text(const std::vector<std::string>& lines,
                                    ExpressionFactory& factory);

void save_attractor(const std::string& path, const AttractorResult& result,
                    const ExpressionFactory& factory);

AttractorResult load_attractor(const std::string& path,
                               ExpressionFactory& factory);

}  // namespace xi

#endif  // XI_REPORT_HPP
