// ============================================================================
// xi/utils.hpp — Utility functions
// ============================================================================

#ifndef XI_UTILS_HPP
#define XI_UTILS_HPP

#include <string>
#include <utility>
#include <vector>

namespace xi {

// ── File I/O ────────────────────────────────────────────────────────────────

/// Read a text file and return its content as a vector of lines.
/// Throws std::runtime_error if the file cannot be opened.
std::vector<std::string> read_lines(const std::string& path);

/// Write `content` to `path`, replacing the file.
/// Throws std::runtime_error if the file cannot be written.
void write_text_file(const std::string& path, const std::string& content);

// ── String helpers ──────────────────────────────────────────────────────────

/// Trim leading and trailing whitespace from a string.
std::string trim(const std::string& s);

/// Strip an inline comment (everything from the first '#' onward).
/// Returns the portion before '#', trimmed.
std::string strip_comment(const std::string& line);

/// Return true if the line is empty or consists only of whitespace
/// (after comment stripping).
bool is_blank_or_comment(const std::string& line);

/// Split "word rest of line" at the first whitespace run.  The second
/// part is trimmed and empty if there is none.
std::pair<std::string, std::string> split_first_word(const std::string& s);

/// Parse a base-10 int, rejecting trailing garbage and overflow.
/// Throws std::runtime_error naming `what` on failure.
int parse_int(const std::string& text, const std::string& what);

/// Parse "true"/"false".  Throws std::runtime_error naming `what`.
bool parse_bool(const std::string& text, const std::string& what);

/// Escape a string for inclusion in a JSON string literal.
std::string json_escape(const std::string& s);

}  // namespace xi

#endif  // XI_UTILS_HPP
