// ============================================================================
// proplogic/utils.hpp — Utility functions
// ============================================================================

#ifndef PROPLOGIC_UTILS_HPP
#define PROPLOGIC_UTILS_HPP

#include "proplogic/evaluator.hpp"

#include <string>
#include <vector>

namespace proplogic {

// ── File I/O ────────────────────────────────────────────────────────────────

/// Read a text file and return its content as a vector of lines.
/// Throws std::runtime_error if the file cannot be opened.
std::vector<std::string> read_lines(const std::string& path);

// ── String helpers ──────────────────────────────────────────────────────────

/// Trim leading and trailing whitespace from a string.
std::string trim(const std::string& s);

/// Strip an inline comment (everything from the first '#' onward).
/// Returns the portion before '#', trimmed.
std::string strip_comment(const std::string& line);

/// Return true if the line is empty or consists only of whitespace
/// (after comment stripping).
bool is_blank_or_comment(const std::string& line);

/// Split on `sep`, trimming each piece.  Empty pieces are kept.
std::vector<std::string> split(const std::string& s, char sep);

// ── Assignments ─────────────────────────────────────────────────────────────

/// Parse "P=1, Q=false, R=T" into an Interpretation.  Accepted values:
/// 1/0, true/false, T/F.  Throws std::runtime_error on malformed input and
/// InvalidAtomNameError on a bad atom name.
Interpretation parse_assignment(const std::string& text);

}  // namespace proplogic

#endif  // PROPLOGIC_UTILS_HPP
