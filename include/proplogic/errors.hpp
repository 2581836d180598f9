// ============================================================================
// proplogic/errors.hpp — Error types
// ============================================================================
//
// All errors derive from std::runtime_error, so a driver can report any of
// them through a single catch of std::exception.
//
//   SyntaxError           malformed formula text (offset, line, column)
//   InvalidAtomNameError  rejected identifier at construction time
//   UnboundAtomError      a boolean was requested from a residual formula
//
// ============================================================================

#ifndef PROPLOGIC_ERRORS_HPP
#define PROPLOGIC_ERRORS_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace proplogic {

// ── SyntaxError ─────────────────────────────────────────────────────────────
// what() has the format: <line>: ERROR: <reason> at column <n>

class SyntaxError : public std::runtime_error {
public:
    SyntaxError(std::string reason, std::size_t offset,
                std::uint32_t line, std::uint32_t column);

    const std::string& reason() const noexcept { return reason_; }

    /// 0-based byte offset of the offending character in the input.
    std::size_t offset() const noexcept { return offset_; }

    std::uint32_t line() const noexcept { return line_; }
    std::uint32_t column() const noexcept { return column_; }

private:
    std::string   reason_;
    std::size_t   offset_;
    std::uint32_t line_;
    std::uint32_t column_;
};

// ── InvalidAtomNameError ────────────────────────────────────────────────────

class InvalidAtomNameError : public std::runtime_error {
public:
    explicit InvalidAtomNameError(std::string name);

    const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

// ── UnboundAtomError ────────────────────────────────────────────────────────

class UnboundAtomError : public std::runtime_error {
public:
    explicit UnboundAtomError(std::vector<std::string> atoms);

    const std::vector<std::string>& atoms() const noexcept { return atoms_; }

private:
    std::vector<std::string> atoms_;
};

}  // namespace proplogic

#endif  // PROPLOGIC_ERRORS_HPP
