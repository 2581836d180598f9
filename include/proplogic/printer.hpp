// ============================================================================
// proplogic/printer.hpp — Display rendering of formulas
// ============================================================================
//
// format_formula() prints a formula with the fewest parentheses the parser
// needs to read it back, using the connective spellings of a SymbolTable.
// The three presets only use spellings that Syntax::standard() accepts, so
// their output parses back to the same FormulaId:
//
//   preset     ¬     ∧     ∨     →         ↔      ⊕
//   ascii      ~     &     |     ->        <->    ^
//   unicode    ¬     ∧     ∨     →         ↔      ⊕
//   words      not   and   or    implies   iff    xor
//
// The symbol table is display-only; nothing else reads it.
//
// ============================================================================

#ifndef PROPLOGIC_PRINTER_HPP
#define PROPLOGIC_PRINTER_HPP

#include "proplogic/ast.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace proplogic {

// ── SymbolTable ─────────────────────────────────────────────────────────────

struct SymbolTable {
    std::string negation      = "~";
    std::string conjunction   = "&";
    std::string disjunction   = "|";
    std::string implication   = "->";
    std::string biconditional = "<->";
    std::string exclusive_or  = "^";
    std::string truth         = "true";
    std::string falsity       = "false";

    static SymbolTable ascii();
    static SymbolTable unicode();
    static SymbolTable words();

    /// Preset by name ("ascii", "unicode", "words"), nullopt if unknown.
    static std::optional<SymbolTable> by_name(std::string_view name);

    /// Spelling of a connective or constant kind; empty for Atom.
    const std::string& symbol(NodeKind k) const;
};

/// Render `id` with minimal parentheses.
std::string format_formula(const FormulaFactory& f, FormulaId id,
                           const SymbolTable& symbols = SymbolTable::ascii());

}  // namespace proplogic

#endif  // PROPLOGIC_PRINTER_HPP
