// ============================================================================
// proplogic/parser.hpp — Recursive-descent parser for propositional formulas
// ============================================================================
//
// Grammar (informal, with precedence already encoded):
//
//   formula     ::= iff_expr
//   iff_expr    ::= impl_expr ( ('<->' | '^') impl_expr )*   (left-assoc)
//   impl_expr   ::= or_expr   ( '->'  impl_expr )?           (right-assoc)
//   or_expr     ::= and_expr  ( '|'   and_expr )*            (left-assoc)
//   and_expr    ::= unary     ( '&'   unary )*               (left-assoc)
//   unary       ::= '~' unary
//                  | primary
//   primary     ::= 'true' | 'false' | IDENTIFIER
//                  | '(' formula ')'
//
// Precedence (highest → lowest):
//   1. ~            (unary prefix)
//   2. &            (left-assoc)
//   3. |            (left-assoc)
//   4. ->           (right-assoc)
//   5. <->, ^       (left-assoc, same level)
//
// The connective symbols shown are the ASCII defaults; the actual spellings
// come from the Syntax passed to the Lexer.
//
// ============================================================================

#ifndef PROPLOGIC_PARSER_HPP
#define PROPLOGIC_PARSER_HPP

#include "proplogic/ast.hpp"
#include "proplogic/errors.hpp"
#include "proplogic/lexer.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace proplogic {

// ── ParseResult ─────────────────────────────────────────────────────────────
// Either a formula or the SyntaxError that prevented it.  Parsing is
// all-or-nothing: on error no formula is reported.

struct ParseResult {
    FormulaId                  formula = kInvalidId;
    std::optional<SyntaxError> error;

    bool ok() const noexcept { return !error.has_value(); }
};

// ── Parser ──────────────────────────────────────────────────────────────────
// Takes a Lexer and a FormulaFactory reference.  Parses exactly one formula
// and returns its FormulaId.  Throws SyntaxError on malformed input.

class Parser {
public:
    /// Nesting of parentheses, negations and binary operators (each operator
    /// of a chain adds a level) beyond this depth is rejected.
    static constexpr std::size_t kMaxNesting = 2048;

    Parser(Lexer& lexer, FormulaFactory& factory);

    /// Parse a complete formula (expects Eof after).
    FormulaId parse();

private:
    // ── Recursive-descent methods, one per precedence level ─────────────
    FormulaId parse_formula();
    FormulaId parse_iff();
    FormulaId parse_implies();
    FormulaId parse_or();
    FormulaId parse_and();
    FormulaId parse_unary();
    FormulaId parse_primary();

    // ── Helpers ─────────────────────────────────────────────────────────
    void enter(const Token& tok);
    void leave() noexcept { --depth_; }
    [[noreturn]] void error(const Token& tok, const std::string& msg);

    Lexer&          lex_;
    FormulaFactory& fac_;
    std::size_t     depth_ = 0;
};

// ── Convenience free functions ──────────────────────────────────────────────

/// Parse a single formula from a string.  Throws SyntaxError.
FormulaId parse_formula(std::string_view input, FormulaFactory& factory,
                        const Syntax& syntax = Syntax::standard(),
                        std::uint32_t line = 1);

/// Parse a single formula, returning any SyntaxError as a value.
ParseResult try_parse(std::string_view input, FormulaFactory& factory,
                      const Syntax& syntax = Syntax::standard(),
                      std::uint32_t line = 1);

}  // namespace proplogic

#endif  // PROPLOGIC_PARSER_HPP
