// ============================================================================
// proplogic/lexer.hpp — Tokeniser for the formula input language
// ============================================================================
//
// The lexer converts a raw input string into a stream of tokens.  Every
// token carries its source position (byte offset, line, column) so that
// error messages can point the user to the exact location of a problem.
//
// Recognised tokens:
//   Identifiers  [A-Za-z_][A-Za-z0-9_]*   ("true" and "false" are keywords)
//   Connectives  spelled by a Syntax table (see below)
//   Parentheses  (  )
//   EOF          end-of-input sentinel
//
// The concrete spelling of each connective is configurable.  A spelling is
// either a word ([A-Za-z_][A-Za-z0-9_]*, matched as a whole identifier) or a
// run of symbol characters (matched longest-first).  Syntax::standard()
// accepts:
//
//   NOT      ~  !  ¬  not  NOT
//   AND      &  ∧  and  AND
//   OR       |  ∨  or  OR
//   IMPLIES  ->  >>  →  implies  IMPLIES
//   IFF      <->  <<  ↔  iff  IFF
//   XOR      ^  ⊕  xor  XOR
//
// Whitespace is skipped.  Columns count bytes.
//
// ============================================================================

#ifndef PROPLOGIC_LEXER_HPP
#define PROPLOGIC_LEXER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace proplogic {

// ── SourcePos ───────────────────────────────────────────────────────────────
// 0-based byte offset plus 1-based line and column, used for error reporting.

struct SourcePos {
    std::size_t   offset = 0;
    std::uint32_t line   = 1;
    std::uint32_t column = 1;
};

// ── TokenKind ───────────────────────────────────────────────────────────────

enum class TokenKind : std::uint8_t {
    // Literals / identifiers
    Identifier,     // atom name
    KwTrue,         // "true"
    KwFalse,        // "false"

    // Connectives
    Not,
    And,
    Or,
    Implies,
    Iff,
    Xor,

    // Delimiters
    LParen,         // (
    RParen,         // )

    // Sentinel
    Eof
};

/// Human-readable name for debugging and error messages.
const char* token_kind_name(TokenKind k) noexcept;

// ── Syntax ──────────────────────────────────────────────────────────────────
// Concrete spelling of the connectives.  Plain value type; pass a custom one
// to the Lexer / Parser to change the accepted notation.

class Syntax {
public:
    /// Empty table: only identifiers, true/false and parentheses lex.
    Syntax() = default;

    /// The default notation described in the header comment.
    static Syntax standard();

    /// Register `spelling` for connective `kind`.  Throws
    /// std::invalid_argument if the spelling is empty, mixes word and symbol
    /// characters, collides with a parenthesis / "true" / "false", or if
    /// `kind` is not a connective.
    Syntax& add(TokenKind kind, std::string spelling);

    /// Remove every spelling registered for `kind`.
    Syntax& clear(TokenKind kind);

    /// Connective kind for a word spelling, or Identifier if none.
    TokenKind classify_word(std::string_view word) const noexcept;

    /// Longest symbol spelling that prefixes `rest`; {Eof, 0} when none.
    std::pair<TokenKind, std::size_t> match_symbol(std::string_view rest) const noexcept;

    /// All registered spellings for `kind`, in registration order.
    std::vector<std::string> spellings(TokenKind kind) const;

private:
    struct Entry {
        TokenKind   kind;
        std::string spelling;
        bool        is_word;
    };
    std::vector<Entry> entries_;
};

// ── Token ───────────────────────────────────────────────────────────────────

struct Token {
    TokenKind   kind = TokenKind::Eof;
    std::string text;
    SourcePos   pos;
};

// ── Lexer ───────────────────────────────────────────────────────────────────
// Stores the full input and lazily produces tokens via next().
// Errors are reported by throwing SyntaxError with the offending position.

class Lexer {
public:
    /// Construct a lexer over the given input.
    /// @param source  the full text to tokenise (must outlive the lexer)
    /// @param syntax  connective spellings (copied)
    /// @param line    the starting line number (default 1)
    explicit Lexer(std::string_view source,
                   Syntax syntax = Syntax::standard(),
                   std::uint32_t line = 1);

    /// Return the next token.  Repeated calls after EOF keep returning EOF.
    Token next();

    /// Peek at the next token without consuming it.
    const Token& peek();

    /// Current source position (of the next character to be read).
    SourcePos current_pos() const noexcept;

private:
    void skip_whitespace();
    Token read_identifier_or_keyword();
    void advance(std::size_t count);

    [[noreturn]] void error(const std::string& msg) const;

    std::string_view src_;
    Syntax           syntax_;
    SourcePos        pos_;
    bool             has_peeked_ = false;
    Token            peeked_;
};

// ── tokenise ────────────────────────────────────────────────────────────────
// Convenience: tokenise a complete string and return a vector of tokens
// (including the trailing Eof).

std::vector<Token> tokenise(std::string_view source,
                            const Syntax& syntax = Syntax::standard());

}  // namespace proplogic

#endif  // PROPLOGIC_LEXER_HPP
