// ============================================================================
// parser.cpp — Recursive-descent formula parser
// ============================================================================
//
// Implementation notes
// --------------------
//
// This parser consumes tokens from a Lexer and builds an AST via
// FormulaFactory.  The recursive-descent structure mirrors the grammar
// directly:
//
//   parse()           calls parse_formula() and then expects Eof.
//   parse_iff()       handles  <-> and ^  (left-associative).
//   parse_implies()   handles  ->         (right-associative via recursion).
//   parse_or()        handles  |          (left-associative).
//   parse_and()       handles  &          (left-associative).
//   parse_unary()     handles  ~          (prefix).
//   parse_primary()   handles  atoms, true, false, parens.
//
// All error messages follow the format:
//   <line>: ERROR: <message> at column <n>
// and the thrown SyntaxError also carries the byte offset.
//
// ============================================================================

#include "proplogic/parser.hpp"

namespace proplogic {

// ── Constructor ─────────────────────────────────────────────────────────────

Parser::Parser(Lexer& lexer, FormulaFactory& factory)
    : lex_(lexer), fac_(factory) {}

// ── Error helpers ───────────────────────────────────────────────────────────

void Parser::error(const Token& tok, const std::string& msg) {
    throw SyntaxError(msg, tok.pos.offset, tok.pos.line, tok.pos.column);
}

static std::string describe(const Token& t) {
    if (t.kind == TokenKind::Eof) return "end of input";
    return "'" + t.text + "'";
}

void Parser::enter(const Token& tok) {
    if (++depth_ > kMaxNesting) {
        error(tok, "formula nested too deeply");
    }
}

// ── parse ───────────────────────────────────────────────────────────────────
// Entry point: parse one formula then require end-of-input.

FormulaId Parser::parse() {
    FormulaId f = parse_formula();
    const Token& t = lex_.peek();
    if (t.kind == TokenKind::RParen) {
        error(t, "unbalanced ')'");
    }
    if (t.kind != TokenKind::Eof) {
        error(t, "unexpected token " + describe(t) + " after formula");
    }
    return f;
}

FormulaId Parser::parse_formula() {
    return parse_iff();
}

// ── parse_iff ───────────────────────────────────────────────────────────────
// iff_expr ::= impl_expr ( ('<->' | '^') impl_expr )*
// Left-associative: a <-> b ^ c  =  (a <-> b) ^ c

FormulaId Parser::parse_iff() {
    FormulaId   lhs     = parse_implies();
    std::size_t chained = 0;
    for (;;) {
        TokenKind k = lex_.peek().kind;
        if (k != TokenKind::Iff && k != TokenKind::Xor) break;
        enter(lex_.next());
        ++chained;
        FormulaId rhs = parse_implies();
        lhs = (k == TokenKind::Iff) ? fac_.make_iff(lhs, rhs) : fac_.make_xor(lhs, rhs);
    }
    depth_ -= chained;
    return lhs;
}

// ── parse_implies ───────────────────────────────────────────────────────────
// impl_expr ::= or_expr ( '->' impl_expr )?
// Right-associative: a -> b -> c  =  a -> (b -> c)

FormulaId Parser::parse_implies() {
    FormulaId lhs = parse_or();
    if (lex_.peek().kind == TokenKind::Implies) {
        Token op = lex_.next();
        enter(op);
        FormulaId rhs = parse_implies();
        leave();
        return fac_.make_implies(lhs, rhs);
    }
    return lhs;
}

// ── parse_or ────────────────────────────────────────────────────────────────
// or_expr ::= and_expr ( '|' and_expr )*
// Every operator of a left-associative chain deepens the left spine by one,
// so each one counts against the nesting limit until the chain is closed.

FormulaId Parser::parse_or() {
    FormulaId   lhs     = parse_and();
    std::size_t chained = 0;
    while (lex_.peek().kind == TokenKind::Or) {
        enter(lex_.next());
        ++chained;
        FormulaId rhs = parse_and();
        lhs = fac_.make_or(lhs, rhs);
    }
    depth_ -= chained;
    return lhs;
}

// ── parse_and ───────────────────────────────────────────────────────────────
// and_expr ::= unary ( '&' unary )*

FormulaId Parser::parse_and() {
    FormulaId   lhs     = parse_unary();
    std::size_t chained = 0;
    while (lex_.peek().kind == TokenKind::And) {
        enter(lex_.next());
        ++chained;
        FormulaId rhs = parse_unary();
        lhs = fac_.make_and(lhs, rhs);
    }
    depth_ -= chained;
    return lhs;
}

// ── parse_unary ─────────────────────────────────────────────────────────────
// unary ::= '~' unary | primary

FormulaId Parser::parse_unary() {
    if (lex_.peek().kind == TokenKind::Not) {
        Token op = lex_.next();
        enter(op);
        FormulaId child = parse_unary();
        leave();
        return fac_.make_not(child);
    }
    return parse_primary();
}

// ── parse_primary ───────────────────────────────────────────────────────────
// primary ::= 'true' | 'false' | IDENTIFIER | '(' formula ')'

FormulaId Parser::parse_primary() {
    Token t = lex_.next();

    switch (t.kind) {
        case TokenKind::KwTrue:
            return fac_.make_true();

        case TokenKind::KwFalse:
            return fac_.make_false();

        case TokenKind::Identifier:
            if (!is_valid_atom_name(t.text)) {
                error(t, "'" + t.text + "' is reserved and cannot name an atom");
            }
            return fac_.make_atom(t.text);

        case TokenKind::LParen: {
            enter(t);
            FormulaId inner = parse_formula();
            const Token& close = lex_.peek();
            if (close.kind != TokenKind::RParen) {
                error(close, "unbalanced '(' opened at column " +
                             std::to_string(t.pos.column) + ", got " + describe(close));
            }
            lex_.next();
            leave();
            return inner;
        }

        case TokenKind::Eof:
            error(t, "expected operand, got end of input");

        case TokenKind::RParen:
            error(t, "expected operand before ')'");

        case TokenKind::Not:
        case TokenKind::And:
        case TokenKind::Or:
        case TokenKind::Implies:
        case TokenKind::Iff:
        case TokenKind::Xor:
            break;
    }
    error(t, "expected operand before " + describe(t));
}

// ── Free function convenience ───────────────────────────────────────────────

FormulaId parse_formula(std::string_view input, FormulaFactory& factory,
                        const Syntax& syntax, std::uint32_t line) {
    Lexer lex(input, syntax, line);
    Parser parser(lex, factory);
    return parser.parse();
}

ParseResult try_parse(std::string_view input, FormulaFactory& factory,
                      const Syntax& syntax, std::uint32_t line) {
    ParseResult result;
    try {
        result.formula = parse_formula(input, factory, syntax, line);
    } catch (const SyntaxError& e) {
        result.error = e;
    }
    return result;
}

}  // namespace proplogic
