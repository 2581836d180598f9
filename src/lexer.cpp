// ============================================================================
// lexer.cpp — formula tokeniser implementation
// ============================================================================

#include "proplogic/lexer.hpp"
#include "proplogic/errors.hpp"

#include <cctype>
#include <stdexcept>

namespace proplogic {

// ── token_kind_name ─────────────────────────────────────────────────────────

const char* token_kind_name(TokenKind k) noexcept {
    switch (k) {
        case TokenKind::Identifier:   return "identifier";
        case TokenKind::KwTrue:       return "true";
        case TokenKind::KwFalse:      return "false";
        case TokenKind::Not:          return "negation";
        case TokenKind::And:          return "conjunction";
        case TokenKind::Or:           return "disjunction";
        case TokenKind::Implies:      return "implication";
        case TokenKind::Iff:          return "biconditional";
        case TokenKind::Xor:          return "exclusive or";
        case TokenKind::LParen:       return "(";
        case TokenKind::RParen:       return ")";
        case TokenKind::Eof:          return "end of input";
    }
    return "?";
}

// ── Character classes ───────────────────────────────────────────────────────

static bool is_word_start(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalpha(u) || u == '_';
}

static bool is_word_char(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalnum(u) || u == '_';
}

// Anything that is not part of a word, whitespace, or a parenthesis may be
// used in a symbolic connective.  Bytes >= 0x80 qualify, which admits UTF-8
// spellings such as "¬" or "→".
static bool is_symbol_char(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return !is_word_char(c) && !std::isspace(u) && u != '(' && u != ')';
}

// Byte length of the UTF-8 sequence introduced by `lead`, so that error
// messages quote a whole code point.  Stray continuation bytes count as one.
static std::size_t char_length(char lead) {
    unsigned char u = static_cast<unsigned char>(lead);
    if (u >= 0xF0 && u < 0xF8) return 4;
    if (u >= 0xE0) return u < 0xF0 ? 3 : 1;
    if (u >= 0xC0) return 2;
    return 1;
}

// ── Syntax ──────────────────────────────────────────────────────────────────

Syntax Syntax::standard() {
    Syntax s;
    s.add(TokenKind::Not, "~").add(TokenKind::Not, "!").add(TokenKind::Not, "\xC2\xAC")
     .add(TokenKind::Not, "not").add(TokenKind::Not, "NOT");
    s.add(TokenKind::And, "&").add(TokenKind::And, "\xE2\x88\xA7")
     .add(TokenKind::And, "and").add(TokenKind::And, "AND");
    s.add(TokenKind::Or, "|").add(TokenKind::Or, "\xE2\x88\xA8")
     .add(TokenKind::Or, "or").add(TokenKind::Or, "OR");
    s.add(TokenKind::Implies, "->").add(TokenKind::Implies, ">>")
     .add(TokenKind::Implies, "\xE2\x86\x92")
     .add(TokenKind::Implies, "implies").add(TokenKind::Implies, "IMPLIES");
    s.add(TokenKind::Iff, "<->").add(TokenKind::Iff, "<<")
     .add(TokenKind::Iff, "\xE2\x86\x94")
     .add(TokenKind::Iff, "iff").add(TokenKind::Iff, "IFF");
    s.add(TokenKind::Xor, "^").add(TokenKind::Xor, "\xE2\x8A\x95")
     .add(TokenKind::Xor, "xor").add(TokenKind::Xor, "XOR");
    return s;
}

Syntax& Syntax::add(TokenKind kind, std::string spelling) {
    switch (kind) {
        case TokenKind::Not:
        case TokenKind::And:
        case TokenKind::Or:
        case TokenKind::Implies:
        case TokenKind::Iff:
        case TokenKind::Xor:
            break;
        default:
            throw std::invalid_argument(std::string("Syntax::add: not a connective: ") +
                                        token_kind_name(kind));
    }
    if (spelling.empty()) {
        throw std::invalid_argument("Syntax::add: empty spelling");
    }

    bool is_word = is_word_start(spelling[0]);
    for (char c : spelling) {
        if (is_word ? !is_word_char(c) : !is_symbol_char(c)) {
            throw std::invalid_argument("Syntax::add: malformed spelling '" + spelling + "'");
        }
    }
    if (spelling == "true" || spelling == "false") {
        throw std::invalid_argument("Syntax::add: '" + spelling + "' is a boolean literal");
    }
    for (const Entry& e : entries_) {
        if (e.spelling == spelling && e.kind != kind) {
            throw std::invalid_argument("Syntax::add: '" + spelling +
                                        "' is already bound to " + token_kind_name(e.kind));
        }
    }

    entries_.push_back(Entry{kind, std::move(spelling), is_word});
    return *this;
}

Syntax& Syntax::clear(TokenKind kind) {
    std::vector<Entry> kept;
    for (Entry& e : entries_) {
        if (e.kind != kind) kept.push_back(std::move(e));
    }
    entries_ = std::move(kept);
    return *this;
}

TokenKind Syntax::classify_word(std::string_view word) const noexcept {
    for (const Entry& e : entries_) {
        if (e.is_word && e.spelling == word) return e.kind;
    }
    return TokenKind::Identifier;
}

std::pair<TokenKind, std::size_t> Syntax::match_symbol(std::string_view rest) const noexcept {
    TokenKind   best_kind = TokenKind::Eof;
    std::size_t best_len  = 0;
    for (const Entry& e : entries_) {
        if (e.is_word || e.spelling.size() <= best_len) continue;
        if (rest.substr(0, e.spelling.size()) == e.spelling) {
            best_kind = e.kind;
            best_len  = e.spelling.size();
        }
    }
    return {best_kind, best_len};
}

std::vector<std::string> Syntax::spellings(TokenKind kind) const {
    std::vector<std::string> out;
    for (const Entry& e : entries_) {
        if (e.kind == kind) out.push_back(e.spelling);
    }
    return out;
}

// ── Lexer ───────────────────────────────────────────────────────────────────

Lexer::Lexer(std::string_view source, Syntax syntax, std::uint32_t line)
    : src_(source), syntax_(std::move(syntax)), pos_{0, line, 1} {}

SourcePos Lexer::current_pos() const noexcept {
    return pos_;
}

void Lexer::error(const std::string& msg) const {
    throw SyntaxError(msg, pos_.offset, pos_.line, pos_.column);
}

void Lexer::advance(std::size_t count) {
    pos_.offset += count;
    pos_.column += static_cast<std::uint32_t>(count);
}

// ── skip_whitespace ─────────────────────────────────────────────────────────

void Lexer::skip_whitespace() {
    while (pos_.offset < src_.size()) {
        char c = src_[pos_.offset];
        if (c == '\n') {
            ++pos_.offset;
            ++pos_.line;
            pos_.column = 1;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            advance(1);
        } else {
            break;
        }
    }
}

// ── read_identifier_or_keyword ──────────────────────────────────────────────
// Read [A-Za-z_][A-Za-z0-9_]* and classify as literal, connective word, or
// atom identifier.

Token Lexer::read_identifier_or_keyword() {
    SourcePos start = pos_;
    std::size_t end = pos_.offset;
    while (end < src_.size() && is_word_char(src_[end])) {
        ++end;
    }
    std::string text(src_.substr(start.offset, end - start.offset));
    advance(end - start.offset);

    TokenKind kind;
    if (text == "true")       kind = TokenKind::KwTrue;
    else if (text == "false") kind = TokenKind::KwFalse;
    else                      kind = syntax_.classify_word(text);

    return Token{kind, std::move(text), start};
}

// ── next ────────────────────────────────────────────────────────────────────

Token Lexer::next() {
    if (has_peeked_) {
        has_peeked_ = false;
        return std::move(peeked_);
    }

    skip_whitespace();

    if (pos_.offset >= src_.size()) {
        return Token{TokenKind::Eof, "", pos_};
    }

    SourcePos start = pos_;
    char c = src_[pos_.offset];

    if (c == '(') { advance(1); return Token{TokenKind::LParen, "(", start}; }
    if (c == ')') { advance(1); return Token{TokenKind::RParen, ")", start}; }

    if (is_word_start(c)) {
        return read_identifier_or_keyword();
    }

    auto [kind, len] = syntax_.match_symbol(src_.substr(pos_.offset));
    if (len > 0) {
        std::string text(src_.substr(pos_.offset, len));
        advance(len);
        return Token{kind, std::move(text), start};
    }

    if (std::isdigit(static_cast<unsigned char>(c))) {
        error("atom names must not start with a digit");
    }
    error("unexpected character '" + std::string(src_.substr(pos_.offset, char_length(c))) + "'");
}

// ── peek ────────────────────────────────────────────────────────────────────

const Token& Lexer::peek() {
    if (!has_peeked_) {
        peeked_ = next();
        has_peeked_ = true;
    }
    return peeked_;
}

// ── tokenise (convenience) ──────────────────────────────────────────────────

std::vector<Token> tokenise(std::string_view source, const Syntax& syntax) {
    Lexer lex(source, syntax);
    std::vector<Token> toks;
    for (;;) {
        Token t = lex.next();
        toks.push_back(t);
        if (t.kind == TokenKind::Eof) break;
    }
    return toks;
}

}  // namespace proplogic
