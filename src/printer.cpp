// ============================================================================
// printer.cpp — Minimal-parenthesis formula rendering
// ============================================================================
//
// Binding strength, mirroring the parser (higher binds tighter):
//
//   6  constants, atoms
//   5  ~
//   4  &            left-assoc
//   3  |            left-assoc
//   2  ->           right-assoc
//   1  <->, ^       left-assoc
//
// A child is parenthesised when it binds looser than its parent, or equally
// tight on the side the parent's associativity does not absorb.
//
// ============================================================================

#include "proplogic/printer.hpp"

#include <cctype>
#include <utility>

namespace proplogic {

SymbolTable SymbolTable::ascii() {
    return SymbolTable{};
}

SymbolTable SymbolTable::unicode() {
    SymbolTable s;
    s.negation      = "¬";
    s.conjunction   = "∧";
    s.disjunction   = "∨";
    s.implication   = "→";
    s.biconditional = "↔";
    s.exclusive_or  = "⊕";
    return s;
}

SymbolTable SymbolTable::words() {
    SymbolTable s;
    s.negation      = "not";
    s.conjunction   = "and";
    s.disjunction   = "or";
    s.implication   = "implies";
    s.biconditional = "iff";
    s.exclusive_or  = "xor";
    return s;
}

std::optional<SymbolTable> SymbolTable::by_name(std::string_view name) {
    if (name == "ascii")   return ascii();
    if (name == "unicode") return unicode();
    if (name == "words")   return words();
    return std::nullopt;
}

const std::string& SymbolTable::symbol(NodeKind k) const {
    static const std::string kNone;
    switch (k) {
        case NodeKind::True:    return truth;
        case NodeKind::False:   return falsity;
        case NodeKind::Atom:    return kNone;
        case NodeKind::Not:     return negation;
        case NodeKind::And:     return conjunction;
        case NodeKind::Or:      return disjunction;
        case NodeKind::Implies: return implication;
        case NodeKind::Iff:     return biconditional;
        case NodeKind::Xor:     return exclusive_or;
    }
    return kNone;
}

namespace {

int binding(NodeKind k) {
    switch (k) {
        case NodeKind::True:
        case NodeKind::False:
        case NodeKind::Atom:    return 6;
        case NodeKind::Not:     return 5;
        case NodeKind::And:     return 4;
        case NodeKind::Or:      return 3;
        case NodeKind::Implies: return 2;
        case NodeKind::Iff:
        case NodeKind::Xor:     return 1;
    }
    return 0;
}

class Printer {
public:
    Printer(const FormulaFactory& f, const SymbolTable& s) : f_(f), s_(s) {}

    void print(FormulaId id) {
        const FormulaNode& n = f_.node(id);
        switch (n.kind) {
            case NodeKind::True:
            case NodeKind::False:
                out_ += s_.symbol(n.kind);
                break;

            case NodeKind::Atom:
                out_ += n.atom_name;
                break;

            case NodeKind::Not: {
                const std::string& op = s_.symbol(n.kind);
                out_ += op;
                // A word operator needs a separator before the operand.
                if (!op.empty() && std::isalpha(static_cast<unsigned char>(op.back()))) {
                    out_ += ' ';
                }
                child(n.children[0], binding(NodeKind::Not) > binding(f_.node(n.children[0]).kind));
                break;
            }

            case NodeKind::And:
            case NodeKind::Or:
            case NodeKind::Implies:
            case NodeKind::Iff:
            case NodeKind::Xor: {
                const int  self       = binding(n.kind);
                const int  left       = binding(f_.node(n.children[0]).kind);
                const int  right      = binding(f_.node(n.children[1]).kind);
                const bool right_assoc = n.kind == NodeKind::Implies;

                child(n.children[0], right_assoc ? left <= self : left < self);
                out_ += ' ';
                out_ += s_.symbol(n.kind);
                out_ += ' ';
                child(n.children[1], right_assoc ? right < self : right <= self);
                break;
            }
        }
    }

    std::string take() { return std::move(out_); }

private:
    void child(FormulaId id, bool parens) {
        if (parens) out_ += '(';
        print(id);
        if (parens) out_ += ')';
    }

    const FormulaFactory& f_;
    const SymbolTable&    s_;
    std::string           out_;
};

}  // namespace

std::string format_formula(const FormulaFactory& f, FormulaId id, const SymbolTable& symbols) {
    Printer p(f, symbols);
    p.print(id);
    return p.take();
}

}  // namespace proplogic
