// ============================================================================
// ast.cpp — Implementation of the formula AST, interning, and printing
// ============================================================================

#include "proplogic/ast.hpp"
#include "proplogic/errors.hpp"

#include <cctype>
#include <stdexcept>

namespace proplogic {

// ── node_kind_name ──────────────────────────────────────────────────────────

const char* node_kind_name(NodeKind k) noexcept {
    switch (k) {
        case NodeKind::True:    return "true";
        case NodeKind::False:   return "false";
        case NodeKind::Atom:    return "Atom";
        case NodeKind::Not:     return "~";
        case NodeKind::And:     return "&";
        case NodeKind::Or:      return "|";
        case NodeKind::Implies: return "->";
        case NodeKind::Iff:     return "<->";
        case NodeKind::Xor:     return "^";
    }
    return "?";
}

bool is_binary(NodeKind k) noexcept {
    switch (k) {
        case NodeKind::And:
        case NodeKind::Or:
        case NodeKind::Implies:
        case NodeKind::Iff:
        case NodeKind::Xor:
            return true;
        case NodeKind::True:
        case NodeKind::False:
        case NodeKind::Atom:
        case NodeKind::Not:
            return false;
    }
    return false;
}

bool is_constant(NodeKind k) noexcept {
    return k == NodeKind::True || k == NodeKind::False;
}

// ── Atom names ──────────────────────────────────────────────────────────────

bool is_reserved_word(std::string_view word) noexcept {
    static constexpr std::string_view kReserved[] = {
        "true", "false",
        "not", "NOT", "and", "AND", "or", "OR",
        "implies", "IMPLIES", "iff", "IFF", "xor", "XOR",
    };
    for (std::string_view r : kReserved) {
        if (r == word) return true;
    }
    return false;
}

bool is_valid_atom_name(std::string_view name) noexcept {
    if (name.empty()) return false;
    unsigned char first = static_cast<unsigned char>(name[0]);
    if (!std::isalpha(first) && first != '_') return false;
    for (char c : name) {
        unsigned char u = static_cast<unsigned char>(c);
        if (!std::isalnum(u) && u != '_') return false;
    }
    return !is_reserved_word(name);
}

// ── FormulaNode ─────────────────────────────────────────────────────────────

bool FormulaNode::operator==(const FormulaNode& o) const noexcept {
    return kind == o.kind &&
           atom_name == o.atom_name &&
           children[0] == o.children[0] &&
           children[1] == o.children[1];
}

// ── FormulaNodeHash ─────────────────────────────────────────────────────────
// Combine kind, atom_name and children via FNV-like mixing.

std::size_t FormulaNodeHash::operator()(const FormulaNode& n) const noexcept {
    std::size_t h = static_cast<std::size_t>(n.kind);
    h ^= std::hash<std::string>{}(n.atom_name) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= std::hash<FormulaId>{}(n.children[0]) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= std::hash<FormulaId>{}(n.children[1]) + 0x9e3779b9 + (h << 6) + (h >> 2);
    return h;
}

// ── FormulaFactory ──────────────────────────────────────────────────────────

FormulaFactory::FormulaFactory() {
    // Reserve slot 0 and 1 for canonical true/false so they always exist.
    make_true();
    make_false();
}

FormulaId FormulaFactory::intern(FormulaNode node) {
    auto it = intern_.find(node);
    if (it != intern_.end()) {
        return it->second;
    }
    FormulaId id = static_cast<FormulaId>(nodes_.size());
    nodes_.push_back(std::move(node));
    intern_[nodes_.back()] = id;
    return id;
}

// ── make_* helpers ──────────────────────────────────────────────────────────

FormulaId FormulaFactory::make_true() {
    FormulaNode n;
    n.kind = NodeKind::True;
    return intern(std::move(n));
}

FormulaId FormulaFactory::make_false() {
    FormulaNode n;
    n.kind = NodeKind::False;
    return intern(std::move(n));
}

FormulaId FormulaFactory::make_constant(bool value) {
    return value ? make_true() : make_false();
}

FormulaId FormulaFactory::make_atom(const std::string& name) {
    if (!is_valid_atom_name(name)) {
        throw InvalidAtomNameError(name);
    }
    FormulaNode n;
    n.kind = NodeKind::Atom;
    n.atom_name = name;
    return intern(std::move(n));
}

FormulaId FormulaFactory::make_not(FormulaId child) {
    FormulaNode n;
    n.kind = NodeKind::Not;
    n.children[0] = child;
    return intern(std::move(n));
}

FormulaId FormulaFactory::make_and(FormulaId lhs, FormulaId rhs) {
    return make_binary(NodeKind::And, lhs, rhs);
}

FormulaId FormulaFactory::make_or(FormulaId lhs, FormulaId rhs) {
    return make_binary(NodeKind::Or, lhs, rhs);
}

FormulaId FormulaFactory::make_implies(FormulaId lhs, FormulaId rhs) {
    return make_binary(NodeKind::Implies, lhs, rhs);
}

FormulaId FormulaFactory::make_iff(FormulaId lhs, FormulaId rhs) {
    return make_binary(NodeKind::Iff, lhs, rhs);
}

FormulaId FormulaFactory::make_xor(FormulaId lhs, FormulaId rhs) {
    return make_binary(NodeKind::Xor, lhs, rhs);
}

FormulaId FormulaFactory::make_binary(NodeKind kind, FormulaId lhs, FormulaId rhs) {
    if (!is_binary(kind)) {
        throw std::invalid_argument(std::string("make_binary: not a binary connective: ") +
                                    node_kind_name(kind));
    }
    FormulaNode n;
    n.kind = kind;
    n.children[0] = lhs;
    n.children[1] = rhs;
    return intern(std::move(n));
}

// ── Accessors ───────────────────────────────────────────────────────────────

const FormulaNode& FormulaFactory::node(FormulaId id) const {
    if (id >= nodes_.size()) {
        throw std::out_of_range("FormulaFactory::node: invalid FormulaId");
    }
    return nodes_[id];
}

std::size_t FormulaFactory::size() const noexcept {
    return nodes_.size();
}

std::optional<bool> FormulaFactory::constant_value(FormulaId id) const {
    switch (node(id).kind) {
        case NodeKind::True:  return true;
        case NodeKind::False: return false;
        default:              return std::nullopt;
    }
}

// ── Pretty-printing ─────────────────────────────────────────────────────────
// Produces a fully parenthesised string for unambiguity.

std::string FormulaFactory::to_string(FormulaId id) const {
    const FormulaNode& n = node(id);

    switch (n.kind) {
        case NodeKind::True:
            return "true";
        case NodeKind::False:
            return "false";
        case NodeKind::Atom:
            return n.atom_name;
        case NodeKind::Not:
            return "(~" + to_string(n.children[0]) + ")";
        case NodeKind::And:
            return "(" + to_string(n.children[0]) + " & " + to_string(n.children[1]) + ")";
        case NodeKind::Or:
            return "(" + to_string(n.children[0]) + " | " + to_string(n.children[1]) + ")";
        case NodeKind::Implies:
            return "(" + to_string(n.children[0]) + " -> " + to_string(n.children[1]) + ")";
        case NodeKind::Iff:
            return "(" + to_string(n.children[0]) + " <-> " + to_string(n.children[1]) + ")";
        case NodeKind::Xor:
            return "(" + to_string(n.children[0]) + " ^ " + to_string(n.children[1]) + ")";
    }
    return "<?>";
}

}  // namespace proplogic
