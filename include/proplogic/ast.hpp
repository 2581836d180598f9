// ============================================================================
// proplogic/ast.hpp — Abstract Syntax Tree for propositional formulas
// ============================================================================
//
// Design notes:
//
//   Every formula is represented as a node in an interned DAG.  Two
//   formulas that are structurally identical share the same FormulaId.
//   This gives O(1) structural equality and a canonical representation.
//   Nodes are never modified after interning; every transformation builds
//   new nodes and returns a new FormulaId.
//
//   Node types:
//     - True/False: boolean constants
//     - Atom      : propositional variable (string label)
//     - Not       : negation, child[0]
//     - And       : conjunction, child[0] & child[1]
//     - Or        : disjunction, child[0] | child[1]
//     - Implies   : implication child[0] -> child[1]
//     - Iff       : biconditional child[0] <-> child[1]
//     - Xor       : exclusive or child[0] ^ child[1]
//
//   FormulaFactory owns all nodes and provides the interning mechanism
//   via structural hashing.  Clients receive FormulaId handles.  The
//   tree shape is exposed read-only through node() so that external
//   renderers can walk it.
//
// ============================================================================

#ifndef PROPLOGIC_AST_HPP
#define PROPLOGIC_AST_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace proplogic {

// ── FormulaId ───────────────────────────────────────────────────────────────
// A lightweight handle into the formula interning table.  The id is an index
// into the FormulaFactory's internal node vector.  The special value
// kInvalidId signals "no formula".
// ─────────────────────────────────────────────────────────────────────────────

using FormulaId = std::uint32_t;
inline constexpr FormulaId kInvalidId = static_cast<FormulaId>(-1);

// ── NodeKind ────────────────────────────────────────────────────────────────

enum class NodeKind : std::uint8_t {
    // Constants
    True,
    False,

    // Atoms
    Atom,

    // Unary connective
    Not,

    // Binary connectives
    And,
    Or,
    Implies,   // removed by implication elimination
    Iff,       // removed by equivalence elimination
    Xor        // removed by equivalence elimination
};

/// Human-readable string for a NodeKind.
const char* node_kind_name(NodeKind k) noexcept;

/// True for And, Or, Implies, Iff, Xor.
bool is_binary(NodeKind k) noexcept;

/// True for True and False.
bool is_constant(NodeKind k) noexcept;

// ── FormulaNode ─────────────────────────────────────────────────────────────
// Immutable stored node.  All data is value-semantics; the FormulaFactory is
// the sole owner.

struct FormulaNode {
    NodeKind    kind{};
    std::string atom_name;       // non-empty for Atom nodes only
    FormulaId   children[2]{kInvalidId, kInvalidId};

    // Structural-equality (used by the interning table).
    bool operator==(const FormulaNode& o) const noexcept;
};

// ── FormulaNodeHash ─────────────────────────────────────────────────────────
// Hash functor for FormulaNode, combining kind + atom_name + children.

struct FormulaNodeHash {
    std::size_t operator()(const FormulaNode& n) const noexcept;
};

// ── Atom names ──────────────────────────────────────────────────────────────

/// True when `name` matches [A-Za-z_][A-Za-z0-9_]* and is not reserved.
bool is_valid_atom_name(std::string_view name) noexcept;

/// Words that the default syntax treats as keywords and therefore cannot
/// name an atom: true, false and the word spellings of the connectives.
bool is_reserved_word(std::string_view word) noexcept;

// ── FormulaFactory ──────────────────────────────────────────────────────────
// Thread-unsafe for construction (single-threaded design).  Const access
// (node(), size(), constant_value()) may be shared between threads as long
// as nobody is constructing concurrently.  Every make_*() method returns the
// canonical FormulaId for that structure.

class FormulaFactory {
public:
    FormulaFactory();

    // ── Constructors ────────────────────────────────────────────────────
    FormulaId make_true();
    FormulaId make_false();
    FormulaId make_constant(bool value);

    /// Throws InvalidAtomNameError if `name` is not a valid atom name.
    FormulaId make_atom(const std::string& name);

    FormulaId make_not(FormulaId child);
    FormulaId make_and(FormulaId lhs, FormulaId rhs);
    FormulaId make_or(FormulaId lhs, FormulaId rhs);
    FormulaId make_implies(FormulaId lhs, FormulaId rhs);
    FormulaId make_iff(FormulaId lhs, FormulaId rhs);
    FormulaId make_xor(FormulaId lhs, FormulaId rhs);

    /// Build a binary node of the given kind.  Throws std::invalid_argument
    /// if `kind` is not a binary connective.
    FormulaId make_binary(NodeKind kind, FormulaId lhs, FormulaId rhs);

    // ── Accessors ───────────────────────────────────────────────────────
    const FormulaNode& node(FormulaId id) const;
    std::size_t        size() const noexcept;

    /// Value of a True/False node, nullopt for anything else.
    std::optional<bool> constant_value(FormulaId id) const;

    // ── Pretty-print ────────────────────────────────────────────────────
    // Returns a fully parenthesised ASCII representation of a formula.
    // See printer.hpp for minimal-parenthesis output with other symbols.
    std::string to_string(FormulaId id) const;

private:
    // Intern a node: return existing id when structurally equal, otherwise
    // allocate a new slot.
    FormulaId intern(FormulaNode node);

    std::vector<FormulaNode>                                    nodes_;
    std::unordered_map<FormulaNode, FormulaId, FormulaNodeHash> intern_;
};

}  // namespace proplogic

#endif  // PROPLOGIC_AST_HPP
