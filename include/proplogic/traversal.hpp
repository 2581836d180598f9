// ============================================================================
// proplogic/traversal.hpp — Structural queries and substitution
// ============================================================================
//
// Read-only walks over a formula (atoms, subformulas, size) and the
// simultaneous atom substitution.  All functions are pure and total.
//
// Subformulas are reported once per tree position: a pre-order traversal
// yields one entry per node, so a subtree that occurs at two positions is
// listed twice.  Atoms are distinct and listed in first-occurrence
// (pre-order) order; sorted_atoms() gives the lexicographic order used by
// truth tables.
//
// ============================================================================

#ifndef PROPLOGIC_TRAVERSAL_HPP
#define PROPLOGIC_TRAVERSAL_HPP

#include "proplogic/ast.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace proplogic {

/// Atom name → replacement formula.
using Substitution = std::map<std::string, FormulaId>;

/// Distinct atom names in first-occurrence pre-order.
std::vector<std::string> get_atoms(const FormulaFactory& f, FormulaId id);

/// Distinct atom names in lexicographic order.
std::vector<std::string> sorted_atoms(const FormulaFactory& f, FormulaId id);

/// Sorted union of the atoms of two formulas.
std::vector<std::string> sorted_atoms(const FormulaFactory& f, FormulaId a, FormulaId b);

/// Every node of the tree in pre-order, one entry per position.
std::vector<FormulaId> get_subformulas(const FormulaFactory& f, FormulaId id);

/// Replace every atom named in `mapping` by its formula, simultaneously:
/// replacements are inserted as-is and never substituted again.
FormulaId substitute(FormulaId id, const Substitution& mapping, FormulaFactory& f);

/// Number of tree positions (same as get_subformulas().size()).
std::size_t node_count(const FormulaFactory& f, FormulaId id);

/// Height of the tree; a leaf has depth 1.
std::size_t depth(const FormulaFactory& f, FormulaId id);

/// True for atoms and constants.
bool is_atomic(const FormulaFactory& f, FormulaId id);

/// True if `sub` occurs as a subformula of `id` (including id itself).
bool contains(const FormulaFactory& f, FormulaId id, FormulaId sub);

}  // namespace proplogic

#endif  // PROPLOGIC_TRAVERSAL_HPP
