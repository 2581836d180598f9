// ============================================================================
// proplogic/normalization.hpp — NNF, CNF and DNF conversion
// ============================================================================
//
// The normalization pipeline transforms an arbitrary formula into negation
// normal form and from there into conjunctive or disjunctive normal form.
//
//   1. Eliminate ↔/⊕  — expand biconditional and exclusive or.
//   2. Eliminate →    — rewrite implications to disjunctions.
//   3. NNF            — push negation inward until it rests only on atoms.
//   4. Distribute     — ∨ over ∧ (CNF) or ∧ over ∨ (DNF).
//
// All phases are pure functions: they take a FormulaId and a FormulaFactory
// and return a new (interned) FormulaId.  None of them simplifies; chain
// simplify() afterwards for a reduced result.  CNF / DNF output can be
// exponentially larger than the input.
//
// Constants survive the pipeline as literal-level leaves (¬true becomes
// false and vice versa).
//
// ============================================================================

#ifndef PROPLOGIC_NORMALIZATION_HPP
#define PROPLOGIC_NORMALIZATION_HPP

#include "proplogic/ast.hpp"

namespace proplogic {

// ── Phase 1: Equivalence elimination ────────────────────────────────────────
//
//   φ ↔ ψ   ≡   (φ ∧ ψ) ∨ (¬φ ∧ ¬ψ)
//   φ ⊕ ψ   ≡   (φ ∧ ¬ψ) ∨ (¬φ ∧ ψ)
//
// After this phase the formula contains no Iff or Xor nodes.

FormulaId eliminate_equivalences(FormulaId id, FormulaFactory& f);

// ── Phase 2: Implication elimination ────────────────────────────────────────
//
//   φ → ψ   ≡   ¬φ ∨ ψ
//
// After this phase the formula contains no Implies nodes (Iff / Xor nodes,
// if any remain, are left alone).

FormulaId eliminate_implications(FormulaId id, FormulaFactory& f);

// ── Phase 3: Negation Normal Form ───────────────────────────────────────────
//
//   ¬¬φ        ≡   φ
//   ¬(φ ∧ ψ)   ≡   ¬φ ∨ ¬ψ            (De Morgan)
//   ¬(φ ∨ ψ)   ≡   ¬φ ∧ ¬ψ            (De Morgan)
//   ¬true      ≡   false
//   ¬false     ≡   true
//
// to_nnf() runs phases 1–3, so it accepts any formula.

FormulaId to_nnf(FormulaId id, FormulaFactory& f);

// ── Phase 4: Distribution ───────────────────────────────────────────────────
//
//   CNF:  φ ∨ (ψ ∧ χ)  ≡  (φ ∨ ψ) ∧ (φ ∨ χ)       (and mirrored)
//   DNF:  φ ∧ (ψ ∨ χ)  ≡  (φ ∧ ψ) ∨ (φ ∧ χ)       (and mirrored)

FormulaId to_cnf(FormulaId id, FormulaFactory& f);
FormulaId to_dnf(FormulaId id, FormulaFactory& f);

// ── Shape predicates ────────────────────────────────────────────────────────

/// Atom, negated atom, or constant.
bool is_literal(const FormulaFactory& f, FormulaId id);

/// No →/↔/⊕, and ¬ only directly above atoms.
bool is_nnf(const FormulaFactory& f, FormulaId id);

/// Conjunction of disjunctions of literals.
bool is_cnf(const FormulaFactory& f, FormulaId id);

/// Disjunction of conjunctions of literals.
bool is_dnf(const FormulaFactory& f, FormulaId id);

}  // namespace proplogic

#endif  // PROPLOGIC_NORMALIZATION_HPP
