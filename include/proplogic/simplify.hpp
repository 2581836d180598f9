// ============================================================================
// proplogic/simplify.hpp — Equivalence-preserving formula simplification
// ============================================================================
//
// simplify() rewrites bottom-up with the rules below and repeats whole
// passes until a pass returns the formula it was given.  Every rule strictly
// reduces the node count, so the loop terminates; because the result is a
// fixpoint, simplify(simplify(f)) == simplify(f).
//
//   Constants      f & F → F     f | T → T     f & T → f     f | F → f
//                  ~T → F        ~F → T
//                  F -> f → T    f -> T → T    T -> f → f    f -> F → ~f
//                  T <-> f → f   F <-> f → ~f  F ^ f → f     T ^ f → ~f
//   Negation       ~~f → f
//   Idempotence    f & f → f     f | f → f
//                  f -> f → T    f <-> f → T   f ^ f → F
//   Complement     f & ~f → F    f | ~f → T    f <-> ~f → F  f ^ ~f → T
//   Absorption     f & (f | g) → f             f | (f & g) → f
//
// Binary rules are applied in both operand orders.  De Morgan is not used
// here; shape normalisation belongs to normalization.hpp.
//
// ============================================================================

#ifndef PROPLOGIC_SIMPLIFY_HPP
#define PROPLOGIC_SIMPLIFY_HPP

#include "proplogic/ast.hpp"

namespace proplogic {

/// Simplify to a fixpoint of the rule set above.
FormulaId simplify(FormulaId id, FormulaFactory& f);

/// One bottom-up rewrite pass (exposed for tests and statistics).
FormulaId simplify_once(FormulaId id, FormulaFactory& f);

}  // namespace proplogic

#endif  // PROPLOGIC_SIMPLIFY_HPP
