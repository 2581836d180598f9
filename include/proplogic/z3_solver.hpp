// ============================================================================
// proplogic/z3_solver.hpp — Z3 wrapper for propositional satisfiability
// ============================================================================
//
// This module provides a wrapper around Z3 used as an alternative decision
// backend.  Every atom becomes a Z3 boolean constant of the same name and
// every connective maps onto the corresponding Z3 operator.
//
// Usage:
//   Z3Checker checker(factory);
//   checker.add_formula(id);
//   if (checker.check() == Z3Result::SAT) {
//       auto model = checker.get_model(sorted_atoms(factory, id));
//   }
//
// Z3 answers SAT / UNSAT only; the decision procedures phrase tautology,
// contradiction, falsifiability and equivalence as satisfiability queries.
//
// ============================================================================

#ifndef PROPLOGIC_Z3_SOLVER_HPP
#define PROPLOGIC_Z3_SOLVER_HPP

#include "proplogic/ast.hpp"
#include "proplogic/evaluator.hpp"

#include <z3++.h>

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace proplogic {

// ── Z3Result ────────────────────────────────────────────────────────────────

enum class Z3Result {
    SAT,
    UNSAT,
    UNKNOWN
};

// ── Z3Checker ───────────────────────────────────────────────────────────────
// Maintains a Z3 context and solver.  Formulas are added incrementally, and
// check() determines satisfiability of their conjunction.

class Z3Checker {
public:
    explicit Z3Checker(const FormulaFactory& factory);

    /// Assert `formula_id` (or its negation when `positive` is false).
    void add_formula(FormulaId formula_id, bool positive = true);

    /// Assert that the atoms do not take exactly the values in `model`.
    void block(const Interpretation& model);

    /// Check satisfiability of all added formulas.
    Z3Result check();

    /// Reset the solver to empty state.
    void reset();

    /// Model of the last SAT check() restricted to `atoms`.  Atoms the
    /// solver left unconstrained are reported as false.  Returns nullopt if
    /// the last check() was not SAT.
    std::optional<Interpretation> get_model(const std::vector<std::string>& atoms);

private:
    // Convert a formula to a Z3 boolean expression.  Shared sub-formulas are
    // translated once.
    z3::expr to_z3(FormulaId id);

    // Get or create a Z3 boolean variable for the given atom name.
    z3::expr get_bool_var(const std::string& name);

    const FormulaFactory& factory_;
    z3::context          ctx_;
    z3::solver           solver_;
    Z3Result             last_ = Z3Result::UNKNOWN;

    std::unordered_map<std::string, std::unique_ptr<z3::expr>> bool_vars_;
    std::unordered_map<FormulaId, std::unique_ptr<z3::expr>>   translated_;
};

}  // namespace proplogic

#endif  // PROPLOGIC_Z3_SOLVER_HPP
