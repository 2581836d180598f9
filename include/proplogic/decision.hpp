// ============================================================================
// proplogic/decision.hpp — Semantic decision procedures
// ============================================================================
//
// Tautology, contradiction, satisfiability, falsifiability and equivalence,
// plus model enumeration and classification.
//
// Two backends answer the same questions:
//
//   TruthTable  enumerate all 2^n rows over the sorted atoms.  With
//               PROPLOGIC_USE_OPENMP the rows are split between threads and
//               the search stops as soon as a witness row is found.
//   Z3          one satisfiability query per question.
//
// Formulas with 64 or more distinct atoms cannot be enumerated and are sent
// to Z3 whatever the requested backend.
//
// ============================================================================

#ifndef PROPLOGIC_DECISION_HPP
#define PROPLOGIC_DECISION_HPP

#include "proplogic/ast.hpp"
#include "proplogic/evaluator.hpp"

#include <cstddef>
#include <vector>

namespace proplogic {

// ── Options ─────────────────────────────────────────────────────────────────

enum class Backend {
    TruthTable,
    Z3
};

const char* backend_name(Backend b) noexcept;

/// Widest formula the truth-table backend will ever enumerate.
inline constexpr std::size_t kMaxEnumeratedAtoms = RowEvaluator::kMaxAtoms;

/// Default hand-over point: formulas with more atoms are decided by Z3.
inline constexpr std::size_t kDefaultTableAtomLimit = 24;

struct DecisionOptions {
    Backend     backend          = Backend::TruthTable;
    int         num_threads      = 0;   // 0 = OpenMP default, 1 = sequential
    std::size_t table_atom_limit = kDefaultTableAtomLimit;   // capped at kMaxEnumeratedAtoms
};

// ── Classification ──────────────────────────────────────────────────────────

enum class Classification {
    Tautology,
    Contradiction,
    Contingent
};

const char* classification_name(Classification c) noexcept;

// ── Decision procedures ─────────────────────────────────────────────────────

bool is_tautology(FormulaId id, const FormulaFactory& f, const DecisionOptions& opts = {});
bool is_contradiction(FormulaId id, const FormulaFactory& f, const DecisionOptions& opts = {});
bool is_satisfiable(FormulaId id, const FormulaFactory& f, const DecisionOptions& opts = {});
bool is_falsifiable(FormulaId id, const FormulaFactory& f, const DecisionOptions& opts = {});

/// True when `a` and `b` agree under every assignment over the union of
/// their atoms.
bool is_equivalent(FormulaId a, FormulaId b, const FormulaFactory& f,
                   const DecisionOptions& opts = {});

Classification classify(FormulaId id, const FormulaFactory& f, const DecisionOptions& opts = {});

// ── Model enumeration ───────────────────────────────────────────────────────
// Every total interpretation over sorted_atoms(id) under which the formula
// is true (resp. false), in truth-table row order.

std::vector<Interpretation> satisfying_assignments(FormulaId id, const FormulaFactory& f,
                                                   const DecisionOptions& opts = {});
std::vector<Interpretation> falsifying_assignments(FormulaId id, const FormulaFactory& f,
                                                   const DecisionOptions& opts = {});

}  // namespace proplogic

#endif  // PROPLOGIC_DECISION_HPP
