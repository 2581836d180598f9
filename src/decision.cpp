// ============================================================================
// decision.cpp — Semantic decision procedures
// ============================================================================
//
// Every question reduces to "is there a row (assignment) on which the
// formula takes a given value?":
//
//   satisfiable    some row is true
//   falsifiable    some row is false
//   tautology      no row is false
//   contradiction  no row is true
//   equivalent     no row on which a and b differ
//
// The truth-table backend searches the rows; the Z3 backend asserts the
// formula (or its negation) and asks for a model.
//
// ============================================================================

#include "proplogic/decision.hpp"

#include "proplogic/traversal.hpp"
#include "proplogic/z3_solver.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <stdexcept>
#include <string>

#ifdef PROPLOGIC_USE_OPENMP
#include <omp.h>
#endif

namespace proplogic {

const char* backend_name(Backend b) noexcept {
    switch (b) {
        case Backend::TruthTable: return "table";
        case Backend::Z3:         return "z3";
    }
    return "?";
}

const char* classification_name(Classification c) noexcept {
    switch (c) {
        case Classification::Tautology:     return "tautology";
        case Classification::Contradiction: return "contradiction";
        case Classification::Contingent:    return "contingent";
    }
    return "?";
}

namespace {

bool use_z3(const DecisionOptions& opts, std::size_t atom_count) {
    return opts.backend == Backend::Z3 ||
           atom_count > std::min(opts.table_atom_limit, kMaxEnumeratedAtoms);
}

// ── Truth-table backend ─────────────────────────────────────────────────────

// True when pred(row) holds for some row in [0, total).  Threads stop
// evaluating once any of them has found a witness.
template <typename Pred>
bool exists_row(std::uint64_t total, const Pred& pred, int num_threads) {
    std::atomic<bool> found{false};
    const auto n = static_cast<std::int64_t>(total);

#ifdef PROPLOGIC_USE_OPENMP
    if (num_threads > 0) omp_set_num_threads(num_threads);
    #pragma omp parallel for schedule(dynamic, 1024) shared(found) if(num_threads != 1)
#else
    (void)num_threads;
#endif
    for (std::int64_t r = 0; r < n; ++r) {
        if (found.load(std::memory_order_relaxed)) continue;
        if (pred(static_cast<std::uint64_t>(r))) {
            found.store(true, std::memory_order_relaxed);
        }
    }
    return found.load();
}

bool table_has_value(FormulaId id, const FormulaFactory& f, bool want,
                     const std::vector<std::string>& atoms, int num_threads) {
    RowEvaluator eval(f, id, atoms);
    return exists_row(eval.row_count(),
                      [&](std::uint64_t row) { return eval(row) == want; },
                      num_threads);
}

std::vector<Interpretation> table_models(FormulaId id, const FormulaFactory& f, bool want,
                                         const std::vector<std::string>& atoms,
                                         int num_threads) {
    RowEvaluator eval(f, id, atoms);
    const auto n = static_cast<std::int64_t>(eval.row_count());
    std::vector<char> hit(static_cast<std::size_t>(n), 0);

#ifdef PROPLOGIC_USE_OPENMP
    if (num_threads > 0) omp_set_num_threads(num_threads);
    #pragma omp parallel for schedule(static) if(num_threads != 1)
#else
    (void)num_threads;
#endif
    for (std::int64_t r = 0; r < n; ++r) {
        hit[static_cast<std::size_t>(r)] = eval(static_cast<std::uint64_t>(r)) == want;
    }

    // Collected sequentially so the output is in row order.
    std::vector<Interpretation> models;
    std::vector<bool> values(atoms.size());
    for (std::int64_t r = 0; r < n; ++r) {
        if (!hit[static_cast<std::size_t>(r)]) continue;
        for (std::size_t i = 0; i < atoms.size(); ++i) {
            values[i] = eval.atom_value(static_cast<std::uint64_t>(r), i);
        }
        models.emplace_back(atoms, values);
    }
    return models;
}

// ── Z3 backend ──────────────────────────────────────────────────────────────

bool z3_sat(Z3Checker& checker) {
    switch (checker.check()) {
        case Z3Result::SAT:   return true;
        case Z3Result::UNSAT: return false;
        case Z3Result::UNKNOWN:
            break;
    }
    throw std::runtime_error("z3 returned unknown for a propositional query");
}

bool z3_has_value(FormulaId id, const FormulaFactory& f, bool want) {
    Z3Checker checker(f);
    checker.add_formula(id, want);
    return z3_sat(checker);
}

// Row order: lexicographic on the values in sorted-atom order, false first.
bool row_less(const Interpretation& a, const Interpretation& b) {
    return std::lexicographical_compare(
        a.values().begin(), a.values().end(), b.values().begin(), b.values().end(),
        [](const auto& x, const auto& y) { return x.second < y.second; });
}

std::vector<Interpretation> z3_models(FormulaId id, const FormulaFactory& f, bool want,
                                      const std::vector<std::string>& atoms) {
    Z3Checker checker(f);
    checker.add_formula(id, want);

    std::vector<Interpretation> models;
    while (z3_sat(checker)) {
        auto model = checker.get_model(atoms);
        if (!model) break;
        checker.block(*model);
        models.push_back(std::move(*model));
    }
    std::sort(models.begin(), models.end(), row_less);
    return models;
}

// ── Dispatch ────────────────────────────────────────────────────────────────

bool has_value(FormulaId id, const FormulaFactory& f, bool want, const DecisionOptions& opts) {
    std::vector<std::string> atoms = sorted_atoms(f, id);
    if (use_z3(opts, atoms.size())) {
        return z3_has_value(id, f, want);
    }
    return table_has_value(id, f, want, atoms, opts.num_threads);
}

std::vector<Interpretation> models(FormulaId id, const FormulaFactory& f, bool want,
                                   const DecisionOptions& opts) {
    std::vector<std::string> atoms = sorted_atoms(f, id);
    if (use_z3(opts, atoms.size())) {
        return z3_models(id, f, want, atoms);
    }
    return table_models(id, f, want, atoms, opts.num_threads);
}

}  // namespace

// ============================================================================
// Public entry points
// ============================================================================

bool is_satisfiable(FormulaId id, const FormulaFactory& f, const DecisionOptions& opts) {
    return has_value(id, f, true, opts);
}

bool is_falsifiable(FormulaId id, const FormulaFactory& f, const DecisionOptions& opts) {
    return has_value(id, f, false, opts);
}

bool is_tautology(FormulaId id, const FormulaFactory& f, const DecisionOptions& opts) {
    return !is_falsifiable(id, f, opts);
}

bool is_contradiction(FormulaId id, const FormulaFactory& f, const DecisionOptions& opts) {
    return !is_satisfiable(id, f, opts);
}

bool is_equivalent(FormulaId a, FormulaId b, const FormulaFactory& f,
                   const DecisionOptions& opts) {
    if (a == b) return true;

    std::vector<std::string> atoms = sorted_atoms(f, a, b);
    if (use_z3(opts, atoms.size())) {
        Z3Checker checker(f);
        checker.add_formula(a, true);
        checker.add_formula(b, false);
        if (z3_sat(checker)) return false;
        checker.reset();
        checker.add_formula(a, false);
        checker.add_formula(b, true);
        return !z3_sat(checker);
    }

    RowEvaluator eval_a(f, a, atoms);
    RowEvaluator eval_b(f, b, atoms);
    return !exists_row(eval_a.row_count(),
                       [&](std::uint64_t row) { return eval_a(row) != eval_b(row); },
                       opts.num_threads);
}

Classification classify(FormulaId id, const FormulaFactory& f, const DecisionOptions& opts) {
    if (!is_satisfiable(id, f, opts)) return Classification::Contradiction;
    if (!is_falsifiable(id, f, opts)) return Classification::Tautology;
    return Classification::Contingent;
}

std::vector<Interpretation> satisfying_assignments(FormulaId id, const FormulaFactory& f,
                                                   const DecisionOptions& opts) {
    return models(id, f, true, opts);
}

std::vector<Interpretation> falsifying_assignments(FormulaId id, const FormulaFactory& f,
                                                   const DecisionOptions& opts) {
    return models(id, f, false, opts);
}

}  // namespace proplogic
