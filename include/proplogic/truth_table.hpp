// ============================================================================
// proplogic/truth_table.hpp — Truth-table generation
// ============================================================================
//
// The table lists every total assignment over the formula's atoms, sorted
// lexicographically, in binary counting order: false = 0, true = 1, the
// first atom varies slowest.  A formula over n atoms has exactly 2^n rows;
// a formula without atoms has one row holding its constant value.
//
// Rows are independent, so with PROPLOGIC_USE_OPENMP the table is filled by
// a parallel loop.  The result is identical to the sequential one.
//
// ============================================================================

#ifndef PROPLOGIC_TRUTH_TABLE_HPP
#define PROPLOGIC_TRUTH_TABLE_HPP

#include "proplogic/ast.hpp"
#include "proplogic/evaluator.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace proplogic {

// ── TruthTable ──────────────────────────────────────────────────────────────

struct TruthTable {
    struct Row {
        std::vector<bool> values;   // parallel to TruthTable::atoms
        bool              result = false;
    };

    std::vector<std::string> atoms;
    std::vector<Row>         rows;

    /// The interpretation of row `row`.  Throws std::out_of_range.
    Interpretation assignment(std::size_t row) const;

    /// Plain-text rendering, one line per row, 1/0 for true/false.
    std::string to_string() const;
};

/// Build the truth table of `id`.  `num_threads` follows the OpenMP
/// convention (0 = runtime default, 1 = sequential).  Throws
/// std::length_error for more than RowEvaluator::kMaxAtoms atoms.
TruthTable get_truth_table(FormulaId id, const FormulaFactory& f, int num_threads = 0);

}  // namespace proplogic

#endif  // PROPLOGIC_TRUTH_TABLE_HPP
