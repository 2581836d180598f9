// ============================================================================
// truth_table.cpp — Truth-table generation
// ============================================================================

#include "proplogic/truth_table.hpp"

#include "proplogic/traversal.hpp"

#include <cstdint>
#include <sstream>
#include <stdexcept>

#ifdef PROPLOGIC_USE_OPENMP
#include <omp.h>
#endif

namespace proplogic {

Interpretation TruthTable::assignment(std::size_t row) const {
    if (row >= rows.size()) {
        throw std::out_of_range("truth table row " + std::to_string(row) +
                                " out of range (" + std::to_string(rows.size()) +
                                " rows)");
    }
    return Interpretation(atoms, rows[row].values);
}

std::string TruthTable::to_string() const {
    // Column width is the atom name's width; values are centred-left under it.
    static const std::string kResult = "result";

    std::ostringstream out;
    for (const std::string& a : atoms) out << a << " | ";
    out << kResult << "\n";

    for (const std::string& a : atoms) out << std::string(a.size(), '-') << "-+-";
    out << std::string(kResult.size(), '-') << "\n";

    for (const Row& r : rows) {
        for (std::size_t i = 0; i < atoms.size(); ++i) {
            out << (r.values[i] ? '1' : '0') << std::string(atoms[i].size() - 1, ' ')
                << " | ";
        }
        out << (r.result ? '1' : '0') << "\n";
    }
    return out.str();
}

TruthTable get_truth_table(FormulaId id, const FormulaFactory& f, int num_threads) {
    RowEvaluator eval(f, id, sorted_atoms(f, id));

    TruthTable table;
    table.atoms = eval.atoms();
    table.rows.resize(static_cast<std::size_t>(eval.row_count()));

    const std::size_t   n     = table.atoms.size();
    const std::int64_t  total = static_cast<std::int64_t>(eval.row_count());

#ifdef PROPLOGIC_USE_OPENMP
    if (num_threads > 0) omp_set_num_threads(num_threads);
    #pragma omp parallel for schedule(static) if(num_threads != 1)
#else
    (void)num_threads;
#endif
    for (std::int64_t r = 0; r < total; ++r) {
        const auto bits = static_cast<std::uint64_t>(r);
        TruthTable::Row& row = table.rows[static_cast<std::size_t>(r)];
        row.values.resize(n);
        for (std::size_t i = 0; i < n; ++i) {
            row.values[i] = eval.atom_value(bits, i);
        }
        row.result = eval(bits);
    }

    return table;
}

}  // namespace proplogic
