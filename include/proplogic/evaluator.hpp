// ============================================================================
// proplogic/evaluator.hpp — Interpretations and formula evaluation
// ============================================================================
//
// evaluate() reduces a formula under an Interpretation.  The result is
// always a formula: True/False when every atom is bound, otherwise a
// residual formula over the unbound atoms in which every decided operand
// has been folded away.
//
// Semantics:
//   ~a        standard
//   a & b     standard, short-circuits on a false operand
//   a | b     standard, short-circuits on a true operand
//   a -> b    ~a | b
//   a <-> b   (a & b) | (~a & ~b)
//   a ^ b     ~(a <-> b)
//
// ============================================================================

#ifndef PROPLOGIC_EVALUATOR_HPP
#define PROPLOGIC_EVALUATOR_HPP

#include "proplogic/ast.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace proplogic {

// ── Interpretation ──────────────────────────────────────────────────────────
// Immutable mapping from atom name to truth value.  A lookup miss means the
// atom is unbound; it is not an error.

class Interpretation {
public:
    Interpretation() = default;

    /// Throws InvalidAtomNameError for a malformed name.
    Interpretation(std::initializer_list<std::pair<const std::string, bool>> values);

    /// Bind `names[i]` to `values[i]`.  Throws std::invalid_argument on a
    /// length mismatch and InvalidAtomNameError for a malformed name.
    Interpretation(const std::vector<std::string>& names, const std::vector<bool>& values);

    /// Copy of this interpretation with `name` bound to `value`.
    Interpretation with(const std::string& name, bool value) const;

    std::optional<bool> lookup(const std::string& name) const;
    bool                binds(const std::string& name) const;
    std::size_t         size() const noexcept { return values_.size(); }
    bool                empty() const noexcept { return values_.empty(); }

    /// Bindings in name order.
    const std::map<std::string, bool>& values() const noexcept { return values_; }

    /// "{P=1, Q=0}".
    std::string to_string() const;

    bool operator==(const Interpretation& o) const { return values_ == o.values_; }
    bool operator!=(const Interpretation& o) const { return values_ != o.values_; }

private:
    std::map<std::string, bool> values_;
};

// ── Evaluation ──────────────────────────────────────────────────────────────

/// Reduce `id` under `interp`.  Never fails; unbound atoms stay in place.
FormulaId evaluate(FormulaId id, const Interpretation& interp, FormulaFactory& f);

/// Reduce and unwrap to a primitive boolean.  Throws UnboundAtomError
/// naming the unbound atoms when the result is not a constant.
bool evaluate_bool(FormulaId id, const Interpretation& interp, FormulaFactory& f);

// ── RowEvaluator ────────────────────────────────────────────────────────────
// Read-only evaluator for total assignments, used by the enumeration
// engines.  The formula DAG is flattened once into a post-order program;
// each call evaluates it into a local buffer without building nodes, so one
// RowEvaluator may be shared by several threads.
//
// A row is a bit pattern over `atoms`: atoms[0] is the most significant bit,
// atoms[n-1] the least significant, true = 1.

class RowEvaluator {
public:
    /// Widest row a signed 64-bit loop counter can still enumerate.
    static constexpr std::size_t kMaxAtoms = 62;

    /// Throws UnboundAtomError if the formula mentions an atom not in
    /// `atoms`, std::length_error if there are more than kMaxAtoms atoms.
    RowEvaluator(const FormulaFactory& f, FormulaId id, std::vector<std::string> atoms);

    bool operator()(std::uint64_t row) const;

    /// Value of atoms[index] in `row`.
    bool atom_value(std::uint64_t row, std::size_t index) const noexcept {
        return ((row >> (atoms_.size() - 1 - index)) & 1u) != 0;
    }

    const std::vector<std::string>& atoms() const noexcept { return atoms_; }

    /// Number of rows, 2^atoms().size().
    std::uint64_t row_count() const noexcept { return std::uint64_t{1} << atoms_.size(); }

private:
    struct Step {
        NodeKind      kind;
        std::uint32_t a = 0;   // operand slot, or atom index for Atom
        std::uint32_t b = 0;
    };

    std::vector<std::string> atoms_;
    std::vector<Step>        program_;   // result is in the last slot
};

}  // namespace proplogic

#endif  // PROPLOGIC_EVALUATOR_HPP
