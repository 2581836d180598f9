// ============================================================================
// evaluator.cpp — Interpretations, partial evaluation, row evaluation
// ============================================================================

#include "proplogic/evaluator.hpp"
#include "proplogic/errors.hpp"
#include "proplogic/traversal.hpp"

#include <stdexcept>
#include <unordered_map>

namespace proplogic {

// ============================================================================
// Interpretation
// ============================================================================

Interpretation::Interpretation(
    std::initializer_list<std::pair<const std::string, bool>> values) {
    for (const auto& [name, value] : values) {
        if (!is_valid_atom_name(name)) throw InvalidAtomNameError(name);
        values_[name] = value;
    }
}

Interpretation::Interpretation(const std::vector<std::string>& names,
                               const std::vector<bool>& values) {
    if (names.size() != values.size()) {
        throw std::invalid_argument("Interpretation: " + std::to_string(names.size()) +
                                    " names but " + std::to_string(values.size()) +
                                    " values");
    }
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (!is_valid_atom_name(names[i])) throw InvalidAtomNameError(names[i]);
        values_[names[i]] = values[i];
    }
}

Interpretation Interpretation::with(const std::string& name, bool value) const {
    if (!is_valid_atom_name(name)) throw InvalidAtomNameError(name);
    Interpretation copy = *this;
    copy.values_[name] = value;
    return copy;
}

std::optional<bool> Interpretation::lookup(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

bool Interpretation::binds(const std::string& name) const {
    return values_.count(name) != 0;
}

std::string Interpretation::to_string() const {
    std::string out = "{";
    bool first = true;
    for (const auto& [name, value] : values_) {
        if (!first) out += ", ";
        first = false;
        out += name + "=" + (value ? "1" : "0");
    }
    out += "}";
    return out;
}

// ============================================================================
// Partial evaluation
// ============================================================================
//
// Each connective first reduces its left operand; if that alone decides the
// result the right operand is never visited.  Otherwise constants are folded
// out of the residual:
//
//   T & b → b        F | b → b        F -> b → T       a -> T → T
//   T -> b → b       a -> F → ~a      T <-> b → b      F <-> b → ~b
//   T ^ b → ~b       F ^ b → b        (and the mirrored cases)

namespace {

class Reducer {
public:
    Reducer(const Interpretation& interp, FormulaFactory& f) : interp_(interp), f_(f) {}

    FormulaId reduce(FormulaId id) {
        auto hit = memo_.find(id);
        if (hit != memo_.end()) return hit->second;
        FormulaId r = reduce_node(id);
        memo_.emplace(id, r);
        return r;
    }

private:
    std::optional<bool> value(FormulaId id) const { return f_.constant_value(id); }

    FormulaId negate(FormulaId id) {
        if (auto v = value(id)) return f_.make_constant(!*v);
        return f_.make_not(id);
    }

    FormulaId reduce_node(FormulaId id) {
        // Copy before recursing: make_* may reallocate the node storage.
        NodeKind  kind   = f_.node(id).kind;
        FormulaId child0 = f_.node(id).children[0];
        FormulaId child1 = f_.node(id).children[1];

        switch (kind) {
            case NodeKind::True:
            case NodeKind::False:
                return id;

            case NodeKind::Atom: {
                std::optional<bool> v = interp_.lookup(f_.node(id).atom_name);
                return v ? f_.make_constant(*v) : id;
            }

            case NodeKind::Not:
                return negate(reduce(child0));

            case NodeKind::And: {
                FormulaId a = reduce(child0);
                if (value(a) == false) return a;
                FormulaId b = reduce(child1);
                if (value(b) == false) return b;
                if (value(a) == true) return b;
                if (value(b) == true) return a;
                return f_.make_and(a, b);
            }

            case NodeKind::Or: {
                FormulaId a = reduce(child0);
                if (value(a) == true) return a;
                FormulaId b = reduce(child1);
                if (value(b) == true) return b;
                if (value(a) == false) return b;
                if (value(b) == false) return a;
                return f_.make_or(a, b);
            }

            case NodeKind::Implies: {
                FormulaId a = reduce(child0);
                if (value(a) == false) return f_.make_true();
                FormulaId b = reduce(child1);
                if (value(b) == true) return b;
                if (value(a) == true) return b;
                if (value(b) == false) return negate(a);
                return f_.make_implies(a, b);
            }

            case NodeKind::Iff:
            case NodeKind::Xor: {
                FormulaId a = reduce(child0);
                FormulaId b = reduce(child1);
                bool flip = (kind == NodeKind::Xor);
                if (auto va = value(a)) return (*va != flip) ? b : negate(b);
                if (auto vb = value(b)) return (*vb != flip) ? a : negate(a);
                return f_.make_binary(kind, a, b);
            }
        }
        return id;
    }

    const Interpretation&                    interp_;
    FormulaFactory&                          f_;
    std::unordered_map<FormulaId, FormulaId> memo_;
};

}  // namespace

FormulaId evaluate(FormulaId id, const Interpretation& interp, FormulaFactory& f) {
    Reducer reducer(interp, f);
    return reducer.reduce(id);
}

bool evaluate_bool(FormulaId id, const Interpretation& interp, FormulaFactory& f) {
    FormulaId residual = evaluate(id, interp, f);
    if (auto v = f.constant_value(residual)) return *v;
    throw UnboundAtomError(get_atoms(f, residual));
}

// ============================================================================
// RowEvaluator
// ============================================================================

RowEvaluator::RowEvaluator(const FormulaFactory& f, FormulaId id,
                           std::vector<std::string> atoms)
    : atoms_(std::move(atoms)) {
    if (atoms_.size() > kMaxAtoms) {
        throw std::length_error("RowEvaluator: " + std::to_string(atoms_.size()) +
                                " atoms cannot be enumerated");
    }

    std::unordered_map<std::string, std::uint32_t> atom_index;
    for (std::size_t i = 0; i < atoms_.size(); ++i) {
        atom_index.emplace(atoms_[i], static_cast<std::uint32_t>(i));
    }

    // Post-order over distinct ids; every node gets one program slot.
    std::unordered_map<FormulaId, std::uint32_t> slot;
    std::vector<std::pair<FormulaId, bool>>      stack{{id, false}};
    std::vector<std::string>                     missing;

    while (!stack.empty()) {
        auto [cur, expanded] = stack.back();
        stack.pop_back();
        if (slot.count(cur)) continue;

        const FormulaNode& n = f.node(cur);
        if (!expanded) {
            stack.push_back({cur, true});
            if (n.children[1] != kInvalidId) stack.push_back({n.children[1], false});
            if (n.children[0] != kInvalidId) stack.push_back({n.children[0], false});
            continue;
        }

        Step step{n.kind};
        switch (n.kind) {
            case NodeKind::True:
            case NodeKind::False:
                break;
            case NodeKind::Atom: {
                auto it = atom_index.find(n.atom_name);
                if (it == atom_index.end()) {
                    missing.push_back(n.atom_name);
                } else {
                    step.a = it->second;
                }
                break;
            }
            case NodeKind::Not:
                step.a = slot.at(n.children[0]);
                break;
            case NodeKind::And:
            case NodeKind::Or:
            case NodeKind::Implies:
            case NodeKind::Iff:
            case NodeKind::Xor:
                step.a = slot.at(n.children[0]);
                step.b = slot.at(n.children[1]);
                break;
        }
        slot.emplace(cur, static_cast<std::uint32_t>(program_.size()));
        program_.push_back(step);
    }

    if (!missing.empty()) {
        throw UnboundAtomError(std::move(missing));
    }
}

bool RowEvaluator::operator()(std::uint64_t row) const {
    std::vector<char> v(program_.size());
    for (std::size_t i = 0; i < program_.size(); ++i) {
        const Step& s = program_[i];
        switch (s.kind) {
            case NodeKind::True:    v[i] = 1; break;
            case NodeKind::False:   v[i] = 0; break;
            case NodeKind::Atom:    v[i] = atom_value(row, s.a); break;
            case NodeKind::Not:     v[i] = !v[s.a]; break;
            case NodeKind::And:     v[i] = v[s.a] && v[s.b]; break;
            case NodeKind::Or:      v[i] = v[s.a] || v[s.b]; break;
            case NodeKind::Implies: v[i] = !v[s.a] || v[s.b]; break;
            case NodeKind::Iff:     v[i] = (v[s.a] != 0) == (v[s.b] != 0); break;
            case NodeKind::Xor:     v[i] = (v[s.a] != 0) != (v[s.b] != 0); break;
        }
    }
    return v.back() != 0;
}

}  // namespace proplogic
