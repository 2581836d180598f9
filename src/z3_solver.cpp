// ============================================================================
// z3_solver.cpp — Implementation of the Z3 satisfiability checker
// ============================================================================

#include "proplogic/z3_solver.hpp"

namespace proplogic {

// ── Z3Checker ───────────────────────────────────────────────────────────────

Z3Checker::Z3Checker(const FormulaFactory& factory)
    : factory_(factory), ctx_(), solver_(ctx_) {}

void Z3Checker::reset() {
    solver_.reset();
    last_ = Z3Result::UNKNOWN;
    bool_vars_.clear();
    translated_.clear();
}

z3::expr Z3Checker::get_bool_var(const std::string& name) {
    auto it = bool_vars_.find(name);
    if (it != bool_vars_.end()) {
        return *it->second;
    }
    auto var = std::make_unique<z3::expr>(ctx_.bool_const(name.c_str()));
    z3::expr result = *var;
    bool_vars_[name] = std::move(var);
    return result;
}

z3::expr Z3Checker::to_z3(FormulaId id) {
    auto it = translated_.find(id);
    if (it != translated_.end()) {
        return *it->second;
    }

    const FormulaNode& n = factory_.node(id);
    z3::expr result = ctx_.bool_val(false);

    switch (n.kind) {
        case NodeKind::True:
            result = ctx_.bool_val(true);
            break;
        case NodeKind::False:
            result = ctx_.bool_val(false);
            break;

        case NodeKind::Atom:
            result = get_bool_var(n.atom_name);
            break;

        case NodeKind::Not:
            result = !to_z3(n.children[0]);
            break;

        case NodeKind::And: {
            z3::expr lhs = to_z3(n.children[0]);
            z3::expr rhs = to_z3(n.children[1]);
            result = lhs && rhs;
            break;
        }

        case NodeKind::Or: {
            z3::expr lhs = to_z3(n.children[0]);
            z3::expr rhs = to_z3(n.children[1]);
            result = lhs || rhs;
            break;
        }

        case NodeKind::Implies: {
            z3::expr lhs = to_z3(n.children[0]);
            z3::expr rhs = to_z3(n.children[1]);
            result = z3::implies(lhs, rhs);
            break;
        }

        case NodeKind::Iff: {
            z3::expr lhs = to_z3(n.children[0]);
            z3::expr rhs = to_z3(n.children[1]);
            result = lhs == rhs;
            break;
        }

        case NodeKind::Xor: {
            z3::expr lhs = to_z3(n.children[0]);
            z3::expr rhs = to_z3(n.children[1]);
            result = lhs ^ rhs;
            break;
        }
    }

    translated_[id] = std::make_unique<z3::expr>(result);
    return result;
}

void Z3Checker::add_formula(FormulaId formula_id, bool positive) {
    z3::expr e = to_z3(formula_id);
    if (positive) {
        solver_.add(e);
    } else {
        solver_.add(!e);
    }
}

void Z3Checker::block(const Interpretation& model) {
    z3::expr clause = ctx_.bool_val(false);
    for (const auto& [name, value] : model.values()) {
        z3::expr var = get_bool_var(name);
        clause = clause || (value ? !var : var);
    }
    solver_.add(clause);
}

Z3Result Z3Checker::check() {
    z3::check_result result = solver_.check();

    switch (result) {
        case z3::sat:
            last_ = Z3Result::SAT;
            break;
        case z3::unsat:
            last_ = Z3Result::UNSAT;
            break;
        case z3::unknown:
            last_ = Z3Result::UNKNOWN;
            break;
    }

    return last_;
}

std::optional<Interpretation> Z3Checker::get_model(const std::vector<std::string>& atoms) {
    if (last_ != Z3Result::SAT) {
        return std::nullopt;
    }

    z3::model model = solver_.get_model();
    std::vector<bool> values;
    values.reserve(atoms.size());

    for (const std::string& name : atoms) {
        z3::expr value = model.eval(get_bool_var(name), true);
        values.push_back(value.is_true());
    }

    return Interpretation(atoms, values);
}

}  // namespace proplogic
