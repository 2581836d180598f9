// ============================================================================
// normalization.cpp — Equivalence / implication elimination, NNF, CNF, DNF
// ============================================================================
//
// Each phase is a recursive, bottom-up transformation over the interned
// formula DAG.  Every phase memoises on FormulaId, so repeated sub-formulas
// are normalised at most once.
//
// IMPORTANT: When recursively calling these functions, we must copy child IDs
// *before* the recursive call, because the call may grow the factory and
// invalidate any references to FormulaNode (e.g., `const FormulaNode& n`).
//
// ============================================================================

#include "proplogic/normalization.hpp"

#include <unordered_map>
#include <utility>

namespace proplogic {

namespace {

using Memo = std::unordered_map<FormulaId, FormulaId>;

// ============================================================================
// Phase 1: Equivalence elimination
// ============================================================================

FormulaId elim_equiv(FormulaId id, FormulaFactory& f, Memo& memo) {
    auto hit = memo.find(id);
    if (hit != memo.end()) return hit->second;

    NodeKind  kind   = f.node(id).kind;
    FormulaId child0 = f.node(id).children[0];
    FormulaId child1 = f.node(id).children[1];

    FormulaId result = id;
    switch (kind) {
        // ── Leaves ──────────────────────────────────────────────────────
        case NodeKind::True:
        case NodeKind::False:
        case NodeKind::Atom:
            break;

        case NodeKind::Not:
            result = f.make_not(elim_equiv(child0, f, memo));
            break;

        case NodeKind::And:
        case NodeKind::Or:
        case NodeKind::Implies: {
            auto c0 = elim_equiv(child0, f, memo);
            auto c1 = elim_equiv(child1, f, memo);
            result = f.make_binary(kind, c0, c1);
            break;
        }

        // φ ↔ ψ  ≡  (φ ∧ ψ) ∨ (¬φ ∧ ¬ψ)
        case NodeKind::Iff: {
            auto c0 = elim_equiv(child0, f, memo);
            auto c1 = elim_equiv(child1, f, memo);
            auto both    = f.make_and(c0, c1);
            auto neither = f.make_and(f.make_not(c0), f.make_not(c1));
            result = f.make_or(both, neither);
            break;
        }

        // φ ⊕ ψ  ≡  (φ ∧ ¬ψ) ∨ (¬φ ∧ ψ)
        case NodeKind::Xor: {
            auto c0 = elim_equiv(child0, f, memo);
            auto c1 = elim_equiv(child1, f, memo);
            auto left_only  = f.make_and(c0, f.make_not(c1));
            auto right_only = f.make_and(f.make_not(c0), c1);
            result = f.make_or(left_only, right_only);
            break;
        }
    }

    memo.emplace(id, result);
    return result;
}

// ============================================================================
// Phase 2: Implication elimination
// ============================================================================

FormulaId elim_impl(FormulaId id, FormulaFactory& f, Memo& memo) {
    auto hit = memo.find(id);
    if (hit != memo.end()) return hit->second;

    NodeKind  kind   = f.node(id).kind;
    FormulaId child0 = f.node(id).children[0];
    FormulaId child1 = f.node(id).children[1];

    FormulaId result = id;
    switch (kind) {
        case NodeKind::True:
        case NodeKind::False:
        case NodeKind::Atom:
            break;

        case NodeKind::Not:
            result = f.make_not(elim_impl(child0, f, memo));
            break;

        // φ → ψ  ≡  ¬φ ∨ ψ
        case NodeKind::Implies: {
            auto c0 = elim_impl(child0, f, memo);
            auto c1 = elim_impl(child1, f, memo);
            result = f.make_or(f.make_not(c0), c1);
            break;
        }

        case NodeKind::And:
        case NodeKind::Or:
        case NodeKind::Iff:
        case NodeKind::Xor: {
            auto c0 = elim_impl(child0, f, memo);
            auto c1 = elim_impl(child1, f, memo);
            result = f.make_binary(kind, c0, c1);
            break;
        }
    }

    memo.emplace(id, result);
    return result;
}

// ============================================================================
// Phase 3: Negation Normal Form
// ============================================================================
//
// nnf() expects a formula built from constants, atoms, ¬, ∧ and ∨ only.
// negate_nnf() takes a formula already in NNF and returns the NNF of its
// negation, so a ¬ node is handled as negate_nnf(nnf(child)).

FormulaId negate_nnf(FormulaId id, FormulaFactory& f, Memo& memo) {
    auto hit = memo.find(id);
    if (hit != memo.end()) return hit->second;

    NodeKind  kind   = f.node(id).kind;
    FormulaId child0 = f.node(id).children[0];
    FormulaId child1 = f.node(id).children[1];

    FormulaId result = kInvalidId;
    switch (kind) {
        case NodeKind::True:  result = f.make_false(); break;
        case NodeKind::False: result = f.make_true(); break;
        case NodeKind::Atom:  result = f.make_not(id); break;

        // ¬¬p  ≡  p   (child is an atom in NNF)
        case NodeKind::Not:
            result = child0;
            break;

        // ¬(φ ∧ ψ)  ≡  ¬φ ∨ ¬ψ
        case NodeKind::And: {
            auto c0 = negate_nnf(child0, f, memo);
            auto c1 = negate_nnf(child1, f, memo);
            result = f.make_or(c0, c1);
            break;
        }

        // ¬(φ ∨ ψ)  ≡  ¬φ ∧ ¬ψ
        case NodeKind::Or: {
            auto c0 = negate_nnf(child0, f, memo);
            auto c1 = negate_nnf(child1, f, memo);
            result = f.make_and(c0, c1);
            break;
        }

        // Eliminated by phases 1 and 2.
        case NodeKind::Implies:
        case NodeKind::Iff:
        case NodeKind::Xor:
            result = f.make_not(id);
            break;
    }

    memo.emplace(id, result);
    return result;
}

class NnfBuilder {
public:
    explicit NnfBuilder(FormulaFactory& f) : f_(f) {}

    FormulaId run(FormulaId id) {
        auto hit = memo_.find(id);
        if (hit != memo_.end()) return hit->second;

        NodeKind  kind   = f_.node(id).kind;
        FormulaId child0 = f_.node(id).children[0];
        FormulaId child1 = f_.node(id).children[1];

        FormulaId result = id;
        switch (kind) {
            case NodeKind::True:
            case NodeKind::False:
            case NodeKind::Atom:
                break;

            case NodeKind::Not:
                result = negate_nnf(run(child0), f_, negated_);
                break;

            case NodeKind::And:
            case NodeKind::Or:
            case NodeKind::Implies:
            case NodeKind::Iff:
            case NodeKind::Xor: {
                auto c0 = run(child0);
                auto c1 = run(child1);
                result = f_.make_binary(kind, c0, c1);
                break;
            }
        }

        memo_.emplace(id, result);
        return result;
    }

private:
    FormulaFactory& f_;
    Memo            memo_;
    Memo            negated_;
};

// ============================================================================
// Phase 4: Distribution
// ============================================================================
//
// Distributor<Outer, Inner> rewrites an NNF formula so that `Outer` never
// appears below `Inner`.  CNF is Distributor<And, Or>; DNF is the mirror.
//
//   join(a, b)   with a, b already normal:
//     a = a1 Outer a2   →   join(a1, b) Outer join(a2, b)
//     b = b1 Outer b2   →   join(a, b1) Outer join(a, b2)
//     otherwise         →   a Inner b

template <NodeKind Outer, NodeKind Inner>
class Distributor {
public:
    explicit Distributor(FormulaFactory& f) : f_(f) {}

    FormulaId run(FormulaId id) {
        auto hit = memo_.find(id);
        if (hit != memo_.end()) return hit->second;

        NodeKind  kind   = f_.node(id).kind;
        FormulaId child0 = f_.node(id).children[0];
        FormulaId child1 = f_.node(id).children[1];

        FormulaId result = id;
        if (kind == Outer) {
            auto c0 = run(child0);
            auto c1 = run(child1);
            result = f_.make_binary(Outer, c0, c1);
        } else if (kind == Inner) {
            auto c0 = run(child0);
            auto c1 = run(child1);
            result = join(c0, c1);
        }
        // Anything else is a literal in NNF.

        memo_.emplace(id, result);
        return result;
    }

private:
    FormulaId join(FormulaId a, FormulaId b) {
        auto key = std::make_pair(a, b);
        auto hit = joined_.find(key);
        if (hit != joined_.end()) return hit->second;

        FormulaId result;
        if (f_.node(a).kind == Outer) {
            FormulaId a1 = f_.node(a).children[0];
            FormulaId a2 = f_.node(a).children[1];
            auto l = join(a1, b);
            auto r = join(a2, b);
            result = f_.make_binary(Outer, l, r);
        } else if (f_.node(b).kind == Outer) {
            FormulaId b1 = f_.node(b).children[0];
            FormulaId b2 = f_.node(b).children[1];
            auto l = join(a, b1);
            auto r = join(a, b2);
            result = f_.make_binary(Outer, l, r);
        } else {
            result = f_.make_binary(Inner, a, b);
        }

        joined_.emplace(key, result);
        return result;
    }

    struct PairHash {
        std::size_t operator()(const std::pair<FormulaId, FormulaId>& p) const noexcept {
            return (static_cast<std::size_t>(p.first) << 32) ^ p.second;
        }
    };

    FormulaFactory& f_;
    Memo            memo_;
    std::unordered_map<std::pair<FormulaId, FormulaId>, FormulaId, PairHash> joined_;
};

// ── Shape helpers ───────────────────────────────────────────────────────────

// True when `id` is a tree of `k` nodes whose leaves are literals.
bool is_flat(const FormulaFactory& f, FormulaId id, NodeKind k) {
    const FormulaNode& n = f.node(id);
    if (n.kind == k) {
        return is_flat(f, n.children[0], k) && is_flat(f, n.children[1], k);
    }
    return is_literal(f, id);
}

// True when `id` is a tree of `outer` nodes whose leaves are flat `inner`
// trees.
bool is_two_level(const FormulaFactory& f, FormulaId id, NodeKind outer, NodeKind inner) {
    const FormulaNode& n = f.node(id);
    if (n.kind == outer) {
        return is_two_level(f, n.children[0], outer, inner) &&
               is_two_level(f, n.children[1], outer, inner);
    }
    return is_flat(f, id, inner);
}

}  // namespace

// ============================================================================
// Public entry points
// ============================================================================

FormulaId eliminate_equivalences(FormulaId id, FormulaFactory& f) {
    Memo memo;
    return elim_equiv(id, f, memo);
}

FormulaId eliminate_implications(FormulaId id, FormulaFactory& f) {
    Memo memo;
    return elim_impl(id, f, memo);
}

FormulaId to_nnf(FormulaId id, FormulaFactory& f) {
    FormulaId step1 = eliminate_equivalences(id, f);
    FormulaId step2 = eliminate_implications(step1, f);
    NnfBuilder nnf(f);
    return nnf.run(step2);
}

FormulaId to_cnf(FormulaId id, FormulaFactory& f) {
    FormulaId nnf = to_nnf(id, f);
    Distributor<NodeKind::And, NodeKind::Or> dist(f);
    return dist.run(nnf);
}

FormulaId to_dnf(FormulaId id, FormulaFactory& f) {
    FormulaId nnf = to_nnf(id, f);
    Distributor<NodeKind::Or, NodeKind::And> dist(f);
    return dist.run(nnf);
}

bool is_literal(const FormulaFactory& f, FormulaId id) {
    const FormulaNode& n = f.node(id);
    switch (n.kind) {
        case NodeKind::True:
        case NodeKind::False:
        case NodeKind::Atom:
            return true;
        case NodeKind::Not:
            return f.node(n.children[0]).kind == NodeKind::Atom;
        default:
            return false;
    }
}

bool is_nnf(const FormulaFactory& f, FormulaId id) {
    const FormulaNode& n = f.node(id);
    switch (n.kind) {
        case NodeKind::True:
        case NodeKind::False:
        case NodeKind::Atom:
            return true;
        case NodeKind::Not:
            return f.node(n.children[0]).kind == NodeKind::Atom;
        case NodeKind::And:
        case NodeKind::Or:
            return is_nnf(f, n.children[0]) && is_nnf(f, n.children[1]);
        case NodeKind::Implies:
        case NodeKind::Iff:
        case NodeKind::Xor:
            return false;
    }
    return false;
}

bool is_cnf(const FormulaFactory& f, FormulaId id) {
    return is_two_level(f, id, NodeKind::And, NodeKind::Or);
}

bool is_dnf(const FormulaFactory& f, FormulaId id) {
    return is_two_level(f, id, NodeKind::Or, NodeKind::And);
}

}  // namespace proplogic
