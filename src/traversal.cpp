// ============================================================================
// traversal.cpp — Structural queries and substitution
// ============================================================================
//
// The queries that count positions walk the tree with an explicit stack.
// The ones that only care about distinct nodes (atoms, depth, contains,
// substitute) memoise on FormulaId, since interning turns shared subtrees
// into shared ids.
//
// ============================================================================

#include "proplogic/traversal.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace proplogic {

// ── get_atoms ───────────────────────────────────────────────────────────────

std::vector<std::string> get_atoms(const FormulaFactory& f, FormulaId id) {
    std::vector<std::string>      atoms;
    std::unordered_set<FormulaId> visited;
    std::vector<FormulaId>        stack{id};

    while (!stack.empty()) {
        FormulaId cur = stack.back();
        stack.pop_back();
        if (!visited.insert(cur).second) continue;

        const FormulaNode& n = f.node(cur);
        if (n.kind == NodeKind::Atom) {
            atoms.push_back(n.atom_name);  // each atom id is visited once
        }
        // Push right first so the left child is visited first.
        if (n.children[1] != kInvalidId) stack.push_back(n.children[1]);
        if (n.children[0] != kInvalidId) stack.push_back(n.children[0]);
    }
    return atoms;
}

std::vector<std::string> sorted_atoms(const FormulaFactory& f, FormulaId id) {
    std::vector<std::string> atoms = get_atoms(f, id);
    std::sort(atoms.begin(), atoms.end());
    return atoms;
}

std::vector<std::string> sorted_atoms(const FormulaFactory& f, FormulaId a, FormulaId b) {
    std::vector<std::string> atoms = get_atoms(f, a);
    for (std::string& name : get_atoms(f, b)) {
        atoms.push_back(std::move(name));
    }
    std::sort(atoms.begin(), atoms.end());
    atoms.erase(std::unique(atoms.begin(), atoms.end()), atoms.end());
    return atoms;
}

// ── get_subformulas ─────────────────────────────────────────────────────────

std::vector<FormulaId> get_subformulas(const FormulaFactory& f, FormulaId id) {
    std::vector<FormulaId> out;
    std::vector<FormulaId> stack{id};

    while (!stack.empty()) {
        FormulaId cur = stack.back();
        stack.pop_back();
        out.push_back(cur);

        const FormulaNode& n = f.node(cur);
        if (n.children[1] != kInvalidId) stack.push_back(n.children[1]);
        if (n.children[0] != kInvalidId) stack.push_back(n.children[0]);
    }
    return out;
}

// ── substitute ──────────────────────────────────────────────────────────────

static FormulaId substitute_rec(FormulaId id, const Substitution& mapping,
                                FormulaFactory& f,
                                std::unordered_map<FormulaId, FormulaId>& memo) {
    auto hit = memo.find(id);
    if (hit != memo.end()) return hit->second;

    // Copy node data BEFORE any recursive call: building nodes may grow the
    // factory and invalidate references into it.
    NodeKind    kind   = f.node(id).kind;
    FormulaId   child0 = f.node(id).children[0];
    FormulaId   child1 = f.node(id).children[1];

    FormulaId result = id;
    switch (kind) {
        case NodeKind::True:
        case NodeKind::False:
            break;

        case NodeKind::Atom: {
            auto it = mapping.find(f.node(id).atom_name);
            if (it != mapping.end()) result = it->second;
            break;
        }

        case NodeKind::Not:
            result = f.make_not(substitute_rec(child0, mapping, f, memo));
            break;

        case NodeKind::And:
        case NodeKind::Or:
        case NodeKind::Implies:
        case NodeKind::Iff:
        case NodeKind::Xor: {
            FormulaId c0 = substitute_rec(child0, mapping, f, memo);
            FormulaId c1 = substitute_rec(child1, mapping, f, memo);
            result = f.make_binary(kind, c0, c1);
            break;
        }
    }

    memo.emplace(id, result);
    return result;
}

FormulaId substitute(FormulaId id, const Substitution& mapping, FormulaFactory& f) {
    if (mapping.empty()) return id;
    std::unordered_map<FormulaId, FormulaId> memo;
    return substitute_rec(id, mapping, f, memo);
}

// ── Size queries ────────────────────────────────────────────────────────────

std::size_t node_count(const FormulaFactory& f, FormulaId id) {
    // Count per position without materialising the list.
    std::unordered_map<FormulaId, std::size_t> memo;
    std::vector<std::pair<FormulaId, bool>>    stack{{id, false}};

    while (!stack.empty()) {
        auto [cur, expanded] = stack.back();
        stack.pop_back();
        if (memo.count(cur)) continue;

        const FormulaNode& n = f.node(cur);
        if (!expanded) {
            stack.push_back({cur, true});
            if (n.children[0] != kInvalidId) stack.push_back({n.children[0], false});
            if (n.children[1] != kInvalidId) stack.push_back({n.children[1], false});
            continue;
        }
        std::size_t total = 1;
        if (n.children[0] != kInvalidId) total += memo.at(n.children[0]);
        if (n.children[1] != kInvalidId) total += memo.at(n.children[1]);
        memo.emplace(cur, total);
    }
    return memo.at(id);
}

std::size_t depth(const FormulaFactory& f, FormulaId id) {
    std::unordered_map<FormulaId, std::size_t> memo;
    std::vector<std::pair<FormulaId, bool>>    stack{{id, false}};

    while (!stack.empty()) {
        auto [cur, expanded] = stack.back();
        stack.pop_back();
        if (memo.count(cur)) continue;

        const FormulaNode& n = f.node(cur);
        if (!expanded) {
            stack.push_back({cur, true});
            if (n.children[0] != kInvalidId) stack.push_back({n.children[0], false});
            if (n.children[1] != kInvalidId) stack.push_back({n.children[1], false});
            continue;
        }
        std::size_t below = 0;
        if (n.children[0] != kInvalidId) below = std::max(below, memo.at(n.children[0]));
        if (n.children[1] != kInvalidId) below = std::max(below, memo.at(n.children[1]));
        memo.emplace(cur, below + 1);
    }
    return memo.at(id);
}

bool is_atomic(const FormulaFactory& f, FormulaId id) {
    NodeKind k = f.node(id).kind;
    return k == NodeKind::Atom || is_constant(k);
}

bool contains(const FormulaFactory& f, FormulaId id, FormulaId sub) {
    std::unordered_set<FormulaId> visited;
    std::vector<FormulaId>        stack{id};

    while (!stack.empty()) {
        FormulaId cur = stack.back();
        stack.pop_back();
        if (cur == sub) return true;
        if (!visited.insert(cur).second) continue;

        const FormulaNode& n = f.node(cur);
        if (n.children[0] != kInvalidId) stack.push_back(n.children[0]);
        if (n.children[1] != kInvalidId) stack.push_back(n.children[1]);
    }
    return false;
}

}  // namespace proplogic
