// ============================================================================
// simplify.cpp — Rule-based simplification to a fixpoint
// ============================================================================
//
// A pass rebuilds the formula from its simplified children and applies the
// local rules to each rebuilt node.  Interning makes "nothing fired" cheap
// to detect: the pass returns the very same FormulaId.
//
// ============================================================================

#include "proplogic/simplify.hpp"

#include <optional>
#include <unordered_map>

namespace proplogic {

namespace {

class Rewriter {
public:
    explicit Rewriter(FormulaFactory& f) : f_(f) {}

    FormulaId pass(FormulaId id) {
        auto hit = memo_.find(id);
        if (hit != memo_.end()) return hit->second;

        // Copy before recursing: make_* may reallocate the node storage.
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
                result = rewrite_not(pass(child0));
                break;
            case NodeKind::And:
            case NodeKind::Or:
            case NodeKind::Implies:
            case NodeKind::Iff:
            case NodeKind::Xor: {
                FormulaId a = pass(child0);
                FormulaId b = pass(child1);
                result = rewrite_binary(kind, a, b);
                break;
            }
        }

        memo_.emplace(id, result);
        return result;
    }

private:
    std::optional<bool> value(FormulaId id) const { return f_.constant_value(id); }

    bool is_kind(FormulaId id, NodeKind k) const { return f_.node(id).kind == k; }

    // True when `a` is ~b or `b` is ~a.
    bool complementary(FormulaId a, FormulaId b) const {
        return (is_kind(a, NodeKind::Not) && f_.node(a).children[0] == b) ||
               (is_kind(b, NodeKind::Not) && f_.node(b).children[0] == a);
    }

    // True when `outer` is a `k` node with `inner` as one of its operands.
    bool has_operand(FormulaId outer, NodeKind k, FormulaId inner) const {
        const FormulaNode& n = f_.node(outer);
        return n.kind == k && (n.children[0] == inner || n.children[1] == inner);
    }

    FormulaId rewrite_not(FormulaId a) {
        if (auto v = value(a)) return f_.make_constant(!*v);
        if (is_kind(a, NodeKind::Not)) return f_.node(a).children[0];
        return f_.make_not(a);
    }

    FormulaId rewrite_binary(NodeKind kind, FormulaId a, FormulaId b) {
        std::optional<bool> va = value(a);
        std::optional<bool> vb = value(b);

        switch (kind) {
            case NodeKind::And:
                if (va == false || vb == false) return f_.make_false();
                if (va == true) return b;
                if (vb == true) return a;
                if (a == b) return a;
                if (complementary(a, b)) return f_.make_false();
                if (has_operand(b, NodeKind::Or, a)) return a;
                if (has_operand(a, NodeKind::Or, b)) return b;
                return f_.make_and(a, b);

            case NodeKind::Or:
                if (va == true || vb == true) return f_.make_true();
                if (va == false) return b;
                if (vb == false) return a;
                if (a == b) return a;
                if (complementary(a, b)) return f_.make_true();
                if (has_operand(b, NodeKind::And, a)) return a;
                if (has_operand(a, NodeKind::And, b)) return b;
                return f_.make_or(a, b);

            case NodeKind::Implies:
                if (va == false || vb == true) return f_.make_true();
                if (va == true) return b;
                if (vb == false) return rewrite_not(a);
                if (a == b) return f_.make_true();
                return f_.make_implies(a, b);

            case NodeKind::Iff:
                if (va) return *va ? b : rewrite_not(b);
                if (vb) return *vb ? a : rewrite_not(a);
                if (a == b) return f_.make_true();
                if (complementary(a, b)) return f_.make_false();
                return f_.make_iff(a, b);

            case NodeKind::Xor:
                if (va) return *va ? rewrite_not(b) : b;
                if (vb) return *vb ? rewrite_not(a) : a;
                if (a == b) return f_.make_false();
                if (complementary(a, b)) return f_.make_true();
                return f_.make_xor(a, b);

            case NodeKind::True:
            case NodeKind::False:
            case NodeKind::Atom:
            case NodeKind::Not:
                break;
        }
        return f_.make_binary(kind, a, b);
    }

    FormulaFactory&                          f_;
    std::unordered_map<FormulaId, FormulaId> memo_;
};

}  // namespace

FormulaId simplify_once(FormulaId id, FormulaFactory& f) {
    Rewriter rw(f);
    return rw.pass(id);
}

FormulaId simplify(FormulaId id, FormulaFactory& f) {
    for (;;) {
        FormulaId next = simplify_once(id, f);
        if (next == id) return id;
        id = next;
    }
}

}  // namespace proplogic
