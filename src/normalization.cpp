// ============================================================================
// normalization.cpp — Flattening and negation normal form
// ============================================================================
//
// Both phases are recursive, bottom-up rebuilds of the tree.  Operator
// spellings written by the drafter ("not" vs "!") are kept on nodes that
// are only copied; nodes created by a rewrite use the canonical spelling.
//
// ============================================================================

#include "rulemap/normalization.hpp"

namespace rulemap {

namespace {

// Rebuild `node` with every operand passed through `fn`.
template <typename Fn>
ExprNode map_operands(const ExprNode& node, Fn fn) {
    ExprNode out = node;
    for (auto& child : out.operands) {
        child = fn(child);
    }
    return out;
}

OperatorKind flip_comparison(OperatorKind op) noexcept {
    switch (op) {
        case OperatorKind::Greater:   return OperatorKind::LessEq;
        case OperatorKind::GreaterEq: return OperatorKind::Less;
        case OperatorKind::Less:      return OperatorKind::GreaterEq;
        case OperatorKind::LessEq:    return OperatorKind::Greater;
        case OperatorKind::Equal:     return OperatorKind::NotEqual;
        case OperatorKind::NotEqual:  return OperatorKind::Equal;
        default:                      return OperatorKind::Unknown;
    }
}

bool is_negation(const ExprNode& node) noexcept {
    return node.is_operation() && node.op == OperatorKind::Not && node.operands.size() == 1;
}

}  // namespace

// ============================================================================
// Phase 1: Flatten
// ============================================================================
//
//   and(a, and(b, c))      →  and(a, b, c)
//   or(or(a, b), c)        →  or(a, b, c)
//
// A nested node is spliced only when it has the same operator as its
// parent; and/or mixtures are left as written.

ExprNode flatten(const ExprNode& node) {
    if (!node.is_operation()) return node;

    if (node.op != OperatorKind::And && node.op != OperatorKind::Or) {
        return map_operands(node, [](const ExprNode& c) { return flatten(c); });
    }

    ExprNode out = node;
    out.operands.clear();
    for (const auto& child : node.operands) {
        ExprNode flat = flatten(child);
        if (flat.is_operation() && flat.op == node.op) {
            for (auto& grandchild : flat.operands) {
                out.operands.push_back(std::move(grandchild));
            }
        } else {
            out.operands.push_back(std::move(flat));
        }
    }
    return out;
}

// ============================================================================
// Phase 2: Negation normal form
// ============================================================================

static ExprNode negate(const ExprNode& node);

ExprNode to_nnf(const ExprNode& node) {
    if (!node.is_operation()) return node;

    if (is_negation(node)) {
        return negate(node.operands[0]);
    }
    return map_operands(node, [](const ExprNode& c) { return to_nnf(c); });
}

// NNF of ¬node.
static ExprNode negate(const ExprNode& node) {
    // ¬true → false, ¬false → true
    if (node.is_literal() && node.literal.kind == LiteralKind::Bool) {
        return ExprNode::lit(Literal::of_bool(!node.literal.boolean));
    }

    if (!node.is_operation()) {
        return make_not(node);
    }

    // ¬¬φ → φ
    if (is_negation(node)) {
        return to_nnf(node.operands[0]);
    }

    // De Morgan
    if ((node.op == OperatorKind::And || node.op == OperatorKind::Or) &&
        !node.operands.empty()) {
        std::vector<ExprNode> negated;
        negated.reserve(node.operands.size());
        for (const auto& child : node.operands) {
            negated.push_back(negate(child));
        }
        OperatorKind dual = node.op == OperatorKind::And ? OperatorKind::Or : OperatorKind::And;
        return ExprNode::operation(dual, std::move(negated));
    }

    // ¬(a > b) → a <= b, etc.
    if (is_comparison(node.op) && node.operands.size() == 2) {
        std::vector<ExprNode> operands = {to_nnf(node.operands[0]), to_nnf(node.operands[1])};
        return ExprNode::operation(flip_comparison(node.op), std::move(operands));
    }

    // in, if, arithmetic, unknown operators: negation stays on top.
    return make_not(to_nnf(node));
}

// ============================================================================
// Combined
// ============================================================================

ExprNode normalize(const ExprNode& node) {
    return flatten(to_nnf(node));
}

}  // namespace rulemap
