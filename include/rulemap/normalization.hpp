// ============================================================================
// rulemap/normalization.hpp — Flattening and negation normal form
// ============================================================================
//
// Rewrites a validated rule into a canonical shape that is easier to read
// back and to compare:
//
//   1. Flatten     — and(a, and(b, c))  ≡  and(a, b, c)   (same for or)
//   2. NNF         — push negation inward until it rests only on
//                    variables, literals, `in` or conditionals:
//
//        ¬¬φ              ≡   φ
//        ¬and(φ, ψ, …)    ≡   or(¬φ, ¬ψ, …)      (De Morgan)
//        ¬or(φ, ψ, …)     ≡   and(¬φ, ¬ψ, …)     (De Morgan)
//        ¬(a > b)         ≡   a <= b
//        ¬(a >= b)        ≡   a < b
//        ¬(a < b)         ≡   a >= b
//        ¬(a <= b)        ≡   a > b
//        ¬(a == b)        ≡   a != b
//        ¬(a != b)        ≡   a == b
//        ¬true / ¬false   ≡   false / true
//
// Both phases are pure functions.  Nodes with an unknown operator or the
// wrong operand count are copied unchanged, but the input is expected to
// have passed validation (depth is not re-checked here).
//
// ============================================================================

#ifndef RULEMAP_NORMALIZATION_HPP
#define RULEMAP_NORMALIZATION_HPP

#include "rulemap/ast.hpp"

namespace rulemap {

ExprNode flatten(const ExprNode& node);

ExprNode to_nnf(const ExprNode& node);

/// Chains: to_nnf → flatten.
ExprNode normalize(const ExprNode& node);

}  // namespace rulemap

#endif  // RULEMAP_NORMALIZATION_HPP
