// ============================================================================
// rulemap/parser.hpp — Rule text parsing and decoding
// ============================================================================
//
// Rule text is read with nlohmann::json and then decoded into an ExprNode
// (JSON Logic subset):
//
//   {"var": "k"}  or  {"var": ["k", default]}   VarRef(k)
//   {"op": [a, b, ...]}                           Operation(op, a, b, ...)
//   {"op": a}                                     Operation(op, a)
//   [x, y, ...]                                   list Literal
//   "s" | 1.5 | true | false                      scalar Literal
//
// Objects with zero or several members and `null` are rejected.
//
// Every object and array counts as one nesting level.  An operation with
// an operand array uses two, so a rule of depth d needs up to 2d levels
// (one more for the drafting envelope).
//
// ============================================================================

#ifndef RULEMAP_PARSER_HPP
#define RULEMAP_PARSER_HPP

#include "rulemap/ast.hpp"
#include "rulemap/utils.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace rulemap {

inline constexpr std::size_t kDefaultMaxNesting = 256;

/// Nesting allowance that lets every rule up to `max_depth` levels reach
/// the validator: max(kDefaultMaxNesting, 2 * max_depth + 2).
std::size_t nesting_for_depth(std::size_t max_depth) noexcept;

// ── parse_json ──────────────────────────────────────────────────────────────
// Parses exactly one JSON document.  Syntax errors throw ParseError as
//   <line>: ERROR: <msg> at column <n>
// and documents nested deeper than `max_nesting` as
//   ERROR: nesting exceeds limit of <n>

Json parse_json(std::string_view input, std::size_t max_nesting = kDefaultMaxNesting);

// ── Rule decoding ───────────────────────────────────────────────────────────
// Structural errors throw ParseError as
//   ERROR: <msg> at <path>
// with paths in the validator's notation ($/and[0]/>[1]).

ExprNode decode_rule(const Json& value);

/// parse_json + decode_rule.
ExprNode parse_rule(std::string_view input, std::size_t max_nesting = kDefaultMaxNesting);

// ── Draft ───────────────────────────────────────────────────────────────────
// Output of the drafting collaborator: a rule and its explanation.

struct Draft {
    ExprNode                 rule;
    std::vector<std::string> explanation;
};

/// Accepts either a bare rule or the drafting envelope
///   {"json_logic": <rule>, "explanation": "..." | ["...", ...]}
Draft decode_draft(const Json& value);
Draft parse_draft(std::string_view input, std::size_t max_nesting = kDefaultMaxNesting);

}  // namespace rulemap

#endif  // RULEMAP_PARSER_HPP
