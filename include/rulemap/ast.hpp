// ============================================================================
// rulemap/ast.hpp — Expression tree for drafted rules
// ============================================================================
//
// Design notes:
//
//   A rule is a tree of ExprNode values.  Each node is one of three kinds,
//   selected by NodeKind:
//
//     - VarRef    : reference to a registry key ("var" in JSON Logic)
//     - Literal   : bool, number, string or list constant
//     - Operation : operator applied to an ordered list of operands
//
//   Operands are held by value, so ownership runs strictly from parent to
//   child and the tree cannot contain cycles.  Every switch over NodeKind
//   and OperatorKind in the code base is exhaustive; adding an operator is
//   a compile-time checked change.
//
//   Operator names that are not part of the grammar are kept as
//   OperatorKind::Unknown together with their spelling so that the
//   validator can report them instead of the parser rejecting the rule.
//
// ============================================================================

#ifndef RULEMAP_AST_HPP
#define RULEMAP_AST_HPP

#include "rulemap/utils.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace rulemap {

// ── NodeKind ────────────────────────────────────────────────────────────────

enum class NodeKind : std::uint8_t {
    VarRef,
    Literal,
    Operation
};

// ── OperatorKind ────────────────────────────────────────────────────────────

enum class OperatorKind : std::uint8_t {
    // Boolean combinators
    And,        // and
    Or,         // or
    Not,        // ! (also accepted as "not")

    // Comparisons
    Greater,    // >
    GreaterEq,  // >=
    Less,       // <
    LessEq,     // <=
    Equal,      // ==
    NotEqual,   // !=

    // Membership
    In,         // in

    // Conditional and arithmetic (outside the default allowed set)
    If,         // if
    Plus,       // +
    Minus,      // -
    Times,      // *
    Divide,     // /

    // Anything else the drafting step produced
    Unknown
};

/// Canonical JSON Logic spelling of an operator ("?" for Unknown).
const char* operator_name(OperatorKind op) noexcept;

/// Map a spelling to its operator; OperatorKind::Unknown when unrecognised.
OperatorKind parse_operator(std::string_view name) noexcept;

/// True for > >= < <= == !=.
bool is_comparison(OperatorKind op) noexcept;

/// True for the ordering subset > >= < <=.
bool is_ordering(OperatorKind op) noexcept;

/// True for + - * /.
bool is_arithmetic(OperatorKind op) noexcept;

using OperatorSet = std::set<OperatorKind>;

/// and, or, not, >, >=, <, <=, ==, !=, in
OperatorSet default_operators();

// ── Literal ─────────────────────────────────────────────────────────────────

enum class LiteralKind : std::uint8_t {
    Bool,
    Number,
    String,
    List
};

const char* literal_kind_name(LiteralKind k) noexcept;

struct Literal {
    LiteralKind          kind = LiteralKind::Number;
    bool                 boolean = false;
    double               number = 0.0;
    std::string          text;
    std::vector<Literal> items;   // List only

    static Literal of_bool(bool b);
    static Literal of_number(double v);
    static Literal of_string(std::string s);
    static Literal of_list(std::vector<Literal> items);

    bool operator==(const Literal& o) const;
};

// ── ExprNode ────────────────────────────────────────────────────────────────

struct ExprNode {
    NodeKind              kind = NodeKind::Literal;
    std::string           key;        // VarRef
    Literal               literal;    // Literal
    OperatorKind          op = OperatorKind::Unknown;  // Operation
    std::string           op_name;    // Operation: spelling as written
    std::vector<ExprNode> operands;   // Operation

    static ExprNode var(std::string key);
    static ExprNode lit(Literal value);
    static ExprNode operation(OperatorKind op, std::vector<ExprNode> operands);
    /// Operation with an operator spelling outside the grammar.
    static ExprNode unknown_operation(std::string name,
                                      std::vector<ExprNode> operands);

    bool is_var() const noexcept { return kind == NodeKind::VarRef; }
    bool is_literal() const noexcept { return kind == NodeKind::Literal; }
    bool is_operation() const noexcept { return kind == NodeKind::Operation; }

    bool operator==(const ExprNode& o) const;
};

// ── Printing ────────────────────────────────────────────────────────────────

/// nlohmann conversion hooks, so `Json j = node;` yields the JSON Logic form.
void to_json(Json& j, const Literal& lit);
void to_json(Json& j, const ExprNode& node);

/// Compact JSON Logic text, e.g. {">":[{"var":"bureau.score"},700]}
std::string to_json(const ExprNode& node);
std::string to_json(const Literal& lit);

/// Fully parenthesised infix form, e.g. (bureau.score > 700)
std::string to_string(const ExprNode& node);

// ── Measurements ────────────────────────────────────────────────────────────

/// Number of node levels; a single leaf has depth 1.
std::size_t rule_depth(const ExprNode& node);

/// Total node count (list literals count as one node).
std::size_t rule_size(const ExprNode& node);

/// Every VarRef key in the tree, in first-occurrence order, without repeats.
std::vector<std::string> referenced_keys(const ExprNode& node);

// ── Builders ────────────────────────────────────────────────────────────────
// Convenience constructors for rules assembled in code.

/// {op: [{"var": key}, value]}.  Throws std::invalid_argument when `op` is
/// not a comparison operator.
ExprNode make_condition(const std::string& key, OperatorKind op, Literal value);

/// A single condition is returned as-is.  Throws std::invalid_argument on an
/// empty list.
ExprNode make_and(std::vector<ExprNode> conditions);
ExprNode make_or(std::vector<ExprNode> conditions);

ExprNode make_not(ExprNode operand);
ExprNode make_in(ExprNode value, std::vector<Literal> items);
ExprNode make_if(ExprNode condition, ExprNode then_rule,
                 std::optional<ExprNode> else_rule = std::nullopt);

}  // namespace rulemap

#endif  // RULEMAP_AST_HPP
