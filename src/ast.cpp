// ============================================================================
// ast.cpp — Expression tree construction, printing and measurement
// ============================================================================

#include "rulemap/ast.hpp"
#include "rulemap/utils.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace rulemap {

// ── operator_name ───────────────────────────────────────────────────────────

const char* operator_name(OperatorKind op) noexcept {
    switch (op) {
        case OperatorKind::And:       return "and";
        case OperatorKind::Or:        return "or";
        case OperatorKind::Not:       return "!";
        case OperatorKind::Greater:   return ">";
        case OperatorKind::GreaterEq: return ">=";
        case OperatorKind::Less:      return "<";
        case OperatorKind::LessEq:    return "<=";
        case OperatorKind::Equal:     return "==";
        case OperatorKind::NotEqual:  return "!=";
        case OperatorKind::In:        return "in";
        case OperatorKind::If:        return "if";
        case OperatorKind::Plus:      return "+";
        case OperatorKind::Minus:     return "-";
        case OperatorKind::Times:     return "*";
        case OperatorKind::Divide:    return "/";
        case OperatorKind::Unknown:   return "?";
    }
    return "?";
}

OperatorKind parse_operator(std::string_view name) noexcept {
    if (name == "and")                  return OperatorKind::And;
    if (name == "or")                   return OperatorKind::Or;
    if (name == "!" || name == "not")   return OperatorKind::Not;
    if (name == ">")                    return OperatorKind::Greater;
    if (name == ">=")                   return OperatorKind::GreaterEq;
    if (name == "<")                    return OperatorKind::Less;
    if (name == "<=")                   return OperatorKind::LessEq;
    if (name == "==")                   return OperatorKind::Equal;
    if (name == "!=")                   return OperatorKind::NotEqual;
    if (name == "in")                   return OperatorKind::In;
    if (name == "if")                   return OperatorKind::If;
    if (name == "+")                    return OperatorKind::Plus;
    if (name == "-")                    return OperatorKind::Minus;
    if (name == "*")                    return OperatorKind::Times;
    if (name == "/")                    return OperatorKind::Divide;
    return OperatorKind::Unknown;
}

bool is_comparison(OperatorKind op) noexcept {
    return is_ordering(op) || op == OperatorKind::Equal || op == OperatorKind::NotEqual;
}

bool is_ordering(OperatorKind op) noexcept {
    return op == OperatorKind::Greater || op == OperatorKind::GreaterEq ||
           op == OperatorKind::Less || op == OperatorKind::LessEq;
}

bool is_arithmetic(OperatorKind op) noexcept {
    return op == OperatorKind::Plus || op == OperatorKind::Minus ||
           op == OperatorKind::Times || op == OperatorKind::Divide;
}

OperatorSet default_operators() {
    return {OperatorKind::And, OperatorKind::Or, OperatorKind::Not,
            OperatorKind::Greater, OperatorKind::GreaterEq,
            OperatorKind::Less, OperatorKind::LessEq,
            OperatorKind::Equal, OperatorKind::NotEqual,
            OperatorKind::In};
}

// ── Literal ─────────────────────────────────────────────────────────────────

const char* literal_kind_name(LiteralKind k) noexcept {
    switch (k) {
        case LiteralKind::Bool:   return "boolean";
        case LiteralKind::Number: return "number";
        case LiteralKind::String: return "string";
        case LiteralKind::List:   return "list";
    }
    return "?";
}

Literal Literal::of_bool(bool b) {
    Literal l;
    l.kind = LiteralKind::Bool;
    l.boolean = b;
    return l;
}

Literal Literal::of_number(double v) {
    Literal l;
    l.kind = LiteralKind::Number;
    l.number = v;
    return l;
}

Literal Literal::of_string(std::string s) {
    Literal l;
    l.kind = LiteralKind::String;
    l.text = std::move(s);
    return l;
}

Literal Literal::of_list(std::vector<Literal> items) {
    Literal l;
    l.kind = LiteralKind::List;
    l.items = std::move(items);
    return l;
}

bool Literal::operator==(const Literal& o) const {
    if (kind != o.kind) return false;
    switch (kind) {
        case LiteralKind::Bool:   return boolean == o.boolean;
        case LiteralKind::Number: return number == o.number;
        case LiteralKind::String: return text == o.text;
        case LiteralKind::List:   return items == o.items;
    }
    return false;
}

// ── ExprNode ────────────────────────────────────────────────────────────────

ExprNode ExprNode::var(std::string key) {
    ExprNode n;
    n.kind = NodeKind::VarRef;
    n.key = std::move(key);
    return n;
}

ExprNode ExprNode::lit(Literal value) {
    ExprNode n;
    n.kind = NodeKind::Literal;
    n.literal = std::move(value);
    return n;
}

ExprNode ExprNode::operation(OperatorKind op, std::vector<ExprNode> operands) {
    ExprNode n;
    n.kind = NodeKind::Operation;
    n.op = op;
    n.op_name = operator_name(op);
    n.operands = std::move(operands);
    return n;
}

ExprNode ExprNode::unknown_operation(std::string name, std::vector<ExprNode> operands) {
    ExprNode n;
    n.kind = NodeKind::Operation;
    n.op = OperatorKind::Unknown;
    n.op_name = std::move(name);
    n.operands = std::move(operands);
    return n;
}

// Spelling is not part of equality for known operators ("not" == "!").
bool ExprNode::operator==(const ExprNode& o) const {
    if (kind != o.kind) return false;
    switch (kind) {
        case NodeKind::VarRef:
            return key == o.key;
        case NodeKind::Literal:
            return literal == o.literal;
        case NodeKind::Operation:
            if (op != o.op) return false;
            if (op == OperatorKind::Unknown && op_name != o.op_name) return false;
            return operands == o.operands;
    }
    return false;
}

// ── to_json ─────────────────────────────────────────────────────────────────

void to_json(Json& j, const Literal& lit) {
    switch (lit.kind) {
        case LiteralKind::Bool:
            j = lit.boolean;
            return;
        case LiteralKind::Number:
            j = json_number(lit.number);
            return;
        case LiteralKind::String:
            j = lit.text;
            return;
        case LiteralKind::List:
            j = Json::array();
            for (const auto& item : lit.items) {
                Json element;
                to_json(element, item);
                j.push_back(std::move(element));
            }
            return;
    }
    j = nullptr;
}

void to_json(Json& j, const ExprNode& node) {
    switch (node.kind) {
        case NodeKind::VarRef:
            j = Json::object();
            j["var"] = node.key;
            return;
        case NodeKind::Literal:
            to_json(j, node.literal);
            return;
        case NodeKind::Operation: {
            Json args = Json::array();
            for (const auto& operand : node.operands) {
                Json arg;
                to_json(arg, operand);
                args.push_back(std::move(arg));
            }
            j = Json::object();
            j[node.op_name] = std::move(args);
            return;
        }
    }
    j = nullptr;
}

std::string to_json(const Literal& lit) {
    Json j;
    to_json(j, lit);
    return dump_json(j);
}

std::string to_json(const ExprNode& node) {
    Json j;
    to_json(j, node);
    return dump_json(j);
}

// ── to_string ───────────────────────────────────────────────────────────────
// Binary operators print infix, everything else prefix with parenthesised
// arguments.

std::string to_string(const ExprNode& node) {
    switch (node.kind) {
        case NodeKind::VarRef:
            return node.key;
        case NodeKind::Literal:
            return to_json(node.literal);
        case NodeKind::Operation:
            break;
    }

    const auto& args = node.operands;
    if (node.op == OperatorKind::Not && args.size() == 1) {
        return "!" + to_string(args[0]);
    }

    bool infix = node.op != OperatorKind::Unknown && node.op != OperatorKind::If &&
                 node.op != OperatorKind::Not && args.size() >= 2;
    if (infix) {
        std::string sep = std::string(" ") + node.op_name + " ";
        std::string out = "(";
        for (std::size_t i = 0; i < args.size(); ++i) {
            if (i > 0) out += sep;
            out += to_string(args[i]);
        }
        return out + ")";
    }

    std::string out = node.op_name + "(";
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (i > 0) out += ", ";
        out += to_string(args[i]);
    }
    return out + ")";
}

// ── Measurements ────────────────────────────────────────────────────────────

std::size_t rule_depth(const ExprNode& node) {
    std::size_t deepest = 0;
    for (const auto& child : node.operands) {
        deepest = std::max(deepest, rule_depth(child));
    }
    return deepest + 1;
}

std::size_t rule_size(const ExprNode& node) {
    std::size_t n = 1;
    for (const auto& child : node.operands) {
        n += rule_size(child);
    }
    return n;
}

static void collect_keys(const ExprNode& node, std::vector<std::string>& out,
                         std::unordered_set<std::string>& seen) {
    if (node.is_var()) {
        if (seen.insert(node.key).second) out.push_back(node.key);
        return;
    }
    for (const auto& child : node.operands) {
        collect_keys(child, out, seen);
    }
}

std::vector<std::string> referenced_keys(const ExprNode& node) {
    std::vector<std::string> keys;
    std::unordered_set<std::string> seen;
    collect_keys(node, keys, seen);
    return keys;
}

// ── Builders ────────────────────────────────────────────────────────────────

ExprNode make_condition(const std::string& key, OperatorKind op, Literal value) {
    if (!is_comparison(op)) {
        throw std::invalid_argument(std::string("operator '") + operator_name(op) +
                                    "' is not a comparison");
    }
    std::vector<ExprNode> operands;
    operands.push_back(ExprNode::var(key));
    operands.push_back(ExprNode::lit(std::move(value)));
    return ExprNode::operation(op, std::move(operands));
}

static ExprNode make_combinator(OperatorKind op, std::vector<ExprNode> conditions) {
    if (conditions.empty()) {
        throw std::invalid_argument(std::string("'") + operator_name(op) +
                                    "' requires at least one condition");
    }
    if (conditions.size() == 1) {
        return std::move(conditions.front());
    }
    return ExprNode::operation(op, std::move(conditions));
}

ExprNode make_and(std::vector<ExprNode> conditions) {
    return make_combinator(OperatorKind::And, std::move(conditions));
}

ExprNode make_or(std::vector<ExprNode> conditions) {
    return make_combinator(OperatorKind::Or, std::move(conditions));
}

ExprNode make_not(ExprNode operand) {
    std::vector<ExprNode> operands;
    operands.push_back(std::move(operand));
    return ExprNode::operation(OperatorKind::Not, std::move(operands));
}

ExprNode make_in(ExprNode value, std::vector<Literal> items) {
    std::vector<ExprNode> operands;
    operands.push_back(std::move(value));
    operands.push_back(ExprNode::lit(Literal::of_list(std::move(items))));
    return ExprNode::operation(OperatorKind::In, std::move(operands));
}

ExprNode make_if(ExprNode condition, ExprNode then_rule,
                 std::optional<ExprNode> else_rule) {
    std::vector<ExprNode> operands;
    operands.push_back(std::move(condition));
    operands.push_back(std::move(then_rule));
    if (else_rule) operands.push_back(std::move(*else_rule));
    return ExprNode::operation(OperatorKind::If, std::move(operands));
}

}  // namespace rulemap
