// ============================================================================
// parser.cpp — Rule text parsing and decoding
// ============================================================================
//
// Implementation notes
// --------------------
//
// parse_json() hands the text to nlohmann::ordered_json::parse with a
// parser callback that rejects containers past the nesting limit, so the
// recursive decoder below never runs deeper than that limit.
// nlohmann's parse_error carries the byte offset of the failure; it is
// turned back into a line and column here.
//
// decode_rule() turns the document into an ExprNode.  Structural problems
// (null, objects with several members, "var" without a string name) are
// ParseErrors; unknown operator names are not, so that the validator can
// report them alongside every other defect.
//
// ============================================================================

#include "rulemap/parser.hpp"
#include "rulemap/errors.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace rulemap {

std::size_t nesting_for_depth(std::size_t max_depth) noexcept {
    return std::max(kDefaultMaxNesting, 2 * max_depth + 2);
}

// ── parse_json ──────────────────────────────────────────────────────────────

namespace {

// Line and column (1-based) of the byte nlohmann stopped at.
std::pair<std::size_t, std::size_t> locate(std::string_view input, std::size_t byte) {
    std::size_t line = 1;
    std::size_t column = 1;
    std::size_t end = std::min(byte > 0 ? byte - 1 : 0, input.size());
    for (std::size_t i = 0; i < end; ++i) {
        if (input[i] == '\n') {
            ++line;
            column = 1;
        } else {
            ++column;
        }
    }
    return {line, column};
}

// "[json.exception.parse_error.101] parse error at line 1, column 4: syntax
// error ..." → "syntax error ..."
std::string parse_error_detail(const Json::parse_error& e) {
    std::string what = e.what();
    auto colon = what.find(": ");
    return colon == std::string::npos ? what : what.substr(colon + 2);
}

}  // namespace

Json parse_json(std::string_view input, std::size_t max_nesting) {
    Json::parser_callback_t guard =
        [max_nesting](int depth, Json::parse_event_t event, Json&) {
            bool opens = event == Json::parse_event_t::object_start ||
                         event == Json::parse_event_t::array_start;
            if (opens && static_cast<std::size_t>(depth) + 1 > max_nesting) {
                throw ParseError("ERROR: nesting exceeds limit of " +
                                 std::to_string(max_nesting));
            }
            return true;
        };

    try {
        return Json::parse(input, guard);
    } catch (const Json::parse_error& e) {
        auto [line, column] = locate(input, e.byte);
        throw ParseError(std::to_string(line) + ": ERROR: " + parse_error_detail(e) +
                         " at column " + std::to_string(column));
    }
}

// ============================================================================
// Rule decoding
// ============================================================================

[[noreturn]] static void decode_error(const std::string& path, const std::string& msg) {
    throw ParseError("ERROR: " + msg + " at " + path);
}

static Literal decode_literal(const Json& v, const std::string& path) {
    switch (v.type()) {
        case Json::value_t::boolean:
            return Literal::of_bool(v.get<bool>());
        case Json::value_t::number_integer:
        case Json::value_t::number_unsigned:
        case Json::value_t::number_float:
            return Literal::of_number(v.get<double>());
        case Json::value_t::string:
            return Literal::of_string(v.get<std::string>());
        case Json::value_t::array: {
            std::vector<Literal> items;
            items.reserve(v.size());
            for (std::size_t i = 0; i < v.size(); ++i) {
                items.push_back(decode_literal(v[i], path + "[" + std::to_string(i) + "]"));
            }
            return Literal::of_list(std::move(items));
        }
        case Json::value_t::object:
            decode_error(path, "list elements must be literals, got an object");
        case Json::value_t::null:
        case Json::value_t::binary:
        case Json::value_t::discarded:
            break;
    }
    decode_error(path, "null literals are not supported");
}

// {"var": "k"} or {"var": ["k"]} or {"var": ["k", default]}
static ExprNode decode_var(const Json& arg, const std::string& path) {
    if (arg.is_string()) {
        return ExprNode::var(arg.get<std::string>());
    }
    if (arg.is_array() && !arg.empty() && arg.size() <= 2 && arg[0].is_string()) {
        return ExprNode::var(arg[0].get<std::string>());
    }
    decode_error(path, "\"var\" expects a key name");
}

static ExprNode decode_node(const Json& value, const std::string& path) {
    if (!value.is_object()) {
        return ExprNode::lit(decode_literal(value, path));
    }

    if (value.size() != 1) {
        decode_error(path, "each rule object must have exactly one key (the operator), got " +
                           std::to_string(value.size()));
    }

    auto member = value.begin();
    const std::string& name = member.key();
    const Json& arg = member.value();
    if (name == "var") {
        return decode_var(arg, path);
    }

    // Operands: an array is the operand list; anything else is a single
    // operand ({"!": {"var": "x"}}).
    std::vector<ExprNode> operands;
    if (arg.is_array()) {
        operands.reserve(arg.size());
        for (std::size_t i = 0; i < arg.size(); ++i) {
            operands.push_back(
                decode_node(arg[i], path + "/" + name + "[" + std::to_string(i) + "]"));
        }
    } else {
        operands.push_back(decode_node(arg, path + "/" + name + "[0]"));
    }

    OperatorKind op = parse_operator(name);
    if (op == OperatorKind::Unknown) {
        return ExprNode::unknown_operation(name, std::move(operands));
    }
    ExprNode node = ExprNode::operation(op, std::move(operands));
    node.op_name = name;
    return node;
}

ExprNode decode_rule(const Json& value) {
    return decode_node(value, "$");
}

ExprNode parse_rule(std::string_view input, std::size_t max_nesting) {
    return decode_rule(parse_json(input, max_nesting));
}

// ── Draft ───────────────────────────────────────────────────────────────────

Draft decode_draft(const Json& value) {
    if (!value.is_object() || !value.contains("json_logic")) {
        return Draft{decode_rule(value), {}};
    }

    Draft draft{decode_node(value["json_logic"], "$.json_logic"), {}};
    auto expl = value.find("explanation");
    if (expl == value.end()) {
        return draft;
    }
    if (expl->is_string()) {
        draft.explanation.push_back(expl->get<std::string>());
    } else if (expl->is_array()) {
        for (std::size_t i = 0; i < expl->size(); ++i) {
            const Json& line = (*expl)[i];
            if (!line.is_string()) {
                decode_error("$.explanation[" + std::to_string(i) + "]",
                             "explanation entries must be strings");
            }
            draft.explanation.push_back(line.get<std::string>());
        }
    } else {
        decode_error("$.explanation", "explanation must be a string or an array of strings");
    }
    return draft;
}

Draft parse_draft(std::string_view input, std::size_t max_nesting) {
    return decode_draft(parse_json(input, max_nesting));
}

}  // namespace rulemap
