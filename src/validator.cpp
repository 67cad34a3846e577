// ============================================================================
// validator.cpp — Static validation of drafted rules
// ============================================================================

#include "rulemap/validator.hpp"

#include <algorithm>

namespace rulemap {

// ── error_kind_name ─────────────────────────────────────────────────────────

const char* error_kind_name(ErrorKind k) noexcept {
    switch (k) {
        case ErrorKind::UnknownKey:      return "UnknownKeyError";
        case ErrorKind::UnmappedKey:     return "UnmappedKeyError";
        case ErrorKind::UnknownOperator: return "UnknownOperatorError";
        case ErrorKind::Arity:           return "ArityError";
        case ErrorKind::TypeMismatch:    return "TypeMismatchError";
        case ErrorKind::DepthExceeded:   return "DepthExceededError";
        case ErrorKind::SizeExceeded:    return "SizeExceededError";
    }
    return "?";
}

bool ValidationResult::has_error(ErrorKind kind) const {
    return std::any_of(errors.begin(), errors.end(),
                       [kind](const ValidationError& e) { return e.kind == kind; });
}

// ── Validator ───────────────────────────────────────────────────────────────

Validator::Validator(const Registry& registry, ValidatorConfig config)
    : registry_(registry), config_(std::move(config)) {}

const char* Validator::type_name(ValueType t) noexcept {
    switch (t) {
        case ValueType::Any:    return "any";
        case ValueType::Bool:   return "boolean";
        case ValueType::Number: return "number";
        case ValueType::String: return "string";
        case ValueType::List:   return "list";
    }
    return "?";
}

void Validator::report(Walk& w, ErrorKind kind, std::string message,
                       std::string subject, const std::string& path) {
    w.result.errors.push_back(
        ValidationError{kind, std::move(message), std::move(subject), path});
}

ValidationResult Validator::validate(const ExprNode& root,
                                     const std::vector<KeyMapping>* mappings) const {
    ValidationResult result;

    std::set<std::string> mapped;
    const std::set<std::string>* mapped_ptr = nullptr;
    if (config_.require_mapped_keys && mappings != nullptr) {
        for (const auto& m : *mappings) mapped.insert(m.mapped_to);
        mapped_ptr = &mapped;
    }

    Walk w{result, mapped_ptr};
    check(root, 1, "$", w);

    // A tree cut off by the depth limit already failed; measuring it adds
    // nothing.
    if (!result.has_error(ErrorKind::DepthExceeded)) {
        std::size_t size = to_json(root).size();
        if (size > config_.max_size) {
            report(w, ErrorKind::SizeExceeded,
                   "rule is " + std::to_string(size) + " characters, limit is " +
                   std::to_string(config_.max_size),
                   "", "$");
        }
    }

    result.valid = result.errors.empty();
    return result;
}

// ── check ───────────────────────────────────────────────────────────────────

Validator::ValueType Validator::check(const ExprNode& node, std::size_t depth,
                                      const std::string& path, Walk& w) const {
    if (depth > config_.max_depth) {
        report(w, ErrorKind::DepthExceeded,
               "rule nesting exceeds maximum depth of " + std::to_string(config_.max_depth),
               "", path);
        return ValueType::Any;
    }

    switch (node.kind) {
        case NodeKind::VarRef:
            if (!registry_.contains(node.key)) {
                report(w, ErrorKind::UnknownKey,
                       "unknown key '" + node.key + "'", node.key, path);
            } else if (w.mapped != nullptr && w.mapped->count(node.key) == 0) {
                report(w, ErrorKind::UnmappedKey,
                       "key '" + node.key + "' was not produced by any phrase mapping",
                       node.key, path);
            } else {
                w.result.used_keys.insert(node.key);
            }
            return ValueType::Any;

        case NodeKind::Literal:
            switch (node.literal.kind) {
                case LiteralKind::Bool:   return ValueType::Bool;
                case LiteralKind::Number: return ValueType::Number;
                case LiteralKind::String: return ValueType::String;
                case LiteralKind::List:   return ValueType::List;
            }
            return ValueType::Any;

        case NodeKind::Operation:
            return check_operation(node, depth, path, w);
    }
    return ValueType::Any;
}

// ── check_operation ─────────────────────────────────────────────────────────

Validator::ValueType Validator::check_operation(const ExprNode& node, std::size_t depth,
                                                const std::string& path, Walk& w) const {
    const OperatorKind op = node.op;
    const bool allowed = op != OperatorKind::Unknown &&
                         config_.allowed_operators.count(op) != 0;
    if (!allowed) {
        report(w, ErrorKind::UnknownOperator,
               "operator '" + node.op_name + "' is not allowed", node.op_name, path);
    }

    // Operands are checked regardless, so one pass reports every defect.
    std::vector<ValueType> types;
    types.reserve(node.operands.size());
    for (std::size_t i = 0; i < node.operands.size(); ++i) {
        std::string child = path + "/" + node.op_name + "[" + std::to_string(i) + "]";
        types.push_back(check(node.operands[i], depth + 1, child, w));
    }

    if (!allowed) return ValueType::Any;

    // ── Arity ──
    const std::size_t n = types.size();
    std::string expected;
    if (is_comparison(op) || op == OperatorKind::In || op == OperatorKind::Divide) {
        if (n != 2) expected = "exactly 2";
    } else if (op == OperatorKind::Not) {
        if (n != 1) expected = "exactly 1";
    } else if (op == OperatorKind::Minus) {
        if (n < 1 || n > 2) expected = "1 or 2";
    } else if (n < 2) {
        // and, or, if, +, *
        expected = "at least 2";
    }
    if (!expected.empty()) {
        report(w, ErrorKind::Arity,
               "operator '" + node.op_name + "' expects " + expected +
               " operands, got " + std::to_string(n),
               node.op_name, path);
        return ValueType::Any;
    }

    // ── Operand types ──
    bool ok = true;
    auto mismatch = [&](const std::string& msg) {
        report(w, ErrorKind::TypeMismatch, msg, node.op_name, path);
        ok = false;
    };

    if (is_ordering(op) || is_arithmetic(op)) {
        for (std::size_t i = 0; i < n; ++i) {
            if (types[i] != ValueType::Any && types[i] != ValueType::Number) {
                mismatch("operator '" + node.op_name + "' expects numeric operands, operand " +
                         std::to_string(i) + " is " + type_name(types[i]));
            }
        }
    } else if (op == OperatorKind::Equal || op == OperatorKind::NotEqual) {
        if (types[0] != ValueType::Any && types[1] != ValueType::Any && types[0] != types[1]) {
            mismatch("operator '" + node.op_name + "' compares " + type_name(types[0]) +
                     " with " + type_name(types[1]));
        }
    } else if (op == OperatorKind::In) {
        if (types[0] == ValueType::List) {
            mismatch("first operand of '" + node.op_name + "' must be a scalar, got list");
        }
        const ExprNode& haystack = node.operands[1];
        if (!haystack.is_literal() || haystack.literal.kind != LiteralKind::List) {
            mismatch("second operand of '" + node.op_name + "' must be a list literal");
        }
    }

    if (!ok) return ValueType::Any;
    if (is_arithmetic(op)) return ValueType::Number;
    if (op == OperatorKind::If) return ValueType::Any;
    return ValueType::Bool;
}

// ── validate (convenience) ──────────────────────────────────────────────────

ValidationResult validate(const ExprNode& root, const Registry& registry,
                          const OperatorSet& allowed_operators) {
    ValidatorConfig config;
    config.allowed_operators = allowed_operators;
    return Validator(registry, std::move(config)).validate(root);
}

}  // namespace rulemap
