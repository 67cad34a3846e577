// ============================================================================
// rulemap/validator.hpp — Static validation of drafted rules
// ============================================================================
//
// The validator walks an ExprNode tree once and collects every defect it
// finds instead of stopping at the first one.  Nothing is thrown for a bad
// rule; the caller decides what to do with the result.
//
// Checks per node:
//
//   VarRef     key must be in the registry (and, with require_mapped_keys,
//              produced by an accepted mapping)
//   Literal    always valid
//   Operation  operator allowed; operand count; operand types:
//                > >= < <=      2 numeric operands
//                == !=          2 operands of matching type
//                in             scalar, then a list literal
//                and or         2 or more operands
//                !              exactly 1 operand
//                if             2 or more operands
//                + *            2 or more numeric operands
//                -              1 or 2 numeric operands
//                /              exactly 2 numeric operands
//
// Variables have no declared type, so a VarRef satisfies any operand type.
// The root is at depth 1; a node below max_depth is reported and not
// descended into.
//
// ============================================================================

#ifndef RULEMAP_VALIDATOR_HPP
#define RULEMAP_VALIDATOR_HPP

#include "rulemap/ast.hpp"
#include "rulemap/mapper.hpp"
#include "rulemap/registry.hpp"

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace rulemap {

// ── ErrorKind ───────────────────────────────────────────────────────────────

enum class ErrorKind : std::uint8_t {
    UnknownKey,
    UnmappedKey,
    UnknownOperator,
    Arity,
    TypeMismatch,
    DepthExceeded,
    SizeExceeded
};

/// "UnknownKeyError", "TypeMismatchError", ...
const char* error_kind_name(ErrorKind k) noexcept;

// ── ValidationError ─────────────────────────────────────────────────────────

struct ValidationError {
    ErrorKind   kind = ErrorKind::UnknownKey;
    std::string message;
    std::string subject;   // offending key or operator spelling
    std::string path;      // "$", "$/and[1]", "$/and[1]/>[0]"
};

// ── ValidationResult ────────────────────────────────────────────────────────

struct ValidationResult {
    bool                         valid = true;
    std::set<std::string>        used_keys;
    std::vector<ValidationError> errors;

    bool has_error(ErrorKind kind) const;
};

// ── ValidatorConfig ─────────────────────────────────────────────────────────

struct ValidatorConfig {
    OperatorSet allowed_operators = default_operators();
    std::size_t max_depth = 10;
    std::size_t max_size  = 5000;   // serialized characters
    bool        require_mapped_keys = false;
};

// ── Validator ───────────────────────────────────────────────────────────────

class Validator {
public:
    Validator(const Registry& registry, ValidatorConfig config = {});

    /// Validate `root`.  `mappings` is consulted only when
    /// require_mapped_keys is set.
    ValidationResult validate(const ExprNode& root,
                              const std::vector<KeyMapping>* mappings = nullptr) const;

    const ValidatorConfig& config() const noexcept { return config_; }

private:
    // Inferred value type of a subtree.  Any means "not statically known"
    // (variables, conditionals, or subtrees that already failed).
    enum class ValueType : std::uint8_t { Any, Bool, Number, String, List };

    struct Walk {
        ValidationResult&            result;
        const std::set<std::string>* mapped;
    };

    ValueType check(const ExprNode& node, std::size_t depth,
                    const std::string& path, Walk& w) const;
    ValueType check_operation(const ExprNode& node, std::size_t depth,
                              const std::string& path, Walk& w) const;

    static const char* type_name(ValueType t) noexcept;
    static void report(Walk& w, ErrorKind kind, std::string message,
                       std::string subject, const std::string& path);

    const Registry& registry_;
    ValidatorConfig config_;
};

/// Validate with default limits and the given operator set.
ValidationResult validate(const ExprNode& root, const Registry& registry,
                          const OperatorSet& allowed_operators);

}  // namespace rulemap

#endif  // RULEMAP_VALIDATOR_HPP
