// ============================================================================
// z3_solver.cpp — Implementation of the Z3 rule satisfiability checker
// ============================================================================

#include "rulemap/z3_solver.hpp"

#include <cmath>
#include <cstdint>
#include <iomanip>
#include <set>
#include <sstream>

namespace rulemap {

const char* solver_result_name(SolverResult r) noexcept {
    switch (r) {
        case SolverResult::Satisfiable:   return "satisfiable";
        case SolverResult::Unsatisfiable: return "unsatisfiable";
        case SolverResult::Unknown:       return "unknown";
    }
    return "?";
}

// ── RuleSolver ──────────────────────────────────────────────────────────────

RuleSolver::RuleSolver()
    : ctx_(), solver_(ctx_) {}

void RuleSolver::reset() {
    solver_.reset();
    sorts_.clear();
    vars_.clear();
}

z3::expr RuleSolver::get_var(const std::string& name, Sort sort) {
    auto it = vars_.find(name);
    if (it != vars_.end()) {
        return *it->second;
    }
    std::unique_ptr<z3::expr> var;
    switch (sort) {
        case Sort::Bool:
            var = std::make_unique<z3::expr>(ctx_.bool_const(name.c_str()));
            break;
        case Sort::String:
            var = std::make_unique<z3::expr>(ctx_.string_const(name.c_str()));
            break;
        case Sort::Unset:
        case Sort::Real:
            var = std::make_unique<z3::expr>(ctx_.real_const(name.c_str()));
            break;
    }
    z3::expr result = *var;
    vars_[name] = std::move(var);
    return result;
}

// ============================================================================
// Sort inference
// ============================================================================

RuleSolver::Sort RuleSolver::literal_sort(const Literal& lit) noexcept {
    switch (lit.kind) {
        case LiteralKind::Bool:   return Sort::Bool;
        case LiteralKind::Number: return Sort::Real;
        case LiteralKind::String: return Sort::String;
        case LiteralKind::List:   return Sort::Unset;
    }
    return Sort::Unset;
}

bool RuleSolver::assign(SortMap& sorts, const std::string& key, Sort s) {
    if (s == Sort::Unset) return true;
    Sort& cur = sorts[key];
    if (cur == Sort::Unset) {
        cur = s;
        return true;
    }
    return cur == s;
}

// Sort a subtree produces, as far as it is known without descending.
RuleSolver::Sort RuleSolver::sort_of(const ExprNode& node, const SortMap& sorts) {
    switch (node.kind) {
        case NodeKind::Literal:
            return literal_sort(node.literal);
        case NodeKind::VarRef: {
            auto it = sorts.find(node.key);
            return it == sorts.end() ? Sort::Unset : it->second;
        }
        case NodeKind::Operation:
            break;
    }
    if (is_arithmetic(node.op)) return Sort::Real;
    if (node.op == OperatorKind::If || node.op == OperatorKind::Unknown) return Sort::Unset;
    return Sort::Bool;
}

bool RuleSolver::infer_sorts(const ExprNode& node, Sort expected, SortMap& sorts) {
    switch (node.kind) {
        case NodeKind::VarRef:
            return assign(sorts, node.key, expected);
        case NodeKind::Literal: {
            // Lists only have an encoding as the right side of `in`.
            Sort s = literal_sort(node.literal);
            if (s == Sort::Unset) return false;
            return expected == Sort::Unset || s == expected;
        }
        case NodeKind::Operation:
            break;
    }

    const OperatorKind op = node.op;
    const auto& args = node.operands;

    if (op == OperatorKind::Unknown) return false;

    Sort result = sort_of(node, sorts);
    if (expected != Sort::Unset && result != Sort::Unset && result != expected) {
        return false;
    }

    switch (op) {
        case OperatorKind::And:
        case OperatorKind::Or:
        case OperatorKind::Not:
            for (const auto& a : args) {
                if (!infer_sorts(a, Sort::Bool, sorts)) return false;
            }
            return !args.empty();

        case OperatorKind::Greater:
        case OperatorKind::GreaterEq:
        case OperatorKind::Less:
        case OperatorKind::LessEq:
        case OperatorKind::Plus:
        case OperatorKind::Minus:
        case OperatorKind::Times:
        case OperatorKind::Divide:
            for (const auto& a : args) {
                if (!infer_sorts(a, Sort::Real, sorts)) return false;
            }
            return !args.empty();

        case OperatorKind::Equal:
        case OperatorKind::NotEqual: {
            if (args.size() != 2) return false;
            Sort s = sort_of(args[0], sorts);
            if (s == Sort::Unset) s = sort_of(args[1], sorts);
            return infer_sorts(args[0], s, sorts) && infer_sorts(args[1], s, sorts);
        }

        case OperatorKind::In: {
            if (args.size() != 2) return false;
            const ExprNode& list = args[1];
            if (!list.is_literal() || list.literal.kind != LiteralKind::List) return false;
            Sort s = Sort::Unset;
            for (const auto& item : list.literal.items) {
                Sort is = literal_sort(item);
                if (is == Sort::Unset) return false;
                if (s != Sort::Unset && is != s) return false;
                s = is;
            }
            return infer_sorts(args[0], s, sorts);
        }

        case OperatorKind::If: {
            if (args.size() < 2) return false;
            // if(c1, t1, c2, t2, ..., else)
            for (std::size_t i = 0; i < args.size(); ++i) {
                bool is_cond = (i % 2 == 0) && (i + 1 < args.size());
                if (!infer_sorts(args[i], is_cond ? Sort::Bool : expected, sorts)) return false;
            }
            return true;
        }

        case OperatorKind::Unknown:
            break;
    }
    return false;
}

// ============================================================================
// Encoding
// ============================================================================

std::optional<z3::expr> RuleSolver::to_z3_literal(const Literal& lit) {
    switch (lit.kind) {
        case LiteralKind::Bool:
            return ctx_.bool_val(lit.boolean);
        case LiteralKind::String:
            return ctx_.string_val(lit.text);
        case LiteralKind::Number: {
            if (!std::isfinite(lit.number)) return std::nullopt;
            // real_val wants plain decimal notation.
            std::ostringstream ss;
            if (lit.number == std::floor(lit.number) && std::fabs(lit.number) < 1e15) {
                ss << static_cast<std::int64_t>(lit.number);
            } else {
                ss << std::fixed << std::setprecision(17) << lit.number;
            }
            return ctx_.real_val(ss.str().c_str());
        }
        case LiteralKind::List:
            return std::nullopt;
    }
    return std::nullopt;
}

std::optional<z3::expr> RuleSolver::to_z3_term(const ExprNode& n) {
    switch (n.kind) {
        case NodeKind::Literal:
            return to_z3_literal(n.literal);

        case NodeKind::VarRef: {
            auto it = sorts_.find(n.key);
            return get_var(n.key, it == sorts_.end() ? Sort::Real : it->second);
        }

        case NodeKind::Operation:
            break;
    }

    if (!is_arithmetic(n.op)) {
        if (n.op == OperatorKind::If && n.operands.size() == 3) {
            auto c = to_z3_bool(n.operands[0]);
            auto t = to_z3_term(n.operands[1]);
            auto e = to_z3_term(n.operands[2]);
            if (!c || !t || !e) return std::nullopt;
            if (!z3::eq(t->get_sort(), e->get_sort())) return std::nullopt;
            return z3::ite(*c, *t, *e);
        }
        return to_z3_bool(n);
    }

    std::vector<z3::expr> terms;
    for (const auto& a : n.operands) {
        auto t = to_z3_term(a);
        if (!t || !t->is_arith()) return std::nullopt;
        terms.push_back(*t);
    }
    if (terms.empty()) return std::nullopt;

    switch (n.op) {
        case OperatorKind::Plus: {
            z3::expr sum = terms[0];
            for (std::size_t i = 1; i < terms.size(); ++i) sum = sum + terms[i];
            return sum;
        }
        case OperatorKind::Times: {
            z3::expr prod = terms[0];
            for (std::size_t i = 1; i < terms.size(); ++i) prod = prod * terms[i];
            return prod;
        }
        case OperatorKind::Minus:
            if (terms.size() == 1) return -terms[0];
            if (terms.size() == 2) return terms[0] - terms[1];
            return std::nullopt;
        case OperatorKind::Divide:
            if (terms.size() != 2) return std::nullopt;
            return terms[0] / terms[1];
        default:
            return std::nullopt;
    }
}

std::optional<z3::expr> RuleSolver::to_z3_bool(const ExprNode& n) {
    switch (n.kind) {
        case NodeKind::Literal:
            if (n.literal.kind == LiteralKind::Bool) return ctx_.bool_val(n.literal.boolean);
            return std::nullopt;

        case NodeKind::VarRef:
            return get_var(n.key, Sort::Bool);

        case NodeKind::Operation:
            break;
    }

    const auto& args = n.operands;

    switch (n.op) {
        case OperatorKind::Not: {
            if (args.size() != 1) return std::nullopt;
            auto child = to_z3_bool(args[0]);
            if (!child) return std::nullopt;
            return !(*child);
        }

        case OperatorKind::And:
        case OperatorKind::Or: {
            if (args.empty()) return std::nullopt;
            z3::expr_vector parts(ctx_);
            for (const auto& a : args) {
                auto p = to_z3_bool(a);
                if (!p) return std::nullopt;
                parts.push_back(*p);
            }
            return n.op == OperatorKind::And ? z3::mk_and(parts) : z3::mk_or(parts);
        }

        case OperatorKind::Greater:
        case OperatorKind::GreaterEq:
        case OperatorKind::Less:
        case OperatorKind::LessEq:
        case OperatorKind::Equal:
        case OperatorKind::NotEqual: {
            if (args.size() != 2) return std::nullopt;
            auto lhs = to_z3_term(args[0]);
            auto rhs = to_z3_term(args[1]);
            if (!lhs || !rhs) return std::nullopt;
            if (!z3::eq(lhs->get_sort(), rhs->get_sort())) return std::nullopt;
            if (is_ordering(n.op) && !lhs->is_arith()) return std::nullopt;

            switch (n.op) {
                case OperatorKind::Greater:   return *lhs > *rhs;
                case OperatorKind::GreaterEq: return *lhs >= *rhs;
                case OperatorKind::Less:      return *lhs < *rhs;
                case OperatorKind::LessEq:    return *lhs <= *rhs;
                case OperatorKind::Equal:     return *lhs == *rhs;
                default:                      return *lhs != *rhs;
            }
        }

        case OperatorKind::In: {
            if (args.size() != 2 || !args[1].is_literal() ||
                args[1].literal.kind != LiteralKind::List) {
                return std::nullopt;
            }
            auto needle = to_z3_term(args[0]);
            if (!needle) return std::nullopt;
            z3::expr_vector options(ctx_);
            for (const auto& item : args[1].literal.items) {
                auto v = to_z3_literal(item);
                if (!v || !z3::eq(v->get_sort(), needle->get_sort())) return std::nullopt;
                options.push_back(*needle == *v);
            }
            if (options.empty()) return ctx_.bool_val(false);
            return z3::mk_or(options);
        }

        case OperatorKind::If: {
            // if(c1, t1, c2, t2, ..., [else]); a missing else is false.
            if (args.size() < 2) return std::nullopt;
            std::size_t pairs = args.size() / 2;
            z3::expr result = ctx_.bool_val(false);
            if (args.size() % 2 == 1) {
                auto e = to_z3_bool(args.back());
                if (!e) return std::nullopt;
                result = *e;
            }
            for (std::size_t i = pairs; i-- > 0;) {
                auto c = to_z3_bool(args[2 * i]);
                auto t = to_z3_bool(args[2 * i + 1]);
                if (!c || !t) return std::nullopt;
                result = z3::ite(*c, *t, result);
            }
            return result;
        }

        // Arithmetic results are not conditions on their own.
        case OperatorKind::Plus:
        case OperatorKind::Minus:
        case OperatorKind::Times:
        case OperatorKind::Divide:
        case OperatorKind::Unknown:
            return std::nullopt;
    }

    return std::nullopt;
}

// ── add_rule ────────────────────────────────────────────────────────────────
// Inference runs on a copy of the sort table.  If either inference or
// encoding fails, the table and any variables created on the way are
// rolled back, so an unencodable rule leaves the solver as it was.

bool RuleSolver::add_rule(const ExprNode& rule) {
    SortMap trial = sorts_;

    // Iterate so that sorts propagate through key-to-key comparisons.
    for (std::size_t round = 0;; ++round) {
        SortMap before = trial;
        if (!infer_sorts(rule, Sort::Bool, trial)) return false;
        if (trial == before || round > trial.size()) break;
    }

    SortMap saved = sorts_;
    std::set<std::string> existing;
    for (const auto& entry : vars_) existing.insert(entry.first);

    sorts_ = std::move(trial);

    std::optional<z3::expr> encoded;
    try {
        encoded = to_z3_bool(rule);
    } catch (const z3::exception&) {
        encoded.reset();
    }

    if (!encoded) {
        sorts_ = std::move(saved);
        for (auto it = vars_.begin(); it != vars_.end();) {
            if (existing.count(it->first) == 0) {
                it = vars_.erase(it);
            } else {
                ++it;
            }
        }
        return false;
    }

    solver_.add(*encoded);
    return true;
}

SolverResult RuleSolver::check() {
    z3::check_result result = solver_.check();

    switch (result) {
        case z3::sat:
            return SolverResult::Satisfiable;
        case z3::unsat:
            return SolverResult::Unsatisfiable;
        case z3::unknown:
            return SolverResult::Unknown;
    }

    return SolverResult::Unknown;
}

std::string RuleSolver::get_model() {
    if (solver_.check() != z3::sat) {
        return "(no model available)";
    }

    z3::model model = solver_.get_model();
    std::string result = "{";
    bool first = true;

    for (const auto& entry : vars_) {
        if (!first) {
            result += ", ";
        }
        first = false;

        z3::expr value = model.eval(*entry.second, true);
        std::string text = value.is_numeral() ? value.get_decimal_string(4) : value.to_string();
        // Z3 marks truncated decimals with a trailing '?'.
        if (!text.empty() && text.back() == '?') text.pop_back();
        result += entry.first + " = " + text;
    }

    result += "}";
    return result;
}

}  // namespace rulemap
