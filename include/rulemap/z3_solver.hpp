// ============================================================================
// rulemap/z3_solver.hpp — Z3 wrapper for rule satisfiability
// ============================================================================
//
// A drafted rule can be well-formed and still be impossible to meet
// ("score > 700 and score < 600").  RuleSolver encodes a validated rule
// into Z3 and asks whether any record satisfies it.
//
// Usage:
//   RuleSolver solver;
//   if (solver.add_rule(rule) && solver.check() == SolverResult::Satisfiable) {
//       std::string witness = solver.get_model();
//   }
//
// Encoding:
//   - Each key gets one Z3 constant whose sort is inferred from how the
//     rule uses it: compared with numbers or used in arithmetic → Real,
//     compared with strings → String, compared with booleans or used as a
//     condition → Bool.  Keys only compared with other keys default to Real.
//   - and / or / ! / comparisons / in / if / + - * / map to their Z3
//     counterparts; `in` becomes a disjunction of equalities.
//
// A key used with two different sorts, or a construct with no encoding
// (e.g. a list outside `in`), makes add_rule() return false and leaves the
// solver untouched.
//
// ============================================================================

#ifndef RULEMAP_Z3_SOLVER_HPP
#define RULEMAP_Z3_SOLVER_HPP

#include "rulemap/ast.hpp"

#include <z3++.h>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace rulemap {

// ── SolverResult ────────────────────────────────────────────────────────────

enum class SolverResult {
    Satisfiable,
    Unsatisfiable,
    Unknown
};

const char* solver_result_name(SolverResult r) noexcept;

// ── RuleSolver ──────────────────────────────────────────────────────────────
// Maintains a Z3 context and solver.  Rules are added incrementally (all
// added rules must hold together) and check() determines satisfiability.
// One instance per request; not thread-safe.

class RuleSolver {
public:
    RuleSolver();

    /// Assert `rule`.  Returns false (and asserts nothing) when the rule
    /// uses a construct or sort combination with no encoding.
    bool add_rule(const ExprNode& rule);

    SolverResult check();

    /// Reset the solver to empty state.
    void reset();

    /// Valuation of every key (if check() returned Satisfiable), e.g.
    ///   {bureau.score = 701, region = "north"}
    std::string get_model();

private:
    enum class Sort : std::uint8_t { Unset, Real, String, Bool };

    using SortMap = std::map<std::string, Sort>;

    // Sort inference.  `expected` is the sort the enclosing position
    // demands (Unset when it accepts anything).  Returns false on a
    // conflict or a construct with no encoding.
    static bool infer_sorts(const ExprNode& node, Sort expected, SortMap& sorts);
    static bool assign(SortMap& sorts, const std::string& key, Sort s);
    static Sort literal_sort(const Literal& lit) noexcept;
    static Sort sort_of(const ExprNode& node, const SortMap& sorts);

    // Encoders.  nullopt when the subtree has no encoding.
    std::optional<z3::expr> to_z3_bool(const ExprNode& node);
    std::optional<z3::expr> to_z3_term(const ExprNode& node);
    std::optional<z3::expr> to_z3_literal(const Literal& lit);

    z3::expr get_var(const std::string& name, Sort sort);

    z3::context ctx_;
    z3::solver  solver_;

    SortMap                                          sorts_;
    std::map<std::string, std::unique_ptr<z3::expr>> vars_;
};

}  // namespace rulemap

#endif  // RULEMAP_Z3_SOLVER_HPP
