// ============================================================================
// rulemap/analyzer.hpp — Prompt + drafted rule → analysis report
// ============================================================================
//
// Pipeline for one request:
//
//   prompt ─ extract ─ embed ─ map ─┬─ key_mappings
//                                   └─ confidence_score
//   draft ──────────── validate ────┬─ validation
//                                   └─ satisfiability (valid rules only)
//
// The analyzer holds read-only references to the process-scoped registry
// and embedder; analyze() keeps all request state on its own stack, so
// independent requests may run on separate threads provided the embedder
// is safe to call concurrently.
//
// ============================================================================

#ifndef RULEMAP_ANALYZER_HPP
#define RULEMAP_ANALYZER_HPP

#include "rulemap/config.hpp"
#include "rulemap/embedder.hpp"
#include "rulemap/extractor.hpp"
#include "rulemap/mapper.hpp"
#include "rulemap/parser.hpp"
#include "rulemap/registry.hpp"
#include "rulemap/validator.hpp"
#include "rulemap/z3_solver.hpp"

#include <optional>
#include <string>
#include <vector>

namespace rulemap {

// ── AnalysisReport ──────────────────────────────────────────────────────────

struct AnalysisReport {
    std::vector<KeyMapping>      key_mappings;
    std::vector<UnmatchedPhrase> unmatched;
    std::vector<NumericMention>  numeric_values;
    double                       confidence_score = 0.0;

    // Present only when a draft was supplied.
    std::optional<ExprNode>         rule;
    std::vector<std::string>        explanation;
    std::optional<ValidationResult> validation;
    std::optional<SolverResult>     satisfiable;
    std::string                     witness;
    std::optional<ExprNode>         normalized;
};

// ── RuleAnalyzer ────────────────────────────────────────────────────────────

class RuleAnalyzer {
public:
    /// Throws ConfigError when the configuration is invalid or the embedder
    /// dimension differs from the registry's.
    RuleAnalyzer(const Registry& registry, const Embedder& embedder, Config config);

    /// Map the prompt and, if `draft` is given, validate it.
    AnalysisReport analyze(const std::string& prompt, const Draft* draft) const;

    /// Also attach the normalised rule to reports of valid drafts.
    void set_normalize(bool on) noexcept { normalize_ = on; }

    const Config& config() const noexcept { return config_; }

private:
    std::vector<EmbeddedPhrase> embed_candidates(
        const std::vector<PhraseCandidate>& candidates) const;

    const Registry& registry_;
    const Embedder& embedder_;
    Config          config_;
    PhraseExtractor extractor_;
    Validator       validator_;
    bool            normalize_ = false;
};

}  // namespace rulemap

#endif  // RULEMAP_ANALYZER_HPP
