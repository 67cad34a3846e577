// ============================================================================
// analyzer.cpp — Prompt + drafted rule → analysis report
// ============================================================================

#include "rulemap/analyzer.hpp"
#include "rulemap/errors.hpp"
#include "rulemap/normalization.hpp"

namespace rulemap {

// ── Constructor ─────────────────────────────────────────────────────────────

RuleAnalyzer::RuleAnalyzer(const Registry& registry, const Embedder& embedder, Config config)
    : registry_(registry),
      embedder_(embedder),
      config_(std::move(config)),
      extractor_(registry, config_.extractor),
      validator_(registry, config_.validator) {
    validate_config(config_);
    if (!registry_.empty() && embedder_.dimension() != registry_.dimension()) {
        throw ConfigError("embedder dimension " + std::to_string(embedder_.dimension()) +
                          " does not match registry dimension " +
                          std::to_string(registry_.dimension()));
    }
}

// ── embed_candidates ────────────────────────────────────────────────────────
// Literal candidates need no vector.  A candidate the embedder has no
// vector for is dropped; one with the wrong length is a deployment error.
// An empty registry has nothing to compare against, so nothing is embedded.

std::vector<EmbeddedPhrase> RuleAnalyzer::embed_candidates(
    const std::vector<PhraseCandidate>& candidates) const {
    std::vector<EmbeddedPhrase> out;
    out.reserve(candidates.size());

    for (const auto& c : candidates) {
        if (c.is_literal) {
            out.push_back(EmbeddedPhrase{c, {}});
            continue;
        }
        if (registry_.empty()) continue;

        Embedding v = embedder_.embed(c.text);
        if (v.empty()) continue;
        if (v.size() != registry_.dimension()) {
            throw ConfigError("embedder returned " + std::to_string(v.size()) +
                              " components for '" + c.text + "', registry uses " +
                              std::to_string(registry_.dimension()));
        }
        out.push_back(EmbeddedPhrase{c, std::move(v)});
    }
    return out;
}

// ── analyze ─────────────────────────────────────────────────────────────────

AnalysisReport RuleAnalyzer::analyze(const std::string& prompt, const Draft* draft) const {
    AnalysisReport report;

    report.numeric_values = extract_numbers(prompt);

    auto phrases = embed_candidates(extractor_.extract(prompt));
    MappingOutcome outcome = map_phrases(phrases, registry_, config_.mapper);
    report.key_mappings = std::move(outcome.mappings);
    report.unmatched = std::move(outcome.unmatched);
    report.confidence_score = aggregate(report.key_mappings);

    if (draft == nullptr) return report;

    report.rule = draft->rule;
    report.explanation = draft->explanation;
    report.validation = validator_.validate(draft->rule, &report.key_mappings);

    if (!report.validation->valid) return report;

    if (config_.check_satisfiability) {
        RuleSolver solver;
        if (solver.add_rule(draft->rule)) {
            report.satisfiable = solver.check();
            if (*report.satisfiable == SolverResult::Satisfiable) {
                report.witness = solver.get_model();
            }
        } else {
            report.satisfiable = SolverResult::Unknown;
        }
    }

    if (normalize_) {
        report.normalized = normalize(draft->rule);
    }
    return report;
}

}  // namespace rulemap
