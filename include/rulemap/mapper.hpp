// ============================================================================
// rulemap/mapper.hpp — Phrase-to-key similarity mapping and confidence
// ============================================================================
//
// Decision policy per distinct phrase (first occurrence wins):
//
//   - phrase text is a registry identifier  → maps to itself with
//                                             literal_similarity
//   - otherwise rank every key by cosine similarity (ties: smaller
//     identifier first), keep the top_k, and accept the best one when
//     similarity >= threshold
//   - below threshold                        → no mapping; the phrase is
//                                             reported as unmatched with
//                                             its ranked suggestions
//
// The mapper is pure.  Candidates are scored in parallel (OpenMP), each
// into its own slot, so the output order never depends on scheduling.
//
// ============================================================================

#ifndef RULEMAP_MAPPER_HPP
#define RULEMAP_MAPPER_HPP

#include "rulemap/extractor.hpp"
#include "rulemap/registry.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace rulemap {

// ── MapperConfig ────────────────────────────────────────────────────────────

struct MapperConfig {
    double      threshold = 0.20;
    std::size_t top_k = 3;
    double      literal_similarity = 1.0;
    int         num_threads = 0;   // OpenMP threads (0 = default)
};

// ── KeyMapping ──────────────────────────────────────────────────────────────

struct KeyMapping {
    std::string user_phrase;
    std::string mapped_to;
    double      similarity = 0.0;
};

struct ScoredKey {
    std::string identifier;
    double      similarity = 0.0;
};

struct UnmatchedPhrase {
    std::string            phrase;
    double                 best_similarity = 0.0;
    std::vector<ScoredKey> suggestions;   // at most top_k, best first
};

struct MappingOutcome {
    std::vector<KeyMapping>      mappings;
    std::vector<UnmatchedPhrase> unmatched;
};

// ── EmbeddedPhrase ──────────────────────────────────────────────────────────
// A candidate together with the vector the embedding collaborator produced
// for it.  Literal candidates may carry an empty vector.

struct EmbeddedPhrase {
    PhraseCandidate candidate;
    Embedding       embedding;
};

// ── Operations ──────────────────────────────────────────────────────────────

/// Registry keys ranked by similarity to `embedding`, best first, ties
/// broken by identifier; at most `k` entries.
std::vector<ScoredKey> rank(const Embedding& embedding, const Registry& registry,
                            std::size_t k);

/// Apply the decision policy to every candidate.
MappingOutcome map_phrases(const std::vector<EmbeddedPhrase>& phrases,
                           const Registry& registry, const MapperConfig& config);

/// Arithmetic mean of the similarities; 0.0 for an empty sequence.
double aggregate(const std::vector<KeyMapping>& mappings) noexcept;

}  // namespace rulemap

#endif  // RULEMAP_MAPPER_HPP
