// ============================================================================
// mapper.cpp — Phrase-to-key similarity mapping and confidence
// ============================================================================

#include "rulemap/mapper.hpp"
#include "rulemap/embedder.hpp"
#include "rulemap/errors.hpp"

#include <omp.h>

#include <algorithm>
#include <optional>
#include <unordered_set>

namespace rulemap {

// ── rank ────────────────────────────────────────────────────────────────────
// Linear scan over the registry.  Ties go to the lexicographically smaller
// identifier so the result does not depend on load order.

std::vector<ScoredKey> rank(const Embedding& embedding, const Registry& registry,
                            std::size_t k) {
    std::vector<ScoredKey> scored;
    scored.reserve(registry.size());
    for (const auto& key : registry.all()) {
        scored.push_back(ScoredKey{key.identifier, cosine_similarity(embedding, key.embedding)});
    }

    auto better = [](const ScoredKey& a, const ScoredKey& b) {
        if (a.similarity != b.similarity) return a.similarity > b.similarity;
        return a.identifier < b.identifier;
    };

    std::size_t keep = std::min(k, scored.size());
    std::partial_sort(scored.begin(), scored.begin() + static_cast<std::ptrdiff_t>(keep),
                      scored.end(), better);
    scored.resize(keep);
    return scored;
}

// ── map_phrases ─────────────────────────────────────────────────────────────

namespace {

// Per-phrase outcome; exactly one of the two is set, or neither when the
// phrase had no vector.
struct Slot {
    std::optional<KeyMapping>      mapping;
    std::optional<UnmatchedPhrase> unmatched;
};

}  // namespace

MappingOutcome map_phrases(const std::vector<EmbeddedPhrase>& phrases,
                           const Registry& registry, const MapperConfig& config) {
    // Distinct phrase texts, first occurrence wins.
    std::vector<const EmbeddedPhrase*> work;
    std::unordered_set<std::string> seen;
    for (const auto& p : phrases) {
        if (!seen.insert(p.candidate.text).second) continue;

        bool literal = p.candidate.is_literal || registry.contains(p.candidate.text);
        if (!literal && !registry.empty() && !p.embedding.empty() &&
            p.embedding.size() != registry.dimension()) {
            throw ConfigError("embedding for '" + p.candidate.text + "' has dimension " +
                              std::to_string(p.embedding.size()) + ", registry uses " +
                              std::to_string(registry.dimension()));
        }
        work.push_back(&p);
    }

    std::vector<Slot> slots(work.size());
    const long n = static_cast<long>(work.size());

    // Team size for this region only.
    const int threads = config.num_threads > 0 ? config.num_threads : omp_get_max_threads();

    // Each iteration writes only its own slot.
    #pragma omp parallel for schedule(dynamic) num_threads(threads) if(threads > 1 && n > 1)
    for (long i = 0; i < n; ++i) {
        const EmbeddedPhrase& p = *work[static_cast<std::size_t>(i)];
        Slot& slot = slots[static_cast<std::size_t>(i)];
        const std::string& text = p.candidate.text;

        if (p.candidate.is_literal || registry.contains(text)) {
            slot.mapping = KeyMapping{text, text, config.literal_similarity};
            continue;
        }
        if (p.embedding.empty() || registry.empty()) continue;

        std::vector<ScoredKey> ranked = rank(p.embedding, registry,
                                             std::max<std::size_t>(config.top_k, 1));
        const ScoredKey& best = ranked.front();
        if (best.similarity >= config.threshold) {
            slot.mapping = KeyMapping{text, best.identifier, best.similarity};
        } else {
            slot.unmatched = UnmatchedPhrase{text, best.similarity, std::move(ranked)};
        }
    }

    MappingOutcome out;
    for (auto& slot : slots) {
        if (slot.mapping) out.mappings.push_back(std::move(*slot.mapping));
        if (slot.unmatched) out.unmatched.push_back(std::move(*slot.unmatched));
    }
    return out;
}

// ── aggregate ───────────────────────────────────────────────────────────────

double aggregate(const std::vector<KeyMapping>& mappings) noexcept {
    if (mappings.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& m : mappings) sum += m.similarity;
    return sum / static_cast<double>(mappings.size());
}

}  // namespace rulemap
