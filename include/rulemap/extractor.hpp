// ============================================================================
// rulemap/extractor.hpp — Candidate phrases from a raw prompt
// ============================================================================
//
// Three sources of candidates, merged and ordered by first occurrence
// (start offset, then shorter span first):
//
//   1. Literal identifiers: case-sensitive occurrences of registry keys,
//      bounded so that "bureau.score" does not match inside
//      "bureau.scores".  These bypass similarity scoring.
//   2. Quoted spans: text between double quotes, emitted whole.
//   3. Word windows: 1..max_window consecutive words.  A window never
//      crosses punctuation, a number or a literal span, and never starts
//      or ends with a stop word.
//
// Extraction never throws; a prompt with nothing usable yields an empty
// sequence.
//
// ============================================================================

#ifndef RULEMAP_EXTRACTOR_HPP
#define RULEMAP_EXTRACTOR_HPP

#include "rulemap/registry.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rulemap {

// ── PhraseCandidate ─────────────────────────────────────────────────────────

struct PhraseCandidate {
    std::string text;
    std::size_t start = 0;   // byte offset into the prompt
    std::size_t end   = 0;   // one past the last byte
    bool        is_literal = false;
};

// ── ExtractorConfig ─────────────────────────────────────────────────────────

struct ExtractorConfig {
    std::size_t max_window     = 3;
    std::size_t max_candidates = 64;
    bool        include_quoted = true;
};

// ── PhraseExtractor ─────────────────────────────────────────────────────────

class PhraseExtractor {
public:
    PhraseExtractor(const Registry& registry, ExtractorConfig config = {});

    std::vector<PhraseCandidate> extract(std::string_view prompt) const;

private:
    struct Word {
        std::size_t start;
        std::size_t end;
        bool        stop;
    };

    void find_literals(std::string_view prompt,
                       std::vector<PhraseCandidate>& out) const;
    void find_quoted(std::string_view prompt,
                     std::vector<PhraseCandidate>& out) const;
    void find_windows(std::string_view prompt,
                      const std::vector<PhraseCandidate>& literals,
                      std::vector<PhraseCandidate>& out) const;

    const Registry& registry_;
    ExtractorConfig config_;
};

/// True for short function words that never start or end a window.
bool is_stop_word(std::string_view lower_word) noexcept;

// ── Numeric mentions ────────────────────────────────────────────────────────
// Numbers in the prompt, handed to the drafting step as hints.  A range
// ("3 to 5", "between 3 and 5", "3 through 5") is reported once with both
// ends set.

struct NumericMention {
    double                value = 0.0;
    std::optional<double> upper;
    std::size_t           start = 0;
    std::size_t           end   = 0;
};

std::vector<NumericMention> extract_numbers(std::string_view prompt);

}  // namespace rulemap

#endif  // RULEMAP_EXTRACTOR_HPP
