// ============================================================================
// extractor.cpp — Phrase extraction and numeric mentions
// ============================================================================

#include "rulemap/extractor.hpp"
#include "rulemap/utils.hpp"

#include <algorithm>
#include <iterator>
#include <cctype>
#include <charconv>

namespace rulemap {

namespace {

// Sorted; looked up with binary_search.
constexpr std::string_view kStopWords[] = {
    "a", "about", "above", "after", "all", "also", "an", "and", "any", "are",
    "as", "at", "be", "been", "before", "below", "between", "but", "by", "can",
    "cannot", "do", "does", "each", "equal", "equals", "every", "for", "from",
    "greater", "has", "have", "if", "in", "into", "is", "it", "its", "least",
    "less", "more", "most", "must", "no", "not", "of", "on", "only", "or",
    "over", "should", "than", "that", "the", "their", "them", "then", "these",
    "they", "this", "those", "through", "to", "under", "was", "were", "when",
    "where", "which", "who", "will", "with"
};

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '\'';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool all_digits(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

bool overlaps(std::size_t s0, std::size_t e0, std::size_t s1, std::size_t e1) {
    return s0 < e1 && s1 < e0;
}

}  // namespace

bool is_stop_word(std::string_view lower_word) noexcept {
    return std::binary_search(std::begin(kStopWords), std::end(kStopWords), lower_word);
}

// ── PhraseExtractor ─────────────────────────────────────────────────────────

PhraseExtractor::PhraseExtractor(const Registry& registry, ExtractorConfig config)
    : registry_(registry), config_(config) {}

// ── find_literals ───────────────────────────────────────────────────────────
// An occurrence counts only when it is not part of a longer identifier:
// the character before must not be an identifier character or '.', and
// the character after must not continue the path ("x.y" inside "x.yz" or
// "x.y.z" is rejected; a sentence-ending '.' is fine).

void PhraseExtractor::find_literals(std::string_view prompt,
                                    std::vector<PhraseCandidate>& out) const {
    for (const auto& key : registry_.all()) {
        const std::string& id = key.identifier;
        std::size_t from = 0;
        while (from < prompt.size()) {
            std::size_t at = prompt.find(id, from);
            if (at == std::string_view::npos) break;
            from = at + 1;

            std::size_t end = at + id.size();
            if (at > 0 && (is_ident_char(prompt[at - 1]) || prompt[at - 1] == '.')) {
                continue;
            }
            if (end < prompt.size()) {
                char after = prompt[end];
                if (is_ident_char(after)) continue;
                if (after == '.' && end + 1 < prompt.size() && is_ident_char(prompt[end + 1])) {
                    continue;
                }
            }
            out.push_back(PhraseCandidate{id, at, end, true});
        }
    }
}

// ── find_quoted ─────────────────────────────────────────────────────────────

void PhraseExtractor::find_quoted(std::string_view prompt,
                                  std::vector<PhraseCandidate>& out) const {
    std::size_t i = 0;
    while (i < prompt.size()) {
        std::size_t open = prompt.find('"', i);
        if (open == std::string_view::npos) break;
        std::size_t close = prompt.find('"', open + 1);
        if (close == std::string_view::npos) break;

        std::string inner = trim(std::string(prompt.substr(open + 1, close - open - 1)));
        if (!inner.empty()) {
            out.push_back(PhraseCandidate{inner, open + 1, close, false});
        }
        i = close + 1;
    }
}

// ── find_windows ────────────────────────────────────────────────────────────
// Split the prompt into runs of words separated only by whitespace.  Any
// other character, a number, or a word inside a literal span ends a run.

void PhraseExtractor::find_windows(std::string_view prompt,
                                   const std::vector<PhraseCandidate>& literals,
                                   std::vector<PhraseCandidate>& out) const {
    std::vector<std::vector<Word>> runs(1);

    auto barrier = [&runs]() {
        if (!runs.back().empty()) runs.emplace_back();
    };

    std::size_t i = 0;
    while (i < prompt.size()) {
        char c = prompt[i];
        if (is_space(c)) {
            ++i;
            continue;
        }
        if (!is_word_char(c)) {
            barrier();
            ++i;
            continue;
        }

        std::size_t start = i;
        while (i < prompt.size() && is_word_char(prompt[i])) ++i;
        std::string_view word = prompt.substr(start, i - start);

        bool in_literal = std::any_of(literals.begin(), literals.end(),
            [&](const PhraseCandidate& l) { return overlaps(start, i, l.start, l.end); });

        if (all_digits(word) || in_literal) {
            barrier();
            continue;
        }
        runs.back().push_back(Word{start, i, is_stop_word(to_lower(word))});
    }

    for (const auto& run : runs) {
        for (std::size_t s = 0; s < run.size(); ++s) {
            if (run[s].stop) continue;
            for (std::size_t len = 1; len <= config_.max_window && s + len <= run.size(); ++len) {
                const Word& last = run[s + len - 1];
                if (last.stop) continue;
                if (len == 1 && last.end - run[s].start < 2) continue;

                std::string text;
                for (std::size_t k = s; k < s + len; ++k) {
                    if (k > s) text += ' ';
                    text.append(prompt.substr(run[k].start, run[k].end - run[k].start));
                }
                out.push_back(PhraseCandidate{std::move(text), run[s].start, last.end, false});
            }
        }
    }
}

// ── extract ─────────────────────────────────────────────────────────────────

std::vector<PhraseCandidate> PhraseExtractor::extract(std::string_view prompt) const {
    std::vector<PhraseCandidate> literals;
    find_literals(prompt, literals);

    std::vector<PhraseCandidate> others;
    if (config_.include_quoted) find_quoted(prompt, others);
    find_windows(prompt, literals, others);

    auto by_position = [](const PhraseCandidate& a, const PhraseCandidate& b) {
        if (a.start != b.start) return a.start < b.start;
        return (a.end - a.start) < (b.end - b.start);
    };

    // Literal candidates survive the cap first; the remaining budget goes
    // to the earliest other candidates.
    std::stable_sort(literals.begin(), literals.end(), by_position);
    std::stable_sort(others.begin(), others.end(), by_position);

    std::vector<PhraseCandidate> out;
    for (auto& l : literals) {
        if (out.size() >= config_.max_candidates) break;
        out.push_back(std::move(l));
    }
    for (auto& o : others) {
        if (out.size() >= config_.max_candidates) break;
        out.push_back(std::move(o));
    }
    std::stable_sort(out.begin(), out.end(), by_position);
    return out;
}

// ── extract_numbers ─────────────────────────────────────────────────────────

std::vector<NumericMention> extract_numbers(std::string_view prompt) {
    std::vector<NumericMention> found;

    std::size_t i = 0;
    while (i < prompt.size()) {
        char c = prompt[i];
        bool sign = c == '-' && i + 1 < prompt.size() &&
                    std::isdigit(static_cast<unsigned char>(prompt[i + 1])) &&
                    (i == 0 || is_space(prompt[i - 1]) || prompt[i - 1] == '(');
        bool digit = std::isdigit(static_cast<unsigned char>(c)) != 0;
        if (!sign && !digit) {
            ++i;
            continue;
        }
        if (i > 0 && !sign && (is_ident_char(prompt[i - 1]) || prompt[i - 1] == '.')) {
            while (i < prompt.size() && is_ident_char(prompt[i])) ++i;
            continue;
        }

        std::size_t start = i;
        if (sign) ++i;
        while (i < prompt.size() && std::isdigit(static_cast<unsigned char>(prompt[i]))) ++i;
        if (i + 1 < prompt.size() && prompt[i] == '.' &&
            std::isdigit(static_cast<unsigned char>(prompt[i + 1]))) {
            ++i;
            while (i < prompt.size() && std::isdigit(static_cast<unsigned char>(prompt[i]))) ++i;
        }
        if (i < prompt.size() && std::isalpha(static_cast<unsigned char>(prompt[i]))) {
            // Part of a token such as "3rd" or "2fa".
            while (i < prompt.size() && is_ident_char(prompt[i])) ++i;
            continue;
        }

        double value = 0.0;
        auto res = std::from_chars(prompt.data() + start, prompt.data() + i, value);
        if (res.ec != std::errc()) continue;
        found.push_back(NumericMention{value, std::nullopt, start, i});
    }

    // Merge "A to B", "A through B", "A-B" and "between A and B".
    std::vector<NumericMention> merged;
    for (std::size_t k = 0; k < found.size(); ++k) {
        if (k + 1 < found.size()) {
            const NumericMention& a = found[k];
            const NumericMention& b = found[k + 1];
            std::string gap = to_lower(trim(std::string(prompt.substr(a.end, b.start - a.end))));
            bool range = gap == "to" || gap == "through" || gap == "-";
            if (gap == "and") {
                std::string before = to_lower(trim(std::string(prompt.substr(0, a.start))));
                range = before.size() >= 7 &&
                        before.compare(before.size() - 7, 7, "between") == 0;
            }
            if (range) {
                merged.push_back(NumericMention{a.value, b.value, a.start, b.end});
                ++k;
                continue;
            }
        }
        merged.push_back(found[k]);
    }
    return merged;
}

}  // namespace rulemap
