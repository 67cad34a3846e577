// ============================================================================
// rulemap/embedder.hpp — Embedding collaborators
// ============================================================================
//
// Text → fixed-length vector.  The core never computes embeddings on its
// own; the analyzer asks an Embedder for every candidate phrase before the
// (pure) mapper runs.
//
// An empty vector from embed() means "no embedding available"; the phrase
// is skipped.  A non-empty vector of the wrong length is a deployment
// error and raises ConfigError.
//
// ============================================================================

#ifndef RULEMAP_EMBEDDER_HPP
#define RULEMAP_EMBEDDER_HPP

#include "rulemap/registry.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>

namespace rulemap {

// ── Embedder ────────────────────────────────────────────────────────────────

class Embedder {
public:
    virtual ~Embedder() = default;

    virtual std::size_t dimension() const noexcept = 0;

    virtual Embedding embed(const std::string& text) const = 0;
};

// ── HashingEmbedder ─────────────────────────────────────────────────────────
// Deterministic bag-of-features embedding for offline use.  Text is
// lower-cased and split on non-alphanumeric characters; every word and
// every character trigram of "^word$" is hashed (FNV-1a) into one of
// `dimension` buckets with a hash-derived sign.  The result is
// L2-normalised; text without words embeds to the zero vector.

class HashingEmbedder : public Embedder {
public:
    static constexpr std::size_t kDefaultDimension = 256;

    explicit HashingEmbedder(std::size_t dimension = kDefaultDimension);

    std::size_t dimension() const noexcept override { return dimension_; }

    Embedding embed(const std::string& text) const override;

private:
    void add_feature(Embedding& v, std::string_view feature, float weight) const;

    std::size_t dimension_;
};

// ── PrecomputedEmbedder ─────────────────────────────────────────────────────
// Table of vectors computed elsewhere (e.g. by a sentence-embedding model).
// Lookup is exact first, then on the lower-cased, whitespace-trimmed text.

class PrecomputedEmbedder : public Embedder {
public:
    explicit PrecomputedEmbedder(std::size_t dimension);

    /// Throws ConfigError when the vector length differs from dimension().
    void add(const std::string& text, Embedding vector);

    std::size_t dimension() const noexcept override { return dimension_; }
    std::size_t size() const noexcept { return table_.size(); }

    Embedding embed(const std::string& text) const override;

    /// Load {"dimension": d, "vectors": {"phrase": [...], ...}}.
    /// "dimension" may be omitted when at least one vector is present.
    static PrecomputedEmbedder load_file(const std::string& path);

private:
    std::size_t                                dimension_;
    std::unordered_map<std::string, Embedding> table_;
};

// ── Similarity ──────────────────────────────────────────────────────────────

/// dot(a,b) / (|a||b|); 0 when either magnitude is zero or the lengths
/// differ.
double cosine_similarity(const Embedding& a, const Embedding& b) noexcept;

/// 64-bit FNV-1a.
std::uint64_t fnv1a(std::string_view bytes) noexcept;

}  // namespace rulemap

#endif  // RULEMAP_EMBEDDER_HPP
