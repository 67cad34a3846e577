// ============================================================================
// rulemap/registry.hpp — Closed vocabulary of canonical keys
// ============================================================================
//
// The registry is loaded once at startup and never mutated afterwards.
// Every accessor is const, so any number of threads may read it at the
// same time without locking.
//
// ============================================================================

#ifndef RULEMAP_REGISTRY_HPP
#define RULEMAP_REGISTRY_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace rulemap {

class Embedder;

using Embedding = std::vector<float>;

// ── CanonicalKey ────────────────────────────────────────────────────────────

struct CanonicalKey {
    std::string identifier;    // dot-delimited path, e.g. "bureau.score"
    Embedding   embedding;
    std::string description;   // optional, used as embedding text

    bool operator==(const CanonicalKey& o) const {
        return identifier == o.identifier && embedding == o.embedding &&
               description == o.description;
    }
};

// ── Registry ────────────────────────────────────────────────────────────────

class Registry {
public:
    /// Build a registry from entries in load order.
    /// Throws DuplicateKeyError on a repeated identifier and ConfigError on
    /// an empty identifier, a zero-dimension embedding or inconsistent
    /// embedding dimensions.
    static Registry load(std::vector<CanonicalKey> entries);

    /// nullptr when the identifier is not in the vocabulary.
    const CanonicalKey* lookup(std::string_view identifier) const;

    bool contains(std::string_view identifier) const;

    /// All keys in load order.
    const std::vector<CanonicalKey>& all() const noexcept { return keys_; }

    /// All identifiers in load order.
    std::vector<std::string> identifiers() const;

    std::size_t size() const noexcept { return keys_.size(); }
    bool        empty() const noexcept { return keys_.empty(); }

    /// Shared embedding dimension (0 for an empty registry).
    std::size_t dimension() const noexcept { return dimension_; }

private:
    Registry() = default;

    std::vector<CanonicalKey>                    keys_;
    std::unordered_map<std::string, std::size_t> index_;
    std::size_t                                  dimension_ = 0;
};

/// Text used to embed a key that was loaded without a vector: the
/// description when present, otherwise the identifier with '.' and '_'
/// replaced by spaces.
std::string embedding_text(const CanonicalKey& key);

/// Load a store-keys file:
///   {"keys": [{"key": "bureau.score", "description": "...",
///              "embedding": [0.1, ...]}, ...]}
/// Keys without an "embedding" member are embedded with `embedder`; if
/// `embedder` is null such keys are a ConfigError.
Registry load_registry_file(const std::string& path, const Embedder* embedder);

}  // namespace rulemap

#endif  // RULEMAP_REGISTRY_HPP
