// ============================================================================
// embedder.cpp — Hashing and precomputed embedders, cosine similarity
// ============================================================================

#include "rulemap/embedder.hpp"
#include "rulemap/errors.hpp"
#include "rulemap/parser.hpp"
#include "rulemap/utils.hpp"

#include <cctype>
#include <cmath>

namespace rulemap {

// ── fnv1a ───────────────────────────────────────────────────────────────────

std::uint64_t fnv1a(std::string_view bytes) noexcept {
    std::uint64_t h = 0xcbf29ce484222325ULL;
    for (unsigned char c : bytes) {
        h ^= c;
        h *= 0x100000001b3ULL;
    }
    return h;
}

// ── cosine_similarity ───────────────────────────────────────────────────────

double cosine_similarity(const Embedding& a, const Embedding& b) noexcept {
    if (a.size() != b.size() || a.empty()) return 0.0;

    double dot = 0.0, na = 0.0, nb = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        na  += static_cast<double>(a[i]) * a[i];
        nb  += static_cast<double>(b[i]) * b[i];
    }
    if (na == 0.0 || nb == 0.0) return 0.0;

    double sim = dot / (std::sqrt(na) * std::sqrt(nb));
    // Rounding can push identical vectors a hair past 1.
    if (sim > 1.0) sim = 1.0;
    if (sim < -1.0) sim = -1.0;
    return sim;
}

// ── HashingEmbedder ─────────────────────────────────────────────────────────

HashingEmbedder::HashingEmbedder(std::size_t dimension)
    : dimension_(dimension) {
    if (dimension_ == 0) {
        throw ConfigError("embedding dimension must be positive");
    }
}

void HashingEmbedder::add_feature(Embedding& v, std::string_view feature,
                                  float weight) const {
    std::uint64_t h = fnv1a(feature);
    std::size_t bucket = static_cast<std::size_t>(h % dimension_);
    float sign = ((h >> 63) & 1U) ? -1.0f : 1.0f;
    v[bucket] += sign * weight;
}

Embedding HashingEmbedder::embed(const std::string& text) const {
    Embedding v(dimension_, 0.0f);

    std::string lower = to_lower(text);
    std::size_t i = 0;
    while (i < lower.size()) {
        while (i < lower.size() && !std::isalnum(static_cast<unsigned char>(lower[i]))) ++i;
        std::size_t begin = i;
        while (i < lower.size() && std::isalnum(static_cast<unsigned char>(lower[i]))) ++i;
        if (i == begin) break;

        std::string_view word(lower.data() + begin, i - begin);
        add_feature(v, word, 1.0f);

        std::string padded = "^" + std::string(word) + "$";
        for (std::size_t k = 0; k + 3 <= padded.size(); ++k) {
            add_feature(v, std::string_view(padded).substr(k, 3), 0.5f);
        }
    }

    double norm = 0.0;
    for (float x : v) norm += static_cast<double>(x) * x;
    if (norm > 0.0) {
        float inv = static_cast<float>(1.0 / std::sqrt(norm));
        for (float& x : v) x *= inv;
    }
    return v;
}

// ── PrecomputedEmbedder ─────────────────────────────────────────────────────

PrecomputedEmbedder::PrecomputedEmbedder(std::size_t dimension)
    : dimension_(dimension) {
    if (dimension_ == 0) {
        throw ConfigError("embedding dimension must be positive");
    }
}

void PrecomputedEmbedder::add(const std::string& text, Embedding vector) {
    if (vector.size() != dimension_) {
        throw ConfigError("embedding for '" + text + "' has dimension " +
                          std::to_string(vector.size()) + ", expected " +
                          std::to_string(dimension_));
    }
    table_[text] = std::move(vector);
}

Embedding PrecomputedEmbedder::embed(const std::string& text) const {
    auto it = table_.find(text);
    if (it != table_.end()) return it->second;

    it = table_.find(to_lower(trim(text)));
    if (it != table_.end()) return it->second;

    return {};
}

PrecomputedEmbedder PrecomputedEmbedder::load_file(const std::string& path) {
    Json doc;
    try {
        doc = parse_json(read_file(path));
    } catch (const ParseError& e) {
        throw ConfigError(path + ": " + e.what());
    }

    if (!doc.is_object() || !doc.contains("vectors") || !doc["vectors"].is_object()) {
        throw ConfigError(path + ": expected an object with a \"vectors\" object");
    }
    const Json& vectors = doc["vectors"];

    std::size_t dim = 0;
    if (doc.contains("dimension")) {
        const Json& d = doc["dimension"];
        if (!d.is_number_integer() || d.get<std::int64_t>() < 1) {
            throw ConfigError(path + ": \"dimension\" must be a positive integer");
        }
        dim = d.get<std::size_t>();
    } else if (!vectors.empty()) {
        dim = vectors.begin()->size();
    }

    PrecomputedEmbedder emb(dim);
    for (const auto& [phrase, vec] : vectors.items()) {
        if (!vec.is_array()) {
            throw ConfigError(path + ": vector for '" + phrase + "' must be an array");
        }
        Embedding v;
        v.reserve(vec.size());
        for (const auto& x : vec) {
            if (!x.is_number()) {
                throw ConfigError(path + ": non-numeric component in '" + phrase + "'");
            }
            v.push_back(x.get<float>());
        }
        emb.add(phrase, std::move(v));
    }
    return emb;
}

}  // namespace rulemap
