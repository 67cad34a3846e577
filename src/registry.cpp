// ============================================================================
// registry.cpp — Vocabulary registry loading and lookup
// ============================================================================

#include "rulemap/registry.hpp"
#include "rulemap/embedder.hpp"
#include "rulemap/errors.hpp"
#include "rulemap/parser.hpp"
#include "rulemap/utils.hpp"

namespace rulemap {

// ── Registry::load ──────────────────────────────────────────────────────────

Registry Registry::load(std::vector<CanonicalKey> entries) {
    Registry reg;
    reg.keys_.reserve(entries.size());

    for (auto& entry : entries) {
        if (entry.identifier.empty()) {
            throw ConfigError("registry key with an empty identifier");
        }
        if (entry.embedding.empty()) {
            throw ConfigError("registry key '" + entry.identifier +
                              "' has a zero-dimension embedding");
        }
        if (reg.dimension_ == 0) {
            reg.dimension_ = entry.embedding.size();
        } else if (entry.embedding.size() != reg.dimension_) {
            throw ConfigError("registry key '" + entry.identifier + "' has dimension " +
                              std::to_string(entry.embedding.size()) + ", expected " +
                              std::to_string(reg.dimension_));
        }
        if (!reg.index_.emplace(entry.identifier, reg.keys_.size()).second) {
            throw DuplicateKeyError(entry.identifier);
        }
        reg.keys_.push_back(std::move(entry));
    }
    return reg;
}

// ── Lookup ──────────────────────────────────────────────────────────────────

const CanonicalKey* Registry::lookup(std::string_view identifier) const {
    auto it = index_.find(std::string(identifier));
    if (it == index_.end()) return nullptr;
    return &keys_[it->second];
}

bool Registry::contains(std::string_view identifier) const {
    return lookup(identifier) != nullptr;
}

std::vector<std::string> Registry::identifiers() const {
    std::vector<std::string> ids;
    ids.reserve(keys_.size());
    for (const auto& k : keys_) ids.push_back(k.identifier);
    return ids;
}

// ── embedding_text ──────────────────────────────────────────────────────────

std::string embedding_text(const CanonicalKey& key) {
    if (!key.description.empty()) return key.description;
    std::string text = key.identifier;
    for (char& c : text) {
        if (c == '.' || c == '_') c = ' ';
    }
    return text;
}

// ── load_registry_file ──────────────────────────────────────────────────────

Registry load_registry_file(const std::string& path, const Embedder* embedder) {
    Json doc;
    try {
        doc = parse_json(read_file(path));
    } catch (const ParseError& e) {
        throw ConfigError(path + ": " + e.what());
    }

    if (!doc.is_object() || !doc.contains("keys") || !doc["keys"].is_array()) {
        throw ConfigError(path + ": expected an object with a \"keys\" array");
    }
    const Json& keys = doc["keys"];

    std::vector<CanonicalKey> entries;
    entries.reserve(keys.size());

    for (std::size_t i = 0; i < keys.size(); ++i) {
        const Json& item = keys[i];
        std::string where = path + ": keys[" + std::to_string(i) + "]";
        CanonicalKey key;

        if (item.is_string()) {
            key.identifier = item.get<std::string>();
        } else if (item.is_object()) {
            auto name = item.find("key");
            if (name == item.end() || !name->is_string()) {
                throw ConfigError(where + ": key entry without a \"key\" string");
            }
            key.identifier = name->get<std::string>();
            auto desc = item.find("description");
            if (desc != item.end() && desc->is_string()) {
                key.description = desc->get<std::string>();
            }
            auto emb = item.find("embedding");
            if (emb != item.end()) {
                if (!emb->is_array()) {
                    throw ConfigError(where + ": \"embedding\" must be an array");
                }
                for (const auto& x : *emb) {
                    if (!x.is_number()) {
                        throw ConfigError(where + ": non-numeric embedding component");
                    }
                    key.embedding.push_back(x.get<float>());
                }
                if (key.embedding.empty()) {
                    throw ConfigError(where + ": key '" + key.identifier +
                                      "' has a zero-dimension embedding");
                }
            }
        } else {
            throw ConfigError(where + ": key entries must be strings or objects");
        }

        if (key.embedding.empty()) {
            if (embedder == nullptr) {
                throw ConfigError(where + ": key '" + key.identifier +
                                  "' has no embedding and no embedder is configured");
            }
            key.embedding = embedder->embed(embedding_text(key));
            if (key.embedding.empty()) {
                throw ConfigError(where + ": embedder produced no vector for key '" +
                                  key.identifier + "'");
            }
        }
        entries.push_back(std::move(key));
    }

    return Registry::load(std::move(entries));
}

}  // namespace rulemap
