// ============================================================================
// rulemap/errors.hpp — Exception types
// ============================================================================
//
// Exceptions are reserved for input that cannot be processed at all
// (malformed rule text) and for startup configuration problems.  Defects
// found while validating a rule are values (see validator.hpp), and a
// phrase that maps to nothing is simply absent from the mapping set.
//
// ============================================================================

#ifndef RULEMAP_ERRORS_HPP
#define RULEMAP_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace rulemap {

// ── ParseError ──────────────────────────────────────────────────────────────
// Malformed JSON or rule structure.  The message is already formatted as
//   <line>: ERROR: <msg> at column <n>     (JSON syntax)
//   ERROR: <msg> at <path>                 (rule structure)

class ParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ── ConfigError ─────────────────────────────────────────────────────────────
// Fatal at startup: bad threshold, zero-dimension embeddings, dimension
// mismatch between the registry and the embedder, unknown setting.

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ── DuplicateKeyError ───────────────────────────────────────────────────────

class DuplicateKeyError : public ConfigError {
public:
    explicit DuplicateKeyError(const std::string& identifier)
        : ConfigError("duplicate registry key: " + identifier),
          identifier_(identifier) {}

    const std::string& identifier() const noexcept { return identifier_; }

private:
    std::string identifier_;
};

}  // namespace rulemap

#endif  // RULEMAP_ERRORS_HPP
