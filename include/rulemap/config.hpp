// ============================================================================
// rulemap/config.hpp — Startup configuration
// ============================================================================
//
// Configuration files are line-based `key = value` pairs:
//
//   # similarity policy
//   threshold = 0.25
//   top_k     = 3
//   operators = and, or, not, >, >=, <, <=, ==, !=, in
//   threads   = 4
//
// Blank lines and '#' comments are ignored.  Command-line flags are applied
// afterwards through apply_setting(), so they override the file.
//
// ============================================================================

#ifndef RULEMAP_CONFIG_HPP
#define RULEMAP_CONFIG_HPP

#include "rulemap/ast.hpp"
#include "rulemap/extractor.hpp"
#include "rulemap/mapper.hpp"
#include "rulemap/validator.hpp"

#include <cstddef>
#include <string>

namespace rulemap {

// ── Config ──────────────────────────────────────────────────────────────────

struct Config {
    ExtractorConfig extractor;
    MapperConfig    mapper;
    ValidatorConfig validator;
    bool            check_satisfiability = true;
    std::size_t     embedding_dimension = 256;   // HashingEmbedder only
};

/// Set one `key = value` pair.  Throws ConfigError for an unknown key or a
/// value that does not parse.
void apply_setting(Config& config, const std::string& key, const std::string& value);

/// Read a config file on top of `base`.  Errors name the offending line.
Config load_config(const std::string& path, Config base = {});

/// Throws ConfigError if the configuration cannot be used.
void validate_config(const Config& config);

/// "and, or, not, >" → operator set.  Throws ConfigError on an unknown name.
OperatorSet parse_operator_list(const std::string& list);

/// One-line summary for --verbose.
std::string describe(const Config& config);

}  // namespace rulemap

#endif  // RULEMAP_CONFIG_HPP
