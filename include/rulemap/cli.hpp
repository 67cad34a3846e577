// ============================================================================
// rulemap/cli.hpp — Command-line interface handling
// ============================================================================
//
// Parses argv into a structured Options object and provides the main
// driver: load config → load registry → map prompt → validate rule →
// print the JSON report.
//
// ============================================================================

#ifndef RULEMAP_CLI_HPP
#define RULEMAP_CLI_HPP

#include <string>
#include <utility>
#include <vector>

namespace rulemap {

// ── Options ─────────────────────────────────────────────────────────────────

struct Options {
    std::string registry;      // store-keys JSON file
    std::string prompt;        // prompt text (or @file)
    std::string rule;          // drafted rule / envelope JSON file
    std::string embeddings;    // precomputed phrase vectors (optional)
    std::string config;        // key = value config file (optional)
    std::vector<std::pair<std::string, std::string>> overrides;
    bool        list_keys = false;
    bool        normalize = false;
    bool        verbose = false;
    bool        selftest = false;
    bool        help = false;
};

/// Parse command-line arguments.  Throws std::runtime_error on bad usage.
Options parse_args(int argc, char* argv[]);

/// Print usage information to stderr.
void print_usage(const char* program_name);

/// Main driver.  Returns the process exit code (0 = ok, 1 = errors
/// encountered or the drafted rule is invalid).
int run(const Options& opts);

}  // namespace rulemap

#endif  // RULEMAP_CLI_HPP
