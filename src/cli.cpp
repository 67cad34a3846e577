// ============================================================================
// cli.cpp — Command-line interface and main driver
// ============================================================================

#include "rulemap/cli.hpp"
#include "rulemap/analyzer.hpp"
#include "rulemap/config.hpp"
#include "rulemap/embedder.hpp"
#include "rulemap/errors.hpp"
#include "rulemap/parser.hpp"
#include "rulemap/registry.hpp"
#include "rulemap/report.hpp"
#include "rulemap/test.hpp"
#include "rulemap/utils.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace rulemap {

// ── parse_args ──────────────────────────────────────────────────────────────

Options parse_args(int argc, char* argv[]) {
    Options opts;

    auto value_of = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::runtime_error(flag + " requires an argument");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--selftest") {
            opts.selftest = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--keys") {
            opts.list_keys = true;
        } else if (arg == "--normalize") {
            opts.normalize = true;
        } else if (arg == "--registry") {
            opts.registry = value_of(i, arg);
        } else if (arg == "--prompt") {
            opts.prompt = value_of(i, arg);
        } else if (arg == "--rule") {
            opts.rule = value_of(i, arg);
        } else if (arg == "--embeddings") {
            opts.embeddings = value_of(i, arg);
        } else if (arg == "--config") {
            opts.config = value_of(i, arg);
        } else if (arg == "--threshold" || arg == "--top-k" || arg == "--max-depth" ||
                   arg == "--operators" || arg == "--threads" || arg == "-j") {
            std::string key = arg == "-j" ? "threads" : arg.substr(2);
            opts.overrides.emplace_back(key, value_of(i, arg));
        } else if (arg == "--require-mapped") {
            opts.overrides.emplace_back("require_mapped_keys", "true");
        } else if (arg == "--no-sat") {
            opts.overrides.emplace_back("check_satisfiability", "false");
        } else if (arg.starts_with("-")) {
            throw std::runtime_error("unknown option: " + arg);
        } else {
            throw std::runtime_error("unexpected argument: " + arg);
        }
    }

    // Validate: need either --selftest or a registry.
    if (!opts.selftest && !opts.help && opts.registry.empty()) {
        throw std::runtime_error("no registry specified (use --help for usage)");
    }

    return opts;
}

// ── print_usage ─────────────────────────────────────────────────────────────

void print_usage(const char* program_name) {
    std::cerr
        << "Usage: " << program_name << " --registry <keys.json> [OPTIONS]\n"
        << "       " << program_name << " --selftest\n"
        << "\n"
        << "Maps prompt phrases to canonical store keys and validates drafted rules.\n"
        << "\n"
        << "Options:\n"
        << "  --registry <file>    Store keys JSON ({\"keys\": [...]})\n"
        << "  --prompt <text|@file>  Prompt to map (\"@path\" reads a file)\n"
        << "  --rule <file>        Drafted rule (JSON Logic or {\"json_logic\", \"explanation\"})\n"
        << "  --embeddings <file>  Precomputed phrase vectors (default: hashing embedder)\n"
        << "  --config <file>      key = value settings\n"
        << "  --threshold X        Minimum similarity for a mapping (default 0.2)\n"
        << "  --top-k N            Suggestions kept per phrase (default 3)\n"
        << "  --max-depth N        Maximum rule depth (default 10)\n"
        << "  --operators LIST     Allowed operators, comma-separated\n"
        << "  --require-mapped     Keys in the rule must come from a phrase mapping\n"
        << "  --no-sat             Skip the satisfiability check\n"
        << "  --normalize          Include the normalised rule in the report\n"
        << "  --threads N, -j N    Set number of OpenMP threads (0 = auto, default)\n"
        << "  --keys               List registry keys and exit\n"
        << "  --verbose, -v        Progress on stderr\n"
        << "  --selftest           Run built-in tests\n"
        << "  --help, -h           Show this message\n"
        << "\n"
        << "Config file format:\n"
        << "  - One 'key = value' per line\n"
        << "  - Empty lines and lines starting with # are ignored\n"
        << "  - Inline comments: everything after # is ignored\n";
}

// ── run ─────────────────────────────────────────────────────────────────────
// Main driver.  Loads configuration and the registry, maps the prompt,
// validates the drafted rule and prints the report on stdout.

int run(const Options& opts) {
    // ── Handle --selftest ───────────────────────────────────────────────
    if (opts.selftest) {
        return run_selftests();
    }

    // ── Configuration ───────────────────────────────────────────────────
    Config config;
    if (!opts.config.empty()) {
        config = load_config(opts.config);
    }
    for (const auto& [key, value] : opts.overrides) {
        apply_setting(config, key, value);
    }
    validate_config(config);
    if (opts.verbose) {
        std::cerr << "[config] " << describe(config) << "\n";
    }

    // ── Embedder ────────────────────────────────────────────────────────
    std::unique_ptr<Embedder> embedder;
    if (!opts.embeddings.empty()) {
        auto table = std::make_unique<PrecomputedEmbedder>(
            PrecomputedEmbedder::load_file(opts.embeddings));
        if (opts.verbose) {
            std::cerr << "[embedder] " << table->size() << " precomputed vectors, dimension "
                      << table->dimension() << "\n";
        }
        embedder = std::move(table);
    } else {
        embedder = std::make_unique<HashingEmbedder>(config.embedding_dimension);
        if (opts.verbose) {
            std::cerr << "[embedder] hashing, dimension " << embedder->dimension() << "\n";
        }
    }

    // ── Registry ────────────────────────────────────────────────────────
    Registry registry = load_registry_file(opts.registry, embedder.get());
    if (opts.verbose) {
        std::cerr << "[registry] " << registry.size() << " keys, dimension "
                  << registry.dimension() << "\n";
    }

    if (opts.list_keys) {
        std::cout << keys_to_json(registry) << "\n";
        return 0;
    }

    // ── Inputs ──────────────────────────────────────────────────────────
    std::string prompt = opts.prompt;
    if (prompt.starts_with("@")) {
        prompt = read_file(prompt.substr(1));
    }

    std::unique_ptr<Draft> draft;
    if (!opts.rule.empty()) {
        try {
            draft = std::make_unique<Draft>(parse_draft(
                read_file(opts.rule), nesting_for_depth(config.validator.max_depth)));
        } catch (const ParseError& e) {
            // Parser messages already include line/column or the rule path.
            std::cerr << opts.rule << ": " << e.what() << "\n";
            return 1;
        }
    }

    // ── Analyze ─────────────────────────────────────────────────────────
    RuleAnalyzer analyzer(registry, *embedder, config);
    analyzer.set_normalize(opts.normalize);

    AnalysisReport report = analyzer.analyze(prompt, draft.get());
    if (opts.verbose) {
        std::cerr << "[mapper] " << report.key_mappings.size() << " mappings, "
                  << report.unmatched.size() << " unmatched, confidence "
                  << format_number(round_to(report.confidence_score, 4)) << "\n";
        if (report.validation) {
            std::cerr << "[validator] " << (report.validation->valid ? "valid" : "invalid")
                      << ", " << report.validation->errors.size() << " errors\n";
        }
        if (report.satisfiable) {
            std::cerr << "[solver] " << solver_result_name(*report.satisfiable) << "\n";
        }
    }

    std::cout << to_json(report);

    bool invalid = report.validation && !report.validation->valid;
    return invalid ? 1 : 0;
}

}  // namespace rulemap
