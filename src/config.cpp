// ============================================================================
// config.cpp — Startup configuration
// ============================================================================

#include "rulemap/config.hpp"
#include "rulemap/errors.hpp"
#include "rulemap/utils.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <sstream>

namespace rulemap {

namespace {

double parse_double(const std::string& key, const std::string& value) {
    double v = 0.0;
    const char* end = value.data() + value.size();
    auto res = std::from_chars(value.data(), end, v);
    if (value.empty() || res.ec != std::errc() || res.ptr != end) {
        throw ConfigError("setting '" + key + "': '" + value + "' is not a number");
    }
    return v;
}

// Counts are bounded before the conversion, which is undefined out of range.
std::size_t parse_count(const std::string& key, const std::string& value,
                        std::size_t max = std::numeric_limits<std::uint32_t>::max()) {
    double v = parse_double(key, value);
    if (v < 0 || v != std::floor(v)) {
        throw ConfigError("setting '" + key + "': '" + value +
                          "' is not a non-negative integer");
    }
    if (v > static_cast<double>(max)) {
        throw ConfigError("setting '" + key + "': '" + value +
                          "' is too large (maximum " + std::to_string(max) + ")");
    }
    return static_cast<std::size_t>(v);
}

bool parse_bool(const std::string& key, const std::string& value) {
    std::string v = to_lower(value);
    if (v == "true" || v == "yes" || v == "on" || v == "1") return true;
    if (v == "false" || v == "no" || v == "off" || v == "0") return false;
    throw ConfigError("setting '" + key + "': '" + value + "' is not a boolean");
}

}  // namespace

// ── parse_operator_list ─────────────────────────────────────────────────────

OperatorSet parse_operator_list(const std::string& list) {
    OperatorSet ops;
    for (const auto& name : split(list, ',')) {
        OperatorKind op = parse_operator(name);
        if (op == OperatorKind::Unknown) {
            throw ConfigError("unknown operator in operator list: '" + name + "'");
        }
        ops.insert(op);
    }
    if (ops.empty()) {
        throw ConfigError("operator list is empty");
    }
    return ops;
}

// ── apply_setting ───────────────────────────────────────────────────────────
// Keys may be written with '-' or '_' ("top-k" and "top_k" are the same),
// so command-line spellings go through unchanged.

void apply_setting(Config& config, const std::string& raw_key, const std::string& raw_value) {
    std::string key = to_lower(trim(raw_key));
    for (char& c : key) {
        if (c == '-') c = '_';
    }
    std::string value = trim(raw_value);

    if (key == "threshold") {
        config.mapper.threshold = parse_double(key, value);
    } else if (key == "top_k") {
        config.mapper.top_k = parse_count(key, value);
    } else if (key == "literal_similarity") {
        config.mapper.literal_similarity = parse_double(key, value);
    } else if (key == "threads") {
        config.mapper.num_threads = static_cast<int>(
            parse_count(key, value, std::numeric_limits<int>::max()));
    } else if (key == "max_depth") {
        config.validator.max_depth = parse_count(key, value);
    } else if (key == "max_size") {
        config.validator.max_size = parse_count(key, value);
    } else if (key == "operators") {
        config.validator.allowed_operators = parse_operator_list(value);
    } else if (key == "require_mapped_keys" || key == "require_mapped") {
        config.validator.require_mapped_keys = parse_bool(key, value);
    } else if (key == "check_satisfiability") {
        config.check_satisfiability = parse_bool(key, value);
    } else if (key == "max_window") {
        config.extractor.max_window = parse_count(key, value);
    } else if (key == "max_candidates") {
        config.extractor.max_candidates = parse_count(key, value);
    } else if (key == "include_quoted") {
        config.extractor.include_quoted = parse_bool(key, value);
    } else if (key == "embedding_dimension") {
        config.embedding_dimension = parse_count(key, value);
    } else {
        throw ConfigError("unknown setting '" + raw_key + "'");
    }
}

// ── load_config ─────────────────────────────────────────────────────────────

Config load_config(const std::string& path, Config base) {
    auto lines = read_lines(path);

    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (is_blank_or_comment(lines[i])) continue;

        std::string line = strip_comment(lines[i]);
        std::string where = path + ":" + std::to_string(i + 1);

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigError(where + ": expected 'key = value', got '" + line + "'");
        }
        try {
            apply_setting(base, line.substr(0, eq), line.substr(eq + 1));
        } catch (const ConfigError& e) {
            throw ConfigError(where + ": " + e.what());
        }
    }
    return base;
}

// ── validate_config ─────────────────────────────────────────────────────────

void validate_config(const Config& config) {
    const MapperConfig& m = config.mapper;
    if (!std::isfinite(m.threshold) || m.threshold < -1.0 || m.threshold > 1.0) {
        throw ConfigError("threshold must lie in [-1, 1], got " + format_number(m.threshold));
    }
    if (m.top_k < 1) {
        throw ConfigError("top_k must be at least 1");
    }
    if (!std::isfinite(m.literal_similarity) || m.literal_similarity < m.threshold ||
        m.literal_similarity > 1.0) {
        throw ConfigError("literal_similarity must lie in [threshold, 1], got " +
                          format_number(m.literal_similarity));
    }
    if (m.num_threads < 0) {
        throw ConfigError("threads must not be negative");
    }

    const ValidatorConfig& v = config.validator;
    if (v.max_depth < 1) {
        throw ConfigError("max_depth must be at least 1");
    }
    if (v.max_size < 1) {
        throw ConfigError("max_size must be at least 1");
    }
    if (v.allowed_operators.count(OperatorKind::Unknown) != 0) {
        throw ConfigError("allowed operators contain an unknown operator");
    }

    if (config.extractor.max_window < 1) {
        throw ConfigError("max_window must be at least 1");
    }
    if (config.extractor.max_candidates < 1) {
        throw ConfigError("max_candidates must be at least 1");
    }
    if (config.embedding_dimension < 1) {
        throw ConfigError("embedding_dimension must be at least 1");
    }
}

// ── describe ────────────────────────────────────────────────────────────────

std::string describe(const Config& config) {
    std::ostringstream os;
    os << "threshold=" << format_number(config.mapper.threshold)
       << " top_k=" << config.mapper.top_k
       << " literal_similarity=" << format_number(config.mapper.literal_similarity)
       << " max_depth=" << config.validator.max_depth
       << " max_size=" << config.validator.max_size
       << " operators=[";
    bool first = true;
    for (OperatorKind op : config.validator.allowed_operators) {
        if (!first) os << ",";
        first = false;
        os << operator_name(op);
    }
    os << "] require_mapped_keys=" << (config.validator.require_mapped_keys ? "true" : "false")
       << " check_satisfiability=" << (config.check_satisfiability ? "true" : "false")
       << " max_window=" << config.extractor.max_window
       << " max_candidates=" << config.extractor.max_candidates;
    return os.str();
}

}  // namespace rulemap
