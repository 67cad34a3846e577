// ============================================================================
// rulemap/utils.hpp — Utility functions
// ============================================================================

#ifndef RULEMAP_UTILS_HPP
#define RULEMAP_UTILS_HPP

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace rulemap {

/// Object members keep insertion order, so reports print in a fixed layout.
using Json = nlohmann::ordered_json;

// ── File I/O ────────────────────────────────────────────────────────────────

/// Read a text file and return its content as a vector of lines.
/// Throws std::runtime_error if the file cannot be opened.
std::vector<std::string> read_lines(const std::string& path);

/// Read a whole text file into a string.
/// Throws std::runtime_error if the file cannot be opened.
std::string read_file(const std::string& path);

// ── String helpers ──────────────────────────────────────────────────────────

/// Trim leading and trailing whitespace from a string.
std::string trim(const std::string& s);

/// Strip an inline comment (everything from the first '#' onward).
/// Returns the portion before '#', trimmed.
std::string strip_comment(const std::string& line);

/// Return true if the line is empty or consists only of whitespace
/// (after comment stripping).
bool is_blank_or_comment(const std::string& line);

/// Split on a single-character delimiter; every piece is trimmed and
/// empty pieces are dropped.
std::vector<std::string> split(const std::string& s, char delim);

/// ASCII lower-case copy.
std::string to_lower(std::string_view s);

// ── JSON output helpers ─────────────────────────────────────────────────────

/// JSON number for `value`: integral values are stored as integers so they
/// print without a fractional part ("700", not "700.0").  NaN and infinity
/// become null.
Json json_number(double value);

/// Serialise with invalid UTF-8 replaced rather than thrown on.
/// indent < 0 gives the compact form.
std::string dump_json(const Json& value, int indent = -1);

/// Shortest round-trippable-enough decimal text for a number in messages.
/// Integral values print without a fractional part.
std::string format_number(double value);

/// Round to a fixed number of decimal places (used for reported scores).
double round_to(double value, int places);

}  // namespace rulemap

#endif  // RULEMAP_UTILS_HPP
