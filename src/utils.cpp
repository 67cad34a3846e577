// ============================================================================
// utils.cpp — File I/O and string utilities
// ============================================================================

#include "rulemap/utils.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace rulemap {

// ── read_lines ──────────────────────────────────────────────────────────────

std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open file: " + path);
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(std::move(line));
    }
    return lines;
}

// ── read_file ───────────────────────────────────────────────────────────────

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open file: " + path);
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

// ── trim ────────────────────────────────────────────────────────────────────

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// ── strip_comment ───────────────────────────────────────────────────────────

std::string strip_comment(const std::string& line) {
    auto pos = line.find('#');
    if (pos == std::string::npos) {
        return trim(line);
    }
    return trim(line.substr(0, pos));
}

// ── is_blank_or_comment ─────────────────────────────────────────────────────

bool is_blank_or_comment(const std::string& line) {
    return strip_comment(line).empty();
}

// ── split ───────────────────────────────────────────────────────────────────

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::size_t begin = 0;
    while (begin <= s.size()) {
        std::size_t end = s.find(delim, begin);
        if (end == std::string::npos) end = s.size();
        std::string piece = trim(s.substr(begin, end - begin));
        if (!piece.empty()) parts.push_back(std::move(piece));
        begin = end + 1;
    }
    return parts;
}

// ── to_lower ────────────────────────────────────────────────────────────────

std::string to_lower(std::string_view s) {
    std::string out(s);
    for (char& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

// ── json_number ─────────────────────────────────────────────────────────────

Json json_number(double value) {
    if (!std::isfinite(value)) return nullptr;
    if (value == std::floor(value) && std::fabs(value) < 1e15) {
        return static_cast<std::int64_t>(value);
    }
    return value;
}

std::string dump_json(const Json& value, int indent) {
    return value.dump(indent, ' ', false, Json::error_handler_t::replace);
}

// ── format_number ───────────────────────────────────────────────────────────
// JSON has no NaN or infinity; those print as null.

std::string format_number(double value) {
    if (!std::isfinite(value)) return "null";
    if (value == std::floor(value) && std::fabs(value) < 1e15) {
        return std::to_string(static_cast<std::int64_t>(value));
    }
    std::ostringstream oss;
    oss << std::setprecision(15) << value;
    return oss.str();
}

// ── round_to ────────────────────────────────────────────────────────────────

double round_to(double value, int places) {
    double scale = std::pow(10.0, places);
    return std::round(value * scale) / scale;
}

}  // namespace rulemap
