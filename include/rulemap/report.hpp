// ============================================================================
// rulemap/report.hpp — JSON rendering of analysis results
// ============================================================================
//
// Shapes match what the surrounding service returns to its clients:
//
//   {"json_logic": ..., "explanation": [...], "used_keys": [...],
//    "key_mappings": [{"user_phrase", "mapped_to", "similarity"}, ...],
//    "confidence_score": 0.85,
//    "validation": {"valid", "used_keys", "errors": [...]},
//    "unmatched_phrases": [...], "numeric_values": [...],
//    "satisfiable": true | false | "unknown", "witness": "..."}
//
// Similarities and the confidence score are rounded to 4 decimals.  Members
// print in the order shown.
//
// ============================================================================

#ifndef RULEMAP_REPORT_HPP
#define RULEMAP_REPORT_HPP

#include "rulemap/analyzer.hpp"
#include "rulemap/registry.hpp"
#include "rulemap/utils.hpp"
#include "rulemap/validator.hpp"

#include <string>

namespace rulemap {

void to_json(Json& j, const ValidationResult& result);
void to_json(Json& j, const AnalysisReport& report);

/// Pretty-printed with two-space indentation.
std::string to_json(const ValidationResult& result);
std::string to_json(const AnalysisReport& report);

/// Compact: {"keys":["bureau.score",...],"count":n}
std::string keys_to_json(const Registry& registry);

}  // namespace rulemap

#endif  // RULEMAP_REPORT_HPP
