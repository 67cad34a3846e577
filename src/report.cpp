// ============================================================================
// report.cpp — JSON rendering of analysis results
// ============================================================================

#include "rulemap/report.hpp"
#include "rulemap/utils.hpp"

#include <optional>
#include <set>

namespace rulemap {

namespace {

constexpr int kScorePlaces = 4;
constexpr int kIndent = 2;

Json score(double value) {
    return json_number(round_to(value, kScorePlaces));
}

Json satisfiable_json(const std::optional<SolverResult>& result) {
    if (!result) return nullptr;
    switch (*result) {
        case SolverResult::Satisfiable:   return true;
        case SolverResult::Unsatisfiable: return false;
        case SolverResult::Unknown:       break;
    }
    return "unknown";
}

}  // namespace

// ── ValidationResult ────────────────────────────────────────────────────────

void to_json(Json& j, const ValidationResult& result) {
    Json errors = Json::array();
    for (const auto& e : result.errors) {
        errors.push_back(Json{{"type", error_kind_name(e.kind)},
                          {"message", e.message},
                          {"subject", e.subject},
                          {"path", e.path}});
    }
    j = {{"valid", result.valid},
         {"used_keys", result.used_keys},
         {"errors", std::move(errors)}};
}

std::string to_json(const ValidationResult& result) {
    Json j;
    to_json(j, result);
    return dump_json(j, kIndent);
}

// ── AnalysisReport ──────────────────────────────────────────────────────────

void to_json(Json& j, const AnalysisReport& report) {
    j = Json::object();

    if (report.rule) {
        to_json(j["json_logic"], *report.rule);
    } else {
        j["json_logic"] = nullptr;
    }
    j["explanation"] = report.explanation;
    j["used_keys"] = report.validation ? report.validation->used_keys
                                       : std::set<std::string>{};

    Json mappings = Json::array();
    for (const auto& m : report.key_mappings) {
        mappings.push_back(Json{{"user_phrase", m.user_phrase},
                            {"mapped_to", m.mapped_to},
                            {"similarity", score(m.similarity)}});
    }
    j["key_mappings"] = std::move(mappings);
    j["confidence_score"] = score(report.confidence_score);

    if (report.validation) {
        to_json(j["validation"], *report.validation);
    } else {
        j["validation"] = nullptr;
    }

    Json unmatched = Json::array();
    for (const auto& u : report.unmatched) {
        Json suggestions = Json::array();
        for (const auto& s : u.suggestions) {
            suggestions.push_back(Json{{"key", s.identifier},
                                   {"similarity", score(s.similarity)}});
        }
        unmatched.push_back(Json{{"phrase", u.phrase},
                             {"best_similarity", score(u.best_similarity)},
                             {"suggestions", std::move(suggestions)}});
    }
    j["unmatched_phrases"] = std::move(unmatched);

    Json numbers = Json::array();
    for (const auto& n : report.numeric_values) {
        if (n.upper) {
            numbers.push_back(Json{{"from", json_number(n.value)},
                               {"to", json_number(*n.upper)}});
        } else {
            numbers.push_back(json_number(n.value));
        }
    }
    j["numeric_values"] = std::move(numbers);

    j["satisfiable"] = satisfiable_json(report.satisfiable);
    j["witness"] = report.witness;

    if (report.normalized) {
        to_json(j["normalized"], *report.normalized);
    }
}

std::string to_json(const AnalysisReport& report) {
    Json j;
    to_json(j, report);
    return dump_json(j, kIndent) + "\n";
}

// ── keys_to_json ────────────────────────────────────────────────────────────

std::string keys_to_json(const Registry& registry) {
    Json j = {{"keys", registry.identifiers()}, {"count", registry.size()}};
    return dump_json(j);
}

}  // namespace rulemap
