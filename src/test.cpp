// ============================================================================
// test.cpp — Self-test suite for the rulemap tool
// ============================================================================
//
// Contains tests covering:
//   - JSON helpers (number formatting, escaping, member order)
//   - JSON parsing and rule decoding (errors, nesting, operators, envelopes)
//   - Expression utilities (printing, depth/size, builders)
//   - Vocabulary registry (load, lookup round-trip, duplicates, files)
//   - Embedders and cosine similarity
//   - Phrase extraction (literals, windows, quoted spans, numbers)
//   - Similarity mapping (threshold, tie-break, suggestions, threads)
//   - Confidence aggregation
//   - Rule validation (keys, operators, arity, types, depth, size)
//   - Normalisation (NNF, flattening)
//   - Satisfiability (Z3)
//   - Configuration, analyzer pipeline and JSON report
//
// ============================================================================

#include "rulemap/test.hpp"
#include "rulemap/analyzer.hpp"
#include "rulemap/ast.hpp"
#include "rulemap/config.hpp"
#include "rulemap/embedder.hpp"
#include "rulemap/errors.hpp"
#include "rulemap/extractor.hpp"
#include "rulemap/mapper.hpp"
#include "rulemap/normalization.hpp"
#include "rulemap/parser.hpp"
#include "rulemap/registry.hpp"
#include "rulemap/report.hpp"
#include "rulemap/utils.hpp"
#include "rulemap/validator.hpp"
#include "rulemap/z3_solver.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <set>

#include <omp.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace rulemap {

// ── TestContext ──────────────────────────────────────────────────────────────

void TestContext::check(bool condition, const std::string& description) {
    ++total_;
    if (!condition) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n";
    }
}

void TestContext::check_eq(const std::string& actual,
                           const std::string& expected,
                           const std::string& description) {
    ++total_;
    if (actual != expected) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n"
                  << "    expected: " << expected << "\n"
                  << "    actual:   " << actual << "\n";
    }
}

void TestContext::check_near(double actual, double expected, double tolerance,
                             const std::string& description) {
    ++total_;
    if (!(std::fabs(actual - expected) <= tolerance)) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n"
                  << "    expected: " << expected << " (+/- " << tolerance << ")\n"
                  << "    actual:   " << actual << "\n";
    }
}

// ── TestRunner ──────────────────────────────────────────────────────────────

void TestRunner::run(const std::string& name, TestFunc func) {
    ++tests_run_;
    TestContext ctx;
    ctx.current_test_ = name;

    std::cerr << "TEST: " << name << "\n";
    try {
        func(ctx);
    } catch (const std::exception& e) {
        std::cerr << "  EXCEPTION: " << e.what() << "\n";
        ++ctx.failed_;
    }

    checks_total_ += ctx.total();
    checks_failed_ += ctx.failed();
    if (ctx.failed() > 0) {
        ++tests_failed_;
    } else {
        std::cerr << "  OK (" << ctx.total() << " checks)\n";
    }
}

int TestRunner::summarise() const {
    std::cerr << "\n=== Test Summary ===\n"
              << "Tests:  " << tests_run_ << " run, "
              << (tests_run_ - tests_failed_) << " passed, "
              << tests_failed_ << " failed\n"
              << "Checks: " << checks_total_ << " total, "
              << (checks_total_ - checks_failed_) << " passed, "
              << checks_failed_ << " failed\n";

    if (tests_failed_ == 0) {
        std::cerr << "ALL TESTS PASSED\n";
        return 0;
    } else {
        std::cerr << "SOME TESTS FAILED\n";
        return 1;
    }
}

// ============================================================================
// Helpers
// ============================================================================

static CanonicalKey key(const std::string& id, Embedding v) {
    CanonicalKey k;
    k.identifier = id;
    k.embedding = std::move(v);
    return k;
}

// bureau.score = (1, 0), business.vintage_in_years = (0, 1)
static Registry credit_registry() {
    return Registry::load({key("bureau.score", {1.0f, 0.0f}),
                           key("business.vintage_in_years", {0.0f, 1.0f})});
}

static EmbeddedPhrase phrase(const std::string& text, Embedding v) {
    EmbeddedPhrase p;
    p.candidate.text = text;
    p.embedding = std::move(v);
    return p;
}

static std::string pp(const std::string& rule) {
    return to_string(parse_rule(rule));
}

static std::string pp_norm(const std::string& rule) {
    return to_string(normalize(parse_rule(rule)));
}

template <typename Fn>
static std::string error_of(Fn fn) {
    try {
        fn();
    } catch (const std::exception& e) {
        return e.what();
    }
    return "";
}

static bool parse_fails(const std::string& input) {
    try {
        parse_rule(input);
        return false;
    } catch (const ParseError&) {
        return true;
    }
}

static std::string write_temp(const std::string& name, const std::string& content) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream f(path);
    f << content;
    return path.string();
}

static bool has_candidate(const std::vector<PhraseCandidate>& cs, const std::string& text) {
    return std::any_of(cs.begin(), cs.end(),
                       [&](const PhraseCandidate& c) { return c.text == text; });
}

static SolverResult solve(const std::string& rule) {
    RuleSolver solver;
    if (!solver.add_rule(parse_rule(rule))) return SolverResult::Unknown;
    return solver.check();
}

static const char* kScenarioRule =
    R"({"and":[{">":[{"var":"bureau.score"},700]},{">=":[{"var":"business.vintage_in_years"},3]}]})";

// ============================================================================
// Utility Tests
// ============================================================================

static void test_utils_strings(TestContext& ctx) {
    ctx.check_eq(trim("  a b \t\n"), "a b", "trim both ends");
    ctx.check_eq(strip_comment("threshold = 0.3  # strict"), "threshold = 0.3", "strip comment");
    ctx.check(is_blank_or_comment("   # only a comment"), "comment-only line");
    ctx.check(!is_blank_or_comment("x = 1"), "setting line");

    auto parts = split(" and, ,or , > ", ',');
    ctx.check(parts.size() == 3, "split drops empty pieces");
    ctx.check_eq(parts.size() == 3 ? parts[1] : "", "or", "split trims pieces");

    ctx.check_eq(to_lower("Bureau.SCORE"), "bureau.score", "to_lower");

    ctx.check_eq(format_number(700), "700", "integral number");
    ctx.check_eq(format_number(-3), "-3", "negative integral number");
    ctx.check_eq(format_number(0.5), "0.5", "fractional number");
    ctx.check_eq(format_number(std::nan("")), "null", "NaN prints as null");
    ctx.check_near(round_to(0.123456, 4), 0.1235, 1e-12, "round_to 4 places");
}

static void test_utils_json(TestContext& ctx) {
    ctx.check_eq(dump_json(json_number(700.0)), "700", "integral value prints without fraction");
    ctx.check_eq(dump_json(json_number(-3.0)), "-3", "negative integral value");
    ctx.check_eq(dump_json(json_number(0.925)), "0.925", "fractional value");
    ctx.check(json_number(std::nan("")).is_null(), "NaN becomes null");
    ctx.check(json_number(HUGE_VAL).is_null(), "infinity becomes null");

    ctx.check_eq(dump_json(Json("a\"b\\c\n")), "\"a\\\"b\\\\c\\n\"", "string escapes");
    ctx.check_eq(dump_json(Json(std::string(1, '\x01'))), "\"\\u0001\"", "control character");
    ctx.check_eq(dump_json(Json(std::string("ab\xff"))), "\"ab\xef\xbf\xbd\"",
                 "invalid UTF-8 replaced instead of thrown");

    Json obj = {{"z", 1}, {"a", 2}};
    ctx.check_eq(dump_json(obj), R"({"z":1,"a":2})", "members keep insertion order");
}

// ============================================================================
// Parser Tests
// ============================================================================

static void test_parse_json_structure(TestContext& ctx) {
    Json v = parse_json(R"({"b": 1, "a": [true, "x"], "c": {}})");
    ctx.check(v.is_object(), "object");
    ctx.check(v.size() == 3, "three members");
    ctx.check_eq(v.begin().key(), "b", "member order preserved");

    ctx.check(v.contains("a") && v["a"].is_array() && v["a"].size() == 2, "array member");
    ctx.check(!v.contains("missing"), "missing member");
    ctx.check(v["c"].is_object() && v["c"].empty(), "empty object");
}

static void test_parse_json_strings(TestContext& ctx) {
    ctx.check_eq(parse_json(R"("a\"b\\c\/d\te")").get<std::string>(), "a\"b\\c/d\te",
                 "simple escapes");
    ctx.check_eq(parse_json(R"("caf\u00e9")").get<std::string>(), "caf\xc3\xa9",
                 "\\u escape to UTF-8");
    ctx.check_eq(parse_json(R"("\ud83d\ude00")").get<std::string>(), "\xf0\x9f\x98\x80",
                 "surrogate pair to UTF-8");

    ctx.check(!error_of([] { parse_json("\"abc"); }).empty(), "unterminated string");
    ctx.check(!error_of([] { parse_json(R"("\x")"); }).empty(), "invalid escape");
    ctx.check(!error_of([] { parse_json(R"("\ud83d")"); }).empty(), "unpaired surrogate");
}

static void test_parse_json_numbers(TestContext& ctx) {
    ctx.check_near(parse_json("-12.5e2").get<double>(), -1250.0, 1e-9, "exponent value");
    ctx.check_near(parse_json("0").get<double>(), 0.0, 0.0, "zero");
    ctx.check_near(parse_json("3.25").get<double>(), 3.25, 1e-12, "fraction");

    ExprNode tiny = parse_rule("1e-400");
    ctx.check(tiny.is_literal() && tiny.literal.kind == LiteralKind::Number &&
              tiny.literal.number == 0.0, "underflow reads as zero");
    ExprNode cmp = parse_rule(R"({">":[{"var":"bureau.score"},1e-400]})");
    ctx.check(cmp.operands.size() == 2 && cmp.operands[1].is_literal(),
              "underflowing operand accepted");

    ctx.check(parse_fails("01"), "leading zero rejected");
    ctx.check(parse_fails("1."), "missing fraction digits");
    ctx.check(parse_fails("-"), "lone minus");
    ctx.check(parse_fails("tru"), "bad keyword");
}

static void test_parse_json_error_format(TestContext& ctx) {
    std::string msg = error_of([] { parse_json("\n  @"); });
    ctx.check(msg.rfind("2: ERROR: ", 0) == 0, "message starts with line number");
    ctx.check(msg.find("at column 3") != std::string::npos, "message names the column");

    try {
        parse_json("[1,]");
        ctx.check(false, "trailing comma must throw");
    } catch (const ParseError& e) {
        ctx.check(std::string(e.what()).rfind("1: ERROR: ", 0) == 0,
                  "library errors rethrown as ParseError");
    }
}

static void test_parse_json_errors(TestContext& ctx) {
    ctx.check(!error_of([] { parse_json("[1,]"); }).empty(), "trailing comma");
    ctx.check(!error_of([] { parse_json(R"({"a" 1})"); }).empty(), "missing colon");
    ctx.check(!error_of([] { parse_json("1 2"); }).empty(), "trailing value");
    ctx.check(!error_of([] { parse_json("{"); }).empty(), "unterminated object");
    ctx.check(!error_of([] { parse_json(""); }).empty(), "empty input");
    ctx.check(!error_of([] { parse_json("{1: 2}"); }).empty(), "non-string member name");
}

static void test_parse_nesting_limit(TestContext& ctx) {
    std::string deep = std::string(300, '[') + std::string(300, ']');
    ctx.check(error_of([&] { parse_json(deep); }).find("nesting") != std::string::npos,
              "default nesting guard");

    std::string five = std::string(5, '[') + std::string(5, ']');
    std::string six = std::string(6, '[') + std::string(6, ']');
    ctx.check(error_of([&] { parse_json(five, 5); }).empty(), "nesting at the limit");
    ctx.check(!error_of([&] { parse_json(six, 5); }).empty(), "nesting past the limit");
}

// {"!":[{"!":[ ... true ... ]}]}: two containers per level.
static std::string negation_chain(std::size_t levels) {
    std::string text;
    for (std::size_t i = 0; i < levels; ++i) text += R"({"!":[)";
    text += "true";
    for (std::size_t i = 0; i < levels; ++i) text += "]}";
    return text;
}

static void test_parse_nesting_follows_depth(TestContext& ctx) {
    ctx.check(nesting_for_depth(10) == kDefaultMaxNesting, "default depth keeps default guard");
    ctx.check(nesting_for_depth(200) == 402, "guard grows with max_depth");

    std::string text = negation_chain(150);
    ctx.check(error_of([&] { parse_rule(text); }).find("nesting") != std::string::npos,
              "default guard stops the chain");

    ValidatorConfig generous;
    generous.max_depth = 200;
    ExprNode rule;
    ctx.check(error_of([&] { rule = parse_rule(text, nesting_for_depth(generous.max_depth)); })
                  .empty(), "guard scaled to max_depth admits the chain");
    ctx.check(rule_depth(rule) == 151, "chain depth");

    Registry reg = credit_registry();
    ctx.check(Validator(reg, generous).validate(rule).valid, "validates under max_depth 200");

    ValidationResult r = Validator(reg).validate(rule);
    ctx.check(r.has_error(ErrorKind::DepthExceeded),
              "default max_depth reports depth, not a parse error");

    std::string envelope = R"({"json_logic": )" + negation_chain(200) + "}";
    ctx.check(error_of([&] { parse_draft(envelope, nesting_for_depth(200)); }).empty(),
              "envelope fits the scaled guard");
}

static void test_decode_rule_round_trip(TestContext& ctx) {
    ctx.check_eq(to_json(parse_rule(kScenarioRule)), kScenarioRule, "compact JSON round trip");
    ctx.check_eq(pp(kScenarioRule),
                 "((bureau.score > 700) and (business.vintage_in_years >= 3))",
                 "infix rendering");
}

static void test_decode_rule_forms(TestContext& ctx) {
    ExprNode n = parse_rule(R"({"!":{"var":"x"}})");
    ctx.check(n.is_operation() && n.op == OperatorKind::Not, "single operand without array");
    ctx.check(n.operands.size() == 1 && n.operands[0].is_var(), "operand is var");

    n = parse_rule(R"({"var":["k", 0]})");
    ctx.check(n.is_var() && n.key == "k", "var with default");

    n = parse_rule(R"({"not":[{"var":"x"}]})");
    ctx.check(n.op == OperatorKind::Not && n.op_name == "not", "spelling kept");
    ctx.check(n == make_not(ExprNode::var("x")), "spelling ignored by equality");

    n = parse_rule(R"({"foo":[1,2]})");
    ctx.check(n.op == OperatorKind::Unknown && n.op_name == "foo", "unknown operator kept");
    ctx.check_eq(to_json(n), R"({"foo":[1,2]})", "unknown operator prints back");

    n = parse_rule(R"({"in":[{"var":"region"},["north","south"]]})");
    ctx.check(n.op == OperatorKind::In && n.operands.size() == 2, "in operator");
    ctx.check(n.operands[1].is_literal() && n.operands[1].literal.kind == LiteralKind::List &&
              n.operands[1].literal.items.size() == 2, "list literal");

    n = parse_rule("42");
    ctx.check(n.is_literal() && n.literal.kind == LiteralKind::Number &&
              n.literal.number == 42.0, "scalar literal rule");
}

static void test_decode_rule_errors(TestContext& ctx) {
    ctx.check(error_of([] { parse_rule(R"({"a":1,"b":2})"); }).find("exactly one key") !=
              std::string::npos, "multi-member object");
    ctx.check(parse_fails("null"), "null rule");
    ctx.check(parse_fails(R"({"var":5})"), "var without name");
    ctx.check(parse_fails(R"({"in":[1,[{"a":1}]]})"), "object inside list");
    ctx.check(parse_fails(R"({"==":[{"var":"x"},null]})"), "null operand");

    std::string msg = error_of([] { parse_rule(R"({"and":[true,{">":[{"var":5},1]}]})"); });
    ctx.check(msg.rfind("ERROR: ", 0) == 0, "decode error prefix");
    ctx.check(msg.find("at $/and[1]/>[0]") != std::string::npos, "decode error names the path");
}

static void test_decode_draft(TestContext& ctx) {
    Draft d = parse_draft(R"({"json_logic": {"var": "flag"}, "explanation": "one line"})");
    ctx.check(d.rule.is_var() && d.rule.key == "flag", "envelope rule");
    ctx.check(d.explanation.size() == 1 && d.explanation[0] == "one line", "string explanation");

    d = parse_draft(R"({"json_logic": true, "explanation": ["a", "b"]})");
    ctx.check(d.explanation.size() == 2, "array explanation");

    d = parse_draft(kScenarioRule);
    ctx.check(d.explanation.empty() && d.rule.op == OperatorKind::And, "bare rule");

    ctx.check(!error_of([] { parse_draft(R"({"json_logic": true, "explanation": 5})"); }).empty(),
              "bad explanation type");
}

// ============================================================================
// Expression Utility Tests
// ============================================================================

static void test_ast_measurements(TestContext& ctx) {
    ExprNode rule = parse_rule(kScenarioRule);
    ctx.check(rule_depth(rule) == 3, "depth of scenario rule");
    ctx.check(rule_size(rule) == 7, "size of scenario rule");
    ctx.check(rule_depth(ExprNode::var("x")) == 1, "leaf depth is 1");

    auto keys = referenced_keys(parse_rule(
        R"({"or":[{">":[{"var":"a"},1]},{"<":[{"var":"b"},2]},{"<":[{"var":"a"},3]}]})"));
    ctx.check(keys.size() == 2 && keys[0] == "a" && keys[1] == "b",
              "referenced keys in first-occurrence order");
}

static void test_ast_builders(TestContext& ctx) {
    ExprNode c1 = make_condition("bureau.score", OperatorKind::Greater, Literal::of_number(700));
    ExprNode c2 = make_condition("region", OperatorKind::Equal, Literal::of_string("north"));

    ctx.check_eq(to_string(make_and({c1, c2})),
                 "((bureau.score > 700) and (region == \"north\"))", "make_and");
    ctx.check(make_or({c1}) == c1, "single condition collapses");
    ctx.check(!error_of([] { make_or({}); }).empty(), "empty or rejected");
    ctx.check(!error_of([] {
        make_condition("k", OperatorKind::And, Literal::of_bool(true));
    }).empty(), "non-comparison condition rejected");

    ExprNode in = make_in(ExprNode::var("region"),
                          {Literal::of_string("a"), Literal::of_string("b")});
    ctx.check_eq(to_json(in), R"({"in":[{"var":"region"},["a","b"]]})", "make_in");

    ExprNode cond = make_if(c1, ExprNode::lit(Literal::of_bool(true)), std::nullopt);
    ctx.check_eq(to_string(cond), "if((bureau.score > 700), true)", "make_if without else");
    ctx.check_eq(to_string(make_not(ExprNode::var("x"))), "!x", "make_not");
}

static void test_operator_names(TestContext& ctx) {
    ctx.check(parse_operator("not") == OperatorKind::Not, "'not' parses");
    ctx.check(parse_operator("!") == OperatorKind::Not, "'!' parses");
    ctx.check(parse_operator("xor") == OperatorKind::Unknown, "'xor' is unknown");
    ctx.check_eq(operator_name(OperatorKind::GreaterEq), ">=", ">= name");

    OperatorSet defaults = default_operators();
    ctx.check(defaults.size() == 10, "ten default operators");
    ctx.check(defaults.count(OperatorKind::In) == 1, "in is allowed by default");
    ctx.check(defaults.count(OperatorKind::If) == 0, "if is not allowed by default");
}

// ============================================================================
// Registry Tests
// ============================================================================

static void test_registry_round_trip(TestContext& ctx) {
    Registry reg = Registry::load({key("z.last", {0.0f, 1.0f}),
                                   key("a.first", {1.0f, 0.0f}),
                                   key("m.middle", {0.5f, 0.5f})});
    ctx.check(reg.size() == 3 && reg.dimension() == 2, "size and dimension");

    auto ids = reg.identifiers();
    ctx.check(ids.size() == 3 && ids[0] == "z.last" && ids[2] == "m.middle", "load order kept");

    for (const auto& k : reg.all()) {
        const CanonicalKey* found = reg.lookup(k.identifier);
        ctx.check(found != nullptr && *found == k, "lookup round trip: " + k.identifier);
    }
    ctx.check(reg.lookup("missing") == nullptr, "missing key");
    ctx.check(!reg.contains("a.firs"), "no prefix match");
}

static void test_registry_errors(TestContext& ctx) {
    try {
        Registry::load({key("dup", {1.0f}), key("other", {0.5f}), key("dup", {0.0f})});
        ctx.check(false, "duplicate identifier must throw");
    } catch (const DuplicateKeyError& e) {
        ctx.check_eq(e.identifier(), "dup", "duplicate identifier reported");
    }

    ctx.check(!error_of([] { Registry::load({key("a", {})}); }).empty(),
              "zero-dimension embedding");
    ctx.check(!error_of([] { Registry::load({key("a", {1.0f}), key("b", {1.0f, 0.0f})}); })
                   .empty(), "dimension mismatch");
    ctx.check(!error_of([] { Registry::load({key("", {1.0f})}); }).empty(), "empty identifier");
    ctx.check(Registry::load({}).empty(), "empty registry is allowed");
}

static void test_registry_file(TestContext& ctx) {
    HashingEmbedder emb(16);
    std::string path = write_temp("rulemap_selftest_registry.json", R"({"keys": [
        "bureau.score",
        {"key": "business.vintage_in_years", "description": "years the business has operated"},
        {"key": "region"}
    ]})");

    Registry reg = load_registry_file(path, &emb);
    ctx.check(reg.size() == 3 && reg.dimension() == 16, "loaded three keys");
    ctx.check(reg.lookup("region") != nullptr, "object entry without description");
    ctx.check_eq(reg.all()[1].description, "years the business has operated", "description kept");
    ctx.check_near(cosine_similarity(reg.lookup("bureau.score")->embedding,
                                     emb.embed("bureau score")), 1.0, 1e-6,
                   "identifier embedded as words");

    ctx.check(!error_of([&] { load_registry_file(path, nullptr); }).empty(),
              "missing embedder is a config error");

    std::string dup = write_temp("rulemap_selftest_dup.json", R"({"keys": ["a", "b", "a"]})");
    try {
        load_registry_file(dup, &emb);
        ctx.check(false, "duplicate key file must throw");
    } catch (const DuplicateKeyError& e) {
        ctx.check_eq(e.identifier(), "a", "duplicate from file");
    }

    std::string mixed = write_temp("rulemap_selftest_mixed.json",
                                   R"({"keys": ["a", {"key": "b", "embedding": [1, 0]}]})");
    ctx.check(!error_of([&] { load_registry_file(mixed, &emb); }).empty(),
              "mixed dimensions rejected");

    std::string bad = write_temp("rulemap_selftest_bad.json", R"({"keys": [1, 2]})");
    ctx.check(!error_of([&] { load_registry_file(bad, &emb); }).empty(), "non-string keys");

    CanonicalKey described = key("x.y_z", {1.0f});
    ctx.check_eq(embedding_text(described), "x y z", "embedding text from identifier");
}

// ============================================================================
// Embedder Tests
// ============================================================================

static void test_cosine_similarity(TestContext& ctx) {
    ctx.check_near(cosine_similarity({1, 0}, {0, 1}), 0.0, 1e-12, "orthogonal");
    ctx.check_near(cosine_similarity({2, 0}, {1, 0}), 1.0, 1e-12, "parallel");
    ctx.check_near(cosine_similarity({1, 0}, {-1, 0}), -1.0, 1e-12, "opposite");
    ctx.check_near(cosine_similarity({0, 0}, {1, 0}), 0.0, 0.0, "zero magnitude");
    ctx.check_near(cosine_similarity({1, 0}, {1, 0, 0}), 0.0, 0.0, "length mismatch");
    ctx.check_near(cosine_similarity({0.85f, 0.526783f}, {1, 0}), 0.85, 1e-4, "scenario vector");
}

static void test_hashing_embedder(TestContext& ctx) {
    HashingEmbedder emb(64);
    Embedding a = emb.embed("Bureau Score");
    Embedding b = emb.embed("bureau score");
    ctx.check(a.size() == 64, "dimension");
    ctx.check(a == b, "case-insensitive and deterministic");

    double norm = 0.0;
    for (float x : a) norm += static_cast<double>(x) * x;
    ctx.check_near(norm, 1.0, 1e-5, "unit length");

    ctx.check_near(cosine_similarity(emb.embed("bureau.score"), a), 1.0, 1e-6,
                   "punctuation splits words");
    ctx.check(cosine_similarity(emb.embed("bureau scores"), a) >
              cosine_similarity(emb.embed("annual revenue"), a),
              "trigrams make near spellings closer");

    Embedding empty = emb.embed("!!!");
    ctx.check(std::all_of(empty.begin(), empty.end(), [](float x) { return x == 0.0f; }),
              "no words embeds to zero");
    ctx.check(!error_of([] { HashingEmbedder bad(0); }).empty(), "zero dimension rejected");
}

static void test_precomputed_embedder(TestContext& ctx) {
    PrecomputedEmbedder emb(2);
    emb.add("bureau score", {0.85f, 0.526783f});
    ctx.check(emb.embed("bureau score").size() == 2, "exact lookup");
    ctx.check(emb.embed("  Bureau Score ").size() == 2, "lower-cased trimmed lookup");
    ctx.check(emb.embed("revenue").empty(), "unknown text has no vector");
    ctx.check(!error_of([&] { emb.add("x", {1.0f}); }).empty(), "wrong length rejected");

    std::string path = write_temp("rulemap_selftest_vectors.json",
        R"({"vectors": {"bureau score": [0.85, 0.526783], "years in business": [0, 1]}})");
    PrecomputedEmbedder loaded = PrecomputedEmbedder::load_file(path);
    ctx.check(loaded.dimension() == 2 && loaded.size() == 2, "loaded table");

    std::string bad = write_temp("rulemap_selftest_vectors_bad.json",
        R"({"dimension": 3, "vectors": {"a": [1, 0]}})");
    ctx.check(!error_of([&] { PrecomputedEmbedder::load_file(bad); }).empty(),
              "declared dimension enforced");
}

// ============================================================================
// Extractor Tests
// ============================================================================

static void test_extract_literal(TestContext& ctx) {
    Registry reg = credit_registry();
    PhraseExtractor ex(reg);

    auto cs = ex.extract("bureau.score above 700");
    ctx.check(!cs.empty() && cs[0].is_literal, "literal first");
    ctx.check(!cs.empty() && cs[0].text == "bureau.score" && cs[0].start == 0 &&
              cs[0].end == 12, "literal span");
    ctx.check(!has_candidate(cs, "bureau") && !has_candidate(cs, "score"),
              "no windows inside a literal");
}

static void test_extract_literal_boundaries(TestContext& ctx) {
    Registry reg = credit_registry();
    PhraseExtractor ex(reg);

    auto literal_count = [&](const std::string& prompt) {
        auto cs = ex.extract(prompt);
        return std::count_if(cs.begin(), cs.end(),
                             [](const PhraseCandidate& c) { return c.is_literal; });
    };

    ctx.check(literal_count("bureau.scores high") == 0, "longer identifier after");
    ctx.check(literal_count("xbureau.score") == 0, "longer identifier before");
    ctx.check(literal_count("bureau.score.max") == 0, "deeper path");
    ctx.check(literal_count("a.bureau.score") == 0, "path prefix");
    ctx.check(literal_count("Bureau.Score") == 0, "case-sensitive");
    ctx.check(literal_count("check bureau.score.") == 1, "sentence-ending period");
    ctx.check(literal_count("(bureau.score) and bureau.score") == 2, "every occurrence");
}

static void test_extract_windows(TestContext& ctx) {
    Registry reg = credit_registry();
    PhraseExtractor ex(reg);

    auto cs = ex.extract("bureau score above 700");
    ctx.check(cs.size() == 3, "three windows");
    if (cs.size() == 3) {
        ctx.check_eq(cs[0].text, "bureau", "first window");
        ctx.check_eq(cs[1].text, "bureau score", "two-word window");
        ctx.check_eq(cs[2].text, "score", "second word");
        ctx.check(cs[1].start == 0 && cs[1].end == 12, "window span");
    }

    cs = ex.extract("credit score, business age");
    ctx.check(!has_candidate(cs, "score business"), "punctuation breaks windows");
    ctx.check(has_candidate(cs, "business age"), "window after punctuation");

    cs = ex.extract("years  in\tbusiness");
    ctx.check(has_candidate(cs, "years in business"), "inner stop word kept, spacing normalised");
    ctx.check(!has_candidate(cs, "in"), "stop word alone dropped");

    ExtractorConfig narrow;
    narrow.max_window = 1;
    cs = PhraseExtractor(reg, narrow).extract("bureau score");
    ctx.check(cs.size() == 2, "window size bound");
}

static void test_extract_empty(TestContext& ctx) {
    Registry reg = credit_registry();
    PhraseExtractor ex(reg);
    ctx.check(ex.extract("").empty(), "empty prompt");
    ctx.check(ex.extract("!!! 123 ,,, ???").empty(), "punctuation and numbers only");
    ctx.check(ex.extract("the and of").empty(), "stop words only");
    ctx.check(ex.extract("\"unterminated quote").size() == 3, "unterminated quote ignored");
}

static void test_extract_quoted_and_cap(TestContext& ctx) {
    Registry reg = credit_registry();
    PhraseExtractor ex(reg);

    auto cs = ex.extract("region is \"north east\"");
    bool quoted = std::any_of(cs.begin(), cs.end(), [](const PhraseCandidate& c) {
        return c.text == "north east" && c.start == 11 && c.end == 21;
    });
    ctx.check(quoted, "quoted span");

    ExtractorConfig capped;
    capped.max_candidates = 2;
    cs = PhraseExtractor(reg, capped).extract("alpha beta gamma delta bureau.score");
    ctx.check(cs.size() == 2, "candidate cap");
    ctx.check(cs.size() == 2 && cs[0].text == "alpha" && cs[1].is_literal,
              "literals survive the cap");
}

static void test_extract_numbers(TestContext& ctx) {
    auto ns = extract_numbers("score above 700 and 3 to 5 years");
    ctx.check(ns.size() == 2, "single value and one range");
    if (ns.size() == 2) {
        ctx.check(ns[0].value == 700 && !ns[0].upper, "single value");
        ctx.check(ns[1].value == 3 && ns[1].upper && *ns[1].upper == 5, "A to B range");
    }

    ns = extract_numbers("between 1.5 and 2 years");
    ctx.check(ns.size() == 1 && ns[0].upper && ns[0].value == 1.5 && *ns[0].upper == 2,
              "between range");

    ns = extract_numbers("3-5 years, -4 degrees");
    ctx.check(ns.size() == 2 && ns[0].upper && ns[1].value == -4, "hyphen range and sign");

    ctx.check(extract_numbers("v2 and 2fa").empty(), "digits inside words ignored");
}

// ============================================================================
// Mapper Tests
// ============================================================================

static void test_mapper_scenario(TestContext& ctx) {
    Registry reg = credit_registry();
    MapperConfig cfg;   // threshold 0.20

    auto out = map_phrases({phrase("bureau score", {0.85f, 0.526783f})}, reg, cfg);
    ctx.check(out.mappings.size() == 1, "one mapping");
    if (out.mappings.size() == 1) {
        ctx.check_eq(out.mappings[0].user_phrase, "bureau score", "user phrase");
        ctx.check_eq(out.mappings[0].mapped_to, "bureau.score", "mapped key");
        ctx.check_near(out.mappings[0].similarity, 0.85, 1e-4, "similarity");
    }
    ctx.check_near(aggregate(out.mappings), 0.85, 1e-4, "confidence of a single mapping");
}

static void test_mapper_literal_bypass(TestContext& ctx) {
    Registry reg = credit_registry();
    MapperConfig cfg;
    cfg.threshold = 1.0;

    auto out = map_phrases({phrase("business.vintage_in_years", {})}, reg, cfg);
    ctx.check(out.mappings.size() == 1 && out.mappings[0].similarity == 1.0,
              "identifier text maps to itself at any threshold");

    cfg.threshold = 0.5;
    cfg.literal_similarity = 0.95;
    out = map_phrases({phrase("bureau.score", {0.0f, 1.0f})}, reg, cfg);
    ctx.check(out.mappings.size() == 1 && out.mappings[0].mapped_to == "bureau.score" &&
              out.mappings[0].similarity == 0.95, "configured literal value, vector ignored");
}

static void test_mapper_threshold_monotone(TestContext& ctx) {
    Registry reg = credit_registry();
    std::vector<EmbeddedPhrase> ps = {
        phrase("p1", {1.0f, 0.1f}), phrase("p2", {0.5f, 0.5f}), phrase("p3", {0.2f, 1.0f}),
        phrase("p4", {-1.0f, 0.3f}), phrase("p5", {0.9f, -0.4f})};

    std::size_t previous = ps.size() + 1;
    for (double t : {-1.0, -0.5, 0.0, 0.2, 0.5, 0.8, 0.95, 1.0}) {
        MapperConfig cfg;
        cfg.threshold = t;
        auto out = map_phrases(ps, reg, cfg);
        for (const auto& m : out.mappings) {
            ctx.check(m.similarity >= t, "similarity >= threshold " + format_number(t));
        }
        ctx.check(out.mappings.size() <= previous, "monotone at " + format_number(t));
        ctx.check(out.mappings.size() + out.unmatched.size() == ps.size(),
                  "every phrase accounted for");
        previous = out.mappings.size();
    }
}

static void test_mapper_tie_break(TestContext& ctx) {
    Registry reg = Registry::load({key("b.key", {1.0f, 0.0f}), key("a.key", {1.0f, 0.0f}),
                                   key("c.key", {0.0f, 1.0f})});
    auto out = map_phrases({phrase("thing", {1.0f, 0.0f})}, reg, MapperConfig{});
    ctx.check(out.mappings.size() == 1 && out.mappings[0].mapped_to == "a.key",
              "tie goes to the smaller identifier");

    auto ranked = rank({1.0f, 0.0f}, reg, 5);
    ctx.check(ranked.size() == 3, "rank bounded by registry size");
    ctx.check(ranked.size() == 3 && ranked[0].identifier == "a.key" &&
              ranked[1].identifier == "b.key" && ranked[2].identifier == "c.key",
              "ranked order");
}

static void test_mapper_unmatched(TestContext& ctx) {
    Registry reg = credit_registry();
    MapperConfig cfg;
    cfg.threshold = 0.9;

    auto out = map_phrases({phrase("vague", {0.6f, 0.8f})}, reg, cfg);
    ctx.check(out.mappings.empty(), "below threshold dropped");
    ctx.check(out.unmatched.size() == 1, "reported as unmatched");
    if (out.unmatched.size() == 1) {
        const auto& u = out.unmatched[0];
        ctx.check_near(u.best_similarity, 0.8, 1e-6, "best similarity");
        ctx.check(u.suggestions.size() == 2 &&
                  u.suggestions[0].identifier == "business.vintage_in_years",
                  "suggestions best first");
    }

    cfg.top_k = 1;
    out = map_phrases({phrase("vague", {0.6f, 0.8f})}, reg, cfg);
    ctx.check(out.unmatched.size() == 1 && out.unmatched[0].suggestions.size() == 1,
              "top_k bounds suggestions");
}

static void test_mapper_edge_cases(TestContext& ctx) {
    Registry reg = credit_registry();
    ctx.check(map_phrases({}, reg, MapperConfig{}).mappings.empty(), "no candidates");

    auto out = map_phrases({phrase("bureau score", {1.0f, 0.0f}),
                            phrase("bureau score", {0.0f, 1.0f}),
                            phrase("no vector", {})},
                           reg, MapperConfig{});
    ctx.check(out.mappings.size() == 1 && out.mappings[0].mapped_to == "bureau.score",
              "first occurrence wins");
    ctx.check(out.unmatched.empty(), "phrase without vector skipped");

    ctx.check(!error_of([&] {
        map_phrases({phrase("bad", {1.0f, 0.0f, 0.0f})}, reg, MapperConfig{});
    }).empty(), "dimension mismatch is a config error");

    Registry empty = Registry::load({});
    ctx.check(map_phrases({phrase("x", {1.0f})}, empty, MapperConfig{}).mappings.empty(),
              "empty registry maps nothing");
}

static void test_mapper_parallel_equivalence(TestContext& ctx) {
    HashingEmbedder emb(32);
    std::vector<CanonicalKey> keys;
    for (int i = 0; i < 20; ++i) {
        std::string id = "key" + std::to_string(i) + ".field";
        keys.push_back(key(id, emb.embed("topic " + std::to_string(i) + " field")));
    }
    Registry reg = Registry::load(std::move(keys));

    std::vector<EmbeddedPhrase> ps;
    for (int i = 0; i < 200; ++i) {
        std::string text = "phrase " + std::to_string(i % 37) + " topic " + std::to_string(i);
        ps.push_back(phrase(text, emb.embed(text)));
    }

    MapperConfig serial;
    serial.num_threads = 1;
    MapperConfig parallel;
    parallel.num_threads = 4;

    auto a = map_phrases(ps, reg, serial);
    auto b = map_phrases(ps, reg, parallel);

    bool same = a.mappings.size() == b.mappings.size() && a.unmatched.size() == b.unmatched.size();
    for (std::size_t i = 0; same && i < a.mappings.size(); ++i) {
        same = a.mappings[i].user_phrase == b.mappings[i].user_phrase &&
               a.mappings[i].mapped_to == b.mappings[i].mapped_to &&
               a.mappings[i].similarity == b.mappings[i].similarity;
    }
    ctx.check(same, "1 thread and 4 threads give identical mappings");
}

static void test_mapper_thread_setting_local(TestContext& ctx) {
    Registry reg = credit_registry();
    std::vector<EmbeddedPhrase> ps = {phrase("p1", {1.0f, 0.1f}), phrase("p2", {0.2f, 1.0f}),
                                      phrase("p3", {0.7f, 0.7f})};
    const int before = omp_get_max_threads();

    for (int threads : {1, 3, 0}) {
        MapperConfig cfg;
        cfg.num_threads = threads;
        auto out = map_phrases(ps, reg, cfg);
        ctx.check(out.mappings.size() == 3, "all phrases mapped with " +
                  std::to_string(threads) + " threads");
        ctx.check(omp_get_max_threads() == before,
                  "OpenMP default unchanged after " + std::to_string(threads) + " threads");
    }
}

static void test_aggregate(TestContext& ctx) {
    ctx.check(aggregate({}) == 0.0, "empty is 0.0");
    ctx.check_near(aggregate({KeyMapping{"a", "k", 0.8}}), 0.8, 1e-12, "single");
    ctx.check_near(aggregate({KeyMapping{"a", "k", 0.6}, KeyMapping{"b", "j", 1.0}}), 0.8, 1e-12,
                   "mean of two");
}

// ============================================================================
// Validator Tests
// ============================================================================

static void test_validator_scenario_valid(TestContext& ctx) {
    Registry reg = credit_registry();
    ValidationResult r = validate(parse_rule(kScenarioRule), reg, default_operators());
    ctx.check(r.valid, "scenario rule is valid");
    ctx.check(r.errors.empty(), "no errors");
    ctx.check(r.used_keys == std::set<std::string>{"bureau.score", "business.vintage_in_years"},
              "used keys are exactly the referenced keys");
}

static void test_validator_unknown_key(TestContext& ctx) {
    Registry reg = credit_registry();
    ValidationResult r = validate(
        parse_rule(R"({"and":[{">":[{"var":"unknown.field"},1]},{">":[{"var":"bureau.score"},700]}]})"),
        reg, default_operators());
    ctx.check(!r.valid, "invalid");
    ctx.check(r.has_error(ErrorKind::UnknownKey), "UnknownKeyError");
    ctx.check(!r.errors.empty() && r.errors[0].subject == "unknown.field" &&
              r.errors[0].message.find("unknown.field") != std::string::npos,
              "error references the key");
    ctx.check(r.used_keys.count("unknown.field") == 0, "unknown key not used");
    ctx.check(r.used_keys.count("bureau.score") == 1, "known sibling still recorded");

    r = validate(ExprNode::var("unknown.field"), reg, default_operators());
    ctx.check(!r.valid && r.errors.size() == 1 && r.errors[0].path == "$", "bare var at root");
}

static void test_validator_operators(TestContext& ctx) {
    Registry reg = credit_registry();
    ValidationResult r = validate(
        parse_rule(R"({"xor":[{"var":"bureau.score"},{"var":"nope"}]})"), reg, default_operators());
    ctx.check(r.has_error(ErrorKind::UnknownOperator), "unrecognised operator");
    ctx.check(r.has_error(ErrorKind::UnknownKey), "operands still checked");

    r = validate(parse_rule(R"({"if":[true,true]})"), reg, default_operators());
    ctx.check(r.has_error(ErrorKind::UnknownOperator), "known operator outside allowed set");

    OperatorSet no_in = default_operators();
    no_in.erase(OperatorKind::In);
    r = validate(parse_rule(R"({"in":[{"var":"bureau.score"},[1,2]]})"), reg, no_in);
    ctx.check(r.has_error(ErrorKind::UnknownOperator), "operator removed from allowed set");
}

static void test_validator_arity(TestContext& ctx) {
    Registry reg = credit_registry();
    auto arity = [&](const std::string& rule) {
        return validate(parse_rule(rule), reg, default_operators()).has_error(ErrorKind::Arity);
    };
    ctx.check(arity(R"({">":[{"var":"bureau.score"}]})"), "comparison with 1 operand");
    ctx.check(arity(R"({"==":[1,1,1]})"), "comparison with 3 operands");
    ctx.check(arity(R"({"and":[{">":[{"var":"bureau.score"},1]}]})"), "and with 1 operand");
    ctx.check(arity(R"({"or":[]})"), "or with no operands");
    ctx.check(arity(R"({"!":[true,false]})"), "not with 2 operands");
    ctx.check(arity(R"({"in":[{"var":"bureau.score"}]})"), "in with 1 operand");
    ctx.check(!arity(R"({"!":{"var":"bureau.score"}})"), "not with 1 operand");
}

static void test_validator_types(TestContext& ctx) {
    Registry reg = credit_registry();
    auto mismatch = [&](const std::string& rule) {
        return validate(parse_rule(rule), reg, default_operators())
            .has_error(ErrorKind::TypeMismatch);
    };
    ctx.check(mismatch(R"({">":[{"var":"bureau.score"},"high"]})"), "ordering on string");
    ctx.check(mismatch(R"({"<=":[true,1]})"), "ordering on boolean");
    ctx.check(mismatch(R"({"==":[1,"1"]})"), "equality across types");
    ctx.check(!mismatch(R"({"==":[{"var":"bureau.score"},"a"]})"), "variable equals string");
    ctx.check(!mismatch(R"({"!=":["a","b"]})"), "equality of strings");
    ctx.check(!mismatch(R"({"in":[{"var":"bureau.score"},[1,2,3]]})"), "in with list literal");
    ctx.check(mismatch(R"({"in":[{"var":"bureau.score"},{"var":"bureau.score"}]})"),
              "in with variable haystack");
    ctx.check(mismatch(R"({"in":[[1],[1,2]]})"), "in with list needle");
    ctx.check(mismatch(R"({">":[{">":[{"var":"bureau.score"},1]},0]})"),
              "ordering on a comparison result");
}

static ExprNode nested_not(std::size_t depth) {
    ExprNode node = ExprNode::var("bureau.score");
    for (std::size_t i = 1; i < depth; ++i) {
        node = make_not(std::move(node));
    }
    return node;
}

static void test_validator_depth(TestContext& ctx) {
    Registry reg = credit_registry();
    Validator v(reg);   // max_depth 10

    ExprNode at_limit = nested_not(10);
    ctx.check(rule_depth(at_limit) == 10, "tree built at the limit");
    ctx.check(v.validate(at_limit).valid, "depth == max validates");

    ValidationResult r = v.validate(nested_not(11));
    ctx.check(!r.valid && r.has_error(ErrorKind::DepthExceeded), "depth == max + 1 fails");
    ctx.check(r.errors.size() == 1, "one depth error, no size error");

    ValidatorConfig shallow;
    shallow.max_depth = 2;
    r = Validator(reg, shallow).validate(parse_rule(kScenarioRule));
    ctx.check(r.has_error(ErrorKind::DepthExceeded) && r.used_keys.empty(),
              "nodes past the limit are not descended");

    // Far deeper than the validator limit, still within the parser guard.
    r = v.validate(nested_not(200));
    ctx.check(r.has_error(ErrorKind::DepthExceeded), "deep adversarial tree");
}

static void test_validator_size(TestContext& ctx) {
    Registry reg = credit_registry();
    ValidatorConfig cfg;
    cfg.max_size = 20;
    ValidationResult r = Validator(reg, cfg).validate(parse_rule(kScenarioRule));
    ctx.check(r.has_error(ErrorKind::SizeExceeded), "serialized size bound");
    ctx.check(!r.valid, "oversized rule invalid");
}

static void test_validator_collects_all(TestContext& ctx) {
    Registry reg = credit_registry();
    ValidationResult r = validate(parse_rule(R"({"and":[
        {">":[{"var":"unknown.field"},700]},
        {"xor":[{"var":"bureau.score"}]},
        {">":[{"var":"business.vintage_in_years"},"three"]}]})"),
        reg, default_operators());

    ctx.check(r.errors.size() == 3, "three defects in one pass");
    ctx.check(r.has_error(ErrorKind::UnknownKey), "unknown key");
    ctx.check(r.has_error(ErrorKind::UnknownOperator), "unknown operator");
    ctx.check(r.has_error(ErrorKind::TypeMismatch), "type mismatch");

    bool path_ok = std::any_of(r.errors.begin(), r.errors.end(), [](const ValidationError& e) {
        return e.kind == ErrorKind::UnknownOperator && e.path == "$/and[1]";
    });
    ctx.check(path_ok, "operator error path");
    bool key_path_ok = std::any_of(r.errors.begin(), r.errors.end(), [](const ValidationError& e) {
        return e.kind == ErrorKind::UnknownKey && e.path == "$/and[0]/>[0]";
    });
    ctx.check(key_path_ok, "key error path");
    ctx.check(r.used_keys.size() == 2, "known keys recorded despite errors");
}

static void test_validator_require_mapped(TestContext& ctx) {
    Registry reg = credit_registry();
    ValidatorConfig cfg;
    cfg.require_mapped_keys = true;
    Validator v(reg, cfg);

    std::vector<KeyMapping> mappings = {KeyMapping{"bureau score", "bureau.score", 0.85}};
    ValidationResult r = v.validate(parse_rule(kScenarioRule), &mappings);
    ctx.check(r.has_error(ErrorKind::UnmappedKey), "key without a mapping");
    ctx.check(r.used_keys == std::set<std::string>{"bureau.score"}, "unmapped key not used");

    ctx.check(v.validate(parse_rule(kScenarioRule)).valid, "no mapping set, no check");
    ctx.check(Validator(reg).validate(parse_rule(kScenarioRule), &mappings).valid,
              "off by default");
}

static void test_validator_extended_operators(TestContext& ctx) {
    Registry reg = credit_registry();
    OperatorSet ops = default_operators();
    for (OperatorKind op : {OperatorKind::If, OperatorKind::Plus, OperatorKind::Minus,
                            OperatorKind::Times, OperatorKind::Divide}) {
        ops.insert(op);
    }
    auto check = [&](const std::string& rule) { return validate(parse_rule(rule), reg, ops); };

    ctx.check(check(R"({"if":[{">":[{"var":"bureau.score"},700]},true,false]})").valid,
              "if with else");
    ctx.check(check(R"({">":[{"+":[{"var":"bureau.score"},1]},700]})").valid,
              "arithmetic inside comparison");
    ctx.check(check(R"({">":[{"-":[{"var":"bureau.score"}]},0]})").valid, "unary minus");
    ctx.check(check(R"({">":[{"/":[1]},2]})").has_error(ErrorKind::Arity), "divide arity");
    ctx.check(check(R"({">":[{"-":[1,2,3]},0]})").has_error(ErrorKind::Arity), "minus arity");
    ctx.check(check(R"({">":[{"*":["a",2]},0]})").has_error(ErrorKind::TypeMismatch),
              "arithmetic on string");
    ctx.check(check(R"({"==":[{"+":[1,2]},"3"]})").has_error(ErrorKind::TypeMismatch),
              "number result compared with string");
}

// ============================================================================
// Normalisation Tests
// ============================================================================

static void test_nnf(TestContext& ctx) {
    ctx.check_eq(pp_norm(R"({"!":{"!":{"var":"x"}}})"), "x", "double negation");
    ctx.check_eq(pp_norm(R"({"!":{"and":[{">":[{"var":"a"},1]},{"<":[{"var":"b"},2]}]}})"),
                 "((a <= 1) or (b >= 2))", "De Morgan over comparisons");
    ctx.check_eq(pp_norm(R"({"!":{"or":[{"var":"a"},{"and":[{"var":"b"},{"var":"c"}]}]}})"),
                 "(!a and (!b or !c))", "nested De Morgan");
    ctx.check_eq(pp_norm(R"({"!":{"==":[{"var":"a"},"x"]}})"), "(a != \"x\")", "== flips");
    ctx.check_eq(pp_norm(R"({"!":true})"), "false", "negated literal");
    ctx.check_eq(pp_norm(R"({"!":{"in":[{"var":"r"},["x"]]}})"), "!(r in [\"x\"])",
                 "negation stays on in");
}

static void test_flatten(TestContext& ctx) {
    ctx.check_eq(pp_norm(R"({"and":[{"var":"a"},{"and":[{"var":"b"},{"var":"c"}]}]})"),
                 "(a and b and c)", "nested and");
    ctx.check_eq(pp_norm(R"({"or":[{"var":"a"},{"and":[{"var":"b"},{"var":"c"}]}]})"),
                 "(a or (b and c))", "mixed operators kept");
    ctx.check_eq(pp_norm(R"({"!":{"or":[{"!":{"and":[{"var":"a"},{"var":"b"}]}},{"var":"c"}]}})"),
                 "(a and b and !c)", "NNF then flatten");

    Registry reg = credit_registry();
    ExprNode rule = parse_rule(kScenarioRule);
    ctx.check(normalize(rule) == rule, "already normal");
    ctx.check(validate(normalize(parse_rule(
                  R"({"!":{"or":[{"<":[{"var":"bureau.score"},700]},{"var":"bureau.score"}]}})")),
                       reg, default_operators()).valid, "normalised rule still validates");
}

// ============================================================================
// Satisfiability Tests (Z3)
// ============================================================================

static void test_solver_sat(TestContext& ctx) {
    RuleSolver solver;
    ctx.check(solver.add_rule(parse_rule(kScenarioRule)), "encodes scenario rule");
    ctx.check(solver.check() == SolverResult::Satisfiable, "scenario satisfiable");
    std::string model = solver.get_model();
    ctx.check(model.find("bureau.score = ") != std::string::npos, "witness names the key");
}

static void test_solver_unsat(TestContext& ctx) {
    ctx.check(solve(R"({"and":[{">":[{"var":"s"},700]},{"<":[{"var":"s"},600]}]})") ==
              SolverResult::Unsatisfiable, "contradictory bounds");
    ctx.check(solve(R"({"and":[{"var":"flag"},{"!":{"var":"flag"}}]})") ==
              SolverResult::Unsatisfiable, "boolean contradiction");
    ctx.check(solve(R"({"and":[{">":[{"+":[{"var":"x"},{"var":"y"}]},10]},
                               {"<":[{"var":"x"},2]},{"<":[{"var":"y"},2]}]})") ==
              SolverResult::Unsatisfiable, "arithmetic contradiction");
    ctx.check(solve(R"({"and":[{"if":[{">":[{"var":"x"},0]},{"==":[{"var":"y"},1]},
                                      {"==":[{"var":"y"},2]}]},{"==":[{"var":"y"},3]}]})") ==
              SolverResult::Unsatisfiable, "conditional contradiction");
}

static void test_solver_strings(TestContext& ctx) {
    ctx.check(solve(R"({"and":[{"in":[{"var":"region"},["north","south"]]},
                               {"==":[{"var":"region"},"east"]}]})") ==
              SolverResult::Unsatisfiable, "value outside the list");
    ctx.check(solve(R"({"and":[{"in":[{"var":"region"},["north","south"]]},
                               {"!=":[{"var":"region"},"north"]}]})") ==
              SolverResult::Satisfiable, "other list value");
    ctx.check(solve(R"({">":[{"var":"a"},{"var":"b"}]})") == SolverResult::Satisfiable,
              "key-to-key comparison");
}

static void test_solver_unencodable(TestContext& ctx) {
    RuleSolver solver;
    ctx.check(!solver.add_rule(parse_rule(
                  R"({"and":[{">":[{"var":"s"},1]},{"==":[{"var":"s"},"x"]}]})")),
              "conflicting sorts rejected");
    ctx.check(!solver.add_rule(parse_rule(R"({"foo":[1]})")), "unknown operator rejected");
    ctx.check(!solver.add_rule(parse_rule("700")), "number is not a condition");
    ctx.check(solver.check() == SolverResult::Satisfiable, "rejected rules left no trace");

    ctx.check(solver.add_rule(parse_rule(R"({">":[{"var":"s"},1]})")), "later rule accepted");
    ctx.check(!solver.add_rule(parse_rule(R"({"==":[{"var":"s"},"x"]})")),
              "sort conflict with an earlier rule");
    ctx.check(solver.add_rule(parse_rule(R"({"<":[{"var":"s"},0]})")), "compatible rule");
    ctx.check(solver.check() == SolverResult::Unsatisfiable, "rules combine");

    solver.reset();
    ctx.check(solver.check() == SolverResult::Satisfiable, "reset clears assertions");
}

// ============================================================================
// Configuration Tests
// ============================================================================

static void test_config_settings(TestContext& ctx) {
    Config cfg;
    apply_setting(cfg, "threshold", "0.35");
    apply_setting(cfg, "top-k", "5");
    apply_setting(cfg, "operators", "and, or, >, not");
    apply_setting(cfg, "require_mapped_keys", "yes");
    apply_setting(cfg, "check_satisfiability", "off");

    ctx.check_near(cfg.mapper.threshold, 0.35, 1e-12, "threshold");
    ctx.check(cfg.mapper.top_k == 5, "dash spelling");
    ctx.check(cfg.validator.allowed_operators.size() == 4, "operator list");
    ctx.check(cfg.validator.allowed_operators.count(OperatorKind::Not) == 1, "'not' in list");
    ctx.check(cfg.validator.require_mapped_keys, "boolean yes");
    ctx.check(!cfg.check_satisfiability, "boolean off");

    ctx.check(!error_of([&] { apply_setting(cfg, "colour", "red"); }).empty(), "unknown key");
    ctx.check(!error_of([&] { apply_setting(cfg, "threshold", "high"); }).empty(), "bad number");
    ctx.check(!error_of([&] { apply_setting(cfg, "top_k", "2.5"); }).empty(), "fractional count");
    ctx.check(error_of([&] { apply_setting(cfg, "max_depth", "1e30"); }).find("max_depth") !=
              std::string::npos, "oversized count names the key");
    ctx.check(error_of([&] { apply_setting(cfg, "threads", "3000000000"); }).find("threads") !=
              std::string::npos, "thread count bounded by int");
    ctx.check(!error_of([&] { apply_setting(cfg, "max_size", "inf"); }).empty(), "infinite count");
    ctx.check(!error_of([&] { apply_setting(cfg, "top_k", "nan"); }).empty(), "NaN count");
    apply_setting(cfg, "threads", "8");
    ctx.check(cfg.mapper.num_threads == 8, "thread count in range");
    ctx.check(!error_of([&] { apply_setting(cfg, "operators", "and, xor"); }).empty(),
              "unknown operator name");
    ctx.check(!describe(cfg).empty(), "describe");
}

static void test_config_validation(TestContext& ctx) {
    ctx.check(error_of([] { validate_config(Config{}); }).empty(), "defaults are valid");

    auto invalid = [](auto mutate) {
        Config cfg;
        mutate(cfg);
        try {
            validate_config(cfg);
        } catch (const ConfigError&) {
            return true;
        }
        return false;
    };
    ctx.check(invalid([](Config& c) { c.mapper.threshold = 1.5; }), "threshold above 1");
    ctx.check(invalid([](Config& c) { c.mapper.threshold = -1.01; }), "threshold below -1");
    ctx.check(invalid([](Config& c) { c.mapper.threshold = std::nan(""); }), "NaN threshold");
    ctx.check(invalid([](Config& c) { c.mapper.top_k = 0; }), "top_k 0");
    ctx.check(invalid([](Config& c) {
        c.mapper.threshold = 0.5;
        c.mapper.literal_similarity = 0.4;
    }), "literal similarity below threshold");
    ctx.check(invalid([](Config& c) { c.validator.max_depth = 0; }), "max_depth 0");
    ctx.check(invalid([](Config& c) { c.extractor.max_window = 0; }), "window 0");
    ctx.check(invalid([](Config& c) { c.embedding_dimension = 0; }), "dimension 0");
    ctx.check(!invalid([](Config& c) { c.mapper.threshold = -1.0; }), "threshold -1 allowed");
}

static void test_config_file(TestContext& ctx) {
    std::string path = write_temp("rulemap_selftest.conf",
        "# similarity policy\n"
        "threshold = 0.35   # stricter\n"
        "top_k = 5\n"
        "\n"
        "operators = and, or, >, <\n");
    Config cfg = load_config(path);
    ctx.check_near(cfg.mapper.threshold, 0.35, 1e-12, "threshold from file");
    ctx.check(cfg.mapper.top_k == 5, "top_k from file");
    ctx.check(cfg.validator.allowed_operators.size() == 4, "operators from file");
    ctx.check(cfg.validator.max_depth == 10, "unset keys keep defaults");

    std::string bad = write_temp("rulemap_selftest_bad.conf",
        "threshold = 0.3\n"
        "# comment\n"
        "bogus = 1\n");
    ctx.check(error_of([&] { load_config(bad); }).find(":3: ") != std::string::npos,
              "error names the line");

    std::string no_eq = write_temp("rulemap_selftest_noeq.conf", "threshold 0.3\n");
    ctx.check(!error_of([&] { load_config(no_eq); }).empty(), "line without '='");
}

// ============================================================================
// Analyzer and Report Tests
// ============================================================================

static void test_analyzer_end_to_end(TestContext& ctx) {
    Registry reg = credit_registry();
    PrecomputedEmbedder emb(2);
    emb.add("bureau score", {0.85f, 0.526783f});

    RuleAnalyzer analyzer(reg, emb, Config{});
    Draft draft = parse_draft(std::string(R"({"json_logic": )") + kScenarioRule +
                              R"(, "explanation": ["Bureau score above 700",
                                                   "At least 3 years in business"]})");

    AnalysisReport report = analyzer.analyze(
        "bureau score above 700 and business.vintage_in_years at least 3", &draft);

    ctx.check(report.key_mappings.size() == 2, "two mappings");
    if (report.key_mappings.size() == 2) {
        ctx.check_eq(report.key_mappings[0].mapped_to, "bureau.score", "similarity mapping");
        ctx.check_near(report.key_mappings[0].similarity, 0.85, 1e-4, "similarity value");
        ctx.check_eq(report.key_mappings[1].mapped_to, "business.vintage_in_years",
                     "literal mapping");
        ctx.check(report.key_mappings[1].similarity == 1.0, "literal similarity");
    }
    ctx.check_near(report.confidence_score, 0.925, 1e-4, "confidence");
    ctx.check(report.numeric_values.size() == 2, "numbers found");

    ctx.check(report.validation && report.validation->valid, "draft valid");
    ctx.check(report.satisfiable && *report.satisfiable == SolverResult::Satisfiable,
              "draft satisfiable");
    ctx.check(!report.witness.empty(), "witness present");
    ctx.check(report.explanation.size() == 2, "explanation carried");

    std::string json = to_json(report);
    ctx.check(json.find("\"confidence_score\": 0.925") != std::string::npos, "rounded confidence");
    ctx.check(json.find("\"mapped_to\": \"bureau.score\"") != std::string::npos, "mapping in JSON");
    ctx.check(json.find("\"satisfiable\": true") != std::string::npos, "satisfiable in JSON");
    ctx.check(json.find("\"similarity\": 0.85") != std::string::npos, "rounded similarity");

    Json back = Json::parse(json);
    ctx.check_eq(back.begin().key(), "json_logic", "json_logic printed first");
    ctx.check_eq(dump_json(back["json_logic"]), kScenarioRule, "rule embedded as JSON");
    ctx.check(back["key_mappings"].size() == 2, "mappings array");
    ctx.check(back["numeric_values"] == Json::array({700, 3}), "numbers print as integers");
}

static void test_analyzer_hashing(TestContext& ctx) {
    HashingEmbedder emb(64);
    std::vector<CanonicalKey> keys;
    for (const char* id : {"bureau.score", "business.vintage_in_years", "business.revenue"}) {
        CanonicalKey k = key(id, {});
        k.embedding = emb.embed(embedding_text(k));
        keys.push_back(std::move(k));
    }
    Registry reg = Registry::load(std::move(keys));

    RuleAnalyzer analyzer(reg, emb, Config{});
    AnalysisReport report = analyzer.analyze("minimum bureau score of 650", nullptr);

    bool found = std::any_of(report.key_mappings.begin(), report.key_mappings.end(),
        [](const KeyMapping& m) {
            return m.user_phrase == "bureau score" && m.mapped_to == "bureau.score" &&
                   std::fabs(m.similarity - 1.0) < 1e-5;
        });
    ctx.check(found, "window maps to the matching key");
    ctx.check(!report.validation && !report.rule, "no draft, no validation");
    for (const auto& m : report.key_mappings) {
        ctx.check(m.similarity >= 0.2, "mapping above default threshold");
    }
}

static void test_analyzer_invalid_and_unsat(TestContext& ctx) {
    Registry reg = credit_registry();
    PrecomputedEmbedder emb(2);
    RuleAnalyzer analyzer(reg, emb, Config{});

    Draft bad = parse_draft(R"({">":[{"var":"unknown.field"},1]})");
    AnalysisReport report = analyzer.analyze("", &bad);
    ctx.check(report.validation && !report.validation->valid, "invalid draft");
    ctx.check(!report.satisfiable, "solver skipped for invalid drafts");
    ctx.check(report.key_mappings.empty() && report.confidence_score == 0.0,
              "empty prompt gives zero confidence");

    Draft unsat = parse_draft(
        R"({"and":[{">":[{"var":"bureau.score"},700]},{"<":[{"var":"bureau.score"},600]}]})");
    report = analyzer.analyze("", &unsat);
    ctx.check(report.validation && report.validation->valid, "contradiction is well-formed");
    ctx.check(report.satisfiable && *report.satisfiable == SolverResult::Unsatisfiable,
              "contradiction flagged");
    ctx.check(to_json(report).find("\"satisfiable\": false") != std::string::npos,
              "unsat in JSON");

    Config no_sat;
    no_sat.check_satisfiability = false;
    RuleAnalyzer quiet(reg, emb, no_sat);
    ctx.check(!quiet.analyze("", &unsat).satisfiable, "satisfiability check disabled");

    RuleAnalyzer normalizing(reg, emb, Config{});
    normalizing.set_normalize(true);
    Draft neg = parse_draft(R"({"!":{"<":[{"var":"bureau.score"},600]}})");
    report = normalizing.analyze("", &neg);
    ctx.check(report.normalized && to_string(*report.normalized) == "(bureau.score >= 600)",
              "normalised rule attached");
}

static void test_analyzer_empty_registry(TestContext& ctx) {
    Registry empty = Registry::load({});
    HashingEmbedder emb(64);
    RuleAnalyzer analyzer(empty, emb, Config{});

    AnalysisReport report;
    ctx.check(error_of([&] { report = analyzer.analyze("bureau score above 700", nullptr); })
                  .empty(), "no exception without keys");
    ctx.check(report.key_mappings.empty(), "no mappings");
    ctx.check(report.unmatched.empty(), "nothing to suggest");
    ctx.check(report.confidence_score == 0.0, "zero confidence");
    ctx.check(report.numeric_values.size() == 1, "numbers still extracted");

    Draft draft = parse_draft(R"({">":[{"var":"bureau.score"},700]})");
    report = analyzer.analyze("bureau score above 700", &draft);
    ctx.check(report.validation && report.validation->has_error(ErrorKind::UnknownKey),
              "every key is unknown");
    ctx.check(Json::parse(to_json(report))["confidence_score"] == 0, "zero confidence in JSON");
}

static void test_analyzer_config_errors(TestContext& ctx) {
    Registry reg = credit_registry();
    HashingEmbedder wide(8);
    ctx.check(!error_of([&] { RuleAnalyzer a(reg, wide, Config{}); }).empty(),
              "embedder dimension mismatch");

    PrecomputedEmbedder emb(2);
    Config bad;
    bad.mapper.threshold = 2.0;
    ctx.check(!error_of([&] { RuleAnalyzer a(reg, emb, bad); }).empty(), "bad threshold");
}

static void test_report_json(TestContext& ctx) {
    Registry reg = credit_registry();
    ctx.check_eq(keys_to_json(reg),
                 R"({"keys":["bureau.score","business.vintage_in_years"],"count":2})",
                 "key listing");

    ValidationResult r = validate(ExprNode::var("unknown.field"), reg, default_operators());
    std::string json = to_json(r);
    ctx.check(json.find("\"valid\": false") != std::string::npos, "valid flag");
    ctx.check(json.find("\"type\": \"UnknownKeyError\"") != std::string::npos, "error type");
    ctx.check(json.find("\"subject\": \"unknown.field\"") != std::string::npos, "error subject");

    AnalysisReport empty;
    json = to_json(empty);
    ctx.check(json.find("\"json_logic\": null") != std::string::npos, "no rule");
    ctx.check(json.find("\"key_mappings\": []") != std::string::npos, "no mappings");
    ctx.check(json.find("\"satisfiable\": null") != std::string::npos, "no solver result");

    empty.satisfiable = SolverResult::Unknown;
    empty.unmatched.push_back(UnmatchedPhrase{"vague", 0.123456, {}});
    Json parsed = Json::parse(to_json(empty));
    ctx.check(parsed["satisfiable"] == "unknown", "unknown solver result");
    ctx.check(parsed["unmatched_phrases"][0]["best_similarity"] == 0.1235,
              "unmatched similarity rounded");
}

// ============================================================================
// run_selftests
// ============================================================================

int run_selftests() {
    TestRunner runner;

    // Utilities
    runner.run("utils_strings",                  test_utils_strings);

    runner.run("utils_json",                     test_utils_json);

    // Parser tests
    runner.run("parse_json_structure",           test_parse_json_structure);
    runner.run("parse_json_strings",             test_parse_json_strings);
    runner.run("parse_json_numbers",             test_parse_json_numbers);
    runner.run("parse_json_error_format",        test_parse_json_error_format);
    runner.run("parse_json_errors",              test_parse_json_errors);
    runner.run("parse_nesting_limit",            test_parse_nesting_limit);
    runner.run("parse_nesting_follows_depth",    test_parse_nesting_follows_depth);
    runner.run("decode_rule_round_trip",         test_decode_rule_round_trip);
    runner.run("decode_rule_forms",              test_decode_rule_forms);
    runner.run("decode_rule_errors",             test_decode_rule_errors);
    runner.run("decode_draft",                   test_decode_draft);

    // Expression utilities
    runner.run("ast_measurements",               test_ast_measurements);
    runner.run("ast_builders",                   test_ast_builders);
    runner.run("operator_names",                 test_operator_names);

    // Registry
    runner.run("registry_round_trip",            test_registry_round_trip);
    runner.run("registry_errors",                test_registry_errors);
    runner.run("registry_file",                  test_registry_file);

    // Embedders
    runner.run("cosine_similarity",              test_cosine_similarity);
    runner.run("hashing_embedder",               test_hashing_embedder);
    runner.run("precomputed_embedder",           test_precomputed_embedder);

    // Extractor
    runner.run("extract_literal",                test_extract_literal);
    runner.run("extract_literal_boundaries",     test_extract_literal_boundaries);
    runner.run("extract_windows",                test_extract_windows);
    runner.run("extract_empty",                  test_extract_empty);
    runner.run("extract_quoted_and_cap",         test_extract_quoted_and_cap);
    runner.run("extract_numbers",                test_extract_numbers);

    // Mapper and aggregator
    runner.run("mapper_scenario",                test_mapper_scenario);
    runner.run("mapper_literal_bypass",          test_mapper_literal_bypass);
    runner.run("mapper_threshold_monotone",      test_mapper_threshold_monotone);
    runner.run("mapper_tie_break",               test_mapper_tie_break);
    runner.run("mapper_unmatched",               test_mapper_unmatched);
    runner.run("mapper_edge_cases",              test_mapper_edge_cases);
    runner.run("mapper_parallel_equivalence",    test_mapper_parallel_equivalence);
    runner.run("mapper_thread_setting_local",    test_mapper_thread_setting_local);
    runner.run("aggregate",                      test_aggregate);

    // Validator
    runner.run("validator_scenario_valid",       test_validator_scenario_valid);
    runner.run("validator_unknown_key",          test_validator_unknown_key);
    runner.run("validator_operators",            test_validator_operators);
    runner.run("validator_arity",                test_validator_arity);
    runner.run("validator_types",                test_validator_types);
    runner.run("validator_depth",                test_validator_depth);
    runner.run("validator_size",                 test_validator_size);
    runner.run("validator_collects_all",         test_validator_collects_all);
    runner.run("validator_require_mapped",       test_validator_require_mapped);
    runner.run("validator_extended_operators",   test_validator_extended_operators);

    // Normalisation
    runner.run("nnf",                            test_nnf);
    runner.run("flatten",                        test_flatten);

    // Satisfiability (Z3)
    runner.run("solver_sat",                     test_solver_sat);
    runner.run("solver_unsat",                   test_solver_unsat);
    runner.run("solver_strings",                 test_solver_strings);
    runner.run("solver_unencodable",             test_solver_unencodable);

    // Configuration
    runner.run("config_settings",                test_config_settings);
    runner.run("config_validation",              test_config_validation);
    runner.run("config_file",                    test_config_file);

    // Analyzer and report
    runner.run("analyzer_end_to_end",            test_analyzer_end_to_end);
    runner.run("analyzer_hashing",               test_analyzer_hashing);
    runner.run("analyzer_invalid_and_unsat",     test_analyzer_invalid_and_unsat);
    runner.run("analyzer_empty_registry",        test_analyzer_empty_registry);
    runner.run("analyzer_config_errors",         test_analyzer_config_errors);
    runner.run("report_json",                    test_report_json);

    return runner.summarise();
}

}  // namespace rulemap
