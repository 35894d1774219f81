#include "commitlint/json.hpp"
#include "commitlint/reporter.hpp"
#include "commitlint/tokenizer.hpp"
#include "commitlint/type_registry.hpp"
#include "commitlint/validator.hpp"

#include <iostream>
#include <sstream>
#include <string>

using namespace commitlint;

static int passed = 0;
static int failed = 0;

#define ASSERT_TRUE(label, expr)                                            \
    do {                                                                    \
        if ((expr)) {                                                       \
            std::cout << "  [PASS] " << label << "\n";                     \
            ++passed;                                                       \
        } else {                                                            \
            std::cout << "  [FAIL] " << label << "\n";                     \
            ++failed;                                                       \
        }                                                                   \
    } while (0)

#define ASSERT_EQ(label, expected, actual)                                  \
    do {                                                                    \
        if ((expected) == (actual)) {                                       \
            std::cout << "  [PASS] " << label << "\n";                     \
            ++passed;                                                       \
        } else {                                                            \
            std::cout << "  [FAIL] " << label                              \
                      << "  (expected=" << (expected)                      \
                      << " got=" << (actual) << ")\n";                     \
            ++failed;                                                       \
        }                                                                   \
    } while (0)

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

static ValidationResult two_violations() {
    ValidationResult result;
    result.violations.push_back({ ViolationKind::MissingField, "feat", "scope", "" });
    result.violations.push_back({ ViolationKind::MissingField, "feat", "body", "" });
    return result;
}

// ── Suites ────────────────────────────────────────────────────────────────────

void test_format_violation() {
    std::cout << "\n[FormatViolation]\n";

    auto unknown = format_violation({ ViolationKind::UnknownType, "wip", "", "" });
    ASSERT_EQ("unknown type line",
              std::string("[unknown-type] commit type 'wip' is not allowed"), unknown);

    auto missing = format_violation({ ViolationKind::MissingField, "feat", "scope", "" });
    ASSERT_EQ("missing field line",
              std::string("[missing-field] commit type 'feat' requires a scope, but none was given"),
              missing);

    auto malformed = format_violation({ ViolationKind::MalformedHeader, "", "", "no colon" });
    ASSERT_TRUE("malformed names rule", contains(malformed, "[malformed-header]"));
    ASSERT_TRUE("malformed shows detail", contains(malformed, "no colon"));
    ASSERT_TRUE("each violation is one line", !contains(missing, "\n"));
}

void test_exit_policy() {
    std::cout << "\n[ExitPolicy]\n";
    Options options;
    std::ostringstream out, err;

    int status = report(ValidationResult{}, std::nullopt, options, out, err);
    ASSERT_EQ("valid -> 0", static_cast<int>(EXIT_VALID), status);
    ASSERT_TRUE("valid prints nothing", out.str().empty() && err.str().empty());

    status = report(two_violations(), std::nullopt, options, out, err);
    ASSERT_EQ("violations -> 1", static_cast<int>(EXIT_VIOLATIONS), status);
    ASSERT_TRUE("stdout untouched", out.str().empty());

    std::istringstream lines(err.str());
    std::string line;
    int count = 0;
    while (std::getline(lines, line)) ++count;
    ASSERT_EQ("one line per violation", 2, count);

    options.continue_on_error = true;
    std::ostringstream out2, err2;
    status = report(two_violations(), std::nullopt, options, out2, err2);
    ASSERT_EQ("continue-on-error -> 0", static_cast<int>(EXIT_VALID), status);
    ASSERT_TRUE("violations still printed", contains(err2.str(), "requires a scope"));
}

void test_summary() {
    std::cout << "\n[Summary]\n";
    auto tokens = tokenize("feat(cli): add flag\n\nDetails.");
    ASSERT_TRUE("tokenizes", tokens.ok());

    auto table = format_summary(tokens.message, ValidationResult{});
    ASSERT_TRUE("shows type",        contains(table, "Type         : feat"));
    ASSERT_TRUE("shows scope",       contains(table, "Scope        : cli"));
    ASSERT_TRUE("shows body",        contains(table, "Body         : Details."));
    ASSERT_TRUE("absent footer dash", contains(table, "Footer       : -"));
    ASSERT_TRUE("shows valid",       contains(table, "Valid        : true"));

    Options options;
    options.summary = true;
    std::ostringstream out, err;
    report(ValidationResult{}, tokens.message, options, out, err);
    ASSERT_TRUE("--summary prints on stdout", contains(out.str(), "Description  : add flag"));
}

void test_json() {
    std::cout << "\n[Json]\n";
    auto registry = default_type_registry();
    auto tokens = tokenize("wip: \"quoted\"\n\nRefs: #3");
    ASSERT_TRUE("tokenizes", tokens.ok());
    auto result = validate(*tokens.message, registry, false);

    auto json = to_json(result, tokens.message);
    ASSERT_TRUE("json valid flag",     contains(json, "\"valid\": false"));
    ASSERT_TRUE("json kind",           contains(json, "\"kind\": \"UnknownType\""));
    ASSERT_TRUE("json rule",           contains(json, "\"rule\": \"unknown-type\""));
    ASSERT_TRUE("json escapes quotes", contains(json, "\\\"quoted\\\""));
    ASSERT_TRUE("json null scope",     contains(json, "\"scope\": null"));
    ASSERT_TRUE("json trailer",        contains(json, "{ \"key\": \"Refs\", \"value\": \"#3\" }"));

    auto malformed = to_json(lint("no colon", registry, false), std::nullopt);
    ASSERT_TRUE("json null message", contains(malformed, "\"message\": null"));

    Options options;
    options.format = OutputFormat::Json;
    std::ostringstream out, err;
    int status = report(result, tokens.message, options, out, err);
    ASSERT_TRUE("json mode writes stdout", contains(out.str(), "\"violations\": ["));
    ASSERT_TRUE("json mode leaves stderr", err.str().empty());
    ASSERT_EQ("json mode keeps exit policy", static_cast<int>(EXIT_VIOLATIONS), status);

    ASSERT_EQ("control chars escaped", std::string("a\\u0001b"),
              json_detail::escape(std::string("a\x01" "b")));
}

void test_json_utf8() {
    std::cout << "\n[JsonUtf8]\n";
    using json_detail::escape;

    ASSERT_EQ("valid multibyte kept", std::string("caf\xc3\xa9 \xe2\x9c\x93 \xf0\x9f\x9a\x80"),
              escape(std::string("caf\xc3\xa9 \xe2\x9c\x93 \xf0\x9f\x9a\x80")));
    ASSERT_EQ("stray byte replaced", std::string("wip\\ufffd"), escape(std::string("wip\xff")));
    ASSERT_EQ("truncated sequence replaced", std::string("a\\ufffdb"), escape(std::string("a\xc3" "b")));
    ASSERT_EQ("overlong encoding replaced", std::string("\\ufffd\\ufffd"), escape(std::string("\xc0\xaf")));
    ASSERT_EQ("surrogate replaced", std::string("\\ufffd\\ufffd\\ufffd"),
              escape(std::string("\xed\xa0\x80")));

    auto registry = default_type_registry();
    auto tokens = tokenize("wip\xff: x");
    ASSERT_TRUE("tokenizes", tokens.ok());
    if (!tokens.ok()) return;
    auto json = to_json(validate(*tokens.message, registry, false), tokens.message);
    ASSERT_TRUE("raw byte absent from output", json.find('\xff') == std::string::npos);
    ASSERT_TRUE("replacement in type", contains(json, "\"type\": \"wip\\ufffd\""));
}

// ── Main ──────────────────────────────────────────────────────────────────────

int main() {
    std::cout << "=== Reporter Tests ===\n";

    test_format_violation();
    test_exit_policy();
    test_summary();
    test_json();
    test_json_utf8();

    std::cout << "\n--- Results: "
              << passed << " passed, " << failed << " failed ---\n";
    return failed == 0 ? 0 : 1;
}
