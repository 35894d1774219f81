#include "commitlint/logging.hpp"
#include "commitlint/message_source.hpp"
#include "commitlint/options.hpp"
#include "commitlint/reporter.hpp"
#include "commitlint/tokenizer.hpp"
#include "commitlint/type_registry.hpp"
#include "commitlint/validator.hpp"

#include <iostream>
#include <string>

using namespace commitlint;

int main(int argc, char** argv) {
    // ── Options ──────────────────────────────────────────────────────────────
    auto parsed = parse_options(argc, argv);
    if (parsed.help_requested) {
        std::cout << usage_text();
        return EXIT_VALID;
    }
    if (!parsed.ok()) {
        std::cerr << "commitlint: " << parsed.error << "\n\n" << usage_text();
        return EXIT_USAGE;
    }
    const Options& options = *parsed.options;
    if (options.verbose) set_log_level(LogLevel::Debug);

    // ── Registry ─────────────────────────────────────────────────────────────
    auto build = build_registry(options);
    if (!build.ok()) {
        log(LogLevel::Error, to_string(*build.error));
        return EXIT_USAGE;
    }
    const TypeRegistry& registry = *build.registry;

    // ── Message ──────────────────────────────────────────────────────────────
    auto read = read_message(options.message_path);
    if (!read.ok()) {
        log(LogLevel::Error, "failed to read commit message: " + read.error);
        return EXIT_IO_ERROR;
    }
    const std::string& raw = *read.text;

    // ── Validation ───────────────────────────────────────────────────────────
    auto tokens = tokenize(raw);
    ValidationResult result;
    if (tokens.ok()) {
        log(LogLevel::Debug, "header: type='" + tokens.message->type + "' description='" +
                             tokens.message->description + "'");
        result = validate(*tokens.message, registry, options.ignore_case);
    } else {
        log(LogLevel::Debug, "tokenizer rejected header '" + tokens.error->header + "'");
        result.violations.push_back(malformed_header(*tokens.error));
    }

    // ── Report ───────────────────────────────────────────────────────────────
    const int status = report(result, tokens.message, options, std::cout, std::cerr);
    log(LogLevel::Debug, std::to_string(result.violations.size()) + " violation(s), exit status " +
                         std::to_string(status));
    return status;
}
