#pragma once

#include "commitlint/options.hpp"
#include "commitlint/types.hpp"

#include <optional>
#include <ostream>
#include <string>

namespace commitlint {

// Process exit statuses.
enum ExitStatus {
    EXIT_VALID        = 0,
    EXIT_VIOLATIONS   = 1,
    EXIT_USAGE        = 2,
    EXIT_IO_ERROR     = 3
};

/// Short rule identifier used as the line prefix, e.g. "unknown-type".
const char* rule_name(ViolationKind kind);

/// One human-readable line per violation.
std::string format_violation(const Violation& v);

/// Field table of the parsed message, printed with --summary.
std::string format_summary(const std::optional<ParsedMessage>& msg,
                           const ValidationResult& result);

/**
 * report
 *
 * Writes the result in the configured format and returns the exit status.
 * Text mode prints nothing for a valid message and one line per violation
 * otherwise (on err). With continue_on_error violations are still printed
 * but the status is EXIT_VALID.
 */
int report(const ValidationResult& result,
           const std::optional<ParsedMessage>& msg,
           const Options& options,
           std::ostream& out,
           std::ostream& err);

} // namespace commitlint
