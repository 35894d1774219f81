#pragma once

#include "commitlint/types.hpp"

#include <optional>
#include <string>

namespace commitlint {

struct TokenizeResult {
    std::optional<ParsedMessage> message;
    std::optional<FormatError>   error;

    bool ok() const { return message.has_value(); }
};

/**
 * tokenize
 *
 * Splits a raw commit message into its structural fields:
 *
 *   type(scope): description
 *   <blank line>
 *   body ...
 *   <blank line>
 *   Token: value        <- footer, only when every line is a trailer
 *
 * Only the first colon after the optional scope group ends the header
 * prefix. Missing scope, body or footer is not an error; a header with
 * no colon-delimited prefix is.
 */
TokenizeResult tokenize(const std::string& raw);

/// True when the line is a footer trailer ("Refs: #1", "Closes #2", "BREAKING CHANGE: x").
bool is_trailer_line(const std::string& line);

} // namespace commitlint
