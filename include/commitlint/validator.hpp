#pragma once

#include "commitlint/type_registry.hpp"
#include "commitlint/types.hpp"

#include <string>

namespace commitlint {

/**
 * validate
 *
 * Checks a parsed message against the registry:
 *   1. The type must be registered; otherwise a single UnknownType
 *      violation is returned and no field checks run.
 *   2. Each required field, in registry order, must be present and
 *      non-empty. The description is always required; when a type does
 *      not list it, it is checked after the listed fields.
 *
 * Pure: the same inputs always give the same result.
 */
ValidationResult validate(const ParsedMessage& msg,
                          const TypeRegistry& registry,
                          bool ignore_case);

/// The violation reported for a header the tokenizer could not read.
Violation malformed_header(const FormatError& error);

/// Tokenizes then validates. A header that cannot be tokenized yields one MalformedHeader.
ValidationResult lint(const std::string& raw,
                      const TypeRegistry& registry,
                      bool ignore_case);

} // namespace commitlint
