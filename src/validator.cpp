#include "commitlint/validator.hpp"
#include "commitlint/tokenizer.hpp"

#include <algorithm>

namespace commitlint {

namespace {

bool non_empty(const std::optional<std::string>& value) {
    return value && !value->empty();
}

bool field_satisfied(Field field, const ParsedMessage& msg) {
    switch (field) {
        case Field::Scope:       return non_empty(msg.scope);
        case Field::Description: return !msg.description.empty();
        case Field::Body:        return non_empty(msg.body);
        case Field::Footer:      return non_empty(msg.footer);
        default:                 return false;
    }
}

Violation missing(const CommitType& type, const std::string& field) {
    return { ViolationKind::MissingField, type.name, field, "" };
}

} // namespace

ValidationResult validate(const ParsedMessage& msg,
                          const TypeRegistry& registry,
                          bool ignore_case) {
    ValidationResult result;

    const CommitType* type = registry.find(msg.type, ignore_case);
    if (!type) {
        result.violations.push_back({ ViolationKind::UnknownType, msg.type, "", "" });
        return result;
    }

    for (const auto& name : type->required) {
        auto field = field_from_name(name);
        // Names outside the known fields can never be satisfied.
        if (!field || !field_satisfied(*field, msg))
            result.violations.push_back(missing(*type, name));
    }

    const auto& required = type->required;
    const char* description = field_name(Field::Description);
    if (std::find(required.begin(), required.end(), description) == required.end() &&
        !field_satisfied(Field::Description, msg)) {
        result.violations.push_back(missing(*type, description));
    }
    return result;
}

Violation malformed_header(const FormatError& error) {
    return { ViolationKind::MalformedHeader, "", "", error.reason };
}

ValidationResult lint(const std::string& raw,
                      const TypeRegistry& registry,
                      bool ignore_case) {
    auto tokens = tokenize(raw);
    if (!tokens.ok()) {
        ValidationResult result;
        result.violations.push_back(malformed_header(*tokens.error));
        return result;
    }
    return validate(*tokens.message, registry, ignore_case);
}

} // namespace commitlint
