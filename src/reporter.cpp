#include "commitlint/reporter.hpp"
#include "commitlint/json.hpp"

#include <sstream>

namespace commitlint {

namespace {

std::string cell(const std::optional<std::string>& value) {
    return value ? *value : "-";
}

// Multi-line values are shown on one row.
std::string one_line(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) out += (c == '\n') ? ' ' : c;
    return out;
}

} // namespace

const char* rule_name(ViolationKind kind) {
    switch (kind) {
        case ViolationKind::UnknownType:     return "unknown-type";
        case ViolationKind::MissingField:    return "missing-field";
        case ViolationKind::MalformedHeader: return "malformed-header";
        default:                             return "unknown-rule";
    }
}

std::string format_violation(const Violation& v) {
    std::ostringstream os;
    os << "[" << rule_name(v.kind) << "] ";
    switch (v.kind) {
        case ViolationKind::UnknownType:
            os << "commit type '" << v.commit_type << "' is not allowed";
            break;
        case ViolationKind::MissingField:
            os << "commit type '" << v.commit_type << "' requires a "
               << v.field << ", but none was given";
            break;
        case ViolationKind::MalformedHeader:
            os << "expected 'type(scope): description'";
            if (!v.detail.empty()) os << ": " << v.detail;
            break;
    }
    return os.str();
}

std::string format_summary(const std::optional<ParsedMessage>& msg,
                           const ValidationResult& result) {
    std::ostringstream os;
    const auto row = [&os](const char* label, const std::string& value) {
        os << "  " << label << std::string(13 - std::string(label).size(), ' ')
           << ": " << value << "\n";
    };

    row("Type",        msg ? msg->type : "-");
    row("Scope",       msg ? cell(msg->scope) : "-");
    row("Description", msg ? msg->description : "-");
    row("Body",        msg ? one_line(cell(msg->body)) : "-");
    row("Footer",      msg ? one_line(cell(msg->footer)) : "-");
    row("Valid",       result.valid() ? "true" : "false");
    return os.str();
}

int report(const ValidationResult& result,
           const std::optional<ParsedMessage>& msg,
           const Options& options,
           std::ostream& out,
           std::ostream& err) {
    if (options.format == OutputFormat::Json) {
        out << to_json(result, msg) << "\n";
    } else {
        if (options.summary) out << format_summary(msg, result);
        for (const auto& v : result.violations)
            err << format_violation(v) << "\n";
    }

    if (result.valid() || options.continue_on_error) return EXIT_VALID;
    return EXIT_VIOLATIONS;
}

} // namespace commitlint
