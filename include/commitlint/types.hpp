#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace commitlint {

// Structural fields a commit type may require.
enum class Field { Scope, Description, Body, Footer };

enum class ViolationKind { UnknownType, MissingField, MalformedHeader };

struct CommitType {
    std::string              name;      // as supplied, e.g. "feat"
    std::vector<std::string> required;  // "scope", "description", "body", "footer"
};

// A "Token: value" line from the footer block.
struct Trailer {
    std::string key;
    std::string value;
};

inline bool operator==(const Trailer& a, const Trailer& b) {
    return a.key == b.key && a.value == b.value;
}

struct ParsedMessage {
    std::string                type;
    std::optional<std::string> scope;
    std::string                description;
    std::optional<std::string> body;
    std::optional<std::string> footer;
    std::vector<Trailer>       trailers;
};

struct Violation {
    ViolationKind kind;
    std::string   commit_type;  // empty for MalformedHeader
    std::string   field;        // set for MissingField only
    std::string   detail;       // set for MalformedHeader only
};

inline bool operator==(const Violation& a, const Violation& b) {
    return a.kind == b.kind && a.commit_type == b.commit_type &&
           a.field == b.field && a.detail == b.detail;
}

inline bool operator!=(const Violation& a, const Violation& b) {
    return !(a == b);
}

struct ValidationResult {
    std::vector<Violation> violations;

    bool valid() const { return violations.empty(); }
};

inline bool operator==(const ValidationResult& a, const ValidationResult& b) {
    return a.violations == b.violations;
}

// Returned instead of thrown when the override type spec cannot be parsed.
struct ConfigError {
    std::size_t entry_index = 0;  // 1-based, 0 when not tied to an entry
    std::string entry;
    std::string reason;
};

// Returned instead of thrown when no header can be identified.
struct FormatError {
    std::string reason;
    std::string header;
};

inline const char* field_name(Field f) {
    switch (f) {
        case Field::Scope:       return "scope";
        case Field::Description: return "description";
        case Field::Body:        return "body";
        case Field::Footer:      return "footer";
        default:                 return "unknown";
    }
}

inline std::optional<Field> field_from_name(const std::string& name) {
    if (name == "scope")       return Field::Scope;
    if (name == "description") return Field::Description;
    if (name == "body")        return Field::Body;
    if (name == "footer")      return Field::Footer;
    return std::nullopt;
}

inline std::ostream& operator<<(std::ostream& os, ViolationKind k) {
    switch (k) {
        case ViolationKind::UnknownType:     return os << "UnknownType";
        case ViolationKind::MissingField:    return os << "MissingField";
        case ViolationKind::MalformedHeader: return os << "MalformedHeader";
        default:                             return os << "Unknown";
    }
}

} // namespace commitlint
