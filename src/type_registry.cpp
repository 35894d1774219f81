#include "commitlint/type_registry.hpp"
#include "commitlint/logging.hpp"

#include <cctype>

namespace commitlint {

namespace {

std::string to_lower(const std::string& s) {
    std::string out(s);
    for (auto& c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    for (;;) {
        auto pos = s.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            return parts;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
}

bool valid_type_name(const std::string& name) {
    for (char c : name) {
        if (std::isspace(static_cast<unsigned char>(c))) return false;
        switch (c) {
            case '(': case ')': case ':': case '=': case ',':
                return false;
            default:
                break;
        }
    }
    return true;
}

RegistryBuild fail(std::size_t index, const std::string& entry, std::string reason) {
    RegistryBuild build;
    build.error = ConfigError{ index, entry, std::move(reason) };
    return build;
}

} // namespace

// ── TypeRegistry ──────────────────────────────────────────────────────────────

void TypeRegistry::register_type(CommitType type) {
    types_.push_back(std::move(type));
}

const CommitType* TypeRegistry::find(const std::string& token, bool ignore_case) const {
    if (!ignore_case) {
        for (const auto& t : types_)
            if (t.name == token) return &t;
        return nullptr;
    }
    const auto wanted = to_lower(token);
    for (const auto& t : types_)
        if (to_lower(t.name) == wanted) return &t;
    return nullptr;
}

// ── Construction ──────────────────────────────────────────────────────────────

TypeRegistry default_type_registry() {
    TypeRegistry registry;
    for (const char* name : { "fix", "feat", "docs", "style",
                              "refactor", "perf", "test", "chore" }) {
        registry.register_type({ name, { "description" } });
    }
    return registry;
}

RegistryBuild parse_type_spec(const std::string& spec, bool ignore_case) {
    TypeRegistry registry;
    const auto entries = split(spec, ';');

    for (std::size_t i = 0; i < entries.size(); ++i) {
        const std::size_t index = i + 1;
        const auto entry = trim(entries[i]);
        if (entry.empty()) continue;

        const auto eq = entry.find('=');
        if (eq == std::string::npos)
            return fail(index, entry, "missing '=' between type and required fields");

        const auto name = trim(entry.substr(0, eq));
        if (name.empty())
            return fail(index, entry, "empty type name");
        if (!valid_type_name(name))
            return fail(index, entry, "type name '" + name + "' contains whitespace or one of ( ) : = ,");
        if (registry.contains(name, ignore_case))
            return fail(index, entry, "type '" + name + "' is declared more than once");

        CommitType type{ name, {} };
        for (const auto& raw_field : split(entry.substr(eq + 1), ',')) {
            const auto field = trim(raw_field);
            if (field.empty()) continue;
            if (!field_from_name(field))
                log(LogLevel::Warn, "type '" + name + "' requires unknown field '" + field +
                                    "'; messages of this type can never satisfy it");
            bool seen = false;
            for (const auto& f : type.required)
                if (f == field) seen = true;
            if (!seen) type.required.push_back(field);
        }
        registry.register_type(std::move(type));
    }

    if (registry.type_count() == 0)
        return fail(0, spec, "type specification declares no types");

    RegistryBuild build;
    build.registry = std::move(registry);
    return build;
}

RegistryBuild build_registry(const Options& options) {
    if (!options.type_spec) {
        log(LogLevel::Debug, "using default commit types");
        RegistryBuild build;
        build.registry = default_type_registry();
        return build;
    }

    auto build = parse_type_spec(*options.type_spec, options.ignore_case);
    if (build.ok()) {
        log(LogLevel::Debug, "loaded " + std::to_string(build.registry->type_count()) +
                             " commit type(s) from override spec");
    } else {
        log(LogLevel::Debug, "override spec rejected: " + to_string(*build.error));
    }
    return build;
}

std::string to_string(const ConfigError& error) {
    if (error.entry_index == 0)
        return "invalid type specification '" + error.entry + "': " + error.reason;
    return "invalid type specification entry " + std::to_string(error.entry_index) +
           " '" + error.entry + "': " + error.reason;
}

} // namespace commitlint
