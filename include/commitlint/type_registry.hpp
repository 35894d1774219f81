#pragma once

#include "commitlint/options.hpp"
#include "commitlint/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace commitlint {

/**
 * TypeRegistry
 *
 * Ordered set of allowed commit types and the fields each one requires.
 * Built once per run and read-only afterwards. Names keep the case they
 * were registered with so reports show them as the user wrote them.
 */
class TypeRegistry {
public:
    void register_type(CommitType type);

    // Looks up a header type token. With ignore_case both sides are
    // compared in ASCII lowercase.
    const CommitType* find(const std::string& token, bool ignore_case) const;

    bool contains(const std::string& token, bool ignore_case) const {
        return find(token, ignore_case) != nullptr;
    }

    const std::vector<CommitType>& types() const { return types_; }
    std::size_t type_count() const { return types_.size(); }

private:
    std::vector<CommitType> types_;
};

struct RegistryBuild {
    std::optional<TypeRegistry> registry;
    std::optional<ConfigError>  error;

    bool ok() const { return registry.has_value(); }
};

/// fix, feat, docs, style, refactor, perf, test, chore; each requires a description.
TypeRegistry default_type_registry();

/// Parses "type1=f1,f2;type2=;..." into a registry, or reports the first bad entry.
RegistryBuild parse_type_spec(const std::string& spec, bool ignore_case);

/// The default registry, or the override spec from options when one was given.
RegistryBuild build_registry(const Options& options);

std::string to_string(const ConfigError& error);

} // namespace commitlint
