#pragma once

#include <optional>
#include <string>

namespace commitlint {

enum class OutputFormat { Text, Json };

// Run configuration. Passed explicitly to registry construction and
// reporting; the validator only ever sees ignore_case.
struct Options {
    bool                       ignore_case       = false;
    bool                       continue_on_error = false;
    std::optional<std::string> type_spec;
    OutputFormat               format            = OutputFormat::Text;
    bool                       summary           = false;
    bool                       verbose           = false;
    std::optional<std::string> message_path;
};

struct OptionsParse {
    std::optional<Options> options;
    bool                   help_requested = false;
    std::string            error;  // non-empty on a usage error

    bool ok() const { return options.has_value(); }
};

OptionsParse parse_options(int argc, const char* const* argv);

const char* usage_text();

} // namespace commitlint
