#include "commitlint/options.hpp"

#include <string>

namespace commitlint {

namespace {

OptionsParse usage_error(std::string message) {
    OptionsParse parse;
    parse.error = std::move(message);
    return parse;
}

} // namespace

const char* usage_text() {
    return R"(usage: commitlint [options] [MESSAGE_FILE]

Validates a commit message of the form 'type(scope): description'.
Reads MESSAGE_FILE when given (as passed to a commit-msg hook),
otherwise standard input.

Options:
  -t, --types SPEC            allowed types, e.g. "feat=scope,description;docs="
  -i, --ignore-case           match commit types case-insensitively
  -c, --allow-caps-types      alias of --ignore-case
  -e, --dont-exit-on-errors   print violations but exit with status 0
  -f, --format text|json      output format (default: text)
  -s, --summary               print the parsed fields
  -v, --verbose               debug logging on stderr
  -h, --help                  show this help

Exit status:
  0  message is valid (or --dont-exit-on-errors)
  1  message has violations
  2  usage or type specification error
  3  message could not be read
)";
}

OptionsParse parse_options(int argc, const char* const* argv) {
    Options options;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            OptionsParse parse;
            parse.help_requested = true;
            return parse;
        } else if (arg == "-e" || arg == "--dont-exit-on-errors") {
            options.continue_on_error = true;
        } else if (arg == "-c" || arg == "--allow-caps-types" ||
                   arg == "-i" || arg == "--ignore-case") {
            options.ignore_case = true;
        } else if (arg == "-s" || arg == "--summary") {
            options.summary = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-t" || arg == "--types") {
            if (i + 1 >= argc) return usage_error("missing argument for " + arg);
            options.type_spec = argv[++i];
        } else if (arg == "-f" || arg == "--format") {
            if (i + 1 >= argc) return usage_error("missing argument for " + arg);
            const std::string value = argv[++i];
            if (value == "text") {
                options.format = OutputFormat::Text;
            } else if (value == "json") {
                options.format = OutputFormat::Json;
            } else {
                return usage_error("unknown format '" + value + "' (expected text or json)");
            }
        } else if (arg.size() > 1 && arg[0] == '-') {
            return usage_error("unknown option " + arg);
        } else if (options.message_path) {
            return usage_error("more than one message file given");
        } else {
            options.message_path = arg;
        }
    }

    OptionsParse parse;
    parse.options = std::move(options);
    return parse;
}

} // namespace commitlint
