#pragma once

#include <istream>
#include <optional>
#include <string>

namespace commitlint {

struct MessageRead {
    std::optional<std::string> text;
    std::string                error;  // set when text is absent

    bool ok() const { return text.has_value(); }
};

/// Reads the whole stream; fails when the stream reports a read error.
MessageRead read_stream(std::istream& in);

/// Reads a commit message file. Directories and other non-regular files are rejected.
MessageRead read_message_file(const std::string& path);

/// The file named in options, or std::cin when no path (or "-") was given.
MessageRead read_message(const std::optional<std::string>& path);

} // namespace commitlint
