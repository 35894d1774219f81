#include "commitlint/message_source.hpp"
#include "commitlint/logging.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace commitlint {

namespace {

MessageRead read_failure(std::string error) {
    MessageRead read;
    read.error = std::move(error);
    return read;
}

} // namespace

MessageRead read_stream(std::istream& in) {
    std::string text;
    char buf[4096];
    while (in.read(buf, sizeof(buf)) || in.gcount() > 0)
        text.append(buf, static_cast<std::size_t>(in.gcount()));

    // A clean end of input leaves eofbit set alongside failbit.
    if (in.bad() || !in.eof())
        return read_failure("read error");

    MessageRead read;
    read.text = std::move(text);
    return read;
}

MessageRead read_message_file(const std::string& path) {
    std::error_code ec;
    const auto status = std::filesystem::status(path, ec);
    if (ec)
        return read_failure(path + ": " + ec.message());
    if (!std::filesystem::is_regular_file(status))
        return read_failure(path + ": not a regular file");

    std::ifstream file(path, std::ios::binary);
    if (!file)
        return read_failure(path + ": cannot open");

    auto read = read_stream(file);
    if (!read.ok()) read.error = path + ": " + read.error;
    return read;
}

MessageRead read_message(const std::optional<std::string>& path) {
    if (!path || *path == "-") {
        log(LogLevel::Debug, "reading commit message from stdin");
        auto read = read_stream(std::cin);
        if (!read.ok()) read.error = "stdin: " + read.error;
        return read;
    }

    log(LogLevel::Debug, "reading commit message from " + *path);
    return read_message_file(*path);
}

} // namespace commitlint
