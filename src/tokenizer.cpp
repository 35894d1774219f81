#include "commitlint/tokenizer.hpp"

#include <cctype>
#include <vector>

namespace commitlint {

namespace {

const char* const kWhitespace = " \t";

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(kWhitespace);
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(kWhitespace);
    return s.substr(first, last - first + 1);
}

bool is_blank(const std::string& line) {
    return line.find_first_not_of(kWhitespace) == std::string::npos;
}

std::vector<std::string> split_lines(const std::string& raw) {
    std::vector<std::string> lines;
    std::string current;
    for (char c : raw) {
        if (c == '\n') {
            lines.push_back(std::move(current));
            current.clear();
        } else if (c != '\r') {
            current += c;
        }
    }
    lines.push_back(std::move(current));
    return lines;
}

std::string join(const std::vector<std::string>& lines, std::size_t from, std::size_t to) {
    std::string out;
    for (std::size_t i = from; i < to; ++i) {
        if (i > from) out += '\n';
        out += lines[i];
    }
    return out;
}

bool is_token_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-';
}

std::optional<Trailer> parse_trailer(const std::string& line) {
    for (const char* breaking : { "BREAKING CHANGE", "BREAKING-CHANGE" }) {
        const std::string prefix = std::string(breaking) + ": ";
        if (line.compare(0, prefix.size(), prefix) == 0) {
            auto value = trim(line.substr(prefix.size()));
            if (value.empty()) return std::nullopt;
            return Trailer{ breaking, value };
        }
    }

    std::size_t i = 0;
    while (i < line.size() && is_token_char(line[i])) ++i;
    if (i == 0 || i >= line.size()) return std::nullopt;

    std::string value;
    if (line.compare(i, 2, ": ") == 0) {
        value = trim(line.substr(i + 2));
    } else if (line.compare(i, 2, " #") == 0) {
        value = trim(line.substr(i + 1));
    } else {
        return std::nullopt;
    }
    if (value.empty()) return std::nullopt;
    return Trailer{ line.substr(0, i), value };
}

FormatError header_error(std::string reason, const std::string& header) {
    return FormatError{ std::move(reason), header };
}

// Fills type, scope and description from the first line.
std::optional<FormatError> parse_header(const std::string& header, ParsedMessage& msg) {
    const auto open = header.find_first_of("():");
    if (open == std::string::npos)
        return header_error("header has no ':' separating the type from the description", header);
    if (header[open] == ')')
        return header_error("unexpected ')' in the commit type", header);

    msg.type = trim(header.substr(0, open));
    if (msg.type.empty())
        return header_error("header has no commit type before the separator", header);

    std::size_t colon = open;
    if (header[open] == '(') {
        const auto close = header.find_first_of("():", open + 1);
        if (close == std::string::npos || header[close] == ':')
            return header_error("scope group is not closed with ')'", header);
        if (header[close] == '(')
            return header_error("unexpected '(' inside the scope", header);

        msg.scope = trim(header.substr(open + 1, close - open - 1));

        colon = header.find_first_not_of(kWhitespace, close + 1);
        if (colon == std::string::npos || header[colon] != ':')
            return header_error("expected ':' after the scope", header);
    }

    msg.description = trim(header.substr(colon + 1));
    return std::nullopt;
}

// Splits the lines after the header into body and footer.
void parse_sections(const std::vector<std::string>& lines, std::size_t first, ParsedMessage& msg) {
    std::size_t start = first;
    std::size_t end = lines.size();
    while (start < end && is_blank(lines[start])) ++start;
    while (end > start && is_blank(lines[end - 1])) --end;
    if (start == end) return;

    // Last paragraph; it is only a footer candidate when a blank line
    // separates it from what precedes it.
    std::size_t footer_start = end;
    while (footer_start > start && !is_blank(lines[footer_start - 1])) --footer_start;

    bool is_footer = footer_start > first && is_blank(lines[footer_start - 1]);
    std::vector<Trailer> trailers;
    if (is_footer) {
        for (std::size_t i = footer_start; i < end && is_footer; ++i) {
            const auto& line = lines[i];
            if (!trailers.empty() && (line[0] == ' ' || line[0] == '\t')) {
                trailers.back().value += "\n" + trim(line);
                continue;
            }
            auto trailer = parse_trailer(line);
            if (trailer) {
                trailers.push_back(std::move(*trailer));
            } else {
                is_footer = false;
            }
        }
    }

    std::size_t body_end = end;
    if (is_footer) {
        msg.footer = join(lines, footer_start, end);
        msg.trailers = std::move(trailers);
        body_end = footer_start;
        while (body_end > start && is_blank(lines[body_end - 1])) --body_end;
    }
    if (body_end > start)
        msg.body = join(lines, start, body_end);
}

} // namespace

bool is_trailer_line(const std::string& line) {
    return parse_trailer(line).has_value();
}

TokenizeResult tokenize(const std::string& raw) {
    TokenizeResult result;
    const auto lines = split_lines(raw);

    std::size_t header_index = 0;
    while (header_index < lines.size() && is_blank(lines[header_index])) ++header_index;
    if (header_index == lines.size()) {
        result.error = header_error("commit message is empty", "");
        return result;
    }

    ParsedMessage msg;
    if (auto error = parse_header(lines[header_index], msg)) {
        result.error = std::move(error);
        return result;
    }
    parse_sections(lines, header_index + 1, msg);

    result.message = std::move(msg);
    return result;
}

} // namespace commitlint
