#pragma once

#include "commitlint/reporter.hpp"
#include "commitlint/types.hpp"

#include <cstdio>
#include <optional>
#include <sstream>
#include <string>

namespace commitlint {

namespace json_detail {

// Length of the well-formed UTF-8 sequence starting at s[i], or 0.
inline std::size_t utf8_sequence_length(const std::string& s, std::size_t i) {
    const auto byte = [&s](std::size_t k) { return static_cast<unsigned char>(s[k]); };
    const unsigned char lead = byte(i);
    std::size_t len;
    unsigned char lo = 0x80, hi = 0xBF;  // bounds for the second byte
    if (lead < 0x80)                      return 1;
    else if (lead >= 0xC2 && lead <= 0xDF) len = 2;
    else if (lead == 0xE0)               { len = 3; lo = 0xA0; }
    else if (lead == 0xED)               { len = 3; hi = 0x9F; }
    else if (lead >= 0xE1 && lead <= 0xEF) len = 3;
    else if (lead == 0xF0)               { len = 4; lo = 0x90; }
    else if (lead == 0xF4)               { len = 4; hi = 0x8F; }
    else if (lead >= 0xF1 && lead <= 0xF3) len = 4;
    else                                  return 0;

    if (i + len > s.size()) return 0;
    if (byte(i + 1) < lo || byte(i + 1) > hi) return 0;
    for (std::size_t k = 2; k < len; ++k)
        if (byte(i + k) < 0x80 || byte(i + k) > 0xBF) return 0;
    return len;
}

// Invalid UTF-8 bytes become U+FFFD.
inline std::string escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (std::size_t i = 0; i < s.size();) {
        const char c = s[i];
        const std::size_t len = utf8_sequence_length(s, i);
        if (len == 0) {
            result += "\\ufffd";
            ++i;
            continue;
        }
        if (len > 1) {
            result.append(s, i, len);
            i += len;
            continue;
        }
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    result += buf;
                } else {
                    result += c;
                }
                break;
        }
        ++i;
    }
    return result;
}

inline std::string quoted(const std::string& s) {
    return "\"" + escape(s) + "\"";
}

inline std::string quoted_or_null(const std::optional<std::string>& s) {
    return s ? quoted(*s) : "null";
}

} // namespace json_detail

inline std::string to_json(const Violation& v) {
    std::ostringstream os;
    os << "{ \"kind\": \""   << v.kind << "\""
       << ", \"rule\": "    << json_detail::quoted(rule_name(v.kind))
       << ", \"type\": "    << json_detail::quoted(v.commit_type)
       << ", \"field\": "   << json_detail::quoted(v.field)
       << ", \"message\": " << json_detail::quoted(format_violation(v))
       << " }";
    return os.str();
}

inline std::string to_json(const ParsedMessage& m) {
    std::ostringstream os;
    os << "{\n"
       << "    \"type\": "        << json_detail::quoted(m.type) << ",\n"
       << "    \"scope\": "       << json_detail::quoted_or_null(m.scope) << ",\n"
       << "    \"description\": " << json_detail::quoted(m.description) << ",\n"
       << "    \"body\": "        << json_detail::quoted_or_null(m.body) << ",\n"
       << "    \"footer\": "      << json_detail::quoted_or_null(m.footer) << ",\n"
       << "    \"trailers\": [";
    for (std::size_t i = 0; i < m.trailers.size(); ++i) {
        os << "\n      { \"key\": " << json_detail::quoted(m.trailers[i].key)
           << ", \"value\": "       << json_detail::quoted(m.trailers[i].value) << " }";
        if (i + 1 < m.trailers.size()) os << ",";
    }
    os << (m.trailers.empty() ? "]\n" : "\n    ]\n")
       << "  }";
    return os.str();
}

inline std::string to_json(const ValidationResult& result,
                           const std::optional<ParsedMessage>& msg) {
    std::ostringstream os;
    os << "{\n"
       << "  \"valid\": "   << (result.valid() ? "true" : "false") << ",\n"
       << "  \"message\": " << (msg ? to_json(*msg) : std::string("null")) << ",\n"
       << "  \"violations\": [";
    for (std::size_t i = 0; i < result.violations.size(); ++i) {
        os << "\n    " << to_json(result.violations[i]);
        if (i + 1 < result.violations.size()) os << ",";
    }
    os << (result.violations.empty() ? "]\n" : "\n  ]\n")
       << "}";
    return os.str();
}

} // namespace commitlint
