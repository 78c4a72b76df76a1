#include "json_text.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>

namespace sewerflow {
namespace {
// Position just past `"key":` (whitespace allowed around the colon), or npos.
std::size_t find_value(std::string_view json, std::string_view key) {
    const std::string pattern = std::string("\"") + std::string(key) + "\"";
    std::size_t pos = 0;
    while ((pos = json.find(pattern, pos)) != std::string_view::npos) {
        std::size_t cursor = pos + pattern.size();
        while (cursor < json.size() && std::isspace(static_cast<unsigned char>(json[cursor]))) {
            ++cursor;
        }
        if (cursor < json.size() && json[cursor] == ':') {
            ++cursor;
            while (cursor < json.size() && std::isspace(static_cast<unsigned char>(json[cursor]))) {
                ++cursor;
            }
            return cursor;
        }
        pos += pattern.size();
    }
    return std::string_view::npos;
}

unsigned int parse_hex4(std::string_view input, std::size_t pos) {
    unsigned int code = 0;
    for (std::size_t j = 0; j < 4; ++j) {
        char hex = input[pos + j];
        code <<= 4;
        if (hex >= '0' && hex <= '9') {
            code |= static_cast<unsigned int>(hex - '0');
        } else if (hex >= 'a' && hex <= 'f') {
            code |= static_cast<unsigned int>(hex - 'a' + 10);
        } else if (hex >= 'A' && hex <= 'F') {
            code |= static_cast<unsigned int>(hex - 'A' + 10);
        }
    }
    return code;
}

void append_utf8(std::string &out, unsigned int code) {
    if (code <= 0x7F) {
        out.push_back(static_cast<char>(code));
    } else if (code <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    }
}
}  // namespace

std::string JsonEscape(std::string_view input) {
    std::string out;
    out.reserve(input.size() + 2);
    for (char c : input) {
        switch (c) {
            case '\\':
                out += "\\\\";
                break;
            case '"':
                out += "\\\"";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    std::ostringstream oss;
                    oss << "\\u" << std::hex << std::uppercase << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c));
                    out += oss.str();
                } else {
                    out += c;
                }
        }
    }
    return out;
}

std::string JsonUnescape(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    for (std::size_t i = 0; i < input.size(); ++i) {
        char c = input[i];
        if (c != '\\') {
            out.push_back(c);
            continue;
        }
        if (i + 1 >= input.size()) {
            break;
        }
        char esc = input[++i];
        switch (esc) {
            case 'n':
                out.push_back('\n');
                break;
            case 'r':
                out.push_back('\r');
                break;
            case 't':
                out.push_back('\t');
                break;
            case 'u':
                if (i + 4 < input.size()) {
                    append_utf8(out, parse_hex4(input, i + 1));
                    i += 4;
                }
                break;
            default:
                // Covers \\, \" and \/.
                out.push_back(esc);
                break;
        }
    }
    return out;
}

std::string JsonNumber(double value) {
    if (!std::isfinite(value)) {
        return "null";
    }
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    return oss.str();
}

bool JsonExtractString(std::string_view json, std::string_view key, std::string &value) {
    auto pos = find_value(json, key);
    if (pos == std::string_view::npos || pos >= json.size() || json[pos] != '"') {
        return false;
    }
    std::string raw;
    bool escaping = false;
    for (std::size_t i = pos + 1; i < json.size(); ++i) {
        char c = json[i];
        if (!escaping) {
            if (c == '\\') {
                escaping = true;
            } else if (c == '"') {
                value = JsonUnescape(raw);
                return true;
            } else {
                raw.push_back(c);
            }
        } else {
            raw.push_back('\\');
            raw.push_back(c);
            escaping = false;
        }
    }
    return false;
}

bool JsonExtractNumber(std::string_view json, std::string_view key, double &value) {
    auto pos = find_value(json, key);
    if (pos == std::string_view::npos) {
        return false;
    }
    std::size_t end = pos;
    while (end < json.size() &&
           (std::isdigit(static_cast<unsigned char>(json[end])) || json[end] == '-' || json[end] == '+' ||
            json[end] == '.' || json[end] == 'e' || json[end] == 'E')) {
        ++end;
    }
    if (end == pos) {
        return false;
    }
    const std::string number(json.substr(pos, end - pos));
    char *parse_end = nullptr;
    double parsed = std::strtod(number.c_str(), &parse_end);
    if (parse_end != number.c_str() + number.size()) {
        return false;
    }
    value = parsed;
    return true;
}

bool JsonExtractUint64(std::string_view json, std::string_view key, std::uint64_t &value) {
    auto pos = find_value(json, key);
    if (pos == std::string_view::npos) {
        return false;
    }
    std::size_t end = pos;
    while (end < json.size() && std::isdigit(static_cast<unsigned char>(json[end]))) {
        ++end;
    }
    if (end == pos) {
        return false;
    }
    try {
        value = std::stoull(std::string(json.substr(pos, end - pos)));
        return true;
    } catch (const std::exception &) {
        return false;
    }
}

bool JsonExtractBool(std::string_view json, std::string_view key, bool &value) {
    auto pos = find_value(json, key);
    if (pos == std::string_view::npos) {
        return false;
    }
    auto rest = json.substr(pos);
    if (rest.substr(0, 4) == "true") {
        value = true;
        return true;
    }
    if (rest.substr(0, 5) == "false") {
        value = false;
        return true;
    }
    return false;
}

bool JsonExtractTimestamp(std::string_view json, std::string_view key, TimePoint &value) {
    std::string text;
    if (!JsonExtractString(json, key, text)) {
        return false;
    }
    return ParseUtcTimestamp(text, value);
}

}  // namespace sewerflow
