/**
 * @file json_utils.cpp
 * @brief Implementation of the minimal JSON helpers
 */

#include <custody/upload/core/json_utils.h>

#include <charconv>
#include <cstdio>
#include <cstring>

namespace custody::upload::json_utils {

namespace {

constexpr auto npos = std::string_view::npos;

auto skip_ws(std::string_view s, std::size_t pos) -> std::size_t {
    while (pos < s.size() &&
           (s[pos] == ' ' || s[pos] == '\t' || s[pos] == '\n' || s[pos] == '\r')) {
        ++pos;
    }
    return pos;
}

// pos points at the opening quote; returns the index past the closing quote
auto skip_string(std::string_view s, std::size_t pos) -> std::size_t {
    ++pos;
    while (pos < s.size()) {
        if (s[pos] == '\\') {
            pos += 2;
        } else if (s[pos] == '"') {
            return pos + 1;
        } else {
            ++pos;
        }
    }
    return npos;
}

auto skip_value(std::string_view s, std::size_t pos) -> std::size_t {
    if (pos >= s.size()) {
        return npos;
    }

    const char c = s[pos];
    if (c == '"') {
        return skip_string(s, pos);
    }

    if (c == '{' || c == '[') {
        int depth = 0;
        while (pos < s.size()) {
            const char d = s[pos];
            if (d == '"') {
                pos = skip_string(s, pos);
                if (pos == npos) {
                    return npos;
                }
                continue;
            }
            if (d == '{' || d == '[') {
                ++depth;
            } else if (d == '}' || d == ']') {
                if (--depth == 0) {
                    return pos + 1;
                }
            }
            ++pos;
        }
        return npos;
    }

    auto end = pos;
    while (end < s.size() && std::strchr(",}] \t\r\n", s[end]) == nullptr) {
        ++end;
    }
    return end == pos ? npos : end;
}

void append_utf8(std::string& out, unsigned int code) {
    if (code < 0x80) {
        out += static_cast<char>(code);
    } else if (code < 0x800) {
        out += static_cast<char>(0xC0 | (code >> 6));
        out += static_cast<char>(0x80 | (code & 0x3F));
    } else {
        out += static_cast<char>(0xE0 | (code >> 12));
        out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code & 0x3F));
    }
}

}  // namespace

// ============================================================================
// Escaping
// ============================================================================

auto escape(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 8);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

auto unescape(std::string_view input) -> std::string {
    std::string result;
    result.reserve(input.size());

    for (std::size_t i = 0; i < input.size(); ++i) {
        if (input[i] != '\\' || i + 1 >= input.size()) {
            result += input[i];
            continue;
        }

        switch (input[i + 1]) {
            case '"': result += '"'; ++i; break;
            case '\\': result += '\\'; ++i; break;
            case '/': result += '/'; ++i; break;
            case 'b': result += '\b'; ++i; break;
            case 'f': result += '\f'; ++i; break;
            case 'n': result += '\n'; ++i; break;
            case 'r': result += '\r'; ++i; break;
            case 't': result += '\t'; ++i; break;
            case 'u': {
                unsigned int code = 0;
                if (i + 5 < input.size()) {
                    auto hex = input.substr(i + 2, 4);
                    auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), code, 16);
                    if (ec == std::errc{} && ptr == hex.data() + hex.size()) {
                        append_utf8(result, code);
                        i += 5;
                        break;
                    }
                }
                result += input[i];
                break;
            }
            default:
                result += input[i];
                break;
        }
    }
    return result;
}

auto quote(std::string_view input) -> std::string {
    return "\"" + escape(input) + "\"";
}

// ============================================================================
// Lookup
// ============================================================================

auto member(std::string_view object, std::string_view key) -> std::optional<std::string> {
    auto pos = skip_ws(object, 0);
    if (pos >= object.size() || object[pos] != '{') {
        return std::nullopt;
    }
    ++pos;

    while (true) {
        pos = skip_ws(object, pos);
        if (pos >= object.size() || object[pos] != '"') {
            return std::nullopt;
        }

        auto name_end = skip_string(object, pos);
        if (name_end == npos) {
            return std::nullopt;
        }
        auto name = unescape(object.substr(pos + 1, name_end - pos - 2));

        pos = skip_ws(object, name_end);
        if (pos >= object.size() || object[pos] != ':') {
            return std::nullopt;
        }
        pos = skip_ws(object, pos + 1);

        auto value_end = skip_value(object, pos);
        if (value_end == npos) {
            return std::nullopt;
        }
        if (name == key) {
            return std::string(object.substr(pos, value_end - pos));
        }

        pos = skip_ws(object, value_end);
        if (pos < object.size() && object[pos] == ',') {
            ++pos;
            continue;
        }
        return std::nullopt;
    }
}

auto string_member(std::string_view object, std::string_view key)
    -> std::optional<std::string> {
    auto raw = member(object, key);
    if (!raw || raw->size() < 2 || raw->front() != '"') {
        return std::nullopt;
    }
    return unescape(std::string_view(*raw).substr(1, raw->size() - 2));
}

auto uint_member(std::string_view object, std::string_view key) -> std::optional<uint64_t> {
    auto raw = member(object, key);
    if (!raw || raw->empty()) {
        return std::nullopt;
    }

    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(raw->data(), raw->data() + raw->size(), value);
    if (ec != std::errc{} || ptr != raw->data() + raw->size()) {
        return std::nullopt;
    }
    return value;
}

auto array_elements(std::string_view array) -> std::optional<std::vector<std::string>> {
    auto pos = skip_ws(array, 0);
    if (pos >= array.size() || array[pos] != '[') {
        return std::nullopt;
    }

    std::vector<std::string> elements;
    pos = skip_ws(array, pos + 1);
    if (pos < array.size() && array[pos] == ']') {
        return elements;
    }

    while (true) {
        pos = skip_ws(array, pos);
        auto end = skip_value(array, pos);
        if (end == npos) {
            return std::nullopt;
        }
        elements.emplace_back(array.substr(pos, end - pos));

        pos = skip_ws(array, end);
        if (pos >= array.size()) {
            return std::nullopt;
        }
        if (array[pos] == ']') {
            return elements;
        }
        if (array[pos] != ',') {
            return std::nullopt;
        }
        ++pos;
    }
}

auto is_object(std::string_view text) -> bool {
    auto pos = skip_ws(text, 0);
    if (pos >= text.size() || text[pos] != '{') {
        return false;
    }
    auto end = skip_value(text, pos);
    return end != npos && skip_ws(text, end) == text.size();
}

auto is_null(std::string_view value) -> bool {
    return value == "null";
}

}  // namespace custody::upload::json_utils
