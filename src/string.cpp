#include "string.hpp"

#include <array>
#include <cassert>
#include <cstdint>

constexpr std::array<char, 256> getToLowerTable()
{
    std::array<char, 256> table = {};
    for (size_t i = 0; i < 256; ++i) {
        table[i] = static_cast<char>(static_cast<uint8_t>(i));
        if (i >= 'A' && i <= 'Z') {
            table[i] -= 'A' - 'a';
        }
    }
    return table;
}

char toLower(char c)
{
    static auto table = getToLowerTable();
    return table[static_cast<uint8_t>(c)];
}

std::string toLower(std::string_view str)
{
    std::string ret(str);
    for (auto& c : ret) {
        c = toLower(c);
    }
    return ret;
}

std::string toUpper(std::string_view str)
{
    std::string ret(str);
    for (auto& c : ret) {
        if (c >= 'a' && c <= 'z') {
            c = static_cast<char>(c - ('a' - 'A'));
        }
    }
    return ret;
}

bool ciEqual(std::string_view a, std::string_view b)
{
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (toLower(a[i]) != toLower(b[i])) {
            return false;
        }
    }
    return true;
}

namespace {
bool isHttpWhitespace(char c)
{
    return c == ' ' || c == '\t';
}

bool isHexDigit(char c)
{
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}
}

std::vector<std::string_view> split(std::string_view str, char delim)
{
    std::vector<std::string_view> parts;
    size_t i = 0;
    while (i < str.size()) {
        const auto delimPos = str.find(delim, i);
        if (delimPos == std::string_view::npos) {
            break;
        }
        parts.push_back(str.substr(i, delimPos - i));
        i = delimPos + 1;
    }
    parts.push_back(str.substr(i));
    return parts;
}

std::string_view httpTrim(std::string_view str)
{
    if (str.empty()) {
        return str;
    }

    size_t start = 0;
    while (start < str.size() && isHttpWhitespace(str[start])) {
        start++;
    }
    if (start == str.size()) {
        return str.substr(start, 0);
    }
    assert(start < str.size());

    auto end = str.size() - 1;
    while (end > start && isHttpWhitespace(str[end])) {
        end--;
    }

    return str.substr(start, end + 1 - start);
}

bool startsWith(std::string_view str, std::string_view start)
{
    return str.substr(0, start.size()) == start;
}

bool endsWith(std::string_view str, std::string_view end)
{
    return str.size() >= end.size() && str.substr(str.size() - end.size()) == end;
}

namespace {
uint8_t hexValue(char c)
{
    if (c >= '0' && c <= '9') {
        return static_cast<uint8_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
        return static_cast<uint8_t>(c - 'a' + 10);
    }
    assert(c >= 'A' && c <= 'F');
    return static_cast<uint8_t>(c - 'A' + 10);
}
}

std::optional<std::string> percentDecode(std::string_view str, bool plusAsSpace)
{
    std::string ret;
    ret.reserve(str.size());
    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%') {
            if (i + 2 >= str.size()) {
                return std::nullopt;
            }
            if (!isHexDigit(str[i + 1]) || !isHexDigit(str[i + 2])) {
                return std::nullopt;
            }
            ret.push_back(static_cast<char>((hexValue(str[i + 1]) << 4) | hexValue(str[i + 2])));
            i += 2;
        } else if (plusAsSpace && str[i] == '+') {
            ret.push_back(' ');
        } else {
            ret.push_back(str[i]);
        }
    }
    return ret;
}

std::unordered_map<std::string, std::string> parseQueryString(std::string_view query)
{
    std::unordered_map<std::string, std::string> ret;
    if (query.empty()) {
        return ret;
    }
    for (const auto pair : split(query, '&')) {
        if (pair.empty()) {
            continue;
        }
        const auto eq = pair.find('=');
        const auto key = percentDecode(pair.substr(0, eq), true);
        const auto value = eq == std::string_view::npos
            ? std::optional<std::string>(std::string())
            : percentDecode(pair.substr(eq + 1), true);
        if (!key || !value) {
            continue;
        }
        ret[*key] = *value;
    }
    return ret;
}

std::string_view cleanPrefix(std::string_view prefix)
{
    while (!prefix.empty() && prefix.front() == '/') {
        prefix.remove_prefix(1);
    }
    while (!prefix.empty() && prefix.back() == '/') {
        prefix.remove_suffix(1);
    }
    return prefix;
}
