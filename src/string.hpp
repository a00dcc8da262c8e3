#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// NO. LOCALES.
char toLower(char c);
std::string toLower(std::string_view str);
std::string toUpper(std::string_view str);

bool ciEqual(std::string_view a, std::string_view b);

std::vector<std::string_view> split(std::string_view str, char delim);

std::string_view httpTrim(std::string_view str);

bool startsWith(std::string_view str, std::string_view start);
bool endsWith(std::string_view str, std::string_view end);

// RFC3986, 2.1. Returns nullopt for truncated or non-hex escapes.
// If plusAsSpace is true, '+' is decoded as ' ' (application/x-www-form-urlencoded).
std::optional<std::string> percentDecode(std::string_view str, bool plusAsSpace = false);

// "a=1&b=%20x" -> { a: "1", b: " x" }. Later keys overwrite earlier ones.
// Pairs that fail to decode are skipped.
std::unordered_map<std::string, std::string> parseQueryString(std::string_view query);

// Strips all leading and trailing slashes
std::string_view cleanPrefix(std::string_view prefix);

template <typename Container>
std::string join(const Container& container, std::string_view delim = ", ")
{
    std::string ret;
    bool first = true;
    for (const auto& elem : container) {
        if (!first) {
            ret.append(delim);
        }
        first = false;
        ret.append(elem);
    }
    return ret;
}
