#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

using RouteParams = std::unordered_map<std::string, std::string>;

struct RouteSegment {
    enum class Type {
        Literal,
        Param,
    };

    Type type;
    std::string str; // the literal text or the parameter name

    bool operator==(const RouteSegment& other) const;
};

class RoutePattern {
public:
    RoutePattern() = default;
    RoutePattern(std::vector<RouteSegment> segments);

    // "/api/product/:id". Empty segments are dropped, so "" and "/" are the root.
    static std::optional<RoutePattern> parse(std::string_view str);

    const std::vector<RouteSegment>& segments() const;

    // Number of literal segments
    size_t specificity() const;

    // The rendered pattern, e.g. "/api/product/:id"
    const std::string& str() const;

    // The rendered pattern with every parameter name replaced by ":", so patterns that differ
    // only in their parameter names compare equal.
    std::string shape() const;

    // Matches already split request path segments. Parameter values are percent-decoded.
    // A malformed escape in a parameter segment makes the pattern not match.
    std::optional<RouteParams> match(const std::vector<std::string_view>& requestSegments) const;

    bool operator==(const RoutePattern& other) const;

private:
    std::vector<RouteSegment> segments_;
    std::string str_ = "/";
};

// Collapses duplicate slashes and strips a trailing slash (except for the root)
std::string normalizePath(std::string_view path);

// Segments of a normalized path, "/" has no segments
std::vector<std::string_view> splitPath(std::string_view normalizedPath);
