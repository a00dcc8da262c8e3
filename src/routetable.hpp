#pragma once

#include <array>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "http.hpp"
#include "middleware.hpp"
#include "routemodule.hpp"
#include "routepattern.hpp"
#include "schema.hpp"

// A closed map from Method to T
template <typename T>
class MethodMap {
public:
    bool contains(Method method) const { return entries_[index(method)].has_value(); }

    const T* get(Method method) const
    {
        const auto& entry = entries_[index(method)];
        return entry ? &*entry : nullptr;
    }

    void set(Method method, T value) { entries_[index(method)] = std::move(value); }

    bool empty() const
    {
        for (const auto& entry : entries_) {
            if (entry) {
                return false;
            }
        }
        return true;
    }

    // In the order of the Method enum
    std::vector<Method> keys() const
    {
        std::vector<Method> ret;
        for (size_t i = 0; i < NumMethods; ++i) {
            if (entries_[i]) {
                ret.push_back(static_cast<Method>(i));
            }
        }
        return ret;
    }

private:
    static size_t index(Method method) { return static_cast<size_t>(method); }

    std::array<std::optional<T>, NumMethods> entries_;
};

struct RouteDescriptor {
    RoutePattern pattern;
    std::string file; // relative to the route directory
    MethodMap<Handler> handlers;
    std::vector<Middleware> middleware;
    MethodMap<MethodSchema> schema;
    MethodMap<OperationDoc> docs;

    // Methods with a handler
    std::vector<Method> methods() const;
};

// Sorted once on construction (more literal segments first, then by pattern) and immutable
// afterwards, so it may be read from any number of requests at once.
class RouteTable {
public:
    struct Match {
        const RouteDescriptor* route;
        size_t index;
        RouteParams params;
    };

    struct NotFound { };

    // The path matched, but the route has no handler for the method
    struct MethodMismatch {
        const RouteDescriptor* route;
        size_t index;
    };

    using MatchResult = std::variant<Match, NotFound, MethodMismatch>;

    RouteTable() = default;
    explicit RouteTable(std::vector<RouteDescriptor> routes);

    // Normalizes path and returns the first route in table order that matches it
    MatchResult match(std::string_view path, Method method) const;

    const std::vector<RouteDescriptor>& routes() const;
    size_t size() const;
    bool empty() const;

    // One line per route: "GET,POST /api/products <- products/route.cpp"
    std::string dump() const;

private:
    std::vector<RouteDescriptor> routes_;
};

// Specificity descending, then pattern string ascending
bool routeOrder(const RouteDescriptor& a, const RouteDescriptor& b);

std::string joinMethods(const std::vector<Method>& methods, std::string_view delim = ",");
