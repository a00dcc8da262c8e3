#include "routetable.hpp"

#include <algorithm>

std::vector<Method> RouteDescriptor::methods() const
{
    return handlers.keys();
}

bool routeOrder(const RouteDescriptor& a, const RouteDescriptor& b)
{
    const auto specA = a.pattern.specificity();
    const auto specB = b.pattern.specificity();
    if (specA != specB) {
        return specA > specB;
    }
    return a.pattern.str() < b.pattern.str();
}

std::string joinMethods(const std::vector<Method>& methods, std::string_view delim)
{
    std::vector<std::string> names;
    for (const auto method : methods) {
        names.push_back(toString(method));
    }
    return join(names, delim);
}

RouteTable::RouteTable(std::vector<RouteDescriptor> routes)
    : routes_(std::move(routes))
{
    std::stable_sort(routes_.begin(), routes_.end(), routeOrder);
}

RouteTable::MatchResult RouteTable::match(std::string_view path, Method method) const
{
    const auto normalized = normalizePath(path);
    const auto segments = splitPath(normalized);
    for (size_t i = 0; i < routes_.size(); ++i) {
        const auto& route = routes_[i];
        auto params = route.pattern.match(segments);
        if (!params) {
            continue;
        }
        if (!route.handlers.contains(method)) {
            return MethodMismatch { &route, i };
        }
        return Match { &route, i, std::move(*params) };
    }
    return NotFound {};
}

const std::vector<RouteDescriptor>& RouteTable::routes() const
{
    return routes_;
}

size_t RouteTable::size() const
{
    return routes_.size();
}

bool RouteTable::empty() const
{
    return routes_.empty();
}

std::string RouteTable::dump() const
{
    std::string ret;
    for (const auto& route : routes_) {
        ret.append(joinMethods(route.methods()));
        ret.append(" ");
        ret.append(route.pattern.str());
        ret.append(" <- ");
        ret.append(route.file);
        ret.append("\n");
    }
    return ret;
}
