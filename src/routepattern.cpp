#include "routepattern.hpp"

#include <cassert>

#include "string.hpp"

bool RouteSegment::operator==(const RouteSegment& other) const
{
    return type == other.type && str == other.str;
}

RoutePattern::RoutePattern(std::vector<RouteSegment> segments)
    : segments_(std::move(segments))
{
    str_.clear();
    for (const auto& segment : segments_) {
        str_.push_back('/');
        if (segment.type == RouteSegment::Type::Param) {
            str_.push_back(':');
        }
        str_.append(segment.str);
    }
    if (str_.empty()) {
        str_ = "/";
    }
}

std::optional<RoutePattern> RoutePattern::parse(std::string_view str)
{
    std::vector<RouteSegment> segments;
    for (const auto part : split(str, '/')) {
        if (part.empty()) {
            continue;
        }
        if (part[0] == ':') {
            if (part.size() == 1) {
                return std::nullopt;
            }
            segments.push_back(
                RouteSegment { RouteSegment::Type::Param, std::string(part.substr(1)) });
        } else {
            segments.push_back(RouteSegment { RouteSegment::Type::Literal, std::string(part) });
        }
    }
    return RoutePattern(std::move(segments));
}

const std::vector<RouteSegment>& RoutePattern::segments() const
{
    return segments_;
}

size_t RoutePattern::specificity() const
{
    size_t n = 0;
    for (const auto& segment : segments_) {
        if (segment.type == RouteSegment::Type::Literal) {
            n++;
        }
    }
    return n;
}

const std::string& RoutePattern::str() const
{
    return str_;
}

std::string RoutePattern::shape() const
{
    std::string ret;
    for (const auto& segment : segments_) {
        ret.push_back('/');
        if (segment.type == RouteSegment::Type::Param) {
            ret.push_back(':');
        } else {
            ret.append(segment.str);
        }
    }
    return ret.empty() ? "/" : ret;
}

std::optional<RouteParams> RoutePattern::match(
    const std::vector<std::string_view>& requestSegments) const
{
    // No catch-all segments, so the segment counts have to agree
    if (requestSegments.size() != segments_.size()) {
        return std::nullopt;
    }

    RouteParams params;
    for (size_t i = 0; i < segments_.size(); ++i) {
        const auto& segment = segments_[i];
        if (segment.type == RouteSegment::Type::Literal) {
            if (segment.str != requestSegments[i]) {
                return std::nullopt;
            }
        } else {
            assert(segment.type == RouteSegment::Type::Param);
            auto value = percentDecode(requestSegments[i]);
            if (!value) {
                return std::nullopt;
            }
            params.emplace(segment.str, std::move(*value));
        }
    }
    return params;
}

bool RoutePattern::operator==(const RoutePattern& other) const
{
    return segments_ == other.segments_;
}

std::string normalizePath(std::string_view path)
{
    std::string ret;
    ret.reserve(path.size() + 1);
    for (const auto c : path) {
        if (c == '/' && !ret.empty() && ret.back() == '/') {
            continue;
        }
        ret.push_back(c);
    }
    if (ret.empty() || ret[0] != '/') {
        ret.insert(ret.begin(), '/');
    }
    if (ret.size() > 1 && ret.back() == '/') {
        ret.pop_back();
    }
    return ret;
}

std::vector<std::string_view> splitPath(std::string_view normalizedPath)
{
    std::vector<std::string_view> segments;
    for (const auto part : split(normalizedPath, '/')) {
        if (!part.empty()) {
            segments.push_back(part);
        }
    }
    return segments;
}
