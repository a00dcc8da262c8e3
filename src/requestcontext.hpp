#pragma once

#include <optional>
#include <string>
#include <unordered_map>

#include "http.hpp"
#include "json.hpp"
#include "result.hpp"
#include "routepattern.hpp"

struct RouteDescriptor;

using QueryParams = std::unordered_map<std::string, std::string>;

// Parsed and coerced output of the validators declared for the request's method.
// Only the slices that had a validator are set.
struct Validated {
    std::optional<JsonValue> params;
    std::optional<JsonValue> query;
    std::optional<JsonValue> body;
};

// Everything belonging to a single request. Owned by that request's dispatch and never shared.
struct RequestContext {
    RequestContext(const Request& request, const RouteDescriptor* route, RouteParams params);

    const Request& request;
    const RouteDescriptor* route;
    RouteParams params;
    std::optional<Validated> validated;
    // cpprom::now() when the dispatcher received the request. Request metrics are measured from
    // here.
    double start = 0.0;

    const QueryParams& query();

    // The body is parsed on the first call only. Validation stores its coerced output here, so
    // a handler reading the body afterwards gets the validated value.
    Result<const JsonValue*, std::string> json();
    void setJson(JsonValue json);

private:
    std::optional<QueryParams> query_;
    std::optional<Result<JsonValue, std::string>> body_;
};
