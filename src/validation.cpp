#include "validation.hpp"

#include "log.hpp"
#include "metrics.hpp"
#include "requestcontext.hpp"
#include "routetable.hpp"

namespace {
JsonValue fieldError(std::string field, JsonValue detail)
{
    JsonObject obj;
    obj.emplace("field", JsonValue(std::move(field)));
    obj.emplace("error", std::move(detail));
    return JsonValue(std::move(obj));
}

JsonValue toJson(const std::unordered_map<std::string, std::string>& map)
{
    JsonObject obj;
    for (const auto& [key, value] : map) {
        obj.emplace(key, JsonValue(value));
    }
    return JsonValue(std::move(obj));
}

std::string_view routeLabel(const RequestContext& context)
{
    return context.route ? std::string_view(context.route->pattern.str()) : std::string_view();
}
}

Response validationErrorResponse(JsonArray errors)
{
    JsonObject obj;
    obj.emplace("errors", JsonValue(std::move(errors)));
    return jsonResponse(JsonValue(std::move(obj)), StatusCode::BadRequest);
}

Middleware createValidationMiddleware(MethodSchema schema)
{
    return [schema = std::move(schema)](RequestContext& context) -> MiddlewareResult {
        if (context.validated) {
            return Continue {};
        }

        JsonArray errors;
        Validated validated;

        const auto fail = [&](std::string field, JsonValue detail) {
            Metrics::get().validationFailures.labels(routeLabel(context), field).inc();
            errors.push_back(fieldError(std::move(field), std::move(detail)));
        };

        if (schema.params) {
            auto res = schema.params->parse(toJson(context.params));
            if (res) {
                validated.params = std::move(*res);
            } else {
                fail("params", res.error().detail);
            }
        }

        if (schema.query) {
            auto res = schema.query->parse(toJson(context.query()));
            if (res) {
                validated.query = std::move(*res);
            } else {
                fail("query", res.error().detail);
            }
        }

        if (schema.body) {
            const auto contentType = context.request.headers.get("Content-Type");
            if (!contentType || !isJsonContentType(*contentType)) {
                fail("body",
                    JsonValue(std::string("Content-Type must be application/json, got '")
                        + std::string(contentType.value_or("")) + "'"));
            } else if (const auto body = context.json(); !body) {
                fail("body", JsonValue("Invalid JSON: " + body.error()));
            } else {
                auto res = schema.body->parse(**body);
                if (res) {
                    validated.body = std::move(*res);
                } else {
                    fail("body", res.error().detail);
                }
            }
        }

        if (!errors.empty()) {
            slog::debug("Validation failed for ", toString(context.request.method), " ",
                context.request.url.path, " (", errors.size(), " field(s))");
            return validationErrorResponse(std::move(errors));
        }

        if (validated.body) {
            context.setJson(*validated.body);
        }
        context.validated = std::move(validated);
        return Continue {};
    };
}
