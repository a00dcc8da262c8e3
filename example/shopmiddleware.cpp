#include "shopmiddleware.hpp"

#include <chrono>

#include "log.hpp"
#include "requestcontext.hpp"

MiddlewareResult requestLogger(RequestContext& ctx)
{
    slog::debug("Request: ", toString(ctx.request.method), " ", ctx.request.url.fullRaw);
    return Continue {};
}

Middleware responseTime()
{
    return [](RequestContext&) -> MiddlewareResult {
        const auto start = std::chrono::steady_clock::now();
        return Transform([start](Response&& response) {
            const auto elapsed = std::chrono::duration<double, std::milli>(
                std::chrono::steady_clock::now() - start);
            response.headers.set("X-Response-Time", std::to_string(elapsed.count()) + "ms");
            return std::move(response);
        });
    };
}

Middleware cors(std::string origin)
{
    return [origin = std::move(origin)](RequestContext&) -> MiddlewareResult {
        return Transform([origin](Response&& response) {
            response.headers.set("Access-Control-Allow-Origin", origin);
            return std::move(response);
        });
    };
}
