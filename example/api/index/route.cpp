#include "requestcontext.hpp"
#include "routemodule.hpp"

BURGER_ROUTE_MODULE(route)
{
    route.openapi["get"] = OperationDoc { "Service status" };

    route.handleAsync("GET", [](RequestContext&, std::unique_ptr<Responder> responder) {
        JsonObject status;
        status.emplace("service", JsonValue(std::string("burger-shop")));
        status.emplace("status", JsonValue(std::string("ok")));
        responder->respond(jsonResponse(JsonValue(std::move(status))));
    });
}
