#include "log.hpp"
#include "productstore.hpp"
#include "requestcontext.hpp"
#include "routemodule.hpp"

BURGER_ROUTE_MODULE(route)
{
    auto query = objectSchema();
    query->string("search").optional().coerce();
    route.schema["get"].query = query;

    auto body = objectSchema();
    body->string("name").minLength(1, "Name is required").number("price").positive(
        "Price must be positive");
    route.schema["post"].body = body;

    route.openapi["get"]
        = OperationDoc { "List products", "Optionally filtered by name", { "products" } };
    route.openapi["post"] = OperationDoc { "Create a product", "", { "products" } };

    route.use([](RequestContext& ctx) -> MiddlewareResult {
        slog::debug("Products route: ", ctx.request.url.fullRaw);
        return Continue {};
    });

    route.handle("GET", [](RequestContext& ctx) {
        const auto search = getMember(*ctx.validated->query, "search");
        const auto products
            = ProductStore::getDefault().list(search ? search->asString() : std::string());
        return jsonResponse(toJson(products));
    });

    route.handle("POST", [](RequestContext& ctx) {
        const auto& body = *ctx.validated->body;
        const auto& product = ProductStore::getDefault().add(
            getMember(body, "name")->asString(), getMember(body, "price")->asNumber());
        return jsonResponse(product.toJson(), StatusCode::Created);
    });
}
