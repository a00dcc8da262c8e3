#include "productstore.hpp"
#include "requestcontext.hpp"
#include "routemodule.hpp"

// Takes precedence over products/[id]
BURGER_ROUTE_MODULE(route)
{
    route.openapi["get"] = OperationDoc { "List featured products", "", { "products" } };

    route.handle("GET", [](RequestContext&) {
        return jsonResponse(toJson(ProductStore::getDefault().featured()));
    });
}
