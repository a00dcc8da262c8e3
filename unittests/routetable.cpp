#include "test.hpp"

#include "routetable.hpp"

namespace {
Handler noopHandler()
{
    return wrapSyncHandler([](RequestContext&) { return Response("ok"); });
}

RouteDescriptor route(std::string_view pattern, std::vector<Method> methods = { Method::Get })
{
    RouteDescriptor desc;
    desc.pattern = RoutePattern::parse(pattern).value();
    desc.file = std::string(pattern);
    for (const auto method : methods) {
        desc.handlers.set(method, noopHandler());
    }
    return desc;
}

std::vector<std::string> patterns(const RouteTable& table)
{
    std::vector<std::string> ret;
    for (const auto& r : table.routes()) {
        ret.push_back(r.pattern.str());
    }
    return ret;
}
}

TEST_CASE("RouteTable sorts by specificity, then pattern")
{
    const RouteTable table({
        route("/product/:id"),
        route("/a/:x/:y"),
        route("/product/featured"),
        route("/"),
        route("/product"),
        route("/about"),
    });
    const std::vector<std::string> expected {
        "/product/featured",
        "/a/:x/:y",
        "/about",
        "/product",
        "/product/:id",
        "/",
    };
    TEST_CHECK(patterns(table) == expected);
}

TEST_CASE("RouteTable prefers static routes")
{
    const RouteTable table({ route("/product/:id"), route("/product/featured") });

    const auto featured = table.match("/product/featured", Method::Get);
    const auto match = std::get_if<RouteTable::Match>(&featured);
    TEST_REQUIRE(match);
    TEST_CHECK(match->route->pattern.str() == "/product/featured");
    TEST_CHECK(match->params.empty());

    const auto dynamic = table.match("/product/42", Method::Get);
    const auto dynMatch = std::get_if<RouteTable::Match>(&dynamic);
    TEST_REQUIRE(dynMatch);
    TEST_CHECK(dynMatch->route->pattern.str() == "/product/:id");
    TEST_CHECK(dynMatch->params.at("id") == "42");
}

TEST_CASE("RouteTable distinguishes not found and method mismatch")
{
    const RouteTable table({ route("/x", { Method::Get, Method::Post }) });

    TEST_CHECK(std::holds_alternative<RouteTable::Match>(table.match("/x", Method::Post)));
    TEST_CHECK(std::holds_alternative<RouteTable::NotFound>(table.match("/y", Method::Get)));

    const auto res = table.match("/x", Method::Delete);
    const auto mismatch = std::get_if<RouteTable::MethodMismatch>(&res);
    TEST_REQUIRE(mismatch);
    TEST_CHECK((mismatch->route->methods() == std::vector<Method> { Method::Get, Method::Post }));
}

TEST_CASE("RouteTable normalizes the request path")
{
    const RouteTable table({ route("/api/products") });
    TEST_CHECK(
        std::holds_alternative<RouteTable::Match>(table.match("/api/products/", Method::Get)));
    TEST_CHECK(
        std::holds_alternative<RouteTable::Match>(table.match("//api//products", Method::Get)));
    TEST_CHECK(std::holds_alternative<RouteTable::NotFound>(table.match("/api", Method::Get)));
}

TEST_CASE("RouteTable mismatch stops at the first matching path")
{
    // The static route shadows the dynamic one, even though only the dynamic one handles POST
    const RouteTable table({ route("/p/:id", { Method::Post }), route("/p/new") });
    const auto res = table.match("/p/new", Method::Post);
    TEST_CHECK(std::holds_alternative<RouteTable::MethodMismatch>(res));
}

TEST_CASE("RouteTable empty")
{
    const RouteTable table;
    TEST_CHECK(table.empty());
    TEST_CHECK(std::holds_alternative<RouteTable::NotFound>(table.match("/", Method::Get)));
}

TEST_CASE("RouteTable::dump")
{
    const RouteTable table({ route("/api/products", { Method::Get, Method::Post }) });
    TEST_CHECK(table.dump() == "GET,POST /api/products <- /api/products\n");
}
