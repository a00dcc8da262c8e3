#include "test.hpp"

#include "openapi.hpp"
#include "testutil.hpp"

namespace {
RouteDescriptor productRoute()
{
    RouteDescriptor desc;
    desc.pattern = RoutePattern::parse("/api/products/:id").value();
    desc.file = "products/[id]/route.cpp";
    const auto handler = wrapSyncHandler([](RequestContext&) { return Response("ok"); });
    desc.handlers.set(Method::Get, handler);
    desc.handlers.set(Method::Put, handler);

    auto params = objectSchema();
    params->integer("id").coerce();
    auto query = objectSchema();
    query->string("fields").optional();
    auto body = objectSchema();
    body->string("name").number("price");
    desc.schema.set(Method::Put, MethodSchema { params, query, body });
    desc.docs.set(
        Method::Get, OperationDoc { "Get product", "Fetch by id", { "products" }, "getProduct" });
    return desc;
}

RouteTable productTable()
{
    std::vector<RouteDescriptor> routes;
    routes.push_back(productRoute());
    RouteDescriptor root;
    root.pattern = RoutePattern::parse("/").value();
    root.handlers.set(Method::Get, wrapSyncHandler([](RequestContext&) { return Response("/"); }));
    routes.push_back(std::move(root));
    return RouteTable(std::move(routes));
}

const JsonValue* findParameter(const JsonValue* operation, std::string_view name)
{
    const auto params = operation ? at(*operation, "parameters") : nullptr;
    if (!params || !params->isArray()) {
        return nullptr;
    }
    for (const auto& param : params->asArray()) {
        if (isString(at(param, "name"), name)) {
            return &param;
        }
    }
    return nullptr;
}
}

TEST_CASE("OpenAPI paths use braces for parameters")
{
    TEST_CHECK(toOpenApiPath(RoutePattern::parse("/api/products/:id").value())
        == "/api/products/{id}");
    TEST_CHECK(toOpenApiPath(RoutePattern::parse("/a/:x/b/:y").value()) == "/a/{x}/b/{y}");
    TEST_CHECK(toOpenApiPath(RoutePattern::parse("/").value()) == "/");
}

TEST_CASE("OpenAPI document lists every route and method")
{
    const auto doc = generateOpenApiDocument(productTable(), OpenApiInfo {});
    TEST_CHECK(isString(at(doc, "openapi"), "3.0.0"));
    TEST_CHECK(isString(at(doc, "info", "title"), "Burger API"));
    TEST_CHECK(isString(at(doc, "info", "version"), "1.0.0"));

    const auto paths = at(doc, "paths");
    TEST_REQUIRE(paths && paths->isObject());
    TEST_CHECK(paths->asObject().size() == 2);
    TEST_CHECK(at(*paths, "/api/products/{id}", "get"));
    TEST_CHECK(at(*paths, "/api/products/{id}", "put"));
    TEST_CHECK(!at(*paths, "/api/products/{id}", "post"));
    TEST_CHECK(at(*paths, "/", "get"));
}

TEST_CASE("OpenAPI operations use the route documentation")
{
    const auto doc = generateOpenApiDocument(productTable(), OpenApiInfo {});
    const auto get = at(doc, "paths", "/api/products/{id}", "get");
    TEST_REQUIRE(get);
    TEST_CHECK(isString(at(*get, "summary"), "Get product"));
    TEST_CHECK(isString(at(*get, "description"), "Fetch by id"));
    TEST_CHECK(isString(at(*get, "tags", 0), "products"));
    TEST_CHECK(isString(at(*get, "operationId"), "getProduct"));
    TEST_CHECK(isString(at(*get, "responses", "200", "description"), "Successful response"));

    const auto put = at(doc, "paths", "/api/products/{id}", "put");
    TEST_REQUIRE(put);
    TEST_CHECK(isString(at(*put, "summary"), "Auto-generated summary for PUT /api/products/{id}"));
    TEST_CHECK(!at(*put, "operationId"));
}

TEST_CASE("OpenAPI parameters come from schemas or the pattern")
{
    const auto doc = generateOpenApiDocument(productTable(), OpenApiInfo {});

    // No params schema for GET, so the pattern parameter is documented as a string
    const auto getId = findParameter(at(doc, "paths", "/api/products/{id}", "get"), "id");
    TEST_REQUIRE(getId);
    TEST_CHECK(isString(at(*getId, "in"), "path"));
    TEST_CHECK(at(*getId, "required")->asBool());
    TEST_CHECK(isString(at(*getId, "schema", "type"), "string"));

    const auto put = at(doc, "paths", "/api/products/{id}", "put");
    const auto putId = findParameter(put, "id");
    TEST_REQUIRE(putId);
    TEST_CHECK(isString(at(*putId, "schema", "type"), "integer"));
    TEST_CHECK(at(*putId, "required")->asBool());

    const auto fields = findParameter(put, "fields");
    TEST_REQUIRE(fields);
    TEST_CHECK(isString(at(*fields, "in"), "query"));
    TEST_CHECK(!at(*fields, "required")->asBool());
}

TEST_CASE("OpenAPI request bodies come from body schemas")
{
    const auto doc = generateOpenApiDocument(productTable(), OpenApiInfo {});
    const auto put = at(doc, "paths", "/api/products/{id}", "put");
    TEST_REQUIRE(put);
    const auto body = at(*put, "requestBody");
    TEST_REQUIRE(body);
    TEST_CHECK(at(*body, "required")->asBool());
    const auto schema = at(*body, "content", "application/json", "schema");
    TEST_REQUIRE(schema);
    TEST_CHECK(isString(at(*schema, "properties", "price", "type"), "number"));

    TEST_CHECK(!at(doc, "paths", "/api/products/{id}", "get", "requestBody"));
}

TEST_CASE("DocsServer serves the document and the UI")
{
    const DocsServer docs(productTable(), OpenApiInfo { "Shop", "", "3.1.4" },
        DocsServer::Paths { "/docs", "/openapi.json" });

    const auto json = TestRequest::create("GET", "/openapi.json");
    const auto jsonResp = docs.handle(json->request);
    TEST_REQUIRE(jsonResp);
    TEST_CHECK(jsonResp->status == StatusCode::Ok);
    TEST_CHECK(jsonResp->headers.get("Content-Type") == "application/json");
    TEST_CHECK(isString(at(parseBody(*jsonResp), "info", "version"), "3.1.4"));

    const auto html = TestRequest::create("GET", "/docs/");
    const auto htmlResp = docs.handle(html->request);
    TEST_REQUIRE(htmlResp);
    TEST_CHECK(htmlResp->body.find("swagger-ui") != std::string::npos);
    TEST_CHECK(htmlResp->body.find("/openapi.json") != std::string::npos);

    TEST_CHECK(!docs.handle(TestRequest::create("POST", "/docs")->request));
    TEST_CHECK(!docs.handle(TestRequest::create("GET", "/api/products/1")->request));
}

TEST_CASE("OpenAPI documents path parameters missing from the params schema")
{
    RouteDescriptor desc;
    desc.pattern = RoutePattern::parse("/shops/:shop/items/:item").value();
    desc.handlers.set(
        Method::Get, wrapSyncHandler([](RequestContext&) { return Response("ok"); }));
    desc.handlers.set(
        Method::Put, wrapSyncHandler([](RequestContext&) { return Response("ok"); }));

    auto params = objectSchema();
    params->integer("item").coerce();
    desc.schema.set(Method::Get, MethodSchema { params, nullptr, nullptr });
    desc.schema.set(
        Method::Put, MethodSchema { std::make_shared<CountingSchema>(), nullptr, nullptr });

    std::vector<RouteDescriptor> routes;
    routes.push_back(std::move(desc));
    const auto doc = generateOpenApiDocument(RouteTable(std::move(routes)), OpenApiInfo {});

    const auto get = at(doc, "paths", "/shops/{shop}/items/{item}", "get");
    TEST_REQUIRE(get);
    const auto item = findParameter(get, "item");
    TEST_REQUIRE(item);
    TEST_CHECK(isString(at(*item, "schema", "type"), "integer"));
    const auto shop = findParameter(get, "shop");
    TEST_REQUIRE(shop);
    TEST_CHECK(isString(at(*shop, "in"), "path"));
    TEST_CHECK(at(*shop, "required")->asBool());
    TEST_CHECK(isString(at(*shop, "schema", "type"), "string"));
    TEST_CHECK(at(*get, "parameters")->asArray().size() == 2);

    // A params schema without properties still documents every path parameter
    const auto put = at(doc, "paths", "/shops/{shop}/items/{item}", "put");
    TEST_REQUIRE(put);
    for (const auto name : { "shop", "item" }) {
        const auto param = findParameter(put, name);
        TEST_REQUIRE(param);
        TEST_CHECK(at(*param, "required")->asBool());
        TEST_CHECK(isString(at(*param, "schema", "type"), "string"));
    }
}

TEST_CASE("Swagger UI page escapes the title")
{
    const auto html = swaggerHtml("<script>alert(1)</script> & \"co\"", "/openapi.json");
    TEST_CHECK(html.find("<script>alert") == std::string::npos);
    const auto title = "<title>&lt;script&gt;alert(1)&lt;/script&gt; &amp; &quot;co&quot;</title>";
    TEST_CHECK(html.find(title) != std::string::npos);
    TEST_CHECK(html.find("/openapi.json") != std::string::npos);
}
