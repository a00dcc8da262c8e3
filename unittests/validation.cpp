#include "test.hpp"

#include "requestcontext.hpp"
#include "testutil.hpp"
#include "validation.hpp"

namespace {
std::shared_ptr<ObjectSchema> productSchema()
{
    auto schema = objectSchema();
    schema->string("name").minLength(1, "Name is required").number("price").positive(
        "Price must be positive");
    return schema;
}

Dispatcher productDispatcher(MethodSchema schema)
{
    RouteDescriptor desc;
    desc.pattern = RoutePattern::parse("/api/products/:id").value();
    desc.handlers.set(Method::Post, wrapSyncHandler([](RequestContext& ctx) {
        const auto body = ctx.json();
        return jsonResponse(body ? **body : JsonValue(), StatusCode::Created);
    }));
    desc.schema.set(Method::Post, std::move(schema));
    std::vector<RouteDescriptor> routes;
    routes.push_back(std::move(desc));
    return Dispatcher(RouteTable(std::move(routes)), {});
}

bool hasIssue(const JsonValue* fieldError, std::string_view path)
{
    const auto issues = fieldError ? at(*fieldError, "error", "issues") : nullptr;
    if (!issues || !issues->isArray()) {
        return false;
    }
    for (const auto& issue : issues->asArray()) {
        if (isString(at(issue, "path"), path)) {
            return true;
        }
    }
    return false;
}
}

TEST_CASE("Validation reports every missing body field")
{
    const auto dispatcher = productDispatcher(MethodSchema { nullptr, nullptr, productSchema() });
    const auto resp = fetch(dispatcher, "POST", "/api/products/1", "{}");
    TEST_REQUIRE(resp);
    TEST_CHECK(resp->status == StatusCode::BadRequest);

    const auto body = parseBody(*resp);
    const auto errors = at(body, "errors");
    TEST_REQUIRE(errors && errors->isArray());
    TEST_REQUIRE(errors->asArray().size() == 1);
    const auto bodyError = at(*errors, 0);
    TEST_CHECK(isString(at(*bodyError, "field"), "body"));
    const auto issues = at(*bodyError, "error", "issues");
    TEST_REQUIRE(issues && issues->isArray());
    TEST_CHECK(issues->asArray().size() == 2);
    TEST_CHECK(hasIssue(bodyError, "name"));
    TEST_CHECK(hasIssue(bodyError, "price"));
}

TEST_CASE("Validation rejects non-JSON bodies without throwing")
{
    const auto dispatcher = productDispatcher(MethodSchema { nullptr, nullptr, productSchema() });
    const auto resp = fetch(
        dispatcher, "POST", "/api/products/1", "{\"name\":\"x\",\"price\":1}", "text/plain");
    TEST_REQUIRE(resp);
    TEST_CHECK(resp->status == StatusCode::BadRequest);
    const auto body = parseBody(*resp);
    TEST_CHECK(isString(at(body, "errors", 0, "field"), "body"));
    TEST_CHECK(at(body, "errors", 0, "error")->isString());

    const auto noType = fetch(dispatcher, "POST", "/api/products/1", "{}", "");
    TEST_REQUIRE(noType);
    TEST_CHECK(noType->status == StatusCode::BadRequest);
}

TEST_CASE("Validation rejects malformed JSON")
{
    const auto dispatcher = productDispatcher(MethodSchema { nullptr, nullptr, productSchema() });
    const auto resp = fetch(dispatcher, "POST", "/api/products/1", "{\"name\":");
    TEST_REQUIRE(resp);
    TEST_CHECK(resp->status == StatusCode::BadRequest);
    TEST_CHECK(isString(at(parseBody(*resp), "errors", 0, "field"), "body"));
}

TEST_CASE("Validation collects failures of all slices in order")
{
    auto params = objectSchema();
    params->integer("id").coerce();
    auto query = objectSchema();
    query->boolean("draft").coerce();
    const auto dispatcher = productDispatcher(MethodSchema { params, query, productSchema() });

    const auto resp = fetch(dispatcher, "POST", "/api/products/abc?draft=maybe", "{\"price\":-1}");
    TEST_REQUIRE(resp);
    TEST_CHECK(resp->status == StatusCode::BadRequest);
    const auto body = parseBody(*resp);
    const auto errors = at(body, "errors");
    TEST_REQUIRE(errors && errors->isArray());
    TEST_REQUIRE(errors->asArray().size() == 3);
    TEST_CHECK(isString(at(*errors, 0, "field"), "params"));
    TEST_CHECK(isString(at(*errors, 1, "field"), "query"));
    TEST_CHECK(isString(at(*errors, 2, "field"), "body"));
    TEST_CHECK(hasIssue(at(*errors, 0), "id"));
    TEST_CHECK(hasIssue(at(*errors, 1), "draft"));
    TEST_CHECK(hasIssue(at(*errors, 2), "name"));
    TEST_CHECK(hasIssue(at(*errors, 2), "price"));
}

TEST_CASE("Validation passes the parsed body to the handler")
{
    auto params = objectSchema();
    params->integer("id").coerce();
    const auto dispatcher = productDispatcher(MethodSchema { params, nullptr, productSchema() });

    const auto resp = fetch(dispatcher, "POST", "/api/products/7",
        "{\"name\":\"Fries\",\"price\":3.5,\"extra\":true}", "application/json; charset=utf-8");
    TEST_REQUIRE(resp);
    TEST_CHECK(resp->status == StatusCode::Created);
    const auto body = parseBody(*resp);
    TEST_CHECK(isString(at(body, "name"), "Fries"));
    TEST_REQUIRE(at(body, "price"));
    TEST_CHECK(at(body, "price")->asNumber() == 3.5);
    // Undeclared keys are stripped by the schema, so the handler sees the validated value
    TEST_CHECK(!at(body, "extra"));
}

TEST_CASE("Validation stores coerced values")
{
    const auto req = TestRequest::create("GET", "/p/42?verbose=true");
    RequestContext ctx(req->request, nullptr, RouteParams { { "id", "42" } });

    auto params = objectSchema();
    params->integer("id").coerce();
    auto query = objectSchema();
    query->boolean("verbose").optional().coerce();
    const auto mw = createValidationMiddleware(MethodSchema { params, query, nullptr });

    const auto res = mw(ctx);
    TEST_CHECK(std::holds_alternative<Continue>(res));
    TEST_REQUIRE(ctx.validated);
    TEST_REQUIRE(ctx.validated->params);
    TEST_CHECK(at(*ctx.validated->params, "id")->asNumber() == 42.0);
    TEST_REQUIRE(ctx.validated->query);
    TEST_CHECK(at(*ctx.validated->query, "verbose")->asBool());
    TEST_CHECK(!ctx.validated->body);
}

TEST_CASE("Validation is skipped for validated contexts")
{
    const auto req = TestRequest::create("POST", "/p", "not json", "text/plain");
    RequestContext ctx(req->request, nullptr, {});
    ctx.validated = Validated {};

    auto counting = std::make_shared<CountingSchema>();
    const auto mw = createValidationMiddleware(MethodSchema { counting, counting, counting });
    TEST_CHECK(std::holds_alternative<Continue>(mw(ctx)));
    TEST_CHECK(counting->calls == 0);
}

TEST_CASE("RequestContext caches the parsed body")
{
    const auto req = TestRequest::create("POST", "/p", "{\"a\":1}");
    RequestContext ctx(req->request, nullptr, {});
    const auto first = ctx.json();
    TEST_REQUIRE(first);
    const auto second = ctx.json();
    TEST_REQUIRE(second);
    TEST_CHECK(*first == *second);

    JsonObject obj;
    obj.emplace("b", JsonValue(2.0));
    ctx.setJson(JsonValue(std::move(obj)));
    const auto replaced = ctx.json();
    TEST_REQUIRE(replaced);
    TEST_CHECK(at(**replaced, "b"));
    TEST_CHECK(!at(**replaced, "a"));
}

TEST_CASE("RequestContext reports invalid JSON")
{
    const auto req = TestRequest::create("POST", "/p", "{");
    RequestContext ctx(req->request, nullptr, {});
    const auto json = ctx.json();
    TEST_CHECK(!json);
    TEST_CHECK(!json.error().empty());
}

TEST_CASE("RequestContext parses the query")
{
    const auto req = TestRequest::create("GET", "/p?search=cheese%20burger&page=2");
    RequestContext ctx(req->request, nullptr, {});
    TEST_CHECK(ctx.query().at("search") == "cheese burger");
    TEST_CHECK(ctx.query().at("page") == "2");
}
