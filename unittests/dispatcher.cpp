#include "test.hpp"

#include <stdexcept>

#include <cpprom/cpprom.hpp>

#include "requestcontext.hpp"
#include "testutil.hpp"
#include "validation.hpp"

namespace {
RouteDescriptor route(std::string_view pattern)
{
    RouteDescriptor desc;
    desc.pattern = RoutePattern::parse(pattern).value();
    desc.file = std::string(pattern);
    return desc;
}

void onGet(RouteDescriptor& desc, SyncHandler handler)
{
    desc.handlers.set(Method::Get, wrapSyncHandler(std::move(handler)));
}

RouteTable table(RouteDescriptor desc)
{
    std::vector<RouteDescriptor> routes;
    routes.push_back(std::move(desc));
    return RouteTable(std::move(routes));
}

// Appends the given marker to a header, so the order of transforms is visible
Middleware appendTransform(std::string marker)
{
    return [marker](RequestContext&) -> MiddlewareResult {
        return Transform([marker](Response&& resp) {
            const auto current = resp.headers.get("X-Trace").value_or("");
            resp.headers.set("X-Trace", std::string(current) + marker);
            return std::move(resp);
        });
    };
}
}

TEST_CASE("Dispatcher returns 404 and 405")
{
    auto x = route("/x");
    onGet(x, [](RequestContext&) { return Response("x"); });
    const Dispatcher dispatcher(table(std::move(x)), {});

    const auto ok = fetch(dispatcher, "GET", "/x");
    TEST_REQUIRE(ok);
    TEST_CHECK(ok->status == StatusCode::Ok);
    TEST_CHECK(ok->body == "x");

    const auto notAllowed = fetch(dispatcher, "DELETE", "/x");
    TEST_REQUIRE(notAllowed);
    TEST_CHECK(notAllowed->status == StatusCode::MethodNotAllowed);
    TEST_CHECK(notAllowed->headers.get("Allow") == "GET");
    TEST_CHECK(isString(at(parseBody(*notAllowed), "error"), "Method Not Allowed"));

    const auto notFound = fetch(dispatcher, "GET", "/y");
    TEST_REQUIRE(notFound);
    TEST_CHECK(notFound->status == StatusCode::NotFound);
    TEST_CHECK(isString(at(parseBody(*notFound), "error"), "Route not found"));
    TEST_CHECK(notFound->headers.get("Content-Type") == "application/json");
}

TEST_CASE("Dispatcher passes parameters to the handler")
{
    auto product = route("/api/product/:id");
    onGet(product, [](RequestContext& ctx) { return Response(ctx.params.at("id")); });
    const Dispatcher dispatcher(table(std::move(product)), {});

    const auto resp = fetch(dispatcher, "GET", "/api/product/42");
    TEST_REQUIRE(resp);
    TEST_CHECK(resp->body == "42");

    const auto encoded = fetch(dispatcher, "GET", "/api/product/a%20b?x=1");
    TEST_REQUIRE(encoded);
    TEST_CHECK(encoded->body == "a b");
}

TEST_CASE("Short-circuit skips route middleware and handler")
{
    size_t handlerCalls = 0;
    size_t routeMiddlewareCalls = 0;

    auto x = route("/x");
    onGet(x, [&handlerCalls](RequestContext&) {
        handlerCalls++;
        return Response("handler");
    });
    x.middleware.push_back([&routeMiddlewareCalls](RequestContext&) -> MiddlewareResult {
        routeMiddlewareCalls++;
        return Continue {};
    });

    DispatcherConfig config;
    config.globalMiddleware.push_back(appendTransform("a"));
    config.globalMiddleware.push_back([](RequestContext&) -> MiddlewareResult {
        return Response(StatusCode::Unauthorized, "denied");
    });
    const Dispatcher dispatcher(table(std::move(x)), std::move(config));

    const auto resp = fetch(dispatcher, "GET", "/x");
    TEST_REQUIRE(resp);
    TEST_CHECK(resp->status == StatusCode::Unauthorized);
    TEST_CHECK(resp->body == "denied");
    TEST_CHECK(handlerCalls == 0);
    TEST_CHECK(routeMiddlewareCalls == 0);
    // Transforms collected before the short-circuit do not run
    TEST_CHECK(!resp->headers.contains("X-Trace"));
}

TEST_CASE("Transforms run in reverse order after the handler")
{
    std::string order;
    auto x = route("/x");
    onGet(x, [&order](RequestContext&) {
        order += "h";
        return Response("body");
    });
    x.middleware.push_back(appendTransform("3"));

    DispatcherConfig config;
    config.globalMiddleware.push_back(appendTransform("1"));
    config.globalMiddleware.push_back([&order](RequestContext&) -> MiddlewareResult {
        order += "c";
        return Continue {};
    });
    config.globalMiddleware.push_back(appendTransform("2"));
    const Dispatcher dispatcher(table(std::move(x)), std::move(config));

    const auto resp = fetch(dispatcher, "GET", "/x");
    TEST_REQUIRE(resp);
    TEST_CHECK(order == "ch");
    // Last registered runs first, so the first global transform gets the final say
    TEST_CHECK(resp->headers.get("X-Trace") == "321");
    TEST_CHECK(resp->body == "body");
}

TEST_CASE("Transforms can replace the response")
{
    auto x = route("/x");
    onGet(x, [](RequestContext&) { return Response("original"); });
    x.middleware.push_back([](RequestContext&) -> MiddlewareResult {
        return Transform([](Response&&) { return Response(StatusCode::Accepted, "replaced"); });
    });
    const Dispatcher dispatcher(table(std::move(x)), {});

    const auto resp = fetch(dispatcher, "GET", "/x");
    TEST_REQUIRE(resp);
    TEST_CHECK(resp->status == StatusCode::Accepted);
    TEST_CHECK(resp->body == "replaced");
}

TEST_CASE("Exceptions become 500 responses")
{
    auto x = route("/x");
    onGet(x, [](RequestContext&) -> Response { throw std::runtime_error("boom"); });
    const Dispatcher dispatcher(table(std::move(x)), {});

    const auto resp = fetch(dispatcher, "GET", "/x");
    TEST_REQUIRE(resp);
    TEST_CHECK(resp->status == StatusCode::InternalServerError);
    const auto body = parseBody(*resp);
    TEST_CHECK(isString(at(body, "error"), "Internal Server Error"));
    TEST_CHECK(!at(body, "message"));
}

TEST_CASE("Exceptions include details in debug mode")
{
    auto x = route("/x/:id");
    x.middleware.push_back([](RequestContext&) -> MiddlewareResult { throw 42; });
    onGet(x, [](RequestContext&) { return Response("unreachable"); });
    DispatcherConfig config;
    config.debug = true;
    const Dispatcher dispatcher(table(std::move(x)), std::move(config));

    const auto resp = fetch(dispatcher, "GET", "/x/1?q=2");
    TEST_REQUIRE(resp);
    TEST_CHECK(resp->status == StatusCode::InternalServerError);
    const auto body = parseBody(*resp);
    TEST_CHECK(isString(at(body, "error"), "Internal Server Error"));
    TEST_CHECK(isString(at(body, "message"), "Unknown exception"));
    TEST_CHECK(isString(at(body, "method"), "GET"));
    TEST_CHECK(isString(at(body, "url"), "/x/1?q=2"));
    TEST_CHECK(isString(at(body, "route"), "/x/:id"));
}

TEST_CASE("Exceptions in transforms become 500 responses")
{
    auto x = route("/x");
    onGet(x, [](RequestContext&) { return Response("ok"); });
    x.middleware.push_back([](RequestContext&) -> MiddlewareResult {
        return Transform([](Response&&) -> Response { throw std::logic_error("transform"); });
    });
    DispatcherConfig config;
    config.debug = true;
    const Dispatcher dispatcher(table(std::move(x)), std::move(config));

    const auto resp = fetch(dispatcher, "GET", "/x");
    TEST_REQUIRE(resp);
    TEST_CHECK(resp->status == StatusCode::InternalServerError);
    TEST_CHECK(isString(at(parseBody(*resp), "message"), "transform"));
}

TEST_CASE("Exceptions after responding do not send a second response")
{
    auto x = route("/x");
    x.handlers.set(Method::Get, [](RequestContext&, std::unique_ptr<Responder> responder) {
        responder->respond(Response("first"));
        throw std::runtime_error("late");
    });
    const Dispatcher dispatcher(table(std::move(x)), {});

    const auto req = TestRequest::create("GET", "/x");
    size_t responses = 0;
    std::string body;
    dispatcher(req->request, std::make_unique<CallbackResponder>([&](Response&& resp) {
        responses++;
        body = resp.body;
    }));
    TEST_CHECK(responses == 1);
    TEST_CHECK(body == "first");
}

TEST_CASE("Asynchronous handlers keep the context alive")
{
    std::unique_ptr<Responder> pending;
    RequestContext* pendingContext = nullptr;

    auto x = route("/x/:id");
    x.middleware.push_back(appendTransform("t"));
    x.handlers.set(Method::Get,
        [&](RequestContext& ctx, std::unique_ptr<Responder> responder) {
            pendingContext = &ctx;
            pending = std::move(responder);
        });
    const Dispatcher dispatcher(table(std::move(x)), {});

    const auto req = TestRequest::create("GET", "/x/7");
    std::optional<Response> result;
    dispatcher(req->request,
        std::make_unique<CallbackResponder>([&](Response&& resp) { result = std::move(resp); }));
    TEST_CHECK(!result);
    TEST_REQUIRE(pending);
    TEST_REQUIRE(pendingContext);

    pending->respond(Response(pendingContext->params.at("id")));
    TEST_REQUIRE(result);
    TEST_CHECK(result->body == "7");
    TEST_CHECK(result->headers.get("X-Trace") == "t");
}

TEST_CASE("Pipeline is global, validation, route middleware")
{
    auto x = route("/x");
    onGet(x, [](RequestContext&) { return Response("ok"); });
    x.middleware.push_back([](RequestContext&) -> MiddlewareResult { return Continue {}; });
    x.schema.set(
        Method::Get, MethodSchema { nullptr, std::make_shared<CountingSchema>(), nullptr });
    x.handlers.set(Method::Post, wrapSyncHandler([](RequestContext&) { return Response("p"); }));

    DispatcherConfig config;
    config.globalMiddleware.push_back(appendTransform("a"));
    config.globalMiddleware.push_back(appendTransform("b"));
    const Dispatcher dispatcher(table(std::move(x)), std::move(config));

    const auto withSchema = dispatcher.getPipeline(0, Method::Get);
    TEST_REQUIRE(withSchema);
    TEST_CHECK(withSchema->middleware.size() == 2 + 1 + 1);
    TEST_CHECK(withSchema->hasValidation);

    const auto withoutSchema = dispatcher.getPipeline(0, Method::Post);
    TEST_REQUIRE(withoutSchema);
    TEST_CHECK(withoutSchema->middleware.size() == 2 + 1);
    TEST_CHECK(!withoutSchema->hasValidation);

    TEST_CHECK(!dispatcher.getPipeline(0, Method::Put));
}

TEST_CASE("Validation runs before route middleware")
{
    size_t routeMiddlewareCalls = 0;
    auto x = route("/x");
    onGet(x, [](RequestContext&) { return Response("ok"); });
    x.middleware.push_back([&routeMiddlewareCalls](RequestContext& ctx) -> MiddlewareResult {
        routeMiddlewareCalls++;
        return ctx.validated ? MiddlewareResult(Continue {})
                             : MiddlewareResult(Response(StatusCode::Conflict));
    });
    auto query = objectSchema();
    query->integer("page").coerce();
    x.schema.set(Method::Get, MethodSchema { nullptr, query, nullptr });
    const Dispatcher dispatcher(table(std::move(x)), {});

    const auto ok = fetch(dispatcher, "GET", "/x?page=2");
    TEST_REQUIRE(ok);
    TEST_CHECK(ok->status == StatusCode::Ok);
    TEST_CHECK(routeMiddlewareCalls == 1);

    const auto invalid = fetch(dispatcher, "GET", "/x?page=two");
    TEST_REQUIRE(invalid);
    TEST_CHECK(invalid->status == StatusCode::BadRequest);
    TEST_CHECK(routeMiddlewareCalls == 1);
}

TEST_CASE("Re-running a validated request does not validate again")
{
    auto counting = std::make_shared<CountingSchema>();
    auto x = route("/x/:id");
    onGet(x, [](RequestContext& ctx) { return Response(ctx.validated ? "validated" : "raw"); });
    x.schema.set(Method::Get, MethodSchema { counting, counting, nullptr });
    const Dispatcher dispatcher(table(std::move(x)), {});

    const auto first = fetch(dispatcher, "GET", "/x/1");
    TEST_REQUIRE(first);
    TEST_CHECK(first->body == "validated");
    TEST_CHECK(counting->calls == 2);

    const auto req = TestRequest::create("GET", "/x/1");
    auto ctx = std::make_unique<RequestContext>(
        req->request, &dispatcher.routeTable().routes()[0], RouteParams { { "id", "1" } });
    ctx->validated = Validated {};
    std::optional<Response> second;
    dispatcher.run(*dispatcher.getPipeline(0, Method::Get), std::move(ctx), cpprom::now(),
        std::make_unique<CallbackResponder>([&](Response&& resp) { second = std::move(resp); }));
    TEST_REQUIRE(second);
    TEST_CHECK(second->body == "validated");
    TEST_CHECK(counting->calls == 2);
}

TEST_CASE("Requests are timed from when the dispatcher received them")
{
    double seenStart = -1.0;
    double seenNow = -1.0;
    auto x = route("/x");
    onGet(x, [](RequestContext&) { return Response("x"); });
    DispatcherConfig config;
    config.globalMiddleware.push_back([&](RequestContext& ctx) -> MiddlewareResult {
        seenStart = ctx.start;
        seenNow = cpprom::now();
        return Continue {};
    });
    const Dispatcher dispatcher(table(std::move(x)), std::move(config));

    const auto before = cpprom::now();
    TEST_REQUIRE(fetch(dispatcher, "GET", "/x"));
    TEST_CHECK(seenStart >= before);
    TEST_CHECK(seenStart <= seenNow);

    const auto req = TestRequest::create("GET", "/x");
    auto ctx = std::make_unique<RequestContext>(
        req->request, &dispatcher.routeTable().routes()[0], RouteParams {});
    std::optional<Response> resp;
    dispatcher.run(*dispatcher.getPipeline(0, Method::Get), std::move(ctx), 12.5,
        std::make_unique<CallbackResponder>([&](Response&& r) { resp = std::move(r); }));
    TEST_REQUIRE(resp);
    TEST_CHECK(seenStart == 12.5);
}

TEST_CASE("Dispatcher serves an empty table")
{
    const Dispatcher dispatcher(RouteTable(), {});
    const auto resp = fetch(dispatcher, "GET", "/api");
    TEST_REQUIRE(resp);
    TEST_CHECK(resp->status == StatusCode::NotFound);
}
