#include "dispatcher.hpp"

#include <cassert>

#include "json.hpp"
#include "log.hpp"
#include "metrics.hpp"
#include "validation.hpp"

namespace {
constexpr std::string_view NoRoute = "<none>";
}

// Shared between the dispatch and the responder handed to the handler, so that an exception can
// still be turned into a response and the context outlives an asynchronous handler.
struct Dispatcher::PendingResponse {
    std::unique_ptr<Responder> responder;
    std::unique_ptr<RequestContext> context;
    std::vector<Transform> transforms;
    double start;
    bool sent = false;

    std::string_view routeLabel() const
    {
        return context->route ? std::string_view(context->route->pattern.str()) : NoRoute;
    }
};

class Dispatcher::HandlerResponder : public Responder {
public:
    HandlerResponder(const Dispatcher& dispatcher, std::shared_ptr<PendingResponse> pending)
        : dispatcher_(dispatcher)
        , pending_(std::move(pending))
    {
    }

    void respond(Response&& response) override
    {
        if (pending_->sent) {
            slog::error("Handler responded more than once: ",
                toString(pending_->context->request.method), " ",
                pending_->context->request.url.fullRaw);
            return;
        }

        // Last registered transform runs first
        try {
            for (auto it = pending_->transforms.rbegin(); it != pending_->transforms.rend(); ++it) {
                response = (*it)(std::move(response));
            }
        } catch (const std::exception& exc) {
            dispatcher_.fail(*pending_, exc.what());
            return;
        } catch (...) {
            dispatcher_.fail(*pending_, "Unknown exception");
            return;
        }
        dispatcher_.finish(*pending_, std::move(response));
    }

private:
    const Dispatcher& dispatcher_;
    std::shared_ptr<PendingResponse> pending_;
};

Response notFoundResponse()
{
    return jsonResponse(errorDescriptor("Route not found"), StatusCode::NotFound);
}

Response methodNotAllowedResponse(const std::vector<Method>& allowed)
{
    auto response
        = jsonResponse(errorDescriptor("Method Not Allowed"), StatusCode::MethodNotAllowed);
    response.headers.set("Allow", joinMethods(allowed, ", "));
    return response;
}

Response internalErrorResponse()
{
    return jsonResponse(errorDescriptor("Internal Server Error"), StatusCode::InternalServerError);
}

Pipeline buildPipeline(
    const RouteDescriptor& route, Method method, const std::vector<Middleware>& globalMiddleware)
{
    const auto handler = route.handlers.get(method);
    assert(handler);

    Pipeline pipeline;
    pipeline.middleware.reserve(globalMiddleware.size() + 1 + route.middleware.size());
    pipeline.middleware.insert(
        pipeline.middleware.end(), globalMiddleware.begin(), globalMiddleware.end());
    const auto schema = route.schema.get(method);
    if (schema && !schema->empty()) {
        pipeline.middleware.push_back(createValidationMiddleware(*schema));
        pipeline.hasValidation = true;
    }
    pipeline.middleware.insert(
        pipeline.middleware.end(), route.middleware.begin(), route.middleware.end());
    pipeline.handler = *handler;
    return pipeline;
}

Dispatcher::Dispatcher(RouteTable table, DispatcherConfig config)
    : table_(std::move(table))
    , config_(std::move(config))
{
    pipelines_.reserve(table_.size());
    for (const auto& route : table_.routes()) {
        auto& pipelines = pipelines_.emplace_back();
        for (const auto method : route.methods()) {
            pipelines.set(method, buildPipeline(route, method, config_.globalMiddleware));
        }
    }
    Metrics::get().routes.labels().set(static_cast<double>(table_.size()));
}

const RouteTable& Dispatcher::routeTable() const
{
    return table_;
}

const DispatcherConfig& Dispatcher::config() const
{
    return config_;
}

const Pipeline* Dispatcher::getPipeline(size_t routeIndex, Method method) const
{
    assert(routeIndex < pipelines_.size());
    return pipelines_[routeIndex].get(method);
}

void Dispatcher::operator()(const Request& request, std::unique_ptr<Responder> responder) const
{
    const auto start = cpprom::now();
    auto result = table_.match(request.url.path, request.method);

    if (std::holds_alternative<RouteTable::NotFound>(result)) {
        respond(request, NoRoute, start, *responder, notFoundResponse());
        return;
    }

    if (const auto mismatch = std::get_if<RouteTable::MethodMismatch>(&result)) {
        respond(request, mismatch->route->pattern.str(), start, *responder,
            methodNotAllowedResponse(mismatch->route->methods()));
        return;
    }

    auto& match = std::get<RouteTable::Match>(result);
    const auto pipeline = getPipeline(match.index, request.method);
    assert(pipeline);
    run(*pipeline, std::make_unique<RequestContext>(request, match.route, std::move(match.params)),
        start, std::move(responder));
}

void Dispatcher::run(const Pipeline& pipeline, std::unique_ptr<RequestContext> context,
    double start, std::unique_ptr<Responder> responder) const
{
    auto pending = std::make_shared<PendingResponse>();
    pending->responder = std::move(responder);
    pending->context = std::move(context);
    pending->context->start = start;
    pending->start = start;

    try {
        for (const auto& mw : pipeline.middleware) {
            auto result = mw(*pending->context);
            if (auto response = std::get_if<Response>(&result)) {
                // Transforms collected so far are skipped
                finish(*pending, std::move(*response));
                return;
            }
            if (auto transform = std::get_if<Transform>(&result)) {
                pending->transforms.push_back(std::move(*transform));
            }
        }
        pipeline.handler(*pending->context, std::make_unique<HandlerResponder>(*this, pending));
    } catch (const std::exception& exc) {
        fail(*pending, exc.what());
    } catch (...) {
        fail(*pending, "Unknown exception");
    }
}

void Dispatcher::finish(PendingResponse& pending, Response&& response) const
{
    pending.sent = true;
    respond(pending.context->request, pending.routeLabel(), pending.start, *pending.responder,
        std::move(response));
}

void Dispatcher::fail(PendingResponse& pending, std::string_view message) const
{
    const auto& request = pending.context->request;
    Metrics::get().handlerErrors.labels(pending.routeLabel()).inc();

    if (pending.sent) {
        slog::error("Exception after response was sent for ", toString(request.method), " ",
            request.url.fullRaw, ": ", message);
        return;
    }

    if (config_.debug) {
        slog::error("Error handling ", toString(request.method), " ", request.url.fullRaw,
            " (route ", pending.routeLabel(), "): ", message);
        JsonObject obj;
        obj.emplace("error", JsonValue(std::string("Internal Server Error")));
        obj.emplace("message", JsonValue(std::string(message)));
        obj.emplace("method", JsonValue(toString(request.method)));
        obj.emplace("url", JsonValue(request.url.fullRaw));
        obj.emplace("route", JsonValue(std::string(pending.routeLabel())));
        finish(pending, jsonResponse(JsonValue(std::move(obj)), StatusCode::InternalServerError));
    } else {
        slog::error("Error handling ", toString(request.method), " ", request.url.fullRaw);
        finish(pending, internalErrorResponse());
    }
}

void Dispatcher::respond(const Request& request, std::string_view routeLabel, double start,
    Responder& responder, Response&& response) const
{
    const auto method = toString(request.method);
    const auto status = std::to_string(static_cast<int>(response.status));
    Metrics::get().reqsTotal.labels(method, routeLabel, status).inc();
    Metrics::get().reqDuration.labels(method, routeLabel).observe(cpprom::now() - start);
    Metrics::get().respSize.labels(method, routeLabel, status).observe(response.body.size());
    if (config_.accessLog) {
        slog::info("\"", method, " ", request.url.fullRaw, "\" ", static_cast<int>(response.status),
            " ", response.body.size());
    }
    responder.respond(std::move(response));
}

CallbackResponder::CallbackResponder(Callback callback)
    : callback_(std::move(callback))
{
}

void CallbackResponder::respond(Response&& response)
{
    callback_(std::move(response));
}
