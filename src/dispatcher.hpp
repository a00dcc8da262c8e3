#pragma once

#include <memory>
#include <string>
#include <vector>

#include "middleware.hpp"
#include "requestcontext.hpp"
#include "routetable.hpp"

struct DispatcherConfig {
    // Run before the validation and route middleware of every route, in this order
    std::vector<Middleware> globalMiddleware;
    // Adds the exception message and request information to 500 responses
    bool debug = false;
    bool accessLog = false;
};

class Dispatcher {
public:
    Dispatcher(RouteTable table, DispatcherConfig config);

    // The request has to stay alive until the responder was called
    void operator()(const Request& request, std::unique_ptr<Responder> responder) const;

    // Runs the pipeline of an already matched request. start is the cpprom::now() value taken
    // when the request was received.
    void run(const Pipeline& pipeline, std::unique_ptr<RequestContext> context, double start,
        std::unique_ptr<Responder> responder) const;

    const RouteTable& routeTable() const;
    const DispatcherConfig& config() const;

    // nullptr if the route has no handler for method
    const Pipeline* getPipeline(size_t routeIndex, Method method) const;

private:
    struct PendingResponse;
    class HandlerResponder;

    void finish(PendingResponse& pending, Response&& response) const;
    void fail(PendingResponse& pending, std::string_view message) const;
    void respond(const Request& request, std::string_view routeLabel, double start,
        Responder& responder, Response&& response) const;

    RouteTable table_;
    DispatcherConfig config_;
    // Index is the same as in the route table
    std::vector<MethodMap<Pipeline>> pipelines_;
};

Pipeline buildPipeline(const RouteDescriptor& route, Method method,
    const std::vector<Middleware>& globalMiddleware);

Response notFoundResponse();
Response methodNotAllowedResponse(const std::vector<Method>& allowed);
Response internalErrorResponse();

// Calls a function with the response
class CallbackResponder : public Responder {
public:
    using Callback = std::function<void(Response&&)>;

    CallbackResponder(Callback callback);

    void respond(Response&& response) override;

private:
    Callback callback_;
};
