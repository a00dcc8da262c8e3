#pragma once

#include <functional>
#include <memory>
#include <variant>
#include <vector>

#include "http.hpp"

struct RequestContext;

struct Responder {
    virtual ~Responder() = default;
    virtual void respond(Response&& response) = 0;
};

// A middleware either finishes the request with a Response (short-circuit), lets it continue
// untouched (Continue) or lets it continue and rewrites the eventual response (Transform).
// Transforms run after the handler has responded, last registered first.
struct Continue { };
using Transform = std::function<Response(Response&&)>;
using MiddlewareResult = std::variant<Continue, Response, Transform>;

using Middleware = std::function<MiddlewareResult(RequestContext&)>;

// A handler has to call respond exactly once, but may do so asynchronously.
// The context stays alive until the response is sent.
using Handler = std::function<void(RequestContext&, std::unique_ptr<Responder>)>;
using SyncHandler = std::function<Response(RequestContext&)>;

Handler wrapSyncHandler(SyncHandler handler);

// The flattened middleware of one (route, method): global, validation, route-specific.
// Built once at startup and never modified afterwards.
struct Pipeline {
    std::vector<Middleware> middleware;
    Handler handler;
    bool hasValidation = false;
};
