#pragma once

#include "middleware.hpp"
#include "schema.hpp"

// Turns the validators of one method into a single middleware. Every failing slice (params,
// query, body) is collected and reported together as a 400. On success the parsed values are
// stored in RequestContext::validated and the parsed body replaces the cached body.
// If the context has already been validated, the middleware does nothing.
Middleware createValidationMiddleware(MethodSchema schema);

// {"errors": [{"field": ..., "error": ...}, ...]}
Response validationErrorResponse(JsonArray errors);
