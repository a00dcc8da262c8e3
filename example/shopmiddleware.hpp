#pragma once

#include <string>

#include "middleware.hpp"

// Logs every matched request at debug level
MiddlewareResult requestLogger(RequestContext& ctx);

// Adds X-Response-Time (milliseconds since the middleware ran)
Middleware responseTime();

// Adds Access-Control-Allow-Origin to every response
Middleware cors(std::string origin);
