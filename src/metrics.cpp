#include "metrics.hpp"

Metrics& Metrics::get()
{
    static auto& reg = cpprom::Registry::getDefault();
    static auto durationBuckets = cpprom::Histogram::defaultBuckets();
    static auto sizeBuckets = cpprom::Histogram::exponentialBuckets(64.0, 4.0, 7);
    static Metrics metrics {
        reg.counter("burger_requests_total", { "method", "route", "status" },
            "Number of dispatched requests"),
        reg.histogram("burger_request_duration_seconds", { "method", "route" }, durationBuckets,
            "Time from dispatch until the response was sent"),
        reg.histogram("burger_response_size_bytes", { "method", "route", "status" }, sizeBuckets,
            "Response body size in bytes"),

        reg.counter("burger_validation_failures_total", { "route", "field" },
            "Number of failed request validations per field"),
        reg.counter("burger_handler_errors_total", { "route" },
            "Number of exceptions caught from middleware or handlers"),

        reg.gauge("burger_routes", {}, "Number of routes in the compiled route table"),
    };
    return metrics;
}
