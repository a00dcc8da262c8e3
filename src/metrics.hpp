#pragma once

#include <cpprom/cpprom.hpp>

/* https://prometheus.io/docs/practices/instrumentation/#inner-loops
 * Requests are counted when their response is sent. Routes are labeled with their pattern
 * instead of the request path to keep the cardinality bounded by the size of the route table.
 * Unmatched requests use the route label "<none>".
 */
struct Metrics {
    cpprom::MetricFamily<cpprom::Counter>& reqsTotal;
    cpprom::MetricFamily<cpprom::Histogram>& reqDuration;
    cpprom::MetricFamily<cpprom::Histogram>& respSize;

    cpprom::MetricFamily<cpprom::Counter>& validationFailures;
    cpprom::MetricFamily<cpprom::Counter>& handlerErrors;

    cpprom::MetricFamily<cpprom::Gauge>& routes;

    static Metrics& get();
};
