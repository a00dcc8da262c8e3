#include "requestcontext.hpp"

#include "string.hpp"

RequestContext::RequestContext(
    const Request& request, const RouteDescriptor* route, RouteParams params)
    : request(request)
    , route(route)
    , params(std::move(params))
{
}

const QueryParams& RequestContext::query()
{
    if (!query_) {
        query_ = parseQueryString(request.url.query);
    }
    return *query_;
}

Result<const JsonValue*, std::string> RequestContext::json()
{
    if (!body_) {
        body_.emplace(parseJson(request.body));
    }
    if (!*body_) {
        return error(body_->error());
    }
    return &body_->value();
}

void RequestContext::setJson(JsonValue json)
{
    body_.emplace(std::move(json));
}
