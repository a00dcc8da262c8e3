#include "middleware.hpp"

Handler wrapSyncHandler(SyncHandler handler)
{
    return [handler = std::move(handler)](
               RequestContext& context, std::unique_ptr<Responder> responder) {
        responder->respond(handler(context));
    };
}
