// =============================================================================
// FILE: include/http/health_handler.h
// =============================================================================
#ifndef HEALTH_HANDLER_H
#define HEALTH_HANDLER_H

#include "http/http_server.h"

namespace turbo_dialer {

class MongoClient;
class RepPool;
class DispatchScheduler;
class StaleClaimReaper;

// GET /health and GET /ready.
//
// /health is 503 when the rep pool store cannot be read (nothing can be
// claimed, so every answered lead would hold then go to voicemail). Missing
// telephony credentials only mark it degraded: webhooks for calls already in
// flight still land. /ready additionally round-trips to MongoDB.
class HealthHandler {
public:
    struct Dependencies {
        MongoClient*       mongo            = nullptr;
        bool               mongo_enabled    = false;
        RepPool*           reps             = nullptr;
        bool               telephony_ready  = false;
        DispatchScheduler* scheduler        = nullptr;   // null when auto dispatch is off
        StaleClaimReaper*  reaper           = nullptr;
    };

    static void register_routes(HttpServer& server, const Dependencies& deps);

    static HttpServer::Response handle_health(const HttpServer::Request& req,
                                              const Dependencies& deps);
    static HttpServer::Response handle_ready(const HttpServer::Request& req,
                                             const Dependencies& deps);
};

} // namespace turbo_dialer
#endif
