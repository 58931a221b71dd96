// =============================================================================
// FILE: include/http/stats_handler.h
// =============================================================================
#ifndef STATS_HANDLER_H
#define STATS_HANDLER_H

#include "http/http_server.h"

namespace turbo_dialer {

class DispatchLauncher;
class AnswerHandler;
class LifecycleProcessor;
class VoicemailFinisher;
class DispatchScheduler;
class StaleClaimReaper;
class TwilioProvider;
class HttpCrmGateway;
class MongoClient;
class SlowHandlerLogger;
class RepConnector;
struct Config;

// Registers the stats and config endpoints on the HTTP server.
class StatsHandler {
public:
    struct Dependencies {
        const Config*       config      = nullptr;
        HttpServer*         http        = nullptr;
        DispatchLauncher*   launcher    = nullptr;
        AnswerHandler*      answer      = nullptr;
        LifecycleProcessor* lifecycle   = nullptr;
        VoicemailFinisher*  voicemail   = nullptr;
        DispatchScheduler*  scheduler   = nullptr;
        StaleClaimReaper*   reaper      = nullptr;
        TwilioProvider*     provider    = nullptr;
        HttpCrmGateway*     crm         = nullptr;
        MongoClient*        mongo       = nullptr;
        SlowHandlerLogger*  slow_logger = nullptr;
        RepConnector*       connector   = nullptr;
    };

    static void register_routes(HttpServer& server, const Dependencies& deps);

    static HttpServer::Response handle_stats(const HttpServer::Request& req,
                                             const Dependencies& deps);
    static HttpServer::Response handle_config(const HttpServer::Request& req,
                                              const Dependencies& deps);
};

} // namespace turbo_dialer
#endif
