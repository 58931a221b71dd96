// =============================================================================
// FILE: include/http/turbo_api_handler.h
// =============================================================================
#ifndef TURBO_API_HANDLER_H
#define TURBO_API_HANDLER_H

#include "http/http_server.h"

namespace turbo_dialer {

class QueueStore;
class RepPool;
class CallAttemptStore;
class DispatchLauncher;
class RepConnector;

// JSON endpoints the CRM calls to feed the queue and run rep sessions.
//   POST   /turbo/queue              {org_id, added_by, priority, leads:[...]}
//   GET    /turbo/queue?org_id=
//   DELETE /turbo/queue?org_id=&lead_id=   or   ?org_id=&clear_all=true
//   POST   /turbo/session/start      {org_id, rep_id}  -> session + join_url
//   POST   /turbo/session/stop       {session_id}
//   POST   /turbo/dial?org_id=
class TurboApiHandler {
public:
    struct Dependencies {
        QueueStore*       queue    = nullptr;
        RepPool*          reps     = nullptr;
        CallAttemptStore* calls    = nullptr;
        DispatchLauncher* launcher = nullptr;
        RepConnector*     connector = nullptr;
    };

    static void register_routes(HttpServer& server, const Dependencies& deps);

    static HttpServer::Response handle_enqueue(const HttpServer::Request& req,
                                               const Dependencies& deps);
    static HttpServer::Response handle_get_queue(const HttpServer::Request& req,
                                                 const Dependencies& deps);
    static HttpServer::Response handle_delete_queue(const HttpServer::Request& req,
                                                    const Dependencies& deps);
    static HttpServer::Response handle_session_start(const HttpServer::Request& req,
                                                     const Dependencies& deps);
    static HttpServer::Response handle_session_stop(const HttpServer::Request& req,
                                                    const Dependencies& deps);
    static HttpServer::Response handle_dial(const HttpServer::Request& req,
                                            const Dependencies& deps);
};

} // namespace turbo_dialer
#endif
