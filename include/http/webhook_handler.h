// =============================================================================
// FILE: include/http/webhook_handler.h
// =============================================================================
#ifndef WEBHOOK_HANDLER_H
#define WEBHOOK_HANDLER_H

#include "http/http_server.h"

namespace turbo_dialer {

class AnswerHandler;
class LifecycleProcessor;
class VoicemailFinisher;
class SlowHandlerLogger;
class RepConnector;

// Registers the voice provider callbacks (form-encoded POSTs):
//   POST /turbo/lead-answered                       -> instruction document
//   POST /turbo/call-status
//   POST /turbo/conference-status?session_id=
//   POST /turbo/voicemail?call_handle=              -> instruction document
//   POST /turbo/voicemail/transcription?call_handle=
//   POST /turbo/session/twiml?session_id=[&conference=]  -> rep leg document
//   POST /turbo/rep-leg-status?session_id=&conference=
// Every callback is acknowledged with 200, whatever happened inside; a 5xx
// would only make the provider retry or play an error to the lead.
class WebhookHandler {
public:
    struct Dependencies {
        AnswerHandler*      answer      = nullptr;
        LifecycleProcessor* lifecycle   = nullptr;
        VoicemailFinisher*  voicemail   = nullptr;
        SlowHandlerLogger*  slow_logger = nullptr;
        RepConnector*       connector   = nullptr;
    };

    static void register_routes(HttpServer& server, const Dependencies& deps);

    static HttpServer::Response handle_lead_answered(const HttpServer::Request& req,
                                                     const Dependencies& deps);
    static HttpServer::Response handle_call_status(const HttpServer::Request& req,
                                                   const Dependencies& deps);
    static HttpServer::Response handle_conference_status(const HttpServer::Request& req,
                                                         const Dependencies& deps);
    static HttpServer::Response handle_voicemail(const HttpServer::Request& req,
                                                 const Dependencies& deps);
    static HttpServer::Response handle_transcription(const HttpServer::Request& req,
                                                     const Dependencies& deps);
    static HttpServer::Response handle_session_join(const HttpServer::Request& req,
                                                    const Dependencies& deps);
    static HttpServer::Response handle_rep_leg_status(const HttpServer::Request& req,
                                                      const Dependencies& deps);
};

} // namespace turbo_dialer
#endif
