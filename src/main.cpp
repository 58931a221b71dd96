// =============================================================================
// FILE: src/main.cpp
// =============================================================================
#include "common/config.h"
#include "common/logger.h"
#include "common/slow_handler_logger.h"
#include "persistence/mongo_client.h"
#include "persistence/mongo_stores.h"
#include "persistence/memory_stores.h"
#include "telephony/twilio_provider.h"
#include "crm/http_crm_gateway.h"
#include "dialer/caller_id_pool.h"
#include "dialer/dispatch_launcher.h"
#include "dialer/answer_handler.h"
#include "dialer/lifecycle_processor.h"
#include "dialer/voicemail_finisher.h"
#include "dialer/rep_connector.h"
#include "dispatch/dispatch_scheduler.h"
#include "dispatch/stale_claim_reaper.h"
#include "http/http_server.h"
#include "http/webhook_handler.h"
#include "http/turbo_api_handler.h"
#include "http/health_handler.h"
#include "http/stats_handler.h"
#include <csignal>
#include <atomic>
#include <memory>
#include <thread>

using namespace turbo_dialer;

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int sig) {
    LOG_INFO("Signal %d received", sig);
    g_shutdown.store(true, std::memory_order_release);
}

int main(int argc, char* argv[]) {
    Logger::instance().set_level(LogLevel::kInfo);
    LOG_INFO("Turbo dialer starting...");

    // 1. Load config
    Config config = (argc > 1) ? Config::load_from_file(argv[1]) : Config::load_defaults();

    // Configure file-based logging with rotation
    Logger::instance().configure(
        config.log_directory,
        config.log_base_name,
        parse_log_level(config.log_console_level_str),
        config.log_max_file_size_mb * 1024 * 1024,
        config.log_max_rotated_files);
    Logger::instance().set_level(parse_log_level(config.log_level_str));

    // Signals
    struct sigaction sa{}; sa.sa_handler = signal_handler; sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr); sigaction(SIGTERM, &sa, nullptr);
    signal(SIGPIPE, SIG_IGN);

    // 2. Shared components
    auto slow_logger = std::make_shared<SlowHandlerLogger>(config);

    // 3. Stores: MongoDB, or in-process when persistence is off
    std::shared_ptr<MongoClient> mongo;
    std::unique_ptr<QueueStore> queue;
    std::unique_ptr<RepPool> reps;
    std::unique_ptr<CallAttemptStore> calls;
    if (config.mongo_enable_persistence) {
        mongo = std::make_shared<MongoClient>(config);
        if (mongo->connect() != Result::kOk) {
            LOG_FATAL("MongoDB connection failed"); return 1;
        }
        if (mongo->ensure_indexes() != Result::kOk) {
            LOG_FATAL("MongoDB index setup failed"); return 1;
        }
        queue = std::make_unique<MongoQueueStore>(config, mongo);
        reps  = std::make_unique<MongoRepPool>(config, mongo);
        calls = std::make_unique<MongoCallAttemptStore>(config, mongo);
    } else {
        LOG_WARN("Persistence disabled: queue, rep pool and call state live in memory only");
        queue = std::make_unique<MemoryQueueStore>(
            RetryPolicy{config.retry_limit, config.retry_cooldown});
        reps  = std::make_unique<MemoryRepPool>();
        calls = std::make_unique<MemoryCallAttemptStore>();
    }

    // 4. Outbound integrations
    TwilioProvider provider(config);
    HttpCrmGateway crm(config);
    CallerIdPool caller_ids(config.default_caller_id, config.caller_id_pool);
    bool telephony_ready = !config.telephony_account_sid.empty() &&
                           !config.telephony_auth_token.empty() &&
                           !caller_ids.default_number().empty();
    if (!telephony_ready) {
        LOG_WARN("Telephony credentials or caller id missing; dispatch cycles will fail");
    }

    // 5. Dialer components
    DispatchLauncher launcher(config, DispatchLauncher::Dependencies{
        queue.get(), reps.get(), calls.get(), &provider, &caller_ids, slow_logger.get()});
    RepConnector connector(config, RepConnector::Dependencies{reps.get(), &provider});
    AnswerHandler answer(config, AnswerHandler::Dependencies{
        queue.get(), reps.get(), calls.get(), &provider, &crm, &connector});
    LifecycleProcessor lifecycle(LifecycleProcessor::Dependencies{
        queue.get(), reps.get(), calls.get(), &crm});
    VoicemailFinisher voicemail(VoicemailFinisher::Dependencies{queue.get(), calls.get()});

    // 6. Background workers
    std::unique_ptr<DispatchScheduler> scheduler;
    if (config.auto_dispatch) {
        scheduler = std::make_unique<DispatchScheduler>(config, launcher, *reps);
        if (scheduler->start() != Result::kOk) { LOG_FATAL("Dispatch scheduler failed"); return 1; }
    }

    StaleClaimReaper reaper(config, *reps, *calls);
    reaper.start();

    // 7. HTTP server
    HttpServer http(config);
    if (config.http_enabled) {
        WebhookHandler::Dependencies wdeps{&answer, &lifecycle, &voicemail, slow_logger.get(),
                                           &connector};
        WebhookHandler::register_routes(http, wdeps);

        TurboApiHandler::Dependencies adeps{queue.get(), reps.get(), calls.get(), &launcher,
                                            &connector};
        TurboApiHandler::register_routes(http, adeps);

        HealthHandler::Dependencies hdeps{mongo.get(), config.mongo_enable_persistence,
                                          reps.get(), telephony_ready, scheduler.get(), &reaper};
        HealthHandler::register_routes(http, hdeps);

        StatsHandler::Dependencies sdeps{&config, &http, &launcher, &answer, &lifecycle,
                                         &voicemail, scheduler.get(), &reaper, &provider,
                                         &crm, mongo.get(), slow_logger.get(), &connector};
        StatsHandler::register_routes(http, sdeps);

        if (http.start() != Result::kOk) { LOG_FATAL("HTTP server failed"); return 1; }
    }

    LOG_INFO("All components started. service_id=%s store=%s auto_dispatch=%s",
             config.service_id.c_str(),
             config.mongo_enable_persistence ? "mongodb" : "memory",
             config.auto_dispatch ? "on" : "off");

    // Main loop
    uint64_t tick = 0;
    while (!g_shutdown.load(std::memory_order_acquire)) {
        std::this_thread::sleep_for(Seconds(1));
        if (++tick % 30 == 0) {
            auto& ls = launcher.stats();
            auto& as = answer.stats();
            LOG_INFO("Stats: cycles=%lu placed=%lu failed=%lu answers=%lu connected=%lu "
                     "holds=%lu voicemails=%lu machines=%lu",
                     ls.cycles.load(), ls.calls_placed.load(), ls.calls_failed.load(),
                     as.answers.load(), as.connected.load(), as.holds.load(),
                     as.voicemails.load(), as.machines.load());
        }
    }

    // Shutdown (reverse order)
    LOG_INFO("Shutting down...");
    http.stop();
    reaper.stop();
    if (scheduler) scheduler->stop();
    if (mongo) mongo->disconnect();

    LOG_INFO("Turbo dialer stopped cleanly.");
    Logger::instance().flush_all();
    return 0;
}
