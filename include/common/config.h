// =============================================================================
// FILE: include/common/config.h
// =============================================================================
#ifndef COMMON_CONFIG_H
#define COMMON_CONFIG_H

#include "common/types.h"
#include <cstddef>
#include <string>
#include <vector>
#include <unordered_map>

namespace turbo_dialer {

struct Config {
    // General
    std::string service_id     = "turbo-dialer-01";
    std::string instance_name  = "turbo_dialer";
    std::string log_level_str  = "info";

    // Dialer
    size_t  leads_per_rep                = 3;    // fan-out factor per available rep
    size_t  max_batch_size               = 30;
    int     retry_limit                  = 3;
    Seconds ring_timeout                 = Seconds(30);
    Seconds machine_detection_timeout    = Seconds(5);
    Seconds hold_pause                   = Seconds(2);
    Seconds voicemail_max_length         = Seconds(120);
    Seconds dispatch_interval            = Seconds(5);
    bool    auto_dispatch                = false;

    // Queue
    Seconds retry_cooldown               = Seconds(0);

    // Reaper
    Seconds reaper_scan_interval         = Seconds(60);
    Seconds stale_claim_timeout          = Seconds(300);

    // Telephony provider
    std::string telephony_api_base_url   = "https://api.twilio.com";
    std::string telephony_account_sid;
    std::string telephony_auth_token;
    std::string public_base_url          = "http://localhost:8080";  // where the provider reaches us
    std::string default_caller_id;
    std::vector<std::string> caller_id_pool;
    // Address the rep's leg is dialed at once a lead is bridged; "{rep_id}"
    // is replaced. "client:" reaches the rep's browser softphone.
    std::string rep_endpoint             = "client:{rep_id}";
    Seconds     rep_ring_timeout         = Seconds(20);
    Millisecs   telephony_request_timeout = Millisecs(10000);

    // CRM
    bool        crm_enabled              = false;
    std::string crm_base_url             = "http://localhost:3000";
    std::string crm_api_token;
    Millisecs   crm_request_timeout      = Millisecs(5000);

    // MongoDB
    std::string mongo_uri                    = "mongodb://localhost:27017";
    std::string mongo_database               = "turbo_dialer";
    std::string mongo_collection_queue       = "turbo_queue";
    std::string mongo_collection_calls       = "turbo_calls";
    std::string mongo_collection_sessions    = "turbo_sessions";
    std::string mongo_collection_batches     = "turbo_batches";
    Millisecs   mongo_connect_timeout        = Millisecs(5000);
    bool        mongo_enable_persistence     = true;

    // Slow handler logging thresholds
    Millisecs slow_handler_warn_threshold     = Millisecs(250);
    Millisecs slow_handler_error_threshold    = Millisecs(1000);
    Millisecs slow_handler_critical_threshold = Millisecs(5000);

    // HTTP server
    bool        http_enabled            = true;
    std::string http_bind_address       = "0.0.0.0";
    uint16_t    http_port               = 8080;
    size_t      http_worker_threads     = 8;
    Seconds     http_read_timeout       = Seconds(30);
    size_t      http_max_connections    = 100;
    size_t      http_max_body_bytes     = 1024 * 1024;

    // Logging
    std::string log_directory           = "/var/log/turbo_dialer";
    std::string log_base_name           = "turbo_dialer";
    std::string log_console_level_str   = "warn";
    size_t      log_max_file_size_mb    = 50;
    int         log_max_rotated_files   = 10;

    // Parse from INI-style config file
    static Config load_from_file(const std::string& path);
    static Config load_defaults();

private:
    // INI parser helper
    static std::unordered_map<std::string, std::string> parse_ini(const std::string& path);
    static std::string get_or(const std::unordered_map<std::string, std::string>& m,
                               const std::string& key, const std::string& def);
    static int get_int(const std::unordered_map<std::string, std::string>& m,
                        const std::string& key, int def);
    static size_t get_size(const std::unordered_map<std::string, std::string>& m,
                            const std::string& key, size_t def);
    static bool get_bool(const std::unordered_map<std::string, std::string>& m,
                          const std::string& key, bool def);
    static std::vector<std::string> parse_list(const std::string& csv);
};

} // namespace turbo_dialer
#endif // COMMON_CONFIG_H
