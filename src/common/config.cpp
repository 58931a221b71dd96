// =============================================================================
// FILE: src/common/config.cpp
// =============================================================================
#include "common/config.h"
#include "common/logger.h"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <stdexcept>
#include <cstdlib>

namespace turbo_dialer {

std::unordered_map<std::string, std::string> Config::parse_ini(const std::string& path) {
    std::unordered_map<std::string, std::string> map;
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: %s", path.c_str());
        return map;
    }

    std::string section, line;
    while (std::getline(file, line)) {
        line.erase(0, line.find_first_not_of(" \t\r\n"));
        line.erase(line.find_last_not_of(" \t\r\n") + 1);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[') {
            auto end = line.find(']');
            if (end != std::string::npos) section = line.substr(1, end - 1);
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = line.substr(0, eq);
        std::string val = line.substr(eq + 1);
        key.erase(key.find_last_not_of(" \t") + 1);
        key.erase(0, key.find_first_not_of(" \t"));
        val.erase(0, val.find_first_not_of(" \t"));
        val.erase(val.find_last_not_of(" \t") + 1);

        // ${ENV_VAR} substitution, used for provider and CRM secrets
        size_t pos = 0;
        while ((pos = val.find("${", pos)) != std::string::npos) {
            auto end = val.find('}', pos);
            if (end == std::string::npos) break;
            std::string env_name = val.substr(pos + 2, end - pos - 2);
            const char* env_val = std::getenv(env_name.c_str());
            val.replace(pos, end - pos + 1, env_val ? env_val : "");
        }

        std::string full_key = section.empty() ? key : section + "." + key;
        map[full_key] = val;
    }
    return map;
}

std::string Config::get_or(const std::unordered_map<std::string, std::string>& m,
                            const std::string& key, const std::string& def) {
    auto it = m.find(key); return (it != m.end()) ? it->second : def;
}

int Config::get_int(const std::unordered_map<std::string, std::string>& m,
                     const std::string& key, int def) {
    auto it = m.find(key);
    if (it == m.end()) return def;
    try {
        return std::stoi(it->second);
    } catch (const std::logic_error&) {
        LOG_WARN("Config: '%s' is not an integer ('%s'), using %d",
                 key.c_str(), it->second.c_str(), def);
        return def;
    }
}

size_t Config::get_size(const std::unordered_map<std::string, std::string>& m,
                         const std::string& key, size_t def) {
    auto it = m.find(key);
    if (it == m.end()) return def;
    try {
        return std::stoull(it->second);
    } catch (const std::logic_error&) {
        LOG_WARN("Config: '%s' is not a size ('%s'), using %zu",
                 key.c_str(), it->second.c_str(), def);
        return def;
    }
}

bool Config::get_bool(const std::unordered_map<std::string, std::string>& m,
                       const std::string& key, bool def) {
    auto it = m.find(key);
    if (it == m.end()) return def;
    return (it->second == "true" || it->second == "1" || it->second == "yes");
}

std::vector<std::string> Config::parse_list(const std::string& csv) {
    std::vector<std::string> items;
    std::istringstream stream(csv);
    std::string token;
    while (std::getline(stream, token, ',')) {
        token.erase(0, token.find_first_not_of(" \t"));
        token.erase(token.find_last_not_of(" \t") + 1);
        if (!token.empty()) items.push_back(token);
    }
    return items;
}

Config Config::load_defaults() {
    Config cfg;
    LOG_INFO("Config: defaults loaded, leads_per_rep=%zu retry_limit=%d",
             cfg.leads_per_rep, cfg.retry_limit);
    return cfg;
}

Config Config::load_from_file(const std::string& path) {
    auto m = parse_ini(path);
    if (m.empty()) {
        LOG_WARN("Config: empty or missing file '%s', using defaults", path.c_str());
        return load_defaults();
    }

    Config c;

    // General
    c.service_id     = get_or(m, "general.service_id", c.service_id);
    c.instance_name  = get_or(m, "general.instance_name", c.instance_name);
    c.log_level_str  = get_or(m, "general.log_level", c.log_level_str);

    // Dialer
    c.leads_per_rep  = get_size(m, "dialer.leads_per_rep", c.leads_per_rep);
    if (c.leads_per_rep == 0) c.leads_per_rep = 1;
    c.max_batch_size = get_size(m, "dialer.max_batch_size", c.max_batch_size);
    c.retry_limit    = std::max(1, get_int(m, "dialer.retry_limit", c.retry_limit));
    c.ring_timeout   = Seconds(get_int(m, "dialer.ring_timeout_sec", 30));
    c.machine_detection_timeout = Seconds(get_int(m, "dialer.machine_detection_timeout_sec", 5));
    c.hold_pause     = Seconds(get_int(m, "dialer.hold_pause_sec", 2));
    c.voicemail_max_length = Seconds(get_int(m, "dialer.voicemail_max_length_sec", 120));
    c.dispatch_interval = Seconds(get_int(m, "dialer.dispatch_interval_sec", 5));
    c.auto_dispatch  = get_bool(m, "dialer.auto_dispatch", c.auto_dispatch);

    // Queue
    c.retry_cooldown = Seconds(std::max(0, get_int(m, "queue.retry_cooldown_sec", 0)));

    // Reaper
    c.reaper_scan_interval = Seconds(get_int(m, "reaper.scan_interval_sec", 60));
    c.stale_claim_timeout  = Seconds(get_int(m, "reaper.stale_claim_timeout_sec", 300));

    // Telephony
    c.telephony_api_base_url = get_or(m, "telephony.api_base_url", c.telephony_api_base_url);
    c.telephony_account_sid  = get_or(m, "telephony.account_sid", c.telephony_account_sid);
    c.telephony_auth_token   = get_or(m, "telephony.auth_token", c.telephony_auth_token);
    c.public_base_url        = get_or(m, "telephony.public_base_url", c.public_base_url);
    c.default_caller_id      = get_or(m, "telephony.default_caller_id", c.default_caller_id);
    c.caller_id_pool         = parse_list(get_or(m, "telephony.caller_id_pool", ""));
    c.telephony_request_timeout = Millisecs(get_int(m, "telephony.request_timeout_ms", 10000));
    c.rep_endpoint           = get_or(m, "telephony.rep_endpoint", c.rep_endpoint);
    c.rep_ring_timeout       = Seconds(get_int(m, "telephony.rep_ring_timeout_sec", 20));

    // CRM
    c.crm_enabled         = get_bool(m, "crm.enabled", c.crm_enabled);
    c.crm_base_url        = get_or(m, "crm.base_url", c.crm_base_url);
    c.crm_api_token       = get_or(m, "crm.api_token", c.crm_api_token);
    c.crm_request_timeout = Millisecs(get_int(m, "crm.request_timeout_ms", 5000));

    // MongoDB
    c.mongo_uri                 = get_or(m, "mongodb.uri", c.mongo_uri);
    c.mongo_database            = get_or(m, "mongodb.database", c.mongo_database);
    c.mongo_collection_queue    = get_or(m, "mongodb.collection_queue", c.mongo_collection_queue);
    c.mongo_collection_calls    = get_or(m, "mongodb.collection_calls", c.mongo_collection_calls);
    c.mongo_collection_sessions = get_or(m, "mongodb.collection_sessions", c.mongo_collection_sessions);
    c.mongo_collection_batches  = get_or(m, "mongodb.collection_batches", c.mongo_collection_batches);
    c.mongo_connect_timeout     = Millisecs(get_int(m, "mongodb.connect_timeout_ms", 5000));
    c.mongo_enable_persistence  = get_bool(m, "mongodb.enable_persistence", true);

    // Slow handler
    c.slow_handler_warn_threshold     = Millisecs(get_int(m, "slow_handler.warn_threshold_ms", 250));
    c.slow_handler_error_threshold    = Millisecs(get_int(m, "slow_handler.error_threshold_ms", 1000));
    c.slow_handler_critical_threshold = Millisecs(get_int(m, "slow_handler.critical_threshold_ms", 5000));

    // HTTP
    c.http_enabled         = get_bool(m, "http.enabled", true);
    c.http_bind_address    = get_or(m, "http.bind_address", c.http_bind_address);
    c.http_port            = static_cast<uint16_t>(get_int(m, "http.port", 8080));
    c.http_worker_threads  = std::max<size_t>(1, get_size(m, "http.worker_threads", 8));
    c.http_read_timeout    = Seconds(get_int(m, "http.read_timeout_sec", 30));
    c.http_max_connections = get_size(m, "http.max_connections", 100);
    c.http_max_body_bytes  = get_size(m, "http.max_body_bytes", c.http_max_body_bytes);

    // Logging
    c.log_directory         = get_or(m, "logging.directory", c.log_directory);
    c.log_base_name         = get_or(m, "logging.base_name", c.log_base_name);
    c.log_console_level_str = get_or(m, "logging.console_level", c.log_console_level_str);
    c.log_max_file_size_mb  = get_size(m, "logging.max_file_size_mb", 50);
    c.log_max_rotated_files = get_int(m, "logging.max_rotated_files", 10);

    LOG_INFO("Config: loaded from '%s', leads_per_rep=%zu retry_limit=%d cooldown=%lds "
             "caller_ids=%zu mongo=%s http=%s:%d",
             path.c_str(), c.leads_per_rep, c.retry_limit,
             static_cast<long>(c.retry_cooldown.count()), c.caller_id_pool.size(),
             c.mongo_enable_persistence ? "enabled" : "disabled",
             c.http_bind_address.c_str(), c.http_port);

    return c;
}

} // namespace turbo_dialer
