// =============================================================================
// FILE: src/dialer/caller_id_pool.cpp
// =============================================================================
#include "dialer/caller_id_pool.h"
#include "common/phone_number.h"
#include "common/logger.h"

#include <functional>

namespace turbo_dialer {

CallerIdPool::CallerIdPool(const std::string& default_number,
                           const std::vector<std::string>& pool)
    : default_(normalize_e164(default_number))
{
    for (const auto& raw : pool) {
        std::string number = normalize_e164(raw);
        if (number.empty()) {
            LOG_WARN("Caller id '%s' is not a phone number, skipped", raw.c_str());
            continue;
        }
        std::string area = nanp_area_code(number);
        if (area.empty()) continue;
        by_area_[area].push_back(number);
        ++size_;
    }
    if (default_.empty() && !by_area_.empty()) {
        default_ = by_area_.begin()->second.front();
    }
}

std::string CallerIdPool::pick(const std::string& lead_e164) const {
    auto it = by_area_.find(nanp_area_code(lead_e164));
    if (it == by_area_.end() || it->second.empty()) return default_;
    const auto& numbers = it->second;
    // Same lead always shows the same number
    return numbers[std::hash<std::string>{}(lead_e164) % numbers.size()];
}

} // namespace turbo_dialer
