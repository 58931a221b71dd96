// =============================================================================
// FILE: include/dialer/caller_id_pool.h
// =============================================================================
#ifndef CALLER_ID_POOL_H
#define CALLER_ID_POOL_H

#include <string>
#include <unordered_map>
#include <vector>

namespace turbo_dialer {

// Local-presence caller id: a number from the pool sharing the lead's area
// code, else the default number. Immutable after construction.
class CallerIdPool {
public:
    CallerIdPool(const std::string& default_number, const std::vector<std::string>& pool);

    std::string pick(const std::string& lead_e164) const;

    const std::string& default_number() const { return default_; }
    size_t size() const { return size_; }

private:
    std::string default_;
    size_t size_ = 0;
    // area code -> numbers; several numbers per area code rotate by lead
    std::unordered_map<std::string, std::vector<std::string>> by_area_;
};

} // namespace turbo_dialer
#endif // CALLER_ID_POOL_H
