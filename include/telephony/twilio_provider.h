// =============================================================================
// FILE: include/telephony/twilio_provider.h
// =============================================================================
#ifndef TWILIO_PROVIDER_H
#define TWILIO_PROVIDER_H

#include "common/config.h"
#include "http/rest_client.h"
#include "telephony/telephony_provider.h"
#include <atomic>

namespace turbo_dialer {

// Twilio-compatible REST adapter:
//   place:  POST {base}/2010-04-01/Accounts/{sid}/Calls.json
//   cancel: POST {base}/2010-04-01/Accounts/{sid}/Calls/{call}.json  Status=canceled
// Synchronous answering-machine detection (DetectMessageEnd), so AnsweredBy
// arrives with the answer callback.
class TwilioProvider final : public TelephonyProvider {
public:
    explicit TwilioProvider(const Config& config);

    Result place_call(const PlaceCallRequest& request, std::string& call_handle) override;
    Result cancel_call(const std::string& call_handle) override;

    struct Stats {
        std::atomic<uint64_t> calls_placed{0};
        std::atomic<uint64_t> calls_rejected{0};
        std::atomic<uint64_t> cancels_sent{0};
        std::atomic<uint64_t> cancels_failed{0};
    };
    const Stats& stats() const { return stats_; }

private:
    std::string calls_path() const;

    std::string account_sid_;
    RestClient  rest_;
    Stats       stats_;
};

} // namespace turbo_dialer
#endif // TWILIO_PROVIDER_H
