// =============================================================================
// FILE: tests/fakes/fake_telephony_provider.h
// =============================================================================
#ifndef FAKE_TELEPHONY_PROVIDER_H
#define FAKE_TELEPHONY_PROVIDER_H

#include "telephony/telephony_provider.h"
#include <cstdio>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace turbo_dialer {
namespace fakes {

// Records every request; hands out "CA0001", "CA0002", ... in order.
// Numbers listed in reject_to are refused with kProviderError.
class FakeTelephonyProvider : public TelephonyProvider {
public:
    Result place_call(const PlaceCallRequest& request, std::string& call_handle) override {
        std::lock_guard<std::mutex> lk(mu_);
        placed.push_back(request);
        if (reject_to.count(request.to)) return Result::kProviderError;
        char buf[16];
        snprintf(buf, sizeof(buf), "CA%04d", ++next_);
        call_handle = buf;
        handles.push_back(call_handle);
        return Result::kOk;
    }

    Result cancel_call(const std::string& call_handle) override {
        std::lock_guard<std::mutex> lk(mu_);
        canceled.push_back(call_handle);
        return cancel_result;
    }

    std::vector<PlaceCallRequest> placed;
    std::vector<std::string> handles;
    std::vector<std::string> canceled;
    std::set<std::string> reject_to;
    Result cancel_result = Result::kOk;

private:
    std::mutex mu_;
    int next_ = 0;
};

} // namespace fakes
} // namespace turbo_dialer
#endif // FAKE_TELEPHONY_PROVIDER_H
