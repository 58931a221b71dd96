// =============================================================================
// FILE: include/crm/http_crm_gateway.h
// =============================================================================
#ifndef HTTP_CRM_GATEWAY_H
#define HTTP_CRM_GATEWAY_H

#include "common/config.h"
#include "crm/crm_gateway.h"
#include "http/rest_client.h"
#include <atomic>
#include <memory>

namespace turbo_dialer {

// JSON over HTTP with a bearer token:
//   POST  /turbo/leads/{lead_id}/owner   {org_id, rep_id}
//   POST  /turbo/calls                   call record
//   PATCH /turbo/calls/{call_handle}     completion
// With crm.enabled = false every call is logged at DEBUG and reports kOk.
class HttpCrmGateway final : public CrmGateway {
public:
    explicit HttpCrmGateway(const Config& config);

    Result assign_lead_owner(const OrgId& org_id, const std::string& lead_id,
                             const std::string& rep_id) override;
    Result create_call_record(const CallAttempt& attempt) override;
    Result complete_call_record(const CallAttempt& attempt) override;

    struct Stats {
        std::atomic<uint64_t> requests{0};
        std::atomic<uint64_t> failures{0};
    };
    const Stats& stats() const { return stats_; }

private:
    Result send(const char* op, const std::string& method, const std::string& path,
                const std::string& body);

    bool enabled_;
    std::unique_ptr<RestClient> rest_;
    Stats stats_;
};

} // namespace turbo_dialer
#endif // HTTP_CRM_GATEWAY_H
