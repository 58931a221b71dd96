// =============================================================================
// FILE: src/common/ids.cpp
// =============================================================================
#include "common/ids.h"
#include <array>
#include <random>
#include <sstream>
#include <iomanip>
#include <cctype>

namespace turbo_dialer {

namespace {

// Conference names travel in provider URLs and TwiML; keep them to [A-Za-z0-9_-].
std::string sanitize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        unsigned char uc = static_cast<unsigned char>(c);
        out.push_back((std::isalnum(uc) || c == '-' || c == '_') ? c : '_');
    }
    return out;
}

} // namespace

std::string generate_uuid() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};

    std::array<uint8_t, 16> id{};
    for (auto& b : id)
        b = static_cast<uint8_t>(rng());

    id[6] = (id[6] & 0x0F) | 0x40;
    id[8] = (id[8] & 0x3F) | 0x80;

    std::ostringstream oss;
    for (size_t i = 0; i < id.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) oss << "-";
        oss << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(id[i]);
    }
    return oss.str();
}

std::string make_conference_name(const OrgId& org_id, const std::string& rep_id,
                                 EpochMs at) {
    return "turbo-" + sanitize(org_id) + "-" + sanitize(rep_id) + "-" + std::to_string(at);
}

} // namespace turbo_dialer
