// =============================================================================
// FILE: src/common/phone_number.cpp
// =============================================================================
#include "common/phone_number.h"
#include <cctype>

namespace turbo_dialer {

static constexpr size_t kMinDigits = 7;

std::string normalize_e164(const std::string& raw) {
    std::string digits;
    digits.reserve(raw.size());
    for (char c : raw) {
        if (std::isdigit(static_cast<unsigned char>(c))) digits.push_back(c);
    }

    if (digits.size() < kMinDigits) return "";
    if (digits.size() == 10) return "+1" + digits;
    if (digits.size() == 11 && digits[0] == '1') return "+" + digits;
    return "+" + digits;
}

std::string nanp_area_code(const std::string& e164) {
    if (e164.size() != 12 || e164.compare(0, 2, "+1") != 0) return "";
    return e164.substr(2, 3);
}

} // namespace turbo_dialer
