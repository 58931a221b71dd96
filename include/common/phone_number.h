// =============================================================================
// FILE: include/common/phone_number.h
// =============================================================================
#ifndef COMMON_PHONE_NUMBER_H
#define COMMON_PHONE_NUMBER_H

#include <string>

namespace turbo_dialer {

// Normalizes a CRM phone field to E.164.
//   10 digits            -> +1XXXXXXXXXX (NANP)
//   11 digits, leading 1 -> +1XXXXXXXXXX
//   anything else        -> + followed by the digits
// Returns an empty string when the input carries fewer than 7 digits.
std::string normalize_e164(const std::string& raw);

// Three-digit NANP area code of an E.164 number, or "" for non-NANP numbers.
std::string nanp_area_code(const std::string& e164);

} // namespace turbo_dialer
#endif // COMMON_PHONE_NUMBER_H
