#pragma once

#include <cstdint>
#include <string>

namespace casetrack::service {

inline constexpr const char* kCaseDomain = "case";

// CASE-YYYYMMDD-NNNNN. Throws InvalidState once the day's five digits are used up.
std::string FormatCaseId(const std::string& day, uint64_t sequence);

bool IsValidCaseId(const std::string& case_id);

} // namespace casetrack::service
