#include "case_id.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

#include "internal/util/errors.hpp"

namespace casetrack::service {

namespace {
constexpr uint64_t kMaxDailySequence = 99999;

bool AllDigits(const std::string& s, std::size_t pos, std::size_t len) {
  return std::all_of(s.begin() + pos, s.begin() + pos + len, [](unsigned char c) { return std::isdigit(c) != 0; });
}
} // namespace

std::string FormatCaseId(const std::string& day, uint64_t sequence) {
  if (day.size() != 8 || !AllDigits(day, 0, 8)) {
    throw util::InvalidArgument("case id day must be YYYYMMDD, got '" + day + "'");
  }
  if (sequence == 0 || sequence > kMaxDailySequence) {
    throw util::InvalidState("case sequence " + std::to_string(sequence) + " out of range for " + day);
  }

  char buf[32];
  std::snprintf(buf, sizeof(buf), "CASE-%s-%05llu", day.c_str(), static_cast<unsigned long long>(sequence));
  return buf;
}

bool IsValidCaseId(const std::string& case_id) {
  // CASE- + 8 digits + - + 5 digits
  return case_id.size() == 19 && case_id.compare(0, 5, "CASE-") == 0 && AllDigits(case_id, 5, 8) && case_id[13] == '-' &&
         AllDigits(case_id, 14, 5);
}

} // namespace casetrack::service
