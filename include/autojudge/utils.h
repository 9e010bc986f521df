#ifndef INCLUDE_AUTOJUDGE_UTILS_H_
#define INCLUDE_AUTOJUDGE_UTILS_H_

#include <string>
#include <optional>

#include "submission.h"

const char* SubmissionStatusName(SubmissionStatus);
std::optional<SubmissionStatus> GetSubmissionStatus(const std::string&);

SortDirection GetSortDirection(const std::string&);

std::string Trim(const std::string&);
std::string ToLower(std::string);
std::string ToUpper(std::string);
// stripped and lowercased
std::string NormalizeSlug(const std::string&);

// At most 4 decimals, trailing zeros removed; "—" if absent
std::string FormatValue(std::optional<double>);

#endif  // INCLUDE_AUTOJUDGE_UTILS_H_
