#pragma once

#include "scrapeguard/value.h"

#include <string>
#include <vector>

namespace scrapeguard {

// Union of record keys in first-seen order.
std::vector<std::string> record_columns(const List& records);

// Header row plus one row per record, "\n" line ends. Fields holding a comma,
// quote or line break are quoted with doubled quotes; missing keys are empty;
// non-string values use to_display().
std::string records_to_csv(const List& records);

} // namespace scrapeguard
