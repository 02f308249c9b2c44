#pragma once

#include "scrapeguard/value.h"

#include <cstddef>
#include <string>

namespace scrapeguard {

// Removes characters outside [word, whitespace, '@', '.', '-'], then
// collapses whitespace runs to one space and trims. Input is read as UTF-8:
// letters and digits of any script are word characters, Unicode spaces
// (NBSP included) are whitespace, and symbols, emoji and malformed bytes
// are removed. Idempotent.
std::string clean_text(const std::string& s);

struct ValidationStats {
    size_t input{0};
    size_t dropped_non_map{0};
    size_t dropped_empty{0};
    size_t kept{0};
};

// ResultValidator. Pure: the input is not modified and the output shares no
// containers with it.
//   - a list is taken element-wise; any other truthy value becomes a
//     one-element list; a falsy value yields nothing
//   - non-map elements are dropped
//   - string fields are cleaned with clean_text; other fields are kept as is,
//     except that containers past kMaxValueDepth levels become null
//   - a record without at least one truthy field is dropped
// Output order is input order.
List validate_records(const Value& raw, ValidationStats* stats = nullptr);

} // namespace scrapeguard
