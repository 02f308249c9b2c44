#pragma once

// Built-in extraction heuristics shared by the fallback tiers and the
// helpers injected into generated code.

#include <string>
#include <utility>
#include <vector>

namespace scrapeguard {

using Headers = std::vector<std::pair<std::string, std::string>>;

// Browser-like request headers sent by every fetch helper.
const Headers& polite_headers();

// Phone numbers as the rendered fallback tier finds them: "+91"-prefixed
// ten digit numbers, bare ten digit runs and 10-12 digit international
// numbers. Deduplicated, first-seen order.
std::vector<std::string> extract_fallback_phones(const std::string& text);

// Looser phone matcher exposed to generated code: NANP-style groups with
// optional separators and generic 1-4 digit group sequences.
// Deduplicated, first-seen order.
std::vector<std::string> extract_phones(const std::string& text);

// E-mail addresses, deduplicated, first-seen order.
std::vector<std::string> extract_emails(const std::string& text);

} // namespace scrapeguard
