#pragma once

// std::regex over page-sized subjects.
//
// libstdc++ matches recursively, roughly one stack frame per character a
// repetition consumes, so a single long match can exhaust the stack. Subjects
// are therefore scanned in windows of at most kRegexWindowBytes, cut after a
// newline or a space where one exists in the second half of the window.
// Anchors and word boundaries see the surrounding text (match_prev_avail,
// match_not_eol); a match never spans two windows.

#include <cstddef>
#include <functional>
#include <regex>
#include <string>

namespace scrapeguard {

constexpr size_t kRegexWindowBytes = 2048;

// End offset of the window starting at `begin`.
size_t regex_window_end(const std::string& s, size_t begin);

// Calls fn for every match in subject order until fn returns false.
// Match iterators point into s.
void for_each_match(const std::string& s, const std::regex& re,
                    const std::function<bool(const std::smatch&)>& fn);

// First match anchored at the start of s (Python's re.match).
bool match_at_start(const std::string& s, const std::regex& re, std::smatch* m);

} // namespace scrapeguard
