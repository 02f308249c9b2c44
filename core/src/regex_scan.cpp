#include "scrapeguard/regex_scan.h"

namespace scrapeguard {

size_t regex_window_end(const std::string& s, size_t begin) {
    const size_t limit = begin + kRegexWindowBytes;
    if (limit >= s.size()) return s.size();
    const size_t floor = begin + kRegexWindowBytes / 2;
    for (const char* seps : {"\n", " \t\r"}) {
        const size_t cut = s.find_last_of(seps, limit - 1);
        if (cut != std::string::npos && cut >= floor) return cut + 1;
    }
    return limit;
}

void for_each_match(const std::string& s, const std::regex& re,
                    const std::function<bool(const std::smatch&)>& fn) {
    size_t begin = 0;
    do {
        const size_t end = regex_window_end(s, begin);
        auto flags = std::regex_constants::match_default;
        if (begin > 0) flags |= std::regex_constants::match_prev_avail;
        if (end < s.size()) flags |= std::regex_constants::match_not_eol;
        const auto first = s.begin() + (std::ptrdiff_t)begin;
        const auto last = s.begin() + (std::ptrdiff_t)end;
        for (std::sregex_iterator it(first, last, re, flags), stop; it != stop; ++it) {
            const std::smatch& m = *it;
            // the previous window already reported an empty match at its end
            if (begin > 0 && m.length(0) == 0 && m[0].first == first) continue;
            if (!fn(m)) return;
        }
        begin = end;
    } while (begin < s.size());
}

bool match_at_start(const std::string& s, const std::regex& re, std::smatch* m) {
    const size_t end = regex_window_end(s, 0);
    auto flags = std::regex_constants::match_continuous;
    if (end < s.size()) flags |= std::regex_constants::match_not_eol;
    return std::regex_search(s.begin(), s.begin() + (std::ptrdiff_t)end, *m, re, flags);
}

} // namespace scrapeguard
