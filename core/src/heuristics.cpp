#include "scrapeguard/heuristics.h"
#include "scrapeguard/regex_scan.h"

#include <regex>
#include <unordered_set>

namespace scrapeguard {

namespace {

std::vector<std::string> find_all_unique(const std::string& text, const std::vector<std::regex>& patterns) {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const auto& re : patterns) {
        for_each_match(text, re, [&](const std::smatch& hit) {
            std::string m = hit.str();
            if (!m.empty() && seen.insert(m).second) out.push_back(std::move(m));
            return true;
        });
    }
    return out;
}

} // namespace

const Headers& polite_headers() {
    static const Headers h = {
        {"User-Agent", "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
                       "(KHTML, like Gecko) Chrome/91.0.4472.124 Safari/537.36"},
        {"Accept", "text/html,application/xhtml+xml,application/xml;q=0.9,image/webp,*/*;q=0.8"},
        {"Accept-Language", "en-US,en;q=0.5"},
        {"Accept-Encoding", "gzip, deflate"},
        {"Connection", "keep-alive"},
        {"Upgrade-Insecure-Requests", "1"},
    };
    return h;
}

std::vector<std::string> extract_fallback_phones(const std::string& text) {
    static const std::vector<std::regex> patterns = {
        std::regex(R"(\+?91[0-9]{10})"),
        std::regex(R"([0-9]{10})"),
        std::regex(R"(\+?[0-9]{10,12})"),
    };
    return find_all_unique(text, patterns);
}

std::vector<std::string> extract_phones(const std::string& text) {
    static const std::vector<std::regex> patterns = {
        std::regex(R"(\+?1?[-.\s]?\(?[0-9]{3}\)?[-.\s]?[0-9]{3}[-.\s]?[0-9]{4})"),
        std::regex(R"(\+?[0-9]{1,4}[-.\s]?[0-9]{1,4}[-.\s]?[0-9]{1,4}[-.\s]?[0-9]{1,4})"),
    };
    return find_all_unique(text, patterns);
}

std::vector<std::string> extract_emails(const std::string& text) {
    static const std::vector<std::regex> patterns = {
        std::regex(R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)", std::regex::icase),
    };
    return find_all_unique(text, patterns);
}

} // namespace scrapeguard
