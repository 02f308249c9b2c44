#pragma once

#include "scrapeguard/config.h"
#include "scrapeguard/heuristics.h"

#include <atomic>
#include <filesystem>
#include <string>
#include <vector>

namespace scrapeguard {

struct FetchRequest {
    std::string url;
    Headers headers;
    int timeout_ms{0};   // 0: fetcher default
    int settle_ms{0};    // rendered fetch only: wait after load before the DOM is taken
};

struct FetchResult {
    bool ok{false};
    int status_code{0};       // HTTP status for static fetches, 0 when unknown
    std::string url;
    std::string body;         // HTML
    bool timed_out{false};
    bool cancelled{false};
    std::string error;
};

// Blocking fetch capabilities. Every call is bounded by a timeout.
class IFetcher {
public:
    virtual ~IFetcher() = default;
    virtual FetchResult fetch_static(const FetchRequest& req) = 0;
    virtual FetchResult fetch_rendered(const FetchRequest& req) = 0;
};

// "example.com/x" -> "https://example.com/x"; URLs with a scheme unchanged.
std::string normalize_url(const std::string& url);

struct UrlParts {
    std::string scheme;  // lowercased
    std::string host;    // lowercased, brackets stripped for IPv6 literals
    std::string port;    // explicit or scheme default
};

// Minimal scheme://[userinfo@]host[:port]/... parser. false when no host.
bool parse_url(const std::string& url, UrlParts* out);

// Exact names, "*" and "*.suffix" wildcards. Empty allowlist allows all.
bool host_allowed(const std::string& host, const std::vector<std::string>& allowlist);

// Loopback, RFC 1918, RFC 5737, RFC 6598, link-local, ULA and cloud metadata.
bool is_private_or_reserved_ip(const std::string& ip);

struct SsrfCheck {
    std::string error;        // empty: safe
    std::string resolved_ip;  // first safe address, used to pin curl's resolution
};

// Resolves host and rejects it when any address is private or reserved.
SsrfCheck ssrf_check_host(const std::string& host);

// Scheme, host allowlist and (when configured) private address checks
// shared by both fetch paths. Empty string when the URL may be fetched.
std::string check_fetch_target(const std::string& url, const FetchConfig& cfg, SsrfCheck* pinned = nullptr);

// Uniform jitter in [settle_min_ms, settle_max_ms].
int settle_jitter_ms(const FetchConfig& cfg);

// Temporary browser profile directory; removed on every exit path.
class BrowserSession {
public:
    BrowserSession();
    ~BrowserSession();

    BrowserSession(const BrowserSession&) = delete;
    BrowserSession& operator=(const BrowserSession&) = delete;

    bool ok() const { return !dir_.empty(); }
    const std::filesystem::path& profile_dir() const { return dir_; }
    const std::string& error() const { return error_; }

private:
    std::filesystem::path dir_;
    std::string error_;
};

// Drives curl for static fetches and a headless Chromium (--dump-dom) for
// rendered ones, both through the sandboxed process runner. The cancel flag,
// when given, kills an in-flight child promptly.
class ProcessFetcher : public IFetcher {
public:
    explicit ProcessFetcher(FetchConfig cfg, const std::atomic<bool>* cancel = nullptr);

    FetchResult fetch_static(const FetchRequest& req) override;
    FetchResult fetch_rendered(const FetchRequest& req) override;

    const FetchConfig& config() const { return cfg_; }

private:
    std::string find_browser() const;

    FetchConfig cfg_;
    const std::atomic<bool>* cancel_;
};

} // namespace scrapeguard
