#include "scrapeguard/fetch.h"
#include "scrapeguard/proc.h"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <random>
#include <system_error>

#ifndef _WIN32
#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace scrapeguard {

namespace {

const char* kStatusMarker = "\n__SCRAPEGUARD_STATUS__:";

std::string lower_ascii(std::string s) {
    for (char& c : s) if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
    return s;
}

bool ends_with(const std::string& s, const std::string& suf) {
    return s.size() >= suf.size() && s.compare(s.size() - suf.size(), suf.size(), suf) == 0;
}

std::string curl_error(int exit_code) {
    switch (exit_code) {
        case 6:  return "could not resolve host";
        case 7:  return "failed to connect";
        case 28: return "operation timed out";
        case 35: return "TLS handshake failed";
        case 47: return "too many redirects";
        case 60: return "peer certificate could not be verified";
        case 63: return "response exceeds size limit";
        case 127: return "curl not found";
        default: return "curl exited with code " + std::to_string(exit_code);
    }
}

FetchResult failed(const std::string& url, std::string error) {
    FetchResult r;
    r.url = url;
    r.error = std::move(error);
    return r;
}

} // namespace

std::string normalize_url(const std::string& url) {
    size_t b = url.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = url.find_last_not_of(" \t\r\n");
    std::string u = url.substr(b, e - b + 1);
    if (u.find("://") == std::string::npos) u = "https://" + u;
    return u;
}

bool parse_url(const std::string& url, UrlParts* out) {
    auto p = url.find("://");
    if (p == std::string::npos || p == 0) return false;
    UrlParts parts;
    parts.scheme = lower_ascii(url.substr(0, p));
    std::string rest = url.substr(p + 3);
    auto end = rest.find_first_of("/?#");
    if (end != std::string::npos) rest = rest.substr(0, end);
    auto at = rest.rfind('@');
    if (at != std::string::npos) rest = rest.substr(at + 1);

    if (!rest.empty() && rest[0] == '[') {
        auto close = rest.find(']');
        if (close == std::string::npos) return false;
        parts.host = rest.substr(1, close - 1);
        if (close + 1 < rest.size() && rest[close + 1] == ':') parts.port = rest.substr(close + 2);
    } else {
        auto colon = rest.find(':');
        parts.host = rest.substr(0, colon);
        if (colon != std::string::npos) parts.port = rest.substr(colon + 1);
    }
    parts.host = lower_ascii(parts.host);
    if (parts.host.empty()) return false;
    if (parts.port.empty()) parts.port = parts.scheme == "https" ? "443" : "80";
    if (out) *out = std::move(parts);
    return true;
}

bool host_allowed(const std::string& host, const std::vector<std::string>& allowlist) {
    if (allowlist.empty()) return true;
    const std::string h = lower_ascii(host);
    for (const auto& raw : allowlist) {
        const std::string tok = lower_ascii(raw);
        if (tok == "*") return true;
        if (tok.rfind("*.", 0) == 0) {
            if (ends_with(h, tok.substr(1))) return true;
            continue;
        }
        if (h == tok) return true;
    }
    return false;
}

bool is_private_or_reserved_ip(const std::string& ip) {
#ifndef _WIN32
    struct in_addr addr4;
    if (inet_pton(AF_INET, ip.c_str(), &addr4) == 1) {
        uint32_t h = ntohl(addr4.s_addr);
        if ((h >> 24) == 127) return true;                          // 127.0.0.0/8
        if ((h >> 24) == 10) return true;                           // 10.0.0.0/8
        if ((h >> 20) == (172 << 4 | 1)) return true;               // 172.16.0.0/12
        if ((h >> 16) == (192 << 8 | 168)) return true;             // 192.168.0.0/16
        if ((h >> 16) == (169 << 8 | 254)) return true;             // 169.254.0.0/16, incl. metadata
        if ((h >> 22) == (100 << 2 | 1)) return true;               // 100.64.0.0/10
        if ((h >> 24) == 0) return true;                            // 0.0.0.0/8
        if (h == 0xFFFFFFFF) return true;
        if ((h >> 8) == (192u << 16)) return true;                  // 192.0.0.0/24
        if ((h >> 8) == (192u << 16 | 2)) return true;              // 192.0.2.0/24
        if ((h >> 8) == (198u << 16 | 51 << 8 | 100)) return true;  // 198.51.100.0/24
        if ((h >> 8) == (203u << 16 | 113)) return true;            // 203.0.113.0/24
        return false;
    }
    struct in6_addr addr6;
    if (inet_pton(AF_INET6, ip.c_str(), &addr6) == 1) {
        if (IN6_IS_ADDR_LOOPBACK(&addr6)) return true;
        if (IN6_IS_ADDR_UNSPECIFIED(&addr6)) return true;
        if (IN6_IS_ADDR_LINKLOCAL(&addr6)) return true;
        if (IN6_IS_ADDR_SITELOCAL(&addr6)) return true;
        if ((addr6.s6_addr[0] & 0xfe) == 0xfc) return true;        // fc00::/7
        if (IN6_IS_ADDR_V4MAPPED(&addr6)) {
            char buf[INET_ADDRSTRLEN];
            if (!inet_ntop(AF_INET, &addr6.s6_addr[12], buf, sizeof(buf))) return true;
            return is_private_or_reserved_ip(buf);
        }
    }
#else
    (void)ip;
#endif
    return false;
}

SsrfCheck ssrf_check_host(const std::string& host) {
#ifndef _WIN32
    const std::string lh = lower_ascii(host);
    if (lh == "metadata.google.internal" || lh == "metadata" || lh == "localhost" || ends_with(lh, ".localhost")) {
        return {"blocked host: " + host, ""};
    }

    struct addrinfo hints{};
    struct addrinfo* res = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    int err = getaddrinfo(host.c_str(), nullptr, &hints, &res);
    if (err != 0) return {std::string("could not resolve host: ") + gai_strerror(err), ""};

    std::string first_ip;
    for (auto* rp = res; rp; rp = rp->ai_next) {
        char ip[INET6_ADDRSTRLEN]{};
        if (rp->ai_family == AF_INET) {
            inet_ntop(AF_INET, &((struct sockaddr_in*)rp->ai_addr)->sin_addr, ip, sizeof(ip));
        } else if (rp->ai_family == AF_INET6) {
            inet_ntop(AF_INET6, &((struct sockaddr_in6*)rp->ai_addr)->sin6_addr, ip, sizeof(ip));
        }
        if (!ip[0]) continue;
        if (is_private_or_reserved_ip(ip)) {
            freeaddrinfo(res);
            return {std::string("resolves to private address ") + ip, ""};
        }
        if (first_ip.empty()) first_ip = ip;
    }
    freeaddrinfo(res);
    return {"", first_ip};
#else
    (void)host;
    return {"", ""};
#endif
}

std::string check_fetch_target(const std::string& url, const FetchConfig& cfg, SsrfCheck* pinned) {
    UrlParts parts;
    if (!parse_url(url, &parts)) return "cannot parse url: " + url;
    if (parts.scheme != "http" && parts.scheme != "https") return "only http/https allowed";
    if (!host_allowed(parts.host, cfg.allowed_hosts)) return "host not allowed: " + parts.host;
    if (cfg.block_private) {
        if (is_private_or_reserved_ip(parts.host)) return "SSRF blocked: private address " + parts.host;
        SsrfCheck c = ssrf_check_host(parts.host);
        if (!c.error.empty()) return "SSRF blocked: " + c.error;
        if (pinned) *pinned = std::move(c);
    }
    return "";
}

int settle_jitter_ms(const FetchConfig& cfg) {
    if (cfg.settle_max_ms <= cfg.settle_min_ms) return cfg.settle_min_ms;
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(cfg.settle_min_ms, cfg.settle_max_ms);
    return dist(rng);
}

BrowserSession::BrowserSession() {
    std::error_code ec;
    std::filesystem::path tmpl = std::filesystem::temp_directory_path(ec);
    if (ec) tmpl = "/tmp";
    std::string pattern = (tmpl / "scrapeguard-browser-XXXXXX").string();
#ifndef _WIN32
    if (char* d = mkdtemp(pattern.data())) {
        dir_ = d;
    } else {
        error_ = std::string("mkdtemp failed: ") + std::strerror(errno);
    }
#else
    error_ = "browser sessions are not supported on Windows";
#endif
}

BrowserSession::~BrowserSession() {
    if (dir_.empty()) return;
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
}

ProcessFetcher::ProcessFetcher(FetchConfig cfg, const std::atomic<bool>* cancel)
    : cfg_(std::move(cfg)), cancel_(cancel) {}

FetchResult ProcessFetcher::fetch_static(const FetchRequest& req) {
    const std::string url = normalize_url(req.url);
    SsrfCheck pin;
    if (std::string err = check_fetch_target(url, cfg_, &pin); !err.empty()) return failed(url, err);

    const int timeout_ms = req.timeout_ms > 0 ? req.timeout_ms : cfg_.http_timeout_ms;
    const int max_time_s = std::max(1, (timeout_ms + 999) / 1000);

    std::vector<std::string> argv = {
        cfg_.curl_bin, "-sS", "--compressed",
        "--max-time", std::to_string(max_time_s),
        "--max-filesize", std::to_string(cfg_.http_max_bytes),
        "--proto", "=http,https",
        "--proto-redir", "=http,https",
    };
    // A pinned address only covers the first hop, so redirects stay off
    // whenever private addresses are blocked.
    if (cfg_.block_private) {
        argv.insert(argv.end(), {"--max-redirs", "0"});
    } else {
        argv.insert(argv.end(), {"-L", "--max-redirs", "5"});
    }
    if (!pin.resolved_ip.empty()) {
        UrlParts parts;
        parse_url(url, &parts);
        std::string ip = pin.resolved_ip.find(':') != std::string::npos ? "[" + pin.resolved_ip + "]" : pin.resolved_ip;
        argv.push_back("--resolve");
        argv.push_back(parts.host + ":" + parts.port + ":" + ip);
    }
    for (const auto& [k, v] : req.headers) {
        if (lower_ascii(k) == "accept-encoding") continue; // --compressed negotiates
        argv.push_back("-H");
        argv.push_back(k + ": " + v);
    }
    argv.push_back("-w");
    argv.push_back(std::string(kStatusMarker) + "%{http_code}");
    argv.push_back("--");
    argv.push_back(url);

    ProcLimits lim;
    lim.timeout_ms = timeout_ms + 1000;
    lim.stdout_max_bytes = cfg_.http_max_bytes + 64;
    lim.rlimit_cpu_sec = max_time_s + 2;
    lim.rlimit_as_mb = 1024;
    lim.rlimit_fsize_mb = 1;
    lim.rlimit_nofile = 64;
    lim.rlimit_nproc = 0;
    lim.merge_stderr = false;
    lim.cancel = cancel_;

    ProcResult pr;
    if (!proc_run_capture_sandboxed(argv, "", lim, &pr)) return failed(url, pr.error);

    FetchResult r;
    r.url = url;
    r.timed_out = pr.timed_out;
    r.cancelled = pr.cancelled;
    if (pr.cancelled) { r.error = "fetch cancelled"; return r; }
    if (pr.timed_out) { r.error = "fetch timed out after " + std::to_string(timeout_ms) + " ms"; return r; }
    if (pr.output_truncated) { r.error = curl_error(63); return r; }
    if (pr.exit_code != 0) { r.error = curl_error(pr.exit_code); return r; }

    auto m = pr.output.rfind(kStatusMarker);
    if (m == std::string::npos) { r.error = "malformed curl output"; return r; }
    try {
        r.status_code = std::stoi(pr.output.substr(m + std::strlen(kStatusMarker)));
    } catch (const std::exception&) {
        r.error = "malformed curl status";
        return r;
    }
    r.body = pr.output.substr(0, m);
    if (r.status_code < 200 || r.status_code >= 300) {
        r.error = "HTTP " + std::to_string(r.status_code);
        return r;
    }
    r.ok = true;
    return r;
}

std::string ProcessFetcher::find_browser() const {
    if (!cfg_.browser_bin.empty()) return cfg_.browser_bin;
#ifndef _WIN32
    const char* path = std::getenv("PATH");
    if (!path) return "";
    static const char* kCandidates[] = {"chromium", "chromium-browser", "google-chrome", "google-chrome-stable", "chrome"};
    std::string p = path;
    size_t start = 0;
    while (start <= p.size()) {
        size_t colon = p.find(':', start);
        if (colon == std::string::npos) colon = p.size();
        const std::string dir = p.substr(start, colon - start);
        start = colon + 1;
        if (dir.empty()) continue;
        for (const char* name : kCandidates) {
            std::string cand = dir + "/" + name;
            if (access(cand.c_str(), X_OK) == 0) return cand;
        }
    }
#endif
    return "";
}

FetchResult ProcessFetcher::fetch_rendered(const FetchRequest& req) {
    const std::string url = normalize_url(req.url);
    SsrfCheck pin;
    if (std::string err = check_fetch_target(url, cfg_, &pin); !err.empty()) return failed(url, err);

    const std::string browser = find_browser();
    if (browser.empty()) return failed(url, "browser launch failed: no chromium/chrome executable found");

    BrowserSession session;
    if (!session.ok()) return failed(url, "browser launch failed: " + session.error());

    const int timeout_ms = req.timeout_ms > 0 ? req.timeout_ms : cfg_.render_timeout_ms;
    const int settle_ms = std::max(0, req.settle_ms);

    std::string user_agent = cfg_.user_agent;
    std::string lang = "en-US";
    for (const auto& [k, v] : req.headers) {
        const std::string lk = lower_ascii(k);
        if (lk == "user-agent") user_agent = v;
        else if (lk == "accept-language") lang = v.substr(0, v.find(','));
    }

    std::vector<std::string> argv = {
        browser,
        "--headless=new",
        "--disable-gpu",
        "--disable-extensions",
        "--disable-background-networking",
        "--no-first-run",
        "--no-default-browser-check",
        "--mute-audio",
        "--hide-scrollbars",
        "--user-data-dir=" + session.profile_dir().string(),
        "--user-agent=" + user_agent,
        "--lang=" + lang,
        "--timeout=" + std::to_string(timeout_ms),
        "--virtual-time-budget=" + std::to_string(settle_ms),
    };
    if (cfg_.browser_no_sandbox) argv.push_back("--no-sandbox");
    if (!pin.resolved_ip.empty()) {
        UrlParts parts;
        parse_url(url, &parts);
        std::string ip = pin.resolved_ip.find(':') != std::string::npos ? "[" + pin.resolved_ip + "]" : pin.resolved_ip;
        argv.push_back("--host-resolver-rules=MAP " + parts.host + " " + ip);
    }
    argv.push_back("--dump-dom");
    argv.push_back(url);

    ProcLimits lim;
    lim.timeout_ms = timeout_ms + settle_ms + 5000;
    lim.stdout_max_bytes = cfg_.http_max_bytes;
    // Chromium reserves large address ranges and forks helper processes.
    lim.rlimit_as_mb = 0;
    lim.rlimit_nproc = 0;
    lim.rlimit_cpu_sec = std::max(10, lim.timeout_ms / 1000 * 2);
    lim.rlimit_fsize_mb = 64;
    lim.rlimit_nofile = 1024;
    lim.merge_stderr = false;
    lim.kill_group_on_exit = true;
    lim.cancel = cancel_;

    ProcResult pr;
    if (!proc_run_capture_sandboxed(argv, session.profile_dir().string(), lim, &pr)) {
        return failed(url, "browser launch failed: " + pr.error);
    }

    FetchResult r;
    r.url = url;
    r.timed_out = pr.timed_out;
    r.cancelled = pr.cancelled;
    if (pr.cancelled) { r.error = "render cancelled"; return r; }
    if (pr.timed_out) { r.error = "navigation timed out after " + std::to_string(timeout_ms) + " ms"; return r; }
    if (pr.exit_code == 127) { r.error = "browser launch failed: cannot execute " + browser; return r; }
    if (pr.output.find_first_not_of(" \t\r\n") == std::string::npos) {
        r.error = "browser produced no DOM (exit code " + std::to_string(pr.exit_code) + ")";
        return r;
    }
    r.body = std::move(pr.output);
    r.ok = true;
    return r;
}

} // namespace scrapeguard
