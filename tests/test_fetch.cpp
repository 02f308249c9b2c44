#include "test_common.h"
#include "scrapeguard/fetch.h"

#include <filesystem>
#include <fstream>
#include <string>

using namespace scrapeguard;

int main() {
    // Test 1: URL normalization
    expect_true(normalize_url(" example.com/x ") == "https://example.com/x", "scheme added");
    expect_true(normalize_url("http://example.com") == "http://example.com", "scheme kept");
    expect_true(normalize_url("  \t ").empty(), "blank url");

    // Test 2: URL parsing
    {
        UrlParts p;
        expect_true(parse_url("http://Example.COM", &p), "parse plain");
        expect_true(p.scheme == "http" && p.host == "example.com" && p.port == "80", "host lowered, default port 80");
        expect_true(parse_url("HTTPS://user:pw@Api.Example.com:8443/p?q=1", &p), "parse userinfo");
        expect_true(p.scheme == "https" && p.host == "api.example.com" && p.port == "8443", "userinfo stripped: " + p.host);
        expect_true(parse_url("https://user@[::1]:9443/p", &p), "parse ipv6");
        expect_true(p.host == "::1" && p.port == "9443", "ipv6 brackets stripped: " + p.host);
        expect_true(parse_url("https://[2001:db8::1]/", &p) && p.port == "443", "ipv6 default port");
        expect_true(!parse_url("nohost", &p), "no scheme");
        expect_true(!parse_url("http:///path", &p), "empty host");
        expect_true(!parse_url("https://[::1/", &p), "unterminated bracket");
    }

    // Test 3: host allowlist
    {
        expect_true(host_allowed("anything.org", {}), "empty allowlist allows all");
        expect_true(host_allowed("x.org", {"*"}), "star");
        std::vector<std::string> al = {"example.com", "*.shop.test"};
        expect_true(host_allowed("example.com", al), "exact");
        expect_true(host_allowed("EXAMPLE.com", al), "case-insensitive");
        expect_true(!host_allowed("api.example.com", al), "exact does not cover subdomains");
        expect_true(host_allowed("eu.shop.test", al), "wildcard subdomain");
        expect_true(host_allowed("a.b.shop.test", al), "wildcard nested subdomain");
        expect_true(!host_allowed("shop.test", al), "wildcard excludes apex");
        expect_true(!host_allowed("evilshop.test", al), "wildcard needs a dot boundary");
    }

    // Test 4: private and reserved addresses
    {
        for (const char* ip : {"127.0.0.1", "10.1.2.3", "172.16.0.1", "172.31.255.255", "192.168.1.1",
                               "169.254.169.254", "100.64.0.1", "0.0.0.0", "255.255.255.255",
                               "192.0.2.5", "198.51.100.7", "203.0.113.9",
                               "::1", "::", "fe80::1", "fd00::1", "::ffff:10.0.0.1", "::ffff:127.0.0.1"}) {
            expect_true(is_private_or_reserved_ip(ip), std::string("private: ") + ip);
        }
        for (const char* ip : {"8.8.8.8", "172.32.0.1", "100.128.0.1", "1.1.1.1",
                               "2001:4860:4860::8888", "::ffff:8.8.8.8", "example.com", ""}) {
            expect_true(!is_private_or_reserved_ip(ip), std::string("public or not an ip: ") + ip);
        }
    }

    // Test 5: fetch target checks
    {
        FetchConfig cfg;
        expect_true(check_fetch_target("ftp://example.com/f", cfg) == "only http/https allowed", "scheme");
        expect_true(check_fetch_target("file:///etc/passwd", cfg).rfind("cannot parse url", 0) == 0, "no host");
        expect_true(check_fetch_target("http://localhost:8080/", cfg).empty(), "private allowed when not blocked");

        cfg.allowed_hosts = {"example.com"};
        expect_true(check_fetch_target("https://example.com/", cfg).empty(), "allowlisted host");
        expect_true(check_fetch_target("https://other.org/", cfg) == "host not allowed: other.org", "allowlist");

        cfg.allowed_hosts.clear();
        cfg.block_private = true;
        expect_true(check_fetch_target("http://127.0.0.1/", cfg) == "SSRF blocked: private address 127.0.0.1", "loopback literal");
        expect_true(check_fetch_target("http://[::1]:80/", cfg) == "SSRF blocked: private address ::1", "ipv6 loopback literal");
        expect_true(check_fetch_target("http://localhost/", cfg) == "SSRF blocked: blocked host: localhost", "localhost name");
        expect_true(check_fetch_target("http://metadata.google.internal/", cfg).rfind("SSRF blocked: blocked host", 0) == 0, "metadata name");
    }

    // Test 6: fetchers refuse blocked targets without spawning anything
    {
        FetchConfig cfg;
        cfg.block_private = true;
        cfg.curl_bin = "/nonexistent/curl";
        ProcessFetcher f(cfg);
        FetchRequest req;
        req.url = "127.0.0.1/admin";
        FetchResult r = f.fetch_static(req);
        expect_true(!r.ok, "static fetch refused");
        expect_true(r.url == "https://127.0.0.1/admin", "url normalized: " + r.url);
        expect_true(r.error.find("SSRF blocked") != std::string::npos, "static error: " + r.error);

        req.url = "ftp://example.com/";
        r = f.fetch_rendered(req);
        expect_true(!r.ok && r.error == "only http/https allowed", "rendered error: " + r.error);
    }

    // Test 7: settle jitter stays inside the window
    {
        FetchConfig cfg;
        cfg.settle_min_ms = 100;
        cfg.settle_max_ms = 200;
        for (int i = 0; i < 200; ++i) {
            int v = settle_jitter_ms(cfg);
            expect_true(v >= 100 && v <= 200, "jitter in range: " + std::to_string(v));
        }
        cfg.settle_max_ms = 50;
        expect_eq_ll(settle_jitter_ms(cfg), 100, "degenerate window returns min");
    }

    // Test 8: browser profile directory is removed with the session
    {
        std::filesystem::path dir;
        {
            BrowserSession s;
            expect_true(s.ok(), "session created: " + s.error());
            dir = s.profile_dir();
            expect_true(std::filesystem::is_directory(dir), "profile dir exists");
            std::filesystem::create_directories(dir / "Default");
            std::ofstream(dir / "Default" / "Cookies") << "x";
        }
        expect_true(!std::filesystem::exists(dir), "profile dir removed");
    }

    std::cerr << "test_fetch: ALL PASSED" << std::endl;
    return 0;
}
