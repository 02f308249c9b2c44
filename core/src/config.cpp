#include "scrapeguard/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace scrapeguard {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

} // namespace

Profile detect_profile() {
    const char* env = std::getenv("SCRAPEGUARD_PROFILE");
    if (!env) return Profile::DEV;
    const std::string val = lower(env);
    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("SCRAPEGUARD_ISOLATE",            "0",     NO_OVERWRITE);
            setenv("SCRAPEGUARD_SECCOMP_ENABLE",     "0",     NO_OVERWRITE);
            setenv("SCRAPEGUARD_HTTP_BLOCK_PRIVATE", "0",     NO_OVERWRITE);
            setenv("SCRAPEGUARD_EVAL_TIMEOUT_MS",    "60000", NO_OVERWRITE);
            setenv("SCRAPEGUARD_HTTP_TIMEOUT_MS",    "10000", NO_OVERWRITE);
            setenv("SCRAPEGUARD_RENDER_TIMEOUT_MS",  "30000", NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("SCRAPEGUARD_ISOLATE",            "1",     NO_OVERWRITE);
            setenv("SCRAPEGUARD_SECCOMP_ENABLE",     "1",     NO_OVERWRITE);
            setenv("SCRAPEGUARD_SECCOMP_PROFILE",    "net",   NO_OVERWRITE);
            setenv("SCRAPEGUARD_HTTP_BLOCK_PRIVATE", "1",     NO_OVERWRITE);
            setenv("SCRAPEGUARD_EVAL_TIMEOUT_MS",    "30000", NO_OVERWRITE);
            setenv("SCRAPEGUARD_HTTP_TIMEOUT_MS",    "8000",  NO_OVERWRITE);
            setenv("SCRAPEGUARD_RENDER_TIMEOUT_MS",  "20000", NO_OVERWRITE);
            break;
    }
}

int getenv_int(const char* name, int defv) {
    if (const char* v = std::getenv(name)) {
        try { return std::stoi(v); } catch (const std::exception&) { return defv; }
    }
    return defv;
}

size_t getenv_size(const char* name, size_t defv) {
    if (const char* v = std::getenv(name)) {
        try { return (size_t)std::stoull(v); } catch (const std::exception&) { return defv; }
    }
    return defv;
}

bool getenv_bool(const char* name, bool defv) {
    const char* v = std::getenv(name);
    if (!v) return defv;
    const std::string s = lower(v);
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return defv;
}

std::string getenv_str(const char* name, const std::string& defv) {
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : defv;
}

std::vector<std::string> split_csv(const std::string& s) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
        size_t comma = s.find(',', start);
        if (comma == std::string::npos) comma = s.size();
        std::string item = trim(s.substr(start, comma - start));
        if (!item.empty()) out.push_back(std::move(item));
        start = comma + 1;
    }
    return out;
}

ExecutorConfig load_executor_config() {
    ExecutorConfig c;
    c.max_retries = std::max(0, getenv_int("SCRAPEGUARD_MAX_RETRIES", c.max_retries));
    c.eval_max_steps = (long long)getenv_size("SCRAPEGUARD_EVAL_MAX_STEPS", (size_t)c.eval_max_steps);
    c.eval_timeout_ms = getenv_int("SCRAPEGUARD_EVAL_TIMEOUT_MS", c.eval_timeout_ms);
    c.max_records = getenv_size("SCRAPEGUARD_MAX_RECORDS", c.max_records);
    c.isolate = getenv_bool("SCRAPEGUARD_ISOLATE", c.isolate);
    c.worker_bin = getenv_str("SCRAPEGUARD_WORKER_BIN");
    c.enable_seccomp = getenv_bool("SCRAPEGUARD_SECCOMP_ENABLE", c.enable_seccomp);
    c.seccomp_profile = seccomp_profile_from_string(
        getenv_str("SCRAPEGUARD_SECCOMP_PROFILE", seccomp_profile_name(c.seccomp_profile)));
    c.worker_as_mb = getenv_size("SCRAPEGUARD_WORKER_RLIMIT_AS_MB", c.worker_as_mb);
    c.worker_cpu_sec = getenv_int("SCRAPEGUARD_WORKER_RLIMIT_CPU_SEC", c.worker_cpu_sec);
    return c;
}

FetchConfig load_fetch_config() {
    FetchConfig c;
    c.http_timeout_ms = getenv_int("SCRAPEGUARD_HTTP_TIMEOUT_MS", c.http_timeout_ms);
    c.http_max_bytes = getenv_size("SCRAPEGUARD_HTTP_MAX_BYTES", c.http_max_bytes);
    c.allowed_hosts = split_csv(getenv_str("SCRAPEGUARD_HTTP_ALLOWED_HOSTS"));
    for (auto& h : c.allowed_hosts) h = lower(h);
    c.block_private = getenv_bool("SCRAPEGUARD_HTTP_BLOCK_PRIVATE", c.block_private);
    c.curl_bin = getenv_str("SCRAPEGUARD_CURL", c.curl_bin);
    c.user_agent = getenv_str("SCRAPEGUARD_USER_AGENT", c.user_agent);
    c.browser_bin = getenv_str("SCRAPEGUARD_BROWSER");
    c.render_timeout_ms = getenv_int("SCRAPEGUARD_RENDER_TIMEOUT_MS", c.render_timeout_ms);
    c.settle_min_ms = std::max(0, getenv_int("SCRAPEGUARD_RENDER_SETTLE_MIN_MS", c.settle_min_ms));
    c.settle_max_ms = std::max(c.settle_min_ms, getenv_int("SCRAPEGUARD_RENDER_SETTLE_MAX_MS", c.settle_max_ms));
    c.browser_no_sandbox = getenv_bool("SCRAPEGUARD_BROWSER_NO_SANDBOX", c.browser_no_sandbox);
    return c;
}

CodegenConfig load_codegen_config() {
    CodegenConfig c;
    c.cmd = getenv_str("SCRAPEGUARD_CODEGEN_CMD");
    c.timeout_ms = getenv_int("SCRAPEGUARD_CODEGEN_TIMEOUT_MS", c.timeout_ms);
    c.max_output_bytes = getenv_size("SCRAPEGUARD_CODEGEN_MAX_BYTES", c.max_output_bytes);
    return c;
}

} // namespace scrapeguard
