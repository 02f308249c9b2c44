#pragma once

#include "scrapeguard/sandbox.h"

#include <cstddef>
#include <string>
#include <vector>

namespace scrapeguard {

enum class Profile { DEV, PROD };

// Detect profile from SCRAPEGUARD_PROFILE. Default: DEV.
Profile detect_profile();

const char* profile_name(Profile p);

// Sets env vars that are not already set.
// DEV: in-process evaluation, no seccomp, private addresses reachable, generous timeouts.
// PROD: worker isolation, seccomp, private addresses blocked, tight timeouts.
// Call before any worker threads exist (setenv).
void apply_profile_defaults(Profile p);

// Env readers; malformed values fall back to the default.
int getenv_int(const char* name, int defv);
size_t getenv_size(const char* name, size_t defv);
bool getenv_bool(const char* name, bool defv);
std::string getenv_str(const char* name, const std::string& defv = "");

struct ExecutorConfig {
    int max_retries{3};

    // in-process interpreter bounds
    long long eval_max_steps{2000000};
    int eval_timeout_ms{60000};
    size_t max_records{10000};

    // out-of-process evaluation through scrapeguard_worker
    bool isolate{false};
    std::string worker_bin;
    bool enable_seccomp{false};
    SeccompProfile seccomp_profile{SeccompProfile::NET};
    size_t worker_as_mb{1024};
    int worker_cpu_sec{60};
};

struct FetchConfig {
    int http_timeout_ms{10000};
    size_t http_max_bytes{8 * 1024 * 1024};
    std::vector<std::string> allowed_hosts;  // empty: any public host
    bool block_private{false};
    std::string curl_bin{"curl"};
    std::string user_agent{"Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36"};

    std::string browser_bin;                 // empty: search PATH
    int render_timeout_ms{30000};
    int settle_min_ms{3000};
    int settle_max_ms{5000};
    bool browser_no_sandbox{false};
};

struct CodegenConfig {
    std::string cmd;         // SCRAPEGUARD_CODEGEN_CMD, split with split_argv_quoted
    int timeout_ms{120000};
    size_t max_output_bytes{1024 * 1024};
};

ExecutorConfig load_executor_config();
FetchConfig load_fetch_config();
CodegenConfig load_codegen_config();

std::vector<std::string> split_csv(const std::string& s);

} // namespace scrapeguard
