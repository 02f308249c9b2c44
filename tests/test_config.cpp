#include "test_common.h"
#include "scrapeguard/config.h"
#include <cstdlib>

using namespace scrapeguard;

static std::string env_or_empty(const char* k) {
    const char* v = std::getenv(k);
    return v ? v : "";
}

int main() {
    // Test 1: Default profile is DEV
    unsetenv("SCRAPEGUARD_PROFILE");
    expect_true(detect_profile() == Profile::DEV, "default should be DEV");

    // Test 2: PROD detection, case insensitive
    setenv("SCRAPEGUARD_PROFILE", "prod", 1);
    expect_true(detect_profile() == Profile::PROD, "should detect PROD");
    setenv("SCRAPEGUARD_PROFILE", "PROD", 1);
    expect_true(detect_profile() == Profile::PROD, "should detect PROD case-insensitive");
    setenv("SCRAPEGUARD_PROFILE", "staging", 1);
    expect_true(detect_profile() == Profile::DEV, "unknown profile falls back to DEV");

    // Test 3: Apply defaults does not override existing values
    setenv("SCRAPEGUARD_EVAL_TIMEOUT_MS", "42", 1);
    unsetenv("SCRAPEGUARD_ISOLATE");
    unsetenv("SCRAPEGUARD_HTTP_BLOCK_PRIVATE");
    apply_profile_defaults(Profile::PROD);
    expect_true(env_or_empty("SCRAPEGUARD_EVAL_TIMEOUT_MS") == "42", "should NOT override pre-existing env var");
    expect_true(env_or_empty("SCRAPEGUARD_ISOLATE") == "1", "PROD should isolate");
    expect_true(env_or_empty("SCRAPEGUARD_HTTP_BLOCK_PRIVATE") == "1", "PROD should block private hosts");

    ExecutorConfig ec = load_executor_config();
    expect_true(ec.isolate, "isolate loaded");
    expect_eq_ll(ec.eval_timeout_ms, 42, "eval timeout from env");
    expect_true(ec.seccomp_profile == SeccompProfile::NET, "PROD seccomp profile is net");
    FetchConfig fc = load_fetch_config();
    expect_true(fc.block_private, "block_private loaded");

    // Test 4: Malformed values fall back to defaults; retries never negative
    setenv("SCRAPEGUARD_MAX_RETRIES", "lots", 1);
    expect_eq_ll(load_executor_config().max_retries, 3, "malformed int uses default");
    setenv("SCRAPEGUARD_MAX_RETRIES", "-4", 1);
    expect_eq_ll(load_executor_config().max_retries, 0, "negative retries clamp to 0");
    setenv("SCRAPEGUARD_ISOLATE", "maybe", 1);
    expect_true(getenv_bool("SCRAPEGUARD_ISOLATE", false) == false, "malformed bool uses default");

    // Test 5: Settle window is ordered
    setenv("SCRAPEGUARD_RENDER_SETTLE_MIN_MS", "4000", 1);
    setenv("SCRAPEGUARD_RENDER_SETTLE_MAX_MS", "1000", 1);
    fc = load_fetch_config();
    expect_eq_ll(fc.settle_min_ms, 4000, "settle min");
    expect_eq_ll(fc.settle_max_ms, 4000, "settle max raised to min");

    // Test 6: Host allowlist parsing
    setenv("SCRAPEGUARD_HTTP_ALLOWED_HOSTS", " Example.com, ,api.example.org ", 1);
    fc = load_fetch_config();
    expect_eq_ll((long long)fc.allowed_hosts.size(), 2, "two hosts");
    expect_true(fc.allowed_hosts[0] == "example.com", "hosts lowercased and trimmed");

    // Test 7: Profile names
    expect_true(std::string(profile_name(Profile::DEV)) == "dev", "dev name");
    expect_true(std::string(profile_name(Profile::PROD)) == "prod", "prod name");

    // Cleanup
    for (const char* k : {"SCRAPEGUARD_PROFILE", "SCRAPEGUARD_EVAL_TIMEOUT_MS", "SCRAPEGUARD_ISOLATE",
                          "SCRAPEGUARD_HTTP_BLOCK_PRIVATE", "SCRAPEGUARD_MAX_RETRIES",
                          "SCRAPEGUARD_RENDER_SETTLE_MIN_MS", "SCRAPEGUARD_RENDER_SETTLE_MAX_MS",
                          "SCRAPEGUARD_HTTP_ALLOWED_HOSTS", "SCRAPEGUARD_SECCOMP_ENABLE",
                          "SCRAPEGUARD_SECCOMP_PROFILE", "SCRAPEGUARD_HTTP_TIMEOUT_MS",
                          "SCRAPEGUARD_RENDER_TIMEOUT_MS"}) {
        unsetenv(k);
    }

    std::cerr << "test_config: ALL PASSED" << std::endl;
    return 0;
}
