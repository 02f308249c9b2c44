#include "test_common.h"

#include "../runner/runner_utils.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace scrapeguard;

static bool is_hex(const std::string& s) {
    for (char c : s) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
    }
    return true;
}

static void test_run_id_shape() {
    unsetenv("SCRAPEGUARD_DETERMINISTIC_RUN_ID");
    const std::string a = gen_run_id();
    const std::string b = gen_run_id();
    expect_eq_ll((long long)a.size(), 32, "run id length: " + a);
    expect_true(is_hex(a), "run id is lowercase hex: " + a);
    expect_true(a != b, "run ids differ");
}

static void test_run_id_deterministic() {
    setenv("SCRAPEGUARD_DETERMINISTIC_RUN_ID", "1", 1);
    const std::string a = gen_run_id();
    const std::string b = gen_run_id();
    unsetenv("SCRAPEGUARD_DETERMINISTIC_RUN_ID");
    expect_true(a == b, "deterministic run id repeats");
    expect_eq_ll((long long)a.size(), 32, "deterministic length");
}

static void test_slurp() {
    const auto p = std::filesystem::temp_directory_path() / "scrapeguard_slurp.txt";
    std::ofstream(p) << "line1\nline2";
    expect_true(slurp(p.string()) == "line1\nline2", "slurp content");
    std::filesystem::remove(p);

    bool threw = false;
    try {
        slurp(p.string());
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()) == "cannot open: " + p.string();
    }
    expect_true(threw, "missing file throws");
}

static void test_set_env_if_missing() {
    unsetenv("SCRAPEGUARD_TEST_ENV");
    set_env_if_missing("SCRAPEGUARD_TEST_ENV", "first");
    set_env_if_missing("SCRAPEGUARD_TEST_ENV", "second");
    const char* v = std::getenv("SCRAPEGUARD_TEST_ENV");
    expect_true(v && std::string(v) == "first", "existing value kept");
    unsetenv("SCRAPEGUARD_TEST_ENV");
}

static void test_resolve_root_env() {
    const auto dir = std::filesystem::temp_directory_path() / "scrapeguard_root_test";
    std::filesystem::create_directories(dir / "logs");
    setenv("SCRAPEGUARD_ROOT", dir.string().c_str(), 1);
    expect_true(resolve_root(nullptr) == std::filesystem::canonical(dir), "env root wins");

    setenv("SCRAPEGUARD_ROOT", (dir / "missing").string().c_str(), 1);
    const auto exe = dir / "bin" / "scrapeguard_cli";
    std::filesystem::create_directories(exe.parent_path());
    std::ofstream(exe) << "";
    expect_true(resolve_root(exe.string().c_str()) == std::filesystem::canonical(dir), "walks up to logs dir");

    unsetenv("SCRAPEGUARD_ROOT");
    std::filesystem::remove_all(dir);
}

static void test_now_ms_monotonic() {
    const long long a = now_ms();
    const long long b = now_ms();
    expect_true(b >= a, "steady clock");
}

int main() {
    test_run_id_shape();
    test_run_id_deterministic();
    test_slurp();
    test_set_env_if_missing();
    test_resolve_root_env();
    test_now_ms_monotonic();

    std::cerr << "test_runner_utils: ALL PASSED" << std::endl;
    return 0;
}
