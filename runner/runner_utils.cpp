#include "runner_utils.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <random>
#include <stdexcept>

namespace scrapeguard {

namespace {

std::string getenv_or_empty(const char* key) {
    const char* v = std::getenv(key);
    return v ? v : "";
}

bool is_system_dir(const std::filesystem::path& p) {
    for (const char* d : {"/", "/etc", "/usr", "/var", "/home", "/root", "/tmp"}) {
        if (p == d) return true;
    }
    return false;
}

std::filesystem::path checked_root(std::filesystem::path root) {
    std::error_code ec;
    auto canon = std::filesystem::weakly_canonical(root, ec);
    if (!ec && is_system_dir(canon)) {
        std::cerr << "[warn] project root resolves to system directory " << canon
                  << "; logs go to " << (canon / "logs") << "\n";
    }
    return root;
}

bool looks_like_root(const std::filesystem::path& dir) {
    std::error_code ec;
    return std::filesystem::is_directory(dir / "logs", ec) || std::filesystem::exists(dir / "CMakeLists.txt", ec);
}

} // namespace

std::filesystem::path resolve_root(const char* argv0) {
    namespace fs = std::filesystem;
    std::error_code ec;

    const std::string env = getenv_or_empty("SCRAPEGUARD_ROOT");
    if (!env.empty() && fs::exists(env, ec)) {
        fs::path canon = fs::canonical(env, ec);
        if (!ec) return checked_root(canon);
    }

    fs::path start;
    if (argv0 && *argv0) {
        fs::path exe = fs::absolute(argv0, ec);
        if (!ec && fs::exists(exe, ec)) {
            fs::path canon = fs::canonical(exe, ec);
            if (!ec) exe = canon;
        }
        start = exe.parent_path();
    }
    if (start.empty()) start = fs::current_path(ec);

    fs::path dir = start;
    for (int depth = 0; depth < 8 && !dir.empty(); depth++) {
        if (looks_like_root(dir)) return checked_root(dir);
        fs::path up = dir.parent_path();
        if (up == dir) break;
        dir = up;
    }
    return checked_root(fs::current_path(ec));
}

void set_env_if_missing(const char* key, const std::string& value) {
    // overwrite=0 leaves an existing value alone
    setenv(key, value.c_str(), 0);
}

std::string slurp(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("cannot open: " + path);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::string gen_run_id() {
    uint64_t seed = 1234567ULL;
    if (getenv_or_empty("SCRAPEGUARD_DETERMINISTIC_RUN_ID") != "1") {
        seed = (uint64_t)std::chrono::system_clock::now().time_since_epoch().count();
        try {
            std::random_device entropy;
            seed ^= ((uint64_t)entropy() << 32) | (uint64_t)entropy();
        } catch (const std::exception&) {
            // clock only
        }
    }

    std::mt19937_64 rng{seed};
    char buf[33];
    std::snprintf(buf, sizeof(buf), "%016llx%016llx",
                  (unsigned long long)rng(), (unsigned long long)rng());
    return buf;
}

long long now_ms() {
    return (long long)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

} // namespace scrapeguard
