#pragma once

#include <filesystem>
#include <string>

namespace scrapeguard {

// SCRAPEGUARD_ROOT when it exists; otherwise the nearest ancestor of the
// executable holding a "logs" directory or a CMakeLists.txt; otherwise cwd.
std::filesystem::path resolve_root(const char* argv0);

void set_env_if_missing(const char* key, const std::string& value);

// Throws std::runtime_error("cannot open: <path>").
std::string slurp(const std::string& path);

// 32 hex chars. SCRAPEGUARD_DETERMINISTIC_RUN_ID=1 pins the seed.
std::string gen_run_id();

// Milliseconds since an arbitrary steady epoch.
long long now_ms();

} // namespace scrapeguard
