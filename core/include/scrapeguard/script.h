#pragma once

// Embedded interpreter for extraction scripts.
//
// Scripts are a small brace-block statement language:
//
//   page = fetch(url)
//   for a in find_all(page, "a") {
//       href = a["attrs"].get("href", "")
//       if href.startswith("mailto:") {
//           emit({"email": href.replace("mailto:", ""), "source": url})
//       }
//   }
//
// Statements: assignment (name, index, or "a, b = ..." unpacking), "+=" and
// friends, if/elif/else, for-in, while, break, continue, pass, import.
// Expressions: literals, lists, dicts, arithmetic, comparisons, "in",
// and/or/not, calls, indexing, slicing and method calls.
//
// Every name that is not a script variable, every import and every method
// name is resolved through SandboxPolicy::authorize. The only side channels
// are the helpers bound into the scope (fetch, emit, ...) and the `results`
// list, which is what the caller reads back.

#include "scrapeguard/config.h"
#include "scrapeguard/fetch.h"
#include "scrapeguard/value.h"

#include <atomic>
#include <functional>
#include <stdexcept>
#include <string>

namespace scrapeguard {

class ScriptError : public std::runtime_error {
public:
    ScriptError(int line, const std::string& msg)
        : std::runtime_error(msg), line_(line) {}

    int line() const { return line_; }

private:
    int line_;
};

struct ScriptLimits {
    long long max_steps{2000000};
    int timeout_ms{60000};             // wall clock, fetches included
    size_t max_records{10000};         // emit() cap
    size_t max_collection{1000000};    // range(), list/str repetition
    size_t max_string_bytes{16 * 1024 * 1024};
    int max_nesting{100};              // list/dict depth, below kMaxValueDepth
    size_t max_output_bytes{64 * 1024};
    int max_sleep_ms{10000};           // per sleep_jitter() call
    int max_fetches{25};
};

struct ScriptContext {
    std::string url;
    IFetcher* fetcher{nullptr};        // null: fetch helpers raise
    FetchConfig fetch;
    ScriptLimits limits;
    const std::atomic<bool>* cancel{nullptr};
    std::function<void(int)> sleeper;  // null: sleeps the calling thread
};

struct ScriptRun {
    bool ok{false};
    Value results;            // final value bound to `results`
    std::string output;       // captured print()
    std::string error;        // "line N: message"
    int error_line{0};
    long long steps{0};
    bool timed_out{false};
    bool cancelled{false};
    int fetches{0};
};

ScriptRun run_script(const std::string& code, const ScriptContext& ctx);

// Parse only. Empty string when the code is syntactically valid.
std::string check_syntax(const std::string& code);

} // namespace scrapeguard
