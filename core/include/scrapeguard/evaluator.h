#pragma once

#include "scrapeguard/config.h"
#include "scrapeguard/fetch.h"
#include "scrapeguard/script.h"
#include "scrapeguard/value.h"

#include <atomic>
#include <string>

namespace scrapeguard {

struct EvalOutcome {
    bool ok{false};
    Value results;         // value bound to `results` when the script finished
    std::string error;     // "line N: ..." for script errors, runner text otherwise
    std::string output;    // captured print()
    long long steps{0};
    int fetches{0};
    bool timed_out{false};
    bool cancelled{false};
};

// The evaluation primitive: run generated code against a URL and hand back
// whatever it left in `results`.
class IEvaluator {
public:
    virtual ~IEvaluator() = default;
    virtual EvalOutcome evaluate(const std::string& code, const std::string& url) = 0;
};

ScriptLimits script_limits_from(const ExecutorConfig& cfg);
EvalOutcome outcome_from_run(const ScriptRun& run);

// Runs the interpreter on the calling thread.
class InProcessEvaluator : public IEvaluator {
public:
    InProcessEvaluator(IFetcher* fetcher, FetchConfig fetch, ScriptLimits limits,
                       const std::atomic<bool>* cancel = nullptr);

    EvalOutcome evaluate(const std::string& code, const std::string& url) override;

private:
    IFetcher* fetcher_;
    FetchConfig fetch_;
    ScriptLimits limits_;
    const std::atomic<bool>* cancel_;
};

// Runs the interpreter inside scrapeguard_worker under rlimits, no_new_privs
// and (optionally) seccomp. Request on stdin, one JSON reply on stdout:
//   in : {"code": "...", "url": "...", "limits": {"max_steps", "timeout_ms", "max_records"}}
//   out: {"ok": bool, "results": ..., "error": "...", "output": "...",
//         "steps": n, "fetches": n, "timed_out": bool}
class ProcessEvaluator : public IEvaluator {
public:
    ProcessEvaluator(ExecutorConfig cfg, const std::atomic<bool>* cancel = nullptr);

    EvalOutcome evaluate(const std::string& code, const std::string& url) override;

    const std::string& worker_bin() const { return cfg_.worker_bin; }

private:
    ExecutorConfig cfg_;
    const std::atomic<bool>* cancel_;
};

// Encodes/decodes the worker protocol. Shared by ProcessEvaluator and the worker.
std::string encode_eval_request(const std::string& code, const std::string& url, const ScriptLimits& limits);
bool decode_eval_request(const std::string& json, std::string* code, std::string* url,
                         ScriptLimits* limits, std::string* err);
std::string encode_eval_reply(const EvalOutcome& o);
bool decode_eval_reply(const std::string& json, EvalOutcome* out, std::string* err);

} // namespace scrapeguard
