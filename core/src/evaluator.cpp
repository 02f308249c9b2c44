#include "scrapeguard/evaluator.h"
#include "scrapeguard/proc.h"

#include <json-c/json.h>

#include <algorithm>
#include <string>
#include <vector>

namespace scrapeguard {

namespace {

// Worker reply ceiling: the record cap bounds the payload, not the runner.
constexpr size_t kReplyMaxBytes = 32ULL * 1024 * 1024;
// Time the worker gets on top of the script deadline to serialize its reply.
constexpr int kReplyGraceMs = 5000;

struct JsonGuard {
    json_object* o;
    ~JsonGuard() { if (o) json_object_put(o); }
};

std::string get_str(json_object* obj, const char* key) {
    json_object* v = nullptr;
    if (json_object_object_get_ex(obj, key, &v) && json_object_is_type(v, json_type_string)) {
        return std::string(json_object_get_string(v), (size_t)json_object_get_string_len(v));
    }
    return "";
}

int64_t get_i64(json_object* obj, const char* key, int64_t defv) {
    json_object* v = nullptr;
    if (json_object_object_get_ex(obj, key, &v) && json_object_is_type(v, json_type_int)) {
        return json_object_get_int64(v);
    }
    return defv;
}

bool get_bool(json_object* obj, const char* key) {
    json_object* v = nullptr;
    return json_object_object_get_ex(obj, key, &v) && json_object_get_boolean(v);
}

std::string trim_ws(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ' || s.back() == '\t')) s.pop_back();
    size_t i = 0;
    while (i < s.size() && (s[i] == '\n' || s[i] == '\r' || s[i] == ' ' || s[i] == '\t')) i++;
    if (i) s.erase(0, i);
    return s;
}

} // namespace

ScriptLimits script_limits_from(const ExecutorConfig& cfg) {
    ScriptLimits l;
    l.max_steps = cfg.eval_max_steps;
    l.timeout_ms = cfg.eval_timeout_ms;
    l.max_records = cfg.max_records;
    return l;
}

EvalOutcome outcome_from_run(const ScriptRun& run) {
    EvalOutcome o;
    o.ok = run.ok;
    o.results = run.results;
    o.error = run.error;
    o.output = run.output;
    o.steps = run.steps;
    o.fetches = run.fetches;
    o.timed_out = run.timed_out;
    o.cancelled = run.cancelled;
    return o;
}

// ---------------------------------------------------------------------------
// InProcessEvaluator
// ---------------------------------------------------------------------------

InProcessEvaluator::InProcessEvaluator(IFetcher* fetcher, FetchConfig fetch, ScriptLimits limits,
                                       const std::atomic<bool>* cancel)
    : fetcher_(fetcher), fetch_(std::move(fetch)), limits_(limits), cancel_(cancel) {}

EvalOutcome InProcessEvaluator::evaluate(const std::string& code, const std::string& url) {
    ScriptContext ctx;
    ctx.url = url;
    ctx.fetcher = fetcher_;
    ctx.fetch = fetch_;
    ctx.limits = limits_;
    ctx.cancel = cancel_;

    return outcome_from_run(run_script(code, ctx));
}

// ---------------------------------------------------------------------------
// Worker protocol
// ---------------------------------------------------------------------------

std::string encode_eval_request(const std::string& code, const std::string& url, const ScriptLimits& limits) {
    json_object* root = json_object_new_object();
    JsonGuard g{root};
    json_object_object_add(root, "code", json_object_new_string_len(code.c_str(), (int)code.size()));
    json_object_object_add(root, "url", json_object_new_string_len(url.c_str(), (int)url.size()));
    json_object* lim = json_object_new_object();
    json_object_object_add(lim, "max_steps", json_object_new_int64(limits.max_steps));
    json_object_object_add(lim, "timeout_ms", json_object_new_int64(limits.timeout_ms));
    json_object_object_add(lim, "max_records", json_object_new_int64((int64_t)limits.max_records));
    json_object_object_add(root, "limits", lim);
    return json_object_to_json_string_ext(root, JSON_C_TO_STRING_PLAIN);
}

bool decode_eval_request(const std::string& json, std::string* code, std::string* url,
                         ScriptLimits* limits, std::string* err) {
    json_object* root = json_tokener_parse(json.c_str());
    if (!root || !json_object_is_type(root, json_type_object)) {
        if (root) json_object_put(root);
        if (err) *err = "invalid JSON request";
        return false;
    }
    JsonGuard g{root};
    json_object* c = nullptr;
    if (!json_object_object_get_ex(root, "code", &c) || !json_object_is_type(c, json_type_string)) {
        if (err) *err = "missing code";
        return false;
    }
    if (code) *code = get_str(root, "code");
    if (url) *url = get_str(root, "url");
    if (limits) {
        json_object* lim = nullptr;
        if (json_object_object_get_ex(root, "limits", &lim) && json_object_is_type(lim, json_type_object)) {
            limits->max_steps = get_i64(lim, "max_steps", limits->max_steps);
            limits->timeout_ms = (int)get_i64(lim, "timeout_ms", limits->timeout_ms);
            limits->max_records = (size_t)std::max<int64_t>(0, get_i64(lim, "max_records", (int64_t)limits->max_records));
        }
    }
    return true;
}

std::string encode_eval_reply(const EvalOutcome& o) {
    json_object* root = json_object_new_object();
    JsonGuard g{root};
    json_object_object_add(root, "ok", json_object_new_boolean(o.ok ? 1 : 0));
    json_object_object_add(root, "results", value_to_json(o.results));
    json_object_object_add(root, "error", json_object_new_string_len(o.error.c_str(), (int)o.error.size()));
    json_object_object_add(root, "output", json_object_new_string_len(o.output.c_str(), (int)o.output.size()));
    json_object_object_add(root, "steps", json_object_new_int64(o.steps));
    json_object_object_add(root, "fetches", json_object_new_int(o.fetches));
    json_object_object_add(root, "timed_out", json_object_new_boolean(o.timed_out ? 1 : 0));
    json_object_object_add(root, "cancelled", json_object_new_boolean(o.cancelled ? 1 : 0));
    return json_object_to_json_string_ext(root, JSON_C_TO_STRING_PLAIN);
}

bool decode_eval_reply(const std::string& json, EvalOutcome* out, std::string* err) {
    // results may nest up to kMaxValueDepth below the reply object
    json_tokener* tok = json_tokener_new_ex(kMaxValueDepth + 4);
    if (!tok) {
        if (err) *err = "out of memory";
        return false;
    }
    json_object* root = json_tokener_parse_ex(tok, json.c_str(), static_cast<int>(json.size()));
    if (json_tokener_get_error(tok) != json_tokener_success) {
        if (root) json_object_put(root);
        root = nullptr;
    }
    json_tokener_free(tok);
    if (!root || !json_object_is_type(root, json_type_object)) {
        if (root) json_object_put(root);
        if (err) *err = "invalid worker reply";
        return false;
    }
    JsonGuard g{root};
    json_object* ok = nullptr;
    if (!json_object_object_get_ex(root, "ok", &ok)) {
        if (err) *err = "worker reply missing ok";
        return false;
    }
    out->ok = json_object_get_boolean(ok);
    json_object* res = nullptr;
    out->results = json_object_object_get_ex(root, "results", &res) ? value_from_json(res) : Value::nil();
    out->error = get_str(root, "error");
    out->output = get_str(root, "output");
    out->steps = get_i64(root, "steps", 0);
    out->fetches = (int)get_i64(root, "fetches", 0);
    out->timed_out = get_bool(root, "timed_out");
    out->cancelled = get_bool(root, "cancelled");
    return true;
}

// ---------------------------------------------------------------------------
// ProcessEvaluator
// ---------------------------------------------------------------------------

ProcessEvaluator::ProcessEvaluator(ExecutorConfig cfg, const std::atomic<bool>* cancel)
    : cfg_(std::move(cfg)), cancel_(cancel) {}

EvalOutcome ProcessEvaluator::evaluate(const std::string& code, const std::string& url) {
    EvalOutcome o;
    if (cfg_.worker_bin.empty()) {
        o.error = "worker binary not configured (SCRAPEGUARD_WORKER_BIN)";
        return o;
    }

    const ScriptLimits limits = script_limits_from(cfg_);

    ProcLimits lim;
    lim.timeout_ms = limits.timeout_ms > 0 ? limits.timeout_ms + kReplyGraceMs : 0;
    lim.stdout_max_bytes = kReplyMaxBytes;
    lim.rlimit_cpu_sec = cfg_.worker_cpu_sec;
    lim.rlimit_as_mb = cfg_.worker_as_mb;
    lim.rlimit_fsize_mb = 1;
    lim.rlimit_nofile = 64;
    lim.rlimit_nproc = 64;  // fetch helpers launch curl
    lim.no_new_privs = true;
    lim.enable_seccomp = cfg_.enable_seccomp;
    lim.seccomp_profile = cfg_.seccomp_profile;
    lim.merge_stderr = false;
    lim.cancel = cancel_;

    ProcResult pr;
    const std::vector<std::string> argv{cfg_.worker_bin};
    const bool started = proc_run_capture_sandboxed_stdin(argv, "", encode_eval_request(code, url, limits), lim, &pr);

    if (!started) {
        o.error = "worker not started: " + (pr.error.empty() ? cfg_.worker_bin : pr.error);
        return o;
    }
    if (pr.cancelled) {
        o.cancelled = true;
        o.error = "execution cancelled";
        return o;
    }
    if (pr.timed_out) {
        o.timed_out = true;
        o.error = "TimeoutError: worker exceeded " + std::to_string(lim.timeout_ms) + " ms";
        return o;
    }
    if (pr.output_truncated) {
        o.error = "worker reply exceeds " + std::to_string(kReplyMaxBytes) + " bytes";
        return o;
    }

    const std::string reply = trim_ws(pr.output);
    std::string err;
    if (reply.empty() || !decode_eval_reply(reply, &o, &err)) {
        o = EvalOutcome{};
        o.error = pr.exit_code != 0
            ? "worker exited with code " + std::to_string(pr.exit_code)
            : (err.empty() ? std::string("empty worker reply") : err);
        return o;
    }
    return o;
}

} // namespace scrapeguard
